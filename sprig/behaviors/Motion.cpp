#include "Motion.h"

#include <algorithm>
#include <cmath>

#include "../input/InputState.h"
#include "../scene/Sprite.h"

namespace Sprig::Behaviors {

namespace {
float approach(float current, float target, float maxStep) {
    if (current > target) {
        return std::max(target, current - maxStep);
    }
    if (current < target) {
        return std::min(target, current + maxStep);
    }
    return current;
}
}  // namespace

Move::Move(const Vec2& offset, const Vec2& velocity)
    : offset_(offset), velocity_(velocity), remaining_(std::fabs(offset.x), std::fabs(offset.y)) {}

void Move::execute(float dt, Sprite& sprite) {
    float x = std::min(std::fabs(velocity_.x * dt), std::max(0.0f, remaining_.x));
    float y = std::min(std::fabs(velocity_.y * dt), std::max(0.0f, remaining_.y));

    remaining_.x -= x;
    remaining_.y -= y;

    if (offset_.x < 0.0f) x = -x;
    if (offset_.y < 0.0f) y = -y;

    sprite.setPosition(sprite.position() + Vec2{x, y});
}

void CalculatedPosition::execute(float dt, Sprite& sprite) {
    elapsed_ += dt;

    Vec2 pos = sprite.position();
    if (xFn_) pos.x = xFn_(elapsed_);
    if (yFn_) pos.y = yFn_(elapsed_);
    sprite.setPosition(pos);
}

void MovePlayer::execute(float dt, Sprite& sprite) {
    Vec2 pos = sprite.position();
    if (input_.isDown(InputKey::Left)) {
        pos.x -= speed_ * dt;
    } else if (input_.isDown(InputKey::Right)) {
        pos.x += speed_ * dt;
    }
    pos.x = std::clamp(pos.x, minX_, maxX_);
    sprite.setPosition(pos);
}

void RelativeToNow::execute(float dt, Sprite& sprite) {
    if (!origin_) {
        origin_ = sprite.position();
    }
    inner_->execute(dt, sprite);
    sprite.setPosition(*origin_ + sprite.position());
}

void RelativeToNowOnlyX::execute(float dt, Sprite& sprite) {
    if (!originX_) {
        originX_ = sprite.position().x;
    }
    const float y = sprite.position().y;
    inner_->execute(dt, sprite);
    sprite.setPosition(Vec2{*originX_ + sprite.position().x, y});
}

bool ReturnToNormalPosition::enabled(Sprite& sprite) { return sprite.position() != sprite.normalPosition(); }

void ReturnToNormalPosition::execute(float dt, Sprite& sprite) {
    const Vec2& pos = sprite.position();
    const Vec2& normal = sprite.normalPosition();
    sprite.setPosition(Vec2{approach(pos.x, normal.x, std::fabs(velocity_.x * dt)),
                            approach(pos.y, normal.y, std::fabs(velocity_.y * dt))});
}

void OverridePosition::execute(float dt, Sprite& sprite) {
    if (!slot_) {
        slot_ = sprite.position();
    }
    sprite.setNormalPosition(sprite.position());
    sprite.setPosition(*slot_);
    inner_->execute(dt, sprite);
    slot_ = sprite.position();
}

}  // namespace Sprig::Behaviors
