#include "Sprite.h"

#include <algorithm>

#include "../render/RenderDevice.h"

namespace Sprig {

Sprite::Sprite(const Vec2& position, std::vector<TexturePtr> images, GameObjectConfig config)
    : GameObject(std::move(config)), position_(position), normalPosition_(position), images_(std::move(images)) {}

Behavior& Sprite::addBehavior(BehaviorPtr behavior) {
    behaviors_.push_back(std::move(behavior));
    return *behaviors_.back();
}

Vec2 Sprite::size() const {
    if (size_.x > 0.0f || size_.y > 0.0f) {
        return size_;
    }
    if (auto image = currentImage()) {
        return Vec2{static_cast<float>(image->width()), static_cast<float>(image->height())};
    }
    return Vec2{};
}

void Sprite::setImages(std::vector<TexturePtr> images) {
    images_ = std::move(images);
    frame_ = 0;
    frameAccumulator_ = 0.0f;
}

TexturePtr Sprite::currentImage() const {
    if (images_.empty()) {
        return nullptr;
    }
    return images_[static_cast<std::size_t>(frame_) % images_.size()];
}

void Sprite::onActivated() {
    frame_ = 0;
    frameAccumulator_ = 0.0f;
}

void Sprite::onUpdate(float dt) {
    if (lifetime_) {
        *lifetime_ -= dt;
        if (*lifetime_ <= 0.0f) {
            destroy();
            return;
        }
    }

    animate(dt);
    runBehaviors(dt);
}

void Sprite::onDraw(RenderDevice& surface) {
    const Rect box = bounds();
    if (auto image = currentImage()) {
        surface.drawTexture(*image, box.topLeft, box.size);
    } else if (!box.empty()) {
        surface.drawFilledRect(box.topLeft, box.size, colour_);
    }
}

void Sprite::animate(float dt) {
    if (images_.size() <= 1 || fps_ <= 0.0f) {
        return;
    }
    const float frameTime = 1.0f / fps_;
    frameAccumulator_ += dt;
    while (frameAccumulator_ >= frameTime) {
        frameAccumulator_ -= frameTime;
        frame_ = (frame_ + 1) % static_cast<int>(images_.size());
    }
}

void Sprite::runBehaviors(float dt) {
    behaviors_.erase(std::remove_if(behaviors_.begin(), behaviors_.end(),
                                    [this](const BehaviorPtr& b) { return b->remove(*this); }),
                     behaviors_.end());

    // Index loop: a behavior may append to behaviors_ while it runs.
    const std::size_t count = behaviors_.size();
    for (std::size_t i = 0; i < count; ++i) {
        Behavior& behavior = *behaviors_[i];
        if (behavior.enabled(*this)) {
            behavior.execute(dt, *this);
        }
    }
}

}  // namespace Sprig
