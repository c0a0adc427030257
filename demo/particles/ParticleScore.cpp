#include "ParticleScore.h"

#include <string>

#include "ParticleExplosion.h"

namespace Demo {

ParticleScore::ParticleScore(const Sprig::Vec2& position, float lifetime, int value, std::mt19937& rng,
                             Sprig::TextRenderer* text)
    : position_(position), timeLeft_(lifetime), value_(value), text_(text) {
    std::uniform_real_distribution<float> vx(kMinVx, kMaxVx);
    std::uniform_real_distribution<float> vy(kMinVy, kMaxVy);
    velocity_.x = vx(rng);
    velocity_.y = vy(rng);
}

void ParticleScore::onUpdate(float dt) {
    timeLeft_ -= dt;
    if (timeLeft_ < 0.0f) {
        destroy();
        return;
    }
    velocity_.y += kGravity * dt;
    position_ += velocity_ * dt;
}

void ParticleScore::onDraw(Sprig::RenderDevice& /*surface*/) {
    if (text_) {
        text_->drawText(std::to_string(value_), position_, kTextScale, colour_);
    }
}

}  // namespace Demo
