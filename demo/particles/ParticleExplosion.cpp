#include "ParticleExplosion.h"

#include <algorithm>

#include "../../sprig/render/RenderDevice.h"

namespace Demo {

ParticleExplosion::ParticleExplosion(const Sprig::Vec2& position, float lifetime, const Sprig::Color& colour,
                                     int count, std::mt19937& rng)
    : timeLeft_(lifetime), colour_(colour) {
    std::uniform_real_distribution<float> velocity(kMinVelocity, kMaxVelocity);
    particles_.reserve(static_cast<std::size_t>(std::max(0, count)));
    for (int i = 0; i < count; ++i) {
        const float vx = velocity(rng);
        const float vy = velocity(rng);
        particles_.push_back(Particle{position, Sprig::Vec2{vx, vy}});
    }
}

void ParticleExplosion::onUpdate(float dt) {
    timeLeft_ -= dt;
    if (timeLeft_ < 0.0f) {
        destroy();
        return;
    }
    for (auto& p : particles_) {
        p.position += p.velocity * dt;
        p.velocity.y += kGravity * dt;
    }
}

void ParticleExplosion::onDraw(Sprig::RenderDevice& surface) {
    for (const auto& p : particles_) {
        surface.drawFilledCircle(p.position, 1.0f, colour_);
    }
}

}  // namespace Demo
