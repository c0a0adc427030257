// Burst of falling dots that removes itself when its lifetime runs out.
#pragma once

#include <random>
#include <vector>

#include "../../sprig/math/Vec2.h"
#include "../../sprig/render/Color.h"
#include "../../sprig/scene/GameObject.h"

namespace Demo {

constexpr float kGravity = 60.0f;

class ParticleExplosion : public Sprig::GameObject {
public:
    static constexpr float kMinVelocity = -90.0f;
    static constexpr float kMaxVelocity = 90.0f;

    ParticleExplosion(const Sprig::Vec2& position, float lifetime, const Sprig::Color& colour, int count,
                      std::mt19937& rng);

    struct Particle {
        Sprig::Vec2 position;
        Sprig::Vec2 velocity;
    };

    const std::vector<Particle>& particles() const { return particles_; }
    float timeLeft() const { return timeLeft_; }

protected:
    void onUpdate(float dt) override;
    void onDraw(Sprig::RenderDevice& surface) override;

private:
    float timeLeft_;
    Sprig::Color colour_;
    std::vector<Particle> particles_;
};

}  // namespace Demo
