// Score value that pops out of a kill and falls away.
#pragma once

#include <random>

#include "../../sprig/math/Vec2.h"
#include "../../sprig/render/Color.h"
#include "../../sprig/render/TextRenderer.h"
#include "../../sprig/scene/GameObject.h"

namespace Demo {

class ParticleScore : public Sprig::GameObject {
public:
    static constexpr float kMinVx = -60.0f;
    static constexpr float kMaxVx = 60.0f;
    static constexpr float kMinVy = -30.0f;
    static constexpr float kMaxVy = 60.0f;
    static constexpr float kTextScale = 1.5f;

    // text may be null, in which case nothing is drawn.
    ParticleScore(const Sprig::Vec2& position, float lifetime, int value, std::mt19937& rng,
                  Sprig::TextRenderer* text = nullptr);

    const Sprig::Vec2& position() const { return position_; }
    const Sprig::Vec2& velocity() const { return velocity_; }
    int value() const { return value_; }

protected:
    void onUpdate(float dt) override;
    void onDraw(Sprig::RenderDevice& surface) override;

private:
    Sprig::Vec2 position_;
    Sprig::Vec2 velocity_;
    float timeLeft_;
    int value_;
    Sprig::TextRenderer* text_;
    Sprig::Color colour_{255, 255, 0, 255};
};

}  // namespace Demo
