// Demo particle effects: spawn ranges, motion and self-removal.
#include <cassert>
#include <cmath>
#include <random>
#include <string>
#include <vector>

#include "../demo/particles/ParticleExplosion.h"
#include "../demo/particles/ParticleScore.h"
#include "../sprig/render/RenderDevice.h"

using namespace Sprig;

namespace {
bool near(float a, float b) { return std::fabs(a - b) < 1e-3f; }

class CountingDevice : public RenderDevice {
public:
    int circles{0};

    void clear(const Color& /*color*/) override {}
    void drawFilledRect(const Vec2& /*topLeft*/, const Vec2& /*size*/, const Color& /*color*/) override {}
    void drawTexture(const Texture& /*texture*/, const Vec2& /*topLeft*/, const Vec2& /*size*/) override {}
    void drawFilledCircle(const Vec2& /*center*/, float /*radius*/, const Color& /*color*/) override { ++circles; }
    void present() override {}
};

class RecordingText : public TextRenderer {
public:
    std::vector<std::string> drawn;
    Vec2 lastCenter{};

    void drawText(const std::string& text, const Vec2& center, float /*scale*/, const Color& /*color*/) override {
        drawn.push_back(text);
        lastCenter = center;
    }
};
}  // namespace

int main() {
    {
        // Every particle starts at the origin with velocity inside the configured range.
        std::mt19937 rng(1234);
        Demo::ParticleExplosion boom(Vec2{50.0f, 60.0f}, 1.0f, Color{255, 0, 0, 255}, 40, rng);
        assert(boom.particles().size() == 40);
        for (const auto& p : boom.particles()) {
            assert(p.position == (Vec2{50.0f, 60.0f}));
            assert(p.velocity.x >= Demo::ParticleExplosion::kMinVelocity);
            assert(p.velocity.x <= Demo::ParticleExplosion::kMaxVelocity);
            assert(p.velocity.y >= Demo::ParticleExplosion::kMinVelocity);
            assert(p.velocity.y <= Demo::ParticleExplosion::kMaxVelocity);
        }

        // Same seed, same burst.
        std::mt19937 again(1234);
        Demo::ParticleExplosion twin(Vec2{50.0f, 60.0f}, 1.0f, Color{255, 0, 0, 255}, 40, again);
        for (std::size_t i = 0; i < twin.particles().size(); ++i) {
            assert(twin.particles()[i].velocity == boom.particles()[i].velocity);
        }
    }
    {
        // Particles move by their velocity and then gain gravity.
        std::mt19937 rng(7);
        Demo::ParticleExplosion boom(Vec2{0.0f, 0.0f}, 2.0f, Color{}, 5, rng);
        const auto before = boom.particles();
        boom.update(0.5f);
        for (std::size_t i = 0; i < before.size(); ++i) {
            const auto& p = boom.particles()[i];
            assert(near(p.position.x, before[i].velocity.x * 0.5f));
            assert(near(p.position.y, before[i].velocity.y * 0.5f));
            assert(near(p.velocity.y, before[i].velocity.y + Demo::kGravity * 0.5f));
            assert(near(p.velocity.x, before[i].velocity.x));
        }
        CountingDevice device;
        boom.draw(device);
        assert(device.circles == 5);
    }
    {
        // The explosion destroys itself once its lifetime has gone negative.
        std::mt19937 rng(7);
        Demo::ParticleExplosion boom(Vec2{}, 1.0f, Color{}, 3, rng);
        boom.update(0.5f);
        boom.update(0.5f);
        assert(!boom.destroyed());
        boom.update(0.5f);
        assert(boom.destroyed());
    }
    {
        // Score particle: velocity in range, falls under gravity, draws its value.
        std::mt19937 rng(99);
        RecordingText text;
        Demo::ParticleScore score(Vec2{10.0f, 10.0f}, 1.0f, 150, rng, &text);
        const Vec2 v0 = score.velocity();
        assert(v0.x >= Demo::ParticleScore::kMinVx && v0.x <= Demo::ParticleScore::kMaxVx);
        assert(v0.y >= Demo::ParticleScore::kMinVy && v0.y <= Demo::ParticleScore::kMaxVy);
        assert(score.value() == 150);

        score.update(0.5f);
        const float vy = v0.y + Demo::kGravity * 0.5f;
        assert(near(score.velocity().y, vy));
        assert(near(score.position().x, 10.0f + v0.x * 0.5f));
        assert(near(score.position().y, 10.0f + vy * 0.5f));

        CountingDevice device;
        score.draw(device);
        assert((text.drawn == std::vector<std::string>{"150"}));
        assert(text.lastCenter == score.position());

        score.update(0.6f);
        assert(score.destroyed());
    }
    {
        // Without a text renderer nothing is drawn.
        std::mt19937 rng(1);
        Demo::ParticleScore score(Vec2{}, 1.0f, 10, rng);
        CountingDevice device;
        score.draw(device);
        assert(device.circles == 0);
    }
    return 0;
}
