// Behaviors that move a sprite.
#pragma once

#include <functional>
#include <optional>
#include <utility>

#include "../math/Vec2.h"
#include "../scene/Behavior.h"

namespace Sprig {
class InputState;
}

namespace Sprig::Behaviors {

// Moves by offset at velocity (pixels/second, sign ignored). Each axis stops
// independently once it has covered its share of the offset.
class Move final : public Behavior {
public:
    Move(const Vec2& offset, const Vec2& velocity);

    bool enabled(Sprite& /*sprite*/) override { return remaining_.x > 0.0f || remaining_.y > 0.0f; }
    void execute(float dt, Sprite& sprite) override;

    const Vec2& remaining() const { return remaining_; }

private:
    Vec2 offset_;
    Vec2 velocity_;
    Vec2 remaining_;
};

// Places the sprite at (xFn(t), yFn(t)) where t is the time this behavior has run.
// An empty function leaves that axis alone.
class CalculatedPosition final : public Behavior {
public:
    using Fn = std::function<float(float)>;

    CalculatedPosition(Fn xFn, Fn yFn) : xFn_(std::move(xFn)), yFn_(std::move(yFn)) {}

    void execute(float dt, Sprite& sprite) override;

private:
    Fn xFn_;
    Fn yFn_;
    float elapsed_{0.0f};
};

// Horizontal movement from the Left/Right keys, clamped to [minX, maxX].
class MovePlayer final : public Behavior {
public:
    MovePlayer(const InputState& input, float speed, float minX, float maxX)
        : input_(input), speed_(speed), minX_(minX), maxX_(maxX) {}

    void execute(float dt, Sprite& sprite) override;

private:
    const InputState& input_;
    float speed_;
    float minX_;
    float maxX_;
};

// Runs inner in coordinates relative to where the sprite stood on the first tick.
class RelativeToNow final : public Behavior {
public:
    explicit RelativeToNow(BehaviorPtr inner) : inner_(std::move(inner)) {}

    bool enabled(Sprite& sprite) override { return inner_->enabled(sprite); }
    void execute(float dt, Sprite& sprite) override;

private:
    BehaviorPtr inner_;
    std::optional<Vec2> origin_{};
};

// As RelativeToNow, but only x is offset; y keeps its value from before the call.
class RelativeToNowOnlyX final : public Behavior {
public:
    explicit RelativeToNowOnlyX(BehaviorPtr inner) : inner_(std::move(inner)) {}

    bool enabled(Sprite& sprite) override { return inner_->enabled(sprite); }
    void execute(float dt, Sprite& sprite) override;

private:
    BehaviorPtr inner_;
    std::optional<float> originX_{};
};

// Steers the sprite back to its normal position without overshooting.
class ReturnToNormalPosition final : public Behavior {
public:
    explicit ReturnToNormalPosition(const Vec2& velocity) : velocity_(velocity) {}

    bool enabled(Sprite& sprite) override;
    void execute(float dt, Sprite& sprite) override;

private:
    Vec2 velocity_;
};

// Runs inner against a private position slot. Before each call the sprite's
// current position becomes its normal position and the slot is swapped in;
// afterwards the result is kept in the slot.
class OverridePosition final : public Behavior {
public:
    explicit OverridePosition(BehaviorPtr inner) : inner_(std::move(inner)) {}

    bool enabled(Sprite& sprite) override { return inner_->enabled(sprite); }
    void execute(float dt, Sprite& sprite) override;

private:
    BehaviorPtr inner_;
    std::optional<Vec2> slot_{};
};

}  // namespace Sprig::Behaviors
