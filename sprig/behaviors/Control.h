// Combinators that sequence, repeat or gate other behaviors.
#pragma once

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

#include "../scene/Behavior.h"

namespace Sprig::Behaviors {

// Runs one behavior at a time. enabled() moves past behaviors that are no longer
// enabled and stops at the first enabled one, or at the last entry. It never
// reports completion on its own account; wrap it in RemoveWhenFinished for that.
class Sequence final : public Behavior {
public:
    explicit Sequence(std::vector<BehaviorPtr> behaviors);

    template <typename... Ts>
    static std::unique_ptr<Sequence> of(std::unique_ptr<Ts>... behaviors) {
        std::vector<BehaviorPtr> list;
        list.reserve(sizeof...(Ts));
        (list.push_back(std::move(behaviors)), ...);
        return std::make_unique<Sequence>(std::move(list));
    }

    bool enabled(Sprite& sprite) override;
    void execute(float dt, Sprite& sprite) override;

    std::size_t index() const { return index_; }
    std::size_t size() const { return behaviors_.size(); }

private:
    std::vector<BehaviorPtr> behaviors_;
    std::size_t index_{0};
};

// Runs secondary alongside primary for exactly as long as primary is enabled.
class Whilst final : public Behavior {
public:
    Whilst(BehaviorPtr primary, BehaviorPtr secondary)
        : primary_(std::move(primary)), secondary_(std::move(secondary)) {}

    bool enabled(Sprite& sprite) override { return primary_->enabled(sprite); }
    void execute(float dt, Sprite& sprite) override;

private:
    BehaviorPtr primary_;
    BehaviorPtr secondary_;
};

// Lets inner run at most count times.
class Exactly final : public Behavior {
public:
    Exactly(int count, BehaviorPtr inner) : remaining_(count), inner_(std::move(inner)) {}

    bool enabled(Sprite& /*sprite*/) override { return remaining_ > 0; }
    void execute(float dt, Sprite& sprite) override;

    int remaining() const { return remaining_; }

private:
    int remaining_;
    BehaviorPtr inner_;
};

// Asks the owning sprite to evict this behavior once inner is no longer enabled.
class RemoveWhenFinished final : public Behavior {
public:
    explicit RemoveWhenFinished(BehaviorPtr inner) : inner_(std::move(inner)) {}

    bool enabled(Sprite& sprite) override { return inner_->enabled(sprite); }
    void execute(float dt, Sprite& sprite) override { inner_->execute(dt, sprite); }
    bool remove(Sprite& sprite) override { return !inner_->enabled(sprite); }

private:
    BehaviorPtr inner_;
};

// Arbitrary code as a behavior. Always enabled, never removed on its own.
class Callback final : public Behavior {
public:
    using Fn = std::function<void(float, Sprite&)>;

    explicit Callback(Fn fn) : fn_(std::move(fn)) {}

    void execute(float dt, Sprite& sprite) override;

private:
    Fn fn_;
};

}  // namespace Sprig::Behaviors
