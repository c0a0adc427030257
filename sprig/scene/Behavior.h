// Per-tick policy applied to a Sprite.
#pragma once

#include <memory>

namespace Sprig {

class Sprite;

// A Sprite queries remove() first (true evicts the behavior for good), then
// enabled() (false skips it this tick), then calls execute().
class Behavior {
public:
    virtual ~Behavior() = default;

    virtual bool enabled(Sprite& /*sprite*/) { return true; }
    virtual void execute(float dt, Sprite& sprite) = 0;
    virtual bool remove(Sprite& /*sprite*/) { return false; }
};

using BehaviorPtr = std::unique_ptr<Behavior>;

}  // namespace Sprig
