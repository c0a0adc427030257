// Scene node that checks sprite groups for overlap every tick.
#pragma once

#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "GameObject.h"
#include "Sprite.h"

namespace Sprig {

class SpriteCollisions : public GameObject {
public:
    using Group = std::function<std::vector<SpritePtr>()>;
    using Callback = std::function<void(Sprite&, Sprite&)>;

    explicit SpriteCollisions(GameObjectConfig config = {}) : GameObject(std::move(config)) {}

    // Groups are queried afresh every tick. A pair matching several detections
    // triggers each of their callbacks; a sprite present in both groups of a
    // rule is also paired with itself.
    void addDetection(Group first, Group second, Callback callback);

    std::size_t detectionCount() const { return detections_.size(); }

    // Group helper: the direct Sprite children of node. Empty once node is gone.
    static Group childrenOf(const GameObjectPtr& node);

protected:
    void onUpdate(float dt) override;

private:
    struct Detection {
        Group first;
        Group second;
        Callback callback;
    };

    std::vector<Detection> detections_;
};

}  // namespace Sprig
