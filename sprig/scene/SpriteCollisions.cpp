#include "SpriteCollisions.h"

namespace Sprig {

void SpriteCollisions::addDetection(Group first, Group second, Callback callback) {
    detections_.push_back(Detection{std::move(first), std::move(second), std::move(callback)});
}

SpriteCollisions::Group SpriteCollisions::childrenOf(const GameObjectPtr& node) {
    std::weak_ptr<GameObject> weak = node;
    return [weak]() {
        if (auto locked = weak.lock()) {
            return locked->childrenOfType<Sprite>();
        }
        return std::vector<SpritePtr>{};
    };
}

void SpriteCollisions::onUpdate(float /*dt*/) {
    const std::vector<Detection> detections = detections_;
    for (const auto& detection : detections) {
        const auto firstGroup = detection.first();
        const auto secondGroup = detection.second();
        for (const auto& a : firstGroup) {
            for (const auto& b : secondGroup) {
                if (!a || !b) continue;
                // A callback earlier in the loop may have destroyed either side.
                if (a->destroyed() || b->destroyed()) continue;
                if (a->bounds().overlaps(b->bounds())) {
                    detection.callback(*a, *b);
                }
            }
        }
    }
}

}  // namespace Sprig
