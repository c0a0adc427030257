#include "Root.h"

#include "../core/Logger.h"
#include "../render/RenderDevice.h"

namespace Sprig {

namespace {
GameObjectConfig rootConfig() {
    GameObjectConfig config;
    config.name = "root";
    return config;
}
}  // namespace

Root::Root() : tree_(rootConfig()) { logDebug("Root created."); }

void Root::update(float dt) {
    // Snapshot: a func may register further funcs, which start running next frame.
    const std::vector<UpdateFunc> funcs = updateFuncs_;
    for (const auto& fn : funcs) {
        fn(dt);
    }
    tree_.update(dt);
}

void Root::draw(RenderDevice& surface) {
    surface.clear(background_);
    const std::vector<DrawFunc> funcs = drawFuncs_;
    for (const auto& fn : funcs) {
        fn(surface);
    }
    tree_.draw(surface);
}

}  // namespace Sprig
