// Owns the top-level forest and the per-frame callbacks; the host's only entry points.
#pragma once

#include <functional>
#include <utility>
#include <vector>

#include "GameObject.h"
#include "../render/Color.h"

namespace Sprig {

class RenderDevice;

class Root {
public:
    using DrawFunc = std::function<void(RenderDevice&)>;
    using UpdateFunc = std::function<void(float)>;

    Root();

    Root(const Root&) = delete;
    Root& operator=(const Root&) = delete;

    // Runs update funcs in registration order, then updates the tree.
    void update(float dt);
    // Clears to the background colour, runs draw funcs, then draws the tree.
    void draw(RenderDevice& surface);

    void addUpdateFunc(UpdateFunc fn) { updateFuncs_.push_back(std::move(fn)); }
    void addDrawFunc(DrawFunc fn) { drawFuncs_.push_back(std::move(fn)); }

    void setBackgroundColour(const Color& colour) { background_ = colour; }
    const Color& backgroundColour() const { return background_; }

    void addChild(GameObjectPtr child) { tree_.addChild(std::move(child)); }
    GameObjectPtr removeChild(GameObject& child) { return tree_.removeChild(child); }

    template <typename T, typename... Args>
    std::shared_ptr<T> emplaceChild(Args&&... args) {
        return tree_.emplaceChild<T>(std::forward<Args>(args)...);
    }

    GameObject& tree() { return tree_; }
    const GameObject& tree() const { return tree_; }

private:
    GameObject tree_;
    std::vector<UpdateFunc> updateFuncs_;
    std::vector<DrawFunc> drawFuncs_;
    Color background_{0, 0, 0, 255};
};

}  // namespace Sprig
