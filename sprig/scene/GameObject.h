// Hierarchical scene node: owned children, lifecycle flags, per-event handler lists.
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "HandlerList.h"

namespace Sprig {

class GameObject;
class RenderDevice;

using GameObjectPtr = std::shared_ptr<GameObject>;

using DrawHandler = std::function<void(GameObject&, RenderDevice&)>;
using UpdateHandler = std::function<void(GameObject&, float)>;
using LifecycleHandler = std::function<void(GameObject&)>;

// Construction options. Handlers are appended to the node's lists in the order given.
struct GameObjectConfig {
    std::optional<std::string> name{};
    bool active{true};
    bool enabled{true};
    bool visible{true};
    std::vector<GameObjectPtr> children{};
    std::vector<DrawHandler> onDraw{};
    std::vector<UpdateHandler> onUpdate{};
    std::vector<LifecycleHandler> onActivate{};
    std::vector<LifecycleHandler> onDeactivate{};
    std::vector<LifecycleHandler> onDestroy{};
};

// Flags:
//  - active: hierarchical. Assigning it propagates to every descendant (parent first).
//  - enabled: local. Gates this node's own update hook and handlers.
//  - visible: local. Gates this node's own draw hook and handlers; children still draw.
//  - destroyed: terminal. A destroyed node can never become active again and is
//    detached by its parent at the start of the parent's next update.
//
// Each event has two extension channels: a virtual hook for subclasses and an
// ordered handler list for per-instance callbacks. The hook always runs first.
class GameObject {
public:
    GameObject();
    explicit GameObject(GameObjectConfig config);
    virtual ~GameObject();

    GameObject(const GameObject&) = delete;
    GameObject& operator=(const GameObject&) = delete;

    void update(float dt);
    void draw(RenderDevice& surface);

    // Destroys every child first, then deactivates this node and fires its destroy
    // hook and handlers. Calling it again only re-visits the children.
    void destroy();

    // Throws StructuralViolation if child is null or already has a parent.
    void addChild(GameObjectPtr child);
    // Throws StructuralViolation if child belongs to another node. A parentless
    // child is ignored. Returns the detached node, or nullptr if nothing was removed.
    GameObjectPtr removeChild(GameObject& child);

    template <typename T, typename... Args>
    std::shared_ptr<T> emplaceChild(Args&&... args) {
        auto child = std::make_shared<T>(std::forward<Args>(args)...);
        addChild(child);
        return child;
    }

    HandlerId addDrawHandler(DrawHandler fn) { return drawHandlers_.add(std::move(fn)); }
    HandlerId addUpdateHandler(UpdateHandler fn) { return updateHandlers_.add(std::move(fn)); }
    HandlerId addActivateHandler(LifecycleHandler fn) { return activateHandlers_.add(std::move(fn)); }
    HandlerId addDeactivateHandler(LifecycleHandler fn) { return deactivateHandlers_.add(std::move(fn)); }
    HandlerId addDestroyHandler(LifecycleHandler fn) { return destroyHandlers_.add(std::move(fn)); }

    bool removeDrawHandler(HandlerId id) { return drawHandlers_.remove(id); }
    bool removeUpdateHandler(HandlerId id) { return updateHandlers_.remove(id); }
    bool removeActivateHandler(HandlerId id) { return activateHandlers_.remove(id); }
    bool removeDeactivateHandler(HandlerId id) { return deactivateHandlers_.remove(id); }
    bool removeDestroyHandler(HandlerId id) { return destroyHandlers_.remove(id); }

    bool active() const { return active_; }
    void setActive(bool value);
    bool enabled() const { return enabled_; }
    void setEnabled(bool value) { enabled_ = value; }
    bool visible() const { return visible_; }
    void setVisible(bool value) { visible_ = value; }
    bool destroyed() const { return destroyed_; }

    const std::optional<std::string>& name() const { return name_; }
    GameObject* parent() const { return parent_; }
    const std::vector<GameObjectPtr>& children() const { return children_; }

    // First direct child carrying the given name.
    GameObjectPtr findChild(const std::string& name) const;

    // Direct children of type T, in child order.
    template <typename T>
    std::vector<std::shared_ptr<T>> childrenOfType() const {
        std::vector<std::shared_ptr<T>> out;
        for (const auto& child : children_) {
            if (auto typed = std::dynamic_pointer_cast<T>(child)) {
                out.push_back(std::move(typed));
            }
        }
        return out;
    }

protected:
    virtual void onUpdate(float /*dt*/) {}
    virtual void onDraw(RenderDevice& /*surface*/) {}
    virtual void onActivated() {}
    virtual void onDeactivated() {}
    virtual void onDestroyed() {}

private:
    void purgeDestroyedChildren();

    std::optional<std::string> name_;
    bool active_{true};
    bool enabled_{true};
    bool visible_{true};
    bool destroyed_{false};
    GameObject* parent_{nullptr};  // owned by the parent; only addChild/removeChild/purge touch it
    std::vector<GameObjectPtr> children_;

    HandlerList<GameObject&, RenderDevice&> drawHandlers_;
    HandlerList<GameObject&, float> updateHandlers_;
    HandlerList<GameObject&> activateHandlers_;
    HandlerList<GameObject&> deactivateHandlers_;
    HandlerList<GameObject&> destroyHandlers_;
};

}  // namespace Sprig
