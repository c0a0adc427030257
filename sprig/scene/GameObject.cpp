#include "GameObject.h"

#include <algorithm>

#include "StructuralViolation.h"
#include "../core/Logger.h"

namespace Sprig {

namespace {
std::string describe(const GameObject& node) {
    return node.name() ? "'" + *node.name() + "'" : std::string("<unnamed>");
}

[[noreturn]] void violation(const std::string& message) {
    logWarn("Structural violation: " + message);
    throw StructuralViolation(message);
}
}  // namespace

GameObject::GameObject() = default;

GameObject::GameObject(GameObjectConfig config)
    : name_(std::move(config.name)),
      active_(config.active),
      enabled_(config.enabled),
      visible_(config.visible) {
    for (auto& fn : config.onDraw) drawHandlers_.add(std::move(fn));
    for (auto& fn : config.onUpdate) updateHandlers_.add(std::move(fn));
    for (auto& fn : config.onActivate) activateHandlers_.add(std::move(fn));
    for (auto& fn : config.onDeactivate) deactivateHandlers_.add(std::move(fn));
    for (auto& fn : config.onDestroy) destroyHandlers_.add(std::move(fn));
    try {
        for (auto& child : config.children) {
            addChild(std::move(child));
        }
    } catch (const StructuralViolation&) {
        // No destructor runs for a half-built node; unlink what was already adopted.
        for (const auto& child : children_) {
            child->parent_ = nullptr;
        }
        throw;
    }
}

GameObject::~GameObject() {
    // Children may outlive us through other shared owners; drop their back-links.
    for (const auto& child : children_) {
        child->parent_ = nullptr;
    }
}

void GameObject::setActive(bool value) {
    if (destroyed_ || active_ == value) {
        return;
    }
    active_ = value;
    if (value) {
        onActivated();
        activateHandlers_.invoke(*this);
    } else {
        onDeactivated();
        deactivateHandlers_.invoke(*this);
    }

    const std::vector<GameObjectPtr> snapshot = children_;
    for (const auto& child : snapshot) {
        child->setActive(value);
    }
}

void GameObject::destroy() {
    const std::vector<GameObjectPtr> snapshot = children_;
    for (const auto& child : snapshot) {
        child->destroy();
    }

    if (destroyed_) {
        return;
    }
    setActive(false);
    destroyed_ = true;
    onDestroyed();
    destroyHandlers_.invoke(*this);
}

void GameObject::update(float dt) {
    purgeDestroyedChildren();

    if (!active_) {
        return;
    }
    if (enabled_) {
        onUpdate(dt);
        // The hook may have destroyed or deactivated this node.
        if (!active_) {
            return;
        }
        updateHandlers_.invoke(*this, dt);
        if (!active_) {
            return;
        }
    }

    const std::vector<GameObjectPtr> snapshot = children_;
    for (const auto& child : snapshot) {
        // Skip nodes detached earlier in this pass.
        if (child->parent_ == this) {
            child->update(dt);
        }
    }
}

void GameObject::draw(RenderDevice& surface) {
    if (!active_) {
        return;
    }
    if (visible_) {
        onDraw(surface);
        drawHandlers_.invoke(*this, surface);
    }

    const std::vector<GameObjectPtr> snapshot = children_;
    for (const auto& child : snapshot) {
        if (child->parent_ == this) {
            child->draw(surface);
        }
    }
}

void GameObject::addChild(GameObjectPtr child) {
    if (!child) {
        violation("cannot add a null child to " + describe(*this));
    }
    if (child->parent_) {
        violation(describe(*child) + " already has parent " + describe(*child->parent_));
    }
    for (const GameObject* node = this; node; node = node->parent_) {
        if (node == child.get()) {
            violation("adding " + describe(*child) + " under " + describe(*this) + " would create a cycle");
        }
    }
    child->parent_ = this;
    children_.push_back(std::move(child));
}

GameObjectPtr GameObject::removeChild(GameObject& child) {
    if (!child.parent_) {
        return nullptr;
    }
    if (child.parent_ != this) {
        violation(describe(child) + " is not a child of " + describe(*this));
    }
    auto it = std::find_if(children_.begin(), children_.end(),
                           [&child](const GameObjectPtr& c) { return c.get() == &child; });
    GameObjectPtr removed = *it;
    children_.erase(it);
    removed->parent_ = nullptr;
    return removed;
}

GameObjectPtr GameObject::findChild(const std::string& name) const {
    for (const auto& child : children_) {
        if (child->name_ && *child->name_ == name) {
            return child;
        }
    }
    return nullptr;
}

void GameObject::purgeDestroyedChildren() {
    auto firstDead = std::stable_partition(children_.begin(), children_.end(),
                                           [](const GameObjectPtr& c) { return !c->destroyed_; });
    for (auto it = firstDead; it != children_.end(); ++it) {
        (*it)->parent_ = nullptr;
    }
    children_.erase(firstDead, children_.end());
}

}  // namespace Sprig
