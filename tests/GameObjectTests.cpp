// Lifecycle and ownership rules of the scene tree.
#include <cassert>
#include <memory>
#include <string>
#include <vector>

#include "../sprig/render/NullRenderDevice.h"
#include "../sprig/scene/GameObject.h"
#include "../sprig/scene/Sprite.h"
#include "../sprig/scene/StructuralViolation.h"

using namespace Sprig;

namespace {
GameObjectPtr makeNode(const std::string& name, std::vector<std::string>& log) {
    GameObjectConfig config;
    config.name = name;
    config.onActivate.push_back([&log, name](GameObject&) { log.push_back(name + ":activate"); });
    config.onDeactivate.push_back([&log, name](GameObject&) { log.push_back(name + ":deactivate"); });
    config.onDestroy.push_back([&log, name](GameObject&) { log.push_back(name + ":destroy"); });
    return std::make_shared<GameObject>(std::move(config));
}

template <typename Fn>
bool throwsViolation(Fn&& fn) {
    try {
        fn();
    } catch (const StructuralViolation&) {
        return true;
    }
    return false;
}

class CountingNode : public GameObject {
public:
    int activated{0};
    int deactivated{0};
    int destroyedHooks{0};
    std::vector<std::string>* log{nullptr};

protected:
    void onActivated() override {
        ++activated;
        if (log) log->push_back("hook:activate");
    }
    void onDeactivated() override { ++deactivated; }
    void onDestroyed() override { ++destroyedHooks; }
};
}  // namespace

int main() {
    {
        // Activation runs top-down: parent handlers before any child's.
        std::vector<std::string> log;
        auto parent = makeNode("p", log);
        auto c1 = makeNode("c1", log);
        auto c2 = makeNode("c2", log);
        parent->addChild(c1);
        parent->addChild(c2);

        parent->setActive(false);
        assert(!c1->active() && !c2->active());
        log.clear();
        parent->setActive(true);
        assert((log == std::vector<std::string>{"p:activate", "c1:activate", "c2:activate"}));
    }
    {
        // Destruction runs bottom-up, and each node deactivates before its destroy handlers.
        std::vector<std::string> log;
        auto parent = makeNode("p", log);
        auto c1 = makeNode("c1", log);
        auto c2 = makeNode("c2", log);
        parent->addChild(c1);
        parent->addChild(c2);

        parent->destroy();
        assert((log == std::vector<std::string>{"c1:deactivate", "c1:destroy", "c2:deactivate", "c2:destroy",
                                                "p:deactivate", "p:destroy"}));
        assert(parent->destroyed() && c1->destroyed() && c2->destroyed());
    }
    {
        // Destroy is idempotent.
        int destroyCount = 0;
        GameObject node;
        node.addDestroyHandler([&destroyCount](GameObject&) { ++destroyCount; });
        node.destroy();
        node.destroy();
        assert(destroyCount == 1);
    }
    {
        // A destroyed node can never be reactivated.
        GameObject node;
        node.destroy();
        assert(!node.active());
        node.setActive(true);
        assert(!node.active());
    }
    {
        // Setting the same value again fires nothing.
        std::vector<std::string> log;
        auto node = makeNode("n", log);
        node->setActive(true);
        assert(log.empty());
        node->setActive(false);
        node->setActive(false);
        assert(log.size() == 1);
    }
    {
        // Template hook runs before the registered handlers.
        std::vector<std::string> log;
        CountingNode node;
        node.log = &log;
        node.addActivateHandler([&log](GameObject&) { log.push_back("handler:activate"); });
        node.setActive(false);
        node.setActive(true);
        assert((log == std::vector<std::string>{"hook:activate", "handler:activate"}));
        node.destroy();
        node.destroy();
        assert(node.deactivated == 2);
        assert(node.destroyedHooks == 1);
    }
    {
        // Active propagates unconditionally, even into children whose own flag disagreed.
        auto parent = std::make_shared<GameObject>();
        GameObjectConfig childConfig;
        childConfig.active = false;
        auto child = std::make_shared<GameObject>(std::move(childConfig));
        parent->addChild(child);
        assert(!child->active());
        parent->setActive(false);
        parent->setActive(true);
        assert(child->active());
    }
    {
        // Enabled and visible stay local.
        auto parent = std::make_shared<GameObject>();
        auto child = std::make_shared<GameObject>();
        parent->addChild(child);
        parent->setEnabled(false);
        parent->setVisible(false);
        assert(child->enabled() && child->visible());
    }
    {
        // Adding an already-parented node is a structural violation.
        auto a = std::make_shared<GameObject>();
        auto b = std::make_shared<GameObject>();
        auto child = std::make_shared<GameObject>();
        a->addChild(child);
        assert(throwsViolation([&] { b->addChild(child); }));
        assert(throwsViolation([&] { a->addChild(child); }));
        assert(child->parent() == a.get());
        assert(b->children().empty());
        assert(throwsViolation([&] { a->addChild(nullptr); }));
    }
    {
        // Cycles are rejected.
        auto a = std::make_shared<GameObject>();
        auto b = std::make_shared<GameObject>();
        a->addChild(b);
        assert(throwsViolation([&] { b->addChild(a); }));
        assert(throwsViolation([&] { a->addChild(a); }));
    }
    {
        // Removing: foreign child throws, parentless child is a no-op, own child detaches.
        auto a = std::make_shared<GameObject>();
        auto b = std::make_shared<GameObject>();
        auto child = std::make_shared<GameObject>();
        auto loose = std::make_shared<GameObject>();
        a->addChild(child);
        assert(throwsViolation([&] { b->removeChild(*child); }));
        assert(!throwsViolation([&] { assert(b->removeChild(*loose) == nullptr); }));
        auto removed = a->removeChild(*child);
        assert(removed == child);
        assert(child->parent() == nullptr);
        assert(a->children().empty());
        b->addChild(child);
        assert(child->parent() == b.get());
    }
    {
        // Destroyed children are purged at the start of the parent's next update,
        // even when the parent itself is inactive.
        auto parent = std::make_shared<GameObject>();
        auto child = std::make_shared<GameObject>();
        auto survivor = std::make_shared<GameObject>();
        parent->addChild(child);
        parent->addChild(survivor);
        child->destroy();
        assert(parent->children().size() == 2);
        assert(child->parent() == parent.get());
        parent->setActive(false);
        parent->update(0.016f);
        assert(parent->children().size() == 1);
        assert(parent->children().front() == survivor);
        assert(child->parent() == nullptr);
    }
    {
        // Update gating: inactive skips everything, disabled skips only this node's handlers.
        int parentUpdates = 0;
        int childUpdates = 0;
        float seenDt = 0.0f;
        auto parent = std::make_shared<GameObject>();
        auto child = std::make_shared<GameObject>();
        parent->addChild(child);
        parent->addUpdateHandler([&](GameObject&, float dt) {
            ++parentUpdates;
            seenDt = dt;
        });
        child->addUpdateHandler([&](GameObject&, float) { ++childUpdates; });

        parent->update(0.5f);
        assert(parentUpdates == 1 && childUpdates == 1);
        assert(seenDt == 0.5f);

        parent->setEnabled(false);
        parent->update(0.5f);
        assert(parentUpdates == 1 && childUpdates == 2);

        parent->setEnabled(true);
        parent->setActive(false);
        parent->update(0.5f);
        assert(parentUpdates == 1 && childUpdates == 2);
    }
    {
        // Draw gating: invisible parent still draws its children.
        NullRenderDevice surface;
        std::vector<std::string> order;
        auto parent = std::make_shared<GameObject>();
        auto child = std::make_shared<GameObject>();
        parent->addChild(child);
        parent->addDrawHandler([&order](GameObject&, RenderDevice&) { order.push_back("parent"); });
        child->addDrawHandler([&order](GameObject&, RenderDevice&) { order.push_back("child"); });

        parent->draw(surface);
        assert((order == std::vector<std::string>{"parent", "child"}));

        order.clear();
        parent->setVisible(false);
        parent->draw(surface);
        assert((order == std::vector<std::string>{"child"}));

        order.clear();
        parent->setActive(false);
        parent->draw(surface);
        assert(order.empty());
    }
    {
        // Handlers: duplicates fire once per registration; removal takes out one registration.
        int calls = 0;
        GameObject node;
        auto fn = [&calls](GameObject&, float) { ++calls; };
        const HandlerId first = node.addUpdateHandler(fn);
        node.addUpdateHandler(fn);
        node.update(0.1f);
        assert(calls == 2);
        assert(node.removeUpdateHandler(first));
        assert(!node.removeUpdateHandler(first));
        node.update(0.1f);
        assert(calls == 3);
    }
    {
        // A child destroyed by an earlier sibling mid-pass does not update, and is purged next pass.
        auto parent = std::make_shared<GameObject>();
        auto killer = std::make_shared<GameObject>();
        auto victim = std::make_shared<GameObject>();
        int victimUpdates = 0;
        parent->addChild(killer);
        parent->addChild(victim);
        killer->addUpdateHandler([&victim](GameObject&, float) { victim->destroy(); });
        victim->addUpdateHandler([&victimUpdates](GameObject&, float) { ++victimUpdates; });
        parent->update(0.1f);
        assert(victimUpdates == 0);
        assert(parent->children().size() == 2);
        parent->update(0.1f);
        assert(parent->children().size() == 1);
    }
    {
        // A child added by the node's own handler joins the same pass; one added by a
        // sibling mid-iteration waits for the next pass.
        auto parent = std::make_shared<GameObject>();
        int spawnedUpdates = 0;
        bool spawned = false;
        parent->addUpdateHandler([&](GameObject& self, float) {
            if (spawned) return;
            spawned = true;
            auto child = std::make_shared<GameObject>();
            child->addUpdateHandler([&spawnedUpdates](GameObject&, float) { ++spawnedUpdates; });
            self.addChild(child);
        });
        parent->update(0.1f);
        assert(spawnedUpdates == 1);
        parent->update(0.1f);
        assert(spawnedUpdates == 2);

        auto host = std::make_shared<GameObject>();
        auto spawner = std::make_shared<GameObject>();
        int lateUpdates = 0;
        host->addChild(spawner);
        spawner->addUpdateHandler([&](GameObject&, float) {
            if (host->children().size() > 1) return;
            auto late = std::make_shared<GameObject>();
            late->addUpdateHandler([&lateUpdates](GameObject&, float) { ++lateUpdates; });
            host->addChild(late);
        });
        host->update(0.1f);
        assert(host->children().size() == 2);
        assert(lateUpdates == 0);
        host->update(0.1f);
        assert(lateUpdates == 1);
    }
    {
        // Construction config: initial children and lookups.
        auto a = std::make_shared<GameObject>();
        GameObjectConfig bConfig;
        bConfig.name = "b";
        auto b = std::make_shared<GameObject>(std::move(bConfig));
        GameObjectConfig config;
        config.name = "group";
        config.visible = false;
        config.children = {a, b};
        GameObject group(std::move(config));
        assert(group.name() && *group.name() == "group");
        assert(!group.visible() && group.active() && group.enabled());
        assert(group.children().size() == 2);
        assert(a->parent() == &group);
        assert(group.findChild("b") == b);
        assert(group.findChild("missing") == nullptr);
        assert(group.childrenOfType<GameObject>().size() == 2);
    }
    {
        // A rejected initial child leaves the earlier ones unlinked and reusable.
        auto fresh = std::make_shared<GameObject>();
        auto owned = std::make_shared<GameObject>();
        auto owner = std::make_shared<GameObject>();
        owner->addChild(owned);
        GameObjectConfig config;
        config.children = {fresh, owned};
        assert(throwsViolation([&] { std::make_shared<GameObject>(config); }));
        assert(fresh->parent() == nullptr);
        assert(owned->parent() == owner.get());
        auto adopter = std::make_shared<GameObject>();
        assert(!throwsViolation([&] { adopter->addChild(fresh); }));
        assert(fresh->parent() == adopter.get());

        // Listing the same child twice is rejected the same way.
        auto twice = std::make_shared<GameObject>();
        GameObjectConfig dupConfig;
        dupConfig.children = {twice, twice};
        assert(throwsViolation([&] { Sprite(Vec2{}, {}, dupConfig); }));
        assert(twice->parent() == nullptr);
        assert(!throwsViolation([&] { adopter->addChild(twice); }));
    }
    {
        // Children outliving their parent lose the back-link.
        auto child = std::make_shared<GameObject>();
        {
            GameObject parent;
            parent.addChild(child);
        }
        assert(child->parent() == nullptr);
    }
    return 0;
}
