// Headless host loop and the demo scene running on a NullWindow.
#include <cassert>
#include <memory>

#include "../demo/DemoGame.h"
#include "../sprig/core/Application.h"
#include "../sprig/platform/NullWindow.h"

using namespace Sprig;

namespace {
class RecordingListener : public ApplicationListener {
public:
    bool succeed{true};
    int initialized{0};
    int shutdowns{0};
    int updates{0};
    int draws{0};

    bool onInitialize(Application& app) override {
        ++initialized;
        app.root().addUpdateFunc([this](float) { ++updates; });
        app.root().addDrawFunc([this](RenderDevice&) { ++draws; });
        return succeed;
    }
    void onShutdown() override { ++shutdowns; }
};

EngineConfig unpaced() {
    EngineConfig config{};
    config.targetFps = 0.0;
    return config;
}
}  // namespace

int main() {
    {
        // The loop runs until the window's frame budget closes it.
        RecordingListener listener;
        {
            Application app(listener, std::make_unique<NullWindow>(3), unpaced());
            assert(app.initialize());
            assert(app.running());
            app.run();
            assert(!app.running());
            assert(app.time().frame == 3);
            assert(dynamic_cast<NullWindow&>(app.window()).framesPolled() == 3);
            assert(listener.updates == 3);
            assert(listener.draws == 3);
            assert(listener.shutdowns == 0);
        }
        assert(listener.initialized == 1);
        assert(listener.shutdowns == 1);
    }
    {
        // step() advances one frame with the given delta.
        RecordingListener listener;
        Application app(listener, std::make_unique<NullWindow>(100), unpaced());
        assert(app.initialize());
        app.step(0.5);
        app.step(0.25);
        assert(app.time().frame == 2);
        assert(app.time().deltaSeconds == 0.25);
        assert(app.time().elapsedSeconds == 0.75);
        app.requestQuit("test");
        assert(!app.running());
    }
    {
        // A failing listener stops startup; a missing window never reaches the listener.
        RecordingListener listener;
        listener.succeed = false;
        {
            Application app(listener, std::make_unique<NullWindow>(), unpaced());
            assert(!app.initialize());
            assert(!app.running());
        }
        assert(listener.shutdowns == 1);

        RecordingListener unused;
        {
            Application app(unused, nullptr, unpaced());
            assert(!app.initialize());
        }
        assert(unused.initialized == 0);
        assert(unused.shutdowns == 0);
    }
    {
        // Config values reach the root.
        RecordingListener listener;
        EngineConfig config = unpaced();
        config.backgroundColour = Color{1, 2, 3, 255};
        Application app(listener, std::make_unique<NullWindow>(), config);
        assert(app.root().backgroundColour().g == 2);
    }
    {
        // The demo builds its scene and survives a run of headless frames.
        Demo::DemoSettings settings;
        settings.alienColumns = 4;
        settings.alienRows = 2;
        Demo::DemoGame game(settings);
        {
            Application app(game, std::make_unique<NullWindow>(120), unpaced());
            assert(app.initialize());
            const auto& tree = app.root().tree();
            auto aliens = tree.findChild("aliens");
            assert(aliens);
            assert(aliens->children().size() == 8);
            assert(tree.findChild("player"));
            assert(tree.findChild("collisions"));
            auto& window = dynamic_cast<NullWindow&>(app.window());
            assert(window.title() == app.config().window.title + " - score 0");
            for (int i = 0; i < 60; ++i) app.step(1.0 / 60.0);
            assert(aliens->children().size() == 8);
            assert(game.score() == 0);
        }
    }
    return 0;
}
