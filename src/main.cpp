#include <cstdlib>
#include <memory>
#include <optional>
#include <string>

#define SDL_MAIN_HANDLED
#include <SDL.h>

#include "../demo/DemoGame.h"
#include "../sprig/assets/AssetManifest.h"
#include "../sprig/core/Application.h"
#include "../sprig/core/EngineConfig.h"
#include "../sprig/core/Logger.h"
#include "../sprig/platform/NullWindow.h"
#include "../sprig/platform/SDLWindow.h"

// Usage: sprig_demo [--config path] [--manifest path] [--headless frames]
int main(int argc, char** argv) {
    SDL_SetMainReady();

    std::string configPath = "assets/engine.json";
    std::string manifestPath = "assets/manifest.json";
    long headlessFrames = -1;
    for (int i = 1; i + 1 < argc; i += 2) {
        const std::string flag = argv[i];
        if (flag == "--config") {
            configPath = argv[i + 1];
        } else if (flag == "--manifest") {
            manifestPath = argv[i + 1];
        } else if (flag == "--headless") {
            headlessFrames = std::strtol(argv[i + 1], nullptr, 10);
        } else {
            Sprig::logWarn("Ignoring unknown option " + flag);
        }
    }

    Sprig::EngineConfig config{};
    if (auto loaded = Sprig::EngineConfigLoader::loadFromFile(configPath)) {
        config = *loaded;
    } else {
        Sprig::logWarn("Using default engine settings.");
    }

    Sprig::WindowPtr window;
    std::optional<Sprig::AssetManifest> manifest;
    if (headlessFrames > 0) {
        window = std::make_unique<Sprig::NullWindow>(static_cast<unsigned long long>(headlessFrames));
    } else {
        window = std::make_unique<Sprig::SDLWindow>();
        manifest = Sprig::AssetManifestLoader::load(manifestPath);
    }

    Demo::DemoGame game({}, std::move(manifest));
    Sprig::Application app(game, std::move(window), config);
    if (!app.initialize()) {
        return 1;
    }

    app.run();
    return 0;
}
