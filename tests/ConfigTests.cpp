// JSON loaders for engine settings and the asset manifest, and log level parsing.
#include <cassert>
#include <string>

#include "../sprig/assets/AssetManifest.h"
#include "../sprig/core/EngineConfig.h"
#include "../sprig/core/Logger.h"

using namespace Sprig;

int main() {
    {
        auto config = EngineConfigLoader::loadFromString(R"({
            "window": { "width": 1024, "height": 768, "title": "Test", "vsync": false },
            "backgroundColour": [12, 34, 56],
            "targetFps": 30,
            "spriteFps": 4.5,
            "logLevel": "debug"
        })");
        assert(config);
        assert(config->window.width == 1024);
        assert(config->window.height == 768);
        assert(config->window.title == "Test");
        assert(!config->window.vsync);
        assert(config->backgroundColour.r == 12 && config->backgroundColour.g == 34);
        assert(config->backgroundColour.b == 56 && config->backgroundColour.a == 255);
        assert(config->targetFps == 30.0);
        assert(config->spriteFps == 4.5f);
        assert(config->logLevel == LogLevel::Debug);
    }
    {
        // Missing keys keep defaults; keys of the wrong type are ignored.
        auto config = EngineConfigLoader::loadFromString(R"({
            "window": { "width": "wide" },
            "backgroundColour": [300, 0, 0],
            "targetFps": "fast",
            "logLevel": "chatty"
        })");
        assert(config);
        const EngineConfig defaults{};
        assert(config->window.width == defaults.window.width);
        assert(config->window.title == defaults.window.title);
        assert(config->backgroundColour.r == defaults.backgroundColour.r);
        assert(config->targetFps == defaults.targetFps);
        assert(config->logLevel == defaults.logLevel);
    }
    {
        // Malformed input and missing files yield nothing.
        assert(!EngineConfigLoader::loadFromString("{ not json"));
        assert(!EngineConfigLoader::loadFromFile("/nonexistent/sprig/engine.json"));
        auto array = EngineConfigLoader::loadFromString("[1, 2]");
        assert(array);
        assert(array->window.width == EngineConfig{}.window.width);
    }
    {
        auto manifest = AssetManifestLoader::parse(R"({
            "sprites": {
                "alien": ["a0.png", "a1.png"],
                "shot": ["s.png", 7],
                "broken": "nope"
            }
        })");
        assert(manifest);
        const auto* alien = manifest->framesFor("alien");
        assert(alien && alien->size() == 2);
        assert((*alien)[0] == "a0.png" && (*alien)[1] == "a1.png");
        const auto* shot = manifest->framesFor("shot");
        assert(shot && shot->size() == 1);
        assert(manifest->framesFor("broken") == nullptr);
        assert(manifest->framesFor("player") == nullptr);

        assert(!AssetManifestLoader::parse("nope"));
        auto empty = AssetManifestLoader::parse("{}");
        assert(empty && empty->sprites.empty());
        assert(!AssetManifestLoader::load("/nonexistent/sprig/manifest.json"));
    }
    {
        assert(Logger::parseLevel("debug") == LogLevel::Debug);
        assert(Logger::parseLevel("info") == LogLevel::Info);
        assert(Logger::parseLevel("warn") == LogLevel::Warning);
        assert(Logger::parseLevel("warning") == LogLevel::Warning);
        assert(Logger::parseLevel("error") == LogLevel::Error);
        assert(!Logger::parseLevel("loud"));

        const LogLevel previous = Logger::minLevel();
        Logger::setMinLevel(LogLevel::Error);
        assert(Logger::minLevel() == LogLevel::Error);
        logInfo("suppressed");
        Logger::setMinLevel(previous);
    }
    return 0;
}
