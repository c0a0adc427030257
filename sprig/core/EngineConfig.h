// Engine settings loaded from JSON.
#pragma once

#include <optional>
#include <string>

#include "Logger.h"
#include "../render/Color.h"

namespace Sprig {

struct WindowConfig {
    int width{800};
    int height{600};
    std::string title{"Sprig"};
    bool vsync{true};
};

struct EngineConfig {
    WindowConfig window{};
    Color backgroundColour{0, 0, 0, 255};
    double targetFps{60.0};
    float spriteFps{2.0f};
    LogLevel logLevel{LogLevel::Info};
};

class EngineConfigLoader {
public:
    // Missing keys keep their defaults; keys of the wrong type are skipped with a warning.
    static std::optional<EngineConfig> loadFromFile(const std::string& path);
    static std::optional<EngineConfig> loadFromString(const std::string& text);
};

}  // namespace Sprig
