#include "EngineConfig.h"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace Sprig {

namespace {
template <typename T>
void readNumber(const nlohmann::json& obj, const char* key, T& out) {
    if (!obj.contains(key)) return;
    const auto& v = obj[key];
    if (!v.is_number()) {
        logWarn(std::string("EngineConfig: '") + key + "' is not a number; keeping default.");
        return;
    }
    out = v.get<T>();
}

void readColour(const nlohmann::json& obj, const char* key, Color& out) {
    if (!obj.contains(key)) return;
    const auto& v = obj[key];
    if (!v.is_array() || (v.size() != 3 && v.size() != 4)) {
        logWarn(std::string("EngineConfig: '") + key + "' must be [r, g, b] or [r, g, b, a].");
        return;
    }
    for (const auto& c : v) {
        if (!c.is_number_integer() || c.get<int>() < 0 || c.get<int>() > 255) {
            logWarn(std::string("EngineConfig: '") + key + "' components must be integers in 0..255.");
            return;
        }
    }
    out.r = static_cast<unsigned char>(v[0].get<int>());
    out.g = static_cast<unsigned char>(v[1].get<int>());
    out.b = static_cast<unsigned char>(v[2].get<int>());
    out.a = v.size() == 4 ? static_cast<unsigned char>(v[3].get<int>()) : 255;
}

EngineConfig fromJson(const nlohmann::json& j) {
    EngineConfig config{};
    if (!j.is_object()) {
        logWarn("EngineConfig: top level is not an object; using defaults.");
        return config;
    }

    if (j.contains("window") && j["window"].is_object()) {
        const auto& w = j["window"];
        readNumber(w, "width", config.window.width);
        readNumber(w, "height", config.window.height);
        if (w.contains("title") && w["title"].is_string()) {
            config.window.title = w["title"].get<std::string>();
        }
        if (w.contains("vsync") && w["vsync"].is_boolean()) {
            config.window.vsync = w["vsync"].get<bool>();
        }
    }
    readColour(j, "backgroundColour", config.backgroundColour);
    readNumber(j, "targetFps", config.targetFps);
    readNumber(j, "spriteFps", config.spriteFps);
    if (j.contains("logLevel") && j["logLevel"].is_string()) {
        if (auto level = Logger::parseLevel(j["logLevel"].get<std::string>())) {
            config.logLevel = *level;
        } else {
            logWarn("EngineConfig: unknown logLevel '" + j["logLevel"].get<std::string>() + "'.");
        }
    }
    return config;
}
}  // namespace

std::optional<EngineConfig> EngineConfigLoader::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        logWarn("EngineConfig: cannot open " + path);
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return loadFromString(buffer.str());
}

std::optional<EngineConfig> EngineConfigLoader::loadFromString(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        logWarn(std::string("EngineConfig: parse error: ") + e.what());
        return std::nullopt;
    }
    return fromJson(j);
}

}  // namespace Sprig
