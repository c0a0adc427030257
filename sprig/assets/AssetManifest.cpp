#include "AssetManifest.h"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "../core/Logger.h"

namespace Sprig {

std::optional<AssetManifest> AssetManifestLoader::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        logWarn("AssetManifest: cannot open " + path);
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    auto manifest = parse(buffer.str());
    if (manifest) {
        const auto slash = path.find_last_of('/');
        manifest->baseDir = slash == std::string::npos ? std::string{} : path.substr(0, slash);
    }
    return manifest;
}

std::optional<AssetManifest> AssetManifestLoader::parse(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        logWarn(std::string("AssetManifest: parse error: ") + e.what());
        return std::nullopt;
    }

    AssetManifest manifest{};
    if (!j.is_object() || !j.contains("sprites") || !j["sprites"].is_object()) {
        return manifest;
    }
    for (const auto& item : j["sprites"].items()) {
        const std::string& name = item.key();
        const auto& frames = item.value();
        if (!frames.is_array()) {
            logWarn("AssetManifest: sprite '" + name + "' frames must be an array.");
            continue;
        }
        std::vector<std::string> paths;
        for (const auto& f : frames) {
            if (f.is_string()) paths.push_back(f.get<std::string>());
        }
        manifest.sprites[name] = std::move(paths);
    }
    return manifest;
}

}  // namespace Sprig
