// Data-driven list of named sprite image sequences.
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Sprig {

struct AssetManifest {
    // Sprite name -> frame image paths, in animation order.
    std::map<std::string, std::vector<std::string>> sprites;
    // Directory the manifest was read from; frame paths are relative to it.
    std::string baseDir;

    const std::vector<std::string>* framesFor(const std::string& name) const {
        auto it = sprites.find(name);
        return it == sprites.end() ? nullptr : &it->second;
    }
};

class AssetManifestLoader {
public:
    // Sets baseDir to the directory part of path.
    static std::optional<AssetManifest> load(const std::string& path);
    static std::optional<AssetManifest> parse(const std::string& text);
};

}  // namespace Sprig
