// Texture cache keyed by manifest path.
#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "Texture.h"

namespace Sprig {

class RenderDevice;

class TextureManager {
public:
    // Relative paths are resolved against baseDir (usually the manifest's directory).
    explicit TextureManager(RenderDevice& device, std::string baseDir = {});

    // Cached texture for path, loading it on first use. A path that failed once is not retried.
    std::optional<TexturePtr> getOrLoad(const std::string& path);
    // Frames for a sprite in manifest order; frames that fail to load are left out.
    std::vector<TexturePtr> getOrLoadAll(const std::vector<std::string>& paths);

    std::size_t cachedCount() const { return cache_.size(); }

private:
    std::string resolve(const std::string& path) const;

    RenderDevice& device_;
    std::string baseDir_;
    std::unordered_map<std::string, TexturePtr> cache_;
    std::unordered_set<std::string> failed_;
};

}  // namespace Sprig
