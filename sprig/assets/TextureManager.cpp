#include "TextureManager.h"

#include <utility>

#include "TextureLoader.h"
#include "../core/Logger.h"

namespace Sprig {

TextureManager::TextureManager(RenderDevice& device, std::string baseDir)
    : device_(device), baseDir_(std::move(baseDir)) {
    if (!baseDir_.empty() && baseDir_.back() != '/') {
        baseDir_.push_back('/');
    }
}

std::string TextureManager::resolve(const std::string& path) const {
    if (path.empty() || path.front() == '/' || baseDir_.empty()) {
        return path;
    }
    return baseDir_ + path;
}

std::optional<TexturePtr> TextureManager::getOrLoad(const std::string& path) {
    if (auto it = cache_.find(path); it != cache_.end()) {
        return it->second;
    }
    if (failed_.count(path) != 0) {
        return std::nullopt;
    }
    auto loaded = TextureLoader::loadImage(resolve(path), device_);
    if (!loaded) {
        logWarn("TextureManager: no texture for " + path + "; sprite falls back to its colour.");
        failed_.insert(path);
        return std::nullopt;
    }
    cache_.emplace(path, *loaded);
    return loaded;
}

std::vector<TexturePtr> TextureManager::getOrLoadAll(const std::vector<std::string>& paths) {
    std::vector<TexturePtr> frames;
    frames.reserve(paths.size());
    for (const auto& path : paths) {
        if (auto texture = getOrLoad(path)) {
            frames.push_back(std::move(*texture));
        }
    }
    return frames;
}

}  // namespace Sprig
