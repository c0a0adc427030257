#include "TextureLoader.h"

#include <SDL.h>
#include <SDL_image.h>

#include "../core/Logger.h"
#include "../platform/SDLRenderDevice.h"
#include "../platform/SDLTexture.h"
#include "../render/RenderDevice.h"

namespace Sprig {

namespace {
SDL_Renderer* sdlRenderer(RenderDevice& device) {
    auto* sdlDevice = dynamic_cast<SDLRenderDevice*>(&device);
    if (!sdlDevice) {
        logWarn("TextureLoader: unsupported render device.");
        return nullptr;
    }
    if (!sdlDevice->rawRenderer()) {
        logWarn("TextureLoader: renderer unavailable.");
    }
    return sdlDevice->rawRenderer();
}

std::optional<TexturePtr> toTexture(SDL_Renderer* renderer, SDL_Surface* surface, const std::string& path) {
    if (auto texture = SDLTexture::fromSurface(renderer, surface)) {
        return texture;
    }
    logWarn(std::string("Failed to create texture from ") + path + " | " + SDL_GetError());
    return std::nullopt;
}
}  // namespace

std::optional<TexturePtr> TextureLoader::loadBMP(const std::string& path, RenderDevice& device) {
    SDL_Renderer* renderer = sdlRenderer(device);
    if (!renderer) {
        return std::nullopt;
    }
    SDL_Surface* surface = SDL_LoadBMP(path.c_str());
    if (!surface) {
        logWarn(std::string("Failed to load BMP: ") + path + " | " + SDL_GetError());
        return std::nullopt;
    }
    return toTexture(renderer, surface, path);
}

std::optional<TexturePtr> TextureLoader::loadImage(const std::string& path, RenderDevice& device) {
    SDL_Renderer* renderer = sdlRenderer(device);
    if (!renderer) {
        return std::nullopt;
    }
    SDL_Surface* surface = IMG_Load(path.c_str());
    if (!surface) {
        logDebug(std::string("IMG_Load failed: ") + path + " | " + IMG_GetError());
        return loadBMP(path, device);
    }
    return toTexture(renderer, surface, path);
}

}  // namespace Sprig
