#include "SDLTexture.h"

#include <memory>

namespace Sprig {

SDLTexture::SDLTexture(SDL_Texture* texture) : texture_(texture) {
    if (texture_) {
        SDL_QueryTexture(texture_, nullptr, nullptr, &width_, &height_);
    }
}

SDLTexture::~SDLTexture() {
    if (texture_) SDL_DestroyTexture(texture_);
}

TexturePtr SDLTexture::fromSurface(SDL_Renderer* renderer, SDL_Surface* surface) {
    if (!renderer || !surface) {
        if (surface) SDL_FreeSurface(surface);
        return nullptr;
    }
    SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer, surface);
    SDL_FreeSurface(surface);
    if (!texture) {
        return nullptr;
    }
    return std::make_shared<SDLTexture>(texture);
}

}  // namespace Sprig
