// Texture backed by an SDL_Texture it owns.
#pragma once

#include <SDL.h>

#include "../assets/Texture.h"

namespace Sprig {

class SDLTexture final : public Texture {
public:
    explicit SDLTexture(SDL_Texture* texture);
    ~SDLTexture() override;

    SDLTexture(const SDLTexture&) = delete;
    SDLTexture& operator=(const SDLTexture&) = delete;

    // Uploads surface and frees it. Returns null if SDL cannot create the texture.
    static TexturePtr fromSurface(SDL_Renderer* renderer, SDL_Surface* surface);

    int width() const override { return width_; }
    int height() const override { return height_; }
    SDL_Texture* raw() const { return texture_; }

private:
    SDL_Texture* texture_;
    int width_{0};
    int height_{0};
};

}  // namespace Sprig
