// Synchronous image loading into SDL textures.
#pragma once

#include <optional>
#include <string>

#include "Texture.h"

namespace Sprig {

class RenderDevice;

class TextureLoader {
public:
    // Loads PNG/JPG/etc. via SDL_image, falling back to SDL's BMP loader.
    static std::optional<TexturePtr> loadImage(const std::string& path, RenderDevice& device);

private:
    static std::optional<TexturePtr> loadBMP(const std::string& path, RenderDevice& device);
};

}  // namespace Sprig
