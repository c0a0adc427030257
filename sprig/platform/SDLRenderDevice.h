// RenderDevice over an SDL_Renderer; alpha below 255 is blended.
#pragma once

#include <vector>

#include <SDL.h>

#include "../render/RenderDevice.h"

namespace Sprig {

class SDLRenderDevice final : public RenderDevice {
public:
    explicit SDLRenderDevice(SDL_Renderer* renderer) : renderer_(renderer) {}

    void clear(const Color& color) override;
    void drawFilledRect(const Vec2& topLeft, const Vec2& size, const Color& color) override;
    void drawTexture(const Texture& texture, const Vec2& topLeft, const Vec2& size) override;
    void drawFilledCircle(const Vec2& center, float radius, const Color& color) override;
    void present() override;

    SDL_Renderer* rawRenderer() const { return renderer_; }

private:
    void setColour(const Color& color);

    SDL_Renderer* renderer_{nullptr};  // owned by SDLWindow
    std::vector<SDL_FRect> spans_;
};

}  // namespace Sprig
