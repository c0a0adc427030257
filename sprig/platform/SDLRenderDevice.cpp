#include "SDLRenderDevice.h"

#include <algorithm>
#include <cmath>

#include "SDLTexture.h"

namespace Sprig {

void SDLRenderDevice::setColour(const Color& color) {
    SDL_SetRenderDrawBlendMode(renderer_, color.a < 255 ? SDL_BLENDMODE_BLEND : SDL_BLENDMODE_NONE);
    SDL_SetRenderDrawColor(renderer_, color.r, color.g, color.b, color.a);
}

void SDLRenderDevice::clear(const Color& color) {
    SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_NONE);
    SDL_SetRenderDrawColor(renderer_, color.r, color.g, color.b, color.a);
    SDL_RenderClear(renderer_);
}

void SDLRenderDevice::drawFilledRect(const Vec2& topLeft, const Vec2& size, const Color& color) {
    const SDL_FRect rect{topLeft.x, topLeft.y, size.x, size.y};
    setColour(color);
    SDL_RenderFillRectF(renderer_, &rect);
}

void SDLRenderDevice::drawFilledCircle(const Vec2& center, float radius, const Color& color) {
    if (radius <= 0.0f) {
        return;
    }
    // One span per scanline, submitted as a single batch.
    spans_.clear();
    const int r = static_cast<int>(std::ceil(radius));
    for (int dy = -r; dy <= r; ++dy) {
        const float half = std::sqrt(std::max(0.0f, radius * radius - static_cast<float>(dy * dy)));
        const float width = std::max(1.0f, half * 2.0f);
        spans_.push_back(SDL_FRect{center.x - width * 0.5f, center.y + static_cast<float>(dy), width, 1.0f});
    }
    setColour(color);
    SDL_RenderFillRectsF(renderer_, spans_.data(), static_cast<int>(spans_.size()));
}

void SDLRenderDevice::drawTexture(const Texture& texture, const Vec2& topLeft, const Vec2& size) {
    const auto* sdlTexture = dynamic_cast<const SDLTexture*>(&texture);
    if (!sdlTexture || !sdlTexture->raw()) {
        return;
    }
    const SDL_FRect dst{topLeft.x, topLeft.y, size.x, size.y};
    SDL_RenderCopyF(renderer_, sdlTexture->raw(), nullptr, &dst);
}

void SDLRenderDevice::present() { SDL_RenderPresent(renderer_); }

}  // namespace Sprig
