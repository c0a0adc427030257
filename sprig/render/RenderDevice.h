// Minimal immediate-mode 2D render device; the opaque surface handed to draw passes.
#pragma once

#include <algorithm>
#include <cmath>
#include <memory>

#include "../math/Vec2.h"
#include "Color.h"

namespace Sprig {

class RenderDevice {
public:
    virtual ~RenderDevice() = default;

    virtual void clear(const Color& color) = 0;
    virtual void drawFilledRect(const Vec2& topLeft, const Vec2& size, const Color& color) = 0;
    virtual void drawTexture(const class Texture& texture, const Vec2& topLeft, const Vec2& size) = 0;
    // Default implementation rasterizes the circle as one horizontal span per row.
    virtual void drawFilledCircle(const Vec2& center, float radius, const Color& color) {
        if (radius <= 0.0f) {
            return;
        }
        const int r = static_cast<int>(std::ceil(radius));
        for (int dy = -r; dy <= r; ++dy) {
            const float span = std::sqrt(std::max(0.0f, radius * radius - static_cast<float>(dy * dy)));
            if (span <= 0.0f && dy != 0) {
                continue;
            }
            const float width = std::max(1.0f, span * 2.0f);
            drawFilledRect(Vec2{center.x - width * 0.5f, center.y + static_cast<float>(dy)}, Vec2{width, 1.0f}, color);
        }
    }
    virtual void present() = 0;
};

using RenderDevicePtr = std::unique_ptr<RenderDevice>;

}  // namespace Sprig
