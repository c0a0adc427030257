// Minimal text rendering interface.
#pragma once

#include <string>

#include "Color.h"
#include "../math/Vec2.h"

namespace Sprig {

class TextRenderer {
public:
    virtual ~TextRenderer() = default;
    virtual void drawText(const std::string& text, const Vec2& center, float scale, const Color& color) = 0;
};

}  // namespace Sprig
