// Font-free text: digits and a little punctuation drawn as 3x5 blocks of filled rects.
#pragma once

#include <string>

#include "RenderDevice.h"
#include "TextRenderer.h"

namespace Sprig {

class BlockTextRenderer final : public TextRenderer {
public:
    // Side of one block at scale 1, in pixels.
    static constexpr float kBlockSize = 2.0f;

    explicit BlockTextRenderer(RenderDevice& device) : device_(device) {}

    // Characters without a glyph still take up their cell.
    void drawText(const std::string& text, const Vec2& center, float scale, const Color& color) override;
    Vec2 measureText(const std::string& text, float scale) const;

private:
    RenderDevice& device_;
};

}  // namespace Sprig
