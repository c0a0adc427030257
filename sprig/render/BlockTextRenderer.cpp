#include "BlockTextRenderer.h"

#include <array>
#include <cstdint>

namespace Sprig {

namespace {
constexpr int kGlyphWidth = 3;
constexpr int kGlyphHeight = 5;
constexpr int kAdvance = kGlyphWidth + 1;

using Glyph = std::array<std::uint8_t, kGlyphHeight>;  // one row per entry, high bit is the left column

constexpr std::array<Glyph, 10> kDigits{{
    {0b111, 0b101, 0b101, 0b101, 0b111},
    {0b010, 0b110, 0b010, 0b010, 0b111},
    {0b111, 0b001, 0b111, 0b100, 0b111},
    {0b111, 0b001, 0b111, 0b001, 0b111},
    {0b101, 0b101, 0b111, 0b001, 0b001},
    {0b111, 0b100, 0b111, 0b001, 0b111},
    {0b111, 0b100, 0b111, 0b101, 0b111},
    {0b111, 0b001, 0b001, 0b001, 0b001},
    {0b111, 0b101, 0b111, 0b101, 0b111},
    {0b111, 0b101, 0b111, 0b001, 0b111},
}};
constexpr Glyph kColon{0b000, 0b010, 0b000, 0b010, 0b000};
constexpr Glyph kMinus{0b000, 0b000, 0b111, 0b000, 0b000};
constexpr Glyph kPlus{0b000, 0b010, 0b111, 0b010, 0b000};

const Glyph* glyphFor(char c) {
    if (c >= '0' && c <= '9') return &kDigits[static_cast<std::size_t>(c - '0')];
    switch (c) {
        case ':':
            return &kColon;
        case '-':
            return &kMinus;
        case '+':
            return &kPlus;
        default:
            return nullptr;
    }
}
}  // namespace

Vec2 BlockTextRenderer::measureText(const std::string& text, float scale) const {
    if (text.empty()) {
        return Vec2{};
    }
    const float block = kBlockSize * scale;
    const float columns = static_cast<float>(text.size() * kAdvance - 1);
    return Vec2{columns * block, static_cast<float>(kGlyphHeight) * block};
}

void BlockTextRenderer::drawText(const std::string& text, const Vec2& center, float scale, const Color& color) {
    if (text.empty() || scale <= 0.0f) {
        return;
    }
    const float block = kBlockSize * scale;
    const Vec2 extent = measureText(text, scale);
    Vec2 pen{center.x - extent.x * 0.5f, center.y - extent.y * 0.5f};

    for (char c : text) {
        if (const Glyph* glyph = glyphFor(c)) {
            for (int row = 0; row < kGlyphHeight; ++row) {
                for (int col = 0; col < kGlyphWidth; ++col) {
                    if ((*glyph)[row] & (1u << (kGlyphWidth - 1 - col))) {
                        device_.drawFilledRect(Vec2{pen.x + static_cast<float>(col) * block,
                                                    pen.y + static_cast<float>(row) * block},
                                               Vec2{block, block}, color);
                    }
                }
            }
        }
        pen.x += static_cast<float>(kAdvance) * block;
    }
}

}  // namespace Sprig
