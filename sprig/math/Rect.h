// Axis-aligned rectangle used for sprite bounds and overlap tests.
#pragma once

#include "Vec2.h"

namespace Sprig {

struct Rect {
    Vec2 topLeft{};
    Vec2 size{};

    static Rect fromCenter(const Vec2& center, const Vec2& size) {
        return Rect{Vec2{center.x - size.x * 0.5f, center.y - size.y * 0.5f}, size};
    }

    float left() const { return topLeft.x; }
    float top() const { return topLeft.y; }
    float right() const { return topLeft.x + size.x; }
    float bottom() const { return topLeft.y + size.y; }
    bool empty() const { return size.x <= 0.0f || size.y <= 0.0f; }

    // Edges that only touch do not count as overlap.
    bool overlaps(const Rect& other) const {
        if (empty() || other.empty()) return false;
        return left() < other.right() && other.left() < right() && top() < other.bottom() &&
               other.top() < bottom();
    }
};

}  // namespace Sprig
