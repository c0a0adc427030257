// Simple color helper.
#pragma once

namespace Sprig {

struct Color {
    unsigned char r{0};
    unsigned char g{0};
    unsigned char b{0};
    unsigned char a{255};
};

inline bool operator==(const Color& lhs, const Color& rhs) {
    return lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b && lhs.a == rhs.a;
}
inline bool operator!=(const Color& lhs, const Color& rhs) { return !(lhs == rhs); }

}  // namespace Sprig
