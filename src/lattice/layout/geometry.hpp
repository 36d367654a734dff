#pragma once

#include "../color.hpp"
#include <algorithm>
#include <cmath>

namespace lattice {

struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;

    bool operator==(const Vec2&) const = default;
    Vec2 operator+(const Vec2& o) const { return {x + o.x, y + o.y}; }
    Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
};

struct Size {
    float width = 0.0f;
    float height = 0.0f;

    bool operator==(const Size&) const = default;
};

struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    bool operator==(const Rect&) const = default;

    float right() const { return x + width; }
    float bottom() const { return y + height; }

    // Half-open on the far edges so adjacent rects never both contain a point
    bool contains(Vec2 p) const {
        return p.x >= x && p.y >= y && p.x < right() && p.y < bottom();
    }

    Rect intersect(const Rect& o) const {
        float l = std::max(x, o.x);
        float t = std::max(y, o.y);
        float r = std::min(right(), o.right());
        float b = std::min(bottom(), o.bottom());
        return {l, t, std::max(0.0f, r - l), std::max(0.0f, b - t)};
    }
};

// NaN and negative extents collapse to 0
inline float sanitize(float v) {
    return (std::isnan(v) || v < 0.0f) ? 0.0f : v;
}

} // namespace lattice
