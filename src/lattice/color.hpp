#pragma once

#include "result.hpp"
#include <string>

namespace lattice {

// RGBA, components in 0..255
struct Color {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 0.0f;

    bool operator==(const Color&) const = default;

    bool transparent() const { return a <= 0.0f; }

    static Color rgba(float r, float g, float b, float a = 255.0f) { return {r, g, b, a}; }
};

// "#rgb", "#rrggbb", "#rrggbbaa", "rgb(r,g,b)", "rgba(r,g,b,a)" or a CSS color name (any case)
Result<Color> parse_color(const std::string& text);

std::string to_string(const Color& color);

} // namespace lattice
