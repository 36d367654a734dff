#pragma once

#include "geometry.hpp"
#include "../config.hpp"
#include "../markup/style.hpp"
#include <cstdint>
#include <string>

namespace lattice {

// Text style after bindings and defaults are applied
struct TextStyle {
    uint16_t font_id = 0;
    float font_size = 16.0f;
    float line_height = 19.2f;
    Color color = Color::rgba(255, 255, 255);
    TextAlign align = TextAlign::Left;

    bool operator==(const TextStyle&) const = default;
};

// External text measurement; must be a pure function of its inputs
class TextMeasurer {
public:
    virtual ~TextMeasurer() = default;
    virtual Size measure(const std::string& text, const TextStyle& style) const = 0;
};

// Fixed advance per glyph, newline-separated lines, no wrapping
class MonospaceTextMeasurer : public TextMeasurer {
public:
    explicit MonospaceTextMeasurer(TextConfig config = {}) : _config(config) {}

    Size measure(const std::string& text, const TextStyle& style) const override;

private:
    TextConfig _config;
};

} // namespace lattice
