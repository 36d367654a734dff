#include "text_measure.hpp"

namespace lattice {

Size MonospaceTextMeasurer::measure(const std::string& text, const TextStyle& style) const {
    if (text.empty()) {
        return {};
    }

    size_t lines = 1;
    size_t glyphs = 0;
    size_t widest = 0;
    for (unsigned char c : text) {
        if (c == '\n') {
            widest = std::max(widest, glyphs);
            glyphs = 0;
            ++lines;
            continue;
        }
        // Count UTF-8 lead bytes only
        if ((c & 0xC0) != 0x80) {
            ++glyphs;
        }
    }
    widest = std::max(widest, glyphs);

    float advance = sanitize(style.font_size) * _config.char_width;
    return {static_cast<float>(widest) * advance, static_cast<float>(lines) * sanitize(style.line_height)};
}

} // namespace lattice
