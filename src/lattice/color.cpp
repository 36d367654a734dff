#include "color.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <map>
#include <utility>
#include <vector>

namespace lattice {

namespace {

// CSS named colors, plus "transparent"
const std::map<std::string, Color>& named_colors() {
    static const std::map<std::string, Color> colors = [] {
        static const std::pair<const char*, uint32_t> table[] = {
            {"aliceblue", 0xf0f8ff}, {"antiquewhite", 0xfaebd7}, {"aqua", 0x00ffff}, {"aquamarine", 0x7fffd4},
            {"azure", 0xf0ffff}, {"beige", 0xf5f5dc}, {"bisque", 0xffe4c4}, {"black", 0x000000}, {"blanchedalmond", 0xffebcd},
            {"blue", 0x0000ff}, {"blueviolet", 0x8a2be2}, {"brown", 0xa52a2a}, {"burlywood", 0xdeb887}, {"cadetblue", 0x5f9ea0},
            {"chartreuse", 0x7fff00}, {"chocolate", 0xd2691e}, {"coral", 0xff7f50}, {"cornflowerblue", 0x6495ed},
            {"cornsilk", 0xfff8dc}, {"crimson", 0xdc143c}, {"cyan", 0x00ffff}, {"darkblue", 0x00008b}, {"darkcyan", 0x008b8b},
            {"darkgoldenrod", 0xb8860b}, {"darkgray", 0xa9a9a9}, {"darkgreen", 0x006400}, {"darkgrey", 0xa9a9a9},
            {"darkkhaki", 0xbdb76b}, {"darkmagenta", 0x8b008b}, {"darkolivegreen", 0x556b2f}, {"darkorange", 0xff8c00},
            {"darkorchid", 0x9932cc}, {"darkred", 0x8b0000}, {"darksalmon", 0xe9967a}, {"darkseagreen", 0x8fbc8f},
            {"darkslateblue", 0x483d8b}, {"darkslategray", 0x2f4f4f}, {"darkslategrey", 0x2f4f4f}, {"darkturquoise", 0x00ced1},
            {"darkviolet", 0x9400d3}, {"deeppink", 0xff1493}, {"deepskyblue", 0x00bfff}, {"dimgray", 0x696969},
            {"dimgrey", 0x696969}, {"dodgerblue", 0x1e90ff}, {"firebrick", 0xb22222}, {"floralwhite", 0xfffaf0},
            {"forestgreen", 0x228b22}, {"fuchsia", 0xff00ff}, {"gainsboro", 0xdcdcdc}, {"ghostwhite", 0xf8f8ff},
            {"gold", 0xffd700}, {"goldenrod", 0xdaa520}, {"gray", 0x808080}, {"green", 0x008000}, {"greenyellow", 0xadff2f},
            {"grey", 0x808080}, {"honeydew", 0xf0fff0}, {"hotpink", 0xff69b4}, {"indianred", 0xcd5c5c}, {"indigo", 0x4b0082},
            {"ivory", 0xfffff0}, {"khaki", 0xf0e68c}, {"lavender", 0xe6e6fa}, {"lavenderblush", 0xfff0f5},
            {"lawngreen", 0x7cfc00}, {"lemonchiffon", 0xfffacd}, {"lightblue", 0xadd8e6}, {"lightcoral", 0xf08080},
            {"lightcyan", 0xe0ffff}, {"lightgoldenrodyellow", 0xfafad2}, {"lightgray", 0xd3d3d3}, {"lightgreen", 0x90ee90},
            {"lightgrey", 0xd3d3d3}, {"lightpink", 0xffb6c1}, {"lightsalmon", 0xffa07a}, {"lightseagreen", 0x20b2aa},
            {"lightskyblue", 0x87cefa}, {"lightslategray", 0x778899}, {"lightslategrey", 0x778899}, {"lightsteelblue", 0xb0c4de},
            {"lightyellow", 0xffffe0}, {"lime", 0x00ff00}, {"limegreen", 0x32cd32}, {"linen", 0xfaf0e6},
            {"magenta", 0xff00ff}, {"maroon", 0x800000}, {"mediumaquamarine", 0x66cdaa}, {"mediumblue", 0x0000cd},
            {"mediumorchid", 0xba55d3}, {"mediumpurple", 0x9370db}, {"mediumseagreen", 0x3cb371}, {"mediumslateblue", 0x7b68ee},
            {"mediumspringgreen", 0x00fa9a}, {"mediumturquoise", 0x48d1cc}, {"mediumvioletred", 0xc71585},
            {"midnightblue", 0x191970}, {"mintcream", 0xf5fffa}, {"mistyrose", 0xffe4e1}, {"moccasin", 0xffe4b5},
            {"navajowhite", 0xffdead}, {"navy", 0x000080}, {"oldlace", 0xfdf5e6}, {"olive", 0x808000}, {"olivedrab", 0x6b8e23},
            {"orange", 0xffa500}, {"orangered", 0xff4500}, {"orchid", 0xda70d6}, {"palegoldenrod", 0xeee8aa},
            {"palegreen", 0x98fb98}, {"paleturquoise", 0xafeeee}, {"palevioletred", 0xdb7093}, {"papayawhip", 0xffefd5},
            {"peachpuff", 0xffdab9}, {"peru", 0xcd853f}, {"pink", 0xffc0cb}, {"plum", 0xdda0dd}, {"powderblue", 0xb0e0e6},
            {"purple", 0x800080}, {"rebeccapurple", 0x663399}, {"red", 0xff0000}, {"rosybrown", 0xbc8f8f},
            {"royalblue", 0x4169e1}, {"saddlebrown", 0x8b4513}, {"salmon", 0xfa8072}, {"sandybrown", 0xf4a460},
            {"seagreen", 0x2e8b57}, {"seashell", 0xfff5ee}, {"sienna", 0xa0522d}, {"silver", 0xc0c0c0}, {"skyblue", 0x87ceeb},
            {"slateblue", 0x6a5acd}, {"slategray", 0x708090}, {"slategrey", 0x708090}, {"snow", 0xfffafa},
            {"springgreen", 0x00ff7f}, {"steelblue", 0x4682b4}, {"tan", 0xd2b48c}, {"teal", 0x008080}, {"thistle", 0xd8bfd8},
            {"tomato", 0xff6347}, {"turquoise", 0x40e0d0}, {"violet", 0xee82ee}, {"wheat", 0xf5deb3}, {"white", 0xffffff},
            {"whitesmoke", 0xf5f5f5}, {"yellow", 0xffff00}, {"yellowgreen", 0x9acd32},
        };
        std::map<std::string, Color> out;
        for (const auto& [name, rgb] : table) {
            out[name] = Color::rgba(static_cast<float>((rgb >> 16) & 0xFF),
                                    static_cast<float>((rgb >> 8) & 0xFF),
                                    static_cast<float>(rgb & 0xFF));
        }
        out["transparent"] = Color{};
        return out;
    }();
    return colors;
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Result<Color> parse_hex(const std::string& text) {
    std::string digits = text.substr(1);
    if (digits.size() == 3) {
        std::string expanded;
        for (char c : digits) {
            expanded += c;
            expanded += c;
        }
        digits = expanded;
    }
    if (digits.size() != 6 && digits.size() != 8) {
        return Err<Color>(ErrorCode::MalformedMarkup, "parse_color: bad hex length in '" + text + "'");
    }

    std::array<float, 4> parts = {0, 0, 0, 255};
    for (size_t i = 0; i < digits.size() / 2; ++i) {
        int hi = hex_digit(digits[2 * i]);
        int lo = hex_digit(digits[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return Err<Color>(ErrorCode::MalformedMarkup, "parse_color: bad hex digit in '" + text + "'");
        }
        parts[i] = static_cast<float>(hi * 16 + lo);
    }
    return Color{parts[0], parts[1], parts[2], parts[3]};
}

// "rgb(1, 2, 3)" / "rgba(1, 2, 3, 4)"
Result<Color> parse_function(const std::string& text) {
    auto open = text.find('(');
    auto close = text.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return Err<Color>(ErrorCode::MalformedMarkup, "parse_color: unbalanced '" + text + "'");
    }
    std::string name = text.substr(0, open);
    std::string args = text.substr(open + 1, close - open - 1);

    std::vector<float> values;
    size_t pos = 0;
    while (pos <= args.size()) {
        auto comma = args.find(',', pos);
        std::string item = args.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos);
        item.erase(std::remove_if(item.begin(), item.end(), [](unsigned char c) { return std::isspace(c); }), item.end());

        float v = 0.0f;
        auto [ptr, ec] = std::from_chars(item.data(), item.data() + item.size(), v);
        if (item.empty() || ec != std::errc() || ptr != item.data() + item.size()) {
            return Err<Color>(ErrorCode::MalformedMarkup, "parse_color: bad component '" + item + "' in '" + text + "'");
        }
        values.push_back(std::clamp(v, 0.0f, 255.0f));

        if (comma == std::string::npos) break;
        pos = comma + 1;
    }

    if (name == "rgb" && values.size() == 3) {
        return Color{values[0], values[1], values[2], 255.0f};
    }
    if (name == "rgba" && values.size() == 4) {
        return Color{values[0], values[1], values[2], values[3]};
    }
    return Err<Color>(ErrorCode::MalformedMarkup, "parse_color: unsupported '" + text + "'");
}

} // namespace

Result<Color> parse_color(const std::string& text) {
    if (text.empty()) {
        return Err<Color>(ErrorCode::MalformedMarkup, "parse_color: empty color");
    }
    if (text[0] == '#') {
        return parse_hex(text);
    }
    if (text.find('(') != std::string::npos) {
        return parse_function(text);
    }
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    auto it = named_colors().find(lower);
    if (it != named_colors().end()) {
        return it->second;
    }
    return Err<Color>(ErrorCode::MalformedMarkup, "parse_color: unknown color '" + text + "'");
}

std::string to_string(const Color& color) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "rgba(%g, %g, %g, %g)", color.r, color.g, color.b, color.a);
    return buf;
}

} // namespace lattice
