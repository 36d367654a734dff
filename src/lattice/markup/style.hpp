#pragma once

#include "../color.hpp"
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <variant>

namespace lattice {

// Reference to a binding key, resolved per frame
struct KeyRef {
    std::string key;
    bool operator==(const KeyRef&) const = default;
};

// Literal value or binding key
template<typename T>
using Source = std::variant<T, KeyRef>;

enum class SizingMode {
    Fit,
    Grow,
    Fixed,
    Percent,
};

struct Sizing {
    SizingMode mode = SizingMode::Fit;
    Source<float> value = 0.0f;     // extent for Fixed, fraction 0..1 for Percent
    float min = 0.0f;
    float max = std::numeric_limits<float>::infinity();

    bool operator==(const Sizing&) const = default;

    static Sizing fit(float min = 0.0f, float max = std::numeric_limits<float>::infinity()) {
        return {SizingMode::Fit, 0.0f, min, max};
    }
    static Sizing grow(float min = 0.0f, float max = std::numeric_limits<float>::infinity()) {
        return {SizingMode::Grow, 0.0f, min, max};
    }
    static Sizing fixed(Source<float> v) { return {SizingMode::Fixed, std::move(v)}; }
    static Sizing percent(float p) { return {SizingMode::Percent, p}; }
};

enum class Direction {
    TopToBottom,
    LeftToRight,
};

enum class AlignX { Left, Center, Right };
enum class AlignY { Top, Center, Bottom };

// Anchor points used by floating placement
enum class AttachPoint {
    LeftTop, LeftCenter, LeftBottom,
    CenterTop, CenterCenter, CenterBottom,
    RightTop, RightCenter, RightBottom,
};

enum class AttachTarget {
    Parent,
    Root,
    Element,
};

// Element layout and paint attributes
// Every field is optional so that hovered/clicked/right-clicked variants override any subset
struct StyleProps {
    std::optional<Sizing> width;
    std::optional<Sizing> height;
    std::optional<Direction> direction;

    std::optional<float> padding_left;
    std::optional<float> padding_right;
    std::optional<float> padding_top;
    std::optional<float> padding_bottom;
    std::optional<float> child_gap;

    std::optional<AlignX> align_x;
    std::optional<AlignY> align_y;

    std::optional<float> radius_top_left;
    std::optional<float> radius_top_right;
    std::optional<float> radius_bottom_left;
    std::optional<float> radius_bottom_right;

    std::optional<Source<Color>> color;
    std::optional<Source<Color>> border_color;
    std::optional<float> border_left;
    std::optional<float> border_right;
    std::optional<float> border_top;
    std::optional<float> border_bottom;
    std::optional<float> border_between_children;

    std::optional<bool> floating;
    std::optional<Source<float>> offset_x;
    std::optional<Source<float>> offset_y;
    std::optional<AttachPoint> attach_parent;
    std::optional<AttachPoint> attach_element;
    std::optional<AttachTarget> attach_to;
    std::optional<std::string> attach_id;
    std::optional<int> z_index;
    std::optional<bool> capture_pointer;
    // Grows the placed floating box on both sides without moving its children
    std::optional<float> floating_expand_width;
    std::optional<float> floating_expand_height;

    std::optional<bool> scroll_x;
    std::optional<bool> scroll_y;

    std::optional<Source<std::string>> image;

    bool operator==(const StyleProps&) const = default;

    // Replace every field that `other` sets
    void overlay(const StyleProps& other);
};

// Base style plus interaction variants and event names
struct StyleSpec {
    StyleProps base;
    std::optional<StyleProps> hovered;
    std::optional<StyleProps> clicked;
    std::optional<StyleProps> right_clicked;
    std::optional<Source<std::string>> hover_event;
    std::optional<Source<std::string>> click_event;
    std::optional<Source<std::string>> right_click_event;

    bool operator==(const StyleSpec&) const = default;
};

enum class TextAlign { Left, Center, Right };

struct TextStyleSpec {
    uint16_t font_id = 0;
    std::optional<float> font_size;     // engine default when unset
    std::optional<float> line_height;   // derived from font size when unset
    Source<Color> color = Color::rgba(255, 255, 255);
    TextAlign align = TextAlign::Left;

    bool operator==(const TextStyleSpec&) const = default;
};

// Parse helpers shared by the compiler
std::optional<AttachPoint> parse_attach_point(const std::string& name);

} // namespace lattice
