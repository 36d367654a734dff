#include "style.hpp"
#include <map>

namespace lattice {

namespace {

template<typename T>
void take(std::optional<T>& dst, const std::optional<T>& src) {
    if (src) dst = src;
}

} // namespace

void StyleProps::overlay(const StyleProps& o) {
    take(width, o.width);
    take(height, o.height);
    take(direction, o.direction);
    take(padding_left, o.padding_left);
    take(padding_right, o.padding_right);
    take(padding_top, o.padding_top);
    take(padding_bottom, o.padding_bottom);
    take(child_gap, o.child_gap);
    take(align_x, o.align_x);
    take(align_y, o.align_y);
    take(radius_top_left, o.radius_top_left);
    take(radius_top_right, o.radius_top_right);
    take(radius_bottom_left, o.radius_bottom_left);
    take(radius_bottom_right, o.radius_bottom_right);
    take(color, o.color);
    take(border_color, o.border_color);
    take(border_left, o.border_left);
    take(border_right, o.border_right);
    take(border_top, o.border_top);
    take(border_bottom, o.border_bottom);
    take(border_between_children, o.border_between_children);
    take(floating, o.floating);
    take(offset_x, o.offset_x);
    take(offset_y, o.offset_y);
    take(attach_parent, o.attach_parent);
    take(attach_element, o.attach_element);
    take(attach_to, o.attach_to);
    take(attach_id, o.attach_id);
    take(z_index, o.z_index);
    take(capture_pointer, o.capture_pointer);
    take(floating_expand_width, o.floating_expand_width);
    take(floating_expand_height, o.floating_expand_height);
    take(scroll_x, o.scroll_x);
    take(scroll_y, o.scroll_y);
    take(image, o.image);
}

std::optional<AttachPoint> parse_attach_point(const std::string& name) {
    static const std::map<std::string, AttachPoint> points = {
        {"top-left", AttachPoint::LeftTop},
        {"center-left", AttachPoint::LeftCenter},
        {"bottom-left", AttachPoint::LeftBottom},
        {"top-center", AttachPoint::CenterTop},
        {"center", AttachPoint::CenterCenter},
        {"bottom-center", AttachPoint::CenterBottom},
        {"top-right", AttachPoint::RightTop},
        {"center-right", AttachPoint::RightCenter},
        {"bottom-right", AttachPoint::RightBottom},
    };
    auto it = points.find(name);
    if (it == points.end()) return std::nullopt;
    return it->second;
}

} // namespace lattice
