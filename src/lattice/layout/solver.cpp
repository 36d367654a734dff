#include "solver.hpp"
#include <spdlog/spdlog.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cmath>
#include <deque>
#include <limits>
#include <set>

namespace lattice {

namespace {

constexpr float kEpsilon = 0.01f;

enum class Axis { X, Y };

struct AxisSize {
    SizingMode mode = SizingMode::Fit;
    float value = 0.0f;
    float min = 0.0f;
    float max = std::numeric_limits<float>::infinity();
};

// Working node of one solve; flattened into LayoutNode at the end
struct Box {
    NodeKind kind = NodeKind::Element;
    std::string id;
    std::string name;               // declared id, target of floating-attach-to-element
    std::string path;
    int parent = -1;
    std::vector<int> children;
    int depth = 0;

    AxisSize width;
    AxisSize height;
    Direction direction = Direction::TopToBottom;
    float pad_left = 0.0f;
    float pad_right = 0.0f;
    float pad_top = 0.0f;
    float pad_bottom = 0.0f;
    float gap = 0.0f;
    AlignX align_x = AlignX::Left;
    AlignY align_y = AlignY::Top;
    Paint paint;

    bool floating = false;
    Vec2 offset;
    AttachPoint attach_parent = AttachPoint::LeftTop;
    AttachPoint attach_element = AttachPoint::LeftTop;
    AttachTarget attach_to = AttachTarget::Parent;
    std::string attach_id;
    int z_index = 0;
    bool capture_pointer = true;
    float expand_width = 0.0f;
    float expand_height = 0.0f;
    bool scroll_x = false;
    bool scroll_y = false;

    std::optional<std::string> click_event;
    std::optional<std::string> right_click_event;
    std::optional<std::string> hover_event;

    std::string text;
    TextStyle text_style;
    Size measured;

    Size intrinsic;
    Rect rect;
    std::optional<Rect> clip;
};

float& extent(Rect& r, Axis a) { return a == Axis::X ? r.width : r.height; }
float& position(Rect& r, Axis a) { return a == Axis::X ? r.x : r.y; }
float& extent(Size& s, Axis a) { return a == Axis::X ? s.width : s.height; }

const AxisSize& sizing(const Box& b, Axis a) { return a == Axis::X ? b.width : b.height; }
float pad_start(const Box& b, Axis a) { return a == Axis::X ? b.pad_left : b.pad_top; }
float pad_end(const Box& b, Axis a) { return a == Axis::X ? b.pad_right : b.pad_bottom; }
bool is_main(const Box& b, Axis a) { return (b.direction == Direction::LeftToRight) == (a == Axis::X); }
bool scrolls(const Box& b, Axis a) { return a == Axis::X ? b.scroll_x : b.scroll_y; }

// Fraction of leftover space placed before the content
float align_factor(const Box& b, Axis a) {
    if (a == Axis::X) {
        return b.align_x == AlignX::Left ? 0.0f : (b.align_x == AlignX::Center ? 0.5f : 1.0f);
    }
    return b.align_y == AlignY::Top ? 0.0f : (b.align_y == AlignY::Center ? 0.5f : 1.0f);
}

Vec2 anchor(const Rect& r, AttachPoint p) {
    float fx = 0.0f;
    float fy = 0.0f;
    switch (p) {
        case AttachPoint::LeftTop:      fx = 0.0f; fy = 0.0f; break;
        case AttachPoint::LeftCenter:   fx = 0.0f; fy = 0.5f; break;
        case AttachPoint::LeftBottom:   fx = 0.0f; fy = 1.0f; break;
        case AttachPoint::CenterTop:    fx = 0.5f; fy = 0.0f; break;
        case AttachPoint::CenterCenter: fx = 0.5f; fy = 0.5f; break;
        case AttachPoint::CenterBottom: fx = 0.5f; fy = 1.0f; break;
        case AttachPoint::RightTop:     fx = 1.0f; fy = 0.0f; break;
        case AttachPoint::RightCenter:  fx = 1.0f; fy = 0.5f; break;
        case AttachPoint::RightBottom:  fx = 1.0f; fy = 1.0f; break;
    }
    return {r.x + r.width * fx, r.y + r.height * fy};
}

float clamp_to(float v, const AxisSize& s) {
    return std::clamp(v, s.min, s.max);
}

// Records a recovered error once per distinct message; repeats in later frames go to debug
void report(Diagnostics* diagnostics, std::set<std::string>& reported, Error error) {
    if (!diagnostics) {
        return;
    }
    if (!reported.insert(error.message()).second) {
        spdlog::debug("{}", error.message());
        return;
    }
    diagnostics->add(std::move(error));
}

// State of a single solve call
class SolveRun {
public:
    SolveRun(const TextMeasurer& measurer, const TextConfig& text, Diagnostics* diagnostics,
             std::set<std::string>& reported, const InteractionView* interaction,
             const ScrollOffsets& scroll, Size viewport)
        : _measurer(measurer), _text(text), _diagnostics(diagnostics), _reported(reported),
          _interaction(interaction), _scroll(scroll),
          _viewport{sanitize(viewport.width), sanitize(viewport.height)} {}

    LayoutTree run(const Page& page, BindingContext& bindings) {
        // Implicit root: the viewport, top to bottom, never emitted
        Box root;
        root.depth = -1;
        root.width = {SizingMode::Fixed, _viewport.width};
        root.height = {SizingMode::Fixed, _viewport.height};
        root.rect = {0.0f, 0.0f, _viewport.width, _viewport.height};
        _boxes.push_back(root);

        BindingScope scope(bindings);
        _build(page.roots, scope, 0, "", "");
        _inherit_capture();

        for (Axis a : {Axis::X, Axis::Y}) {
            _intrinsic(a);
            _distribute(a);
        }

        std::deque<int> floats;
        _place_subtree(0, floats);
        while (!floats.empty()) {
            int f = floats.front();
            floats.pop_front();
            _place_floating(f);
            _place_subtree(f, floats);
            _expand_floating(f);
        }

        ydebug("Solver: page '{}' produced {} boxes", page.name, _boxes.size() - 1);
        return LayoutTree(_flatten(), _viewport, page.name);
    }

private:
    // ------------------------------------------------------------------------
    // Binding resolution with fallbacks
    // ------------------------------------------------------------------------

    void _report(Error error) {
        report(_diagnostics, _reported, std::move(error));
    }

    template<typename T>
    T _recover(Result<T> res, T fallback, const std::string& what) {
        if (res) {
            return std::move(*res);
        }
        _report(Error("solver: " + what + " fell back to default", res.error()));
        return fallback;
    }

    float _number(const Source<float>& src, BindingContext& scope, const std::string& owner) {
        if (auto v = std::get_if<float>(&src)) return *v;
        const auto& key = std::get<KeyRef>(src).key;
        return static_cast<float>(_recover(scope.get_number(key), 0.0, owner + " number '" + key + "'"));
    }

    Color _color(const Source<Color>& src, BindingContext& scope, const std::string& owner) {
        if (auto v = std::get_if<Color>(&src)) return *v;
        const auto& key = std::get<KeyRef>(src).key;
        return _recover(scope.get_color(key), Color{}, owner + " color '" + key + "'");
    }

    std::string _string(const Source<std::string>& src, BindingContext& scope, const std::string& owner) {
        if (auto v = std::get_if<std::string>(&src)) return *v;
        const auto& key = std::get<KeyRef>(src).key;
        return _recover(scope.get_text(key), std::string(), owner + " text '" + key + "'");
    }

    bool _flag(const Source<bool>& src, BindingContext& scope, const std::string& owner) {
        if (auto v = std::get_if<bool>(&src)) return *v;
        const auto& key = std::get<KeyRef>(src).key;
        return _recover(scope.get_bool(key), false, owner + " predicate '" + key + "'");
    }

    std::optional<std::string> _event(const std::optional<Source<std::string>>& src, BindingContext& scope,
                                      const std::string& owner) {
        if (!src) return std::nullopt;
        if (auto v = std::get_if<std::string>(&*src)) return *v;
        const auto& key = std::get<KeyRef>(*src).key;
        auto res = scope.get_event_name(key);
        if (!res) {
            _report(Error("solver: " + owner + " event '" + key + "' dropped", res.error()));
            return std::nullopt;
        }
        return *res;
    }

    // ------------------------------------------------------------------------
    // Build
    // ------------------------------------------------------------------------

    int _add_box(NodeKind kind, int parent, const std::string& path) {
        Box b;
        b.kind = kind;
        b.parent = parent;
        b.path = path;
        b.depth = _boxes[parent].depth + 1;
        _boxes.push_back(std::move(b));
        int idx = static_cast<int>(_boxes.size()) - 1;
        _boxes[parent].children.push_back(idx);
        return idx;
    }

    std::string _unique(const std::string& id, const std::string& path) {
        if (_ids.insert(id).second) {
            return id;
        }
        std::string alt = id + "@" + path;
        _report(Error("solver: duplicate element id '" + id + "', using '" + alt + "'"));
        _ids.insert(alt);
        return alt;
    }

    void _build(const NodeList& nodes, BindingContext& scope, int parent,
                const std::string& prefix, const std::string& list_suffix) {
        for (size_t i = 0; i < nodes.size(); ++i) {
            std::string path = prefix.empty() ? std::to_string(i) : prefix + "." + std::to_string(i);
            std::visit([&](const auto& node) { _build_node(node, scope, parent, path, list_suffix); }, nodes[i].node);
        }
    }

    void _build_node(const ElementNode& node, BindingContext& scope, int parent,
                     const std::string& path, const std::string& list_suffix) {
        int idx = _add_box(NodeKind::Element, parent, path);

        std::string id = path;
        std::string name;
        if (node.id) {
            name = _string(*node.id, scope, "element " + path + " id");
            if (!name.empty()) {
                id = "#" + name + list_suffix;
            }
        }
        id = _unique(id, path);
        _boxes[idx].id = id;
        _boxes[idx].name = name;

        // Active variant: hovered, then clicked, then right-clicked on top
        ElementState state = _interaction ? _interaction->state(id) : ElementState{};
        StyleProps props = node.style.base;
        if (state.hovered && node.style.hovered) {
            props.overlay(*node.style.hovered);
        }
        if (state.clicked && node.style.clicked) {
            props.overlay(*node.style.clicked);
        }
        if (state.right_clicked && node.style.right_clicked) {
            props.overlay(*node.style.right_clicked);
        }
        _apply_style(idx, props, scope);

        _boxes[idx].click_event = _event(node.style.click_event, scope, id);
        _boxes[idx].right_click_event = _event(node.style.right_click_event, scope, id);
        _boxes[idx].hover_event = _event(node.style.hover_event, scope, id);

        _build(node.children, scope, idx, path, list_suffix);
    }

    void _build_node(const TextNode& node, BindingContext& scope, int parent,
                     const std::string& path, const std::string&) {
        int idx = _add_box(NodeKind::Text, parent, path);
        Box& b = _boxes[idx];
        b.id = _unique(path, path);
        b.text = _string(node.content, scope, "text " + path);

        TextStyle style;
        style.font_id = node.style.font_id;
        style.font_size = sanitize(node.style.font_size.value_or(_text.default_font_size));
        style.line_height = node.style.line_height ? sanitize(*node.style.line_height)
                                                   : style.font_size * _text.line_height;
        style.color = _color(node.style.color, scope, "text " + path);
        style.align = node.style.align;
        b.text_style = style;

        Size m = _measurer.measure(b.text, style);
        b.measured = {sanitize(m.width), sanitize(m.height)};
    }

    void _build_node(const ListNode& node, BindingContext& scope, int parent,
                     const std::string& path, const std::string& list_suffix) {
        auto items = _recover(scope.get_list(node.source_key), std::vector<BindingContextPtr>{},
                              "list " + path + " source '" + node.source_key + "'");
        for (size_t k = 0; k < items.size(); ++k) {
            std::string index = "[" + std::to_string(k) + "]";
            BindingScope item_scope(scope, items[k], node.item_bindings);
            _build(node.body, item_scope, parent, path + index, list_suffix + index);
        }
    }

    void _build_node(const ConditionalNode& node, BindingContext& scope, int parent,
                     const std::string& path, const std::string& list_suffix) {
        bool value = _flag(node.predicate, scope, "conditional " + path);
        if (node.negate) {
            value = !value;
        }
        if (!value) {
            return;
        }
        // A single wrapped node keeps the position of the conditional
        if (node.body.size() == 1) {
            std::visit([&](const auto& n) { _build_node(n, scope, parent, path, list_suffix); }, node.body.front().node);
            return;
        }
        _build(node.body, scope, parent, path, list_suffix);
    }

    void _build_node(const ComponentUseNode& node, BindingContext&, int,
                     const std::string& path, const std::string&) {
        _report(Error(ErrorCode::UnknownReusable,
            "solver: unexpanded use of '" + node.reusable_name + "' at " + path + " skipped"));
    }

    AxisSize _axis(const Sizing& s, BindingContext& scope, const std::string& owner) {
        AxisSize a;
        a.mode = s.mode;
        a.min = sanitize(s.min);
        a.max = std::isnan(s.max) ? std::numeric_limits<float>::infinity() : std::max(s.max, a.min);
        if (s.mode == SizingMode::Fixed) {
            a.value = sanitize(_number(s.value, scope, owner));
        } else if (s.mode == SizingMode::Percent) {
            float p = sanitize(_number(s.value, scope, owner));
            // Values above 1 are read as percentages
            a.value = std::min(p > 1.0f ? p / 100.0f : p, 1.0f);
        }
        return a;
    }

    void _apply_style(int idx, const StyleProps& p, BindingContext& scope) {
        Box& b = _boxes[idx];
        const std::string& owner = b.id;

        if (p.width) b.width = _axis(*p.width, scope, owner + " width");
        if (p.height) b.height = _axis(*p.height, scope, owner + " height");
        b.direction = p.direction.value_or(Direction::TopToBottom);

        b.pad_left = sanitize(p.padding_left.value_or(0.0f));
        b.pad_right = sanitize(p.padding_right.value_or(0.0f));
        b.pad_top = sanitize(p.padding_top.value_or(0.0f));
        b.pad_bottom = sanitize(p.padding_bottom.value_or(0.0f));
        b.gap = sanitize(p.child_gap.value_or(0.0f));
        b.align_x = p.align_x.value_or(AlignX::Left);
        b.align_y = p.align_y.value_or(AlignY::Top);

        if (p.color) b.paint.color = _color(*p.color, scope, owner);
        if (p.border_color) b.paint.border_color = _color(*p.border_color, scope, owner + " border");
        b.paint.border.left = sanitize(p.border_left.value_or(0.0f));
        b.paint.border.right = sanitize(p.border_right.value_or(0.0f));
        b.paint.border.top = sanitize(p.border_top.value_or(0.0f));
        b.paint.border.bottom = sanitize(p.border_bottom.value_or(0.0f));
        b.paint.border.between_children = sanitize(p.border_between_children.value_or(0.0f));
        b.paint.radius.top_left = sanitize(p.radius_top_left.value_or(0.0f));
        b.paint.radius.top_right = sanitize(p.radius_top_right.value_or(0.0f));
        b.paint.radius.bottom_left = sanitize(p.radius_bottom_left.value_or(0.0f));
        b.paint.radius.bottom_right = sanitize(p.radius_bottom_right.value_or(0.0f));
        if (p.image) b.paint.image = _string(*p.image, scope, owner + " image");

        b.floating = p.floating.value_or(false);
        if (p.offset_x) b.offset.x = _number(*p.offset_x, scope, owner + " offset");
        if (p.offset_y) b.offset.y = _number(*p.offset_y, scope, owner + " offset");
        if (std::isnan(b.offset.x)) b.offset.x = 0.0f;
        if (std::isnan(b.offset.y)) b.offset.y = 0.0f;
        b.attach_parent = p.attach_parent.value_or(AttachPoint::LeftTop);
        b.attach_element = p.attach_element.value_or(AttachPoint::LeftTop);
        b.attach_to = p.attach_to.value_or(AttachTarget::Parent);
        b.attach_id = p.attach_id.value_or("");
        b.z_index = p.z_index.value_or(0);
        b.capture_pointer = p.capture_pointer.value_or(true);
        b.expand_width = sanitize(p.floating_expand_width.value_or(0.0f));
        b.expand_height = sanitize(p.floating_expand_height.value_or(0.0f));

        b.scroll_x = p.scroll_x.value_or(false);
        b.scroll_y = p.scroll_y.value_or(false);
    }

    // Pointer pass-through of a floating node covers its whole subtree
    void _inherit_capture() {
        for (size_t i = 1; i < _boxes.size(); ++i) {
            Box& b = _boxes[i];
            if (!b.floating && !_boxes[b.parent].capture_pointer) {
                b.capture_pointer = false;
            }
        }
    }

    // ------------------------------------------------------------------------
    // Sizing
    // ------------------------------------------------------------------------

    // Post-order: boxes are stored in pre-order, so walk backwards
    void _intrinsic(Axis a) {
        for (int i = static_cast<int>(_boxes.size()) - 1; i >= 0; --i) {
            Box& b = _boxes[i];
            const AxisSize& s = sizing(b, a);

            float content = 0.0f;
            if (b.kind == NodeKind::Text) {
                content = extent(b.measured, a);
            } else {
                bool along = is_main(b, a);
                size_t n = 0;
                for (int c : b.children) {
                    const Box& cb = _boxes[c];
                    if (cb.floating) continue;
                    float ci = a == Axis::X ? cb.intrinsic.width : cb.intrinsic.height;
                    content = along ? content + ci : std::max(content, ci);
                    ++n;
                }
                if (along && n > 1) {
                    content += b.gap * static_cast<float>(n - 1);
                }
                content += pad_start(b, a) + pad_end(b, a);
            }

            float v = s.mode == SizingMode::Fixed ? s.value : clamp_to(content, s);
            extent(b.intrinsic, a) = sanitize(v);
        }
    }

    // Pre-order: a box's own extent is final before its children are sized
    void _distribute(Axis a) {
        extent(_boxes[0].rect, a) = a == Axis::X ? _viewport.width : _viewport.height;
        for (size_t i = 0; i < _boxes.size(); ++i) {
            _size_children(static_cast<int>(i), a);
        }
    }

    float _floating_extent(const Box& f, float parent_inner, Axis a) const {
        const AxisSize& s = sizing(f, a);
        switch (s.mode) {
            case SizingMode::Fixed: return s.value;
            case SizingMode::Percent: return s.value * parent_inner;
            case SizingMode::Grow: return clamp_to(parent_inner, s);
            case SizingMode::Fit: break;
        }
        return a == Axis::X ? f.intrinsic.width : f.intrinsic.height;
    }

    void _size_children(int i, Axis a) {
        Box& b = _boxes[i];
        float inner = sanitize(extent(b.rect, a) - pad_start(b, a) - pad_end(b, a));

        std::vector<int> flow;
        for (int c : b.children) {
            Box& cb = _boxes[c];
            if (cb.floating) {
                extent(cb.rect, a) = sanitize(_floating_extent(cb, inner, a));
            } else {
                flow.push_back(c);
            }
        }
        if (flow.empty()) {
            return;
        }

        if (!is_main(b, a)) {
            for (int c : flow) {
                Box& cb = _boxes[c];
                const AxisSize& s = sizing(cb, a);
                float v = extent(cb.intrinsic, a);
                switch (s.mode) {
                    case SizingMode::Grow:
                        v = clamp_to(inner, s);
                        break;
                    case SizingMode::Percent:
                        v = s.value * inner;
                        break;
                    case SizingMode::Fixed:
                        v = s.value;
                        break;
                    case SizingMode::Fit:
                        if (!scrolls(b, a)) {
                            v = std::max(std::min(v, inner), s.min);
                        }
                        break;
                }
                extent(cb.rect, a) = sanitize(v);
            }
            return;
        }

        float gaps = b.gap * static_cast<float>(flow.size() - 1);
        float available = sanitize(inner - gaps);
        float used = 0.0f;
        for (int c : flow) {
            Box& cb = _boxes[c];
            const AxisSize& s = sizing(cb, a);
            float v = s.mode == SizingMode::Percent ? s.value * available : extent(cb.intrinsic, a);
            extent(cb.rect, a) = sanitize(v);
            used += extent(cb.rect, a);
        }

        float remaining = available - used;
        if (remaining > kEpsilon) {
            _grow(flow, a, remaining);
        } else if (remaining < -kEpsilon && !scrolls(b, a)) {
            _shrink(flow, a, -remaining);
        }
    }

    // Equal shares to grow children until the space is used or every grower hits its max
    void _grow(const std::vector<int>& flow, Axis a, float remaining) {
        std::vector<int> growers;
        for (int c : flow) {
            Box& cb = _boxes[c];
            const AxisSize& s = sizing(cb, a);
            if (s.mode == SizingMode::Grow && extent(cb.rect, a) < s.max) {
                growers.push_back(c);
            }
        }

        while (remaining > kEpsilon && !growers.empty()) {
            float share = remaining / static_cast<float>(growers.size());
            std::vector<int> next;
            for (int c : growers) {
                Box& cb = _boxes[c];
                float& e = extent(cb.rect, a);
                float add = std::min(share, sizing(cb, a).max - e);
                e += add;
                remaining -= add;
                if (e < sizing(cb, a).max) {
                    next.push_back(c);
                }
            }
            if (next.size() == growers.size()) {
                break;
            }
            growers.swap(next);
        }
    }

    // Equal cuts from grow and fit children, never below their minimum
    void _shrink(const std::vector<int>& flow, Axis a, float excess) {
        std::vector<int> shrinkable;
        for (int c : flow) {
            Box& cb = _boxes[c];
            const AxisSize& s = sizing(cb, a);
            if ((s.mode == SizingMode::Grow || s.mode == SizingMode::Fit) && extent(cb.rect, a) > s.min) {
                shrinkable.push_back(c);
            }
        }

        while (excess > kEpsilon && !shrinkable.empty()) {
            float share = excess / static_cast<float>(shrinkable.size());
            std::vector<int> next;
            for (int c : shrinkable) {
                Box& cb = _boxes[c];
                float& e = extent(cb.rect, a);
                float floor = sizing(cb, a).min;
                float cut = std::min(share, e - floor);
                e -= cut;
                excess -= cut;
                if (e > floor) {
                    next.push_back(c);
                }
            }
            if (next.size() == shrinkable.size()) {
                break;
            }
            shrinkable.swap(next);
        }
    }

    // ------------------------------------------------------------------------
    // Positioning
    // ------------------------------------------------------------------------

    Vec2 _scroll_offset(const Box& b) const {
        if (!b.scroll_x && !b.scroll_y) return {};
        auto it = _scroll.find(b.id);
        if (it == _scroll.end()) return {};
        return {b.scroll_x ? it->second.x : 0.0f, b.scroll_y ? it->second.y : 0.0f};
    }

    void _position_children(int i, std::deque<int>& floats) {
        Box& b = _boxes[i];

        std::vector<int> flow;
        for (int c : b.children) {
            if (_boxes[c].floating) {
                floats.push_back(c);
            } else {
                flow.push_back(c);
            }
        }
        if (flow.empty()) {
            return;
        }

        std::optional<Rect> child_clip = b.clip;
        if (b.scroll_x || b.scroll_y) {
            child_clip = b.clip ? b.clip->intersect(b.rect) : b.rect;
        }
        Vec2 scroll = _scroll_offset(b);

        Axis main = b.direction == Direction::LeftToRight ? Axis::X : Axis::Y;
        Axis cross = main == Axis::X ? Axis::Y : Axis::X;

        float inner_main = sanitize(extent(b.rect, main) - pad_start(b, main) - pad_end(b, main));
        float inner_cross = sanitize(extent(b.rect, cross) - pad_start(b, cross) - pad_end(b, cross));

        float content = b.gap * static_cast<float>(flow.size() - 1);
        for (int c : flow) {
            content += extent(_boxes[c].rect, main);
        }
        float leftover = std::max(0.0f, inner_main - content);
        float cursor = position(b.rect, main) + pad_start(b, main) + leftover * align_factor(b, main);
        float scroll_main = main == Axis::X ? scroll.x : scroll.y;
        float scroll_cross = main == Axis::X ? scroll.y : scroll.x;

        for (int c : flow) {
            Box& cb = _boxes[c];
            position(cb.rect, main) = cursor - scroll_main;
            cursor += extent(cb.rect, main) + b.gap;

            float slack = std::max(0.0f, inner_cross - extent(cb.rect, cross));
            position(cb.rect, cross) = position(b.rect, cross) + pad_start(b, cross)
                                       + slack * align_factor(b, cross) - scroll_cross;
            cb.clip = child_clip;
        }
    }

    void _place_subtree(int i, std::deque<int>& floats) {
        _position_children(i, floats);
        for (int c : _boxes[i].children) {
            if (!_boxes[c].floating) {
                _place_subtree(c, floats);
            }
        }
    }

    void _place_floating(int f) {
        Box& fb = _boxes[f];
        Rect target = _boxes[fb.parent].rect;

        if (fb.attach_to == AttachTarget::Root) {
            target = _boxes[0].rect;
        } else if (fb.attach_to == AttachTarget::Element) {
            int found = -1;
            for (size_t j = 1; j < _boxes.size(); ++j) {
                if (static_cast<int>(j) != f && _boxes[j].name == fb.attach_id) {
                    found = static_cast<int>(j);
                    break;
                }
            }
            if (found >= 0) {
                target = _boxes[found].rect;
            } else {
                _report(Error(ErrorCode::UnboundKey,
                    "solver: floating " + fb.id + " attaches to unknown element '" + fb.attach_id + "', using parent"));
            }
        }

        Vec2 at = anchor(target, fb.attach_parent);
        Vec2 own = anchor(Rect{0.0f, 0.0f, fb.rect.width, fb.rect.height}, fb.attach_element);
        fb.rect.x = at.x - own.x + fb.offset.x;
        fb.rect.y = at.y - own.y + fb.offset.y;
        fb.clip.reset();
    }

    // Children are already placed against the unexpanded box
    void _expand_floating(int f) {
        Box& fb = _boxes[f];
        fb.rect.x -= fb.expand_width;
        fb.rect.width += fb.expand_width * 2.0f;
        fb.rect.y -= fb.expand_height;
        fb.rect.height += fb.expand_height * 2.0f;
    }

    // ------------------------------------------------------------------------
    // Output
    // ------------------------------------------------------------------------

    std::vector<LayoutNode> _flatten() const {
        std::vector<LayoutNode> nodes;
        nodes.reserve(_boxes.size() - 1);
        for (size_t i = 1; i < _boxes.size(); ++i) {
            const Box& b = _boxes[i];
            LayoutNode n;
            n.kind = b.kind;
            n.id = b.id;
            n.rect = b.rect;
            n.paint = b.paint;
            n.direction = b.direction;
            n.text = b.text;
            n.text_style = b.text_style;
            n.clip = b.clip;
            n.floating = b.floating;
            n.z_index = b.z_index;
            n.capture_pointer = b.capture_pointer;
            n.scroll_x = b.scroll_x;
            n.scroll_y = b.scroll_y;
            n.click_event = b.click_event;
            n.right_click_event = b.right_click_event;
            n.hover_event = b.hover_event;
            n.depth = b.depth;
            n.parent = b.parent - 1;
            for (int c : b.children) {
                n.children.push_back(c - 1);
            }
            nodes.push_back(std::move(n));
        }
        return nodes;
    }

    const TextMeasurer& _measurer;
    const TextConfig& _text;
    Diagnostics* _diagnostics;
    std::set<std::string>& _reported;
    const InteractionView* _interaction;
    const ScrollOffsets& _scroll;
    Size _viewport;

    std::vector<Box> _boxes;
    std::set<std::string> _ids;
};

} // namespace

LayoutTree Solver::solve(const Template& tmpl, BindingContext& bindings, Size viewport,
                         const InteractionView* interaction, const std::string& page,
                         const ScrollOffsets& scroll) const {
    const Page* target = tmpl.find_page(page);
    if (!target) {
        report(_diagnostics, _reported, Error(ErrorCode::UnboundKey,
            "solver: unknown page '" + page + "', using the default page"));
        target = tmpl.find_page("");
    }
    if (!target) {
        spdlog::warn("Solver: template has no pages");
        return LayoutTree({}, viewport, page);
    }

    SolveRun run(_measurer, _text, _diagnostics, _reported, interaction, scroll, viewport);
    return run.run(*target, bindings);
}

} // namespace lattice
