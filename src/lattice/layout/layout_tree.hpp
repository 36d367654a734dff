#pragma once

#include "geometry.hpp"
#include "text_measure.hpp"
#include "../markup/style.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lattice {

enum class NodeKind {
    Element,
    Text,
};

struct CornerRadius {
    float top_left = 0.0f;
    float top_right = 0.0f;
    float bottom_left = 0.0f;
    float bottom_right = 0.0f;

    bool operator==(const CornerRadius&) const = default;
};

struct BorderWidth {
    float left = 0.0f;
    float right = 0.0f;
    float top = 0.0f;
    float bottom = 0.0f;
    float between_children = 0.0f;

    bool operator==(const BorderWidth&) const = default;

    bool any() const { return left > 0 || right > 0 || top > 0 || bottom > 0 || between_children > 0; }
};

// Paint attributes after interaction overrides and bindings
struct Paint {
    Color color;
    Color border_color;
    BorderWidth border;
    CornerRadius radius;
    std::string image;

    bool operator==(const Paint&) const = default;
};

struct LayoutNode {
    NodeKind kind = NodeKind::Element;
    std::string id;
    Rect rect;
    Paint paint;
    Direction direction = Direction::TopToBottom;

    // Text nodes only
    std::string text;
    TextStyle text_style;

    std::optional<Rect> clip;       // set below scroll containers
    bool floating = false;
    int z_index = 0;
    bool capture_pointer = true;
    bool scroll_x = false;
    bool scroll_y = false;

    std::optional<std::string> click_event;
    std::optional<std::string> right_click_event;
    std::optional<std::string> hover_event;

    int depth = 0;
    int parent = -1;
    std::vector<int> children;
};

enum class RenderCommandType {
    Rectangle,
    Border,
    Text,
    Image,
};

struct RenderCommand {
    RenderCommandType type = RenderCommandType::Rectangle;
    std::string id;
    Rect rect;
    std::optional<Rect> clip;
    Color color;
    CornerRadius radius;
    BorderWidth border;
    std::string text;
    TextStyle text_style;
    std::string image;
};

// Solved geometry for one frame. Nodes are stored in pre-order; indices refer into nodes().
class LayoutTree {
public:
    LayoutTree() = default;
    LayoutTree(std::vector<LayoutNode> nodes, Size viewport, std::string page);

    const std::vector<LayoutNode>& nodes() const { return _nodes; }
    size_t size() const { return _nodes.size(); }
    bool empty() const { return _nodes.empty(); }

    const Size& viewport() const { return _viewport; }
    const std::string& page() const { return _page; }

    // Node indices without a parent
    const std::vector<int>& roots() const { return _roots; }

    // Flow nodes in pre-order, then floating subtrees by z-index (declaration order on ties)
    const std::vector<int>& draw_order() const { return _draw_order; }

    const LayoutNode* find(const std::string& id) const;

    // Topmost element containing the point; text nodes and pass-through floats are skipped
    const LayoutNode* hit_test(Vec2 point) const;

    std::vector<RenderCommand> render_commands() const;

    // Indented dump, one node per line
    std::string to_string() const;

private:
    void _index();

    std::vector<LayoutNode> _nodes;
    std::vector<int> _roots;
    std::vector<int> _draw_order;
    std::map<std::string, int> _by_id;
    Size _viewport;
    std::string _page;
};

} // namespace lattice
