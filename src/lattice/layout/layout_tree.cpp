#include "layout_tree.hpp"
#include <algorithm>
#include <sstream>

namespace lattice {

namespace {

struct DrawGroup {
    int z = 0;
    std::vector<int> nodes;
};

void collect(const std::vector<LayoutNode>& nodes, int i, size_t group, std::vector<DrawGroup>& groups) {
    if (nodes[i].floating) {
        groups.push_back({nodes[i].z_index, {}});
        group = groups.size() - 1;
    }
    groups[group].nodes.push_back(i);
    for (int c : nodes[i].children) {
        collect(nodes, c, group, groups);
    }
}

} // namespace

LayoutTree::LayoutTree(std::vector<LayoutNode> nodes, Size viewport, std::string page)
    : _nodes(std::move(nodes)), _viewport(viewport), _page(std::move(page)) {
    _index();
}

void LayoutTree::_index() {
    for (int i = 0; i < static_cast<int>(_nodes.size()); ++i) {
        if (_nodes[i].parent < 0) {
            _roots.push_back(i);
        }
        _by_id.emplace(_nodes[i].id, i);
    }

    std::vector<DrawGroup> groups(1);
    for (int r : _roots) {
        collect(_nodes, r, 0, groups);
    }
    std::stable_sort(groups.begin() + 1, groups.end(),
                     [](const DrawGroup& a, const DrawGroup& b) { return a.z < b.z; });

    for (const auto& g : groups) {
        _draw_order.insert(_draw_order.end(), g.nodes.begin(), g.nodes.end());
    }
}

const LayoutNode* LayoutTree::find(const std::string& id) const {
    auto it = _by_id.find(id);
    return it == _by_id.end() ? nullptr : &_nodes[it->second];
}

const LayoutNode* LayoutTree::hit_test(Vec2 point) const {
    // Last drawn wins; within one draw group a child is drawn after its ancestors
    for (auto it = _draw_order.rbegin(); it != _draw_order.rend(); ++it) {
        const auto& n = _nodes[*it];
        if (n.kind != NodeKind::Element || !n.capture_pointer) {
            continue;
        }
        if (!n.rect.contains(point)) {
            continue;
        }
        if (n.clip && !n.clip->contains(point)) {
            continue;
        }
        return &n;
    }
    return nullptr;
}

std::vector<RenderCommand> LayoutTree::render_commands() const {
    std::vector<RenderCommand> out;

    for (int i : _draw_order) {
        const auto& n = _nodes[i];

        auto command = [&](RenderCommandType type, const Rect& rect) -> RenderCommand& {
            RenderCommand& c = out.emplace_back();
            c.type = type;
            c.id = n.id;
            c.rect = rect;
            c.clip = n.clip;
            return c;
        };

        if (n.kind == NodeKind::Text) {
            if (!n.text.empty()) {
                auto& c = command(RenderCommandType::Text, n.rect);
                c.text = n.text;
                c.text_style = n.text_style;
                c.color = n.text_style.color;
            }
            continue;
        }

        if (!n.paint.color.transparent()) {
            auto& c = command(RenderCommandType::Rectangle, n.rect);
            c.color = n.paint.color;
            c.radius = n.paint.radius;
        }
        if (!n.paint.image.empty()) {
            auto& c = command(RenderCommandType::Image, n.rect);
            c.image = n.paint.image;
            c.radius = n.paint.radius;
        }
        if (n.paint.border.any() && !n.paint.border_color.transparent()) {
            auto& c = command(RenderCommandType::Border, n.rect);
            c.color = n.paint.border_color;
            c.border = n.paint.border;
            c.radius = n.paint.radius;

            // Separators centred in the gap between consecutive flow children
            float w = n.paint.border.between_children;
            if (w > 0.0f) {
                const LayoutNode* prev = nullptr;
                for (int ci : n.children) {
                    const auto& child = _nodes[ci];
                    if (child.floating) continue;
                    if (prev) {
                        Rect line;
                        if (n.direction == Direction::TopToBottom) {
                            float mid = (prev->rect.bottom() + child.rect.y) / 2.0f;
                            line = {n.rect.x, mid - w / 2.0f, n.rect.width, w};
                        } else {
                            float mid = (prev->rect.right() + child.rect.x) / 2.0f;
                            line = {mid - w / 2.0f, n.rect.y, w, n.rect.height};
                        }
                        auto& sep = command(RenderCommandType::Rectangle, line);
                        sep.color = n.paint.border_color;
                    }
                    prev = &child;
                }
            }
        }
    }
    return out;
}

std::string LayoutTree::to_string() const {
    std::ostringstream oss;
    for (const auto& n : _nodes) {
        oss << std::string(static_cast<size_t>(n.depth) * 2, ' ')
            << (n.kind == NodeKind::Text ? "text " : "element ") << n.id
            << " {" << n.rect.x << ", " << n.rect.y << ", " << n.rect.width << ", " << n.rect.height << "}";
        if (n.kind == NodeKind::Text) {
            oss << " \"" << n.text << "\"";
        }
        if (n.floating) {
            oss << " floating z=" << n.z_index;
        }
        if (n.click_event) {
            oss << " click=" << *n.click_event;
        }
        if (n.right_click_event) {
            oss << " right-click=" << *n.right_click_event;
        }
        if (n.hover_event) {
            oss << " hover=" << *n.hover_event;
        }
        oss << "\n";
    }
    return oss.str();
}

} // namespace lattice
