#include "interaction_state.hpp"
#include <ytrace/ytrace.hpp>

namespace lattice {

namespace {

bool under_pointer(const LayoutNode& node, Vec2 p) {
    return node.rect.contains(p) && (!node.clip || node.clip->contains(p));
}

// Press starts on the hovered node at the button edge and holds while the button stays down over it
bool next_pressed(bool previous, bool hovered, bool down, bool edge, const LayoutNode& node, Vec2 p) {
    if (previous) {
        return down && under_pointer(node, p);
    }
    return edge && hovered;
}

} // namespace

InteractionDelta InteractionState::update(const LayoutTree& layout, const PointerState& pointer) {
    InteractionDelta delta;

    const LayoutNode* target = layout.hit_test(pointer.position);
    std::string hovered = target ? target->id : std::string();

    bool down = pointer.left_down();
    bool press_edge = down && !_was_down;
    bool right_down = pointer.right_down();
    bool right_edge = right_down && !_was_right_down;

    std::map<std::string, ElementState> next;
    for (const auto& node : layout.nodes()) {
        if (node.kind != NodeKind::Element) {
            continue;
        }
        ElementState previous = state(node.id);
        ElementState current;

        current.hovered = !hovered.empty() && node.id == hovered;

        current.clicked = next_pressed(previous.clicked, current.hovered, down, press_edge,
                                       node, pointer.position);
        current.right_clicked = next_pressed(previous.right_clicked, current.hovered, right_down, right_edge,
                                             node, pointer.position);

        if (current.hovered && !previous.hovered) delta.hover_entered.push_back(node.id);
        if (!current.hovered && previous.hovered) delta.hover_left.push_back(node.id);
        if (current.clicked && !previous.clicked) delta.pressed.push_back(node.id);
        if (!current.clicked && previous.clicked) delta.released.push_back(node.id);
        if (current.right_clicked && !previous.right_clicked) delta.right_pressed.push_back(node.id);
        if (!current.right_clicked && previous.right_clicked) delta.right_released.push_back(node.id);

        next[node.id] = current;
    }

    for (const auto& [id, st] : _entries) {
        if (!next.count(id)) {
            delta.pruned.push_back(id);
        }
    }
    if (!delta.pruned.empty()) {
        ydebug("InteractionState: pruned {} ids", delta.pruned.size());
    }

    _entries = std::move(next);
    _hovered = std::move(hovered);
    _was_down = down;
    _was_right_down = right_down;
    return delta;
}

ElementState InteractionState::state(const std::string& id) const {
    auto it = _entries.find(id);
    return it == _entries.end() ? ElementState{} : it->second;
}

void InteractionState::clear() {
    _entries.clear();
    _hovered.clear();
    _was_down = false;
    _was_right_down = false;
}

} // namespace lattice
