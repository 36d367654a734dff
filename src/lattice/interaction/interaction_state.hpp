#pragma once

#include "interaction_view.hpp"
#include "../layout/layout_tree.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace lattice {

struct PointerState {
    static constexpr uint32_t LeftButton = 1;
    static constexpr uint32_t RightButton = 2;

    Vec2 position;
    uint32_t buttons = 0;

    bool left_down() const { return (buttons & LeftButton) != 0; }
    bool right_down() const { return (buttons & RightButton) != 0; }
};

// Transitions produced by one update, per element id
struct InteractionDelta {
    std::vector<std::string> hover_entered;
    std::vector<std::string> hover_left;
    std::vector<std::string> pressed;       // clicked false -> true
    std::vector<std::string> released;      // clicked true -> false
    std::vector<std::string> right_pressed;
    std::vector<std::string> right_released;
    std::vector<std::string> pruned;

    bool empty() const {
        return hover_entered.empty() && hover_left.empty() && pressed.empty()
            && released.empty() && right_pressed.empty() && right_released.empty() && pruned.empty();
    }
};

// Per-id hovered / clicked flags persisted across frames
// Only update() mutates the map; the solver reads it through view()
class InteractionState : public InteractionView {
public:
    InteractionState() = default;

    InteractionDelta update(const LayoutTree& layout, const PointerState& pointer);

    ElementState state(const std::string& id) const override;
    const InteractionView& view() const { return *this; }

    const std::map<std::string, ElementState>& entries() const { return _entries; }
    size_t size() const { return _entries.size(); }

    // Id under the pointer after the last update, empty when none
    const std::string& hovered_id() const { return _hovered; }

    void clear();

private:
    std::map<std::string, ElementState> _entries;
    std::string _hovered;
    bool _was_down = false;
    bool _was_right_down = false;
};

} // namespace lattice
