#pragma once

#include <string>

namespace lattice {

struct ElementState {
    bool hovered = false;
    bool clicked = false;
    bool right_clicked = false;

    bool operator==(const ElementState&) const = default;
};

// Read-only view of interaction state consumed by the solver
class InteractionView {
public:
    virtual ~InteractionView() = default;
    virtual ElementState state(const std::string& id) const = 0;
};

} // namespace lattice
