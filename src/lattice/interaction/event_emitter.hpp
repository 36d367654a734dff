#pragma once

#include "interaction_state.hpp"
#include "../event_sink.hpp"
#include "../layout/layout_tree.hpp"

namespace lattice {

// Turns interaction transitions into named events for the host sink
// Click events fire on pressed, right-click events on right_pressed, hover events on hover_entered
// At most one event per element per frame, in that order of precedence
class EventEmitter {
public:
    // Number of events delivered; the first sink failure stops emission and is returned chained
    static Result<size_t> emit(const LayoutTree& layout, const InteractionDelta& delta, EventSink& sink);
};

} // namespace lattice
