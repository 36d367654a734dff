#pragma once

#include "result.hpp"
#include <string>

namespace lattice {

enum class EventKind {
    Click,
    RightClick,
    Hover,
};

[[nodiscard]] inline const char* to_string(EventKind kind) {
    switch (kind) {
        case EventKind::Click: return "click";
        case EventKind::RightClick: return "right-click";
        case EventKind::Hover: return "hover";
    }
    return "unknown";
}

// Named event fired back into the host
struct UiEvent {
    EventKind kind = EventKind::Click;
    std::string name;
    std::string element_id;

    bool operator==(const UiEvent&) const = default;
};

// Host-owned receiver of engine events
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual Result<void> on_event(const UiEvent& event) = 0;
};

} // namespace lattice
