#include "event_emitter.hpp"
#include <spdlog/spdlog.h>
#include <ytrace/ytrace.hpp>
#include <set>

namespace lattice {

namespace {

const std::optional<std::string>& event_name(const LayoutNode& node, EventKind kind) {
    switch (kind) {
        case EventKind::Click: return node.click_event;
        case EventKind::RightClick: return node.right_click_event;
        case EventKind::Hover: break;
    }
    return node.hover_event;
}

// `seen` is shared by every kind of one frame: the first event an element fires wins
Result<void> deliver(const LayoutTree& layout, const std::vector<std::string>& ids, EventKind kind,
                     EventSink& sink, std::set<std::string>& seen, size_t& count) {
    for (const auto& id : ids) {
        if (seen.count(id)) {
            continue;
        }
        const LayoutNode* node = layout.find(id);
        if (!node) {
            continue;
        }
        const auto& name = event_name(*node, kind);
        if (!name || name->empty()) {
            continue;
        }

        seen.insert(id);
        UiEvent event{kind, *name, id};
        ydebug("EventEmitter: {} '{}' from {}", to_string(kind), event.name, id);
        if (auto res = sink.on_event(event); !res) {
            return std::unexpected(Error(ErrorCode::SinkFailed,
                "EventEmitter: sink rejected " + std::string(to_string(kind)) + " '" + event.name + "' from " + id,
                res.error()));
        }
        ++count;
    }
    return Ok();
}

} // namespace

Result<size_t> EventEmitter::emit(const LayoutTree& layout, const InteractionDelta& delta, EventSink& sink) {
    size_t count = 0;
    std::set<std::string> seen;
    if (auto res = deliver(layout, delta.pressed, EventKind::Click, sink, seen, count); !res) {
        return Err<size_t>("EventEmitter::emit: click delivery failed", res);
    }
    if (auto res = deliver(layout, delta.right_pressed, EventKind::RightClick, sink, seen, count); !res) {
        return Err<size_t>("EventEmitter::emit: right-click delivery failed", res);
    }
    if (auto res = deliver(layout, delta.hover_entered, EventKind::Hover, sink, seen, count); !res) {
        return Err<size_t>("EventEmitter::emit: hover delivery failed", res);
    }
    return count;
}

} // namespace lattice
