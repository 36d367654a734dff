#pragma once

#include "result.hpp"
#include "event_sink.hpp"
#include <map>
#include <vector>
#include <functional>
#include <memory>

namespace lattice {

using EventHandler = std::function<Result<void>(const UiEvent&)>;

// Dispatcher - EventSink routing events to handlers by name
// Handler keys: "click/Name", "hover/Name", "*/Name" (any kind), "*" (everything)
class Dispatcher : public EventSink {
public:
    static Result<std::shared_ptr<Dispatcher>> create();

    Result<void> register_event_handler(const std::string& key, EventHandler handler);
    Result<void> unregister_event_handler(const std::string& key);

    // Calls every matching handler in registration order; the first failure stops dispatch
    Result<void> on_event(const UiEvent& event) override;

    // Events seen so far, for hosts that poll instead of registering handlers
    const std::vector<UiEvent>& history() const { return _history; }
    void clear_history() { _history.clear(); }

private:
    Dispatcher() = default;

    Result<void> _call(const std::string& key, const UiEvent& event);

    std::map<std::string, std::vector<EventHandler>> _event_handlers;
    std::vector<UiEvent> _history;
};

using DispatcherPtr = std::shared_ptr<Dispatcher>;

} // namespace lattice
