#include "dispatcher.hpp"
#include <ytrace/ytrace.hpp>

namespace lattice {

Result<std::shared_ptr<Dispatcher>> Dispatcher::create() {
    return std::shared_ptr<Dispatcher>(new Dispatcher());
}

Result<void> Dispatcher::register_event_handler(const std::string& key, EventHandler handler) {
    if (key.empty()) {
        return Err<void>("Dispatcher::register_event_handler: empty key");
    }
    if (!handler) {
        return Err<void>("Dispatcher::register_event_handler: empty handler for '" + key + "'");
    }
    _event_handlers[key].push_back(std::move(handler));
    return Ok();
}

Result<void> Dispatcher::unregister_event_handler(const std::string& key) {
    _event_handlers.erase(key);
    return Ok();
}

Result<void> Dispatcher::_call(const std::string& key, const UiEvent& event) {
    auto it = _event_handlers.find(key);
    if (it == _event_handlers.end()) {
        return Ok();
    }
    for (auto& handler : it->second) {
        if (auto res = handler(event); !res) {
            return Err<void>("Dispatcher: handler '" + key + "' failed", res);
        }
    }
    return Ok();
}

Result<void> Dispatcher::on_event(const UiEvent& event) {
    ydebug("Dispatcher: {} '{}' from {}", to_string(event.kind), event.name, event.element_id);
    _history.push_back(event);

    if (auto res = _call(std::string(to_string(event.kind)) + "/" + event.name, event); !res) {
        return res;
    }
    if (auto res = _call("*/" + event.name, event); !res) {
        return res;
    }
    return _call("*", event);
}

} // namespace lattice
