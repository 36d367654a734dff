#include "binding.hpp"

namespace lattice {

BindingScope::BindingScope(BindingContext& host)
    : _parent(&host) {}

BindingScope::BindingScope(BindingContext& parent, BindingContextPtr item, std::map<std::string, std::string> bindings)
    : _parent(&parent), _item(std::move(item)), _bindings(std::move(bindings)) {}

template<typename T, typename Fn>
Result<T> BindingScope::_lookup(const std::string& key, Fn&& fn) {
    if (_item) {
        auto it = _bindings.find(key);
        if (it != _bindings.end()) {
            return fn(*_item, it->second);
        }
    }
    return fn(*_parent, key);
}

Result<std::string> BindingScope::get_text(const std::string& key) {
    return _lookup<std::string>(key, [](BindingContext& c, const std::string& k) { return c.get_text(k); });
}

Result<bool> BindingScope::get_bool(const std::string& key) {
    return _lookup<bool>(key, [](BindingContext& c, const std::string& k) { return c.get_bool(k); });
}

Result<std::vector<BindingContextPtr>> BindingScope::get_list(const std::string& key) {
    return _lookup<std::vector<BindingContextPtr>>(key, [](BindingContext& c, const std::string& k) { return c.get_list(k); });
}

Result<std::string> BindingScope::get_event_name(const std::string& key) {
    return _lookup<std::string>(key, [](BindingContext& c, const std::string& k) { return c.get_event_name(k); });
}

Result<double> BindingScope::get_number(const std::string& key) {
    return _lookup<double>(key, [](BindingContext& c, const std::string& k) { return c.get_number(k); });
}

Result<Color> BindingScope::get_color(const std::string& key) {
    return _lookup<Color>(key, [](BindingContext& c, const std::string& k) { return c.get_color(k); });
}

} // namespace lattice
