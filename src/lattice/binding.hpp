#pragma once

#include "result.hpp"
#include "color.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace lattice {

class BindingContext;
using BindingContextPtr = std::shared_ptr<BindingContext>;

// Read-only view of host data for one frame
// Missing keys fail with ErrorCode::UnboundKey, kind mismatches with ErrorCode::WrongKind
class BindingContext {
public:
    virtual ~BindingContext() = default;

    virtual Result<std::string> get_text(const std::string& key) = 0;
    virtual Result<bool> get_bool(const std::string& key) = 0;
    virtual Result<std::vector<BindingContextPtr>> get_list(const std::string& key) = 0;
    virtual Result<std::string> get_event_name(const std::string& key) = 0;

    virtual Result<double> get_number(const std::string& key) {
        return Err<double>(ErrorCode::UnboundKey, "get_number: '" + key + "' not provided");
    }
    virtual Result<Color> get_color(const std::string& key) {
        return Err<Color>(ErrorCode::UnboundKey, "get_color: '" + key + "' not provided");
    }
};

// Scope of one list item: locals declared on the list map to keys of the item context,
// every other key is looked up in the enclosing scope
class BindingScope : public BindingContext {
public:
    // Root scope over the host context
    explicit BindingScope(BindingContext& host);

    // Item scope
    BindingScope(BindingContext& parent, BindingContextPtr item, std::map<std::string, std::string> bindings);

    Result<std::string> get_text(const std::string& key) override;
    Result<bool> get_bool(const std::string& key) override;
    Result<std::vector<BindingContextPtr>> get_list(const std::string& key) override;
    Result<std::string> get_event_name(const std::string& key) override;
    Result<double> get_number(const std::string& key) override;
    Result<Color> get_color(const std::string& key) override;

    bool binds(const std::string& key) const { return _bindings.count(key) > 0; }

private:
    // Route a lookup either to the item context (bound local) or to the parent
    template<typename T, typename Fn>
    Result<T> _lookup(const std::string& key, Fn&& fn);

    BindingContext* _parent;
    BindingContextPtr _item;
    std::map<std::string, std::string> _bindings;
};

} // namespace lattice
