#include "data_tree.hpp"
#include <spdlog/spdlog.h>
#include <charconv>

namespace lattice {

// ----------------------------------------------------------------------------
// DataTree
// ----------------------------------------------------------------------------

Result<std::shared_ptr<DataTree>> DataTree::create() {
    return create(YAML::Node(YAML::NodeType::Map));
}

Result<std::shared_ptr<DataTree>> DataTree::create(YAML::Node root) {
    auto tree = std::shared_ptr<DataTree>(new DataTree());
    tree->_root = root;
    return tree;
}

Result<std::shared_ptr<DataTree>> DataTree::from_string(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        return Err<std::shared_ptr<DataTree>>(ErrorCode::Io, std::string("DataTree: YAML parse error: ") + e.what());
    }
    if (root.IsNull()) {
        root = YAML::Node(YAML::NodeType::Map);
    }
    return create(root);
}

Result<std::shared_ptr<DataTree>> DataTree::from_file(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return Err<std::shared_ptr<DataTree>>(ErrorCode::Io, "DataTree: cannot load " + path.string() + ": " + e.what());
    }
    spdlog::debug("DataTree: loaded {}", path.string());
    return create(root);
}

Result<YAML::Node> DataTree::node(const DataPath& path) const {
    YAML::Node current = _root;

    for (const auto& part : path.segments()) {
        if (current.IsMap()) {
            const YAML::Node& map = current;
            YAML::Node child = map[part];
            if (!child.IsDefined()) {
                return Err<YAML::Node>(ErrorCode::UnboundKey, "DataTree: key '" + part + "' not found in '" + path.to_string() + "'");
            }
            current.reset(child);
        } else if (current.IsSequence()) {
            size_t index = 0;
            auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), index);
            if (ec != std::errc() || ptr != part.data() + part.size()) {
                return Err<YAML::Node>(ErrorCode::UnboundKey, "DataTree: '" + part + "' is not a valid index in '" + path.to_string() + "'");
            }
            if (index >= current.size()) {
                return Err<YAML::Node>(ErrorCode::UnboundKey, "DataTree: index " + part + " out of range in '" + path.to_string() + "'");
            }
            const YAML::Node& seq = current;
            current.reset(seq[index]);
        } else {
            return Err<YAML::Node>(ErrorCode::UnboundKey, "DataTree: cannot navigate through scalar at '" + part + "'");
        }
    }
    return current;
}

Result<std::vector<std::string>> DataTree::children(const DataPath& path) const {
    auto res = node(path);
    if (!res) {
        return Err<std::vector<std::string>>("DataTree::children", res);
    }

    std::vector<std::string> names;
    const YAML::Node& n = *res;
    if (n.IsMap()) {
        for (auto it = n.begin(); it != n.end(); ++it) {
            names.push_back(it->first.as<std::string>());
        }
    } else if (n.IsSequence()) {
        for (size_t i = 0; i < n.size(); ++i) {
            names.push_back(std::to_string(i));
        }
    }
    return names;
}

Result<std::string> DataTree::dump(const DataPath& path) const {
    auto res = node(path);
    if (!res) {
        return Err<std::string>("DataTree::dump", res);
    }
    return YAML::Dump(*res);
}

// ----------------------------------------------------------------------------
// TreeBindingContext
// ----------------------------------------------------------------------------

TreeBindingContext::TreeBindingContext(DataTreePtr tree, DataPath base)
    : _tree(std::move(tree)), _base(std::move(base)) {}

Result<std::shared_ptr<TreeBindingContext>> TreeBindingContext::from_string(const std::string& yaml) {
    auto tree_res = DataTree::from_string(yaml);
    if (!tree_res) {
        return Err<std::shared_ptr<TreeBindingContext>>("TreeBindingContext::from_string", tree_res);
    }
    return std::make_shared<TreeBindingContext>(*tree_res);
}

Result<YAML::Node> TreeBindingContext::_scalar(const std::string& key, const char* what) {
    auto res = _tree->node(_base / DataPath(key));
    if (!res) {
        return res;
    }
    if (!res->IsScalar()) {
        return Err<YAML::Node>(ErrorCode::WrongKind, std::string(what) + ": '" + key + "' is not a scalar");
    }
    return res;
}

Result<std::string> TreeBindingContext::get_text(const std::string& key) {
    auto res = _scalar(key, "get_text");
    if (!res) {
        return Err<std::string>("TreeBindingContext::get_text", res);
    }
    return res->Scalar();
}

Result<bool> TreeBindingContext::get_bool(const std::string& key) {
    auto res = _scalar(key, "get_bool");
    if (!res) {
        return Err<bool>("TreeBindingContext::get_bool", res);
    }
    bool value = false;
    if (!YAML::convert<bool>::decode(*res, value)) {
        return Err<bool>(ErrorCode::WrongKind, "get_bool: '" + key + "' is not a bool");
    }
    return value;
}

Result<double> TreeBindingContext::get_number(const std::string& key) {
    auto res = _scalar(key, "get_number");
    if (!res) {
        return Err<double>("TreeBindingContext::get_number", res);
    }
    const std::string& str = res->Scalar();
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != str.data() + str.size()) {
        return Err<double>(ErrorCode::WrongKind, "get_number: '" + key + "' is not a number");
    }
    return value;
}

Result<Color> TreeBindingContext::get_color(const std::string& key) {
    auto res = _tree->node(_base / DataPath(key));
    if (!res) {
        return Err<Color>("TreeBindingContext::get_color", res);
    }

    // [r, g, b] or [r, g, b, a]
    if (res->IsSequence() && (res->size() == 3 || res->size() == 4)) {
        float parts[4] = {0, 0, 0, 255};
        for (size_t i = 0; i < res->size(); ++i) {
            if (!YAML::convert<float>::decode((*res)[i], parts[i])) {
                return Err<Color>(ErrorCode::WrongKind, "get_color: '" + key + "' has a non-numeric component");
            }
        }
        return Color{parts[0], parts[1], parts[2], parts[3]};
    }
    if (!res->IsScalar()) {
        return Err<Color>(ErrorCode::WrongKind, "get_color: '" + key + "' is not a color");
    }

    auto color = parse_color(res->Scalar());
    if (!color) {
        return Err<Color>(ErrorCode::WrongKind, "get_color: '" + key + "': " + color.error().message());
    }
    return color;
}

Result<std::vector<BindingContextPtr>> TreeBindingContext::get_list(const std::string& key) {
    DataPath path = _base / DataPath(key);
    auto res = _tree->node(path);
    if (!res) {
        return Err<std::vector<BindingContextPtr>>("TreeBindingContext::get_list", res);
    }
    if (!res->IsSequence() && !res->IsMap()) {
        return Err<std::vector<BindingContextPtr>>(ErrorCode::WrongKind, "get_list: '" + key + "' is not a list");
    }

    auto names = _tree->children(path);
    if (!names) {
        return Err<std::vector<BindingContextPtr>>("TreeBindingContext::get_list", names);
    }

    std::vector<BindingContextPtr> items;
    items.reserve(names->size());
    for (const auto& name : *names) {
        items.push_back(std::make_shared<TreeBindingContext>(_tree, path / name));
    }
    return items;
}

Result<std::string> TreeBindingContext::get_event_name(const std::string& key) {
    auto res = _scalar(key, "get_event_name");
    if (!res) {
        return Err<std::string>("TreeBindingContext::get_event_name", res);
    }
    if (res->Scalar().empty()) {
        return Err<std::string>(ErrorCode::WrongKind, "get_event_name: '" + key + "' is empty");
    }
    return res->Scalar();
}

} // namespace lattice
