#pragma once

#include "types.hpp"
#include "binding.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>

namespace lattice {

// DataTree - read-only host data over a YAML document, addressed by DataPath
// - map keys become children
// - sequence indices become children ("0", "1", ...)
// - scalars are leaves
class DataTree {
public:
    static Result<std::shared_ptr<DataTree>> create();
    static Result<std::shared_ptr<DataTree>> create(YAML::Node root);
    static Result<std::shared_ptr<DataTree>> from_string(const std::string& yaml);
    static Result<std::shared_ptr<DataTree>> from_file(const std::filesystem::path& path);

    Result<std::vector<std::string>> children(const DataPath& path) const;

    // Subtree rendered as YAML, for CLI output
    Result<std::string> dump(const DataPath& path) const;

    // Raw node at path; UnboundKey when absent
    Result<YAML::Node> node(const DataPath& path) const;

private:
    DataTree() = default;

    YAML::Node _root;
};

using DataTreePtr = std::shared_ptr<DataTree>;

// Binding context reading keys as paths relative to a node of a DataTree
// List items are contexts rooted at each child of the listed node
class TreeBindingContext : public BindingContext {
public:
    explicit TreeBindingContext(DataTreePtr tree, DataPath base = DataPath::root());

    static Result<std::shared_ptr<TreeBindingContext>> from_string(const std::string& yaml);

    Result<std::string> get_text(const std::string& key) override;
    Result<bool> get_bool(const std::string& key) override;
    Result<std::vector<BindingContextPtr>> get_list(const std::string& key) override;
    Result<std::string> get_event_name(const std::string& key) override;
    Result<double> get_number(const std::string& key) override;
    Result<Color> get_color(const std::string& key) override;

    const DataTreePtr& tree() const { return _tree; }
    const DataPath& base() const { return _base; }

private:
    Result<YAML::Node> _scalar(const std::string& key, const char* what);

    DataTreePtr _tree;
    DataPath _base;
};

} // namespace lattice
