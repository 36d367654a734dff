#pragma once

#include <string>
#include <vector>

namespace lattice {

// DataPath - binding key split on '/' ("Documents/1/title")
// "." and ".." fold while parsing, so the key "." names the current scope itself
class DataPath {
public:
    DataPath() = default;
    explicit DataPath(const std::string& key);

    static DataPath root() { return DataPath(); }

    bool is_root() const { return _segments.empty(); }
    bool is_absolute() const { return _absolute; }

    const std::vector<std::string>& segments() const { return _segments; }

    DataPath operator/(const std::string& segment) const;
    // An absolute right side replaces the left
    DataPath operator/(const DataPath& rel) const;

    bool operator==(const DataPath&) const = default;

    std::string to_string() const;

private:
    std::vector<std::string> _segments;
    bool _absolute = false;
};

} // namespace lattice
