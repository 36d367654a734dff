#include "types.hpp"
#include <string_view>

namespace lattice {

namespace {

void push_segment(std::vector<std::string>& segments, std::string_view segment) {
    if (segment.empty() || segment == ".") {
        return;
    }
    if (segment == "..") {
        if (!segments.empty()) segments.pop_back();
        return;
    }
    segments.emplace_back(segment);
}

} // namespace

DataPath::DataPath(const std::string& key) {
    std::string_view rest = key;
    if (!rest.empty() && rest.front() == '/') {
        _absolute = true;
        rest.remove_prefix(1);
    }
    while (!rest.empty()) {
        auto slash = rest.find('/');
        push_segment(_segments, rest.substr(0, slash));
        if (slash == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(slash + 1);
    }
}

DataPath DataPath::operator/(const std::string& segment) const {
    DataPath result = *this;
    push_segment(result._segments, segment);
    return result;
}

DataPath DataPath::operator/(const DataPath& rel) const {
    if (rel._absolute) {
        return rel;
    }
    DataPath result = *this;
    for (const auto& s : rel._segments) {
        push_segment(result._segments, s);
    }
    return result;
}

std::string DataPath::to_string() const {
    std::string out = _absolute ? "/" : "";
    for (size_t i = 0; i < _segments.size(); ++i) {
        if (i > 0) out += '/';
        out += _segments[i];
    }
    return out;
}

} // namespace lattice
