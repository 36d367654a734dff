#pragma once

#include "result.hpp"
#include <deque>
#include <string>
#include <spdlog/spdlog.h>

namespace lattice {

// Bounded log of recovered errors: binding fallbacks, dropped events, duplicate ids,
// rejected reloads. Nothing recorded here aborts a frame.
// Every entry is mirrored to spdlog at its level when added; the oldest entries are
// evicted once max_size is reached.
class Diagnostics {
public:
    struct Entry {
        Error error;
        spdlog::level::level_enum level;
        std::string timestamp;      // HH:MM:SS.mmm, local time
    };

    explicit Diagnostics(size_t max_size = 256) : _max_size(max_size) {}

    void add(Error error, spdlog::level::level_enum level = spdlog::level::warn);

    // Oldest first
    const std::deque<Entry>& entries() const { return _entries; }
    size_t size() const { return _entries.size(); }
    bool empty() const { return _entries.empty(); }

    // Entries carrying the given code
    size_t count(ErrorCode code) const;

    void clear() { _entries.clear(); }

    size_t max_size() const { return _max_size; }
    void set_max_size(size_t max_size);

private:
    void _trim();

    std::deque<Entry> _entries;
    size_t _max_size;
};

} // namespace lattice
