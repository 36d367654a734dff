#pragma once

#include "../result.hpp"
#include "node.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace lattice {

// Holds the active template. Reload compiles on the caller's thread and
// publishes with a single atomic swap; frames keep the snapshot they started with.
class TemplateStore {
public:
    TemplateStore() = default;

    // Compile and publish; on failure the previous template stays active
    Result<void> reload(const std::string& markup);

    // Publish an already compiled template
    void publish(TemplatePtr tmpl);

    // Current template, nullptr before the first successful load
    TemplatePtr snapshot() const;

    // Number of successful publications
    uint64_t generation() const { return _generation.load(); }

private:
    std::atomic<TemplatePtr> _current;
    std::atomic<uint64_t> _generation{0};
};

} // namespace lattice
