#pragma once

#include "../result.hpp"
#include "node.hpp"
#include <optional>
#include <string>
#include <vector>

namespace lattice {

// Named, parameterized fragment instantiated by <use>
struct ReusableDef {
    std::string name;
    std::map<std::string, std::optional<std::string>> params;   // local -> default literal
    NodeList body;
    int line = 0;
};

// Parsed markup before reusable expansion
// Reusables form an arena addressed by index; uses refer to them by name
struct ParsedDocument {
    std::vector<ReusableDef> reusables;
    std::map<std::string, size_t> reusable_index;
    std::vector<Page> pages;
};

// Compiles markup into an immutable Template
// Errors: MalformedMarkup, UnknownReusable, CyclicReuse, UnboundLocal
class Compiler {
public:
    static Result<TemplatePtr> compile(const std::string& markup);

    // Individual stages, exposed for tooling and tests
    static Result<ParsedDocument> parse(const std::string& markup);
    static Result<void> validate(const ParsedDocument& doc);
    static Result<TemplatePtr> expand(const ParsedDocument& doc);
};

} // namespace lattice
