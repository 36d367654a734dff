#pragma once

#include "style.hpp"
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace lattice {

struct NodeTemplate;
using NodeList = std::vector<NodeTemplate>;

struct ElementNode {
    std::optional<Source<std::string>> id;
    StyleSpec style;
    NodeList children;
};

struct TextNode {
    TextStyleSpec style;
    Source<std::string> content;
};

// Body instantiated once per item of the bound list
struct ListNode {
    std::string source_key;
    std::map<std::string, std::string> item_bindings;   // local name -> key in the item
    NodeList body;
};

struct ConditionalNode {
    Source<bool> predicate;
    bool negate = false;
    NodeList body;
};

// Literal value or host key supplied for a reusable local
using LocalValue = std::variant<std::string, KeyRef>;

// Only present before expansion; compiled templates never contain it
struct ComponentUseNode {
    std::string reusable_name;
    std::map<std::string, LocalValue> locals;
};

struct NodeTemplate {
    std::variant<ElementNode, TextNode, ListNode, ConditionalNode, ComponentUseNode> node;
};

struct Page {
    std::string name;
    NodeList roots;
};

// Compiled, immutable markup
struct Template {
    std::vector<Page> pages;    // first page is the default

    const Page* find_page(const std::string& name) const {
        if (name.empty()) {
            return pages.empty() ? nullptr : &pages.front();
        }
        for (const auto& p : pages) {
            if (p.name == name) return &p;
        }
        return nullptr;
    }
};

using TemplatePtr = std::shared_ptr<const Template>;

} // namespace lattice
