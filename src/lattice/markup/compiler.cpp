#include "compiler.hpp"
#include <tinyxml2.h>
#include <spdlog/spdlog.h>
#include <ytrace/ytrace.hpp>
#include <charconv>
#include <set>
#include <type_traits>

namespace lattice {

namespace {

using tinyxml2::XMLElement;

std::string where(const XMLElement* el) {
    return "line " + std::to_string(el->GetLineNum()) + ": <" + el->Name() + ">";
}

std::unexpected<Error> malformed(const XMLElement* el, const std::string& what,
                                 std::source_location loc = std::source_location::current()) {
    return std::unexpected(Error(ErrorCode::MalformedMarkup, where(el) + " " + what, loc));
}

std::optional<std::string> attr(const XMLElement* el, const char* name) {
    const char* v = el->Attribute(name);
    if (!v) return std::nullopt;
    return std::string(v);
}

Result<std::string> required_attr(const XMLElement* el, const char* name) {
    auto v = attr(el, name);
    if (!v || v->empty()) {
        return malformed(el, std::string("requires a non-empty '") + name + "' attribute");
    }
    return *v;
}

// ----------------------------------------------------------------------------
// Literal parsing
// ----------------------------------------------------------------------------

Result<float> parse_number(const std::string& text) {
    float v = 0.0f;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
        return Err<float>(ErrorCode::MalformedMarkup, "'" + text + "' is not a number");
    }
    return v;
}

Result<bool> parse_flag(const std::string& text) {
    if (text == "true" || text == "1" || text == "yes") return true;
    if (text == "false" || text == "0" || text == "no") return false;
    return Err<bool>(ErrorCode::MalformedMarkup, "'" + text + "' is not a bool");
}

template<typename T>
Result<T> from_literal(const std::string& text) {
    if constexpr (std::is_same_v<T, std::string>) {
        return text;
    } else if constexpr (std::is_same_v<T, float>) {
        return parse_number(text);
    } else if constexpr (std::is_same_v<T, bool>) {
        return parse_flag(text);
    } else {
        static_assert(std::is_same_v<T, Color>);
        return parse_color(text);
    }
}

Result<float> float_attr(const XMLElement* el, const char* name) {
    auto v = attr(el, name);
    if (!v) {
        return malformed(el, std::string("requires a '") + name + "' attribute");
    }
    auto n = parse_number(*v);
    if (!n) {
        return malformed(el, std::string("attribute '") + name + "': " + n.error().message());
    }
    return *n;
}

Result<std::optional<float>> opt_float_attr(const XMLElement* el, const char* name) {
    if (!el->Attribute(name)) {
        return std::optional<float>{};
    }
    auto v = float_attr(el, name);
    if (!v) {
        return std::unexpected(v.error());
    }
    return std::optional<float>(*v);
}

Result<bool> bool_attr(const XMLElement* el, const char* name, bool fallback) {
    auto v = attr(el, name);
    if (!v) {
        return fallback;
    }
    auto b = parse_flag(*v);
    if (!b) {
        return malformed(el, std::string("attribute '") + name + "': " + b.error().message());
    }
    return *b;
}

// Literal from `literal_name`, or binding key from `from`
template<typename T>
Result<Source<T>> literal_or_key(const XMLElement* el, const char* literal_name) {
    auto literal = attr(el, literal_name);
    auto key = attr(el, "from");
    if (literal && key) {
        return malformed(el, std::string("takes either '") + literal_name + "' or 'from', not both");
    }
    if (key) {
        if (key->empty()) {
            return malformed(el, "has an empty 'from'");
        }
        return Source<T>(KeyRef{*key});
    }
    if (!literal) {
        return malformed(el, std::string("requires '") + literal_name + "' or 'from'");
    }
    auto v = from_literal<T>(*literal);
    if (!v) {
        return malformed(el, v.error().message());
    }
    return Source<T>(*v);
}

Result<AttachPoint> attach_point(const XMLElement* el) {
    if (auto at = attr(el, "at")) {
        if (auto p = parse_attach_point(*at)) return *p;
        return malformed(el, "unknown corner '" + *at + "'");
    }
    // Corner given as a bare attribute: <floating-attach-to-parent bottom-right="">
    for (auto a = el->FirstAttribute(); a; a = a->Next()) {
        if (auto p = parse_attach_point(a->Name())) return *p;
    }
    return malformed(el, "requires a corner");
}

bool is_get_declaration(const std::string& tag) {
    static const std::set<std::string> tags = {
        "get-text", "get-bool", "get-numeric", "get-color", "get-event", "get-image", "get-list",
    };
    return tags.count(tag) > 0;
}

bool is_set_declaration(const std::string& tag) {
    static const std::set<std::string> tags = {
        "set-text", "set-bool", "set-numeric", "set-color", "set-event", "set-image",
    };
    return tags.count(tag) > 0;
}

NodeTemplate wrap(NodeTemplate inner, Source<bool> predicate, bool negate) {
    ConditionalNode cond{std::move(predicate), negate, {}};
    cond.body.push_back(std::move(inner));
    return NodeTemplate{std::move(cond)};
}

// ----------------------------------------------------------------------------
// Parser: XML -> ParsedDocument
// ----------------------------------------------------------------------------

struct ParseContext {
    std::set<std::string> event_locals;     // bound by get-event on enclosing lists
};

class MarkupParser {
public:
    Result<ParsedDocument> run(const std::string& markup) {
        tinyxml2::XMLDocument xml;
        if (xml.Parse(markup.c_str(), markup.size()) != tinyxml2::XML_SUCCESS) {
            return Err<ParsedDocument>(ErrorCode::MalformedMarkup,
                "line " + std::to_string(xml.ErrorLineNum()) + ": " + xml.ErrorStr());
        }

        const XMLElement* first = xml.FirstChildElement();
        if (!first) {
            return Err<ParsedDocument>(ErrorCode::MalformedMarkup, "markup has no elements");
        }

        for (const XMLElement* el = first; el; el = el->NextSiblingElement()) {
            if (std::string(el->Name()) == "layout") {
                for (const XMLElement* child = el->FirstChildElement(); child; child = child->NextSiblingElement()) {
                    if (auto res = _top_level(child); !res) {
                        return std::unexpected(res.error());
                    }
                }
            } else if (auto res = _top_level(el); !res) {
                return std::unexpected(res.error());
            }
        }

        if (_doc.pages.empty()) {
            return Err<ParsedDocument>(ErrorCode::MalformedMarkup, "markup defines no page");
        }
        return std::move(_doc);
    }

private:
    Result<void> _top_level(const XMLElement* el) {
        std::string tag = el->Name();
        if (tag == "reusable") {
            return _reusable(el);
        }
        if (tag == "page") {
            return _page(el);
        }

        // Loose structure nodes form an implicit page
        if (!_implicit_page) {
            if (_has_page("main")) {
                return malformed(el, "outside <page> while a page named 'main' exists");
            }
            _implicit_page = _doc.pages.size();
            _doc.pages.push_back(Page{"main", {}});
        }
        return _structure(el, ParseContext{}, _doc.pages[*_implicit_page].roots);
    }

    bool _has_page(const std::string& name) const {
        for (const auto& p : _doc.pages) {
            if (p.name == name) return true;
        }
        return false;
    }

    Result<void> _reusable(const XMLElement* el) {
        auto name = required_attr(el, "name");
        if (!name) {
            return std::unexpected(name.error());
        }
        if (_doc.reusable_index.count(*name)) {
            return malformed(el, "duplicate reusable '" + *name + "'");
        }

        ReusableDef def{*name, {}, {}, el->GetLineNum()};
        for (const XMLElement* child = el->FirstChildElement(); child; child = child->NextSiblingElement()) {
            if (std::string(child->Name()) == "param") {
                auto local = required_attr(child, "local");
                if (!local) {
                    return std::unexpected(local.error());
                }
                def.params[*local] = attr(child, "default");
                continue;
            }
            if (auto res = _structure(child, ParseContext{}, def.body); !res) {
                return res;
            }
        }

        _doc.reusable_index[def.name] = _doc.reusables.size();
        _doc.reusables.push_back(std::move(def));
        return Ok();
    }

    Result<void> _page(const XMLElement* el) {
        auto name = required_attr(el, "name");
        if (!name) {
            return std::unexpected(name.error());
        }
        if (_has_page(*name)) {
            return malformed(el, "duplicate page '" + *name + "'");
        }

        Page page{*name, {}};
        for (const XMLElement* child = el->FirstChildElement(); child; child = child->NextSiblingElement()) {
            if (auto res = _structure(child, ParseContext{}, page.roots); !res) {
                return res;
            }
        }
        _doc.pages.push_back(std::move(page));
        return Ok();
    }

    // One structural node, wrapped by its if / if-not conditions
    Result<void> _structure(const XMLElement* el, const ParseContext& ctx, NodeList& out) {
        std::string tag = el->Name();
        Result<NodeTemplate> node = [&]() -> Result<NodeTemplate> {
            if (tag == "element") return _element(el, ctx);
            if (tag == "text-element") return _text(el);
            if (tag == "list") return _list(el, ctx);
            if (tag == "use") return _use(el);
            return malformed(el, "is not a structural tag");
        }();
        if (!node) {
            return std::unexpected(node.error());
        }

        NodeTemplate result = std::move(*node);
        if (auto cond = attr(el, "if-not")) {
            if (cond->empty()) return malformed(el, "has an empty 'if-not'");
            result = wrap(std::move(result), KeyRef{*cond}, true);
        }
        if (auto cond = attr(el, "if")) {
            if (cond->empty()) return malformed(el, "has an empty 'if'");
            result = wrap(std::move(result), KeyRef{*cond}, false);
        }
        out.push_back(std::move(result));
        return Ok();
    }

    Result<NodeTemplate> _element(const XMLElement* el, const ParseContext& ctx) {
        ElementNode node;
        if (auto id = attr(el, "id")) {
            if (id->empty()) return malformed(el, "has an empty 'id'");
            node.id = Source<std::string>(*id);
        }

        bool config_seen = false;
        for (const XMLElement* child = el->FirstChildElement(); child; child = child->NextSiblingElement()) {
            if (std::string(child->Name()) == "element-config") {
                if (config_seen) {
                    return malformed(child, "appears twice in one element");
                }
                config_seen = true;
                if (auto res = _element_config(child, node, ctx); !res) {
                    return std::unexpected(res.error());
                }
                continue;
            }
            if (auto res = _structure(child, ctx, node.children); !res) {
                return std::unexpected(res.error());
            }
        }
        return NodeTemplate{std::move(node)};
    }

    Result<void> _element_config(const XMLElement* el, ElementNode& node, const ParseContext& ctx) {
        for (const XMLElement* child = el->FirstChildElement(); child; child = child->NextSiblingElement()) {
            std::string tag = child->Name();

            if (tag == "id") {
                if (node.id) {
                    return malformed(child, "element already has an id");
                }
                auto id = literal_or_key<std::string>(child, "is");
                if (!id) {
                    return std::unexpected(id.error());
                }
                node.id = *id;
                continue;
            }

            if (tag == "hovered" || tag == "clicked" || tag == "right-clicked") {
                auto& variant = tag == "hovered" ? node.style.hovered
                              : tag == "clicked" ? node.style.clicked : node.style.right_clicked;
                auto& event = tag == "hovered" ? node.style.hover_event
                            : tag == "clicked" ? node.style.click_event : node.style.right_click_event;
                if (variant) {
                    return malformed(child, "appears twice in one element-config");
                }
                StyleProps props;
                for (const XMLElement* leaf = child->FirstChildElement(); leaf; leaf = leaf->NextSiblingElement()) {
                    if (auto res = _style_leaf(leaf, props); !res) {
                        return res;
                    }
                }
                variant = props;
                if (auto emit = attr(child, "emit")) {
                    if (emit->empty()) {
                        return malformed(child, "has an empty 'emit'");
                    }
                    if (ctx.event_locals.count(*emit)) {
                        event = Source<std::string>(KeyRef{*emit});
                    } else {
                        event = Source<std::string>(*emit);
                    }
                }
                continue;
            }

            if (auto res = _style_leaf(child, node.style.base); !res) {
                return res;
            }
        }
        return Ok();
    }

    Result<void> _sizing(const XMLElement* el, SizingMode mode, std::optional<Sizing>& out) {
        Sizing s;
        s.mode = mode;
        if (mode == SizingMode::Fixed) {
            auto v = literal_or_key<float>(el, "at");
            if (!v) return std::unexpected(v.error());
            s.value = *v;
        } else if (mode == SizingMode::Percent) {
            auto v = float_attr(el, "at");
            if (!v) return std::unexpected(v.error());
            s.value = *v;
        } else {
            auto min = opt_float_attr(el, "min");
            if (!min) return std::unexpected(min.error());
            auto max = opt_float_attr(el, "max");
            if (!max) return std::unexpected(max.error());
            if (*min) s.min = **min;
            if (*max) s.max = **max;
            if (s.max < s.min) {
                return malformed(el, "has max below min");
            }
        }
        out = s;
        return Ok();
    }

    static Result<void> _set_float(const XMLElement* el, std::initializer_list<std::optional<float>*> targets) {
        auto v = float_attr(el, "is");
        if (!v) return std::unexpected(v.error());
        for (auto* t : targets) *t = *v;
        return Ok();
    }

    Result<void> _style_leaf(const XMLElement* el, StyleProps& p) {
        std::string tag = el->Name();

        if (tag == "grow") {
            p.width = Sizing::grow();
            p.height = Sizing::grow();
            return Ok();
        }
        if (tag == "width-grow") return _sizing(el, SizingMode::Grow, p.width);
        if (tag == "height-grow") return _sizing(el, SizingMode::Grow, p.height);
        if (tag == "width-fit") return _sizing(el, SizingMode::Fit, p.width);
        if (tag == "height-fit") return _sizing(el, SizingMode::Fit, p.height);
        if (tag == "width-fixed") return _sizing(el, SizingMode::Fixed, p.width);
        if (tag == "height-fixed") return _sizing(el, SizingMode::Fixed, p.height);
        if (tag == "width-percent") return _sizing(el, SizingMode::Percent, p.width);
        if (tag == "height-percent") return _sizing(el, SizingMode::Percent, p.height);

        if (tag == "padding-all") {
            return _set_float(el, {&p.padding_left, &p.padding_right, &p.padding_top, &p.padding_bottom});
        }
        if (tag == "padding-left") return _set_float(el, {&p.padding_left});
        if (tag == "padding-right") return _set_float(el, {&p.padding_right});
        if (tag == "padding-top") return _set_float(el, {&p.padding_top});
        if (tag == "padding-bottom") return _set_float(el, {&p.padding_bottom});
        if (tag == "child-gap") return _set_float(el, {&p.child_gap});

        if (tag == "direction") {
            auto is = required_attr(el, "is");
            if (!is) return std::unexpected(is.error());
            if (*is == "ttb" || *is == "top-to-bottom") {
                p.direction = Direction::TopToBottom;
            } else if (*is == "ltr" || *is == "left-to-right") {
                p.direction = Direction::LeftToRight;
            } else {
                return malformed(el, "unknown direction '" + *is + "'");
            }
            return Ok();
        }
        if (tag == "align-children-x") {
            auto to = required_attr(el, "to");
            if (!to) return std::unexpected(to.error());
            if (*to == "left") p.align_x = AlignX::Left;
            else if (*to == "center") p.align_x = AlignX::Center;
            else if (*to == "right") p.align_x = AlignX::Right;
            else return malformed(el, "unknown alignment '" + *to + "'");
            return Ok();
        }
        if (tag == "align-children-y") {
            auto to = required_attr(el, "to");
            if (!to) return std::unexpected(to.error());
            if (*to == "top") p.align_y = AlignY::Top;
            else if (*to == "center") p.align_y = AlignY::Center;
            else if (*to == "bottom") p.align_y = AlignY::Bottom;
            else return malformed(el, "unknown alignment '" + *to + "'");
            return Ok();
        }

        if (tag == "color") {
            auto c = literal_or_key<Color>(el, "is");
            if (!c) return std::unexpected(c.error());
            p.color = *c;
            return Ok();
        }
        if (tag == "dyn-color") {
            auto key = required_attr(el, "from");
            if (!key) return std::unexpected(key.error());
            p.color = Source<Color>(KeyRef{*key});
            return Ok();
        }

        if (tag == "radius-all") {
            return _set_float(el, {&p.radius_top_left, &p.radius_top_right, &p.radius_bottom_left, &p.radius_bottom_right});
        }
        if (tag == "radius-top-left") return _set_float(el, {&p.radius_top_left});
        if (tag == "radius-top-right") return _set_float(el, {&p.radius_top_right});
        if (tag == "radius-bottom-left") return _set_float(el, {&p.radius_bottom_left});
        if (tag == "radius-bottom-right") return _set_float(el, {&p.radius_bottom_right});

        if (tag == "border-color") {
            auto c = literal_or_key<Color>(el, "is");
            if (!c) return std::unexpected(c.error());
            p.border_color = *c;
            return Ok();
        }
        if (tag == "border-dynamic-color") {
            auto key = required_attr(el, "from");
            if (!key) return std::unexpected(key.error());
            p.border_color = Source<Color>(KeyRef{*key});
            return Ok();
        }
        if (tag == "border-all") {
            return _set_float(el, {&p.border_left, &p.border_right, &p.border_top, &p.border_bottom});
        }
        if (tag == "border-left") return _set_float(el, {&p.border_left});
        if (tag == "border-right") return _set_float(el, {&p.border_right});
        if (tag == "border-top") return _set_float(el, {&p.border_top});
        if (tag == "border-bottom") return _set_float(el, {&p.border_bottom});
        if (tag == "border-between-children") return _set_float(el, {&p.border_between_children});

        if (tag == "scroll") {
            auto v = bool_attr(el, "vertical", false);
            if (!v) return std::unexpected(v.error());
            auto h = bool_attr(el, "horizontal", false);
            if (!h) return std::unexpected(h.error());
            p.scroll_y = *v;
            p.scroll_x = *h;
            return Ok();
        }
        if (tag == "image") {
            auto img = literal_or_key<std::string>(el, "src");
            if (!img) return std::unexpected(img.error());
            p.image = *img;
            return Ok();
        }

        if (tag == "floating") {
            p.floating = true;
            return Ok();
        }
        if (tag == "floating-offset") {
            auto x = opt_float_attr(el, "x");
            if (!x) return std::unexpected(x.error());
            auto y = opt_float_attr(el, "y");
            if (!y) return std::unexpected(y.error());
            p.offset_x = Source<float>(x->value_or(0.0f));
            p.offset_y = Source<float>(y->value_or(0.0f));
            if (auto key = attr(el, "x-from")) p.offset_x = Source<float>(KeyRef{*key});
            if (auto key = attr(el, "y-from")) p.offset_y = Source<float>(KeyRef{*key});
            return Ok();
        }
        if (tag == "floating-size") {
            auto w = float_attr(el, "width");
            if (!w) return std::unexpected(w.error());
            auto h = float_attr(el, "height");
            if (!h) return std::unexpected(h.error());
            p.floating_expand_width = *w;
            p.floating_expand_height = *h;
            return Ok();
        }
        if (tag == "floating-attach-to-parent") {
            auto point = attach_point(el);
            if (!point) return std::unexpected(point.error());
            p.attach_parent = *point;
            return Ok();
        }
        if (tag == "floating-attach-element") {
            auto point = attach_point(el);
            if (!point) return std::unexpected(point.error());
            p.attach_element = *point;
            return Ok();
        }
        if (tag == "floating-attach-to-root") {
            p.attach_to = AttachTarget::Root;
            return Ok();
        }
        if (tag == "floating-attach-to-element") {
            auto id = required_attr(el, "id");
            if (!id) return std::unexpected(id.error());
            p.attach_to = AttachTarget::Element;
            p.attach_id = *id;
            return Ok();
        }
        if (tag == "floating-z-index") {
            int z = 0;
            if (el->QueryIntAttribute("z", &z) != tinyxml2::XML_SUCCESS) {
                return malformed(el, "requires an integer 'z'");
            }
            p.z_index = z;
            return Ok();
        }
        if (tag == "floating-capture-pointer") {
            auto state = bool_attr(el, "state", true);
            if (!state) return std::unexpected(state.error());
            p.capture_pointer = *state;
            return Ok();
        }

        return malformed(el, "is not a configuration tag");
    }

    Result<NodeTemplate> _text(const XMLElement* el) {
        TextNode node{{}, std::string()};
        bool has_content = false;

        auto set_content = [&](const XMLElement* at, Source<std::string> content) -> Result<void> {
            if (has_content) {
                return malformed(at, "text-element already has content");
            }
            node.content = std::move(content);
            has_content = true;
            return Ok();
        };

        for (const XMLElement* child = el->FirstChildElement(); child; child = child->NextSiblingElement()) {
            std::string tag = child->Name();
            if (tag == "text-config") {
                for (const XMLElement* leaf = child->FirstChildElement(); leaf; leaf = leaf->NextSiblingElement()) {
                    if (std::string(leaf->Name()) == "dyn-content") {
                        auto key = required_attr(leaf, "from");
                        if (!key) return std::unexpected(key.error());
                        if (auto res = set_content(leaf, KeyRef{*key}); !res) return std::unexpected(res.error());
                        continue;
                    }
                    if (auto res = _text_leaf(leaf, node.style); !res) {
                        return std::unexpected(res.error());
                    }
                }
            } else if (tag == "content") {
                const char* text = child->GetText();
                if (auto res = set_content(child, std::string(text ? text : "")); !res) return std::unexpected(res.error());
            } else if (tag == "dyn-content") {
                auto key = required_attr(child, "from");
                if (!key) return std::unexpected(key.error());
                if (auto res = set_content(child, KeyRef{*key}); !res) return std::unexpected(res.error());
            } else {
                return malformed(child, "is not valid inside <text-element>");
            }
        }

        if (!has_content && el->GetText()) {
            node.content = std::string(el->GetText());
        }
        return NodeTemplate{std::move(node)};
    }

    Result<void> _text_leaf(const XMLElement* el, TextStyleSpec& style) {
        std::string tag = el->Name();
        if (tag == "font-id") {
            int id = 0;
            if (el->QueryIntAttribute("is", &id) != tinyxml2::XML_SUCCESS || id < 0 || id > 0xFFFF) {
                return malformed(el, "requires a font id in 'is'");
            }
            style.font_id = static_cast<uint16_t>(id);
            return Ok();
        }
        if (tag == "font-size") {
            auto v = float_attr(el, "is");
            if (!v) return std::unexpected(v.error());
            style.font_size = *v;
            return Ok();
        }
        if (tag == "line-height") {
            auto v = float_attr(el, "is");
            if (!v) return std::unexpected(v.error());
            style.line_height = *v;
            return Ok();
        }
        if (tag == "color") {
            auto c = literal_or_key<Color>(el, "is");
            if (!c) return std::unexpected(c.error());
            style.color = *c;
            return Ok();
        }
        if (tag == "text-align-left") { style.align = TextAlign::Left; return Ok(); }
        if (tag == "text-align-center") { style.align = TextAlign::Center; return Ok(); }
        if (tag == "text-align-right") { style.align = TextAlign::Right; return Ok(); }
        return malformed(el, "is not a text configuration tag");
    }

    Result<NodeTemplate> _list(const XMLElement* el, const ParseContext& ctx) {
        auto src = attr(el, "src");
        if (!src || src->empty()) {
            return malformed(el, "requires a 'src'");
        }

        ListNode node{*src, {}, {}};
        ParseContext inner = ctx;

        // Declarations first so the body sees every item local
        for (const XMLElement* child = el->FirstChildElement(); child; child = child->NextSiblingElement()) {
            std::string tag = child->Name();
            if (is_set_declaration(tag)) {
                return malformed(child, "is only valid inside <use>");
            }
            if (!is_get_declaration(tag)) {
                continue;
            }
            auto local = required_attr(child, "local");
            if (!local) return std::unexpected(local.error());
            auto from = required_attr(child, "from");
            if (!from) return std::unexpected(from.error());
            node.item_bindings[*local] = *from;
            if (tag == "get-event") {
                inner.event_locals.insert(*local);
            } else {
                inner.event_locals.erase(*local);
            }
        }

        for (const XMLElement* child = el->FirstChildElement(); child; child = child->NextSiblingElement()) {
            if (is_get_declaration(child->Name())) {
                continue;
            }
            if (auto res = _structure(child, inner, node.body); !res) {
                return std::unexpected(res.error());
            }
        }
        return NodeTemplate{std::move(node)};
    }

    Result<NodeTemplate> _use(const XMLElement* el) {
        auto name = attr(el, "name");
        if (!name || name->empty()) {
            return malformed(el, "requires a 'name'");
        }

        ComponentUseNode node{*name, {}};
        for (const XMLElement* child = el->FirstChildElement(); child; child = child->NextSiblingElement()) {
            std::string tag = child->Name();
            auto local = required_attr(child, "local");
            if (!local) return std::unexpected(local.error());

            if (is_get_declaration(tag)) {
                auto from = required_attr(child, "from");
                if (!from) return std::unexpected(from.error());
                node.locals[*local] = KeyRef{*from};
                continue;
            }
            if (!is_set_declaration(tag)) {
                return malformed(child, "is not valid inside <use>");
            }

            auto to = attr(child, "to");
            if (!to) {
                return malformed(child, "requires a 'to'");
            }
            Result<void> check = Ok();
            if (tag == "set-bool") {
                if (auto b = parse_flag(*to); !b) check = std::unexpected(b.error());
            } else if (tag == "set-numeric") {
                if (auto n = parse_number(*to); !n) check = std::unexpected(n.error());
            } else if (tag == "set-color") {
                if (auto c = parse_color(*to); !c) check = std::unexpected(c.error());
            } else if (tag == "set-event" && to->empty()) {
                return malformed(child, "has an empty event name");
            }
            if (!check) {
                return malformed(child, check.error().message());
            }
            node.locals[*local] = *to;
        }
        return NodeTemplate{std::move(node)};
    }

    ParsedDocument _doc;
    std::optional<size_t> _implicit_page;
};

// ----------------------------------------------------------------------------
// Validation: unknown reusables, cycles
// ----------------------------------------------------------------------------

void collect_uses(const NodeList& nodes, std::vector<std::string>& out) {
    for (const auto& n : nodes) {
        std::visit([&](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ElementNode>) {
                collect_uses(node.children, out);
            } else if constexpr (std::is_same_v<T, ListNode> || std::is_same_v<T, ConditionalNode>) {
                collect_uses(node.body, out);
            } else if constexpr (std::is_same_v<T, ComponentUseNode>) {
                out.push_back(node.reusable_name);
            }
        }, n.node);
    }
}

// Depth-first colouring over the reusable arena
class CycleFinder {
public:
    CycleFinder(const ParsedDocument& doc) : _doc(doc), _marks(doc.reusables.size(), Mark::White) {
        _edges.resize(doc.reusables.size());
        for (size_t i = 0; i < doc.reusables.size(); ++i) {
            std::vector<std::string> uses;
            collect_uses(doc.reusables[i].body, uses);
            for (const auto& u : uses) {
                _edges[i].push_back(doc.reusable_index.at(u));
            }
        }
    }

    Result<void> run() {
        for (size_t i = 0; i < _marks.size(); ++i) {
            if (_marks[i] == Mark::White) {
                if (auto res = _visit(i); !res) return res;
            }
        }
        return Ok();
    }

private:
    enum class Mark { White, Gray, Black };

    Result<void> _visit(size_t i) {
        _marks[i] = Mark::Gray;
        _stack.push_back(i);
        for (size_t j : _edges[i]) {
            if (_marks[j] == Mark::Gray) {
                std::string path;
                bool in_cycle = false;
                for (size_t k : _stack) {
                    if (k == j) in_cycle = true;
                    if (in_cycle) path += _doc.reusables[k].name + " -> ";
                }
                path += _doc.reusables[j].name;
                return Err<void>(ErrorCode::CyclicReuse, "cyclic reuse: " + path);
            }
            if (_marks[j] == Mark::White) {
                if (auto res = _visit(j); !res) return res;
            }
        }
        _stack.pop_back();
        _marks[i] = Mark::Black;
        return Ok();
    }

    const ParsedDocument& _doc;
    std::vector<Mark> _marks;
    std::vector<std::vector<size_t>> _edges;
    std::vector<size_t> _stack;
};

// ----------------------------------------------------------------------------
// Expansion: inline reusables, substitute locals
// ----------------------------------------------------------------------------

// Local name -> value; nullopt marks a declared param without a value
using Env = std::map<std::string, std::optional<LocalValue>>;

class Expander {
public:
    explicit Expander(const ParsedDocument& doc) : _doc(doc) {}

    Result<void> expand(const NodeList& in, const Env& env, const std::string& scope, NodeList& out) {
        for (const auto& n : in) {
            auto res = std::visit([&](const auto& node) { return _expand(node, env, scope, out); }, n.node);
            if (!res) return res;
        }
        return Ok();
    }

private:
    std::unexpected<Error> _unbound(const std::string& scope, const std::string& local) {
        return std::unexpected(Error(ErrorCode::UnboundLocal,
            "reusable '" + scope + "': local '" + local + "' is referenced but has no value"));
    }

    // Resolve a reference to a local; nullptr when `key` is not a local
    Result<const LocalValue*> _local(const std::string& key, const Env& env, const std::string& scope) {
        auto it = env.find(key);
        if (it == env.end()) {
            return static_cast<const LocalValue*>(nullptr);
        }
        if (!it->second) {
            return _unbound(scope, key);
        }
        return &*it->second;
    }

    template<typename T>
    Result<void> _subst(Source<T>& src, const Env& env, const std::string& scope) {
        auto ref = std::get_if<KeyRef>(&src);
        if (!ref) return Ok();

        auto local = _local(ref->key, env, scope);
        if (!local) return std::unexpected(local.error());
        if (!*local) return Ok();

        if (auto remote = std::get_if<KeyRef>(*local)) {
            src = *remote;
            return Ok();
        }
        auto value = from_literal<T>(std::get<std::string>(**local));
        if (!value) {
            return Err<void>("reusable '" + scope + "': local '" + ref->key + "'", value);
        }
        src = *value;
        return Ok();
    }

    template<typename T>
    Result<void> _subst(std::optional<Source<T>>& src, const Env& env, const std::string& scope) {
        if (!src) return Ok();
        return _subst(*src, env, scope);
    }

    // Event names are literals unless they name a local
    Result<void> _subst_event(std::optional<Source<std::string>>& ev, const Env& env, const std::string& scope) {
        if (!ev) return Ok();
        if (auto name = std::get_if<std::string>(&*ev)) {
            if (env.count(*name) == 0) return Ok();
            Source<std::string> ref = KeyRef{*name};
            if (auto res = _subst(ref, env, scope); !res) return res;
            ev = ref;
            return Ok();
        }
        return _subst(*ev, env, scope);
    }

    Result<void> _subst_props(StyleProps& p, const Env& env, const std::string& scope) {
        if (p.width) {
            if (auto res = _subst(p.width->value, env, scope); !res) return res;
        }
        if (p.height) {
            if (auto res = _subst(p.height->value, env, scope); !res) return res;
        }
        if (auto res = _subst(p.color, env, scope); !res) return res;
        if (auto res = _subst(p.border_color, env, scope); !res) return res;
        if (auto res = _subst(p.offset_x, env, scope); !res) return res;
        if (auto res = _subst(p.offset_y, env, scope); !res) return res;
        return _subst(p.image, env, scope);
    }

    Result<void> _expand(const ElementNode& in, const Env& env, const std::string& scope, NodeList& out) {
        ElementNode node{in.id, in.style, {}};
        if (auto res = _subst(node.id, env, scope); !res) return res;
        if (auto res = _subst_props(node.style.base, env, scope); !res) return res;
        if (node.style.hovered) {
            if (auto res = _subst_props(*node.style.hovered, env, scope); !res) return res;
        }
        if (node.style.clicked) {
            if (auto res = _subst_props(*node.style.clicked, env, scope); !res) return res;
        }
        if (node.style.right_clicked) {
            if (auto res = _subst_props(*node.style.right_clicked, env, scope); !res) return res;
        }
        if (auto res = _subst_event(node.style.hover_event, env, scope); !res) return res;
        if (auto res = _subst_event(node.style.click_event, env, scope); !res) return res;
        if (auto res = _subst_event(node.style.right_click_event, env, scope); !res) return res;
        if (auto res = expand(in.children, env, scope, node.children); !res) return res;
        out.push_back(NodeTemplate{std::move(node)});
        return Ok();
    }

    Result<void> _expand(const TextNode& in, const Env& env, const std::string& scope, NodeList& out) {
        TextNode node = in;
        if (auto res = _subst(node.content, env, scope); !res) return res;
        if (auto res = _subst(node.style.color, env, scope); !res) return res;
        out.push_back(NodeTemplate{std::move(node)});
        return Ok();
    }

    Result<void> _expand(const ListNode& in, const Env& env, const std::string& scope, NodeList& out) {
        ListNode node{in.source_key, in.item_bindings, {}};

        auto local = _local(in.source_key, env, scope);
        if (!local) return std::unexpected(local.error());
        if (*local) {
            if (auto remote = std::get_if<KeyRef>(*local)) {
                node.source_key = remote->key;
            } else {
                node.source_key = std::get<std::string>(**local);
            }
        }

        // Item locals shadow reusable locals inside the body
        Env inner = env;
        for (const auto& [name, _] : in.item_bindings) {
            inner.erase(name);
        }
        if (auto res = expand(in.body, inner, scope, node.body); !res) return res;
        out.push_back(NodeTemplate{std::move(node)});
        return Ok();
    }

    Result<void> _expand(const ConditionalNode& in, const Env& env, const std::string& scope, NodeList& out) {
        ConditionalNode node{in.predicate, in.negate, {}};
        if (auto res = _subst(node.predicate, env, scope); !res) return res;
        if (auto res = expand(in.body, env, scope, node.body); !res) return res;
        out.push_back(NodeTemplate{std::move(node)});
        return Ok();
    }

    Result<void> _expand(const ComponentUseNode& in, const Env& env, const std::string& scope, NodeList& out) {
        const auto& def = _doc.reusables[_doc.reusable_index.at(in.reusable_name)];

        Env inner;
        for (const auto& [name, fallback] : def.params) {
            inner[name] = fallback ? std::optional<LocalValue>(*fallback) : std::nullopt;
        }
        for (const auto& [name, value] : in.locals) {
            // A use inside a reusable may forward one of its own locals
            if (auto ref = std::get_if<KeyRef>(&value)) {
                auto it = env.find(ref->key);
                if (it != env.end()) {
                    inner[name] = it->second;
                    continue;
                }
            }
            inner[name] = value;
        }

        ydebug("Expander: use '{}' with {} locals", def.name, inner.size());
        return expand(def.body, inner, def.name, out);
    }

    const ParsedDocument& _doc;
};

} // namespace

Result<ParsedDocument> Compiler::parse(const std::string& markup) {
    MarkupParser parser;
    return parser.run(markup);
}

Result<void> Compiler::validate(const ParsedDocument& doc) {
    auto check = [&](const NodeList& nodes, const std::string& owner) -> Result<void> {
        std::vector<std::string> uses;
        collect_uses(nodes, uses);
        for (const auto& u : uses) {
            if (!doc.reusable_index.count(u)) {
                return Err<void>(ErrorCode::UnknownReusable, owner + " uses unknown reusable '" + u + "'");
            }
        }
        return Ok();
    };

    for (const auto& page : doc.pages) {
        if (auto res = check(page.roots, "page '" + page.name + "'"); !res) return res;
    }
    for (const auto& def : doc.reusables) {
        if (auto res = check(def.body, "reusable '" + def.name + "'"); !res) return res;
    }

    CycleFinder finder(doc);
    return finder.run();
}

Result<TemplatePtr> Compiler::expand(const ParsedDocument& doc) {
    auto tmpl = std::make_shared<Template>();
    Expander expander(doc);
    for (const auto& page : doc.pages) {
        Page out{page.name, {}};
        if (auto res = expander.expand(page.roots, Env{}, page.name, out.roots); !res) {
            return Err<TemplatePtr>("Compiler: expanding page '" + page.name + "'", res);
        }
        tmpl->pages.push_back(std::move(out));
    }
    return TemplatePtr(std::move(tmpl));
}

Result<TemplatePtr> Compiler::compile(const std::string& markup) {
    auto doc = parse(markup);
    if (!doc) {
        return Err<TemplatePtr>("Compiler::compile: parse failed", doc);
    }
    if (auto res = validate(*doc); !res) {
        return Err<TemplatePtr>("Compiler::compile: validation failed", res);
    }
    auto tmpl = expand(*doc);
    if (!tmpl) {
        return tmpl;
    }
    spdlog::debug("Compiler: compiled {} page(s), {} reusable(s)", (*tmpl)->pages.size(), doc->reusables.size());
    return tmpl;
}

} // namespace lattice
