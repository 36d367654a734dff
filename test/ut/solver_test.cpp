// Layout solver unit tests
#include <boost/ut.hpp>
#include "lattice/markup/compiler.hpp"
#include "lattice/layout/solver.hpp"
#include "lattice/data_tree.hpp"
#include <cmath>

using namespace boost::ut;
using namespace lattice;

namespace {

bool near(float a, float b) {
    return std::abs(a - b) < 0.001f;
}

struct SolveOptions {
    std::string yaml = "{}";
    Size viewport{800.0f, 600.0f};
    Diagnostics* diagnostics = nullptr;
    const InteractionView* interaction = nullptr;
    ScrollOffsets scroll;
    std::string page;
};

LayoutTree solve(const std::string& markup, const SolveOptions& opts = {}) {
    static MonospaceTextMeasurer measurer;

    auto tmpl = Compiler::compile(markup);
    expect(tmpl.has_value()) << "compile failed: " << error_msg(tmpl);
    if (!tmpl) return {};

    auto ctx = TreeBindingContext::from_string(opts.yaml);
    expect(ctx.has_value()) << "bindings failed: " << error_msg(ctx);
    if (!ctx) return {};

    Solver solver(measurer, TextConfig{}, opts.diagnostics);
    return solver.solve(**tmpl, **ctx, opts.viewport, opts.interaction, opts.page, opts.scroll);
}

Rect rect_of(const LayoutTree& tree, const std::string& id) {
    auto node = tree.find(id);
    expect(node != nullptr) << "missing node " << id;
    return node ? node->rect : Rect{};
}

// Hovers a fixed set of ids
class FakeView : public InteractionView {
public:
    explicit FakeView(std::map<std::string, ElementState> states) : _states(std::move(states)) {}

    ElementState state(const std::string& id) const override {
        auto it = _states.find(id);
        return it == _states.end() ? ElementState{} : it->second;
    }

private:
    std::map<std::string, ElementState> _states;
};

const char* DASHBOARD = R"(
<page name="Main">
  <element id="root">
    <element-config>
      <width-grow/>
      <height-grow/>
      <padding-all is="16"/>
      <child-gap is="16"/>
      <direction is="ttb"/>
    </element-config>
    <element id="header">
      <element-config>
        <width-grow/>
        <height-fixed at="60"/>
      </element-config>
    </element>
    <element id="body">
      <element-config>
        <width-grow/>
        <height-grow/>
      </element-config>
    </element>
  </element>
</page>
)";

const char* DOCUMENT_LIST = R"(
<page name="Main">
  <element id="list">
    <element-config>
      <grow/>
    </element-config>
    <list src="Documents">
      <get-text local="title" from="name"/>
      <element>
        <element-config>
          <width-grow/>
          <height-fixed at="30"/>
          <clicked emit="Clicked"/>
        </element-config>
        <text-element><dyn-content from="title"/></text-element>
      </element>
    </list>
  </element>
</page>
)";

const char* THREE_DOCUMENTS = R"(
Documents:
  - name: Alpha
  - name: Beta
  - name: Gamma
)";

const char* FLOATING_TEMPLATE = R"(
<page name="P">
  <element id="outer">
    <element-config>
      <padding-left is="100"/>
      <padding-top is="50"/>
    </element-config>
    <element id="parent">
      <element-config>
        <width-fixed at="40"/>
        <height-fixed at="40"/>
      </element-config>
      <element id="tip">
        <element-config>
          <floating/>
          <floating-offset x="0" y="35"/>
          %ATTACH%
        </element-config>
        <text-element>Hi</text-element>
      </element>
    </element>
  </element>
</page>
)";

std::string floating_markup(const std::string& attach) {
    std::string markup = FLOATING_TEMPLATE;
    markup.replace(markup.find("%ATTACH%"), 8, attach);
    return markup;
}

} // namespace

suite solver_sizing_tests = [] {
    "fixed_sizes_ignore_viewport"_test = [] {
        const char* markup = R"(
<page name="P">
  <element id="outer">
    <element-config>
      <width-fixed at="300"/>
      <height-fixed at="200"/>
      <padding-all is="10"/>
      <child-gap is="5"/>
    </element-config>
    <element id="a"><element-config><width-fixed at="100"/><height-fixed at="50"/></element-config></element>
    <element id="b"><element-config><width-fixed at="120"/><height-fixed at="40"/></element-config></element>
  </element>
</page>
)";
        for (Size viewport : {Size{800, 600}, Size{50, 30}, Size{0, 0}}) {
            SolveOptions opts;
            opts.viewport = viewport;
            auto tree = solve(markup, opts);

            auto outer = rect_of(tree, "#outer");
            auto a = rect_of(tree, "#a");
            auto b = rect_of(tree, "#b");
            expect(outer.width == 300.0_f && outer.height == 200.0_f);
            expect(a.width == 100.0_f && a.height == 50.0_f);
            expect(b.width == 120.0_f && b.height == 40.0_f);
        }
    };

    "grow_children_fill_main_axis"_test = [] {
        auto tree = solve(R"(
<page name="P">
  <element id="row">
    <element-config>
      <width-fixed at="500"/>
      <height-fixed at="100"/>
      <padding-all is="10"/>
      <child-gap is="5"/>
      <direction is="ltr"/>
    </element-config>
    <element id="fixed"><element-config><width-fixed at="50"/></element-config></element>
    <element id="g1"><element-config><width-grow/></element-config></element>
    <element id="g2">
      <element-config><width-grow/></element-config>
      <text-element>abc</text-element>
    </element>
  </element>
</page>
)");
        float sum = rect_of(tree, "#fixed").width + rect_of(tree, "#g1").width + rect_of(tree, "#g2").width;
        expect(near(sum, 500.0f - 2 * 10.0f - 2 * 5.0f)) << "sum was " << sum;

        // Equal shares of the leftover on top of each intrinsic width
        expect(near(rect_of(tree, "#g1").width, 198.0f));
        expect(near(rect_of(tree, "#g2").width, 222.0f));
        expect(rect_of(tree, "#fixed").width == 50.0_f);
    };

    "grow_without_space_is_zero"_test = [] {
        auto tree = solve(R"(
<page name="P">
  <element id="row">
    <element-config><width-fixed at="100"/><height-fixed at="20"/><direction is="ltr"/></element-config>
    <element id="wide"><element-config><width-fixed at="120"/></element-config></element>
    <element id="g"><element-config><width-grow/></element-config></element>
  </element>
</page>
)");
        expect(rect_of(tree, "#g").width == 0.0_f) << "never negative";
        expect(rect_of(tree, "#wide").width == 120.0_f) << "fixed children are not shrunk";
    };

    "grow_respects_max"_test = [] {
        auto tree = solve(R"(
<page name="P">
  <element>
    <element-config><width-fixed at="500"/><direction is="ltr"/></element-config>
    <element id="capped"><element-config><width-grow max="100"/></element-config></element>
    <element id="free"><element-config><width-grow/></element-config></element>
  </element>
</page>
)");
        expect(near(rect_of(tree, "#capped").width, 100.0f));
        expect(near(rect_of(tree, "#free").width, 400.0f));
    };

    "fit_children_shrink_on_overflow"_test = [] {
        auto tree = solve(R"(
<page name="P">
  <element>
    <element-config><width-fixed at="100"/><direction is="ltr"/></element-config>
    <element id="left">
      <element-config><width-fit/></element-config>
      <element><element-config><width-fixed at="80"/></element-config></element>
    </element>
    <element id="right">
      <element-config><width-fit/></element-config>
      <element><element-config><width-fixed at="80"/></element-config></element>
    </element>
  </element>
</page>
)");
        expect(near(rect_of(tree, "#left").width, 50.0f));
        expect(near(rect_of(tree, "#right").width, 50.0f));
    };

    "percent_of_parent"_test = [] {
        auto tree = solve(R"(
<page name="P">
  <element>
    <element-config><width-fixed at="200"/><height-fixed at="80"/><direction is="ltr"/></element-config>
    <element id="quarter"><element-config><width-percent at="0.25"/><height-percent at="0.5"/></element-config></element>
  </element>
</page>
)");
        expect(near(rect_of(tree, "#quarter").width, 50.0f));
        expect(near(rect_of(tree, "#quarter").height, 40.0f));
    };

    "empty_container_is_padding_only"_test = [] {
        auto tree = solve(R"(<page name="P"><element id="pad"><element-config><padding-all is="10"/></element-config></element></page>)");
        auto r = rect_of(tree, "#pad");
        expect(r.width == 20.0_f && r.height == 20.0_f);
    };

    "negative_inputs_clamp_to_zero"_test = [] {
        auto tree = solve(R"(
<page name="P">
  <element id="neg">
    <element-config><padding-all is="-5"/><width-fixed at="-30"/></element-config>
  </element>
</page>
)");
        auto r = rect_of(tree, "#neg");
        expect(r.width == 0.0_f && r.height == 0.0_f);
    };

    "text_is_measured"_test = [] {
        auto tree = solve(R"(<page name="P"><element id="box"><text-element>four</text-element></element></page>)");
        auto r = rect_of(tree, "#box");
        expect(near(r.width, 4 * 16 * 0.5f));
        expect(near(r.height, 16 * 1.2f));
    };
};

suite solver_scenario_tests = [] {
    "header_and_body"_test = [] {
        auto tree = solve(DASHBOARD);
        auto header = rect_of(tree, "#header");
        auto body = rect_of(tree, "#body");

        expect(header.height == 60.0_f);
        expect(near(body.height, 600.0f - 2 * 16.0f - 16.0f - 60.0f)) << "body height " << body.height;
        expect(near(body.height, 492.0f));
        expect(near(header.y, 16.0f));
        expect(near(body.y, 92.0f));
        expect(near(header.width, 768.0f));
        expect(near(rect_of(tree, "#root").height, 600.0f));
    };

    "idempotent"_test = [] {
        SolveOptions opts;
        opts.yaml = THREE_DOCUMENTS;
        auto first = solve(DOCUMENT_LIST, opts);
        auto second = solve(DOCUMENT_LIST, opts);

        expect(first.size() == second.size());
        if (first.size() != second.size()) return;
        for (size_t i = 0; i < first.size(); ++i) {
            expect(first.nodes()[i].id == second.nodes()[i].id);
            expect(first.nodes()[i].rect == second.nodes()[i].rect) << "rect differs at " << first.nodes()[i].id;
        }
    };

    "list_with_items"_test = [] {
        SolveOptions opts;
        opts.yaml = THREE_DOCUMENTS;
        auto tree = solve(DOCUMENT_LIST, opts);

        auto list = tree.find("#list");
        expect(list != nullptr);
        if (!list) return;
        expect(list->children.size() == 3_ul) << "one body per item";

        std::vector<std::string> titles;
        for (int c : list->children) {
            const auto& item = tree.nodes()[c];
            expect(item.children.size() == 1_ul);
            if (item.children.empty()) continue;
            titles.push_back(tree.nodes()[item.children[0]].text);
        }
        expect(titles == std::vector<std::string>{"Alpha", "Beta", "Gamma"}) << "source order";

        expect(tree.find("0.0[0].0") != nullptr);
        expect(tree.find("0.0[1].0") != nullptr);
        expect(tree.find("0.0[2].0") != nullptr);
        expect(near(rect_of(tree, "0.0[1].0").y, 30.0f));
        expect(tree.find("0.0[1].0")->click_event == std::optional<std::string>("Clicked"));
    };

    "list_with_no_items"_test = [] {
        SolveOptions opts;
        opts.yaml = "Documents: []";
        auto tree = solve(DOCUMENT_LIST, opts);
        auto list = tree.find("#list");
        expect(list != nullptr);
        if (!list) return;
        expect(list->children.empty());
        expect(tree.size() == 1_ul);
    };

    "false_conditional_is_absent"_test = [] {
        SolveOptions opts;
        opts.yaml = "show: false";
        auto tree = solve(R"(
<page name="P">
  <element id="root">
    <element id="shown" if-not="show"/>
    <element id="hidden" if="show">
      <element id="inner"/>
    </element>
  </element>
</page>
)", opts);
        expect(tree.find("#shown") != nullptr);
        expect(tree.find("#hidden") == nullptr);
        expect(tree.find("#inner") == nullptr);
        expect(tree.size() == 2_ul);
        expect(tree.find("#root")->children.size() == 1_ul);
    };

    "conditional_keeps_position_id"_test = [] {
        SolveOptions opts;
        opts.yaml = "show: true";
        auto tree = solve(R"(<page name="P"><element/><element if="show"/></page>)", opts);
        expect(tree.find("1") != nullptr) << "a wrapped node keeps its own path";
    };
};

suite solver_floating_tests = [] {
    "floating_offset_from_parent"_test = [] {
        auto tree = solve(floating_markup(""));
        auto parent = rect_of(tree, "#parent");
        expect(parent == Rect{100, 50, 40, 40});

        auto tip = rect_of(tree, "#tip");
        expect(near(tip.x, 100.0f)) << "x " << tip.x;
        expect(near(tip.y, 85.0f)) << "y " << tip.y;
        expect(near(tip.width, 16.0f)) << "intrinsic width";
        expect(near(tip.height, 19.2f)) << "intrinsic height";
    };

    "floating_does_not_size_parent"_test = [] {
        auto tree = solve(floating_markup(""));
        auto outer = rect_of(tree, "#outer");
        expect(outer.width == 140.0_f && outer.height == 90.0_f);
    };

    "floating_element_corner"_test = [] {
        auto tree = solve(floating_markup(R"(<floating-attach-element at="bottom-right"/>)"));
        auto tip = rect_of(tree, "#tip");
        expect(near(tip.right(), 100.0f));
        expect(near(tip.bottom(), 85.0f));
    };

    "floating_size_expands_around_children"_test = [] {
        auto tree = solve(floating_markup(R"(<floating-size width="4" height="2"/>)"));
        auto tip = tree.find("#tip");
        expect(tip != nullptr);
        if (!tip || tip->children.empty()) return;
        expect(near(tip->rect.x, 96.0f)) << "x " << tip->rect.x;
        expect(near(tip->rect.y, 83.0f)) << "y " << tip->rect.y;
        expect(near(tip->rect.width, 24.0f));
        expect(near(tip->rect.height, 23.2f));

        const auto& text = tree.nodes()[tip->children[0]];
        expect(near(text.rect.x, 100.0f)) << "children keep the unexpanded position";
        expect(near(text.rect.y, 85.0f));
    };

    "floating_parent_corner"_test = [] {
        auto tree = solve(floating_markup(R"(<floating-attach-to-parent at="bottom-right"/>)"));
        auto tip = rect_of(tree, "#tip");
        expect(near(tip.x, 140.0f));
        expect(near(tip.y, 125.0f));
    };

    "floating_attach_to_element"_test = [] {
        auto tree = solve(R"(
<page name="P">
  <element id="anchor"><element-config><width-fixed at="30"/><height-fixed at="30"/></element-config></element>
  <element id="other">
    <element id="pop">
      <element-config>
        <floating/>
        <floating-attach-to-element id="anchor"/>
        <floating-attach-to-parent at="bottom-left"/>
        <width-fixed at="10"/>
        <height-fixed at="10"/>
      </element-config>
    </element>
  </element>
</page>
)");
        auto pop = rect_of(tree, "#pop");
        expect(near(pop.x, 0.0f) && near(pop.y, 30.0f));
    };

    "floating_draw_order_and_hit_test"_test = [] {
        const char* markup = R"(
<page name="P">
  <element id="base">
    <element-config><width-fixed at="200"/><height-fixed at="200"/></element-config>
    <element id="high">
      <element-config><floating/><floating-attach-to-root/><floating-z-index z="5"/><width-fixed at="50"/><height-fixed at="50"/></element-config>
    </element>
    <element id="low">
      <element-config><floating/><floating-attach-to-root/><floating-z-index z="1"/><width-fixed at="50"/><height-fixed at="50"/></element-config>
    </element>
    <element id="tie">
      <element-config><floating/><floating-attach-to-root/><floating-z-index z="5"/><width-fixed at="50"/><height-fixed at="50"/>%CAPTURE%</element-config>
    </element>
  </element>
</page>
)";
        std::string capturing = markup;
        capturing.replace(capturing.find("%CAPTURE%"), 9, "");
        auto tree = solve(capturing);

        std::vector<std::string> order;
        for (int i : tree.draw_order()) {
            order.push_back(tree.nodes()[i].id);
        }
        expect(order == std::vector<std::string>{"#base", "#low", "#high", "#tie"}) << "z order, declaration order on ties";

        auto hit = tree.hit_test({10, 10});
        expect(hit != nullptr && hit->id == "#tie");

        std::string passing = markup;
        passing.replace(passing.find("%CAPTURE%"), 9, R"(<floating-capture-pointer state="false"/>)");
        auto pass_tree = solve(passing);
        auto pass_hit = pass_tree.hit_test({10, 10});
        expect(pass_hit != nullptr && pass_hit->id == "#high") << "pass-through floats are not hit";
    };
};

suite solver_flow_tests = [] {
    "alignment"_test = [] {
        auto tree = solve(R"(
<page name="P">
  <element>
    <element-config>
      <width-fixed at="200"/>
      <height-fixed at="100"/>
      <direction is="ltr"/>
      <align-children-x to="center"/>
      <align-children-y to="bottom"/>
    </element-config>
    <element id="c"><element-config><width-fixed at="50"/><height-fixed at="20"/></element-config></element>
  </element>
</page>
)");
        auto c = rect_of(tree, "#c");
        expect(near(c.x, 75.0f));
        expect(near(c.y, 80.0f));
    };

    "scroll_offsets_shift_without_resizing"_test = [] {
        const char* markup = R"(
<page name="P">
  <element id="scroller">
    <element-config>
      <width-fixed at="100"/>
      <height-fixed at="100"/>
      <scroll vertical="true"/>
    </element-config>
    <element id="a"><element-config><width-grow/><height-fixed at="50"/></element-config></element>
    <element id="b"><element-config><width-grow/><height-fixed at="50"/></element-config></element>
    <element id="c"><element-config><width-grow/><height-fixed at="50"/></element-config></element>
  </element>
</page>
)";
        auto still = solve(markup);
        SolveOptions opts;
        opts.scroll["#scroller"] = Vec2{0.0f, 30.0f};
        auto scrolled = solve(markup, opts);

        expect(near(rect_of(still, "#a").y, 0.0f));
        expect(near(rect_of(scrolled, "#a").y, -30.0f));
        expect(near(rect_of(scrolled, "#c").y, 70.0f));
        for (const char* id : {"#scroller", "#a", "#b", "#c"}) {
            expect(rect_of(still, id).width == rect_of(scrolled, id).width);
            expect(rect_of(still, id).height == rect_of(scrolled, id).height);
        }

        auto a = scrolled.find("#a");
        expect(a != nullptr && a->clip.has_value());
        if (a && a->clip) {
            expect(*a->clip == Rect{0, 0, 100, 100}) << "children clip to the container";
        }
        expect(scrolled.hit_test({50, 110}) == nullptr) << "clipped content is not hit";
    };

    "static_and_dynamic_ids"_test = [] {
        Diagnostics diagnostics;
        SolveOptions opts;
        opts.diagnostics = &diagnostics;
        opts.yaml = R"(
Documents:
  - key: first
  - key: second
)";
        auto tree = solve(R"(
<page name="P">
  <element id="dup"/>
  <element id="dup"/>
  <list src="Documents">
    <get-text local="key" from="key"/>
    <element><element-config><id from="key"/></element-config></element>
  </list>
</page>
)", opts);
        expect(tree.find("#dup") != nullptr);
        expect(tree.find("#dup@1") != nullptr) << "duplicate ids are made unique";
        expect(tree.find("#first[0]") != nullptr);
        expect(tree.find("#second[1]") != nullptr);
        expect(diagnostics.size() == 1_ul);
    };
};

suite solver_binding_tests = [] {
    "bindings_fall_back_with_diagnostics"_test = [] {
        Diagnostics diagnostics;
        SolveOptions opts;
        opts.diagnostics = &diagnostics;
        auto tree = solve(R"(
<page name="P">
  <element id="box">
    <element-config><dyn-color from="missing_color"/></element-config>
    <text-element><dyn-content from="missing_text"/></text-element>
    <list src="missing_list"><element/></list>
    <element id="maybe" if="missing_flag"/>
  </element>
</page>
)", opts);
        auto box = tree.find("#box");
        expect(box != nullptr);
        if (!box) return;
        expect(box->paint.color.transparent());
        expect(box->children.size() == 1_ul) << "only the text node remains";
        if (box->children.size() == 1) {
            expect(tree.nodes()[box->children[0]].text.empty());
        }
        expect(tree.find("#maybe") == nullptr);
        expect(diagnostics.count(ErrorCode::UnboundKey) == 4_ul);
    };

    "bound_values_flow_through"_test = [] {
        SolveOptions opts;
        opts.yaml = R"(
accent: "#00ff00"
size: 42
label: Hello
)";
        auto tree = solve(R"(
<page name="P">
  <element id="box">
    <element-config><dyn-color from="accent"/><width-fixed from="size"/></element-config>
    <text-element><dyn-content from="label"/></text-element>
  </element>
</page>
)", opts);
        auto box = tree.find("#box");
        expect(box != nullptr);
        if (!box) return;
        expect(box->paint.color == Color::rgba(0, 255, 0));
        expect(box->rect.width == 42.0_f);
        expect(tree.nodes()[box->children[0]].text == "Hello");
    };

    "interaction_variants_apply"_test = [] {
        const char* markup = R"(
<page name="P">
  <element id="btn">
    <element-config>
      <color is="gray"/>
      <hovered><color is="white"/></hovered>
      <clicked><color is="blue"/><border-color is="red"/><border-all is="2"/></clicked>
    </element-config>
  </element>
</page>
)";
        FakeView idle(std::map<std::string, ElementState>{});
        FakeView hovered({{"#btn", {true, false}}});
        FakeView clicked({{"#btn", {true, true}}});

        SolveOptions opts;
        opts.interaction = &idle;
        expect(solve(markup, opts).find("#btn")->paint.color == Color::rgba(128, 128, 128));
        opts.interaction = &hovered;
        expect(solve(markup, opts).find("#btn")->paint.color == Color::rgba(255, 255, 255));
        opts.interaction = &clicked;
        auto tree = solve(markup, opts);
        expect(tree.find("#btn")->paint.color == Color::rgba(0, 0, 255)) << "clicked overrides hovered";
        expect(tree.find("#btn")->paint.border.top == 2.0_f);
    };

    "right_clicked_variant_applies_last"_test = [] {
        const char* markup = R"(
<page name="P">
  <element id="row">
    <element-config>
      <color is="gray"/>
      <clicked><color is="blue"/></clicked>
      <right-clicked emit="RowMenu"><color is="orange"/></right-clicked>
    </element-config>
  </element>
</page>
)";
        FakeView right({{"#row", {true, false, true}}});
        FakeView both({{"#row", {true, true, true}}});

        SolveOptions opts;
        opts.interaction = &right;
        auto tree = solve(markup, opts);
        auto row = tree.find("#row");
        expect(row != nullptr);
        if (!row) return;
        expect(row->paint.color == Color::rgba(255, 165, 0));
        expect(row->right_click_event == std::optional<std::string>("RowMenu"));
        expect(!row->click_event.has_value());

        opts.interaction = &both;
        expect(solve(markup, opts).find("#row")->paint.color == Color::rgba(255, 165, 0));
    };

    "repeated_fallback_is_recorded_once"_test = [] {
        static MonospaceTextMeasurer measurer;
        auto tmpl = Compiler::compile(R"(<page name="P"><element id="box"><element-config><dyn-color from="missing"/></element-config></element></page>)");
        auto ctx = TreeBindingContext::from_string("{}");
        expect(tmpl.has_value() && ctx.has_value());
        if (!tmpl || !ctx) return;

        Diagnostics diagnostics;
        Solver solver(measurer, TextConfig{}, &diagnostics);
        for (int frame = 0; frame < 5; ++frame) {
            auto tree = solver.solve(**tmpl, **ctx, {800, 600});
            expect(tree.find("#box") != nullptr);
        }
        expect(diagnostics.size() == 1_ul) << "one entry for the same fallback across frames";

        solver.clear_reported();
        solver.solve(**tmpl, **ctx, {800, 600});
        expect(diagnostics.size() == 2_ul);
    };

    "unknown_page_falls_back"_test = [] {
        Diagnostics diagnostics;
        SolveOptions opts;
        opts.diagnostics = &diagnostics;
        opts.page = "Nowhere";
        auto tree = solve(R"(<layout><page name="A"><element id="a"/></page><page name="B"><element id="b"/></page></layout>)", opts);
        expect(tree.page() == "A");
        expect(tree.find("#a") != nullptr);
        expect(diagnostics.size() == 1_ul);
        expect(diagnostics.count(ErrorCode::UnboundKey) == 1_ul);

        SolveOptions second;
        second.page = "B";
        expect(solve(R"(<layout><page name="A"><element id="a"/></page><page name="B"><element id="b"/></page></layout>)", second).find("#b") != nullptr);
    };
};

suite render_command_tests = [] {
    "commands_follow_draw_order"_test = [] {
        auto tree = solve(R"(
<page name="P">
  <element id="panel">
    <element-config>
      <padding-all is="4"/>
      <color is="#202020"/>
      <border-color is="white"/>
      <border-all is="1"/>
    </element-config>
    <text-element>ok</text-element>
    <element id="pic"><element-config><image src="logo.png"/><width-fixed at="8"/><height-fixed at="8"/></element-config></element>
  </element>
</page>
)");
        auto commands = tree.render_commands();
        expect(commands.size() == 4_ul);
        if (commands.size() != 4) return;
        expect(commands[0].type == RenderCommandType::Rectangle && commands[0].id == "#panel");
        expect(commands[1].type == RenderCommandType::Border && commands[1].border.left == 1.0f);
        expect(commands[2].type == RenderCommandType::Text && commands[2].text == "ok");
        expect(commands[3].type == RenderCommandType::Image && commands[3].image == "logo.png");
    };

    "transparent_elements_emit_nothing"_test = [] {
        auto tree = solve(R"(<page name="P"><element><element/></element></page>)");
        expect(tree.render_commands().empty());
    };
};

int main() { return 0; }
