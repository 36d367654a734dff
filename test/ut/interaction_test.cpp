// Interaction state and event emitter unit tests
#include <boost/ut.hpp>
#include "lattice/markup/compiler.hpp"
#include "lattice/layout/solver.hpp"
#include "lattice/interaction/interaction_state.hpp"
#include "lattice/interaction/event_emitter.hpp"
#include "lattice/data_tree.hpp"
#include <algorithm>

using namespace boost::ut;
using namespace lattice;

namespace {

// Two side-by-side buttons, 100x40 each, the right one nested in a card
const char* BUTTONS = R"(
<page name="P">
  <element id="bar">
    <element-config><direction is="ltr"/></element-config>
    <element id="left">
      <element-config>
        <width-fixed at="100"/>
        <height-fixed at="40"/>
        <hovered emit="LeftHover"/>
        <clicked emit="LeftClick"/>
        <right-clicked emit="LeftMenu"/>
      </element-config>
    </element>
    <element id="card">
      <element-config><padding-all is="0"/></element-config>
      <element id="right">
        <element-config>
          <width-fixed at="100"/>
          <height-fixed at="40"/>
          <clicked emit="RightClick"/>
        </element-config>
      </element>
    </element>
    %EXTRA%
  </element>
</page>
)";

LayoutTree layout(const std::string& extra = "", const std::string& yaml = "{}") {
    static MonospaceTextMeasurer measurer;

    std::string markup = BUTTONS;
    markup.replace(markup.find("%EXTRA%"), 7, extra);

    auto tmpl = Compiler::compile(markup);
    expect(tmpl.has_value()) << error_msg(tmpl);
    if (!tmpl) return {};
    auto ctx = TreeBindingContext::from_string(yaml);
    if (!ctx) return {};

    Solver solver(measurer);
    return solver.solve(**tmpl, **ctx, {800, 600});
}

PointerState at(float x, float y, bool down = false) {
    PointerState p;
    p.position = {x, y};
    p.buttons = down ? PointerState::LeftButton : 0;
    return p;
}

PointerState right_at(float x, float y) {
    PointerState p;
    p.position = {x, y};
    p.buttons = PointerState::RightButton;
    return p;
}

bool contains(const std::vector<std::string>& ids, const std::string& id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

size_t hovered_count(const InteractionState& state) {
    size_t n = 0;
    for (const auto& [id, st] : state.entries()) {
        if (st.hovered) ++n;
    }
    return n;
}

// Records events; optionally fails on a given name
class RecordingSink : public EventSink {
public:
    explicit RecordingSink(std::string fail_on = "") : _fail_on(std::move(fail_on)) {}

    Result<void> on_event(const UiEvent& event) override {
        if (event.name == _fail_on) {
            return Err<void>("sink refused " + event.name);
        }
        events.push_back(event);
        return Ok();
    }

    std::vector<UiEvent> events;

private:
    std::string _fail_on;
};

} // namespace

suite interaction_state_tests = [] {
    "entries_for_every_element"_test = [] {
        auto tree = layout();
        InteractionState state;
        state.update(tree, at(-10, -10));
        expect(state.size() == 4_ul) << "bar, left, card, right";
        expect(hovered_count(state) == 0_ul);
    };

    "hover_is_exclusive_and_deepest"_test = [] {
        auto tree = layout();
        InteractionState state;

        for (auto p : {at(10, 10), at(150, 10), at(199, 39), at(500, 500)}) {
            state.update(tree, p);
            expect(hovered_count(state) <= 1_ul);
        }

        state.update(tree, at(150, 10));
        expect(state.state("#right").hovered) << "innermost node wins";
        expect(!state.state("#card").hovered);
        expect(!state.state("#bar").hovered);
        expect(state.hovered_id() == "#right");
    };

    "hover_transitions"_test = [] {
        auto tree = layout();
        InteractionState state;

        auto d1 = state.update(tree, at(10, 10));
        expect(d1.hover_entered == std::vector<std::string>{"#left"});
        expect(d1.hover_left.empty());

        auto d2 = state.update(tree, at(12, 12));
        expect(d2.hover_entered.empty()) << "no repeat while staying";

        auto d3 = state.update(tree, at(150, 10));
        expect(d3.hover_entered == std::vector<std::string>{"#right"});
        expect(d3.hover_left == std::vector<std::string>{"#left"});
    };

    "click_lifecycle"_test = [] {
        auto tree = layout();
        InteractionState state;

        state.update(tree, at(10, 10));
        auto press = state.update(tree, at(10, 10, true));
        expect(press.pressed == std::vector<std::string>{"#left"});
        expect(state.state("#left").clicked);

        auto hold = state.update(tree, at(20, 20, true));
        expect(hold.pressed.empty()) << "held button does not press again";
        expect(state.state("#left").clicked);

        auto release = state.update(tree, at(20, 20, false));
        expect(release.released == std::vector<std::string>{"#left"});
        expect(!state.state("#left").clicked);
    };

    "leaving_while_held_releases"_test = [] {
        auto tree = layout();
        InteractionState state;

        state.update(tree, at(10, 10, true));
        expect(state.state("#left").clicked);

        auto moved = state.update(tree, at(150, 10, true));
        expect(contains(moved.released, "#left"));
        expect(!state.state("#right").clicked) << "dragging onto a node is not a press";
    };

    "only_hovered_node_clicks"_test = [] {
        auto tree = layout();
        InteractionState state;
        state.update(tree, at(150, 10, true));
        int clicked = 0;
        for (const auto& [id, st] : state.entries()) {
            if (st.clicked) ++clicked;
        }
        expect(clicked == 1_i);
        expect(state.state("#right").clicked);
    };

    "right_button_has_its_own_press_edge"_test = [] {
        auto tree = layout();
        InteractionState state;

        state.update(tree, at(10, 10));
        auto press = state.update(tree, right_at(10, 10));
        expect(press.right_pressed == std::vector<std::string>{"#left"});
        expect(press.pressed.empty()) << "right button does not left-click";
        expect(state.state("#left").right_clicked);
        expect(!state.state("#left").clicked);

        auto hold = state.update(tree, right_at(12, 12));
        expect(hold.right_pressed.empty());

        auto release = state.update(tree, at(12, 12));
        expect(release.right_released == std::vector<std::string>{"#left"});
        expect(!state.state("#left").right_clicked);
    };

    "absent_ids_are_pruned"_test = [] {
        InteractionState state;
        auto with_extra = layout(R"(<element id="extra" if="show"/>)", "show: true");
        state.update(with_extra, at(0, 0));
        expect(state.entries().count("#extra") == 1_ul);

        auto without = layout(R"(<element id="extra" if="show"/>)", "show: false");
        auto delta = state.update(without, at(0, 0));
        expect(state.entries().count("#extra") == 0_ul);
        expect(contains(delta.pruned, "#extra"));
        expect(state.state("#extra") == ElementState{});
    };

    "pass_through_float_is_not_hovered"_test = [] {
        auto tree = layout(R"(
<element id="overlay">
  <element-config>
    <floating/>
    <floating-attach-to-root/>
    <floating-capture-pointer state="false"/>
    <width-fixed at="300"/>
    <height-fixed at="300"/>
  </element-config>
</element>
)");
        InteractionState state;
        state.update(tree, at(10, 10));
        expect(state.state("#left").hovered);
        expect(!state.state("#overlay").hovered);
        expect(state.entries().count("#overlay") == 1_ul);
    };
};

suite event_emitter_tests = [] {
    "click_and_hover_events"_test = [] {
        auto tree = layout();
        InteractionState state;
        RecordingSink sink;

        auto hover = state.update(tree, at(10, 10));
        auto n1 = EventEmitter::emit(tree, hover, sink);
        expect(n1.has_value() && *n1 == 1u);

        auto press = state.update(tree, at(10, 10, true));
        auto n2 = EventEmitter::emit(tree, press, sink);
        expect(n2.has_value() && *n2 == 1u);

        expect(sink.events.size() == 2_ul);
        if (sink.events.size() != 2) return;
        expect(sink.events[0] == UiEvent{EventKind::Hover, "LeftHover", "#left"});
        expect(sink.events[1] == UiEvent{EventKind::Click, "LeftClick", "#left"});
    };

    "no_event_without_name"_test = [] {
        auto tree = layout();
        InteractionState state;
        RecordingSink sink;

        // #right declares no hover event
        auto delta = state.update(tree, at(150, 10));
        auto n = EventEmitter::emit(tree, delta, sink);
        expect(n.has_value() && *n == 0u);
        expect(sink.events.empty());
    };

    "enter_and_press_in_one_frame_emits_once"_test = [] {
        auto tree = layout();
        InteractionState state;
        RecordingSink sink;

        // Pointer arrives with the button already down: hover_entered and pressed together
        auto delta = state.update(tree, at(10, 10, true));
        expect(delta.hover_entered == std::vector<std::string>{"#left"});
        expect(delta.pressed == std::vector<std::string>{"#left"});

        auto n = EventEmitter::emit(tree, delta, sink);
        expect(n.has_value() && *n == 1u);
        expect(sink.events.size() == 1_ul);
        if (sink.events.empty()) return;
        expect(sink.events[0] == UiEvent{EventKind::Click, "LeftClick", "#left"}) << "click wins over hover";
    };

    "right_click_event"_test = [] {
        auto tree = layout();
        InteractionState state;
        RecordingSink sink;

        state.update(tree, at(10, 10));
        auto delta = state.update(tree, right_at(10, 10));
        auto n = EventEmitter::emit(tree, delta, sink);
        expect(n.has_value() && *n == 1u);
        if (sink.events.size() != 1) return;
        expect(sink.events[0] == UiEvent{EventKind::RightClick, "LeftMenu", "#left"});
    };

    "both_buttons_in_one_frame_emit_once"_test = [] {
        auto tree = layout();
        InteractionState state;
        RecordingSink sink;

        state.update(tree, at(10, 10));
        PointerState both = at(10, 10, true);
        both.buttons |= PointerState::RightButton;
        auto delta = state.update(tree, both);
        expect(delta.pressed.size() == 1_ul);
        expect(delta.right_pressed.size() == 1_ul);

        auto n = EventEmitter::emit(tree, delta, sink);
        expect(n.has_value() && *n == 1u);
        if (sink.events.size() != 1) return;
        expect(sink.events[0].kind == EventKind::Click);
    };

    "duplicate_ids_in_delta_emit_once"_test = [] {
        auto tree = layout();
        RecordingSink sink;
        InteractionDelta delta;
        delta.pressed = {"#left", "#left"};
        delta.hover_entered = {"#left"};
        auto n = EventEmitter::emit(tree, delta, sink);
        expect(n.has_value() && *n == 1u);
    };

    "absent_elements_emit_nothing"_test = [] {
        auto tree = layout();
        RecordingSink sink;
        InteractionDelta delta;
        delta.pressed = {"#gone"};
        auto n = EventEmitter::emit(tree, delta, sink);
        expect(n.has_value() && *n == 0u);
    };

    "sink_failure_is_returned"_test = [] {
        auto tree = layout();
        InteractionState state;
        RecordingSink sink("LeftClick");

        state.update(tree, at(10, 10));
        auto delta = state.update(tree, at(10, 10, true));
        auto res = EventEmitter::emit(tree, delta, sink);
        expect(!res.has_value());
        expect(error_code(res) == ErrorCode::SinkFailed) << error_msg(res);
        if (res) return;
        expect(res.error().root_cause().message() == "sink refused LeftClick") << "sink error stays in the chain";
    };
};

int main() { return 0; }
