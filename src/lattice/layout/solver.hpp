#pragma once

#include "layout_tree.hpp"
#include "text_measure.hpp"
#include "../binding.hpp"
#include "../config.hpp"
#include "../diagnostics.hpp"
#include "../interaction/interaction_view.hpp"
#include "../markup/node.hpp"
#include <map>
#include <set>
#include <string>

namespace lattice {

// Host-owned scroll positions keyed by the scroll container's id
// A positive offset moves content up / left
using ScrollOffsets = std::map<std::string, Vec2>;

// Pure function of (template, bindings, viewport, interaction view) -> LayoutTree
//
// Passes: build boxes (conditionals, lists, ids, active style variant),
// intrinsic sizes (post-order), grow/shrink distribution (pre-order),
// flow positioning with alignment and scroll offsets, then floating
// placement in FIFO order once all flow geometry is final.
//
// Binding failures fall back to empty / false / 0 / transparent values and
// are recorded in the diagnostics buffer when one is supplied. A fallback is
// recorded the first frame it occurs; repeats are only logged at debug level.
class Solver {
public:
    Solver(const TextMeasurer& measurer, TextConfig text = {}, Diagnostics* diagnostics = nullptr)
        : _measurer(measurer), _text(text), _diagnostics(diagnostics) {}

    LayoutTree solve(const Template& tmpl,
                     BindingContext& bindings,
                     Size viewport,
                     const InteractionView* interaction = nullptr,
                     const std::string& page = "",
                     const ScrollOffsets& scroll = {}) const;

    // Forget reported fallbacks so that they are recorded again, e.g. after a reload
    void clear_reported() { _reported.clear(); }

private:
    const TextMeasurer& _measurer;
    TextConfig _text;
    Diagnostics* _diagnostics;
    mutable std::set<std::string> _reported;
};

} // namespace lattice
