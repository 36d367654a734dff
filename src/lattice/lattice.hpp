#pragma once

// Lattice - declarative immediate-mode UI layout engine
// C++ implementation

#include "result.hpp"
#include "types.hpp"
#include "config.hpp"
#include "diagnostics.hpp"
#include "color.hpp"
#include "binding.hpp"
#include "data_tree.hpp"
#include "event_sink.hpp"
#include "dispatcher.hpp"
#include "engine.hpp"

#include "markup/node.hpp"
#include "markup/compiler.hpp"
#include "markup/template_store.hpp"
#include "layout/geometry.hpp"
#include "layout/text_measure.hpp"
#include "layout/layout_tree.hpp"
#include "layout/solver.hpp"
#include "interaction/interaction_state.hpp"
#include "interaction/event_emitter.hpp"
