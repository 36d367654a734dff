#pragma once

#include "result.hpp"
#include "config.hpp"
#include "diagnostics.hpp"
#include "event_sink.hpp"
#include "binding.hpp"
#include "markup/template_store.hpp"
#include "layout/solver.hpp"
#include "layout/text_measure.hpp"
#include "interaction/interaction_state.hpp"
#include <filesystem>
#include <memory>
#include <optional>

namespace lattice {

// Output of one frame
// A sink failure does not drop the frame: the layout and commands are still
// delivered and the SinkFailed error is carried in sink_error
struct FrameResult {
    LayoutTree layout;
    InteractionDelta delta;
    size_t events_emitted = 0;
    std::vector<RenderCommand> commands;
    std::optional<Error> sink_error;
};

// Engine - owns the template store, the interaction map and the diagnostics buffer
// and runs snapshot -> solve -> update -> emit once per frame
class Engine {
public:
    // A null measurer selects the monospace estimator configured by config.text
    static Result<std::shared_ptr<Engine>> create(const EngineConfig& config,
                                                  std::shared_ptr<TextMeasurer> measurer = nullptr);

    // Hot reload entry points; on failure the previous template stays active
    Result<void> reload(const std::string& markup);
    Result<void> load_file(const std::filesystem::path& path);

    // Fails only when no template is loaded
    Result<FrameResult> frame(BindingContext& bindings, const PointerState& pointer, EventSink& sink,
                              const ScrollOffsets& scroll = {});

    void set_viewport(Size viewport) { _viewport = viewport; }
    Size viewport() const { return _viewport; }

    // Empty selects the first page
    void set_page(const std::string& page) { _page = page; }
    const std::string& page() const { return _page; }

    const InteractionState& interaction() const { return _interaction; }
    Diagnostics& diagnostics() { return _diagnostics; }
    TemplateStore& store() { return _store; }
    const EngineConfig& config() const { return _config; }

    uint64_t frame_count() const { return _frame_count; }

private:
    Engine() = default;

    EngineConfig _config;
    std::shared_ptr<TextMeasurer> _measurer;
    std::unique_ptr<Solver> _solver;
    TemplateStore _store;
    InteractionState _interaction;
    Diagnostics _diagnostics;
    Size _viewport;
    std::string _page;
    uint64_t _frame_count = 0;
};

using EnginePtr = std::shared_ptr<Engine>;

} // namespace lattice
