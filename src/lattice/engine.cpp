#include "engine.hpp"
#include "interaction/event_emitter.hpp"
#include <spdlog/spdlog.h>
#include <ytrace/ytrace.hpp>
#include <fstream>
#include <sstream>

namespace lattice {

Result<std::shared_ptr<Engine>> Engine::create(const EngineConfig& config, std::shared_ptr<TextMeasurer> measurer) {
    if (config.diagnostics_capacity == 0) {
        return Err<std::shared_ptr<Engine>>(ErrorCode::InvalidConfig,
            "Engine::create: diagnostics-capacity must be positive");
    }

    auto engine = std::shared_ptr<Engine>(new Engine());
    engine->_config = config;
    engine->_measurer = measurer ? std::move(measurer) : std::make_shared<MonospaceTextMeasurer>(config.text);
    engine->_diagnostics.set_max_size(config.diagnostics_capacity);
    engine->_solver = std::make_unique<Solver>(*engine->_measurer, config.text, &engine->_diagnostics);
    engine->_viewport = {config.viewport_width, config.viewport_height};
    engine->_page = config.page;

    spdlog::info("Engine: created, viewport {}x{}", config.viewport_width, config.viewport_height);
    return engine;
}

Result<void> Engine::reload(const std::string& markup) {
    if (auto res = _store.reload(markup); !res) {
        _diagnostics.add(res.error(), spdlog::level::err);
        return Err<void>("Engine::reload: template rejected", res);
    }
    _solver->clear_reported();
    return Ok();
}

Result<void> Engine::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Err<void>(ErrorCode::Io, "Engine::load_file: cannot open " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    if (auto res = reload(buffer.str()); !res) {
        return Err<void>("Engine::load_file: " + path.string(), res);
    }
    spdlog::info("Engine: loaded {}", path.string());
    return Ok();
}

Result<FrameResult> Engine::frame(BindingContext& bindings, const PointerState& pointer, EventSink& sink,
                                  const ScrollOffsets& scroll) {
    // The snapshot stays alive for the whole frame even if a reload publishes meanwhile
    TemplatePtr tmpl = _store.snapshot();
    if (!tmpl) {
        return Err<FrameResult>("Engine::frame: no template loaded");
    }

    FrameResult result;
    result.layout = _solver->solve(*tmpl, bindings, _viewport, &_interaction.view(), _page, scroll);
    result.delta = _interaction.update(result.layout, pointer);

    result.commands = result.layout.render_commands();

    auto emitted = EventEmitter::emit(result.layout, result.delta, sink);
    if (emitted) {
        result.events_emitted = *emitted;
    } else {
        Error error("Engine::frame: event emission failed", emitted.error());
        _diagnostics.add(error, spdlog::level::err);
        result.sink_error = std::move(error);
    }

    ++_frame_count;
    ydebug("Engine: frame {} nodes={} commands={} events={}",
           _frame_count, result.layout.size(), result.commands.size(), result.events_emitted);
    return result;
}

} // namespace lattice
