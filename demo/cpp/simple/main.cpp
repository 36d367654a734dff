#include "lattice/lattice.hpp"
#include <iostream>
#include <filesystem>

int main() {
    auto dir = std::filesystem::path(__FILE__).parent_path();

    lattice::EngineConfig config;
    auto engine_res = lattice::Engine::create(config);
    if (!engine_res) {
        std::cerr << "Failed to create engine: " << lattice::error_msg(engine_res) << std::endl;
        return 1;
    }
    auto engine = *engine_res;

    if (auto res = engine->load_file(dir / "layout" / "app.xml"); !res) {
        std::cerr << "Failed to load layout: " << lattice::error_msg(res) << std::endl;
        return 1;
    }

    auto bindings_res = lattice::DataTree::from_file(dir / "data.yaml");
    if (!bindings_res) {
        std::cerr << "Failed to load data: " << lattice::error_msg(bindings_res) << std::endl;
        return 1;
    }
    lattice::TreeBindingContext bindings(*bindings_res);

    auto dispatcher_res = lattice::Dispatcher::create();
    if (!dispatcher_res) {
        std::cerr << "Failed to create dispatcher: " << lattice::error_msg(dispatcher_res) << std::endl;
        return 1;
    }
    auto dispatcher = *dispatcher_res;
    auto handler_res = dispatcher->register_event_handler("click/Clicked", [](const lattice::UiEvent& event) -> lattice::Result<void> {
        std::cout << "open document " << event.element_id << std::endl;
        return lattice::Ok();
    });
    if (!handler_res) {
        std::cerr << "Failed to register handler: " << lattice::error_msg(handler_res) << std::endl;
        return 1;
    }

    // Hover the second document, press, release
    lattice::Vec2 target{60.0f, 130.0f};
    std::vector<lattice::PointerState> script = {
        {target, 0},
        {target, lattice::PointerState::LeftButton},
        {target, 0},
    };

    for (const auto& pointer : script) {
        auto frame_res = engine->frame(bindings, pointer, *dispatcher);
        if (!frame_res) {
            std::cerr << "Frame error: " << lattice::error_msg(frame_res) << std::endl;
            return 1;
        }
    }

    auto last = engine->frame(bindings, {}, *dispatcher);
    if (!last) {
        std::cerr << "Frame error: " << lattice::error_msg(last) << std::endl;
        return 1;
    }
    std::cout << last->layout.to_string();
    std::cout << dispatcher->history().size() << " events dispatched" << std::endl;
    return 0;
}
