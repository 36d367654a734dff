#include "lattice/lattice.hpp"
#include <iostream>
#include <algorithm>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace {

bool parse_point(const std::string& text, lattice::Vec2& out) {
    auto comma = text.find(',');
    if (comma == std::string::npos) {
        return false;
    }
    try {
        out.x = std::stof(text.substr(0, comma));
        out.y = std::stof(text.substr(comma + 1));
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::info("lattice-cli starting");

    std::filesystem::path config_file;
    std::filesystem::path markup_file;
    std::filesystem::path data_file;
    std::string page;
    lattice::PointerState pointer;
    bool click = false;
    bool right_click = false;
    bool dump_data = false;
    int frames = 1;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                config_file = argv[++i];
            }
        } else if (arg == "-m" || arg == "--markup") {
            if (i + 1 < argc) {
                markup_file = argv[++i];
            }
        } else if (arg == "-d" || arg == "--data") {
            if (i + 1 < argc) {
                data_file = argv[++i];
            }
        } else if (arg == "--page") {
            if (i + 1 < argc) {
                page = argv[++i];
            }
        } else if (arg == "--pointer") {
            if (i + 1 < argc && !parse_point(argv[++i], pointer.position)) {
                std::cerr << "Error: --pointer expects x,y" << std::endl;
                return 1;
            }
        } else if (arg == "--click") {
            click = true;
        } else if (arg == "--right-click") {
            right_click = true;
        } else if (arg == "--dump-data") {
            dump_data = true;
        } else if (arg == "--frames") {
            if (i + 1 < argc) {
                frames = std::max(1, std::atoi(argv[++i]));
            }
        } else if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: lattice [options] [markup]\n"
                      << "Options:\n"
                      << "  -c, --config <file>   Engine configuration (YAML)\n"
                      << "  -m, --markup <file>   Layout markup (default: app.xml)\n"
                      << "  -d, --data <file>     Binding data (YAML)\n"
                      << "  --page <name>         Page to solve (default: first page)\n"
                      << "  --pointer <x,y>       Pointer position\n"
                      << "  --click               Press the left button on the last frame\n"
                      << "  --right-click         Press the right button on the last frame\n"
                      << "  --frames <n>          Number of frames to run (default: 1)\n"
                      << "  --dump-data           Print the binding data before solving\n"
                      << "  -h, --help            Show this help\n"
                      << "\nExamples:\n"
                      << "  lattice -m layout/app.xml -d data.yaml\n"
                      << "  lattice -m app.xml -d data.yaml --pointer 40,120 --click --frames 2\n";
            return 0;
        } else {
            markup_file = arg;
        }
    }

    if (markup_file.empty()) {
        markup_file = "app.xml";
    }

    lattice::EngineConfig config;
    if (!config_file.empty()) {
        auto config_res = lattice::EngineConfig::load_file(config_file);
        if (!config_res) {
            std::cerr << "Failed to load config: " << lattice::error_msg(config_res) << std::endl;
            return 1;
        }
        config = *config_res;
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));
    if (!page.empty()) {
        config.page = page;
    }

    auto engine_res = lattice::Engine::create(config);
    if (!engine_res) {
        std::cerr << "Failed to create engine: " << lattice::error_msg(engine_res) << std::endl;
        return 1;
    }
    auto engine = *engine_res;

    if (auto res = engine->load_file(markup_file); !res) {
        std::cerr << "Failed to load markup: " << lattice::error_msg(res) << std::endl;
        return 1;
    }

    auto tree_res = data_file.empty() ? lattice::DataTree::create() : lattice::DataTree::from_file(data_file);
    if (!tree_res) {
        std::cerr << "Failed to load data: " << lattice::error_msg(tree_res) << std::endl;
        return 1;
    }
    if (dump_data) {
        auto dump_res = (*tree_res)->dump(lattice::DataPath::root());
        if (!dump_res) {
            std::cerr << "Failed to dump data: " << lattice::error_msg(dump_res) << std::endl;
            return 1;
        }
        std::cout << *dump_res << "\n";
    }
    lattice::TreeBindingContext bindings(*tree_res);

    auto dispatcher_res = lattice::Dispatcher::create();
    if (!dispatcher_res) {
        std::cerr << "Failed to create dispatcher: " << lattice::error_msg(dispatcher_res) << std::endl;
        return 1;
    }
    auto dispatcher = *dispatcher_res;
    auto handler_res = dispatcher->register_event_handler("*", [](const lattice::UiEvent& event) -> lattice::Result<void> {
        std::cout << "event " << lattice::to_string(event.kind) << " " << event.name
                  << " from " << event.element_id << "\n";
        return lattice::Ok();
    });
    if (!handler_res) {
        std::cerr << "Failed to register handler: " << lattice::error_msg(handler_res) << std::endl;
        return 1;
    }

    for (int f = 0; f < frames; ++f) {
        // Buttons go down on the last frame only
        lattice::PointerState frame_pointer = pointer;
        frame_pointer.buttons = 0;
        if (f == frames - 1) {
            if (click) frame_pointer.buttons |= lattice::PointerState::LeftButton;
            if (right_click) frame_pointer.buttons |= lattice::PointerState::RightButton;
        }

        auto frame_res = engine->frame(bindings, frame_pointer, *dispatcher);
        if (!frame_res) {
            std::cerr << "Frame error: " << lattice::error_msg(frame_res) << std::endl;
            return 1;
        }
        if (f == frames - 1) {
            std::cout << frame_res->layout.to_string();
            std::cout << frame_res->commands.size() << " render commands\n";
        }
    }

    const auto& diagnostics = engine->diagnostics();
    if (!diagnostics.empty()) {
        std::cout << diagnostics.size() << " diagnostics recorded\n";
        for (const auto& entry : diagnostics.entries()) {
            const auto& cause = entry.error.root_cause();
            auto level = spdlog::level::to_string_view(entry.level);
            std::cout << "  " << entry.timestamp << " " << std::string(level.data(), level.size())
                      << " " << lattice::to_string(cause.code()) << ": " << cause.message() << "\n";
        }
    }
    return 0;
}
