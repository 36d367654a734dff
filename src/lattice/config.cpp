#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace lattice {

namespace {

// Read a scalar of type T if present; leave `out` untouched otherwise
template<typename T>
Result<void> read_scalar(const YAML::Node& parent, const char* key, T& out) {
    auto node = parent[key];
    if (!node) {
        return Ok();
    }
    if (!node.IsScalar()) {
        return Err<void>(ErrorCode::InvalidConfig, std::string("config: '") + key + "' must be a scalar");
    }
    try {
        out = node.as<T>();
    } catch (const YAML::Exception& e) {
        return Err<void>(ErrorCode::InvalidConfig, std::string("config: '") + key + "': " + e.what());
    }
    return Ok();
}

Result<void> read_engine(const YAML::Node& node, EngineConfig& config) {
    if (!node.IsMap()) {
        return Err<void>(ErrorCode::InvalidConfig, "config: 'engine' must be a map");
    }

    if (auto viewport = node["viewport"]) {
        if (!viewport.IsSequence() || viewport.size() != 2) {
            return Err<void>(ErrorCode::InvalidConfig, "config: 'viewport' must be [width, height]");
        }
        try {
            config.viewport_width = viewport[0].as<float>();
            config.viewport_height = viewport[1].as<float>();
        } catch (const YAML::Exception& e) {
            return Err<void>(ErrorCode::InvalidConfig, std::string("config: 'viewport': ") + e.what());
        }
    }

    if (auto res = read_scalar(node, "page", config.page); !res) {
        return res;
    }
    if (auto res = read_scalar(node, "log-level", config.log_level); !res) {
        return res;
    }
    if (spdlog::level::from_str(config.log_level) == spdlog::level::off && config.log_level != "off") {
        return Err<void>(ErrorCode::InvalidConfig, "config: unknown log-level '" + config.log_level + "'");
    }
    if (auto res = read_scalar(node, "diagnostics-capacity", config.diagnostics_capacity); !res) {
        return res;
    }
    return Ok();
}

Result<void> read_text(const YAML::Node& node, TextConfig& text) {
    if (!node.IsMap()) {
        return Err<void>(ErrorCode::InvalidConfig, "config: 'text' must be a map");
    }
    if (auto res = read_scalar(node, "char-width", text.char_width); !res) {
        return res;
    }
    if (auto res = read_scalar(node, "line-height", text.line_height); !res) {
        return res;
    }
    if (auto res = read_scalar(node, "default-font-size", text.default_font_size); !res) {
        return res;
    }
    if (text.char_width < 0.0f || text.line_height < 0.0f || text.default_font_size < 0.0f) {
        return Err<void>(ErrorCode::InvalidConfig, "config: text metrics must not be negative");
    }
    return Ok();
}

} // namespace

Result<EngineConfig> EngineConfig::load_string(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        return Err<EngineConfig>(ErrorCode::InvalidConfig, std::string("config: YAML parse error: ") + e.what());
    }

    EngineConfig config;
    if (root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        return Err<EngineConfig>(ErrorCode::InvalidConfig, "config: root must be a map");
    }

    if (auto engine = root["engine"]) {
        if (auto res = read_engine(engine, config); !res) {
            return Err<EngineConfig>("EngineConfig::load_string: engine section", res);
        }
    }
    if (auto text = root["text"]) {
        if (auto res = read_text(text, config.text); !res) {
            return Err<EngineConfig>("EngineConfig::load_string: text section", res);
        }
    }
    return config;
}

Result<EngineConfig> EngineConfig::load_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Err<EngineConfig>(ErrorCode::Io, "EngineConfig::load_file: cannot open " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();

    auto res = load_string(ss.str());
    if (!res) {
        return Err<EngineConfig>("EngineConfig::load_file: " + path.string(), res);
    }
    spdlog::debug("Loaded config from {}", path.string());
    return res;
}

} // namespace lattice
