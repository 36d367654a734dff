#pragma once

#include "result.hpp"
#include <filesystem>
#include <string>

namespace lattice {

// Parameters of the monospace text estimator
struct TextConfig {
    float char_width = 0.5f;    // fraction of font size per glyph
    float line_height = 1.2f;   // multiple of font size
    float default_font_size = 16.0f;
};

// Engine configuration
struct EngineConfig {
    float viewport_width = 800.0f;
    float viewport_height = 600.0f;
    std::string page;           // empty: first page of the template
    std::string log_level = "info";
    size_t diagnostics_capacity = 256;
    TextConfig text;

    // Load from a YAML document; missing keys keep their defaults
    static Result<EngineConfig> load_string(const std::string& yaml);
    static Result<EngineConfig> load_file(const std::filesystem::path& path);
};

} // namespace lattice
