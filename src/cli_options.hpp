#pragma once

#include "renderer.hpp"
#include "palette.hpp"

#include <memory>
#include <string>

struct CliOptions {
    RenderConfig cfg;
    std::string  output       = "orbitrap.png";
    std::string  palette_name = "classic-ultra";
    std::string  stops;                // custom "pos:RRGGBB,..." list, overrides palette_name
    int          threads      = 0;     // 0 = hardware concurrency
    bool         force_scalar = false;
    bool         benchmark    = false;
    bool         verbose      = false;
    bool         help         = false;
};

// Fills opts from the command line. Returns empty string on success, or a
// description of the first bad argument. Values are range-checked here only
// as far as parsing goes; validate_render_config() does the rest.
std::string parse_cli(int argc, char* argv[], CliOptions& opts);

void print_usage(const char* prog);

// Palette selected by the options: custom stops if given, else the preset.
std::string build_palette(const CliOptions& opts, std::unique_ptr<Palette>& out);
