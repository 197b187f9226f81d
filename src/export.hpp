#pragma once

#include "renderer.hpp"

#include <string>

// Writes buf as 8-bit RGBA PNG. description, when given, is stored in a
// tEXt "Description" chunk (e.g. the render parameters).
// Returns empty string on success, or an error message on failure.
std::string export_png(const char* path, const PixelBuffer& buf,
                       const char* description = nullptr);

// One-line summary of a render configuration for image metadata and logs.
std::string describe_config(const RenderConfig& cfg, const char* palette_label);
