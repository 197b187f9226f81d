#pragma once

#include <vector>
#include <cstdint>
#include <string>

#include "fractal.hpp"
#include "palette.hpp"
#include "view_state.hpp"

// Pixel buffer: RGBA, little-endian packed as 0xAABBGGRR
struct PixelBuffer {
    std::vector<uint32_t> pixels;
    int width  = 0;
    int height = 0;

    void resize(int w, int h)
    {
        width  = w;
        height = h;
        pixels.assign(static_cast<size_t>(w) * static_cast<size_t>(h), 0xFF000000u);
    }

    uint32_t at(int x, int y) const
    {
        return pixels[static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)];
    }

    uint32_t& at(int x, int y)
    {
        return pixels[static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)];
    }
};

// Everything one render reads. Immutable for the duration of the render.
struct RenderConfig {
    ViewState      view;
    int            width  = 1024;
    int            height = 768;
    FractalParams  fractal;
    ColoringParams coloring;
};

// Empty string when the configuration can be rendered, otherwise the first
// problem found.
std::string validate_render_config(const RenderConfig& cfg);

class IFractalRenderer {
public:
    virtual ~IFractalRenderer() = default;

    // Validates cfg, then fills buf (resized to cfg.width x cfg.height).
    // On error buf is left unchanged.
    virtual std::string render(const RenderConfig& cfg, const Palette& palette,
                               PixelBuffer& buf) = 0;
};
