#include "renderer.hpp"

#include <cmath>
#include <cstdio>

// Largest raster accepted; keeps width * height well inside size_t and int.
static constexpr long long MAX_PIXELS = 1LL << 30;

std::string validate_render_config(const RenderConfig& cfg)
{
    char msg[128];
    if (cfg.width <= 0 || cfg.height <= 0) {
        std::snprintf(msg, sizeof(msg), "raster size must be positive (got %dx%d)",
                      cfg.width, cfg.height);
        return msg;
    }
    if (static_cast<long long>(cfg.width) * cfg.height > MAX_PIXELS) {
        std::snprintf(msg, sizeof(msg), "raster %dx%d is too large", cfg.width, cfg.height);
        return msg;
    }
    if (!(cfg.view.half_height > 0.0) || !std::isfinite(cfg.view.half_height)) {
        std::snprintf(msg, sizeof(msg), "view half-height must be positive (got %g)",
                      cfg.view.half_height);
        return msg;
    }
    if (!std::isfinite(cfg.view.center_x) || !std::isfinite(cfg.view.center_y))
        return "view center must be finite";

    std::string err = validate_fractal_params(cfg.fractal);
    if (!err.empty()) return err;
    return validate_coloring_params(cfg.coloring);
}
