#include "palette.hpp"
#include "fractal.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

const char* g_palette_names[PALETTE_COUNT] = {
    "grayscale",
    "fire",
    "ice",
    "electric",
    "sunset",
    "forest",
    "classic-ultra",
    "rainbow",
    "glow",
    "nebula",
};

// ---------------------------------------------------------------------------
// Control-point palette
// ---------------------------------------------------------------------------
std::string GradientPalette::create(std::vector<ColorStop> stops, std::unique_ptr<Palette>& out)
{
    char msg[160];
    if (stops.size() < 2) {
        std::snprintf(msg, sizeof(msg),
                      "palette needs at least 2 color stops (got %zu)", stops.size());
        return msg;
    }
    for (size_t i = 0; i < stops.size(); ++i) {
        const double t = stops[i].t;
        if (!std::isfinite(t) || t < 0.0 || t > 1.0) {
            std::snprintf(msg, sizeof(msg),
                          "palette stop %zu position %g is outside [0,1]", i, t);
            return msg;
        }
        if (i > 0 && !(t > stops[i - 1].t)) {
            std::snprintf(msg, sizeof(msg),
                          "palette stop %zu position %g does not increase (previous %g)",
                          i, t, stops[i - 1].t);
            return msg;
        }
    }
    out.reset(new GradientPalette(std::move(stops)));
    return {};
}

static uint8_t lerp_channel(uint8_t a, uint8_t b, double f)
{
    const double v = static_cast<double>(a) + f * (static_cast<double>(b) - a);
    return static_cast<uint8_t>(std::lround(v));
}

Rgb GradientPalette::color_at(double t) const
{
    const ColorStop& first = stops.front();
    const ColorStop& last  = stops.back();
    if (!(t > first.t)) return {first.r, first.g, first.b};
    if (t >= last.t)    return {last.r, last.g, last.b};

    // Find the segment [stops[seg], stops[seg+1]] that contains t.
    size_t seg = stops.size() - 2;
    for (size_t s = 0; s + 1 < stops.size(); ++s) {
        if (t <= stops[s + 1].t) { seg = s; break; }
    }
    const ColorStop& a = stops[seg];
    const ColorStop& b = stops[seg + 1];
    const double f = (t - a.t) / (b.t - a.t);

    return { lerp_channel(a.r, b.r, f),
             lerp_channel(a.g, b.g, f),
             lerp_channel(a.b, b.b, f) };
}

// ---------------------------------------------------------------------------
// Procedural palette
// ---------------------------------------------------------------------------
Rgb CosinePalette::color_at(double t) const
{
    if (!(t >= 0.0)) t = 0.0;
    if (t > 1.0)     t = 1.0;

    const double two_pi = 6.283185307179586;
    uint8_t ch[3];
    for (int k = 0; k < 3; ++k) {
        double v = coeffs.a[k] + coeffs.b[k] * std::cos(two_pi * (coeffs.c[k] * t + coeffs.d[k]));
        v = std::max(0.0, std::min(1.0, v));
        ch[k] = static_cast<uint8_t>(std::lround(v * 255.0));
    }
    return {ch[0], ch[1], ch[2]};
}

// ---------------------------------------------------------------------------
// Preset definitions
// ---------------------------------------------------------------------------
static std::vector<ColorStop> preset_stops(int idx)
{
    switch (idx) {
        // black → white
        case 0: return {
            {0.0,   0,   0,   0},
            {1.0, 255, 255, 255},
        };
        // black → dark-red → red → orange → yellow → white
        case 1: return {
            {0.000,   0,   0,   0},
            {0.250, 128,   0,   0},
            {0.500, 255,   0,   0},
            {0.750, 255, 128,   0},
            {0.875, 255, 255,   0},
            {1.000, 255, 255, 255},
        };
        // black → dark-blue → blue → cyan → white
        case 2: return {
            {0.000,   0,   0,   0},
            {0.250,   0,   0, 128},
            {0.500,   0,  64, 255},
            {0.750,   0, 200, 255},
            {1.000, 255, 255, 255},
        };
        // black → dark-purple → blue → cyan → white
        case 3: return {
            {0.000,   0,   0,   0},
            {0.250,  64,   0, 128},
            {0.500,   0,  64, 255},
            {0.750,   0, 200, 255},
            {1.000, 255, 255, 255},
        };
        // black → deep-red → orange → yellow → pale-yellow
        case 4: return {
            {0.000,   0,   0,   0},
            {0.300, 128,   0,  32},
            {0.550, 255,  64,   0},
            {0.800, 255, 200,   0},
            {1.000, 255, 255, 180},
        };
        // black → dark-green → green → lime → pale-green
        case 5: return {
            {0.000,   0,   0,   0},
            {0.250,   0,  64,   0},
            {0.500,   0, 160,   0},
            {0.750, 100, 220,   0},
            {1.000, 200, 255, 180},
        };
        // blue-gold gradient, UltraFractal-inspired
        case 6: return {
            {0.0000,   0,   7, 100},
            {0.1600,  32, 107, 203},
            {0.4200, 237, 255, 255},
            {0.6425, 255, 170,   0},
            {0.8575,   0,   2,   0},
            {1.0000,   0,   7, 100},
        };
    }
    return {};
}

static CosineCoeffs preset_coeffs(int idx)
{
    switch (idx) {
        case 7:  return {{0.5, 0.5, 0.5}, {0.5, 0.5, 0.5}, {1.0, 1.0, 1.0}, {0.00, 0.33, 0.67}};
        case 8:  return {{0.5, 0.5, 0.5}, {0.5, 0.5, 0.5}, {1.0, 1.0, 1.0}, {0.00, 0.10, 0.20}};
        default: return {{0.5, 0.5, 0.5}, {0.5, 0.5, 0.5}, {1.0, 1.0, 0.5}, {0.80, 0.90, 0.30}};
    }
}

static std::string lowercase(const std::string& s)
{
    std::string r(s);
    std::transform(r.begin(), r.end(), r.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return r;
}

std::string make_preset_palette(const std::string& name, std::unique_ptr<Palette>& out)
{
    const std::string key = lowercase(name);
    for (int i = 0; i < PALETTE_COUNT; ++i) {
        if (key != g_palette_names[i]) continue;
        if (i <= 6)
            return GradientPalette::create(preset_stops(i), out);
        out.reset(new CosinePalette(preset_coeffs(i)));
        return {};
    }
    return "unknown palette: " + name;
}

// ---------------------------------------------------------------------------
// "pos:RRGGBB,..." parser
// ---------------------------------------------------------------------------
std::string parse_color_stops(const std::string& text, std::vector<ColorStop>& out)
{
    std::vector<ColorStop> stops;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find(',', start);
        if (end == std::string::npos) end = text.size();
        const std::string item = text.substr(start, end - start);
        start = end + 1;

        const size_t colon = item.find(':');
        if (colon == std::string::npos)
            return "color stop '" + item + "' is not of the form pos:RRGGBB";

        const std::string pos_str = item.substr(0, colon);
        std::string hex = item.substr(colon + 1);
        if (!hex.empty() && hex[0] == '#') hex.erase(0, 1);

        char* pend = nullptr;
        const double pos = std::strtod(pos_str.c_str(), &pend);
        if (pos_str.empty() || *pend != '\0')
            return "bad color stop position '" + pos_str + "'";

        if (hex.size() != 6 ||
            !std::all_of(hex.begin(), hex.end(),
                         [](unsigned char ch) { return std::isxdigit(ch) != 0; }))
            return "bad color '" + hex + "' (expected RRGGBB)";
        const unsigned long rgb = std::strtoul(hex.c_str(), nullptr, 16);

        stops.push_back({pos,
                         static_cast<uint8_t>((rgb >> 16) & 0xFFu),
                         static_cast<uint8_t>((rgb >>  8) & 0xFFu),
                         static_cast<uint8_t>( rgb        & 0xFFu)});
        if (end == text.size()) break;
    }
    out = std::move(stops);
    return {};
}

// ---------------------------------------------------------------------------
// Pixel result -> color
// ---------------------------------------------------------------------------
std::string validate_coloring_params(const ColoringParams& cp)
{
    char msg[128];
    if (!(cp.trap_falloff > 0.0) || !std::isfinite(cp.trap_falloff)) {
        std::snprintf(msg, sizeof(msg), "trap falloff must be positive (got %g)", cp.trap_falloff);
        return msg;
    }
    if (!(cp.smooth_blend >= 0.0 && cp.smooth_blend <= 1.0)) {
        std::snprintf(msg, sizeof(msg), "smooth blend must be in [0,1] (got %g)", cp.smooth_blend);
        return msg;
    }
    return {};
}

double coloring_t(const PixelResult& r, int max_iter, const ColoringParams& cp)
{
    if (!r.escaped) return INTERIOR_T;

    const double t_trap = 1.0 - std::exp(-r.trap_distance / cp.trap_falloff);
    const double t_iter = (max_iter > 0) ? r.smooth / static_cast<double>(max_iter) : 0.0;
    const double t = (1.0 - cp.smooth_blend) * t_trap + cp.smooth_blend * t_iter;

    if (!(t >= 0.0)) return 0.0;
    return std::min(t, 1.0);
}

uint32_t pixel_color(const PixelResult& r, int max_iter,
                     const ColoringParams& cp, const Palette& palette)
{
    if (!r.escaped && !cp.interior_from_palette)
        return pack_rgba(cp.interior);
    return pack_rgba(palette.color_at(coloring_t(r, max_iter, cp)));
}
