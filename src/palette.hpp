#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

struct PixelResult;

struct Rgb { uint8_t r, g, b; };

// 32-bit RGBA pixel, little-endian packed as 0xAABBGGRR.
inline uint32_t pack_rgba(Rgb c)
{
    return 0xFF000000u
         | (static_cast<uint32_t>(c.b) << 16)
         | (static_cast<uint32_t>(c.g) <<  8)
         |  static_cast<uint32_t>(c.r);
}

inline Rgb unpack_rgb(uint32_t px)
{
    return { static_cast<uint8_t>(px & 0xFFu),
             static_cast<uint8_t>((px >> 8) & 0xFFu),
             static_cast<uint8_t>((px >> 16) & 0xFFu) };
}

// Maps t in [0,1] to a color. Values outside [0,1] are clamped.
class Palette {
public:
    virtual ~Palette() = default;
    virtual Rgb color_at(double t) const = 0;
};

// ---------------------------------------------------------------------------
// Control-point palette: linear interpolation between bracketing stops.
// ---------------------------------------------------------------------------
struct ColorStop { double t; uint8_t r, g, b; };

class GradientPalette : public Palette {
public:
    // Needs at least two stops with strictly increasing positions in [0,1].
    // Returns empty string and fills out on success; out is untouched on error.
    static std::string create(std::vector<ColorStop> stops, std::unique_ptr<Palette>& out);

    Rgb color_at(double t) const override;

private:
    explicit GradientPalette(std::vector<ColorStop> s) : stops(std::move(s)) {}

    std::vector<ColorStop> stops;
};

// ---------------------------------------------------------------------------
// Procedural palette: per channel a + b * cos(2*pi * (c*t + d)), clamped.
// ---------------------------------------------------------------------------
struct CosineCoeffs { double a[3], b[3], c[3], d[3]; };

class CosinePalette : public Palette {
public:
    explicit CosinePalette(const CosineCoeffs& k) : coeffs(k) {}
    Rgb color_at(double t) const override;

private:
    CosineCoeffs coeffs;
};

// ---------------------------------------------------------------------------
// Built-in presets
// ---------------------------------------------------------------------------
static constexpr int PALETTE_COUNT = 10;

extern const char* g_palette_names[PALETTE_COUNT];

// Builds preset by case-insensitive name ("fire", "classic-ultra", ...).
std::string make_preset_palette(const std::string& name, std::unique_ptr<Palette>& out);

// Parses "pos:RRGGBB,pos:RRGGBB,..." (e.g. "0:000000,0.5:ff8000,1:ffffff").
std::string parse_color_stops(const std::string& text, std::vector<ColorStop>& out);

// ---------------------------------------------------------------------------
// Pixel result -> color
// ---------------------------------------------------------------------------
static constexpr double INTERIOR_T = 0.0;

struct ColoringParams {
    double trap_falloff          = 0.25;   // distance at which t reaches 1 - 1/e
    double smooth_blend          = 0.0;    // 0: trap distance only, 1: smooth count only
    bool   interior_from_palette = false;  // color interior with palette(INTERIOR_T)
    Rgb    interior              = {0, 0, 0};
};

std::string validate_coloring_params(const ColoringParams& cp);

// Normalized scalar for a pixel. Small trap distances map towards 0.
double coloring_t(const PixelResult& r, int max_iter, const ColoringParams& cp);

uint32_t pixel_color(const PixelResult& r, int max_iter,
                     const ColoringParams& cp, const Palette& palette);
