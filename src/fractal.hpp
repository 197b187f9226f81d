#pragma once

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <utility>
#include <vector>
#include "orbit_trap.hpp"

enum class FormulaType {
    Standard    = 0,  // z^2 + c
    BurningShip = 1,  // (|Re z| + i|Im z|)^2 + c
    Celtic      = 2,  // |Re(z^2)| + i Im(z^2) + c
    Buffalo     = 3,  // |Re(z^2)| + i|Im(z^2)| + c
    Mandelbar   = 4,  // conj(z)^2 + c
};
constexpr int FORMULA_COUNT = 5;

struct FractalParams {
    int         max_iter      =  256;
    double      escape_radius =  2.0;
    FormulaType formula       =  FormulaType::Standard;
    bool        julia_mode    =  false;   // z0 = pixel, c = (julia_re, julia_im)
    double      julia_re      = -0.7;
    double      julia_im      =  0.27015;
    OrbitTrap   trap;
};

// Outcome of iterating one point.
//  iterations : index n of the first iterate with |z_n| >= R, or max_iter
//  smooth     : continuous iteration count (max_iter for interior points)
//  trap_distance : min over z_1..z_n of the distance to the trap; a point
//                  that escapes at n = 0 reports the distance of z_0
struct PixelResult {
    bool   escaped       = false;
    int    iterations    = 0;
    double smooth        = 0.0;
    double trap_distance = 0.0;
};

// Per-render constants for the inner loop.
struct KernelParams {
    int          max_iter   = 0;
    double       radius2    = 4.0;
    double       log_radius = 0.0;
    bool         smooth_ok  = true;   // smoothing needs R > 1
    double       julia_re   = 0.0;
    double       julia_im   = 0.0;
    TrapGeometry trap;
};

inline KernelParams make_kernel_params(const FractalParams& fp)
{
    KernelParams kp;
    kp.max_iter   = fp.max_iter;
    kp.radius2    = fp.escape_radius * fp.escape_radius;
    kp.smooth_ok  = fp.escape_radius > 1.0;
    kp.log_radius = kp.smooth_ok ? std::log(fp.escape_radius) : 0.0;
    kp.julia_re   = fp.julia_re;
    kp.julia_im   = fp.julia_im;
    kp.trap       = make_trap_geometry(fp.trap);
    return kp;
}

// Normalized iteration count: n + 1 - log2(log|z_n| / log R).
inline double smooth_count(int n, double mag2, const KernelParams& kp)
{
    if (!kp.smooth_ok) return static_cast<double>(n);
    const double log_zn = std::log(mag2) * 0.5;
    const double nu     = std::log(log_zn / kp.log_radius) / std::log(2.0);
    return std::max(0.0, static_cast<double>(n) + 1.0 - nu);
}

// One step of the recurrence. zr2 / zi2 are the squares already computed
// for the escape test.
template<FormulaType F>
inline void formula_step(double zr, double zi, double zr2, double zi2,
                         double cr, double ci, double& new_zr, double& new_zi)
{
    if constexpr (F == FormulaType::BurningShip) {
        new_zr = zr2 - zi2 + cr;
        new_zi = std::abs(2.0*zr*zi) + ci;
    } else if constexpr (F == FormulaType::Celtic) {
        new_zr = std::abs(zr2 - zi2) + cr;
        new_zi = 2.0*zr*zi + ci;
    } else if constexpr (F == FormulaType::Buffalo) {
        new_zr = std::abs(zr2 - zi2) + cr;
        new_zi = std::abs(2.0*zr*zi) + ci;
    } else if constexpr (F == FormulaType::Mandelbar) {
        new_zr = zr2 - zi2 + cr;
        new_zi = -2.0*zr*zi + ci;
    } else {
        new_zr = zr2 - zi2 + cr;
        new_zi = 2.0*zr*zi + ci;
    }
}

// Escape-time iteration with orbit-trap tracking. The trap is sampled on
// every new iterate right after it is produced, before its own escape test,
// so the escaping iterate is part of the minimum and z_0 is not.
template<FormulaType F, bool IsJulia, TrapShape S>
inline PixelResult trap_kernel(double re, double im, const KernelParams& kp)
{
    double zr = IsJulia ? re : 0.0;
    double zi = IsJulia ? im : 0.0;
    const double cr = IsJulia ? kp.julia_re : re;
    const double ci = IsJulia ? kp.julia_im : im;
    double trap_min = std::numeric_limits<double>::infinity();

    PixelResult r;
    int i = 0;
    while (i < kp.max_iter) {
        const double zr2 = zr*zr, zi2 = zi*zi;
        const double mag2 = zr2 + zi2;
        if (mag2 >= kp.radius2) {
            if (i == 0) trap_min = trap_metric<S>(kp.trap, zr, zi);
            r.escaped       = true;
            r.iterations    = i;
            r.smooth        = smooth_count(i, mag2, kp);
            r.trap_distance = trap_finalize<S>(trap_min);
            return r;
        }
        double new_zr, new_zi;
        formula_step<F>(zr, zi, zr2, zi2, cr, ci, new_zr, new_zi);
        zr = new_zr;
        zi = new_zi;
        trap_min = std::min(trap_min, trap_metric<S>(kp.trap, zr, zi));
        ++i;
    }
    r.escaped       = false;
    r.iterations    = kp.max_iter;
    r.smooth        = static_cast<double>(kp.max_iter);
    r.trap_distance = trap_finalize<S>(trap_min);
    return r;
}

using KernelFn = PixelResult (*)(double re, double im, const KernelParams& kp);

// Picks the kernel instantiation for a formula / mode / trap combination.
KernelFn select_kernel(FormulaType formula, bool julia_mode, TrapShape shape);

// Empty string when the parameters are usable, otherwise a description.
std::string validate_fractal_params(const FractalParams& fp);

// Single-point evaluation. fp must have passed validate_fractal_params().
inline PixelResult evaluate_point(double re, double im, const FractalParams& fp)
{
    const KernelParams kp = make_kernel_params(fp);
    return select_kernel(fp.formula, fp.julia_mode, fp.trap.shape)(re, im, kp);
}

// Returns z_0 followed by up to max_n iterates, stopping after the first
// iterate with |z| >= escape_radius.
std::vector<std::pair<double,double>>
compute_orbit(double re, double im, const FractalParams& fp, int max_n = 20);

// Human-readable name combining formula and Julia mode.
inline const char* fractal_name(const FractalParams& fp)
{
    switch (fp.formula) {
        case FormulaType::Standard:
            return fp.julia_mode ? "Julia"              : "Mandelbrot";
        case FormulaType::BurningShip:
            return fp.julia_mode ? "Burning Ship Julia" : "Burning Ship";
        case FormulaType::Mandelbar:
            return fp.julia_mode ? "Mandelbar Julia"    : "Mandelbar";
        case FormulaType::Celtic:
            return fp.julia_mode ? "Celtic Julia"       : "Celtic";
        case FormulaType::Buffalo:
            return fp.julia_mode ? "Buffalo Julia"      : "Buffalo";
    }
    return "Unknown";
}

inline const char* formula_key(FormulaType f)
{
    switch (f) {
        case FormulaType::Standard:    return "mandelbrot";
        case FormulaType::BurningShip: return "burning-ship";
        case FormulaType::Celtic:      return "celtic";
        case FormulaType::Buffalo:     return "buffalo";
        case FormulaType::Mandelbar:   return "mandelbar";
    }
    return "unknown";
}
