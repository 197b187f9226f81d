#include "fractal.hpp"

#include <cmath>
#include <cstdio>

// -----------------------------------------------------------------------
// Kernel selection: resolved once per render, never per pixel
// -----------------------------------------------------------------------
template<FormulaType F, bool IsJulia>
static KernelFn pick_trap(TrapShape shape)
{
    switch (shape) {
        case TrapShape::Point:  return &trap_kernel<F, IsJulia, TrapShape::Point>;
        case TrapShape::Circle: return &trap_kernel<F, IsJulia, TrapShape::Circle>;
        case TrapShape::Line:   return &trap_kernel<F, IsJulia, TrapShape::Line>;
        case TrapShape::Cross:  return &trap_kernel<F, IsJulia, TrapShape::Cross>;
    }
    return &trap_kernel<F, IsJulia, TrapShape::Point>;
}

template<FormulaType F>
static KernelFn pick_mode(bool julia_mode, TrapShape shape)
{
    return julia_mode ? pick_trap<F, true>(shape) : pick_trap<F, false>(shape);
}

KernelFn select_kernel(FormulaType formula, bool julia_mode, TrapShape shape)
{
    switch (formula) {
        case FormulaType::Standard:
            return pick_mode<FormulaType::Standard>(julia_mode, shape);
        case FormulaType::BurningShip:
            return pick_mode<FormulaType::BurningShip>(julia_mode, shape);
        case FormulaType::Celtic:
            return pick_mode<FormulaType::Celtic>(julia_mode, shape);
        case FormulaType::Buffalo:
            return pick_mode<FormulaType::Buffalo>(julia_mode, shape);
        case FormulaType::Mandelbar:
            return pick_mode<FormulaType::Mandelbar>(julia_mode, shape);
    }
    return pick_mode<FormulaType::Standard>(julia_mode, shape);
}

// -----------------------------------------------------------------------
// Validation
// -----------------------------------------------------------------------
std::string validate_fractal_params(const FractalParams& fp)
{
    char msg[128];
    if (fp.max_iter <= 0) {
        std::snprintf(msg, sizeof(msg), "max iterations must be positive (got %d)", fp.max_iter);
        return msg;
    }
    if (!(fp.escape_radius > 0.0) || !std::isfinite(fp.escape_radius)) {
        std::snprintf(msg, sizeof(msg), "escape radius must be positive (got %g)", fp.escape_radius);
        return msg;
    }
    if (!std::isfinite(fp.escape_radius * fp.escape_radius)) {
        std::snprintf(msg, sizeof(msg), "escape radius is too large (got %g)", fp.escape_radius);
        return msg;
    }
    const int f = static_cast<int>(fp.formula);
    if (f < 0 || f >= FORMULA_COUNT)
        return "unknown formula";
    const int s = static_cast<int>(fp.trap.shape);
    if (s < 0 || s >= TRAP_SHAPE_COUNT)
        return "unknown trap shape";
    if (!std::isfinite(fp.trap.center_re) || !std::isfinite(fp.trap.center_im) ||
        !std::isfinite(fp.trap.angle))
        return "trap center and angle must be finite";
    if (fp.trap.shape == TrapShape::Circle &&
        (!(fp.trap.radius >= 0.0) || !std::isfinite(fp.trap.radius))) {
        std::snprintf(msg, sizeof(msg), "circle trap radius must be non-negative (got %g)",
                      fp.trap.radius);
        return msg;
    }
    if (fp.julia_mode && (!std::isfinite(fp.julia_re) || !std::isfinite(fp.julia_im)))
        return "Julia parameter must be finite";
    return {};
}

// -----------------------------------------------------------------------
// Orbit
// -----------------------------------------------------------------------
template<FormulaType F>
static std::vector<std::pair<double,double>>
orbit_of(double re, double im, const FractalParams& fp, int max_n)
{
    std::vector<std::pair<double,double>> pts;
    pts.reserve(static_cast<size_t>(std::max(max_n, 0)) + 1);

    double zr = fp.julia_mode ? re : 0.0;
    double zi = fp.julia_mode ? im : 0.0;
    const double cr = fp.julia_mode ? fp.julia_re : re;
    const double ci = fp.julia_mode ? fp.julia_im : im;
    const double radius2 = fp.escape_radius * fp.escape_radius;

    pts.push_back({zr, zi});
    for (int i = 0; i < max_n; ++i) {
        double new_zr, new_zi;
        formula_step<F>(zr, zi, zr*zr, zi*zi, cr, ci, new_zr, new_zi);
        zr = new_zr;
        zi = new_zi;
        pts.push_back({zr, zi});
        if (zr*zr + zi*zi >= radius2) break;
    }
    return pts;
}

std::vector<std::pair<double,double>>
compute_orbit(double re, double im, const FractalParams& fp, int max_n)
{
    switch (fp.formula) {
        case FormulaType::Standard:    return orbit_of<FormulaType::Standard>(re, im, fp, max_n);
        case FormulaType::BurningShip: return orbit_of<FormulaType::BurningShip>(re, im, fp, max_n);
        case FormulaType::Celtic:      return orbit_of<FormulaType::Celtic>(re, im, fp, max_n);
        case FormulaType::Buffalo:     return orbit_of<FormulaType::Buffalo>(re, im, fp, max_n);
        case FormulaType::Mandelbar:   return orbit_of<FormulaType::Mandelbar>(re, im, fp, max_n);
    }
    return orbit_of<FormulaType::Standard>(re, im, fp, max_n);
}
