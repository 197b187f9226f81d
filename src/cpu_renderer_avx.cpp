// Compiled with -mavx2 only. Do NOT include from other translation units.
// Avoid calling inline helpers from fractal.hpp / orbit_trap.hpp here: an
// AVX2 copy of an inline function could be the one the linker keeps.

#include "cpu_renderer_avx.hpp"

#include <immintrin.h>
#include <sleef.h>
#include <cmath>
#include <limits>

// -----------------------------------------------------------------------
// Trap metric for 4 lanes, same operation order as trap_metric<S>() so
// the running minimum matches the scalar path bit for bit.
// -----------------------------------------------------------------------
template<TrapShape S>
static inline __m256d avx_trap_metric(const TrapGeometry& g, __m256d zr, __m256d zi)
{
    const __m256d sign_bit = _mm256_set1_pd(-0.0);
    const __m256d dr = _mm256_sub_pd(zr, _mm256_set1_pd(g.center_re));
    const __m256d di = _mm256_sub_pd(zi, _mm256_set1_pd(g.center_im));

    if constexpr (S == TrapShape::Point) {
        return _mm256_add_pd(_mm256_mul_pd(dr, dr), _mm256_mul_pd(di, di));
    } else if constexpr (S == TrapShape::Circle) {
        const __m256d d = _mm256_sqrt_pd(
            _mm256_add_pd(_mm256_mul_pd(dr, dr), _mm256_mul_pd(di, di)));
        return _mm256_andnot_pd(sign_bit, _mm256_sub_pd(d, _mm256_set1_pd(g.radius)));
    } else {
        const __m256d dir_re = _mm256_set1_pd(g.dir_re);
        const __m256d dir_im = _mm256_set1_pd(g.dir_im);
        const __m256d along  = _mm256_andnot_pd(sign_bit,
            _mm256_sub_pd(_mm256_mul_pd(dr, dir_im), _mm256_mul_pd(di, dir_re)));
        if constexpr (S == TrapShape::Line) {
            return along;
        } else {
            const __m256d across = _mm256_andnot_pd(sign_bit,
                _mm256_add_pd(_mm256_mul_pd(dr, dir_re), _mm256_mul_pd(di, dir_im)));
            // min(along, across): pick across only where it is strictly smaller
            return _mm256_blendv_pd(along, across,
                                    _mm256_cmp_pd(across, along, _CMP_LT_OQ));
        }
    }
}

// -----------------------------------------------------------------------
// Generic AVX2 kernel, 4 points per call.
//
//  - iters counted by accumulation for lanes still active after the update
//  - z update keeps the scalar operation order (no FMA)
//  - escaped lanes are frozen with blendv; loop exits when all have escaped
// -----------------------------------------------------------------------
template<FormulaType F, bool IsJulia, TrapShape S>
static void avx_trap_kernel(const double* re4, double im,
                            const KernelParams& kp, PixelResult* out4)
{
    const __m256d re_v = _mm256_loadu_pd(re4);
    __m256d cr, ci, zr, zi;
    if constexpr (IsJulia) {
        cr = _mm256_set1_pd(kp.julia_re);
        ci = _mm256_set1_pd(kp.julia_im);
        zr = re_v;
        zi = _mm256_set1_pd(im);
    } else {
        cr = re_v;
        ci = _mm256_set1_pd(im);
        zr = _mm256_setzero_pd();
        zi = _mm256_setzero_pd();
    }

    const __m256d radius2  = _mm256_set1_pd(kp.radius2);
    const __m256d one      = _mm256_set1_pd(1.0);
    const __m256d two      = _mm256_set1_pd(2.0);
    const __m256d sign_bit = _mm256_set1_pd(-0.0);

    __m256d active   = _mm256_castsi256_pd(_mm256_set1_epi64x(-1LL));
    __m256d iters_d  = _mm256_setzero_pd();
    __m256d final_r2 = radius2;
    __m256d trap_min = _mm256_set1_pd(std::numeric_limits<double>::infinity());
    const __m256d trap_z0 = avx_trap_metric<S>(kp.trap, zr, zi);

    for (int i = 0; i < kp.max_iter; ++i) {
        const __m256d zr2  = _mm256_mul_pd(zr, zr);
        const __m256d zi2  = _mm256_mul_pd(zi, zi);
        const __m256d mag2 = _mm256_add_pd(zr2, zi2);

        // Lanes escaping this iteration (mag2 >= R^2 AND still active)
        const __m256d just_esc = _mm256_and_pd(
            _mm256_cmp_pd(mag2, radius2, _CMP_GE_OQ), active);
        final_r2 = _mm256_blendv_pd(final_r2, mag2, just_esc);
        active   = _mm256_andnot_pd(just_esc, active);

        if (_mm256_movemask_pd(active) == 0) break;

        const __m256d re_sq  = _mm256_sub_pd(zr2, zi2);                      // zr^2 - zi^2
        const __m256d cross2 = _mm256_mul_pd(_mm256_mul_pd(two, zr), zi);    // 2*zr*zi
        __m256d new_zr, new_zi;
        if constexpr (F == FormulaType::BurningShip) {
            new_zr = _mm256_add_pd(re_sq, cr);
            new_zi = _mm256_add_pd(_mm256_andnot_pd(sign_bit, cross2), ci);
        } else if constexpr (F == FormulaType::Celtic) {
            new_zr = _mm256_add_pd(_mm256_andnot_pd(sign_bit, re_sq), cr);
            new_zi = _mm256_add_pd(cross2, ci);
        } else if constexpr (F == FormulaType::Buffalo) {
            new_zr = _mm256_add_pd(_mm256_andnot_pd(sign_bit, re_sq), cr);
            new_zi = _mm256_add_pd(_mm256_andnot_pd(sign_bit, cross2), ci);
        } else if constexpr (F == FormulaType::Mandelbar) {
            new_zr = _mm256_add_pd(re_sq, cr);
            new_zi = _mm256_add_pd(_mm256_xor_pd(cross2, sign_bit), ci);     // -2*zr*zi + ci
        } else {
            new_zr = _mm256_add_pd(re_sq, cr);
            new_zi = _mm256_add_pd(cross2, ci);
        }

        zr = _mm256_blendv_pd(zr, new_zr, active);
        zi = _mm256_blendv_pd(zi, new_zi, active);

        // Running minimum: replace only where the new sample is strictly smaller
        const __m256d m      = avx_trap_metric<S>(kp.trap, zr, zi);
        const __m256d better = _mm256_and_pd(_mm256_cmp_pd(m, trap_min, _CMP_LT_OQ), active);
        trap_min = _mm256_blendv_pd(trap_min, m, better);

        iters_d = _mm256_add_pd(iters_d, _mm256_and_pd(active, one));
    }

    // Lanes that escaped before any update report the distance of z0
    const __m256d at_start = _mm256_andnot_pd(active,
        _mm256_cmp_pd(iters_d, _mm256_setzero_pd(), _CMP_EQ_OQ));
    trap_min = _mm256_blendv_pd(trap_min, trap_z0, at_start);
    if constexpr (S == TrapShape::Point)
        trap_min = _mm256_sqrt_pd(trap_min);

    // smooth = iters + 1 - log2(log|z| / log R)
    const __m256d max_d_v = _mm256_set1_pd(static_cast<double>(kp.max_iter));
    __m256d smooth = iters_d;
    if (kp.smooth_ok) {
        const __m256d inv_log2 = _mm256_set1_pd(1.0 / std::log(2.0));
        const __m256d log_zn   = _mm256_mul_pd(Sleef_logd4_u35(final_r2), _mm256_set1_pd(0.5));
        const __m256d nu       = _mm256_mul_pd(
            Sleef_logd4_u35(_mm256_div_pd(log_zn, _mm256_set1_pd(kp.log_radius))), inv_log2);
        smooth = _mm256_max_pd(_mm256_setzero_pd(),
                               _mm256_sub_pd(_mm256_add_pd(iters_d, one), nu));
    }
    // Interior points (still active) get max_iter
    smooth  = _mm256_blendv_pd(smooth,  max_d_v, active);
    iters_d = _mm256_blendv_pd(iters_d, max_d_v, active);

    double iters[4], smooth4[4], trap4[4];
    _mm256_storeu_pd(iters,   iters_d);
    _mm256_storeu_pd(smooth4, smooth);
    _mm256_storeu_pd(trap4,   trap_min);
    const int active_mask = _mm256_movemask_pd(active);

    for (int k = 0; k < 4; ++k) {
        out4[k].escaped       = ((active_mask >> k) & 1) == 0;
        out4[k].iterations    = static_cast<int>(iters[k]);
        out4[k].smooth        = smooth4[k];
        out4[k].trap_distance = trap4[k];
    }
}

// -----------------------------------------------------------------------
// Dispatch
// -----------------------------------------------------------------------
template<FormulaType F, bool IsJulia>
static AvxKernelFn avx_pick_trap(TrapShape shape)
{
    switch (shape) {
        case TrapShape::Point:  return &avx_trap_kernel<F, IsJulia, TrapShape::Point>;
        case TrapShape::Circle: return &avx_trap_kernel<F, IsJulia, TrapShape::Circle>;
        case TrapShape::Line:   return &avx_trap_kernel<F, IsJulia, TrapShape::Line>;
        case TrapShape::Cross:  return &avx_trap_kernel<F, IsJulia, TrapShape::Cross>;
    }
    return &avx_trap_kernel<F, IsJulia, TrapShape::Point>;
}

template<FormulaType F>
static AvxKernelFn avx_pick_mode(bool julia_mode, TrapShape shape)
{
    return julia_mode ? avx_pick_trap<F, true>(shape) : avx_pick_trap<F, false>(shape);
}

AvxKernelFn select_avx_kernel(FormulaType formula, bool julia_mode, TrapShape shape)
{
    switch (formula) {
        case FormulaType::Standard:
            return avx_pick_mode<FormulaType::Standard>(julia_mode, shape);
        case FormulaType::BurningShip:
            return avx_pick_mode<FormulaType::BurningShip>(julia_mode, shape);
        case FormulaType::Celtic:
            return avx_pick_mode<FormulaType::Celtic>(julia_mode, shape);
        case FormulaType::Buffalo:
            return avx_pick_mode<FormulaType::Buffalo>(julia_mode, shape);
        case FormulaType::Mandelbar:
            return avx_pick_mode<FormulaType::Mandelbar>(julia_mode, shape);
    }
    return avx_pick_mode<FormulaType::Standard>(julia_mode, shape);
}
