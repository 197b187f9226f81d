#pragma once

#include "fractal.hpp"   // FormulaType, KernelParams, PixelResult

// AVX2 orbit-trap kernels, implementations in cpu_renderer_avx.cpp
// Each call evaluates 4 points that share one imaginary coordinate.
// re4:  real coordinates of the 4 points (usually 4 adjacent pixels)
// im:   imaginary coordinate of the row
// out4: receives 4 results, identical to the scalar kernel's except for
//       the smooth value, which uses SLEEF's vector log
using AvxKernelFn = void (*)(const double* re4, double im,
                             const KernelParams& kp, PixelResult* out4);

AvxKernelFn select_avx_kernel(FormulaType formula, bool julia_mode, TrapShape shape);
