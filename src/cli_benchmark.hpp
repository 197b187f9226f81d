#pragma once

#include "cpu_renderer.hpp"
#include "palette.hpp"
#include <cstdio>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

// Renders cfg once to warm up, then runs times and averages the best_n
// timings into avg_ms. Stops at the first failed render.
inline std::string time_render(CpuRenderer& renderer, const RenderConfig& cfg,
                               const Palette& palette, int runs, int best_n,
                               double& avg_ms)
{
    PixelBuffer buf;
    std::string err = renderer.render(cfg, palette, buf);
    if (!err.empty()) return err;

    std::vector<double> times(static_cast<size_t>(runs));
    for (int r = 0; r < runs; ++r) {
        err = renderer.render(cfg, palette, buf);
        if (!err.empty()) return err;
        times[r] = renderer.last_render_ms;
    }
    std::sort(times.begin(), times.end());
    best_n = std::min(best_n, runs);
    double sum = 0.0;
    for (int i = 0; i < best_n; ++i) sum += times[i];
    avg_ms = best_n > 0 ? sum / best_n : 0.0;
    return {};
}

inline int run_cli_benchmark()
{
    std::unique_ptr<Palette> palette;
    const std::string err = make_preset_palette("classic-ultra", palette);
    if (!err.empty()) {
        std::fprintf(stderr, "benchmark: %s\n", err.c_str());
        return 1;
    }

    CpuRenderer renderer;
    renderer.set_thread_count(1);

    constexpr int W = 1920, H = 1080, RUNS = 4, BEST_N = 2;
    struct TestCase {
        const char* label;
        FormulaType formula;
        bool        julia_mode;
        TrapShape   trap;
        bool        force_scalar;
    };

    const TestCase tests[] = {
        // AVX2 path
        {"Mandelbrot / point",      FormulaType::Standard,    false, TrapShape::Point,  false},
        {"Mandelbrot / cross",      FormulaType::Standard,    false, TrapShape::Cross,  false},
        {"Julia / circle",          FormulaType::Standard,    true,  TrapShape::Circle, false},
        {"Burning Ship / point",    FormulaType::BurningShip, false, TrapShape::Point,  false},
        {"Celtic / line",           FormulaType::Celtic,      false, TrapShape::Line,   false},
        {"Buffalo / point",         FormulaType::Buffalo,     false, TrapShape::Point,  false},
        {"Mandelbar / point",       FormulaType::Mandelbar,   false, TrapShape::Point,  false},
        // Scalar path
        {"Mandelbrot / point",      FormulaType::Standard,    false, TrapShape::Point,  true },
        {"Mandelbrot / cross",      FormulaType::Standard,    false, TrapShape::Cross,  true },
        {"Julia / circle",          FormulaType::Standard,    true,  TrapShape::Circle, true },
        {"Burning Ship / point",    FormulaType::BurningShip, false, TrapShape::Point,  true },
        {"Celtic / line",           FormulaType::Celtic,      false, TrapShape::Line,   true },
        {"Buffalo / point",         FormulaType::Buffalo,     false, TrapShape::Point,  true },
        {"Mandelbar / point",       FormulaType::Mandelbar,   false, TrapShape::Point,  true },
    };

    const bool has_avx = renderer.avx_available();

    std::printf("orbitrap CLI Benchmark\n");
    std::printf("%dx%d, 256 iter, 1 thread, %d runs (avg best %d)\n", W, H, RUNS, BEST_N);
    std::printf("AVX2 kernel available: %s\n\n", has_avx ? "yes" : "no");
    std::printf("%-30s %-10s %s\n", "Label", "Path", "Mpix/s");
    std::printf("------------------------------------------------\n");

    for (const auto& t : tests) {
        if (!t.force_scalar && !has_avx) continue;

        RenderConfig cfg;
        cfg.width               = W;
        cfg.height              = H;
        cfg.view.center_x       = -0.5;
        cfg.view.center_y       =  0.0;
        cfg.view.half_height    =  1.0;
        cfg.fractal.max_iter    =  256;
        cfg.fractal.formula     =  t.formula;
        cfg.fractal.julia_mode  =  t.julia_mode;
        cfg.fractal.trap.shape  =  t.trap;
        if (t.julia_mode) cfg.view.center_x = 0.0;

        renderer.set_avx(!t.force_scalar);

        double avg_ms = 0.0;
        const std::string rerr = time_render(renderer, cfg, *palette, RUNS, BEST_N, avg_ms);
        if (!rerr.empty()) {
            std::fprintf(stderr, "benchmark: %s\n", rerr.c_str());
            return 1;
        }
        const double mpixs = (W * H) / (avg_ms * 1000.0);

        std::printf("%-30s %-10s %6.2f\n", t.label, t.force_scalar ? "scalar" : "AVX2", mpixs);
    }

    renderer.set_avx(has_avx);  // restore
    return 0;
}
