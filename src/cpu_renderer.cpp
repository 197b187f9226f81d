#include "cpu_renderer.hpp"
#include "fractal.hpp"
#include "palette.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

// -----------------------------------------------------------------------
// Constructor: detect AVX2, build thread pool
// -----------------------------------------------------------------------
CpuRenderer::CpuRenderer()
{
#ifdef HAVE_SLEEF
    avx_supported = __builtin_cpu_supports("avx2");
#endif
    avx_active = avx_supported;

    int n = static_cast<int>(std::thread::hardware_concurrency());
    if (n < 1) n = 4;
    hw_concurrency = n;
    thread_count   = n;
    pool = std::make_unique<ThreadPool>(n);
}

void CpuRenderer::set_thread_count(int n)
{
    if (n < 1) n = hw_concurrency;
    if (n == thread_count && pool) return;
    pool = std::make_unique<ThreadPool>(n);
    thread_count = n;
}

// -----------------------------------------------------------------------
// Tile renderer, called from thread pool workers
// -----------------------------------------------------------------------
template<typename Emit>
void CpuRenderer::render_tile(const KernelParams& kp, const PlaneMapping& map,
                              KernelFn kernel, AvxKernelFn avx_kernel, const Emit& emit,
                              int tx, int ty, int tw, int th)
{
    const int end_x = std::min(tx + tw, map.width);
    const int end_y = std::min(ty + th, map.height);

    for (int py = ty; py < end_y; ++py) {
        const double im = plane_im(map, py);
        int          px = tx;

        // --- AVX2 path: 4 pixels per call ---
        if (avx_kernel) {
            for (; px + 4 <= end_x; px += 4) {
                double      re4[4];
                PixelResult res4[4];
                for (int k = 0; k < 4; ++k)
                    re4[k] = plane_re(map, px + k);
                avx_kernel(re4, im, kp, res4);
                for (int k = 0; k < 4; ++k)
                    emit(px + k, py, res4[k]);
            }
        }

        // --- Scalar path: remainder pixels (or full row if no AVX2) ---
        for (; px < end_x; ++px)
            emit(px, py, kernel(plane_re(map, px), im, kp));
    }
}

// -----------------------------------------------------------------------
// Splits the raster into tiles and dispatches them to the thread pool
// -----------------------------------------------------------------------
template<typename Emit>
void CpuRenderer::run_tiles(const RenderConfig& cfg, const Emit& emit)
{
    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();

    const FractalParams& fp     = cfg.fractal;
    const KernelParams   kp     = make_kernel_params(fp);
    const PlaneMapping   map    = make_plane_mapping(cfg.view, cfg.width, cfg.height);
    const KernelFn       kernel = select_kernel(fp.formula, fp.julia_mode, fp.trap.shape);
    AvxKernelFn avx_kernel = nullptr;
#ifdef HAVE_SLEEF
    if (avx_active)
        avx_kernel = select_avx_kernel(fp.formula, fp.julia_mode, fp.trap.shape);
#endif

    constexpr int TILE_W = 64;
    constexpr int TILE_H = 64;
    const int tiles_x = (cfg.width  + TILE_W - 1) / TILE_W;
    const int tiles_y = (cfg.height + TILE_H - 1) / TILE_H;

    pool->run(tiles_x * tiles_y, [&](int tile) {
        const int tx = (tile % tiles_x) * TILE_W;
        const int ty = (tile / tiles_x) * TILE_H;
        render_tile(kp, map, kernel, avx_kernel, emit, tx, ty, TILE_W, TILE_H);
    });

    last_render_ms = std::chrono::duration<double, std::milli>(
                         clock::now() - t0).count();
}

std::string CpuRenderer::render(const RenderConfig& cfg, const Palette& palette,
                                PixelBuffer& buf)
{
    std::string err = validate_render_config(cfg);
    if (!err.empty()) return err;

    buf.resize(cfg.width, cfg.height);
    uint32_t* const pixels   = buf.pixels.data();
    const int       W        = cfg.width;
    const int       max_iter = cfg.fractal.max_iter;
    const ColoringParams& cp = cfg.coloring;

    run_tiles(cfg, [&](int px, int py, const PixelResult& r) {
        pixels[static_cast<size_t>(py) * W + px] = pixel_color(r, max_iter, cp, palette);
    });
    return {};
}

std::string CpuRenderer::evaluate(const RenderConfig& cfg, std::vector<PixelResult>& out)
{
    std::string err = validate_render_config(cfg);
    if (!err.empty()) return err;

    out.assign(static_cast<size_t>(cfg.width) * static_cast<size_t>(cfg.height), PixelResult{});
    PixelResult* const results = out.data();
    const int          W       = cfg.width;

    run_tiles(cfg, [&](int px, int py, const PixelResult& r) {
        results[static_cast<size_t>(py) * W + px] = r;
    });
    return {};
}
