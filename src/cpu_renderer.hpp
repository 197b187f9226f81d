#pragma once

#include "renderer.hpp"
#include "cpu_renderer_avx.hpp"
#include "thread_pool.hpp"

#include <memory>
#include <string>
#include <vector>

class CpuRenderer : public IFractalRenderer {
public:
    CpuRenderer();
    std::string render(const RenderConfig& cfg, const Palette& palette,
                       PixelBuffer& buf) override;

    // Same traversal as render() but keeps the raw per-pixel results
    // (row-major, width * height entries) instead of colors.
    std::string evaluate(const RenderConfig& cfg, std::vector<PixelResult>& out);

    double last_render_ms = 0.0;
    bool   avx_active     = false;   // true if AVX path is in use
    int    thread_count   = 0;
    int    hw_concurrency = 0;       // logical CPU count detected at startup

    // n=0 restores hw_concurrency
    void set_thread_count(int n);

    // Override AVX flag (e.g. for benchmarking scalar path). Ignored when
    // the AVX kernels are not compiled in or the CPU lacks AVX2.
    void set_avx(bool b) { avx_active = b && avx_supported; }
    bool avx_available() const { return avx_supported; }

private:
    // Calls emit(px, py, result) for every pixel. Tiles are disjoint, so
    // emit may write per-pixel output without synchronization.
    template<typename Emit>
    void run_tiles(const RenderConfig& cfg, const Emit& emit);

    template<typename Emit>
    static void render_tile(const KernelParams& kp, const PlaneMapping& map,
                            KernelFn kernel, AvxKernelFn avx_kernel, const Emit& emit,
                            int tx, int ty, int tw, int th);

    std::unique_ptr<ThreadPool> pool;
    bool avx_supported = false;
};
