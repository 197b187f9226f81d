#include <gtest/gtest.h>

#include "cli_benchmark.hpp"
#include "cpu_renderer.hpp"
#include "palette.hpp"

#include <memory>
#include <vector>

namespace {

RenderConfig cardioid_scene()
{
    RenderConfig cfg;
    cfg.view.center_x      = -0.5;
    cfg.view.center_y      =  0.0;
    cfg.view.half_height   =  1.5;
    cfg.width              =  100;
    cfg.height             =  100;
    cfg.fractal.max_iter      = 50;
    cfg.fractal.escape_radius = 2.0;
    return cfg;
}

std::unique_ptr<Palette> preset(const char* name)
{
    std::unique_ptr<Palette> p;
    EXPECT_EQ(make_preset_palette(name, p), "");
    return p;
}

} // namespace

TEST(CpuRenderer, CenterOfCardioidSceneIsInterior)
{
    CpuRenderer renderer;
    std::vector<PixelResult> results;
    ASSERT_EQ(renderer.evaluate(cardioid_scene(), results), "");
    ASSERT_EQ(results.size(), 100u * 100u);

    const PixelResult& center = results[50 * 100 + 50];
    EXPECT_FALSE(center.escaped);
    EXPECT_EQ(center.iterations, 50);
}

TEST(CpuRenderer, SceneOutsideTheSetEscapesQuickly)
{
    RenderConfig cfg = cardioid_scene();
    cfg.view.center_x    = 2.0;
    cfg.view.center_y    = 2.0;
    cfg.view.half_height = 0.1;
    cfg.width  = 10;
    cfg.height = 10;

    CpuRenderer renderer;
    std::vector<PixelResult> results;
    ASSERT_EQ(renderer.evaluate(cfg, results), "");
    ASSERT_EQ(results.size(), 100u);
    for (const PixelResult& r : results) {
        EXPECT_TRUE(r.escaped);
        EXPECT_LE(r.iterations, 3);
    }
}

TEST(CpuRenderer, MatchesSinglePointEvaluation)
{
    RenderConfig cfg = cardioid_scene();
    cfg.width  = 37;   // not a multiple of the tile or vector width
    cfg.height = 23;
    cfg.fractal.trap.shape = TrapShape::Cross;
    cfg.fractal.trap.angle = 0.3;

    CpuRenderer renderer;
    renderer.set_avx(false);
    std::vector<PixelResult> results;
    ASSERT_EQ(renderer.evaluate(cfg, results), "");

    const PlaneMapping map = make_plane_mapping(cfg.view, cfg.width, cfg.height);
    for (int py = 0; py < cfg.height; ++py) {
        for (int px = 0; px < cfg.width; ++px) {
            const PixelResult expect = evaluate_point(plane_re(map, px), plane_im(map, py),
                                                      cfg.fractal);
            const PixelResult& got = results[static_cast<size_t>(py) * cfg.width + px];
            EXPECT_EQ(got.escaped, expect.escaped);
            EXPECT_EQ(got.iterations, expect.iterations);
            EXPECT_EQ(got.trap_distance, expect.trap_distance);
        }
    }
}

TEST(CpuRenderer, RenderIsBitIdenticalAcrossRuns)
{
    auto palette = preset("fire");
    RenderConfig cfg = cardioid_scene();
    cfg.width  = 160;
    cfg.height = 90;

    CpuRenderer renderer;
    PixelBuffer a, b;
    ASSERT_EQ(renderer.render(cfg, *palette, a), "");
    ASSERT_EQ(renderer.render(cfg, *palette, b), "");
    EXPECT_EQ(a.width, 160);
    EXPECT_EQ(a.height, 90);
    EXPECT_EQ(a.pixels, b.pixels);
}

TEST(CpuRenderer, ThreadCountDoesNotChangeOutput)
{
    auto palette = preset("classic-ultra");
    RenderConfig cfg = cardioid_scene();
    cfg.width  = 200;
    cfg.height = 130;
    cfg.fractal.max_iter = 200;

    CpuRenderer renderer;
    PixelBuffer single, multi;
    renderer.set_thread_count(1);
    ASSERT_EQ(renderer.render(cfg, *palette, single), "");
    renderer.set_thread_count(7);
    ASSERT_EQ(renderer.render(cfg, *palette, multi), "");
    EXPECT_EQ(single.pixels, multi.pixels);
}

TEST(CpuRenderer, InteriorPixelsGetInteriorColor)
{
    auto palette = preset("ice");
    RenderConfig cfg = cardioid_scene();
    cfg.coloring.interior = {7, 8, 9};

    CpuRenderer renderer;
    PixelBuffer buf;
    ASSERT_EQ(renderer.render(cfg, *palette, buf), "");
    EXPECT_EQ(buf.at(50, 50), pack_rgba({7, 8, 9}));
    // Top-left corner (-2.5, 1.5) is far outside the set
    EXPECT_NE(buf.at(0, 0), pack_rgba({7, 8, 9}));
}

TEST(CpuRenderer, SinglePixelRaster)
{
    auto palette = preset("grayscale");
    RenderConfig cfg = cardioid_scene();
    cfg.width  = 1;
    cfg.height = 1;

    CpuRenderer renderer;
    std::vector<PixelResult> results;
    ASSERT_EQ(renderer.evaluate(cfg, results), "");
    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].escaped);   // lands on the view center, -0.5
}

TEST(CpuRenderer, RejectsBadConfigBeforeRendering)
{
    auto palette = preset("fire");
    CpuRenderer renderer;

    PixelBuffer buf;
    buf.resize(3, 2);
    const std::vector<uint32_t> before = buf.pixels;

    RenderConfig cfg = cardioid_scene();
    cfg.width = 0;
    EXPECT_NE(renderer.render(cfg, *palette, buf), "");

    cfg = cardioid_scene();
    cfg.height = -4;
    EXPECT_NE(renderer.render(cfg, *palette, buf), "");

    cfg = cardioid_scene();
    cfg.fractal.max_iter = 0;
    EXPECT_NE(renderer.render(cfg, *palette, buf), "");

    cfg = cardioid_scene();
    cfg.fractal.escape_radius = -1.0;
    EXPECT_NE(renderer.render(cfg, *palette, buf), "");

    cfg = cardioid_scene();
    cfg.view.half_height = 0.0;
    EXPECT_NE(renderer.render(cfg, *palette, buf), "");

    cfg = cardioid_scene();
    cfg.coloring.trap_falloff = -1.0;
    EXPECT_NE(renderer.render(cfg, *palette, buf), "");

    EXPECT_EQ(buf.width, 3);
    EXPECT_EQ(buf.height, 2);
    EXPECT_EQ(buf.pixels, before);
}

TEST(CpuRenderer, VectorKernelMatchesScalar)
{
    CpuRenderer renderer;
    if (!renderer.avx_available())
        GTEST_SKIP() << "AVX2 kernels not available";

    for (int f = 0; f < FORMULA_COUNT; ++f) {
        for (int s = 0; s < TRAP_SHAPE_COUNT; ++s) {
            for (bool julia : {false, true}) {
                RenderConfig cfg = cardioid_scene();
                cfg.width  = 67;
                cfg.height = 41;
                cfg.view.center_x      = julia ? 0.0 : -0.5;
                cfg.fractal.max_iter   = 120;
                cfg.fractal.formula    = static_cast<FormulaType>(f);
                cfg.fractal.julia_mode = julia;
                cfg.fractal.trap.shape = static_cast<TrapShape>(s);
                cfg.fractal.trap.center_re = 0.2;
                cfg.fractal.trap.center_im = -0.1;
                cfg.fractal.trap.angle     = 0.6;

                std::vector<PixelResult> scalar, vec;
                renderer.set_avx(false);
                ASSERT_EQ(renderer.evaluate(cfg, scalar), "");
                renderer.set_avx(true);
                ASSERT_EQ(renderer.evaluate(cfg, vec), "");
                ASSERT_EQ(scalar.size(), vec.size());

                for (size_t i = 0; i < scalar.size(); ++i) {
                    EXPECT_EQ(vec[i].escaped, scalar[i].escaped) << i;
                    EXPECT_EQ(vec[i].iterations, scalar[i].iterations) << i;
                    EXPECT_EQ(vec[i].trap_distance, scalar[i].trap_distance) << i;
                    EXPECT_NEAR(vec[i].smooth, scalar[i].smooth, 1e-9) << i;
                }
            }
        }
    }
}

TEST(PixelBuffer, MutableAtWritesInPlace)
{
    PixelBuffer buf;
    buf.resize(4, 3);
    buf.at(3, 2) = pack_rgba({1, 2, 3});
    EXPECT_EQ(buf.pixels[2 * 4 + 3], pack_rgba({1, 2, 3}));
    const PixelBuffer& cbuf = buf;
    EXPECT_EQ(cbuf.at(3, 2), pack_rgba({1, 2, 3}));
    EXPECT_EQ(cbuf.at(0, 0), 0xFF000000u);
}

TEST(CliBenchmark, TimeRenderReportsFailedRender)
{
    auto palette = preset("fire");
    CpuRenderer renderer;
    RenderConfig cfg = cardioid_scene();
    cfg.fractal.max_iter = 0;
    double avg_ms = -1.0;
    EXPECT_NE(time_render(renderer, cfg, *palette, 3, 2, avg_ms), "");
    EXPECT_EQ(avg_ms, -1.0);

    cfg = cardioid_scene();
    cfg.width  = 16;
    cfg.height = 16;
    ASSERT_EQ(time_render(renderer, cfg, *palette, 3, 2, avg_ms), "");
    EXPECT_GE(avg_ms, 0.0);
}
