#include "cli_options.hpp"
#include "cli_benchmark.hpp"
#include "cpu_renderer.hpp"
#include "export.hpp"
#include "palette.hpp"

#include <cstdio>
#include <memory>
#include <string>

int main(int argc, char* argv[])
{
    CliOptions opts;
    std::string err = parse_cli(argc, argv, opts);
    if (!err.empty()) {
        std::fprintf(stderr, "%s: %s\n\n", argv[0], err.c_str());
        print_usage(argv[0]);
        return 1;
    }
    if (opts.help) {
        print_usage(argv[0]);
        return 0;
    }
    if (opts.benchmark)
        return run_cli_benchmark();

    // Reject bad configuration before any pixel is computed.
    std::unique_ptr<Palette> palette;
    err = build_palette(opts, palette);
    if (err.empty())
        err = validate_render_config(opts.cfg);
    if (!err.empty()) {
        std::fprintf(stderr, "%s: %s\n", argv[0], err.c_str());
        return 1;
    }

    CpuRenderer renderer;
    renderer.set_thread_count(opts.threads);
    if (opts.force_scalar) renderer.set_avx(false);

    const std::string desc = describe_config(
        opts.cfg, opts.stops.empty() ? opts.palette_name.c_str() : nullptr);
    if (opts.verbose) {
        std::fprintf(stderr, "%s\n", desc.c_str());
        std::fprintf(stderr, "threads: %d, kernel: %s\n",
                     renderer.thread_count, renderer.avx_active ? "AVX2" : "scalar");
    }

    PixelBuffer pbuf;
    err = renderer.render(opts.cfg, *palette, pbuf);
    if (!err.empty()) {
        std::fprintf(stderr, "%s: render failed: %s\n", argv[0], err.c_str());
        return 1;
    }
    if (opts.verbose) {
        const double mpix = static_cast<double>(pbuf.width) * pbuf.height / 1e6;
        std::fprintf(stderr, "rendered %.2f Mpix in %.1f ms\n", mpix, renderer.last_render_ms);
    }

    err = export_png(opts.output.c_str(), pbuf, desc.c_str());
    if (!err.empty()) {
        std::fprintf(stderr, "%s: %s\n", argv[0], err.c_str());
        return 1;
    }
    std::printf("Saved %s (%dx%d)\n", opts.output.c_str(), pbuf.width, pbuf.height);
    return 0;
}
