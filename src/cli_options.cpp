#include "cli_options.hpp"

#include <getopt.h>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace {

enum LongOnly {
    OPT_TRAP_CENTER = 1000,
    OPT_TRAP_RADIUS,
    OPT_TRAP_ANGLE,
    OPT_TRAP_FALLOFF,
    OPT_SMOOTH_BLEND,
    OPT_STOPS,
    OPT_INTERIOR,
    OPT_SCALAR,
    OPT_BENCHMARK,
};

const struct option long_options[] = {
    {"output",       required_argument, nullptr, 'o'},
    {"size",         required_argument, nullptr, 's'},
    {"center",       required_argument, nullptr, 'c'},
    {"half-height",  required_argument, nullptr, 'H'},
    {"zoom",         required_argument, nullptr, 'z'},
    {"iterations",   required_argument, nullptr, 'i'},
    {"radius",       required_argument, nullptr, 'r'},
    {"formula",      required_argument, nullptr, 'f'},
    {"julia",        required_argument, nullptr, 'j'},
    {"trap",         required_argument, nullptr, 't'},
    {"palette",      required_argument, nullptr, 'p'},
    {"threads",      required_argument, nullptr, 'n'},
    {"trap-center",  required_argument, nullptr, OPT_TRAP_CENTER},
    {"trap-radius",  required_argument, nullptr, OPT_TRAP_RADIUS},
    {"trap-angle",   required_argument, nullptr, OPT_TRAP_ANGLE},
    {"trap-falloff", required_argument, nullptr, OPT_TRAP_FALLOFF},
    {"smooth-blend", required_argument, nullptr, OPT_SMOOTH_BLEND},
    {"stops",        required_argument, nullptr, OPT_STOPS},
    {"interior",     required_argument, nullptr, OPT_INTERIOR},
    {"scalar",       no_argument,       nullptr, OPT_SCALAR},
    {"benchmark",    no_argument,       nullptr, OPT_BENCHMARK},
    {"verbose",      no_argument,       nullptr, 'v'},
    {"help",         no_argument,       nullptr, 'h'},
    {nullptr, 0, nullptr, 0}
};

bool parse_double(const char* s, double& out)
{
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(s, &end);
    if (end == s || *end != '\0' || errno == ERANGE || !std::isfinite(v)) return false;
    out = v;
    return true;
}

bool parse_int(const char* s, int& out)
{
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(s, &end, 10);
    if (end == s || *end != '\0' || errno == ERANGE || v < -2147483647L || v > 2147483647L)
        return false;
    out = static_cast<int>(v);
    return true;
}

// "a<sep>b" -> two numbers
bool parse_pair(const char* s, char sep, double& a, double& b)
{
    const char* mid = std::strchr(s, sep);
    if (!mid) return false;
    const std::string first(s, static_cast<size_t>(mid - s));
    return parse_double(first.c_str(), a) && parse_double(mid + 1, b);
}

bool parse_formula(const char* s, FormulaType& out)
{
    for (int f = 0; f < FORMULA_COUNT; ++f) {
        const FormulaType ft = static_cast<FormulaType>(f);
        if (std::strcmp(s, formula_key(ft)) == 0) { out = ft; return true; }
    }
    return false;
}

bool parse_trap_shape(const char* s, TrapShape& out)
{
    for (int t = 0; t < TRAP_SHAPE_COUNT; ++t) {
        const TrapShape ts = static_cast<TrapShape>(t);
        if (std::strcmp(s, trap_shape_name(ts)) == 0) { out = ts; return true; }
    }
    return false;
}

bool parse_rgb(const char* s, Rgb& out)
{
    if (*s == '#') ++s;
    if (std::strlen(s) != 6) return false;
    for (int i = 0; i < 6; ++i)
        if (!std::isxdigit(static_cast<unsigned char>(s[i]))) return false;
    const unsigned long v = std::strtoul(s, nullptr, 16);
    out = { static_cast<uint8_t>((v >> 16) & 0xFFu),
            static_cast<uint8_t>((v >>  8) & 0xFFu),
            static_cast<uint8_t>( v        & 0xFFu) };
    return true;
}

std::string bad_value(const char* what, const char* value)
{
    return std::string("invalid ") + what + ": '" + value + "'";
}

} // namespace

std::string parse_cli(int argc, char* argv[], CliOptions& opts)
{
    RenderConfig&  cfg = opts.cfg;
    FractalParams& fp  = cfg.fractal;

    optind = 0;   // restart scanning (GNU getopt)
    opterr = 0;
    int opt;
    while ((opt = getopt_long(argc, argv, "o:s:c:H:z:i:r:f:j:t:p:n:vh",
                              long_options, nullptr)) != -1) {
        switch (opt) {
            case 'o':
                opts.output = optarg;
                break;
            case 's': {
                double w = 0.0, h = 0.0;
                if (!parse_pair(optarg, 'x', w, h) || w != std::floor(w) || h != std::floor(h) ||
                    w < 1.0 || h < 1.0 || w > 65536.0 || h > 65536.0)
                    return bad_value("size (expected WxH)", optarg);
                cfg.width  = static_cast<int>(w);
                cfg.height = static_cast<int>(h);
                break;
            }
            case 'c':
                if (!parse_pair(optarg, ',', cfg.view.center_x, cfg.view.center_y))
                    return bad_value("center (expected re,im)", optarg);
                break;
            case 'H':
                if (!parse_double(optarg, cfg.view.half_height))
                    return bad_value("half-height", optarg);
                break;
            case 'z': {
                double zoom = 0.0;
                if (!parse_double(optarg, zoom) || zoom <= 0.0)
                    return bad_value("zoom", optarg);
                set_zoom(cfg.view, zoom);
                break;
            }
            case 'i':
                if (!parse_int(optarg, fp.max_iter))
                    return bad_value("iterations", optarg);
                break;
            case 'r':
                if (!parse_double(optarg, fp.escape_radius))
                    return bad_value("escape radius", optarg);
                break;
            case 'f':
                if (!parse_formula(optarg, fp.formula))
                    return bad_value("formula", optarg);
                break;
            case 'j':
                if (!parse_pair(optarg, ',', fp.julia_re, fp.julia_im))
                    return bad_value("Julia parameter (expected re,im)", optarg);
                fp.julia_mode = true;
                break;
            case 't':
                if (!parse_trap_shape(optarg, fp.trap.shape))
                    return bad_value("trap shape", optarg);
                break;
            case 'p':
                opts.palette_name = optarg;
                break;
            case 'n':
                if (!parse_int(optarg, opts.threads) || opts.threads < 0)
                    return bad_value("thread count", optarg);
                break;
            case OPT_TRAP_CENTER:
                if (!parse_pair(optarg, ',', fp.trap.center_re, fp.trap.center_im))
                    return bad_value("trap center (expected re,im)", optarg);
                break;
            case OPT_TRAP_RADIUS:
                if (!parse_double(optarg, fp.trap.radius))
                    return bad_value("trap radius", optarg);
                break;
            case OPT_TRAP_ANGLE: {
                double degrees = 0.0;
                if (!parse_double(optarg, degrees))
                    return bad_value("trap angle", optarg);
                fp.trap.angle = degrees * 3.14159265358979323846 / 180.0;
                break;
            }
            case OPT_TRAP_FALLOFF:
                if (!parse_double(optarg, cfg.coloring.trap_falloff))
                    return bad_value("trap falloff", optarg);
                break;
            case OPT_SMOOTH_BLEND:
                if (!parse_double(optarg, cfg.coloring.smooth_blend))
                    return bad_value("smooth blend", optarg);
                break;
            case OPT_STOPS:
                opts.stops = optarg;
                break;
            case OPT_INTERIOR:
                if (std::strcmp(optarg, "palette") == 0)
                    cfg.coloring.interior_from_palette = true;
                else if (!parse_rgb(optarg, cfg.coloring.interior))
                    return bad_value("interior color (expected RRGGBB or 'palette')", optarg);
                break;
            case OPT_SCALAR:
                opts.force_scalar = true;
                break;
            case OPT_BENCHMARK:
                opts.benchmark = true;
                break;
            case 'v':
                opts.verbose = true;
                break;
            case 'h':
                opts.help = true;
                break;
            default: {
                const char* arg = (optind > 0 && optind <= argc) ? argv[optind - 1] : "?";
                return std::string("unknown or incomplete option: ") + arg;
            }
        }
    }
    if (optind < argc)
        return std::string("unexpected argument: ") + argv[optind];
    return {};
}

void print_usage(const char* prog)
{
    std::printf("Usage: %s [options]\n\n", prog);
    std::printf("Output\n");
    std::printf("  -o, --output FILE        PNG file to write (default orbitrap.png)\n");
    std::printf("  -s, --size WxH           raster size in pixels (default 1024x768)\n");
    std::printf("View\n");
    std::printf("  -c, --center RE,IM       view center (default -0.5,0)\n");
    std::printf("  -H, --half-height H      imaginary half-extent of the view (default 1.5)\n");
    std::printf("  -z, --zoom Z             zoom factor, same as --half-height 1.5/Z\n");
    std::printf("Fractal\n");
    std::printf("  -i, --iterations N       maximum iterations (default 256)\n");
    std::printf("  -r, --radius R           escape radius (default 2)\n");
    std::printf("  -f, --formula NAME       mandelbrot | burning-ship | celtic | buffalo | mandelbar\n");
    std::printf("  -j, --julia RE,IM        Julia mode with parameter c = RE + i*IM\n");
    std::printf("Orbit trap\n");
    std::printf("  -t, --trap SHAPE         point | circle | line | cross (default point)\n");
    std::printf("      --trap-center RE,IM  trap center (default 0,0)\n");
    std::printf("      --trap-radius R      circle trap radius (default 0.5)\n");
    std::printf("      --trap-angle DEG     line / cross orientation (default 0)\n");
    std::printf("Coloring\n");
    std::printf("  -p, --palette NAME       ");
    for (int i = 0; i < PALETTE_COUNT; ++i)
        std::printf("%s%s", g_palette_names[i], i + 1 < PALETTE_COUNT ? " | " : "\n");
    std::printf("      --stops LIST         custom palette, e.g. 0:000000,0.5:ff8000,1:ffffff\n");
    std::printf("      --trap-falloff D     trap distance mapped to 1-1/e (default 0.25)\n");
    std::printf("      --smooth-blend B     0 = trap only, 1 = smooth iteration count only\n");
    std::printf("      --interior RRGGBB    interior color, or 'palette' (default 000000)\n");
    std::printf("Execution\n");
    std::printf("  -n, --threads N          worker threads (default: all cores)\n");
    std::printf("      --scalar             disable the AVX2 kernel\n");
    std::printf("      --benchmark          run the built-in benchmark and exit\n");
    std::printf("  -v, --verbose            print configuration and timing\n");
    std::printf("  -h, --help               show this help\n");
}

std::string build_palette(const CliOptions& opts, std::unique_ptr<Palette>& out)
{
    if (opts.stops.empty())
        return make_preset_palette(opts.palette_name, out);

    std::vector<ColorStop> stops;
    std::string err = parse_color_stops(opts.stops, stops);
    if (!err.empty()) return err;
    return GradientPalette::create(std::move(stops), out);
}
