#include "export.hpp"

#include <png.h>
#include <cstdio>
#include <cstring>

// ---------------------------------------------------------------------------
// PNG export
//
// Pixel layout: each uint32_t stores 0xAA BB GG RR.
// On a little-endian machine the bytes in memory are [R, G, B, A], which is
// exactly what PNG_COLOR_TYPE_RGBA expects, no conversion needed.
// ---------------------------------------------------------------------------
std::string export_png(const char* path, const PixelBuffer& buf, const char* description)
{
    if (buf.width <= 0 || buf.height <= 0 ||
        buf.pixels.size() != static_cast<size_t>(buf.width) * static_cast<size_t>(buf.height))
        return "Pixel buffer is empty or inconsistent";

    FILE* fp = std::fopen(path, "wb");
    if (!fp)
        return std::string("Cannot open file for writing: ") + path;

    png_structp png = png_create_write_struct(
        PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        std::fclose(fp);
        return "png_create_write_struct failed";
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        std::fclose(fp);
        return "png_create_info_struct failed";
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        std::fclose(fp);
        return "PNG write error (libpng longjmp)";
    }

    png_init_io(png, fp);
    png_set_IHDR(png, info,
                 static_cast<png_uint_32>(buf.width),
                 static_cast<png_uint_32>(buf.height),
                 8, PNG_COLOR_TYPE_RGBA,
                 PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);

    png_text text[2];
    std::memset(text, 0, sizeof(text));
    int n_text = 0;
    text[n_text].compression = PNG_TEXT_COMPRESSION_NONE;
    text[n_text].key         = const_cast<png_charp>("Software");
    text[n_text].text        = const_cast<png_charp>("orbitrap");
    ++n_text;
    if (description && *description) {
        text[n_text].compression = PNG_TEXT_COMPRESSION_NONE;
        text[n_text].key         = const_cast<png_charp>("Description");
        text[n_text].text        = const_cast<png_charp>(description);
        ++n_text;
    }
    png_set_text(png, info, text, n_text);

    png_write_info(png, info);

    for (int y = 0; y < buf.height; ++y) {
        const png_const_bytep row = reinterpret_cast<png_const_bytep>(
            buf.pixels.data() + static_cast<size_t>(y) * buf.width);
        png_write_row(png, row);
    }

    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    if (std::fclose(fp) != 0)
        return std::string("Error closing file: ") + path;
    return {};  // success
}

std::string describe_config(const RenderConfig& cfg, const char* palette_label)
{
    const FractalParams& fp = cfg.fractal;
    char buf[512];
    int  len = std::snprintf(buf, sizeof(buf),
        "%s %dx%d center=(%.17g, %.17g) half-height=%.17g iter=%d radius=%g "
        "trap=%s(%g, %g) palette=%s",
        fractal_name(fp), cfg.width, cfg.height,
        cfg.view.center_x, cfg.view.center_y, cfg.view.half_height,
        fp.max_iter, fp.escape_radius,
        trap_shape_name(fp.trap.shape), fp.trap.center_re, fp.trap.center_im,
        palette_label ? palette_label : "custom");
    if (fp.julia_mode && len > 0 && static_cast<size_t>(len) < sizeof(buf))
        std::snprintf(buf + len, sizeof(buf) - static_cast<size_t>(len),
                      " c=(%.17g, %.17g)", fp.julia_re, fp.julia_im);
    return buf;
}
