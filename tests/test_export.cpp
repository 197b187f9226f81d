#include <gtest/gtest.h>

#include "export.hpp"
#include "palette.hpp"

#include <png.h>

#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

namespace {

std::string temp_path(const char* name)
{
    return testing::TempDir() + name;
}

PixelBuffer checker(int w, int h)
{
    PixelBuffer buf;
    buf.resize(w, h);
    for (int y = 0; y < h; ++y)
        for (int x = 0; x < w; ++x)
            buf.at(x, y) = ((x + y) & 1) ? pack_rgba({255, 128, 0})
                                         : pack_rgba({0, 64, 200});
    return buf;
}

} // namespace

TEST(ExportPng, WritesPngSignature)
{
    const std::string path = temp_path("orbitrap_sig.png");
    ASSERT_EQ(export_png(path.c_str(), checker(8, 5)), "");

    FILE* fp = std::fopen(path.c_str(), "rb");
    ASSERT_NE(fp, nullptr);
    unsigned char sig[8] = {};
    const size_t n = std::fread(sig, 1, sizeof(sig), fp);
    std::fclose(fp);
    ASSERT_EQ(n, sizeof(sig));
    EXPECT_EQ(png_sig_cmp(sig, 0, sizeof(sig)), 0);
    std::remove(path.c_str());
}

TEST(ExportPng, PixelsSurviveRoundTrip)
{
    const std::string path = temp_path("orbitrap_roundtrip.png");
    const PixelBuffer src = checker(13, 7);
    ASSERT_EQ(export_png(path.c_str(), src, "test render"), "");

    png_image image;
    std::memset(&image, 0, sizeof(image));
    image.version = PNG_IMAGE_VERSION;
    ASSERT_NE(png_image_begin_read_from_file(&image, path.c_str()), 0) << image.message;
    EXPECT_EQ(image.width, 13u);
    EXPECT_EQ(image.height, 7u);

    image.format = PNG_FORMAT_RGBA;
    std::vector<uint8_t> data(PNG_IMAGE_SIZE(image));
    ASSERT_NE(png_image_finish_read(&image, nullptr, data.data(), 0, nullptr), 0) << image.message;

    for (int y = 0; y < 7; ++y) {
        for (int x = 0; x < 13; ++x) {
            const uint8_t* px = &data[(static_cast<size_t>(y) * 13 + x) * 4];
            const Rgb expect = unpack_rgb(src.pixels[static_cast<size_t>(y) * 13 + x]);
            EXPECT_EQ(px[0], expect.r);
            EXPECT_EQ(px[1], expect.g);
            EXPECT_EQ(px[2], expect.b);
            EXPECT_EQ(px[3], 255);
        }
    }
    std::remove(path.c_str());
}

TEST(ExportPng, ReportsUnwritablePath)
{
    const std::string err = export_png("/nonexistent-dir/sub/out.png", checker(2, 2));
    EXPECT_NE(err, "");
    EXPECT_NE(err.find("/nonexistent-dir/sub/out.png"), std::string::npos);
}

TEST(ExportPng, RejectsEmptyOrInconsistentBuffer)
{
    const std::string path = temp_path("orbitrap_empty.png");
    PixelBuffer empty;
    EXPECT_NE(export_png(path.c_str(), empty), "");

    PixelBuffer bad = checker(4, 4);
    bad.pixels.pop_back();
    EXPECT_NE(export_png(path.c_str(), bad), "");
}

TEST(DescribeConfig, NamesFractalAndPalette)
{
    RenderConfig cfg;
    cfg.fractal.formula = FormulaType::BurningShip;
    const std::string d = describe_config(cfg, "fire");
    EXPECT_NE(d.find(fractal_name(cfg.fractal)), std::string::npos);
    EXPECT_NE(d.find("palette=fire"), std::string::npos);
    EXPECT_NE(d.find("1024x768"), std::string::npos);
    EXPECT_EQ(d.find(" c=("), std::string::npos);

    cfg.fractal.julia_mode = true;
    const std::string j = describe_config(cfg, nullptr);
    EXPECT_NE(j.find("palette=custom"), std::string::npos);
    EXPECT_NE(j.find(" c=("), std::string::npos);
}
