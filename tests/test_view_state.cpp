#include <gtest/gtest.h>

#include "view_state.hpp"

#include <cmath>

TEST(PlaneMapping, CenterPixelMapsToViewCenter)
{
    ViewState vs;
    vs.center_x    = -0.5;
    vs.center_y    =  0.0;
    vs.half_height =  1.5;

    double re = 1.0, im = 1.0;
    pixel_to_plane(vs, 100, 100, 50, 50, re, im);
    EXPECT_DOUBLE_EQ(re, -0.5);
    EXPECT_DOUBLE_EQ(im,  0.0);
}

TEST(PlaneMapping, OddSizeCenterWithinHalfPixel)
{
    ViewState vs;
    vs.center_x    = 0.25;
    vs.center_y    = -0.75;
    vs.half_height = 0.01;

    const PlaneMapping m = make_plane_mapping(vs, 101, 57);
    // Pixel W/2 is exact; with odd sizes the middle pixel is half a step
    // off, give or take rounding in the last bit.
    const double tol = 0.5 * m.scale * (1.0 + 1e-9);
    EXPECT_NEAR(plane_re(m, 50), vs.center_x, tol);
    EXPECT_NEAR(plane_im(m, 28), vs.center_y, tol);
}

TEST(PlaneMapping, IsDeterministic)
{
    ViewState vs;
    vs.center_x    = -0.743643887037151;
    vs.center_y    =  0.131825904205330;
    vs.half_height =  1e-9;

    for (int py = 0; py < 48; py += 7) {
        for (int px = 0; px < 64; px += 5) {
            double re1, im1, re2, im2;
            pixel_to_plane(vs, 64, 48, px, py, re1, im1);
            pixel_to_plane(vs, 64, 48, px, py, re2, im2);
            EXPECT_EQ(re1, re2);
            EXPECT_EQ(im1, im2);
        }
    }
}

TEST(PlaneMapping, HeightSpansTwiceHalfHeight)
{
    ViewState vs;
    vs.center_x    = 0.0;
    vs.center_y    = 0.0;
    vs.half_height = 2.0;

    const PlaneMapping m = make_plane_mapping(vs, 80, 40);
    EXPECT_DOUBLE_EQ(m.scale * 40, 4.0);
    // Row 0 is the top edge: positive imaginary half-height.
    EXPECT_DOUBLE_EQ(plane_im(m, 0), 2.0);
    EXPECT_DOUBLE_EQ(plane_im(m, 40), -2.0);
}

TEST(PlaneMapping, AspectCorrectRealSpan)
{
    ViewState vs;
    vs.center_x    = 1.0;
    vs.center_y    = 0.0;
    vs.half_height = 0.5;

    const PlaneMapping m = make_plane_mapping(vs, 300, 100);
    const double hw = half_width(vs, 300, 100);
    EXPECT_DOUBLE_EQ(hw, 1.5);
    EXPECT_DOUBLE_EQ(plane_re(m, 0), 1.0 - hw);
    EXPECT_DOUBLE_EQ(plane_re(m, 300), 1.0 + hw);
}

TEST(PlaneMapping, IsAffineInColumnAndRow)
{
    ViewState vs;
    vs.center_x    = -1.25;
    vs.center_y    =  0.3;
    vs.half_height =  0.2;

    const PlaneMapping m = make_plane_mapping(vs, 200, 150);
    const double dx = plane_re(m, 1) - plane_re(m, 0);
    const double dy = plane_im(m, 1) - plane_im(m, 0);
    for (int k = 0; k < 200; k += 13)
        EXPECT_NEAR(plane_re(m, k + 1) - plane_re(m, k), dx, 1e-12);
    for (int k = 0; k < 150; k += 11)
        EXPECT_NEAR(plane_im(m, k + 1) - plane_im(m, k), dy, 1e-12);
    EXPECT_NEAR(dx, -dy, 1e-15);
}

TEST(PlaneMapping, SinglePixelDimensionCollapsesToCenter)
{
    ViewState vs;
    vs.center_x    = 0.4;
    vs.center_y    = -0.2;
    vs.half_height = 1.0;

    double re, im;
    pixel_to_plane(vs, 1, 1, 0, 0, re, im);
    EXPECT_EQ(re, 0.4);
    EXPECT_EQ(im, -0.2);

    // 1 x N: only the real axis collapses
    pixel_to_plane(vs, 1, 10, 0, 0, re, im);
    EXPECT_EQ(re, 0.4);
    EXPECT_DOUBLE_EQ(im, -0.2 + 1.0);

    // N x 1: only the imaginary axis collapses
    pixel_to_plane(vs, 10, 1, 9, 0, re, im);
    EXPECT_EQ(im, -0.2);
    EXPECT_TRUE(std::isfinite(re));
}

TEST(ViewState, ZoomRoundTrip)
{
    ViewState vs;
    EXPECT_DOUBLE_EQ(zoom_display(vs), 1.0);
    set_zoom(vs, 1000.0);
    EXPECT_DOUBLE_EQ(vs.half_height, 0.0015);
    EXPECT_DOUBLE_EQ(zoom_display(vs), 1000.0);
}
