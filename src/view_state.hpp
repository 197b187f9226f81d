#pragma once

// Half-height of the default view; zoom factors are relative to it.
static constexpr double DEFAULT_HALF_HEIGHT = 1.5;

struct ViewState {
    double center_x    = -0.5;
    double center_y    =  0.0;
    double half_height =  DEFAULT_HALF_HEIGHT;  // imaginary half-extent of the viewport
};

inline double zoom_display(const ViewState& vs)
{
    return DEFAULT_HALF_HEIGHT / vs.half_height;
}

inline void set_zoom(ViewState& vs, double zoom)
{
    vs.half_height = DEFAULT_HALF_HEIGHT / zoom;
}

inline double half_width(const ViewState& vs, int width, int height)
{
    return vs.half_height * static_cast<double>(width) / static_cast<double>(height);
}

// ---------------------------------------------------------------------------
// Pixel -> complex plane mapping, resolved once per render.
//
// Pixel (width/2, height/2) lands exactly on the view center. Row 0 is the
// top of the image, so the imaginary part decreases with the row index.
// A dimension of 1 pixel collapses onto the center on that axis.
// ---------------------------------------------------------------------------
struct PlaneMapping {
    double center_x = 0.0;
    double center_y = 0.0;
    double scale    = 0.0;   // complex units per pixel
    int    width    = 0;
    int    height   = 0;
};

// width and height must be positive (see validate_render_config).
inline PlaneMapping make_plane_mapping(const ViewState& vs, int width, int height)
{
    PlaneMapping m;
    m.center_x = vs.center_x;
    m.center_y = vs.center_y;
    m.scale    = 2.0 * vs.half_height / static_cast<double>(height);
    m.width    = width;
    m.height   = height;
    return m;
}

inline double plane_re(const PlaneMapping& m, int px)
{
    if (m.width == 1) return m.center_x;
    return m.center_x + (static_cast<double>(px) - m.width * 0.5) * m.scale;
}

inline double plane_im(const PlaneMapping& m, int py)
{
    if (m.height == 1) return m.center_y;
    return m.center_y - (static_cast<double>(py) - m.height * 0.5) * m.scale;
}

inline void pixel_to_plane(const ViewState& vs, int width, int height,
                           int px, int py, double& re, double& im)
{
    const PlaneMapping m = make_plane_mapping(vs, width, height);
    re = plane_re(m, px);
    im = plane_im(m, py);
}
