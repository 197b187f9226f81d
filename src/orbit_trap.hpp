#pragma once

#include <algorithm>
#include <cmath>

enum class TrapShape {
    Point  = 0,  // distance to a point
    Circle = 1,  // distance to a circle around the trap center
    Line   = 2,  // distance to a line through the trap center
    Cross  = 3,  // distance to the nearer of two perpendicular lines
};
constexpr int TRAP_SHAPE_COUNT = 4;

struct OrbitTrap {
    TrapShape shape     = TrapShape::Point;
    double    center_re = 0.0;
    double    center_im = 0.0;
    double    radius    = 0.5;   // Circle only
    double    angle     = 0.0;   // Line / Cross, radians from the real axis
};

inline const char* trap_shape_name(TrapShape s)
{
    switch (s) {
        case TrapShape::Point:  return "point";
        case TrapShape::Circle: return "circle";
        case TrapShape::Line:   return "line";
        case TrapShape::Cross:  return "cross";
    }
    return "unknown";
}

// Trap resolved for the inner loop: the line direction is a unit vector so
// the line distances need no normalization per sample.
struct TrapGeometry {
    double center_re = 0.0;
    double center_im = 0.0;
    double radius    = 0.0;
    double dir_re    = 1.0;
    double dir_im    = 0.0;
};

inline TrapGeometry make_trap_geometry(const OrbitTrap& trap)
{
    TrapGeometry g;
    g.center_re = trap.center_re;
    g.center_im = trap.center_im;
    g.radius    = trap.radius;
    g.dir_re    = std::cos(trap.angle);
    g.dir_im    = std::sin(trap.angle);
    return g;
}

// Per-sample trap metric. For the point trap this is the squared distance;
// trap_finalize() turns the running minimum into a distance once per pixel.
template<TrapShape S>
inline double trap_metric(const TrapGeometry& g, double zr, double zi)
{
    const double dr = zr - g.center_re;
    const double di = zi - g.center_im;
    if constexpr (S == TrapShape::Point) {
        return dr*dr + di*di;
    } else if constexpr (S == TrapShape::Circle) {
        return std::abs(std::sqrt(dr*dr + di*di) - g.radius);
    } else if constexpr (S == TrapShape::Line) {
        return std::abs(dr*g.dir_im - di*g.dir_re);
    } else {
        const double along  = std::abs(dr*g.dir_im - di*g.dir_re);
        const double across = std::abs(dr*g.dir_re + di*g.dir_im);
        return std::min(along, across);
    }
}

template<TrapShape S>
inline double trap_finalize(double metric)
{
    if constexpr (S == TrapShape::Point)
        return std::sqrt(metric);
    else
        return metric;
}

// Runtime-dispatched distance; not for the inner loop.
inline double trap_distance(const TrapGeometry& g, TrapShape s, double zr, double zi)
{
    switch (s) {
        case TrapShape::Point:
            return trap_finalize<TrapShape::Point>(trap_metric<TrapShape::Point>(g, zr, zi));
        case TrapShape::Circle:
            return trap_metric<TrapShape::Circle>(g, zr, zi);
        case TrapShape::Line:
            return trap_metric<TrapShape::Line>(g, zr, zi);
        case TrapShape::Cross:
            return trap_metric<TrapShape::Cross>(g, zr, zi);
    }
    return 0.0;
}
