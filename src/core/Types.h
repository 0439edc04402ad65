#pragma once

#include <glm/glm.hpp>

#include <cmath>
#include <cstdint>
#include <string>

namespace ringchart {

// ============================================================================
// Color types
// ============================================================================

struct RGBcolor {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;
};

inline bool operator==(const RGBcolor& x, const RGBcolor& y) {
    return x.r == y.r && x.g == y.g && x.b == y.b && x.a == y.a;
}

inline bool operator!=(const RGBcolor& x, const RGBcolor& y) {
    return !(x == y);
}

// ============================================================================
// Vector types
// ============================================================================

// Screen-space point, y axis pointing down.
using Point = glm::dvec2;

// Chart area in pixels. The outer radius is always width / 2.
struct ChartSize {
    double width = 0.0;
    double height = 0.0;

    Point center() const { return Point(width * 0.5, height * 0.5); }
    double outerRadius() const { return width * 0.5; }
};

// ============================================================================
// Math constants
// ============================================================================

inline constexpr double PI      = 3.14159265358979323846;
inline constexpr double EPSILON = 1.0e-6;

// ============================================================================
// Math helpers
// ============================================================================

inline double sqr(double x) {
    return x * x;
}

inline double deg(double radians) {
    return radians * (180.0 / PI);
}

inline double rad(double degrees) {
    return degrees * (PI / 180.0);
}

inline double interpolate(double a, double b, double t) {
    return a + t * (b - a);
}

} // namespace ringchart
