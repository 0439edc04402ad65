#include "animation/Easing.h"
#include "core/Types.h"

#include <algorithm>
#include <cmath>

namespace ringchart {
namespace Easing {

namespace {

struct NamedEasing {
    EasingType type;
    const char* name;
};

const NamedEasing easingNames[] = {
    {EasingType::Linear,       "linear"},
    {EasingType::Quadratic,    "quadratic"},
    {EasingType::InvQuadratic, "invQuadratic"},
    {EasingType::Sigmoid,      "sigmoid"},
    {EasingType::SigmoidAccel, "sigmoidAccel"},
    {EasingType::EaseIn,       "easeIn"},
    {EasingType::EaseOut,      "easeOut"},
    {EasingType::EaseInOut,    "easeInOut"},
};

// One coordinate of a cubic bezier with endpoints 0 and 1.
double bezierCoord(double a, double b, double m) {
    return 3.0 * a * (1.0 - m) * (1.0 - m) * m +
           3.0 * b * (1.0 - m) * m * m +
           m * m * m;
}

// Cubic bezier through (0,0), (x1,y1), (x2,y2), (1,1), evaluated at x = t.
// x(m) is monotonic for control x in [0, 1], so bisection converges.
double cubicBezier(double x1, double y1, double x2, double y2, double t) {
    double lo = 0.0;
    double hi = 1.0;
    for (int i = 0; i < 64; ++i) {
        double mid = 0.5 * (lo + hi);
        double x = bezierCoord(x1, x2, mid);
        if (std::abs(x - t) < 1.0e-9) {
            return bezierCoord(y1, y2, mid);
        }
        if (x < t) {
            lo = mid;
        } else {
            hi = mid;
        }
    }
    return bezierCoord(y1, y2, 0.5 * (lo + hi));
}

} // namespace

double apply(EasingType type, double t) {
    t = std::clamp(t, 0.0, 1.0);
    if (t == 0.0 || t == 1.0) {
        return t;
    }

    switch (type) {
        case EasingType::Linear:
            return t;

        case EasingType::Quadratic:
            // Parabolic curve
            return t * t;

        case EasingType::InvQuadratic:
            // Inverted parabolic curve
            return 1.0 - (1.0 - t) * (1.0 - t);

        case EasingType::Sigmoid:
            // Sigmoidal (S-like) remapping
            return 0.5 * (1.0 - std::cos(PI * t));

        case EasingType::SigmoidAccel:
            // Sigmoidal, with acceleration
            return 0.5 * (1.0 - std::cos(PI * t * t));

        case EasingType::EaseIn:
            return cubicBezier(0.42, 0.0, 1.0, 1.0, t);

        case EasingType::EaseOut:
            return cubicBezier(0.0, 0.0, 0.58, 1.0, t);

        case EasingType::EaseInOut:
            return cubicBezier(0.42, 0.0, 0.58, 1.0, t);
    }
    return t;
}

const char* name(EasingType type) {
    for (const auto& entry : easingNames) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "linear";
}

bool fromName(const std::string& name, EasingType& out) {
    for (const auto& entry : easingNames) {
        if (name == entry.name) {
            out = entry.type;
            return true;
        }
    }
    return false;
}

} // namespace Easing
} // namespace ringchart
