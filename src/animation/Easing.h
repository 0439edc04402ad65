#pragma once

#include <string>

namespace ringchart {

enum class EasingType {
    Linear,
    Quadratic,
    InvQuadratic,
    Sigmoid,
    SigmoidAccel,
    EaseIn,      // cubic-bezier(0.42, 0, 1, 1)
    EaseOut,     // cubic-bezier(0, 0, 0.58, 1)
    EaseInOut    // cubic-bezier(0.42, 0, 0.58, 1)
};

namespace Easing {

    // Remap linear progress t in [0, 1] through the curve. Input outside
    // [0, 1] is clamped; the result is exactly 0 at t = 0 and 1 at t = 1.
    double apply(EasingType type, double t);

    // Stable name used in the config file ("easeIn", "sigmoid", ...).
    const char* name(EasingType type);

    // Parse a name produced by name(). Returns false for unknown names.
    bool fromName(const std::string& name, EasingType& out);

} // namespace Easing
} // namespace ringchart
