#pragma once

#include "animation/Easing.h"
#include "core/Types.h"

#include <cstddef>
#include <optional>

namespace ringchart {

// ============================================================================
// Corner radii
// ============================================================================

// Elliptical corner radius: x runs along the arc, y along the radial edge.
struct CornerRadius {
    double x = 0.0;
    double y = 0.0;

    static CornerRadius circular(double r) { return CornerRadius{r, r}; }
    bool isZero() const { return x <= 0.0 || y <= 0.0; }
};

inline bool operator==(const CornerRadius& a, const CornerRadius& b) {
    return a.x == b.x && a.y == b.y;
}

// The four corners of one ring slice. Leading is the corner at the segment's
// start angle, trailing the one at its end angle.
struct CornerRadii {
    CornerRadius outerLeading;
    CornerRadius outerTrailing;
    CornerRadius innerLeading;
    CornerRadius innerTrailing;

    static CornerRadii all(const CornerRadius& r) { return CornerRadii{r, r, r, r}; }
};

inline bool operator==(const CornerRadii& a, const CornerRadii& b) {
    return a.outerLeading == b.outerLeading && a.outerTrailing == b.outerTrailing &&
           a.innerLeading == b.innerLeading && a.innerTrailing == b.innerTrailing;
}

// ============================================================================
// ChartConfig - chart-wide style and animation settings
// ============================================================================

struct LabelStyle {
    RGBcolor color{1.0f, 1.0f, 1.0f, 1.0f};
    float fontScale = 1.0f;
};

struct ChartConfig {
    double ringWidth = 40.0;
    // Gap between segments, as an arc length on the mid-ring circle
    double segmentSpacing = 5.0;
    CornerRadii cornerRadii = CornerRadii::all(CornerRadius::circular(10.0));
    // Ring color when there are no items
    RGBcolor defaultColor{0.62f, 0.62f, 0.62f, 1.0f};
    double animationDuration = 0.15;  // seconds
    EasingType easing = EasingType::EaseIn;
    // Unset: labels use the host's default text color at scale 1
    std::optional<LabelStyle> labelStyle;

    // Throws std::invalid_argument when the ring width is not in
    // (0, outer radius), the spacing is negative or larger than
    // SegmentCalculator::maxSegmentSpacing allows for itemCount items, or
    // the animation duration is not positive.
    void validate(const ChartSize& size, size_t itemCount) const;

    // Gap between segments in chart degrees for a chart of the given size.
    double gapAngle(const ChartSize& size) const;
};

} // namespace ringchart
