#pragma once

#include "geometry/ChartConfig.h"
#include "core/Types.h"

#include <vector>

namespace ringchart {

// ============================================================================
// SegmentPath - recorded outline of one ring slice
// ============================================================================

enum class PathVerb {
    MoveTo,
    LineTo,
    QuadTo,
    ArcTo,
    Close
};

struct PathCommand {
    PathVerb verb = PathVerb::MoveTo;
    Point p0{};              // MoveTo/LineTo target, QuadTo control, ArcTo center
    Point p1{};              // QuadTo end point
    double radius = 0.0;     // ArcTo only
    double startAngle = 0.0; // ArcTo only, radians (screen parametrization)
    double sweepAngle = 0.0; // ArcTo only, radians, negative = counter-clockwise
};

class SegmentPath {
public:
    void moveTo(const Point& p);
    void lineTo(const Point& p);
    void quadTo(const Point& control, const Point& end);
    // Connects to the arc start with a straight line first, like a canvas
    // arcTo without forceMoveTo.
    void arcTo(const Point& center, double radius, double startAngle, double sweepAngle);
    void close();

    const std::vector<PathCommand>& commands() const { return commands_; }
    bool empty() const { return commands_.empty(); }

    // Polygon approximation of the outline. Arcs are split into steps no
    // wider than arcStepDegrees, quadratic curves into quadSteps pieces.
    // Consecutive duplicate points are dropped.
    std::vector<Point> flatten(double arcStepDegrees = ARC_STEP_DEGREES,
                               int quadSteps = QUAD_STEPS) const;

    static constexpr double ARC_STEP_DEGREES = 3.0;
    static constexpr int QUAD_STEPS = 8;

private:
    std::vector<PathCommand> commands_;
};

// ============================================================================
// SegmentPathBuilder
// ============================================================================

namespace SegmentPathBuilder {

    // Scale radius so that neither axis exceeds its maximum, keeping the
    // x:y ratio. A corner with a non-positive axis becomes square (0, 0).
    CornerRadius normalizeCorner(const CornerRadius& radius, double maxHorizontal,
                                 double maxVertical);

    // Clamp all four corners for a slice whose outer and inner arcs have the
    // given lengths. Outer corners may take up to half the outer arc, inner
    // corners a fifth of the inner arc, and no corner more than half the
    // ring width.
    CornerRadii normalizeCornerRadii(const CornerRadii& radii, double outerArcLength,
                                     double innerArcLength, double ringWidth);

    // Closed outline of the ring slice spanning [startAngle, startAngle + spanAngle]
    // (chart degrees) between outerRadius - ringWidth and outerRadius.
    // Returns an empty path when spanAngle <= 0.
    SegmentPath buildSegmentPath(const Point& center, double outerRadius, double ringWidth,
                                 double startAngle, double spanAngle,
                                 const CornerRadii& radii);

    // Label position: angular midpoint of the slice, halfway across the ring.
    Point labelAnchor(const Point& center, double outerRadius, double ringWidth,
                      double startAngle, double spanAngle);

} // namespace SegmentPathBuilder
} // namespace ringchart
