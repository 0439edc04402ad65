#include "geometry/SegmentPath.h"
#include "geometry/ChartMath.h"

#include <algorithm>
#include <cmath>

namespace ringchart {

// ============================================================================
// SegmentPath recording
// ============================================================================

void SegmentPath::moveTo(const Point& p) {
    PathCommand cmd;
    cmd.verb = PathVerb::MoveTo;
    cmd.p0 = p;
    commands_.push_back(cmd);
}

void SegmentPath::lineTo(const Point& p) {
    PathCommand cmd;
    cmd.verb = PathVerb::LineTo;
    cmd.p0 = p;
    commands_.push_back(cmd);
}

void SegmentPath::quadTo(const Point& control, const Point& end) {
    PathCommand cmd;
    cmd.verb = PathVerb::QuadTo;
    cmd.p0 = control;
    cmd.p1 = end;
    commands_.push_back(cmd);
}

void SegmentPath::arcTo(const Point& center, double radius, double startAngle, double sweepAngle) {
    PathCommand cmd;
    cmd.verb = PathVerb::ArcTo;
    cmd.p0 = center;
    cmd.radius = radius;
    cmd.startAngle = startAngle;
    cmd.sweepAngle = sweepAngle;
    commands_.push_back(cmd);
}

void SegmentPath::close() {
    PathCommand cmd;
    cmd.verb = PathVerb::Close;
    commands_.push_back(cmd);
}

// ============================================================================
// flatten
// ============================================================================

std::vector<Point> SegmentPath::flatten(double arcStepDegrees, int quadSteps) const {
    std::vector<Point> points;
    quadSteps = std::max(quadSteps, 1);
    arcStepDegrees = std::max(arcStepDegrees, 0.1);

    auto push = [&points](const Point& p) {
        if (points.empty() || glm::length(p - points.back()) > EPSILON) {
            points.push_back(p);
        }
    };

    Point current{};
    for (const auto& cmd : commands_) {
        switch (cmd.verb) {
            case PathVerb::MoveTo:
            case PathVerb::LineTo:
                push(cmd.p0);
                current = cmd.p0;
                break;

            case PathVerb::QuadTo: {
                Point from = current;
                for (int k = 1; k <= quadSteps; ++k) {
                    double t = static_cast<double>(k) / static_cast<double>(quadSteps);
                    double u = 1.0 - t;
                    push(u * u * from + 2.0 * u * t * cmd.p0 + t * t * cmd.p1);
                }
                current = cmd.p1;
                break;
            }

            case PathVerb::ArcTo: {
                int steps = std::max(1, static_cast<int>(std::ceil(
                    std::abs(deg(cmd.sweepAngle)) / arcStepDegrees)));
                for (int k = 0; k <= steps; ++k) {
                    double a = cmd.startAngle +
                               cmd.sweepAngle * static_cast<double>(k) / static_cast<double>(steps);
                    current = cmd.p0 + cmd.radius * Point(std::cos(a), std::sin(a));
                    push(current);
                }
                break;
            }

            case PathVerb::Close:
                break;
        }
    }

    // The polygon is implicitly closed
    if (points.size() > 1 && glm::length(points.front() - points.back()) <= EPSILON) {
        points.pop_back();
    }
    return points;
}

namespace SegmentPathBuilder {

// ============================================================================
// Corner normalization
// ============================================================================

CornerRadius normalizeCorner(const CornerRadius& radius, double maxHorizontal,
                             double maxVertical) {
    if (radius.isZero()) {
        return CornerRadius{};
    }

    maxHorizontal = std::max(maxHorizontal, 0.0);
    maxVertical = std::max(maxVertical, 0.0);

    double horizontalRatio = radius.x > maxHorizontal ? maxHorizontal / radius.x : 1.0;
    double verticalRatio = radius.y > maxVertical ? maxVertical / radius.y : 1.0;
    double ratio = std::min(horizontalRatio, verticalRatio);

    CornerRadius out{radius.x * ratio, radius.y * ratio};
    if (out.isZero()) {
        return CornerRadius{};
    }
    return out;
}

CornerRadii normalizeCornerRadii(const CornerRadii& radii, double outerArcLength,
                                 double innerArcLength, double ringWidth) {
    double maxOuter = outerArcLength / 2.0;
    // Inner corners never take more than a fifth of the inner arc
    double maxInner = innerArcLength / 5.0;
    double maxVertical = ringWidth / 2.0;

    CornerRadii out;
    out.outerLeading = normalizeCorner(radii.outerLeading, maxOuter, maxVertical);
    out.outerTrailing = normalizeCorner(radii.outerTrailing, maxOuter, maxVertical);
    out.innerLeading = normalizeCorner(radii.innerLeading, maxInner, maxVertical);
    out.innerTrailing = normalizeCorner(radii.innerTrailing, maxInner, maxVertical);
    return out;
}

// ============================================================================
// buildSegmentPath
//
// Traced clockwise along the outer arc and back along the inner arc:
//
//   outer-leading corner -> outer arc -> outer-trailing corner
//     -> trailing radial edge -> inner-trailing corner -> inner arc
//     -> inner-leading corner -> leading radial edge (close)
//
// Every corner is a quadratic curve. Outer corners use the sharp corner
// point as control; inner corners use the intersection of the inner arc's
// tangent with the radial edge, which keeps the join smooth on the concave side.
// ============================================================================

SegmentPath buildSegmentPath(const Point& center, double outerRadius, double ringWidth,
                             double startAngle, double spanAngle,
                             const CornerRadii& radii) {
    SegmentPath path;
    if (spanAngle <= 0.0) {
        return path;
    }

    const double innerRadius = outerRadius - ringWidth;
    const double endAngle = startAngle + spanAngle;

    const CornerRadii r = normalizeCornerRadii(
        radii,
        ChartMath::arcLengthForAngle(outerRadius, spanAngle),
        ChartMath::arcLengthForAngle(innerRadius, spanAngle),
        ringWidth);

    auto at = [&center](double radius, double angle) {
        return ChartMath::pointOnRing(center, radius, angle);
    };

    const double outerLeadAngle = ChartMath::angleForArcLength(outerRadius, r.outerLeading.x);
    const double outerTrailAngle = ChartMath::angleForArcLength(outerRadius, r.outerTrailing.x);
    const double innerLeadAngle = ChartMath::angleForArcLength(innerRadius, r.innerLeading.x);
    const double innerTrailAngle = ChartMath::angleForArcLength(innerRadius, r.innerTrailing.x);

    // Outer-leading corner
    path.moveTo(at(outerRadius - r.outerLeading.y, startAngle));
    path.quadTo(at(outerRadius, startAngle),
                at(outerRadius, startAngle + outerLeadAngle));

    // Outer arc
    path.arcTo(center, outerRadius,
               rad(180.0 + startAngle + outerLeadAngle),
               rad(spanAngle - outerLeadAngle - outerTrailAngle));

    // Outer-trailing corner
    path.quadTo(at(outerRadius, endAngle),
                at(outerRadius - r.outerTrailing.y, endAngle));

    // Trailing radial edge and inner-trailing corner
    const Point trailEdgeStart = at(innerRadius + r.innerTrailing.y, endAngle);
    const Point trailEdgeEnd = at(innerRadius, endAngle);
    const Point innerTrailEnd = at(innerRadius, endAngle - innerTrailAngle);
    Point innerTrailSnap = innerTrailEnd;
    if (!r.innerTrailing.isZero()) {
        innerTrailSnap = ChartMath::tangentLineIntersection(
            center, innerRadius, 180.0 + endAngle - innerTrailAngle,
            trailEdgeStart, trailEdgeEnd);
    }
    path.lineTo(trailEdgeStart);
    path.quadTo(innerTrailSnap, innerTrailEnd);

    // Inner arc, running back towards the start angle
    path.arcTo(center, innerRadius,
               rad(180.0 + endAngle - innerTrailAngle),
               -rad(spanAngle - innerLeadAngle - innerTrailAngle));

    // Inner-leading corner
    const Point leadEdgeEnd = at(innerRadius + r.innerLeading.y, startAngle);
    Point innerLeadSnap = leadEdgeEnd;
    if (!r.innerLeading.isZero()) {
        innerLeadSnap = ChartMath::tangentLineIntersection(
            center, innerRadius, 180.0 + startAngle + innerLeadAngle,
            at(innerRadius, startAngle), leadEdgeEnd);
    }
    path.quadTo(innerLeadSnap, leadEdgeEnd);

    path.close();
    return path;
}

Point labelAnchor(const Point& center, double outerRadius, double ringWidth,
                  double startAngle, double spanAngle) {
    return ChartMath::pointOnRing(center, outerRadius - ringWidth / 2.0,
                                  startAngle + spanAngle / 2.0);
}

} // namespace SegmentPathBuilder
} // namespace ringchart
