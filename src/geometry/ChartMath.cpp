#include "geometry/ChartMath.h"

#include <algorithm>
#include <cmath>

namespace ringchart {
namespace ChartMath {

// Relative tolerance below which a direction counts as vertical, and two
// slopes count as equal.
static constexpr double SLOPE_TOLERANCE = 1.0e-12;

double angleForArcLength(double radius, double length) {
    if (radius == 0.0) {
        throw DomainError("angleForArcLength: radius cannot be zero");
    }
    return deg(length / radius);
}

double arcLengthForAngle(double radius, double degrees) {
    return (PI * radius * degrees) / 180.0;
}

Point rotatePointAroundCenter(const Point& center, const Point& point, double degrees) {
    double radians = rad(degrees);
    double c = std::cos(radians);
    double s = std::sin(radians);

    double x1 = point.x - center.x;
    double y1 = point.y - center.y;

    return Point(x1 * c - y1 * s + center.x,
                 x1 * s + y1 * c + center.y);
}

Point pointOnRing(const Point& center, double radius, double chartDegrees) {
    return rotatePointAroundCenter(center, Point(center.x - radius, center.y), chartDegrees);
}

// ============================================================================
// tangentLineIntersection
//
// Both lines are kept in slope/intercept form, with a vertical line stored as
// an infinite slope and its x coordinate in place of the intercept.
// ============================================================================
Point tangentLineIntersection(const Point& center, double radius, double angleDegrees,
                              const Point& point1, const Point& point2) {
    double angleRadians = rad(angleDegrees);

    // Point of tangency
    double x0 = center.x + radius * std::cos(angleRadians);
    double y0 = center.y + radius * std::sin(angleRadians);

    // Tangent direction is perpendicular to the radius
    double dx = -radius * std::sin(angleRadians);
    double dy = radius * std::cos(angleRadians);

    double deltaX = point2.x - point1.x;
    double deltaY = point2.y - point1.y;
    if (deltaX == 0.0 && deltaY == 0.0) {
        throw DomainError("tangentLineIntersection: line points coincide");
    }

    bool tangentVertical = std::abs(dx) <= SLOPE_TOLERANCE * std::abs(dy);
    bool lineVertical = std::abs(deltaX) <= SLOPE_TOLERANCE * std::abs(deltaY);

    if (tangentVertical && lineVertical) {
        throw DomainError("tangentLineIntersection: lines are parallel or equal");
    }

    if (tangentVertical) {
        double lineSlope = deltaY / deltaX;
        double b2 = point1.y - lineSlope * point1.x;
        return Point(x0, lineSlope * x0 + b2);
    }

    double tangentSlope = dy / dx;
    double b1 = y0 - tangentSlope * x0;

    if (lineVertical) {
        double x = point1.x;
        return Point(x, tangentSlope * x + b1);
    }

    double lineSlope = deltaY / deltaX;
    double b2 = point1.y - lineSlope * point1.x;

    double scale = std::max({1.0, std::abs(tangentSlope), std::abs(lineSlope)});
    if (std::abs(tangentSlope - lineSlope) <= SLOPE_TOLERANCE * scale) {
        throw DomainError("tangentLineIntersection: lines are parallel or equal");
    }

    double x = (b2 - b1) / (tangentSlope - lineSlope);
    return Point(x, tangentSlope * x + b1);
}

double chartAngleOf(const Point& center, const Point& point) {
    double angle = deg(std::atan2(point.y - center.y, point.x - center.x));
    // Chart angle 0 is the leftmost point, i.e. screen angle 180
    angle -= 180.0;
    while (angle < 0.0) angle += 360.0;
    while (angle >= 360.0) angle -= 360.0;
    return angle;
}

} // namespace ChartMath
} // namespace ringchart
