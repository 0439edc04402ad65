#pragma once

#include "core/Types.h"

#include <stdexcept>
#include <string>

namespace ringchart {

// Raised by the geometry primitives for inputs with no defined result.
class DomainError : public std::domain_error {
public:
    explicit DomainError(const std::string& what) : std::domain_error(what) {}
};

// ============================================================================
// ChartMath - stateless polar helpers used by the segment path builder,
// the layout and the hit tester.
//
// Chart angles are in degrees. Angle 0 is the leftmost point of the ring and
// angles grow clockwise on screen (y axis down), i.e. chart angle t sits at
// screen angle 180 + t in the usual (cos, sin) parametrization.
// ============================================================================

namespace ChartMath {

    // Angle (degrees) subtended by an arc of the given length.
    // Throws DomainError if radius == 0.
    double angleForArcLength(double radius, double length);

    // Arc length subtended by the given angle (degrees). Total; radius 0 gives 0.
    double arcLengthForAngle(double radius, double degrees);

    // Rotate point about center by the given angle. Positive angles rotate
    // clockwise on screen.
    Point rotatePointAroundCenter(const Point& center, const Point& point, double degrees);

    // Point at distance radius from center, at the given chart angle.
    Point pointOnRing(const Point& center, double radius, double chartDegrees);

    // Intersection of the tangent to the circle (center, radius) at
    // angleDegrees (screen parametrization) with the line through point1 and
    // point2. Vertical tangents and vertical lines are handled explicitly.
    // Throws DomainError if the two lines are parallel or coincident.
    Point tangentLineIntersection(const Point& center, double radius, double angleDegrees,
                                  const Point& point1, const Point& point2);

    // Chart angle of point around center, in [0, 360).
    double chartAngleOf(const Point& center, const Point& point);

} // namespace ChartMath
} // namespace ringchart
