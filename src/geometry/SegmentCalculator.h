#pragma once

#include "animation/Transition.h"
#include "core/ChartItem.h"

#include <vector>

namespace ringchart {

namespace SegmentCalculator {

    // Smallest fraction of the circle a settled segment may occupy.
    inline constexpr double MIN_SEGMENT_FRACTION = 0.025;

    // Largest spacing (arc length on a circle of the given radius) that still
    // leaves every one of itemCount segments its minimum fraction.
    // Returns +infinity for zero items and 0 when the floors alone fill the circle.
    double maxSegmentSpacing(size_t itemCount, double radius);

    // Fractions of the full circle occupied by each item, in item order.
    // When nothing is appearing or disappearing they sum to
    // 1 - itemCount * gapDegrees / 360.
    //
    // Items below MIN_SEGMENT_FRACTION are raised to it unless they are in
    // the middle of an Add or Remove transition; those keep their raw size
    // and give back part of their gap in proportion to their current scale.
    // After flooring, every fraction is scaled by the same factor so the
    // set fills the available space. A floored item can therefore end up
    // below the floor once the larger items are accounted for.
    //
    // snapshot may be null when nothing is animating.
    std::vector<double> calculateSpans(const ChartItemList& items, double gapDegrees,
                                       const AnimationSnapshot* snapshot);

} // namespace SegmentCalculator
} // namespace ringchart
