#pragma once

#include "animation/Transition.h"
#include "geometry/ChartConfig.h"
#include "core/ChartItem.h"
#include "core/Types.h"

#include <optional>

namespace ringchart {

// Result of a successful tap on the chart.
struct SegmentTapDetails {
    ChartItem item;
    int index = 0;             // position in the render list
    Point localPosition{};     // tap position relative to the chart origin
};

namespace HitTester {

    // Find the segment under point (chart-local coordinates).
    //
    // Points outside the ring [outerRadius - ringWidth, outerRadius] match
    // nothing; a single-item chart matches anywhere on the ring. Otherwise
    // the point's chart angle is located among the same spans the painter
    // lays out. Spans are half-open [start, end), so a point on a shared
    // boundary belongs to the later segment, and points in a gap match nothing.
    //
    // items is the render list with unscaled values; snapshot may be null.
    std::optional<SegmentTapDetails> hitTest(const Point& point, const ChartSize& size,
                                             const ChartConfig& config,
                                             const ChartItemList& items,
                                             const AnimationSnapshot* snapshot);

} // namespace HitTester
} // namespace ringchart
