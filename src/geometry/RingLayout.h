#pragma once

#include "animation/Transition.h"
#include "geometry/ChartConfig.h"
#include "core/ChartItem.h"
#include "core/Types.h"
#include "geometry/SegmentPath.h"

#include <optional>
#include <string>
#include <vector>

namespace ringchart {

enum class RingMode {
    Empty,      // one full ring in the default color
    Single,     // one full ring in the only item's color
    Segments    // one rounded slice per item
};

// Full-circle stroke used for empty and single-item charts.
struct RingShape {
    Point center{};
    double radius = 0.0;        // stroke centerline
    double strokeWidth = 0.0;
    RGBcolor color{};
    std::optional<std::string> label;
    Point labelAnchor{};        // top of the ring
};

struct SegmentShape {
    int itemIndex = 0;
    double startAngle = 0.0;    // chart degrees
    double spanAngle = 0.0;     // chart degrees
    RGBcolor color{};
    SegmentPath path;
    std::optional<std::string> label;
    Point labelAnchor{};
};

struct RingLayoutResult {
    RingMode mode = RingMode::Empty;
    RingShape ring;                         // Empty and Single modes
    std::vector<SegmentShape> segments;     // Segments mode
    double gapAngle = 0.0;
};

// ============================================================================
// RingLayout - turns one frame's render list into drawable shapes
// ============================================================================

namespace RingLayout {

    // Copy of items with every value multiplied by the absolute scale factor
    // of that item's live transition, if any.
    ChartItemList scaledItems(const ChartItemList& items, const AnimationSnapshot* snapshot);

    // Shapes for one frame. items is the render list (items mid-removal
    // included, values not yet scaled); snapshot may be null when idle.
    RingLayoutResult compute(const ChartItemList& items, const AnimationSnapshot* snapshot,
                             const ChartConfig& config, const ChartSize& size);

} // namespace RingLayout
} // namespace ringchart
