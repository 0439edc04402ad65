#include "geometry/RingLayout.h"
#include "geometry/SegmentCalculator.h"

#include <cmath>
#include <utility>

namespace ringchart {
namespace RingLayout {

ChartItemList scaledItems(const ChartItemList& items, const AnimationSnapshot* snapshot) {
    ChartItemList scaled;
    scaled.reserve(items.size());
    for (const auto& item : items) {
        double scale = 1.0;
        if (snapshot) {
            auto it = snapshot->find(item.id());
            if (it != snapshot->end()) {
                scale = std::abs(it->second.value);
            }
        }
        scaled.push_back(scale == 1.0 ? item : item.withValue(item.value() * scale));
    }
    return scaled;
}

// ============================================================================
// compute
// ============================================================================

RingLayoutResult compute(const ChartItemList& items, const AnimationSnapshot* snapshot,
                         const ChartConfig& config, const ChartSize& size) {
    RingLayoutResult result;

    const Point center = size.center();
    const double outerRadius = size.outerRadius();
    const double ringWidth = config.ringWidth;

    if (items.size() < 2) {
        // Empty and single-item charts skip span computation entirely
        RingShape& ring = result.ring;
        ring.center = center;
        ring.radius = outerRadius - ringWidth / 2.0;
        ring.strokeWidth = ringWidth;
        ring.labelAnchor = Point(center.x, center.y - outerRadius + ringWidth / 2.0);
        if (items.empty()) {
            result.mode = RingMode::Empty;
            ring.color = config.defaultColor;
        } else {
            result.mode = RingMode::Single;
            ring.color = items[0].color();
            ring.label = items[0].label();
        }
        return result;
    }

    result.mode = RingMode::Segments;
    result.gapAngle = config.gapAngle(size);

    ChartItemList scaled = scaledItems(items, snapshot);
    std::vector<double> spans =
        SegmentCalculator::calculateSpans(scaled, result.gapAngle, snapshot);

    double startAngle = 0.0;
    result.segments.reserve(scaled.size());
    for (size_t i = 0; i < scaled.size(); ++i) {
        double segmentDegrees = spans[i] * 360.0;
        double endAngle = startAngle + segmentDegrees;

        SegmentShape shape;
        shape.itemIndex = static_cast<int>(i);
        shape.startAngle = startAngle;
        shape.spanAngle = segmentDegrees;
        shape.color = scaled[i].color();
        shape.label = scaled[i].label();
        shape.path = SegmentPathBuilder::buildSegmentPath(
            center, outerRadius, ringWidth, startAngle, segmentDegrees, config.cornerRadii);
        shape.labelAnchor = SegmentPathBuilder::labelAnchor(
            center, outerRadius, ringWidth, startAngle, segmentDegrees);
        result.segments.push_back(std::move(shape));

        startAngle = endAngle + result.gapAngle;
    }

    return result;
}

} // namespace RingLayout
} // namespace ringchart
