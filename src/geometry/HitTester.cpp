#include "geometry/HitTester.h"
#include "geometry/ChartMath.h"
#include "geometry/RingLayout.h"
#include "geometry/SegmentCalculator.h"

#include <glm/glm.hpp>

namespace ringchart {
namespace HitTester {

std::optional<SegmentTapDetails> hitTest(const Point& point, const ChartSize& size,
                                         const ChartConfig& config,
                                         const ChartItemList& items,
                                         const AnimationSnapshot* snapshot) {
    if (items.empty()) {
        return std::nullopt;
    }

    const Point center = size.center();
    const double outerRadius = size.outerRadius();
    const double innerRadius = outerRadius - config.ringWidth;

    double distance = glm::length(point - center);
    if (distance < innerRadius || distance > outerRadius) {
        return std::nullopt;
    }

    if (items.size() == 1) {
        return SegmentTapDetails{items[0], 0, point};
    }

    double tapAngle = ChartMath::chartAngleOf(center, point);
    double gapAngle = config.gapAngle(size);

    ChartItemList scaled = RingLayout::scaledItems(items, snapshot);
    std::vector<double> spans = SegmentCalculator::calculateSpans(scaled, gapAngle, snapshot);

    // Same accumulation as RingLayout::compute, so boundaries agree exactly
    double startAngle = 0.0;
    for (size_t i = 0; i < items.size(); ++i) {
        double endAngle = startAngle + spans[i] * 360.0;
        if (tapAngle >= startAngle && tapAngle < endAngle) {
            return SegmentTapDetails{items[i], static_cast<int>(i), point};
        }
        startAngle = endAngle + gapAngle;
    }

    return std::nullopt;
}

} // namespace HitTester
} // namespace ringchart
