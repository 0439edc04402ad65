#include "geometry/ChartConfig.h"
#include "geometry/ChartMath.h"
#include "geometry/SegmentCalculator.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace ringchart {

void ChartConfig::validate(const ChartSize& size, size_t itemCount) const {
    const double radius = size.outerRadius();

    if (!(ringWidth > 0.0) || ringWidth >= radius) {
        throw std::invalid_argument(
            "ChartConfig: ring width " + std::to_string(ringWidth) +
            " must be greater than 0 and less than the chart radius " + std::to_string(radius));
    }

    double maxSpacing = SegmentCalculator::maxSegmentSpacing(itemCount, radius - ringWidth / 2.0);
    if (!(segmentSpacing >= 0.0) || segmentSpacing > maxSpacing) {
        throw std::invalid_argument(
            "ChartConfig: segment spacing " + std::to_string(segmentSpacing) +
            " is too large for " + std::to_string(itemCount) + " segments at this chart size");
    }

    if (!(animationDuration > 0.0) || !std::isfinite(animationDuration)) {
        throw std::invalid_argument("ChartConfig: animation duration must be greater than 0");
    }
}

double ChartConfig::gapAngle(const ChartSize& size) const {
    return ChartMath::angleForArcLength(size.outerRadius() - ringWidth / 2.0, segmentSpacing);
}

} // namespace ringchart
