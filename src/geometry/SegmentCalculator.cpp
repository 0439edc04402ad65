#include "geometry/SegmentCalculator.h"
#include "core/Types.h"

#include <limits>

namespace ringchart {
namespace SegmentCalculator {

double maxSegmentSpacing(size_t itemCount, double radius) {
    if (itemCount == 0) {
        return std::numeric_limits<double>::infinity();
    }

    double count = static_cast<double>(itemCount);
    double circumference = 2.0 * PI * radius;
    double totalMinSegmentLength = MIN_SEGMENT_FRACTION * circumference * count;
    double maxTotalGapLength = circumference - totalMinSegmentLength;

    if (maxTotalGapLength <= 0.0) {
        return 0.0;
    }
    return maxTotalGapLength / count;
}

std::vector<double> calculateSpans(const ChartItemList& items, double gapDegrees,
                                   const AnimationSnapshot* snapshot) {
    if (items.empty()) {
        return {};
    }

    double totalSize = 0.0;
    for (const auto& item : items) {
        totalSize += item.value();
    }

    std::vector<double> spans(items.size(), 0.0);
    if (totalSize > 0.0) {
        for (size_t i = 0; i < items.size(); ++i) {
            spans[i] = items[i].value() / totalSize;
        }
    }

    double gapFraction = gapDegrees / 360.0;
    double availableFraction = 1.0 - static_cast<double>(items.size()) * gapFraction;

    double totalAdjusted = 0.0;
    for (size_t i = 0; i < spans.size(); ++i) {
        if (spans[i] < MIN_SEGMENT_FRACTION) {
            const TransitionSample* sample = nullptr;
            if (snapshot) {
                auto it = snapshot->find(items[i].id());
                if (it != snapshot->end()) {
                    sample = &it->second;
                }
            }

            if (!sample || sample->kind == TransitionKind::UpdateValue) {
                spans[i] = MIN_SEGMENT_FRACTION;
            } else {
                // Appearing or disappearing: keep the raw size and only
                // claim as much gap as the item is currently present
                availableFraction -= gapFraction * sample->value;
            }
        }
        totalAdjusted += spans[i];
    }

    if (totalAdjusted > 0.0) {
        double scale = availableFraction / totalAdjusted;
        for (auto& span : spans) {
            span *= scale;
        }
    }
    return spans;
}

} // namespace SegmentCalculator
} // namespace ringchart
