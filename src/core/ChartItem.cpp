#include "core/ChartItem.h"
#include "core/PlatformUtils.h"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace ringchart {

ChartItem::ChartItem(std::string id, double value, const RGBcolor& color,
                     std::optional<std::string> label, std::any userData)
    : id_(std::move(id)),
      value_(value),
      color_(color),
      label_(std::move(label)),
      userData_(std::move(userData)) {
    if (!std::isfinite(value_) || value_ <= 0.0) {
        throw std::invalid_argument("ChartItem: value must be greater than 0");
    }
    if (id_.empty()) {
        id_ = PlatformUtils::generateId();
    }
}

ChartItem::ChartItem(double value, const RGBcolor& color, std::optional<std::string> label)
    : ChartItem(std::string(), value, color, std::move(label)) {
}

ChartItem ChartItem::withValue(double value) const {
    return ChartItem(id_, value, color_, label_, userData_);
}

ChartItem ChartItem::withColor(const RGBcolor& color) const {
    return ChartItem(id_, value_, color, label_, userData_);
}

ChartItem ChartItem::withLabel(std::optional<std::string> label) const {
    return ChartItem(id_, value_, color_, std::move(label), userData_);
}

int indexOfId(const ChartItemList& items, const std::string& id) {
    for (size_t i = 0; i < items.size(); ++i) {
        if (items[i].id() == id) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

} // namespace ringchart
