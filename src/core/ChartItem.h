#pragma once

#include "Types.h"

#include <any>
#include <optional>
#include <string>
#include <vector>

namespace ringchart {

// ============================================================================
// ChartItem - one weighted segment of a ring chart
//
// Immutable once built. The id is the identity used to diff successive item
// lists, so it must be unique within one chart; an empty id is replaced by
// a generated one. The value must be finite and greater than 0.
// ============================================================================

class ChartItem {
public:
    // Throws std::invalid_argument if value is not a finite number > 0.
    ChartItem(std::string id, double value, const RGBcolor& color,
              std::optional<std::string> label = std::nullopt,
              std::any userData = {});

    // Same, with a generated id.
    ChartItem(double value, const RGBcolor& color,
              std::optional<std::string> label = std::nullopt);

    const std::string& id() const { return id_; }
    double value() const { return value_; }
    const RGBcolor& color() const { return color_; }
    const std::optional<std::string>& label() const { return label_; }

    // Application payload, carried through every copy and never read by
    // the chart itself.
    const std::any& userData() const { return userData_; }

    // Payload as a T, or null when it is empty or holds another type.
    template <typename T>
    const T* userDataAs() const { return std::any_cast<T>(&userData_); }

    // --- Copies with one field replaced (id and payload preserved) ---

    ChartItem withValue(double value) const;
    ChartItem withColor(const RGBcolor& color) const;
    // Pass std::nullopt to clear the label.
    ChartItem withLabel(std::optional<std::string> label) const;

private:
    std::string id_;
    double value_ = 0.0;
    RGBcolor color_{};
    std::optional<std::string> label_;
    std::any userData_;
};

using ChartItemList = std::vector<ChartItem>;

// Index of the item with the given id, or -1.
int indexOfId(const ChartItemList& items, const std::string& id);

} // namespace ringchart
