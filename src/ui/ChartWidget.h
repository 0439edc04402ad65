#pragma once

#include "animation/ChartAnimator.h"
#include "geometry/ChartConfig.h"
#include "core/ChartItem.h"
#include "geometry/HitTester.h"

#include <imgui.h>

#include <functional>
#include <utility>

namespace ringchart {

// Interactive ring chart for an ImGui window. Owns the animator, so item
// updates passed to setItems() are animated against the previous list.
class ChartWidget {
public:
    using TapCallback = std::function<void(const SegmentTapDetails&)>;

    explicit ChartWidget(ChartItemList items = {}, ChartConfig config = {});
    ~ChartWidget();

    ChartWidget(const ChartWidget&) = delete;
    ChartWidget& operator=(const ChartWidget&) = delete;

    void setItems(const ChartItemList& items);
    const ChartItemList& items() const { return animator_.items(); }
    // Items drawn this frame, including those still shrinking away
    size_t renderItemCount() const { return animator_.renderItems().size(); }

    void setConfig(const ChartConfig& config) { config_ = config; }
    const ChartConfig& config() const { return config_; }

    void setOnSegmentTap(TapCallback callback) { onSegmentTap_ = std::move(callback); }

    // Lay out, paint and hit-test the chart in a side x side square at the
    // current cursor position. Throws std::invalid_argument if the config
    // does not fit that size.
    void draw(const char* id, float side);

    bool isAnimating() const { return animator_.isAnimating(); }

private:
    ChartAnimator animator_;
    ChartConfig config_;
    TapCallback onSegmentTap_;
};

} // namespace ringchart
