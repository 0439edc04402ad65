#pragma once

#include <memory>
#include <optional>
#include <string>

#include "core/ChartItem.h"
#include "geometry/HitTester.h"

namespace ringchart {

class ChartWidget;

// Demo window: one animated ring chart plus controls that edit its items
// and style.
class MainWindow {
public:
    static MainWindow& instance();
    ~MainWindow();

    void init();
    void draw();

    // Item list edits, each animated by the chart
    void addMiddleItem();
    void removeMiddleItem();
    void scaleLastValue(double factor);
    void setFirstValue(double value);

    const ChartItemList& items() const { return items_; }

private:
    MainWindow() = default;

    void drawControls();
    void drawTapDetails();
    void pushItems();
    void fitStyleToSide();

    std::unique_ptr<ChartWidget> chart_;
    ChartItemList items_;
    std::optional<SegmentTapDetails> lastTap_;
    int addedCount_ = 0;

    // Slider state
    float firstValue_ = 100.0f;
    float cornerRadius_ = 10.0f;
    float side_ = 300.0f;
};

} // namespace ringchart
