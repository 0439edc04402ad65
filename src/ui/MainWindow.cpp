#include "ui/MainWindow.h"

#include <imgui.h>
#include <algorithm>
#include <cstddef>
#include <string>

#include "app/Config.h"
#include "core/PlatformUtils.h"
#include "geometry/SegmentCalculator.h"
#include "ui/ChartWidget.h"

namespace ringchart {

static const RGBcolor kRed{0.96f, 0.26f, 0.21f, 1.0f};
static const RGBcolor kGreen{0.30f, 0.69f, 0.31f, 1.0f};
static const RGBcolor kBlue{0.13f, 0.59f, 0.95f, 1.0f};
static const RGBcolor kAmber{1.0f, 0.84f, 0.25f, 1.0f};

MainWindow& MainWindow::instance() {
    static MainWindow s;
    return s;
}

MainWindow::~MainWindow() = default;

void MainWindow::init() {
    items_ = {
        ChartItem("red", 100.0, kRed, std::string("Red")),
        ChartItem("green", 200.0, kGreen, std::string("Green")),
        ChartItem("blue", 500.0, kBlue, std::string("Blue")),
    };
    firstValue_ = static_cast<float>(items_.front().value());

    const ChartConfig& style = Config::instance().chart;
    cornerRadius_ = static_cast<float>(style.cornerRadii.outerLeading.x);

    chart_ = std::make_unique<ChartWidget>(items_, style);
    chart_->setOnSegmentTap([this](const SegmentTapDetails& details) {
        lastTap_ = details;
    });
}

// ============================================================================
// Item edits
// ============================================================================

void MainWindow::pushItems() {
    if (chart_) {
        chart_->setItems(items_);
    }
}

void MainWindow::addMiddleItem() {
    size_t index = (items_.size() + 1) / 2;
    ++addedCount_;
    ChartItem item(100.0, kAmber, "Added " + std::to_string(addedCount_));
    items_.insert(items_.begin() + static_cast<std::ptrdiff_t>(index), item);
    pushItems();
}

void MainWindow::removeMiddleItem() {
    if (items_.empty()) {
        return;
    }
    size_t index = std::min(items_.size() / 2, items_.size() - 1);
    items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(index));
    pushItems();
}

void MainWindow::scaleLastValue(double factor) {
    if (items_.empty()) {
        return;
    }
    ChartItem& last = items_.back();
    last = last.withValue(last.value() * factor);
    pushItems();
}

void MainWindow::setFirstValue(double value) {
    if (items_.empty()) {
        return;
    }
    items_.front() = items_.front().withValue(value);
    pushItems();
}

// ============================================================================
// draw
// ============================================================================

void MainWindow::draw() {
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);

    ImGuiWindowFlags windowFlags =
        ImGuiWindowFlags_NoTitleBar |
        ImGuiWindowFlags_NoCollapse |
        ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_NoBringToFrontOnFocus;

    ImGui::Begin("ringchart", nullptr, windowFlags);

    const float controlsWidth = 320.0f;
    ImVec2 avail = ImGui::GetContentRegionAvail();
    float side = std::min(avail.x - controlsWidth, avail.y);
    side_ = std::max(side, 120.0f);
    fitStyleToSide();

    ImGui::BeginChild("##chart", ImVec2(side_, side_));
    chart_->draw("##ring", side_);
    ImGui::EndChild();

    ImGui::SameLine();
    ImGui::BeginChild("##controls", ImVec2(0.0f, 0.0f));
    drawControls();
    ImGui::Separator();
    drawTapDetails();
    ImGui::EndChild();

    ImGui::End();
}

// Shrink ring width and spacing so a smaller window still satisfies
// ChartConfig::validate.
void MainWindow::fitStyleToSide() {
    ChartConfig style = chart_->config();
    double outerRadius = side_ * 0.5;
    bool changed = false;

    if (style.ringWidth >= outerRadius) {
        style.ringWidth = outerRadius * 0.5;
        changed = true;
    }
    // Items mid-removal are still drawn and count towards the limit
    double maxSpacing = SegmentCalculator::maxSegmentSpacing(
        chart_->renderItemCount(), outerRadius - style.ringWidth * 0.5);
    if (style.segmentSpacing > maxSpacing) {
        style.segmentSpacing = std::max(maxSpacing, 0.0);
        changed = true;
    }

    if (changed) {
        chart_->setConfig(style);
    }
}

void MainWindow::drawControls() {
    if (ImGui::Button("Add item")) {
        addMiddleItem();
    }
    ImGui::SameLine();
    if (ImGui::Button("Remove item")) {
        removeMiddleItem();
    }
    if (ImGui::Button("Value x2")) {
        scaleLastValue(2.0);
    }
    ImGui::SameLine();
    if (ImGui::Button("Value / 2")) {
        scaleLastValue(0.5);
    }

    ImGui::Spacing();

    if (!items_.empty()) {
        if (ImGui::SliderFloat("First value", &firstValue_, 1.0f, 1000.0f, "%.0f")) {
            setFirstValue(firstValue_);
        }
    }

    ChartConfig style = chart_->config();
    // Slider limits follow the ring the chart was last drawn with
    float outerRadius = side_ * 0.5f;
    float maxRingWidth = std::max(outerRadius - 1.0f, 4.0f);
    float maxSpacing = static_cast<float>(SegmentCalculator::maxSegmentSpacing(
        chart_->renderItemCount(), outerRadius - style.ringWidth * 0.5));
    maxSpacing = std::min(std::max(maxSpacing, 0.0f), 30.0f);

    bool changed = false;
    if (ImGui::SliderFloat("Corner radius", &cornerRadius_, 0.0f, 40.0f, "%.1f")) {
        style.cornerRadii = CornerRadii::all(CornerRadius::circular(cornerRadius_));
        changed = true;
    }
    float ringWidth = static_cast<float>(style.ringWidth);
    if (ImGui::SliderFloat("Ring width", &ringWidth, 4.0f, maxRingWidth, "%.0f")) {
        style.ringWidth = ringWidth;
        changed = true;
    }
    float spacing = static_cast<float>(style.segmentSpacing);
    if (ImGui::SliderFloat("Spacing", &spacing, 0.0f, maxSpacing, "%.1f")) {
        style.segmentSpacing = spacing;
        changed = true;
    }

    if (changed) {
        chart_->setConfig(style);
        Config::instance().chart = style;
    }
}

void MainWindow::drawTapDetails() {
    if (!lastTap_) {
        ImGui::TextDisabled("Click a segment");
        return;
    }
    const ChartItem& item = lastTap_->item;
    ImGui::Text("Index: %d", lastTap_->index);
    ImGui::Text("Id: %s", item.id().c_str());
    if (item.label()) {
        ImGui::Text("Label: %s", item.label()->c_str());
    }
    ImGui::Text("Value: %.2f", item.value());
    ImGui::Text("Color: %s", PlatformUtils::rgb2hex(item.color()).c_str());
    ImGui::Text("Position: (%.1f, %.1f)",
                lastTap_->localPosition.x, lastTap_->localPosition.y);
}

} // namespace ringchart
