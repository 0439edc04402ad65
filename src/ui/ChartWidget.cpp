#include "ui/ChartWidget.h"

#include "core/PlatformUtils.h"
#include "geometry/RingLayout.h"
#include "renderer/ChartRenderer.h"

namespace ringchart {

ChartWidget::ChartWidget(ChartItemList items, ChartConfig config)
    : animator_(std::move(items), config.animationDuration, config.easing),
      config_(std::move(config)) {}

ChartWidget::~ChartWidget() {
    animator_.dispose();
}

void ChartWidget::setItems(const ChartItemList& items) {
    animator_.setTiming(config_.animationDuration, config_.easing);
    animator_.update(items, PlatformUtils::getTime());
}

void ChartWidget::draw(const char* id, float side) {
    ChartSize size{side, side};
    config_.validate(size, animator_.renderItems().size());

    animator_.setTiming(config_.animationDuration, config_.easing);
    animator_.tick(PlatformUtils::getTime());

    const ChartItemList& items = animator_.renderItems();
    const AnimationSnapshot& snapshot = animator_.snapshot();

    ImVec2 origin = ImGui::GetCursorScreenPos();
    ImGui::InvisibleButton(id, ImVec2(side, side));

    if (ImGui::IsItemClicked(ImGuiMouseButton_Left) && onSegmentTap_) {
        ImVec2 mouse = ImGui::GetIO().MousePos;
        Point local(mouse.x - origin.x, mouse.y - origin.y);
        auto hit = HitTester::hitTest(local, size, config_, items, &snapshot);
        if (hit) {
            onSegmentTap_(*hit);
        }
    }

    RingLayoutResult layout = RingLayout::compute(items, &snapshot, config_, size);
    ChartRenderer::draw(ImGui::GetWindowDrawList(), origin, size, layout, config_);
}

} // namespace ringchart
