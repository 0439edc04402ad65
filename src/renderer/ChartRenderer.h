#pragma once

#include "geometry/ChartConfig.h"
#include "core/Types.h"
#include "geometry/RingLayout.h"

#include <imgui.h>

#include <optional>
#include <string>

namespace ringchart {

// Issues one frame of RingLayout shapes to an ImGui draw list.
class ChartRenderer {
public:
    // origin is the screen position of the chart's top-left corner.
    static void draw(ImDrawList* drawList, const ImVec2& origin, const ChartSize& size,
                     const RingLayoutResult& layout, const ChartConfig& config);

    static ImU32 toImColor(const RGBcolor& color);

private:
    static void drawRing(ImDrawList* drawList, const ImVec2& origin, const RingShape& ring);
    static void drawSegment(ImDrawList* drawList, const ImVec2& origin,
                            const SegmentShape& segment);
    static void drawLabel(ImDrawList* drawList, const ImVec2& origin, const Point& anchor,
                          const std::string& text, const ChartConfig& config, float wrapWidth);
};

} // namespace ringchart
