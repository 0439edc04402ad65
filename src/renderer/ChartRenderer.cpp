#include "renderer/ChartRenderer.h"

#include <cfloat>
#include <vector>

namespace ringchart {

ImU32 ChartRenderer::toImColor(const RGBcolor& color) {
    return ImGui::ColorConvertFloat4ToU32(ImVec4(color.r, color.g, color.b, color.a));
}

static ImVec2 toScreen(const ImVec2& origin, const Point& p) {
    return ImVec2(origin.x + static_cast<float>(p.x), origin.y + static_cast<float>(p.y));
}

void ChartRenderer::draw(ImDrawList* drawList, const ImVec2& origin, const ChartSize& size,
                         const RingLayoutResult& layout, const ChartConfig& config) {
    // Labels wrap at half the chart width
    float wrapWidth = static_cast<float>(size.width * 0.5);

    if (layout.mode != RingMode::Segments) {
        drawRing(drawList, origin, layout.ring);
        if (layout.ring.label) {
            drawLabel(drawList, origin, layout.ring.labelAnchor, *layout.ring.label,
                      config, wrapWidth);
        }
        return;
    }

    for (const auto& segment : layout.segments) {
        drawSegment(drawList, origin, segment);
    }
    // Labels go on top of every slice
    for (const auto& segment : layout.segments) {
        if (segment.label) {
            drawLabel(drawList, origin, segment.labelAnchor, *segment.label, config, wrapWidth);
        }
    }
}

void ChartRenderer::drawRing(ImDrawList* drawList, const ImVec2& origin, const RingShape& ring) {
    drawList->AddCircle(toScreen(origin, ring.center), static_cast<float>(ring.radius),
                        toImColor(ring.color), 0, static_cast<float>(ring.strokeWidth));
}

void ChartRenderer::drawSegment(ImDrawList* drawList, const ImVec2& origin,
                                const SegmentShape& segment) {
    std::vector<Point> outline = segment.path.flatten();
    if (outline.size() < 3) {
        return;
    }

    std::vector<ImVec2> points;
    points.reserve(outline.size());
    for (const auto& p : outline) {
        points.push_back(toScreen(origin, p));
    }

    // Ring slices are concave along the inner arc
    drawList->AddConcavePolyFilled(points.data(), static_cast<int>(points.size()),
                                   toImColor(segment.color));
}

void ChartRenderer::drawLabel(ImDrawList* drawList, const ImVec2& origin, const Point& anchor,
                              const std::string& text, const ChartConfig& config,
                              float wrapWidth) {
    ImFont* font = ImGui::GetFont();
    float fontSize = ImGui::GetFontSize();
    ImU32 color = ImGui::GetColorU32(ImGuiCol_Text);
    if (config.labelStyle) {
        fontSize *= config.labelStyle->fontScale;
        color = toImColor(config.labelStyle->color);
    }

    const char* begin = text.c_str();
    const char* end = begin + text.size();
    ImVec2 textSize = font->CalcTextSizeA(fontSize, FLT_MAX, wrapWidth, begin, end);

    ImVec2 center = toScreen(origin, anchor);
    ImVec2 pos(center.x - textSize.x * 0.5f, center.y - textSize.y * 0.5f);
    drawList->AddText(font, fontSize, pos, color, begin, end, wrapWidth);
}

} // namespace ringchart
