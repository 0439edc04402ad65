#include <gtest/gtest.h>
#include "geometry/ChartMath.h"
#include "geometry/RingLayout.h"

using namespace ringchart;

namespace {

const RGBcolor kRed{1.0f, 0.0f, 0.0f};
const RGBcolor kGreen{0.0f, 1.0f, 0.0f};
const RGBcolor kBlue{0.0f, 0.0f, 1.0f};

ChartConfig noGapConfig() {
    ChartConfig config;
    config.segmentSpacing = 0.0;
    return config;
}

} // namespace

TEST(RingLayoutTest, EmptyChartIsDefaultColoredRing) {
    ChartConfig config;
    RingLayoutResult layout = RingLayout::compute({}, nullptr, config, ChartSize{300.0, 300.0});

    EXPECT_EQ(layout.mode, RingMode::Empty);
    EXPECT_TRUE(layout.segments.empty());
    EXPECT_EQ(layout.ring.color, config.defaultColor);
    EXPECT_DOUBLE_EQ(layout.ring.radius, 130.0);
    EXPECT_DOUBLE_EQ(layout.ring.strokeWidth, 40.0);
    EXPECT_FALSE(layout.ring.label.has_value());
}

TEST(RingLayoutTest, SingleItemIsFullRing) {
    ChartItemList items = {ChartItem("a", 100.0, kRed, std::string("Only"))};
    ChartConfig config;
    RingLayoutResult layout = RingLayout::compute(items, nullptr, config, ChartSize{300.0, 300.0});

    EXPECT_EQ(layout.mode, RingMode::Single);
    EXPECT_TRUE(layout.segments.empty());
    EXPECT_EQ(layout.ring.color, kRed);
    EXPECT_DOUBLE_EQ(layout.ring.center.x, 150.0);
    EXPECT_DOUBLE_EQ(layout.ring.radius, 130.0);
    ASSERT_TRUE(layout.ring.label.has_value());
    EXPECT_EQ(*layout.ring.label, "Only");

    // Label centered at the top of the ring
    EXPECT_DOUBLE_EQ(layout.ring.labelAnchor.x, 150.0);
    EXPECT_DOUBLE_EQ(layout.ring.labelAnchor.y, 20.0);
}

TEST(RingLayoutTest, SegmentsWithoutGap) {
    ChartItemList items = {
        ChartItem("a", 30.0, kRed),
        ChartItem("b", 40.0, kGreen),
        ChartItem("c", 30.0, kBlue),
    };
    RingLayoutResult layout =
        RingLayout::compute(items, nullptr, noGapConfig(), ChartSize{300.0, 300.0});

    EXPECT_EQ(layout.mode, RingMode::Segments);
    EXPECT_DOUBLE_EQ(layout.gapAngle, 0.0);
    ASSERT_EQ(layout.segments.size(), 3u);

    EXPECT_NEAR(layout.segments[0].startAngle, 0.0, 1e-9);
    EXPECT_NEAR(layout.segments[0].spanAngle, 108.0, 1e-9);
    EXPECT_NEAR(layout.segments[1].startAngle, 108.0, 1e-9);
    EXPECT_NEAR(layout.segments[1].spanAngle, 144.0, 1e-9);
    EXPECT_NEAR(layout.segments[2].startAngle, 252.0, 1e-9);

    EXPECT_EQ(layout.segments[1].color, kGreen);
    EXPECT_EQ(layout.segments[2].itemIndex, 2);
    for (const auto& segment : layout.segments) {
        EXPECT_FALSE(segment.path.empty());
    }
}

TEST(RingLayoutTest, GapsCloseTheCircle) {
    ChartItemList items = {
        ChartItem("a", 10.0, kRed),
        ChartItem("b", 20.0, kGreen),
        ChartItem("c", 30.0, kBlue),
        ChartItem("d", 40.0, kRed),
    };
    ChartConfig config;
    ChartSize size{300.0, 300.0};
    RingLayoutResult layout = RingLayout::compute(items, nullptr, config, size);

    // Spacing is an arc length on the mid-ring circle (radius 130)
    EXPECT_NEAR(layout.gapAngle, deg(5.0 / 130.0), 1e-12);
    ASSERT_EQ(layout.segments.size(), 4u);

    for (size_t i = 1; i < layout.segments.size(); ++i) {
        const auto& prev = layout.segments[i - 1];
        EXPECT_NEAR(layout.segments[i].startAngle,
                    prev.startAngle + prev.spanAngle + layout.gapAngle, 1e-9);
    }
    const auto& last = layout.segments.back();
    EXPECT_NEAR(last.startAngle + last.spanAngle + layout.gapAngle, 360.0, 1e-9);
}

TEST(RingLayoutTest, SegmentLabelAnchor) {
    ChartItemList items = {
        ChartItem("a", 1.0, kRed, std::string("A")),
        ChartItem("b", 1.0, kGreen),
    };
    ChartSize size{200.0, 200.0};
    RingLayoutResult layout = RingLayout::compute(items, nullptr, noGapConfig(), size);

    ASSERT_TRUE(layout.segments[0].label.has_value());
    EXPECT_FALSE(layout.segments[1].label.has_value());

    // First half ends at 180, so its middle is the top of the ring
    EXPECT_NEAR(layout.segments[0].labelAnchor.x, 100.0, 1e-9);
    EXPECT_NEAR(layout.segments[0].labelAnchor.y, 20.0, 1e-9);
}

TEST(RingLayoutTest, ScaledItemsFollowSnapshot) {
    ChartItemList items = {
        ChartItem("a", 100.0, kRed),
        ChartItem("b", 100.0, kGreen),
    };
    AnimationSnapshot snapshot;
    snapshot["b"] = TransitionSample{TransitionKind::Remove, 0.5};

    ChartItemList scaled = RingLayout::scaledItems(items, &snapshot);
    ASSERT_EQ(scaled.size(), 2u);
    EXPECT_DOUBLE_EQ(scaled[0].value(), 100.0);
    EXPECT_DOUBLE_EQ(scaled[1].value(), 50.0);
    EXPECT_EQ(scaled[1].id(), "b");

    RingLayoutResult layout =
        RingLayout::compute(items, &snapshot, noGapConfig(), ChartSize{300.0, 300.0});
    EXPECT_NEAR(layout.segments[0].spanAngle, 240.0, 1e-9);
    EXPECT_NEAR(layout.segments[1].spanAngle, 120.0, 1e-9);
}
