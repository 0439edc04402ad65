#include <gtest/gtest.h>
#include "geometry/ChartMath.h"
#include "geometry/HitTester.h"

using namespace ringchart;

namespace {

const ChartSize kSize{200.0, 200.0};
const Point kCenter(100.0, 100.0);

ChartConfig testConfig(double spacing = 0.0) {
    ChartConfig config;
    config.ringWidth = 20.0;
    config.segmentSpacing = spacing;
    return config;
}

ChartItemList twoHalves() {
    return {
        ChartItem("a", 1.0, RGBcolor{1.0f, 0.0f, 0.0f}),
        ChartItem("b", 1.0, RGBcolor{0.0f, 0.0f, 1.0f}),
    };
}

} // namespace

TEST(HitTesterTest, FindsSegmentByAngle) {
    auto items = twoHalves();

    auto top = HitTester::hitTest(ChartMath::pointOnRing(kCenter, 90.0, 90.0), kSize,
                                  testConfig(), items, nullptr);
    ASSERT_TRUE(top.has_value());
    EXPECT_EQ(top->index, 0);
    EXPECT_EQ(top->item.id(), "a");

    auto bottom = HitTester::hitTest(ChartMath::pointOnRing(kCenter, 90.0, 270.0), kSize,
                                     testConfig(), items, nullptr);
    ASSERT_TRUE(bottom.has_value());
    EXPECT_EQ(bottom->index, 1);
    EXPECT_EQ(bottom->item.id(), "b");
}

TEST(HitTesterTest, SharedBoundaryBelongsToLaterSegment) {
    auto items = twoHalves();
    // Chart angle exactly 180, where "a" ends and "b" starts
    Point boundary(190.0, 100.0);

    auto hit = HitTester::hitTest(boundary, kSize, testConfig(), items, nullptr);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->index, 1);

    // Same answer every time
    auto again = HitTester::hitTest(boundary, kSize, testConfig(), items, nullptr);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->index, 1);
}

TEST(HitTesterTest, GapMatchesNothing) {
    auto items = twoHalves();
    ChartConfig config = testConfig(10.0);
    double gap = config.gapAngle(kSize);
    ASSERT_GT(gap, 1.0);

    // "a" ends at 180 - gap; the gap runs up to 180
    Point inGap = ChartMath::pointOnRing(kCenter, 90.0, 180.0 - gap / 2.0);
    EXPECT_FALSE(HitTester::hitTest(inGap, kSize, config, items, nullptr).has_value());

    Point inA = ChartMath::pointOnRing(kCenter, 90.0, 180.0 - gap * 1.5);
    auto hit = HitTester::hitTest(inA, kSize, config, items, nullptr);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->index, 0);
}

TEST(HitTesterTest, OutsideRingMatchesNothing) {
    auto items = twoHalves();
    EXPECT_FALSE(HitTester::hitTest(kCenter, kSize, testConfig(), items, nullptr).has_value());
    EXPECT_FALSE(HitTester::hitTest(ChartMath::pointOnRing(kCenter, 70.0, 45.0), kSize,
                                    testConfig(), items, nullptr).has_value());
    EXPECT_FALSE(HitTester::hitTest(ChartMath::pointOnRing(kCenter, 101.0, 45.0), kSize,
                                    testConfig(), items, nullptr).has_value());
    EXPECT_FALSE(HitTester::hitTest(Point(0.0, 0.0), kSize, testConfig(), items, nullptr)
                     .has_value());
}

TEST(HitTesterTest, SingleItemMatchesWholeRing) {
    ChartItemList items = {ChartItem("only", 5.0, RGBcolor{})};
    for (double angle = 0.0; angle < 360.0; angle += 45.0) {
        Point p = ChartMath::pointOnRing(kCenter, 85.0, angle);
        auto hit = HitTester::hitTest(p, kSize, testConfig(), items, nullptr);
        ASSERT_TRUE(hit.has_value());
        EXPECT_EQ(hit->index, 0);
        EXPECT_EQ(hit->item.id(), "only");
        EXPECT_DOUBLE_EQ(hit->localPosition.x, p.x);
        EXPECT_DOUBLE_EQ(hit->localPosition.y, p.y);
    }
}

TEST(HitTesterTest, EmptyChartMatchesNothing) {
    Point p = ChartMath::pointOnRing(kCenter, 90.0, 10.0);
    EXPECT_FALSE(HitTester::hitTest(p, kSize, testConfig(), {}, nullptr).has_value());
}

TEST(HitTesterTest, UsesAnimatedSpans) {
    auto items = twoHalves();
    AnimationSnapshot snapshot;
    snapshot["b"] = TransitionSample{TransitionKind::Remove, VANISHED_SCALE};

    // "b" has shrunk to about 1% of the circle at the end
    Point p = ChartMath::pointOnRing(kCenter, 90.0, 300.0);
    auto hit = HitTester::hitTest(p, kSize, testConfig(), items, &snapshot);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->index, 0);

    Point end = ChartMath::pointOnRing(kCenter, 90.0, 358.5);
    hit = HitTester::hitTest(end, kSize, testConfig(), items, &snapshot);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->index, 1);
}
