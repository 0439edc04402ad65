#include <gtest/gtest.h>
#include "animation/Easing.h"
#include "animation/Transition.h"

using namespace ringchart;

namespace {

const EasingType kAllEasings[] = {
    EasingType::Linear, EasingType::Quadratic, EasingType::InvQuadratic,
    EasingType::Sigmoid, EasingType::SigmoidAccel, EasingType::EaseIn,
    EasingType::EaseOut, EasingType::EaseInOut,
};

} // namespace

TEST(EasingTest, EndpointsAreExact) {
    for (EasingType type : kAllEasings) {
        EXPECT_DOUBLE_EQ(Easing::apply(type, 0.0), 0.0) << Easing::name(type);
        EXPECT_DOUBLE_EQ(Easing::apply(type, 1.0), 1.0) << Easing::name(type);
        // Clamped outside [0, 1]
        EXPECT_DOUBLE_EQ(Easing::apply(type, -0.5), 0.0) << Easing::name(type);
        EXPECT_DOUBLE_EQ(Easing::apply(type, 2.0), 1.0) << Easing::name(type);
    }
}

TEST(EasingTest, Monotonic) {
    for (EasingType type : kAllEasings) {
        double previous = 0.0;
        for (int i = 1; i <= 50; ++i) {
            double value = Easing::apply(type, i / 50.0);
            EXPECT_GE(value, previous - 1e-9) << Easing::name(type) << " at " << i;
            previous = value;
        }
    }
}

TEST(EasingTest, CurveShapes) {
    EXPECT_DOUBLE_EQ(Easing::apply(EasingType::Linear, 0.25), 0.25);
    EXPECT_DOUBLE_EQ(Easing::apply(EasingType::Quadratic, 0.5), 0.25);
    EXPECT_DOUBLE_EQ(Easing::apply(EasingType::InvQuadratic, 0.5), 0.75);
    EXPECT_NEAR(Easing::apply(EasingType::Sigmoid, 0.5), 0.5, 1e-12);

    // Ease-in starts slowly, ease-out finishes slowly
    EXPECT_LT(Easing::apply(EasingType::EaseIn, 0.5), 0.5);
    EXPECT_GT(Easing::apply(EasingType::EaseOut, 0.5), 0.5);
    EXPECT_NEAR(Easing::apply(EasingType::EaseInOut, 0.5), 0.5, 1e-6);
}

TEST(EasingTest, Names) {
    for (EasingType type : kAllEasings) {
        EasingType parsed = EasingType::Linear;
        ASSERT_TRUE(Easing::fromName(Easing::name(type), parsed));
        EXPECT_EQ(parsed, type);
    }
    EXPECT_STREQ(Easing::name(EasingType::EaseIn), "easeIn");

    EasingType unchanged = EasingType::Sigmoid;
    EXPECT_FALSE(Easing::fromName("bouncy", unchanged));
    EXPECT_EQ(unchanged, EasingType::Sigmoid);
}

TEST(TransitionTest, AddGrowsFromVanished) {
    Transition t = Transition::add(10.0, 0.2, EasingType::Linear);
    EXPECT_EQ(t.kind(), TransitionKind::Add);
    EXPECT_DOUBLE_EQ(t.valueAt(10.0), VANISHED_SCALE);
    EXPECT_NEAR(t.valueAt(10.1), (VANISHED_SCALE + 1.0) / 2.0, 1e-12);
    EXPECT_DOUBLE_EQ(t.valueAt(10.3), 1.0);
    EXPECT_DOUBLE_EQ(t.valueAt(50.0), 1.0);
}

TEST(TransitionTest, RemoveShrinksToVanished) {
    Transition t = Transition::remove(0.0, 0.15, EasingType::EaseIn);
    EXPECT_EQ(t.kind(), TransitionKind::Remove);
    EXPECT_DOUBLE_EQ(t.valueAt(0.0), 1.0);
    EXPECT_DOUBLE_EQ(t.valueAt(0.2), VANISHED_SCALE);
    EXPECT_GT(t.valueAt(0.05), VANISHED_SCALE);
    EXPECT_LT(t.valueAt(0.05), 1.0);
}

TEST(TransitionTest, UpdateValueStartsAtRatio) {
    Transition t = Transition::updateValue(100.0, 200.0, 1.0, 0.15, EasingType::EaseIn);
    EXPECT_EQ(t.kind(), TransitionKind::UpdateValue);
    EXPECT_DOUBLE_EQ(t.startValue(), 0.5);
    EXPECT_DOUBLE_EQ(t.endValue(), 1.0);
    EXPECT_DOUBLE_EQ(t.valueAt(1.0), 0.5);
    EXPECT_DOUBLE_EQ(t.valueAt(1.2), 1.0);
}

TEST(TransitionTest, ProgressAndCompletion) {
    Transition t = Transition::add(2.0, 1.0, EasingType::EaseIn);
    EXPECT_DOUBLE_EQ(t.progress(1.0), 0.0);
    EXPECT_DOUBLE_EQ(t.progress(2.5), 0.5);
    EXPECT_DOUBLE_EQ(t.progress(4.0), 1.0);

    EXPECT_FALSE(t.isComplete(2.99));
    EXPECT_TRUE(t.isComplete(3.0));
}
