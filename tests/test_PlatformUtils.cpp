#include <gtest/gtest.h>
#include "core/Types.h"
#include "core/PlatformUtils.h"

#include <set>

using namespace ringchart;

TEST(PlatformUtilsTest, Hex2Rgb) {
    RGBcolor c = PlatformUtils::hex2rgb("#FF0000");
    EXPECT_NEAR(c.r, 1.0f, 0.01f);
    EXPECT_NEAR(c.g, 0.0f, 0.01f);
    EXPECT_NEAR(c.b, 0.0f, 0.01f);
    EXPECT_NEAR(c.a, 1.0f, 0.01f);

    c = PlatformUtils::hex2rgb("00FF00");
    EXPECT_NEAR(c.g, 1.0f, 0.01f);

    c = PlatformUtils::hex2rgb("#A0A0A0");
    EXPECT_NEAR(c.r, 160.0f / 255.0f, 0.01f);

    c = PlatformUtils::hex2rgb("#0000FF80");
    EXPECT_NEAR(c.b, 1.0f, 0.01f);
    EXPECT_NEAR(c.a, 128.0f / 255.0f, 0.01f);
}

TEST(PlatformUtilsTest, Hex2RgbMalformed) {
    RGBcolor black{0.0f, 0.0f, 0.0f, 1.0f};
    EXPECT_EQ(PlatformUtils::hex2rgb(""), black);
    EXPECT_EQ(PlatformUtils::hex2rgb("#FFF"), black);
    EXPECT_EQ(PlatformUtils::hex2rgb("#GGHHII"), black);
}

TEST(PlatformUtilsTest, Rgb2Hex) {
    RGBcolor c{1.0f, 0.0f, 0.0f};
    EXPECT_EQ(PlatformUtils::rgb2hex(c), "#FF0000");

    RGBcolor translucent{0.0f, 0.0f, 1.0f, 0.5f};
    EXPECT_EQ(PlatformUtils::rgb2hex(translucent), "#0000FF80");
}

TEST(PlatformUtilsTest, GenerateIdUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        std::string id = PlatformUtils::generateId();
        EXPECT_NE(id.find('-'), std::string::npos);
        EXPECT_TRUE(seen.insert(id).second) << id;
    }
}

TEST(PlatformUtilsTest, GetTimeIsMonotonic) {
    double t0 = PlatformUtils::getTime();
    double t1 = PlatformUtils::getTime();
    EXPECT_GE(t0, 0.0);
    EXPECT_GE(t1, t0);
}
