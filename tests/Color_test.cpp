#include <gtest/gtest.h>

#include "Color.hpp"

TEST(Color, ParsesSixAndEightDigitHex)
{
    const auto rgb = Color::fromHex("#ff8000");
    ASSERT_TRUE(rgb.has_value());
    EXPECT_FLOAT_EQ(rgb->r, 1.0f);
    EXPECT_NEAR(rgb->g, 128.0f / 255.0f, 1e-6f);
    EXPECT_FLOAT_EQ(rgb->b, 0.0f);
    EXPECT_FLOAT_EQ(rgb->a, 1.0f);

    const auto rgba = Color::fromHex("00FF0080");
    ASSERT_TRUE(rgba.has_value());
    EXPECT_FLOAT_EQ(rgba->g, 1.0f);
    EXPECT_NEAR(rgba->a, 128.0f / 255.0f, 1e-6f);
}

TEST(Color, RejectsMalformedHex)
{
    EXPECT_FALSE(Color::fromHex("").has_value());
    EXPECT_FALSE(Color::fromHex("#").has_value());
    EXPECT_FALSE(Color::fromHex("#fff").has_value());
    EXPECT_FALSE(Color::fromHex("#gg0000").has_value());
    EXPECT_FALSE(Color::fromHex("#1234567").has_value());
}

TEST(Color, ToHexIsLowercaseRgba)
{
    EXPECT_EQ((Color{1.0f, 0.5f, 0.0f, 1.0f}).toHex(), "#ff8000ff");
    EXPECT_EQ((Color{0.0f, 0.0f, 0.0f, 0.0f}).toHex(), "#00000000");
}

TEST(Color, ArithmeticClamps)
{
    const Color a{0.8f, 0.5f, 0.1f, 1.0f};
    const Color b{0.5f, 0.5f, 0.2f, 1.0f};

    const Color sum = a.add(b);
    EXPECT_FLOAT_EQ(sum.r, 1.0f);
    EXPECT_FLOAT_EQ(sum.g, 1.0f);
    EXPECT_NEAR(sum.b, 0.3f, 1e-6f);
    EXPECT_FLOAT_EQ(sum.a, 1.0f);

    const Color product = a.multiply(b);
    EXPECT_NEAR(product.r, 0.4f, 1e-6f);
    EXPECT_NEAR(product.b, 0.02f, 1e-6f);

    const Color wild{-1.0f, 2.0f, 0.5f, 7.0f};
    EXPECT_EQ(wild.clamped(), (Color{0.0f, 1.0f, 0.5f, 1.0f}));
}

TEST(Color, ToVec4)
{
    const glm::vec4 v = Color{0.1f, 0.2f, 0.3f, 0.4f}.toVec4();
    EXPECT_FLOAT_EQ(v.x, 0.1f);
    EXPECT_FLOAT_EQ(v.w, 0.4f);
}
