#include <gtest/gtest.h>

#include <limits>

#include "pixel_attack_core/boundary.hpp"
#include "pixel_attack_core/errors.hpp"

TEST(BoundaryTest, InRangeCoordinatesUnchanged) {
    EXPECT_EQ(reflect_coordinate(0, 10), 0);
    EXPECT_EQ(reflect_coordinate(5, 10), 5);
    EXPECT_EQ(reflect_coordinate(9, 10), 9);
}

TEST(BoundaryTest, NegativeCoordinateIsMirrored) {
    EXPECT_EQ(reflect_coordinate(-1, 10), 1);
    EXPECT_EQ(reflect_coordinate(-9, 10), 9);
}

TEST(BoundaryTest, OverflowUsesSingleStepReflection) {
    // size - 1 - v, 结果可能为负 (不做 clamp)
    EXPECT_EQ(reflect_coordinate(10, 10), -1);
    EXPECT_EQ(reflect_coordinate(12, 10), -3);
    EXPECT_EQ(reflect_coordinate(18, 10), -9);
}

TEST(BoundaryTest, LargeNegativeIsReflectedTwiceSequentially) {
    // -20 -> 20 -> 9 - 20
    EXPECT_EQ(reflect_coordinate(-20, 10), -11);
}

TEST(BoundaryTest, ReflectionRangeForModerateOvershoot) {
    const int size = 16;
    for (int v = -(size - 1); v <= 2 * (size - 1); ++v) {
        const int r = reflect_coordinate(v, size);
        if (v <= size - 1) {
            EXPECT_GE(r, 0);
            EXPECT_LE(r, size - 1);
        } else {
            EXPECT_EQ(r, size - 1 - v);
            EXPECT_GE(r, -(size - 1));
            EXPECT_LT(r, 0);
        }
    }
}

TEST(BoundaryTest, ColorReflection) {
    EXPECT_DOUBLE_EQ(reflect_color(0.4), 0.4);
    EXPECT_DOUBLE_EQ(reflect_color(-0.2), 0.2);
    EXPECT_NEAR(reflect_color(1.3), -0.3, 1e-12);
    EXPECT_NEAR(reflect_color(-1.5), -0.5, 1e-12);
}

TEST(BoundaryTest, RepairCoordsUsesPerAxisBounds) {
    CoordArray coords(1, 2, 2);
    coords.at(0, 0, 0) = 5;   // x, height = 4
    coords.at(0, 0, 1) = 5;   // y, width = 8
    coords.at(0, 1, 0) = -2;
    coords.at(0, 1, 1) = 9;

    repair_coords(coords, 4, 8);

    EXPECT_EQ(coords.at(0, 0, 0), -2);
    EXPECT_EQ(coords.at(0, 0, 1), 5);
    EXPECT_EQ(coords.at(0, 1, 0), 2);
    EXPECT_EQ(coords.at(0, 1, 1), -2);
}

TEST(BoundaryTest, RepairColorsIsPerComponent) {
    ColorArray colors(1, 1, 3);
    colors.at(0, 0, 0) = -0.25;
    colors.at(0, 0, 1) = 0.5;
    colors.at(0, 0, 2) = 1.25;

    repair_colors(colors);

    EXPECT_DOUBLE_EQ(colors.at(0, 0, 0), 0.25);
    EXPECT_DOUBLE_EQ(colors.at(0, 0, 1), 0.5);
    EXPECT_DOUBLE_EQ(colors.at(0, 0, 2), -0.25);
}

TEST(BoundaryTest, RepairCoordsRejectsWrongDims) {
    CoordArray coords(1, 1, 3);
    EXPECT_THROW(repair_coords(coords, 4, 4), ShapeMismatch);
}

TEST(BoundaryTest, MostNegativeIntCannotBeMirrored) {
    EXPECT_THROW(reflect_coordinate(std::numeric_limits<int>::min(), 10), CoordinateOutOfRange);
    EXPECT_EQ(reflect_coordinate(std::numeric_limits<int>::min() + 1, 10),
              9 - std::numeric_limits<int>::max());
}
