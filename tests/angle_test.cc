#define _USE_MATH_DEFINES
#include <cmath>
#include <limits>
#include <gtest/gtest.h>
#include "Rotation.h"

using namespace kRotate;

// ── Conversion ────────────────────────────────────────────────────────────────

TEST(angle, degrees_radians_conversion)
{
    EXPECT_DOUBLE_EQ(degreesToRadians(180.0), M_PI);
    EXPECT_DOUBLE_EQ(degreesToRadians(-90.0), -M_PI / 2);
    EXPECT_DOUBLE_EQ(radiansToDegrees(M_PI / 4), 45.0);
    EXPECT_NEAR(radiansToDegrees(degreesToRadians(37.25)), 37.25, 1e-12);
}

// ── normalizeAngle ────────────────────────────────────────────────────────────

TEST(angle, normalize_wraps_into_range)
{
    EXPECT_DOUBLE_EQ(normalizeAngle(0.0), 0.0);
    EXPECT_DOUBLE_EQ(normalizeAngle(45.0), 45.0);
    EXPECT_DOUBLE_EQ(normalizeAngle(360.0), 0.0);
    EXPECT_DOUBLE_EQ(normalizeAngle(720.0), 0.0);
    EXPECT_DOUBLE_EQ(normalizeAngle(-90.0), 270.0);
    EXPECT_DOUBLE_EQ(normalizeAngle(-450.0), 270.0);
    EXPECT_DOUBLE_EQ(normalizeAngle(405.5), 45.5);
}

TEST(angle, normalize_stays_below_360)
{
    // Tiny negatives add back up to exactly 360.0 in double precision
    double n = normalizeAngle(-1e-20);
    EXPECT_GE(n, 0.0);
    EXPECT_LT(n, 360.0);

    for (double a = -1000.0; a <= 1000.0; a += 13.7) {
        double v = normalizeAngle(a);
        EXPECT_GE(v, 0.0) << a;
        EXPECT_LT(v, 360.0) << a;
    }
}

TEST(angle, normalize_non_finite_is_zero)
{
    EXPECT_EQ(normalizeAngle(std::numeric_limits<double>::quiet_NaN()), 0.0);
    EXPECT_EQ(normalizeAngle(std::numeric_limits<double>::infinity()), 0.0);
    EXPECT_EQ(normalizeAngle(-std::numeric_limits<double>::infinity()), 0.0);
}

// ── snapAngle ─────────────────────────────────────────────────────────────────

TEST(angle, snap_to_increment)
{
    EXPECT_DOUBLE_EQ(snapAngle(44.0, 15.0), 45.0);
    EXPECT_DOUBLE_EQ(snapAngle(52.0, 15.0), 45.0);
    EXPECT_DOUBLE_EQ(snapAngle(89.0, 90.0), 90.0);
    EXPECT_DOUBLE_EQ(snapAngle(-100.0, 90.0), -90.0);
}

TEST(angle, snap_half_rounds_away_from_zero)
{
    EXPECT_DOUBLE_EQ(snapAngle(37.5, 15.0), 45.0);
    EXPECT_DOUBLE_EQ(snapAngle(-37.5, 15.0), -45.0);
}

TEST(angle, snap_without_increment_is_identity)
{
    EXPECT_DOUBLE_EQ(snapAngle(33.3, 0.0), 33.3);
    EXPECT_DOUBLE_EQ(snapAngle(33.3, -15.0), 33.3);
}

// ── angleFromCenter / angleDelta ──────────────────────────────────────────────

TEST(angle, from_center_is_y_down)
{
    EXPECT_NEAR(angleFromCenter(0, 0, 1, 0), 0.0, 1e-9);
    EXPECT_NEAR(angleFromCenter(0, 0, 0, 1), 90.0, 1e-9);
    EXPECT_NEAR(angleFromCenter(0, 0, -1, 0), 180.0, 1e-9);
    EXPECT_NEAR(angleFromCenter(0, 0, 0, -1), 270.0, 1e-9);
    EXPECT_NEAR(angleFromCenter(10, 10, 15, 15), 45.0, 1e-9);
}

TEST(angle, delta_takes_short_way_round)
{
    EXPECT_NEAR(angleDelta(350.0, 10.0), 20.0, 1e-9);
    EXPECT_NEAR(angleDelta(10.0, 350.0), -20.0, 1e-9);
    EXPECT_NEAR(angleDelta(0.0, 180.0), 180.0, 1e-9);
    EXPECT_NEAR(angleDelta(0.0, 181.0), -179.0, 1e-9);
    EXPECT_NEAR(angleDelta(90.0, 90.0), 0.0, 1e-9);
}

// ── is90DegreeRotation ────────────────────────────────────────────────────────

TEST(angle, right_angle_detection)
{
    EXPECT_TRUE(is90DegreeRotation(0.0));
    EXPECT_TRUE(is90DegreeRotation(90.0));
    EXPECT_TRUE(is90DegreeRotation(180.0));
    EXPECT_TRUE(is90DegreeRotation(-90.0));
    EXPECT_TRUE(is90DegreeRotation(450.0));
    EXPECT_FALSE(is90DegreeRotation(45.0));
    EXPECT_FALSE(is90DegreeRotation(90.0001));
}
