#define _USE_MATH_DEFINES
#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>
#include "Rotation.h"

using namespace kRotate;

// Axis-aligned extent of the four rotated corners
static void cornerExtent(int w, int h, double deg, double& ew, double& eh)
{
    double rad = deg * M_PI / 180.0;
    double c = std::cos(rad), s = std::sin(rad);
    const double xs[4] = { 0, (double)w, 0, (double)w };
    const double ys[4] = { 0, 0, (double)h, (double)h };
    double minX = 1e9, maxX = -1e9, minY = 1e9, maxY = -1e9;
    for (int i = 0; i < 4; i++) {
        double rx = xs[i] * c - ys[i] * s;
        double ry = xs[i] * s + ys[i] * c;
        minX = std::min(minX, rx); maxX = std::max(maxX, rx);
        minY = std::min(minY, ry); maxY = std::max(maxY, ry);
    }
    ew = maxX - minX;
    eh = maxY - minY;
}

TEST(bounds, right_angles_are_exact)
{
    int w, h;
    getRotatedBounds(2, 3, 90.0, &w, &h);
    EXPECT_EQ(w, 3);
    EXPECT_EQ(h, 2);
    getRotatedBounds(10, 20, 180.0, &w, &h);
    EXPECT_EQ(w, 10);
    EXPECT_EQ(h, 20);
    getRotatedBounds(7, 5, 270.0, &w, &h);
    EXPECT_EQ(w, 5);
    EXPECT_EQ(h, 7);
    getRotatedBounds(7, 5, -90.0, &w, &h);
    EXPECT_EQ(w, 5);
    EXPECT_EQ(h, 7);
}

TEST(bounds, square_at_45)
{
    int w, h;
    getRotatedBounds(4, 4, 45.0, &w, &h);
    EXPECT_EQ(w, 6);
    EXPECT_EQ(h, 6);
}

TEST(bounds, zero_area)
{
    int w = -1, h = -1;
    getRotatedBounds(0, 5, 30.0, &w, &h);
    EXPECT_EQ(w, 0);
    EXPECT_EQ(h, 0);
}

TEST(bounds, covers_rotated_corners)
{
    const int sizes[][2] = { { 1, 1 }, { 4, 4 }, { 5, 3 }, { 16, 9 }, { 31, 2 } };
    for (auto& sz : sizes) {
        for (double a = 0.0; a < 360.0; a += 7.0) {
            int w, h;
            getRotatedBounds(sz[0], sz[1], a, &w, &h);
            double ew, eh;
            cornerExtent(sz[0], sz[1], a, ew, eh);
            EXPECT_GE(w, (int)std::floor(ew - 1e-6)) << sz[0] << "x" << sz[1] << " @ " << a;
            EXPECT_LE(w, (int)std::ceil(ew + 1e-6)) << sz[0] << "x" << sz[1] << " @ " << a;
            EXPECT_GE(h, (int)std::floor(eh - 1e-6)) << sz[0] << "x" << sz[1] << " @ " << a;
            EXPECT_LE(h, (int)std::ceil(eh + 1e-6)) << sz[0] << "x" << sz[1] << " @ " << a;
        }
    }
}

// ── calculateRotatedBounds ────────────────────────────────────────────────────

TEST(bounds, recentered_on_source_center)
{
    SDL_Rect r = calculateRotatedBounds({ 10, 10, 4, 4 }, 45.0);
    EXPECT_EQ(r.x, 9);
    EXPECT_EQ(r.y, 9);
    EXPECT_EQ(r.w, 6);
    EXPECT_EQ(r.h, 6);

    r = calculateRotatedBounds({ 0, 0, 2, 3 }, 90.0);
    EXPECT_EQ(r.x, -1);
    EXPECT_EQ(r.y, 0);
    EXPECT_EQ(r.w, 3);
    EXPECT_EQ(r.h, 2);
}

TEST(bounds, zero_angle_keeps_rect)
{
    SDL_Rect r = calculateRotatedBounds({ 3, -7, 12, 5 }, 360.0);
    EXPECT_EQ(r.x, 3);
    EXPECT_EQ(r.y, -7);
    EXPECT_EQ(r.w, 12);
    EXPECT_EQ(r.h, 5);
}

// ── pointInRotatedBounds ──────────────────────────────────────────────────────

TEST(bounds, point_in_unrotated_rect)
{
    SDL_Rect r = { 0, 0, 10, 2 };
    EXPECT_TRUE(pointInRotatedBounds(5, 1, r, 0.0));
    EXPECT_TRUE(pointInRotatedBounds(0, 0, r, 0.0));
    EXPECT_FALSE(pointInRotatedBounds(10, 1, r, 0.0));
    EXPECT_FALSE(pointInRotatedBounds(5, 3, r, 0.0));
}

TEST(bounds, point_in_rotated_rect)
{
    // A 10x2 bar stood upright about (5,1)
    SDL_Rect r = { 0, 0, 10, 2 };
    EXPECT_TRUE(pointInRotatedBounds(5, 4, r, 90.0));
    EXPECT_TRUE(pointInRotatedBounds(5, -3, r, 90.0));
    EXPECT_FALSE(pointInRotatedBounds(9, 1, r, 90.0));
    EXPECT_FALSE(pointInRotatedBounds(1, 1, r, 90.0));
}

TEST(bounds, point_in_empty_rect)
{
    EXPECT_FALSE(pointInRotatedBounds(0, 0, { 0, 0, 0, 0 }, 0.0));
}
