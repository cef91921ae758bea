#pragma once

#include <SDL2/SDL.h>
#include "Raster.h"

namespace kRotate {

enum class Quality { DRAFT, FINAL };

// Which color wins when two compete at a sliced edge. DARKER keeps dark
// outline strokes on top of lighter fills.
enum class EdgePriority { DARKER, LIGHTER };

// ── Options ───────────────────────────────────────────────────────────────────

struct CleanEdgeOptions {
    static constexpr float MIN_LINE_WIDTH = 0.45f;
    static constexpr float MAX_LINE_WIDTH = 1.142f;

    bool         cleanup      = false;  // blend a second line on slant transitions
    EdgePriority edgePriority = EdgePriority::DARKER;
    float        lineWidth    = 1.f;    // clamped to [MIN_LINE_WIDTH, MAX_LINE_WIDTH]
};

struct RotationOptions {
    Quality      quality      = Quality::FINAL;
    EdgePriority edgePriority = EdgePriority::DARKER;
    bool         cleanup      = false;
    float        lineWidth    = 1.f;
    // 90° multiples go through the lossless remap. Clear this to force the
    // CleanEdge path (e.g. for its rounded-corner look) at every angle.
    bool         exactRightAngles = true;

    CleanEdgeOptions cleanEdge() const;
};

struct RotationRequest {
    Raster          raster;
    SDL_Rect        bounds = {0, 0, 0, 0};  // canvas position of raster
    Mask            mask;                   // empty for rectangular selections
    double          angle  = 0.0;           // degrees, clockwise, any real value
    RotationOptions options;
};

struct RotationResult {
    Raster   raster;
    SDL_Rect bounds = {0, 0, 0, 0};  // recentered on the source center
    Mask     mask;                   // empty unless the request carried one
    bool hasMask() const { return !mask.empty(); }
};

// ── Angles ────────────────────────────────────────────────────────────────────

double degreesToRadians(double degrees);
double radiansToDegrees(double radians);
// Maps any real value into [0, 360). Non-finite input maps to 0.
double normalizeAngle(double degrees);
// Nearest multiple of increment, halves rounded away from zero.
double snapAngle(double degrees, double increment);
// Screen-space (y-down) angle from (cx,cy) to (px,py), normalized.
double angleFromCenter(double cx, double cy, double px, double py);
// Shortest signed rotation from one angle to another, in (-180, 180].
double angleDelta(double fromDegrees, double toDegrees);
bool   is90DegreeRotation(double degrees);

// ── Bounds ────────────────────────────────────────────────────────────────────

// Axis-aligned size of a w x h rectangle rotated by angle.
void     getRotatedBounds(int w, int h, double angle, int* outW, int* outH);
// Rotated size, recentered on the center of bounds.
SDL_Rect calculateRotatedBounds(const SDL_Rect& bounds, double angle);
// True if (px,py) lies inside bounds rotated by angle about its center.
bool     pointInRotatedBounds(double px, double py, const SDL_Rect& bounds, double angle);

// ── Exact rotation (no resampling) ────────────────────────────────────────────

Raster rotate90CW (const Raster& src);
Raster rotate180  (const Raster& src);
Raster rotate90CCW(const Raster& src);
// Writes the exact rotation into out and returns true when angle is a
// multiple of 90°; returns false (out untouched) otherwise.
bool   rotateBy90Increment(const Raster& src, double angle, Raster& out);

// ── Resampling rotation ───────────────────────────────────────────────────────

// Each destination pixel center (x + 0.5, y + 0.5) is rotated back about the
// canvas center into the source and floored to a source pixel; misses are
// transparent. Right angles reproduce the exact remap.
Raster rotateNearestNeighbor(const Raster& src, double angle);
// Same mapping into a caller-sized canvas, centered.
Raster rotateNearestNeighbor(const Raster& src, double angle, int dstW, int dstH);

Mask   rotateMask(const Mask& mask, double angle);

// ── CleanEdge ─────────────────────────────────────────────────────────────────

Raster applyCleanEdge(const Raster& src, int scale, const CleanEdgeOptions& opts);
Raster downscaleAreaAverage(const Raster& src, int factor);

// ── Pipeline ──────────────────────────────────────────────────────────────────

int            qualityScale(Quality q);
Raster         rotateCleanEdge(const Raster& src, double angle,
                               const RotationOptions& opts = RotationOptions());
RotationResult rotateSelection(const RotationRequest& req);

} // namespace kRotate
