#pragma once

#include <cstdint>
#include "Raster.h"
#include "Rotation.h"

namespace kRotate {

// Per-sample edge reconstruction for the CleanEdge upscale (after torcado's
// cleanEdge, MIT). Each upscaled sample looks at the 5x5 block around its
// source pixel and decides whether a diagonal the artist implied should cut
// through it, and if so which neighbor color takes the sample.
namespace EdgeClassifier {

struct Vec2 { float x, y; };

// Slot names are rows u/(none)/d/dd and columns b/(none)/f/ff, read in the
// orientation of the current pass: f is toward the sample's side of c, d is
// below it. C is the source pixel itself.
enum Slot { UB, U, UF, UFF, B, C, F, FF, DB, D, DF, DFF, DDB, DD, DDF, SLOT_COUNT };

// A pass mirrors the neighborhood by mainDir before classifying, so one
// classifier covers all three diagonal configurations.
struct Orientation { int x, y; };

// center, then "b" (mirrored in x), then "u" (mirrored in y). A later pass
// that slices overrides an earlier one.
extern const Orientation PASSES[3];

class Neighborhood {
  public:
    static const int RADIUS = 2;

    // Samples src around (cx, cy), flipping both axes so +dx / +dy point
    // along (pointDirX, pointDirY). Out-of-bounds reads are transparent.
    void gather(const Raster& src, int cx, int cy, int pointDirX, int pointDirY);

    uint32_t at(int dx, int dy) const { return px[dy + RADIUS][dx + RADIUS]; }
    int pointDirX() const { return pdx; }
    int pointDirY() const { return pdy; }

    // Fill the slot array for one pass.
    void orient(Orientation o, uint32_t out[SLOT_COUNT]) const;

  private:
    uint32_t px[2 * RADIUS + 1][2 * RADIUS + 1];
    int pdx = 1, pdy = 1;
};

// Normalized Euclidean RGBA distance, 0..2.
float colorDistance(uint32_t a, uint32_t b);
// Bit-identical, or both fully transparent whatever their RGB.
bool  similar (uint32_t a, uint32_t b);
bool  similar3(uint32_t a, uint32_t b, uint32_t c);
bool  similar4(uint32_t a, uint32_t b, uint32_t c, uint32_t d);
// True if self beats other at an edge: opacity first, then luminance.
bool  higher(uint32_t self, uint32_t other, EdgePriority priority);

// Signed distance from test to the line p1-p2, negative on the side dir
// points to.
float distToLine(Vec2 test, Vec2 p1, Vec2 p2, Vec2 dir);

// One pass. point is the sample position inside c in 0..1 pixel-local
// coordinates; returns true and writes the slicing color when the sample
// falls on the far side of a reconstructed edge.
bool sliceDist(const uint32_t n[SLOT_COUNT], Vec2 point, Orientation mainDir, Vec2 pointDir,
               const CleanEdgeOptions& opts, uint32_t& out);

// All passes folded; c's own color when nothing slices.
uint32_t classify(const Neighborhood& hood, Vec2 point, const CleanEdgeOptions& opts);

} // namespace EdgeClassifier
} // namespace kRotate
