#include "EdgeClassifier.h"
#include <algorithm>
#include <cmath>

namespace kRotate {
namespace EdgeClassifier {

const Orientation PASSES[3] = { { 1, 1 }, { -1, 1 }, { 1, -1 } };

// Canonical (dx, dy) of each slot, before the pass mirror is applied.
static const int SLOT_OFFSET[SLOT_COUNT][2] = {
    { -1, -1 }, { 0, -1 }, { 1, -1 }, { 2, -1 },   // UB U UF UFF
    { -1,  0 }, { 0,  0 }, { 1,  0 }, { 2,  0 },   // B  C F  FF
    { -1,  1 }, { 0,  1 }, { 1,  1 }, { 2,  1 },   // DB D DF DFF
    { -1,  2 }, { 0,  2 }, { 1,  2 },              // DDB DD DDF
};

// Near-ties between the two distance sums fall to the priority rule.
static const float TIE_EPSILON = 0.001f;

// ── Neighborhood ──────────────────────────────────────────────────────────────

void Neighborhood::gather(const Raster& src, int cx, int cy, int pointDirX, int pointDirY) {
    pdx = pointDirX;
    pdy = pointDirY;
    for (int dy = -RADIUS; dy <= RADIUS; ++dy)
        for (int dx = -RADIUS; dx <= RADIUS; ++dx)
            px[dy + RADIUS][dx + RADIUS] = src.sample(cx + dx * pdx, cy + dy * pdy);
}

void Neighborhood::orient(Orientation o, uint32_t out[SLOT_COUNT]) const {
    for (int i = 0; i < SLOT_COUNT; ++i)
        out[i] = at(o.x * SLOT_OFFSET[i][0], o.y * SLOT_OFFSET[i][1]);
}

// ── Color comparison ──────────────────────────────────────────────────────────

float colorDistance(uint32_t a, uint32_t b) {
    float dr = (redOf(a)   - redOf(b))   / 255.f;
    float dg = (greenOf(a) - greenOf(b)) / 255.f;
    float db = (blueOf(a)  - blueOf(b))  / 255.f;
    float da = (alphaOf(a) - alphaOf(b)) / 255.f;
    return std::sqrt(dr * dr + dg * dg + db * db + da * da);
}

bool similar(uint32_t a, uint32_t b) {
    if (alphaOf(a) == 0 && alphaOf(b) == 0) return true;
    return a == b;
}

bool similar3(uint32_t a, uint32_t b, uint32_t c) {
    return similar(a, b) && similar(b, c);
}

bool similar4(uint32_t a, uint32_t b, uint32_t c, uint32_t d) {
    return similar(a, b) && similar(b, c) && similar(c, d);
}

bool higher(uint32_t self, uint32_t other, EdgePriority priority) {
    if (similar(self, other)) return false;
    if (alphaOf(self) != alphaOf(other)) return alphaOf(self) > alphaOf(other);
    float lumSelf  = redOf(self)  * 0.299f + greenOf(self)  * 0.587f + blueOf(self)  * 0.114f;
    float lumOther = redOf(other) * 0.299f + greenOf(other) * 0.587f + blueOf(other) * 0.114f;
    return priority == EdgePriority::DARKER ? lumSelf < lumOther : lumSelf > lumOther;
}

// ── Geometry ──────────────────────────────────────────────────────────────────

float distToLine(Vec2 test, Vec2 p1, Vec2 p2, Vec2 dir) {
    float perpX = p2.y - p1.y;
    float perpY = -(p2.x - p1.x);
    float len = std::sqrt(perpX * perpX + perpY * perpY);
    if (len == 0.f) return 0.f;
    float sign = (perpX * dir.x + perpY * dir.y) > 0.f ? 1.f : -1.f;
    return sign * (perpX * (p1.x - test.x) + perpY * (p1.y - test.y)) / len;
}

// ── sliceDist ─────────────────────────────────────────────────────────────────
//
// Candidate lines are given as offsets from the pixel center, scaled by the
// point direction; a flipped line measures from the opposite side and is
// complemented against the line width.

namespace {

class Slicer {
  public:
    Slicer(const uint32_t* n, Vec2 point, Orientation mainDir, Vec2 pointDir,
           const CleanEdgeOptions& opts)
        : n(n), pd(pointDir), back{ -pointDir.x, -pointDir.y }, prio(opts.edgePriority) {
        fp.x = mainDir.x * (point.x - 0.5f) + 0.5f;
        fp.y = mainDir.y * (point.y - 0.5f) + 0.5f;
        lineWidth = std::max(CleanEdgeOptions::MIN_LINE_WIDTH,
                             std::min(CleanEdgeOptions::MAX_LINE_WIDTH, opts.lineWidth));
    }

    bool sim (Slot a, Slot b)                 const { return similar(n[a], n[b]); }
    bool sim3(Slot a, Slot b, Slot c)         const { return similar3(n[a], n[b], n[c]); }
    bool sim4(Slot a, Slot b, Slot c, Slot d) const { return similar4(n[a], n[b], n[c], n[d]); }
    bool hi  (Slot a, Slot b)                 const { return higher(n[a], n[b], prio); }
    float dist(Slot a, Slot b)                const { return colorDistance(n[a], n[b]); }

    Vec2 pt(float kx, float ky) const { return { 0.5f + kx * pd.x, 0.5f + ky * pd.y }; }

    float line(Vec2 a, Vec2 b) const { return distToLine(fp, a, b, pd); }
    float flippedLine(Vec2 a, Vec2 b) const { return lineWidth - distToLine(fp, a, b, back); }

    // Inside the half-width band: take whichever competitor is closer to anchor.
    bool resolve(float d, Slot anchor, Slot first, Slot second, uint32_t& out) const {
        d -= lineWidth / 2.f;
        if (d > 0.f) return false;
        out = dist(anchor, first) <= dist(anchor, second) ? n[first] : n[second];
        return true;
    }

    bool shouldSlice() const {
        float against = 4.f * dist(F, D) + dist(UF, C) + dist(C, DB) + dist(FF, DF) + dist(DF, DD);
        float towards = 4.f * dist(C, DF) + dist(U, F) + dist(F, DFF) + dist(B, D) + dist(D, DDF);
        bool slice = against < towards || (against < towards + TIE_EPSILON && !hi(C, F));
        // Uniform rings around c mean a straight edge, not a diagonal
        if (sim4(F, D, B, U) && sim4(UF, DF, DB, UB) && !sim(C, F))
            slice = false;
        return slice;
    }

    const uint32_t* n;
    Vec2 fp, pd, back;
    EdgePriority prio;
    float lineWidth;
};

} // namespace

bool sliceDist(const uint32_t n[SLOT_COUNT], Vec2 point, Orientation mainDir, Vec2 pointDir,
               const CleanEdgeOptions& opts, uint32_t& out) {
    const Slicer s(n, point, mainDir, pointDir, opts);
    if (!s.shouldSlice()) return false;

    bool flip = false;
    float d;

    // Lower shallow 2:1 slant
    if (s.sim3(F, D, DB) && !s.sim3(F, D, B) && !s.sim(UF, DB)) {
        if (!(s.sim(C, DF) && s.hi(C, F))) {
            if (s.hi(C, F)) flip = true;
            if (s.sim(U, F) && !s.sim(C, DF) && !s.hi(C, U)) flip = true;
        }
        d = flip ? s.flippedLine(s.pt(1.5f, -1.f), s.pt(-0.5f, 0.f))
                 : s.line(s.pt(1.5f, 0.f), s.pt(-0.5f, 1.f));
        if (opts.cleanup && !flip && s.sim(C, UF) &&
            !(s.sim3(C, UF, UFF) && !s.sim3(C, UF, FF) && !s.sim(D, UFF)))
            d = std::min(d, s.line(s.pt(2.f, -1.f), s.pt(0.f, 1.f)));
        return s.resolve(d, C, F, D, out);
    }

    // Forward steep 2:1 slant
    if (s.sim3(UF, F, D) && !s.sim3(U, F, D) && !s.sim(UF, DB)) {
        if (!(s.sim(C, DF) && s.hi(C, D))) {
            if (s.hi(C, D)) flip = true;
            if (s.sim(B, D) && !s.sim(C, DF) && !s.hi(C, D)) flip = true;
        }
        d = flip ? s.flippedLine(s.pt(0.f, -0.5f), s.pt(-1.f, 1.5f))
                 : s.line(s.pt(1.f, -0.5f), s.pt(0.f, 1.5f));
        if (opts.cleanup && !flip && s.sim(C, DB) &&
            !(s.sim3(C, DB, DDB) && !s.sim3(C, DB, DD) && !s.sim(F, DDB)))
            d = std::min(d, s.line(s.pt(1.f, 0.f), s.pt(-1.f, 2.f)));
        return s.resolve(d, C, F, D, out);
    }

    // 45° diagonal
    if (s.sim(F, D)) {
        if (s.sim(C, DF) && s.hi(C, F)) {
            if (!s.sim(C, DD) && !s.sim(C, FF)) flip = true;
        } else {
            if (s.hi(C, F)) flip = true;
            if (!s.sim(C, B) && s.sim4(B, F, D, U)) flip = true;
        }
        if (((s.sim(F, DB) && s.sim3(U, F, DF)) || (s.sim(UF, D) && s.sim3(B, D, DF))) &&
            !s.sim(C, DF))
            flip = true;
        d = flip ? s.flippedLine(s.pt(1.f, -1.f), s.pt(-1.f, 1.f))
                 : s.line(s.pt(1.f, 0.f), s.pt(0.f, 1.f));
        if (opts.cleanup && !flip) {
            if (s.sim3(C, UF, UFF) && !s.sim3(C, UF, FF) && !s.sim(D, UFF))
                d = std::max(d, s.line(s.pt(1.5f, 0.f), s.pt(-0.5f, 1.f)));
            if (s.sim3(DDB, DB, C) && !s.sim3(DD, DB, C) && !s.sim(DDB, F))
                d = std::max(d, s.line(s.pt(1.f, -0.5f), s.pt(0.f, 1.5f)));
        }
        return s.resolve(d, C, F, D, out);
    }

    // Far corner of a shallow slant
    if (s.sim3(FF, DF, D) && !s.sim3(FF, DF, C) && !s.sim(UFF, D)) {
        if (!(s.sim(F, DFF) && s.hi(F, FF))) {
            if (s.hi(F, FF)) flip = true;
            if (s.sim(UF, FF) && !s.sim(F, DFF) && !s.hi(F, UF)) flip = true;
        }
        d = flip ? s.flippedLine(s.pt(2.5f, -1.f), s.pt(0.5f, 0.f))
                 : s.line(s.pt(2.5f, 0.f), s.pt(0.5f, 1.f));
        return s.resolve(d, F, FF, DF, out);
    }

    // Far corner of a steep slant
    if (s.sim3(F, DF, DD) && !s.sim3(C, DF, DD) && !s.sim(F, DDB)) {
        if (!(s.sim(D, DDF) && s.hi(D, DD))) {
            if (s.hi(D, DD)) flip = true;
            if (s.sim(DB, DD) && !s.sim(D, DDF) && !s.hi(D, DD)) flip = true;
        }
        d = flip ? s.flippedLine(s.pt(0.f, 0.5f), s.pt(-1.f, 2.5f))
                 : s.line(s.pt(1.f, 0.5f), s.pt(0.f, 2.5f));
        return s.resolve(d, D, DF, DD, out);
    }

    return false;
}

uint32_t classify(const Neighborhood& hood, Vec2 point, const CleanEdgeOptions& opts) {
    const Vec2 pointDir = { (float)hood.pointDirX(), (float)hood.pointDirY() };
    uint32_t col = hood.at(0, 0);
    uint32_t n[SLOT_COUNT];
    for (const Orientation& o : PASSES) {
        hood.orient(o, n);
        uint32_t sliced;
        if (sliceDist(n, point, o, pointDir, opts, sliced))
            col = sliced;
    }
    return col;
}

} // namespace EdgeClassifier
} // namespace kRotate
