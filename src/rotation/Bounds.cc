#include "Rotation.h"
#include <cmath>

namespace kRotate {

// Below this a trig term is float noise (cos(pi/2) ~ 6e-17); left in, it
// pushes ceil() one pixel past the true size at exact right angles.
static const double TRIG_EPSILON = 1e-10;

static void absCosSin(double angle, double& c, double& s) {
    double rad = degreesToRadians(normalizeAngle(angle));
    c = std::abs(std::cos(rad));
    s = std::abs(std::sin(rad));
    if (c < TRIG_EPSILON) c = 0.0;
    if (s < TRIG_EPSILON) s = 0.0;
}

void getRotatedBounds(int w, int h, double angle, int* outW, int* outH) {
    if (w <= 0 || h <= 0) { *outW = 0; *outH = 0; return; }
    double c, s;
    absCosSin(angle, c, s);
    *outW = (int)std::ceil(w * c + h * s);
    *outH = (int)std::ceil(w * s + h * c);
}

SDL_Rect calculateRotatedBounds(const SDL_Rect& bounds, double angle) {
    int newW, newH;
    getRotatedBounds(bounds.w, bounds.h, angle, &newW, &newH);
    double cx = bounds.x + bounds.w * 0.5;
    double cy = bounds.y + bounds.h * 0.5;
    return { (int)std::floor(cx - newW * 0.5), (int)std::floor(cy - newH * 0.5), newW, newH };
}

bool pointInRotatedBounds(double px, double py, const SDL_Rect& bounds, double angle) {
    if (bounds.w <= 0 || bounds.h <= 0) return false;
    double cx = bounds.x + bounds.w * 0.5;
    double cy = bounds.y + bounds.h * 0.5;
    // Un-rotate the point into the rect's local, axis-aligned frame
    double rad = degreesToRadians(-angle);
    double c = std::cos(rad), s = std::sin(rad);
    double dx = px - cx, dy = py - cy;
    double lx = dx * c - dy * s;
    double ly = dx * s + dy * c;
    double hw = bounds.w * 0.5, hh = bounds.h * 0.5;
    return lx >= -hw && lx < hw && ly >= -hh && ly < hh;
}

} // namespace kRotate
