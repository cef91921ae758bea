#define _USE_MATH_DEFINES
#include "Rotation.h"
#include <cmath>

namespace kRotate {

double degreesToRadians(double degrees) { return degrees * M_PI / 180.0; }
double radiansToDegrees(double radians) { return radians * 180.0 / M_PI; }

double normalizeAngle(double degrees) {
    if (!std::isfinite(degrees)) return 0.0;
    double n = std::fmod(degrees, 360.0);
    if (n < 0.0) n += 360.0;
    // -1e-20 + 360 rounds back up to 360
    if (n >= 360.0) n = 0.0;
    return n;
}

double snapAngle(double degrees, double increment) {
    if (!(increment > 0.0)) return degrees;
    return std::round(degrees / increment) * increment;
}

double angleFromCenter(double cx, double cy, double px, double py) {
    return normalizeAngle(radiansToDegrees(std::atan2(py - cy, px - cx)));
}

// atan2 jumps by 360° when the pointer crosses the negative-X axis; a drag
// handler accumulates these deltas instead of the raw angles.
double angleDelta(double fromDegrees, double toDegrees) {
    double d = normalizeAngle(toDegrees - fromDegrees);
    if (d > 180.0) d -= 360.0;
    return d;
}

bool is90DegreeRotation(double degrees) {
    double n = normalizeAngle(degrees);
    return n == 0.0 || n == 90.0 || n == 180.0 || n == 270.0;
}

} // namespace kRotate
