/**
 * @file angle_utils.cpp
 * @brief Angle normalization implementation.
 */

#include "angle_utils.hpp"

#include <cmath>

namespace geohash {

double normalize_lng(double lng) {
    // In-range values, both endpoints included, pass through unchanged.
    if (lng >= -180.0 && lng <= 180.0) return lng + 0.0;

    // fmod is exact and keeps the sign of lng; both corrections below are
    // exact too, so the result is stable under a second pass.
    double r = std::fmod(lng, 360.0);
    if (r > 180.0) {
        r -= 360.0;
    } else if (r <= -180.0) {
        r += 360.0;
    }
    return r + 0.0;  // -0.0 -> +0.0
}

double normalize_lat(double lat) {
    double r = normalize_lng(lat);
    if (r > 90.0) return 180.0 - r;
    if (r < -90.0) return -180.0 - r;
    return r;
}

LatLng normalize(const LatLng& point) {
    return {normalize_lat(point.lat), normalize_lng(point.lng)};
}

}  // namespace geohash
