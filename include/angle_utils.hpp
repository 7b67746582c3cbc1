/**
 * @file angle_utils.hpp
 * @brief Angle normalization for latitude/longitude inputs.
 */

#pragma once

namespace geohash {

/**
 * @brief Latitude/longitude pair in degrees.
 */
struct LatLng {
    double lat = 0.0;
    double lng = 0.0;
};

/**
 * @brief Reduce any longitude into [-180, 180].
 *
 * Values already in [-180, 180] are returned as is; anything else is
 * reduced modulo 360 into (-180, 180]. Multiples of 360 map to +0.0.
 */
double normalize_lng(double lng);

/**
 * @brief Reduce any latitude into [-90, 90].
 *
 * Applies the longitude reduction first, then reflects over the pole:
 * 91 becomes 89 and -91 becomes -89.
 */
double normalize_lat(double lat);

/**
 * @brief Normalized copy of a coordinate pair. The argument is untouched.
 */
LatLng normalize(const LatLng& point);

}  // namespace geohash
