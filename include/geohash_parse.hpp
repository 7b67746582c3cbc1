/**
 * @file geohash_parse.hpp
 * @brief Strict parsing of textual codec arguments.
 *
 * Used by command-line callers to turn user input into codec arguments,
 * reporting failures with the codec's own error codes.
 */

#pragma once

#include "angle_utils.hpp"

#include <string>

namespace geohash {

/**
 * @brief Parse "LAT,LNG".
 * @throws GeohashError(InvalidCoordinateShape) on wrong arity or
 *         non-numeric members
 */
LatLng parse_lat_lng(const std::string& text);

/**
 * @brief Parse a geohash length.
 * @throws GeohashError(InvalidLength) if not an integer >= 1
 */
int parse_length(const std::string& text);

/**
 * @brief Parse a neighbor order.
 * @throws GeohashError(InvalidOrder) if not an integer in 1..kMaxOrder
 */
int parse_order(const std::string& text);

}  // namespace geohash
