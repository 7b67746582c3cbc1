/**
 * @file geohash_geometry.hpp
 * @brief Geohash cells as Boost.Geometry shapes.
 */

#pragma once

#include <string>
#include <utility>
#include <vector>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point.hpp>
#include <boost/geometry/geometries/box.hpp>

namespace geohash {

namespace bg = boost::geometry;

// x = longitude, y = latitude
using Point2D = bg::model::point<double, 2, bg::cs::cartesian>;
using Box2D = bg::model::box<Point2D>;

/**
 * @brief Bounding box of a geohash cell.
 * @throws GeohashError EmptyGeohash, InvalidCharacter
 */
Box2D cell_box(const std::string& geohash);

/**
 * @brief Boundary polygon of a geohash cell.
 * @return Closed ring of (lat, lng) pairs, counter-clockwise from the
 *         south-west corner, first point repeated last
 */
std::vector<std::pair<double, double>> cell_boundary(const std::string& geohash);

/**
 * @brief True if the (normalized) point lies in the cell, edges included.
 */
bool cell_contains(const std::string& geohash, double lat, double lng);

}  // namespace geohash
