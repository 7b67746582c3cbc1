/**
 * @file geohash_geometry.cpp
 * @brief Cell box, boundary and containment.
 */

#include "geohash_geometry.hpp"
#include "geohash.hpp"

namespace geohash {

Box2D cell_box(const std::string& hash) {
    CellInterval cell = decode_interval(hash);
    return Box2D(Point2D(cell.lng.min, cell.lat.min), Point2D(cell.lng.max, cell.lat.max));
}

std::vector<std::pair<double, double>> cell_boundary(const std::string& hash) {
    CellInterval cell = decode_interval(hash);

    std::vector<std::pair<double, double>> boundary;
    boundary.reserve(5);
    boundary.push_back({cell.lat.min, cell.lng.min});
    boundary.push_back({cell.lat.min, cell.lng.max});
    boundary.push_back({cell.lat.max, cell.lng.max});
    boundary.push_back({cell.lat.max, cell.lng.min});

    // Close the polygon by repeating first point
    boundary.push_back(boundary[0]);
    return boundary;
}

bool cell_contains(const std::string& hash, double lat, double lng) {
    Box2D box = cell_box(hash);
    Point2D p(normalize_lng(lng), normalize_lat(lat));
    return bg::covered_by(p, box);
}

}  // namespace geohash
