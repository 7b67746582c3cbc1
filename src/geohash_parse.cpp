/**
 * @file geohash_parse.cpp
 * @brief Argument parsing implementation.
 */

#include "geohash_parse.hpp"
#include "geohash.hpp"

#include <sstream>
#include <stdexcept>
#include <vector>

namespace geohash {

namespace {

std::string trim(std::string s) {
    s.erase(0, s.find_first_not_of(" \t\r\n"));
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
    return s;
}

// Whole-string number, or false.
bool to_double(const std::string& text, double& out) {
    std::string t = trim(text);
    if (t.empty()) return false;
    try {
        size_t pos = 0;
        out = std::stod(t, &pos);
        return pos == t.size();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool to_int(const std::string& text, int& out) {
    std::string t = trim(text);
    if (t.empty()) return false;
    try {
        size_t pos = 0;
        out = std::stoi(t, &pos);
        return pos == t.size();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

}  // namespace

LatLng parse_lat_lng(const std::string& text) {
    std::vector<double> values;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        double v = 0.0;
        if (!to_double(item, v)) {
            throw GeohashError(ErrorCode::InvalidCoordinateShape,
                               "Coordinate \"" + trim(item) + "\" in \"" + text + "\" is not a number");
        }
        values.push_back(v);
    }
    // A trailing comma leaves an empty last field that getline drops.
    if (!text.empty() && text.back() == ',') {
        throw GeohashError(ErrorCode::InvalidCoordinateShape,
                           "Coordinate pair \"" + text + "\" has an empty member");
    }
    return to_lat_lng(values);
}

int parse_length(const std::string& text) {
    int v = 0;
    if (!to_int(text, v) || v < 1) {
        throw GeohashError(ErrorCode::InvalidLength,
                           "Geohash length must be a positive integer, got \"" + text + "\"");
    }
    return v;
}

int parse_order(const std::string& text) {
    int v = 0;
    if (!to_int(text, v) || v < 1 || v > kMaxOrder) {
        throw GeohashError(ErrorCode::InvalidOrder,
                           "Neighbor order must be an integer in 1.." + std::to_string(kMaxOrder) +
                               ", got \"" + text + "\"");
    }
    return v;
}

}  // namespace geohash
