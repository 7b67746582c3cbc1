/**
 * @file geohash.cpp
 * @brief Interval bisection encode/decode and neighbor generation.
 */

#include "geohash.hpp"
#include "base32.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace geohash {

namespace {

// Past this many decimals rounding a degree value stops meaning anything.
constexpr int kMaxDecimalPlaces = 12;

void check_length(int length) {
    if (length < 1) {
        throw GeohashError(ErrorCode::InvalidLength,
                           "Geohash length must be a positive integer, got " + std::to_string(length));
    }
}

void check_order(int order) {
    if (order < 1) {
        throw GeohashError(ErrorCode::InvalidOrder,
                           "Neighbor order must be a positive integer, got " + std::to_string(order));
    }
    if (order > kMaxOrder) {
        throw GeohashError(ErrorCode::InvalidOrder,
                           "Neighbor order must be at most " + std::to_string(kMaxOrder) + ", got " +
                               std::to_string(order));
    }
}

void check_finite(const LatLng& point) {
    if (!std::isfinite(point.lat) || !std::isfinite(point.lng)) {
        std::ostringstream msg;
        msg << "Coordinates must be finite numbers, got [" << point.lat << ", " << point.lng << "]";
        throw GeohashError(ErrorCode::InvalidCoordinateShape, msg.str());
    }
}

// Bisect both ranges 5*length times. lat/lng must already be normalized.
std::string encode_normalized(double lat, double lng, int length) {
    double lat_min = -90.0, lat_max = 90.0;
    double lng_min = -180.0, lng_max = 180.0;
    bool is_lng = true;

    std::string out;
    out.reserve(length);

    for (int c = 0; c < length; ++c) {
        int value = 0;
        for (int b = 0; b < base32::kBitsPerChar; ++b) {
            value <<= 1;
            if (is_lng) {
                double mid = (lng_min + lng_max) / 2.0;
                if (lng >= mid) {
                    value |= 1;
                    lng_min = mid;
                } else {
                    lng_max = mid;
                }
            } else {
                double mid = (lat_min + lat_max) / 2.0;
                if (lat >= mid) {
                    value |= 1;
                    lat_min = mid;
                } else {
                    lat_max = mid;
                }
            }
            is_lng = !is_lng;
        }
        out.push_back(base32::encode(value));
    }
    return out;
}

// Caller has validated the string.
CellInterval decode_unchecked(const std::string& hash) {
    CellInterval cell;
    bool is_lng = true;

    for (char ch : hash) {
        int value = base32::decode(ch);
        for (int mask = 1 << (base32::kBitsPerChar - 1); mask != 0; mask >>= 1) {
            Interval& axis = is_lng ? cell.lng : cell.lat;
            double mid = axis.mid();
            if (value & mask) {
                axis.min = mid;
            } else {
                axis.max = mid;
            }
            is_lng = !is_lng;
        }
    }
    return cell;
}

// Round half away from zero to the decimals the interval width supports,
// never fewer than one.
double round_to_width(double value, double width) {
    if (!(width > 0.0)) return value;

    int places = std::max(1, -static_cast<int>(std::floor(std::log10(width))));
    if (places > kMaxDecimalPlaces) return value;

    double scale = std::pow(10.0, places);
    return std::round(value * scale) / scale;
}

LatLng decode_point_unchecked(const std::string& hash) {
    CellInterval cell = decode_unchecked(hash);
    return {round_to_width(cell.lat.mid(), cell.lat.width()),
            round_to_width(cell.lng.mid(), cell.lng.width())};
}

std::vector<std::string> neighbors_unchecked(const std::string& hash, int order) {
    const int length = static_cast<int>(hash.size());
    CellInterval cell = decode_unchecked(hash);

    const double delta_lat = cell.lat.width();
    const double delta_lng = cell.lng.width();
    const LatLng center = cell.center();

    const size_t side = 2 * static_cast<size_t>(order) + 1;
    std::vector<std::string> result;
    result.reserve(side * side - 1);

    for (int i = -order; i <= order; ++i) {
        for (int j = -order; j <= order; ++j) {
            if (i == 0 && j == 0) continue;

            // Past a pole the latitude reflects back (see normalize_lat),
            // so high orders near the poles can repeat cells.
            double lat = normalize_lat(center.lat + i * delta_lat);
            double lng = normalize_lng(center.lng + j * delta_lng);
            result.push_back(encode_normalized(lat, lng, length));
        }
    }
    return result;
}

uint64_t to_bits_unchecked(const std::string& hash) {
    uint64_t bits = 0;
    for (char ch : hash) {
        bits = (bits << base32::kBitsPerChar) | static_cast<uint64_t>(base32::decode(ch));
    }
    return bits;
}

}  // namespace

ValidationResult validate(const std::string& hash) {
    ValidationResult result;
    if (hash.empty()) {
        result.ok = false;
        result.code = ErrorCode::EmptyGeohash;
        result.error = "Geohash must have at least one character";
        return result;
    }
    for (size_t i = 0; i < hash.size(); ++i) {
        if (!base32::is_valid(hash[i])) {
            result.ok = false;
            result.code = ErrorCode::InvalidCharacter;
            result.error = "Invalid character '" + std::string(1, hash[i]) + "' at position " +
                           std::to_string(i) + " in geohash \"" + hash + "\"";
            return result;
        }
    }
    return result;
}

void check(const std::string& hash) {
    ValidationResult result = validate(hash);
    if (!result.ok) {
        throw GeohashError(result.code, result.error);
    }
}

LatLng to_lat_lng(const std::vector<double>& lat_lng) {
    if (lat_lng.size() != 2) {
        throw GeohashError(ErrorCode::InvalidCoordinateShape,
                           "Coordinate pair must have exactly 2 items, got " +
                               std::to_string(lat_lng.size()));
    }
    LatLng point{lat_lng[0], lat_lng[1]};
    check_finite(point);
    return point;
}

std::string encode(const LatLng& point, int length) {
    check_length(length);
    check_finite(point);
    LatLng n = normalize(point);
    return encode_normalized(n.lat, n.lng, length);
}

std::string encode(const std::vector<double>& lat_lng, int length) {
    LatLng point = to_lat_lng(lat_lng);
    return encode(point, length);
}

CellInterval decode_interval(const std::string& hash) {
    check(hash);
    return decode_unchecked(hash);
}

LatLng decode_point(const std::string& hash) {
    check(hash);
    return decode_point_unchecked(hash);
}

std::vector<std::string> neighbors(const std::string& hash, int order) {
    check_order(order);
    check(hash);
    return neighbors_unchecked(hash, order);
}

uint64_t to_bits(const std::string& hash) {
    check(hash);
    if (hash.size() > static_cast<size_t>(kMaxBitsLength)) {
        throw GeohashError(ErrorCode::InvalidLength,
                           "Bitstream needs a geohash of at most " + std::to_string(kMaxBitsLength) +
                               " characters, got " + std::to_string(hash.size()));
    }
    return to_bits_unchecked(hash);
}

// ============================================================
// Geohash value
// ============================================================

Geohash::Geohash() : geohash_("s0000000000") {}

Geohash Geohash::from_lat_lng(const LatLng& point, int length) {
    return Geohash(encode(point, length));
}

Geohash Geohash::from_lat_lng(const std::vector<double>& lat_lng, int length) {
    return Geohash(encode(lat_lng, length));
}

Geohash Geohash::from_geohash(const std::string& hash) {
    check(hash);
    return Geohash(hash);
}

void Geohash::set(const std::string& hash) {
    check(hash);
    geohash_ = hash;
}

void Geohash::encode_lat_lng(const LatLng& point, int length) {
    geohash_ = encode(point, length);
}

CellInterval Geohash::decode_interval() const {
    return decode_unchecked(geohash_);
}

LatLng Geohash::decode() const {
    return decode_point_unchecked(geohash_);
}

std::vector<std::string> Geohash::neighbors(int order) const {
    check_order(order);
    return neighbors_unchecked(geohash_, order);
}

uint64_t Geohash::to_bits() const {
    return ::geohash::to_bits(geohash_);
}

}  // namespace geohash
