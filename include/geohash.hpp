/**
 * @file geohash.hpp
 * @brief Geohash encode/decode and neighbor generation.
 *
 * A geohash of length L carries 5*L bits, interleaved longitude/latitude
 * starting with longitude at the most significant bit. Encoding normalizes
 * its input first (wraparound, never clamping); decoding yields the
 * bounding interval of the cell.
 */

#pragma once

#include "angle_utils.hpp"
#include "geohash_error.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace geohash {

constexpr int kDefaultLength = 11;
constexpr int kMaxBitsLength = 12;  ///< Longest geohash that fits in to_bits()
constexpr int kMaxOrder = 1000;     ///< Largest neighbor radius, about 4M cells

/**
 * @brief Closed range of one coordinate.
 */
struct Interval {
    double min = 0.0;
    double max = 0.0;

    double width() const { return max - min; }
    double mid() const { return (min + max) / 2.0; }
    bool contains(double x) const { return min <= x && x <= max; }
};

/**
 * @brief Bounding intervals of a decoded cell.
 */
struct CellInterval {
    Interval lat{-90.0, 90.0};
    Interval lng{-180.0, 180.0};

    LatLng center() const { return {lat.mid(), lng.mid()}; }
};

/**
 * @brief Encode a coordinate pair.
 * @param point Raw coordinates, normalized before encoding
 * @param length Number of characters (>= 1)
 * @throws GeohashError InvalidLength, InvalidCoordinateShape (non-finite)
 */
std::string encode(const LatLng& point, int length = kDefaultLength);

/**
 * @brief Encode a [lat, lng] list.
 * @throws GeohashError InvalidCoordinateShape if the list does not hold
 *         exactly two finite numbers; InvalidLength
 */
std::string encode(const std::vector<double>& lat_lng, int length = kDefaultLength);

/**
 * @brief Bounding intervals of a geohash.
 * @throws GeohashError EmptyGeohash, InvalidCharacter
 */
CellInterval decode_interval(const std::string& geohash);

/**
 * @brief Cell midpoint rounded to the digits the cell size supports.
 * @throws GeohashError EmptyGeohash, InvalidCharacter
 */
LatLng decode_point(const std::string& geohash);

/**
 * @brief Geohashes of the surrounding cells at the same length.
 * @param geohash Center cell
 * @param order Chebyshev radius in cells, 1..kMaxOrder
 * @return (2*order+1)^2 - 1 strings, center excluded. Duplicates are
 *         possible near the poles, where offsets reflect over the pole.
 * @throws GeohashError InvalidOrder, EmptyGeohash, InvalidCharacter
 */
std::vector<std::string> neighbors(const std::string& geohash, int order = 1);

/**
 * @brief Raw bitstream of a geohash of at most kMaxBitsLength characters.
 * @throws GeohashError InvalidLength, EmptyGeohash, InvalidCharacter
 */
uint64_t to_bits(const std::string& geohash);

/**
 * @brief Check a geohash without throwing.
 */
ValidationResult validate(const std::string& geohash);

/**
 * @brief Throwing form of validate().
 */
void check(const std::string& geohash);

/**
 * @brief Convert a [lat, lng] list into a LatLng.
 * @throws GeohashError InvalidCoordinateShape
 */
LatLng to_lat_lng(const std::vector<double>& lat_lng);

/**
 * @brief A validated geohash string.
 *
 * Mutated only through set() and encode_lat_lng(); every query is const.
 */
class Geohash {
public:
    /// Cell at (0, 0), length 11.
    Geohash();

    static Geohash from_lat_lng(const LatLng& point, int length = kDefaultLength);
    static Geohash from_lat_lng(const std::vector<double>& lat_lng, int length = kDefaultLength);
    static Geohash from_geohash(const std::string& geohash);

    const std::string& geohash() const { return geohash_; }

    /**
     * @brief Replace the stored string after validating it.
     */
    void set(const std::string& geohash);

    /**
     * @brief Re-encode in place from a coordinate pair.
     */
    void encode_lat_lng(const LatLng& point, int length = kDefaultLength);

    size_t length() const { return geohash_.size(); }
    int precision() const { return static_cast<int>(geohash_.size()); }

    CellInterval decode_interval() const;
    LatLng decode() const;
    std::vector<std::string> neighbors(int order = 1) const;
    uint64_t to_bits() const;

    bool operator==(const Geohash& o) const { return geohash_ == o.geohash_; }
    bool operator!=(const Geohash& o) const { return geohash_ != o.geohash_; }

private:
    explicit Geohash(std::string geohash) : geohash_(std::move(geohash)) {}

    std::string geohash_;
};

}  // namespace geohash
