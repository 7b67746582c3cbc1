/**
 * @file base32.hpp
 * @brief Geohash base-32 alphabet transcoder.
 */

#pragma once

#include <cstdint>

namespace geohash {
namespace base32 {

/// Geohash alphabet. Index is the 5-bit value.
constexpr char kAlphabet[] = "0123456789bcdefghjkmnpqrstuvwxyz";
constexpr int kBitsPerChar = 5;

/**
 * @brief Character for a 5-bit value.
 * @throws std::out_of_range if value is not in 0..31
 */
char encode(int value);

/**
 * @brief 5-bit value for an alphabet character.
 * @throws GeohashError(InvalidCharacter) if c is not in the alphabet
 */
int decode(char c);

/**
 * @brief True if c belongs to the alphabet (case-sensitive).
 */
bool is_valid(char c);

}  // namespace base32
}  // namespace geohash
