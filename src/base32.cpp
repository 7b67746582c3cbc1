/**
 * @file base32.cpp
 * @brief Base-32 transcoder implementation.
 */

#include "base32.hpp"
#include "geohash_error.hpp"

#include <array>
#include <stdexcept>
#include <string>

namespace geohash {
namespace base32 {

namespace {

// Reverse lookup: byte -> value, -1 for bytes outside the alphabet.
constexpr std::array<int8_t, 256> build_decode_table() {
    std::array<int8_t, 256> table{};
    for (auto& v : table) v = -1;
    for (int i = 0; i < 32; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int8_t>(i);
    }
    return table;
}

constexpr std::array<int8_t, 256> kDecodeTable = build_decode_table();

static_assert(sizeof(kAlphabet) == 33, "alphabet must have 32 symbols");
static_assert(kDecodeTable['s'] == 24, "decode table out of sync with alphabet");

}  // namespace

char encode(int value) {
    if (value < 0 || value > 31) {
        throw std::out_of_range("base32 value out of range: " + std::to_string(value));
    }
    return kAlphabet[value];
}

int decode(char c) {
    int v = kDecodeTable[static_cast<unsigned char>(c)];
    if (v < 0) {
        throw GeohashError(ErrorCode::InvalidCharacter,
                           std::string("Invalid geohash character '") + c + "'");
    }
    return v;
}

bool is_valid(char c) {
    return kDecodeTable[static_cast<unsigned char>(c)] >= 0;
}

}  // namespace base32
}  // namespace geohash
