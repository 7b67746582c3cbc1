/**
 * @file geohash_error.cpp
 * @brief Error code names.
 */

#include "geohash_error.hpp"

namespace geohash {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::InvalidLength: return "InvalidLength";
        case ErrorCode::InvalidCoordinateShape: return "InvalidCoordinateShape";
        case ErrorCode::InvalidCharacter: return "InvalidCharacter";
        case ErrorCode::EmptyGeohash: return "EmptyGeohash";
        case ErrorCode::InvalidOrder: return "InvalidOrder";
    }
    return "Unknown";
}

}  // namespace geohash
