/**
 * @file geohash_error.hpp
 * @brief Error taxonomy for the geohash codec.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace geohash {

/**
 * @brief Reason an input was rejected at the codec boundary.
 */
enum class ErrorCode {
    None,                    ///< No error (used by ValidationResult)
    InvalidLength,           ///< Length < 1, non-integer, or too long for the operation
    InvalidCoordinateShape,  ///< Wrong arity or non-numeric coordinate members
    InvalidCharacter,        ///< Symbol outside the geohash alphabet
    EmptyGeohash,            ///< Zero-length geohash string
    InvalidOrder             ///< Neighbor order outside 1..kMaxOrder or non-integer
};

/**
 * @brief Stable name of an error code ("InvalidLength", ...).
 */
const char* error_code_name(ErrorCode code);

/**
 * @brief Exception raised by every codec entry point on invalid input.
 */
class GeohashError : public std::invalid_argument {
public:
    GeohashError(ErrorCode code, const std::string& message)
        : std::invalid_argument(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/**
 * @brief Non-throwing outcome of validate().
 */
struct ValidationResult {
    bool ok = true;                   ///< True if the geohash is well formed
    ErrorCode code = ErrorCode::None; ///< Failure reason when !ok
    std::string error;                ///< Error description when !ok
};

}  // namespace geohash
