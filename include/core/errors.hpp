/**
 * @file errors.hpp
 * @brief Error taxonomy for the book engine
 *
 * Mutating operations report failures as ErrorCode values returned to the
 * immediate caller (normally a feed adapter), which decides whether a venue
 * resync is needed. None of these conditions is process-fatal.
 *
 * @author Market Data Handler Team
 * @date 2025-01-15
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace aggbook {

/**
 * @brief Result codes for book operations
 */
enum class ErrorCode : uint8_t {
    OK = 0,               ///< Operation applied
    INVALID_PRICE = 1,    ///< Non-finite, non-positive or unrepresentable price/precision
    INVALID_SIZE = 2,     ///< Non-finite size
    RATE_STALE = 3,       ///< USD rate missing or older than the TTL
    CROSSED_BOOK = 4,     ///< Best bid >= best ask (observation only)
    UNKNOWN_VENUE = 5,    ///< Venue is not registered
    DUPLICATE_VENUE = 6,  ///< Venue already registered
    INVALID_STATE = 7     ///< Operation not legal in the venue's current state
};

/**
 * @brief Convert error code to string
 *
 * @param code Error code
 * @return const char* Upper-case name (e.g. "RATE_STALE")
 */
inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_PRICE: return "INVALID_PRICE";
        case ErrorCode::INVALID_SIZE: return "INVALID_SIZE";
        case ErrorCode::RATE_STALE: return "RATE_STALE";
        case ErrorCode::CROSSED_BOOK: return "CROSSED_BOOK";
        case ErrorCode::UNKNOWN_VENUE: return "UNKNOWN_VENUE";
        case ErrorCode::DUPLICATE_VENUE: return "DUPLICATE_VENUE";
        case ErrorCode::INVALID_STATE: return "INVALID_STATE";
    }
    return "UNKNOWN";
}

/**
 * @brief Thrown when a price grid is constructed with an invalid precision
 *
 * Only raised from constructors; per-call validation uses ErrorCode.
 */
class InvalidPriceError : public std::invalid_argument {
public:
    explicit InvalidPriceError(const std::string& what)
        : std::invalid_argument(what) {}
};

} // namespace aggbook
