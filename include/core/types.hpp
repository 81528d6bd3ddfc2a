/**
 * @file types.hpp
 * @brief Core data types shared by the order book and aggregation engine
 *
 * Defines the closed venue enumeration used as the aggregation attribution
 * key, book sides, venue lifecycle states, the raw and output level types,
 * and the fixed-point helpers used for resting sizes.
 *
 * @author Market Data Handler Team
 * @date 2025-01-15
 */

#pragma once

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace aggbook {

/**
 * @brief Venue identifier enumeration
 *
 * Closed set of venues the engine knows how to attribute liquidity to.
 * Adding a venue is a data operation: add an enumerator here and register
 * it with BookManager::add_venue(). The aggregation logic never switches
 * on the venue.
 */
enum class Venue : uint8_t {
    UNKNOWN = 0,        ///< Unknown or unspecified venue (never registrable)
    BINANCE_SPOT = 1,   ///< Binance spot
    BINANCE_USDM = 2,   ///< Binance USD-M futures
    BINANCE_COINM = 3,  ///< Binance COIN-M futures (USD quoted)
    OKX_SPOT = 4,       ///< OKX spot
    BYBIT_SPOT = 5,     ///< Bybit spot
    BYBIT_PERP = 6,     ///< Bybit linear perpetual
    COINBASE = 7,       ///< Coinbase exchange
    KRAKEN = 8          ///< Kraken
};

/**
 * @brief Order side enumeration
 */
enum class Side : uint8_t {
    BID = 0,  ///< Bid (buy) side
    ASK = 1   ///< Ask (sell) side
};

/**
 * @brief Per-venue lifecycle state
 *
 * Transitions are monotonic: REGISTERED -> SNAPSHOTTED -> LIVE. A resync
 * drives a venue back to REGISTERED, never to an intermediate state.
 */
enum class VenueState : uint8_t {
    UNREGISTERED = 0,  ///< Not known to the manager
    REGISTERED = 1,    ///< Book created, waiting for a snapshot
    SNAPSHOTTED = 2,   ///< Snapshot installed, no streaming update yet
    LIVE = 3           ///< At least one streaming update applied
};

/**
 * @brief Convert venue enum to display name
 *
 * @param venue Venue identifier
 * @return const char* Human readable name (e.g. "Binance Spot")
 */
inline const char* venue_to_string(Venue venue) {
    switch (venue) {
        case Venue::BINANCE_SPOT: return "Binance Spot";
        case Venue::BINANCE_USDM: return "Binance USD-M";
        case Venue::BINANCE_COINM: return "Binance COIN-M";
        case Venue::OKX_SPOT: return "OKX Spot";
        case Venue::BYBIT_SPOT: return "Bybit Spot";
        case Venue::BYBIT_PERP: return "Bybit Perp";
        case Venue::COINBASE: return "Coinbase";
        case Venue::KRAKEN: return "Kraken";
        default: return "Unknown";
    }
}

/**
 * @brief Convert venue enum to its configuration key
 *
 * @param venue Venue identifier
 * @return const char* Lower-case key used in YAML (e.g. "binance_spot")
 *
 * @see venue_from_string()
 */
inline const char* venue_to_key(Venue venue) {
    switch (venue) {
        case Venue::BINANCE_SPOT: return "binance_spot";
        case Venue::BINANCE_USDM: return "binance_usdm";
        case Venue::BINANCE_COINM: return "binance_coinm";
        case Venue::OKX_SPOT: return "okx_spot";
        case Venue::BYBIT_SPOT: return "bybit_spot";
        case Venue::BYBIT_PERP: return "bybit_perp";
        case Venue::COINBASE: return "coinbase";
        case Venue::KRAKEN: return "kraken";
        default: return "unknown";
    }
}

/**
 * @brief Parse a configuration key into a venue
 *
 * @param key Lower-case key (e.g. "okx_spot")
 * @return Venue Matching venue, or Venue::UNKNOWN
 *
 * @code
 * Venue v = venue_from_string("bybit_spot");  // Venue::BYBIT_SPOT
 * @endcode
 */
inline Venue venue_from_string(const std::string& key) {
    if (key == "binance_spot") return Venue::BINANCE_SPOT;
    if (key == "binance_usdm") return Venue::BINANCE_USDM;
    if (key == "binance_coinm") return Venue::BINANCE_COINM;
    if (key == "okx_spot") return Venue::OKX_SPOT;
    if (key == "bybit_spot") return Venue::BYBIT_SPOT;
    if (key == "bybit_perp") return Venue::BYBIT_PERP;
    if (key == "coinbase") return Venue::COINBASE;
    if (key == "kraken") return Venue::KRAKEN;
    return Venue::UNKNOWN;
}

inline const char* venue_state_to_string(VenueState state) {
    switch (state) {
        case VenueState::REGISTERED: return "REGISTERED";
        case VenueState::SNAPSHOTTED: return "SNAPSHOTTED";
        case VenueState::LIVE: return "LIVE";
        default: return "UNREGISTERED";
    }
}

/**
 * @brief Raw price level as delivered by a feed adapter
 *
 * Price and size are already parsed from the venue's wire strings but not
 * yet quantized.
 */
struct PriceSize {
    double price;  ///< Venue-native price
    double size;   ///< Resting size (<= 0 means delete)

    PriceSize()
        : price(0.0)
        , size(0.0) {}

    PriceSize(double p, double s)
        : price(p)
        , size(s) {}
};

/**
 * @brief Price level returned by depth queries
 *
 * Price is the grid price (quantized key converted back to a double).
 */
struct DepthLevel {
    double price;  ///< Grid price
    double size;   ///< Resting size

    DepthLevel()
        : price(0.0)
        , size(0.0) {}

    DepthLevel(double p, double s)
        : price(p)
        , size(s) {}
};

/**
 * @brief Top-of-book depth for one book
 *
 * Bids are ordered high to low, asks low to high.
 */
struct DepthSnapshot {
    std::vector<DepthLevel> bids;  ///< Bid levels (descending price)
    std::vector<DepthLevel> asks;  ///< Ask levels (ascending price)
    uint64_t sequence_number{0};   ///< Book mutation count when taken
    uint64_t timestamp_ns{0};      ///< Snapshot timestamp
};

/**
 * @brief Fixed-point scale for resting sizes
 *
 * Sizes are held as signed 64-bit integers with 8 decimals so that running
 * sums across venues are exact. A size that rounds to zero at this scale is
 * treated as a delete.
 */
constexpr int64_t SIZE_SCALE = 100000000LL;

/**
 * @brief Largest accepted resting size for one level
 *
 * 10^10 units is 10^18 in fixed point, so the contributions of every
 * venue at one aggregated level still fit in int64_t. Larger sizes are
 * rejected with INVALID_SIZE rather than clamped.
 */
constexpr double MAX_SIZE = 1e10;

/**
 * @brief Check a size before it enters a book
 *
 * @return true if finite and not above MAX_SIZE (<= 0 is a valid delete)
 */
inline bool is_valid_size(double size) {
    return std::isfinite(size) && size <= MAX_SIZE;
}

/**
 * @brief Convert a size to fixed point
 *
 * @param size Size as double
 * @return int64_t Fixed-point size, rounded to nearest; 0 for non-positive input
 *
 * @warning Caller must check is_valid_size() first
 * @see size_from_fixed()
 */
inline int64_t size_to_fixed(double size) {
    if (!(size > 0.0)) {
        return 0;
    }
    return static_cast<int64_t>(std::llround(size * static_cast<double>(SIZE_SCALE)));
}

/**
 * @brief Convert a fixed-point size back to double
 *
 * @see size_to_fixed()
 */
inline double size_from_fixed(int64_t fixed) {
    return static_cast<double>(fixed) / static_cast<double>(SIZE_SCALE);
}

} // namespace aggbook
