/**
 * @file usd_converter.hpp
 * @brief TTL-bounded quote currency to USD rate cache
 *
 * Holds one USD rate per quote currency together with the time it was last
 * refreshed. A rate older than the TTL is treated as absent: conversion
 * reports RATE_STALE instead of serving it, and the caller must supply a
 * fresh rate through update_rate() before conversion can proceed.
 *
 * @author Market Data Handler Team
 * @date 2025-01-15
 */

#pragma once

#include "core/errors.hpp"
#include "utils/time_utils.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace aggbook {

/**
 * @brief Result of a USD conversion
 */
struct UsdQuote {
    ErrorCode error{ErrorCode::RATE_STALE};  ///< OK, RATE_STALE or INVALID_PRICE
    double usd_value{0.0};                   ///< amount * rate when OK
    double rate{0.0};                        ///< Rate used when OK

    bool ok() const { return error == ErrorCode::OK; }
};

/**
 * @brief USD conversion cache with bounded staleness
 *
 * **Rules:**
 * - A rate is fresh while (now - refreshed) < ttl
 * - "USD" is the identity currency: rate 1.0, never stale
 * - Currency codes are case-insensitive ("usdt" == "USDT")
 * - Rates must be finite and > 0
 *
 * @code
 * UsdConverter converter(ms_to_ns(60000));
 * converter.update_rate("USDT", 0.9995);
 *
 * auto quote = converter.convert("USDT", 50000.0);
 * if (quote.ok()) {
 *     // quote.usd_value == 49975.0
 * }
 * @endcode
 *
 * @note Thread-safe: concurrent conversions, exclusive rate updates
 */
class UsdConverter {
public:
    using Clock = std::function<uint64_t()>;

    static constexpr const char* BASE_CURRENCY = "USD";

    /**
     * @brief Construct converter
     *
     * @param ttl_ns Maximum age of a usable rate
     * @param clock Time source in nanoseconds (monotonic by default)
     */
    explicit UsdConverter(uint64_t ttl_ns, Clock clock = get_monotonic_ns);

    /**
     * @brief Store a fresh rate
     *
     * @param currency Quote currency code
     * @param usd_rate USD value of one unit of currency
     * @return ErrorCode OK, or INVALID_PRICE for a non-finite/non-positive rate
     *         or for an attempt to override the base currency
     */
    ErrorCode update_rate(const std::string& currency, double usd_rate);

    /**
     * @brief Convert an amount to USD
     *
     * O(1), performs no I/O. Never serves a rate older than the TTL.
     *
     * @param currency Quote currency code
     * @param amount Amount in that currency
     * @return UsdQuote with OK, RATE_STALE (missing or expired rate) or
     *         INVALID_PRICE (non-finite amount)
     */
    UsdQuote convert(const std::string& currency, double amount) const;

    /**
     * @brief Get a fresh rate
     *
     * @return Rate, or std::nullopt if missing or stale
     */
    std::optional<double> get_rate(const std::string& currency) const;

    /**
     * @brief Check whether a currency needs a new rate before use
     */
    bool needs_refresh(const std::string& currency) const;

    /**
     * @brief Get when a currency's rate was last refreshed
     *
     * @return Clock value at the last update_rate(), std::nullopt if never set
     */
    std::optional<uint64_t> last_refreshed_ns(const std::string& currency) const;

    uint64_t ttl_ns() const { return ttl_ns_; }

    /**
     * @brief Get every currency with a stored rate (fresh or stale)
     */
    std::vector<std::string> currencies() const;

    /**
     * @brief Check whether a code names the base currency
     */
    static bool is_base(const std::string& currency);

    /**
     * @brief Normalize a currency code to upper case
     */
    static std::string normalize(const std::string& currency);

private:
    struct CachedRate {
        double rate{0.0};
        uint64_t refreshed_ns{0};
    };

    bool is_fresh(const CachedRate& cached, uint64_t now) const;

    uint64_t ttl_ns_;                                      ///< Rate lifetime
    Clock clock_;                                          ///< Time source
    mutable std::shared_mutex mutex_;                      ///< Protects rates_
    std::unordered_map<std::string, CachedRate> rates_;   ///< Currency -> rate
};

} // namespace aggbook
