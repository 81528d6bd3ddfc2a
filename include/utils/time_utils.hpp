/**
 * @file time_utils.hpp
 * @brief Clock helpers used by the book engine
 *
 * Wall-clock timestamps for book and metrics records, a monotonic clock for
 * TTL checks, a scoped latency timer and human-readable formatting for the
 * monitoring output.
 *
 * @author Market Data Handler Team
 * @date 2025-01-15
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace aggbook {

/**
 * @brief Get current wall-clock timestamp in nanoseconds
 *
 * @return uint64_t Nanoseconds since epoch
 *
 * @code
 * uint64_t start = get_timestamp_ns();
 * book.update(100.0, 1.0, true);
 * uint64_t elapsed = get_timestamp_ns() - start;
 * @endcode
 *
 * @see get_monotonic_ns() for interval checks
 */
inline uint64_t get_timestamp_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

inline uint64_t get_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

/**
 * @brief Get monotonic timestamp in nanoseconds
 *
 * Never goes backwards, so it is the clock used for rate TTLs. Not related
 * to the epoch.
 */
inline uint64_t get_monotonic_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()
    ).count();
}

/**
 * @brief Convert milliseconds to nanoseconds
 */
constexpr uint64_t ms_to_ns(uint64_t ms) {
    return ms * 1000000ULL;
}

/**
 * @brief RAII timer for measuring code block execution time
 *
 * @code
 * uint64_t latency_ns = 0;
 * {
 *     ScopedTimer timer(latency_ns);
 *     manager.update_orderbook(Venue::OKX_SPOT, 100.0, 2.0, true);
 * }  // latency_ns now holds the elapsed time
 * @endcode
 */
class ScopedTimer {
public:
    explicit ScopedTimer(uint64_t& duration_ns)
        : start_(get_monotonic_ns())
        , duration_ref_(duration_ns) {}

    ~ScopedTimer() {
        duration_ref_ = get_monotonic_ns() - start_;
    }

    /**
     * @brief Get elapsed time without stopping the timer
     */
    uint64_t elapsed_ns() const {
        return get_monotonic_ns() - start_;
    }

private:
    uint64_t start_;           ///< Start timestamp (monotonic)
    uint64_t& duration_ref_;   ///< Receives elapsed time on destruction
};

/**
 * @brief Convert nanoseconds to ISO 8601 string
 *
 * Output format: "YYYY-MM-DDTHH:MM:SS.nnnnnnnnnZ" (UTC)
 *
 * @param nanos Nanoseconds since epoch
 * @return std::string ISO 8601 formatted timestamp
 */
std::string nanos_to_iso8601(uint64_t nanos);

/**
 * @brief Format a duration for display
 *
 * @param nanos Duration in nanoseconds
 * @return std::string e.g. "850ns", "12.4us", "3.2ms", "1.5s"
 */
std::string format_duration(uint64_t nanos);

} // namespace aggbook
