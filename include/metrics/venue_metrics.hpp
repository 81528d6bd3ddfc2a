/**
 * @file venue_metrics.hpp
 * @brief Per-venue update statistics
 *
 * @author Market Data Handler Team
 * @date 2025-01-15
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>

namespace aggbook {

/**
 * @brief Observability record for one venue
 *
 * Written only from the venue's update path, read by monitoring. No
 * cross-field invariants.
 *
 * @code
 * VenueMetrics m;
 * m.update_latency(1200);       // 1.2 us
 * m.update_prices(50000.0, 50000.5);
 * // m.updates_processed == 1, m.avg_update_latency_ns == 1200.0
 * @endcode
 */
struct VenueMetrics {
    uint64_t updates_processed{0};       ///< Streaming updates applied
    uint64_t snapshots_applied{0};       ///< Snapshots installed
    uint64_t rejected_updates{0};        ///< Updates refused (invalid input, state)
    uint64_t stale_rate_updates{0};      ///< Updates that hit a stale USD rate
    uint64_t reconnects{0};              ///< Resyncs requested
    uint64_t last_update_latency_ns{0};  ///< Most recent processing latency
    uint64_t max_update_latency_ns{0};   ///< Worst processing latency
    double avg_update_latency_ns{0.0};   ///< Running mean latency
    std::optional<double> best_bid;      ///< Venue best bid after last update
    std::optional<double> best_ask;      ///< Venue best ask after last update
    uint64_t last_update_ns{0};          ///< Wall clock of last update (0 = never)

    /**
     * @brief Record the latency of one processed update
     *
     * Folds the sample into the running mean and bumps updates_processed.
     */
    void update_latency(uint64_t latency_ns) {
        last_update_latency_ns = latency_ns;
        avg_update_latency_ns =
            (avg_update_latency_ns * static_cast<double>(updates_processed) +
             static_cast<double>(latency_ns)) /
            (static_cast<double>(updates_processed) + 1.0);
        max_update_latency_ns = std::max(max_update_latency_ns, latency_ns);
        ++updates_processed;
    }

    void update_prices(std::optional<double> bid, std::optional<double> ask) {
        best_bid = bid;
        best_ask = ask;
    }
};

} // namespace aggbook
