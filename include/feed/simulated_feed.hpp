/**
 * @file simulated_feed.hpp
 * @brief Synthetic venue feed driving a BookManager
 *
 * Stands in for a venue's REST snapshot + WebSocket diff adapter: installs
 * a snapshot, then streams absolute level diffs around a random-walk mid
 * price from its own worker thread. Periodic simulated disconnects go
 * through the same resync + fresh snapshot path a real adapter uses.
 *
 * @author Market Data Handler Team
 * @date 2025-01-15
 */

#pragma once

#include "core/book_manager.hpp"
#include "core/types.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <random>
#include <thread>
#include <utility>
#include <vector>

namespace aggbook {

/**
 * @brief Simulated feed parameters
 */
struct SimulatedFeedConfig {
    double base_price{50000.0};          ///< Starting mid in USD
    double quote_rate{1.0};              ///< USD value of one quote currency unit
    int precision{2};                    ///< Venue price decimals
    double level_spacing{0.5};           ///< Distance between levels (quote currency)
    size_t snapshot_depth{20};           ///< Levels per side in each snapshot
    uint32_t updates_per_sec{200};       ///< Diff rate
    uint32_t disconnect_interval_sec{0}; ///< Simulated disconnect period (0 = never)
    uint32_t seed{0};                    ///< RNG seed (0 = random)
};

/**
 * @brief Synthetic per-venue feed
 *
 * @code
 * SimulatedFeedConfig cfg;
 * cfg.base_price = 50000.0;
 * SimulatedVenueFeed feed(manager, Venue::OKX_SPOT, cfg);
 * feed.start();
 * // ...
 * feed.stop();
 * @endcode
 *
 * @note start()/stop() are not thread-safe with respect to each other;
 *       call them from the owning thread. step() and publish_snapshot()
 *       must not be called while the worker is running.
 */
class SimulatedVenueFeed {
public:
    SimulatedVenueFeed(BookManager& manager, Venue venue, const SimulatedFeedConfig& config);
    ~SimulatedVenueFeed();

    SimulatedVenueFeed(const SimulatedVenueFeed&) = delete;
    SimulatedVenueFeed& operator=(const SimulatedVenueFeed&) = delete;

    /**
     * @brief Start the worker thread
     *
     * The worker installs a snapshot first, then streams diffs.
     */
    void start();

    /**
     * @brief Stop and join the worker thread
     */
    void stop();

    bool is_running() const { return running_.load(std::memory_order_acquire); }

    /**
     * @brief Build a fresh book around the current mid and install it
     *
     * @return ErrorCode Result of BookManager::apply_snapshot()
     */
    ErrorCode publish_snapshot();

    /**
     * @brief Move the mid and send one diff (plus any deletes it implies)
     *
     * @return ErrorCode Result of the last BookManager call
     */
    ErrorCode step();

    /**
     * @brief Simulate a disconnect: resync the venue and re-snapshot
     */
    ErrorCode reconnect();

    uint64_t updates_sent() const { return updates_sent_.load(std::memory_order_relaxed); }
    uint64_t snapshots_sent() const { return snapshots_sent_.load(std::memory_order_relaxed); }
    uint64_t errors() const { return errors_.load(std::memory_order_relaxed); }
    Venue venue() const { return venue_; }

private:
    void run();

    ErrorCode send(int64_t tick, double size, bool is_bid);
    double tick_to_price(int64_t tick) const;

    BookManager& manager_;
    Venue venue_;
    SimulatedFeedConfig config_;

    std::mt19937 gen_;
    std::uniform_real_distribution<> walk_dist_;
    std::uniform_real_distribution<> size_dist_;
    std::uniform_real_distribution<> unit_dist_;

    double mid_ticks_;                    ///< Mid price in level-spacing units
    std::map<int64_t, double> bids_;      ///< Feed's own view: tick -> size
    std::map<int64_t, double> asks_;

    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> updates_sent_{0};
    std::atomic<uint64_t> snapshots_sent_{0};
    std::atomic<uint64_t> errors_{0};
};

} // namespace aggbook
