/**
 * @file book_manager.hpp
 * @brief Venue registry and orchestration of per-venue and aggregated books
 *
 * Owns one VenueBook per registered venue plus the shared AggregatedBook.
 * Routes snapshots and streaming diffs to both views, normalizes non-USD
 * prices through the UsdConverter, drives the per-venue lifecycle and
 * collects metrics.
 *
 * @author Market Data Handler Team
 * @date 2025-01-15
 */

#pragma once

#include "config/configuration_manager.hpp"
#include "core/aggregated_book.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"
#include "core/usd_converter.hpp"
#include "core/venue_book.hpp"
#include "metrics/metrics_collector.hpp"
#include "metrics/venue_metrics.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace aggbook {

/**
 * @brief Orchestrator for venue books and the aggregate
 *
 * **Venue Lifecycle:**
 * - add_venue(): UNREGISTERED -> REGISTERED
 * - apply_snapshot(): REGISTERED -> SNAPSHOTTED
 * - first update_orderbook(): SNAPSHOTTED -> LIVE
 * - resync_venue(): any -> REGISTERED (contribution wiped, book emptied)
 * - remove_venue(): any -> UNREGISTERED
 *
 * **Concurrency:**
 * - Registry guarded by a reader-writer lock
 * - One writer mutex per venue, held across the VenueBook and aggregate
 *   mutation, so both views apply a venue's updates in the same order
 * - Different venues update concurrently and meet only at the aggregate lock
 *
 * **USD Normalization:**
 * - A venue quoting in USD enters the aggregate at its own prices
 * - Any other quote currency is converted with a fresh rate; if the rate is
 *   stale the venue's contribution is evicted from the aggregate until a
 *   new rate arrives, and RATE_STALE is returned
 *
 * @code
 * AggregatorConfig cfg;
 * cfg.price_precision = 2;
 * BookManager manager(cfg);
 *
 * manager.add_venue(Venue::BINANCE_SPOT, 2, "USDT");
 * manager.add_venue(Venue::COINBASE, 2);
 * manager.update_usd_rate("USDT", 1.0);
 *
 * manager.apply_snapshot(Venue::COINBASE, {{100.00, 3.0}}, {{100.50, 1.0}});
 * manager.update_orderbook(Venue::COINBASE, 100.00, 4.0, true);
 *
 * auto depth = manager.get_aggregated_depth(10);
 * @endcode
 *
 * @note Thread-safe for all operations
 */
class BookManager {
public:
    /**
     * @brief Construct manager
     *
     * @param config Aggregate precision, aggregation depth and rate TTL
     * @param clock Time source for rate freshness (monotonic by default)
     * @throws InvalidPriceError if config.price_precision is out of range
     */
    explicit BookManager(const AggregatorConfig& config,
                         UsdConverter::Clock clock = get_monotonic_ns);

    BookManager(const BookManager&) = delete;
    BookManager& operator=(const BookManager&) = delete;

    /**
     * @brief Register a venue
     *
     * @param venue Venue identifier
     * @param precision Venue book decimals
     * @param quote_currency Currency the venue quotes in (empty means USD)
     * @return ErrorCode OK, UNKNOWN_VENUE (Venue::UNKNOWN), INVALID_PRICE
     *         (bad precision) or DUPLICATE_VENUE
     */
    ErrorCode add_venue(Venue venue, int precision, const std::string& quote_currency = "USD");

    /**
     * @brief Deregister a venue
     *
     * Wipes its aggregate contribution and destroys its book and metrics.
     *
     * @return ErrorCode OK or UNKNOWN_VENUE
     */
    ErrorCode remove_venue(Venue venue);

    /**
     * @brief Install a full snapshot for a venue
     *
     * The VenueBook is replaced all-or-nothing, then the venue's aggregate
     * contribution is re-seeded from it.
     *
     * @return ErrorCode OK; UNKNOWN_VENUE; INVALID_PRICE / INVALID_SIZE
     *         (nothing installed); RATE_STALE (book installed, aggregate
     *         contribution deferred until a fresh rate). INVALID_SIZE is also
     *         returned when the book installed but its summed levels would
     *         overflow an aggregated level; the venue then stays out of the
     *         aggregate until a later re-seed fits.
     */
    ErrorCode apply_snapshot(Venue venue,
                             const std::vector<PriceSize>& bids,
                             const std::vector<PriceSize>& asks);

    /**
     * @brief Apply one streaming diff to the venue book and the aggregate
     *
     * @param venue Source venue
     * @param price Venue price in its quote currency
     * @param size Absolute new size (<= 0 deletes)
     * @param is_bid True for bid side
     * The venue's contribution at the affected aggregated level is the sum
     * of all its venue levels that map there, so several venue levels
     * collapsing onto one aggregated level never shadow each other.
     *
     * @return ErrorCode OK; UNKNOWN_VENUE; INVALID_STATE (no snapshot yet);
     *         INVALID_PRICE / INVALID_SIZE (nothing applied, including a size
     *         above MAX_SIZE or an aggregated total that would overflow);
     *         RATE_STALE (venue book updated, aggregate contribution evicted)
     */
    ErrorCode update_orderbook(Venue venue, double price, double size, bool is_bid);

    /**
     * @brief Drop a venue's state after a detected gap or disconnect
     *
     * Clears its aggregate contribution and book, moves it back to
     * REGISTERED and counts a reconnect. The next apply_snapshot() reseeds it.
     *
     * @return ErrorCode OK or UNKNOWN_VENUE
     */
    ErrorCode resync_venue(Venue venue);

    /**
     * @brief Rebuild the aggregate from every venue book
     *
     * Each venue's contribution is replaced by its current book, truncated
     * to the configured aggregation depth (0 = full book).
     *
     * @return ErrorCode OK, or RATE_STALE if any venue could not be
     *         converted (that venue stays out of the aggregate)
     */
    ErrorCode update_aggregated_orderbook();

    /**
     * @brief Store a USD rate and re-seed every venue quoting in it
     *
     * @return ErrorCode OK or INVALID_PRICE
     */
    ErrorCode update_usd_rate(const std::string& currency, double usd_rate);

    /**
     * @brief Record adapter-measured latency and prices for a venue
     *
     * Overrides last latency and best bid/ask without counting an update;
     * used when the adapter measures end-to-end latency itself.
     *
     * @return ErrorCode OK or UNKNOWN_VENUE
     */
    ErrorCode update_metrics(Venue venue, uint64_t latency_ns,
                             std::optional<double> best_bid,
                             std::optional<double> best_ask);

    std::map<Venue, VenueMetrics> get_metrics() const;
    std::optional<VenueMetrics> get_venue_metrics(Venue venue) const;
    MetricsCollector::Summary get_engine_metrics() const;

    /**
     * @brief Get top n levels of one venue's book (venue-native prices)
     *
     * @return Depth, or std::nullopt if the venue is not registered
     */
    std::optional<DepthSnapshot> get_venue_depth(Venue venue, size_t n) const;

    AggregatedDepth get_aggregated_depth(size_t n) const;

    /**
     * @brief Read-only access to the aggregate
     */
    const AggregatedBook& get_aggregated_orderbook() const { return aggregated_; }

    const UsdConverter& usd_converter() const { return converter_; }
    const AggregatorConfig& config() const { return config_; }

    /**
     * @brief Get a venue's lifecycle state
     *
     * @return VenueState UNREGISTERED if the venue is unknown
     */
    VenueState get_venue_state(Venue venue) const;

    /**
     * @brief Check whether a venue's aggregate contribution awaits a rate
     */
    bool is_aggregate_pending(Venue venue) const;

    std::optional<std::string> get_quote_currency(Venue venue) const;

    /**
     * @brief Get registered venues in enumeration order
     */
    std::vector<Venue> get_venues() const;

    size_t venue_count() const;

    /**
     * @brief Set callback for crossed aggregate observations
     *
     * @note Invoked from the updating thread outside the aggregate lock but
     *       while that venue's writer lock is held; the callback must not
     *       feed updates for the same venue
     */
    void set_crossed_callback(AggregatedBook::CrossedCallback callback);

private:
    /**
     * @brief Registry entry for one venue
     */
    struct VenueEntry {
        VenueEntry(int precision, std::string currency)
            : book(precision)
            , quote_currency(std::move(currency)) {}

        std::mutex writer_mutex;                 ///< Serializes this venue's writers
        VenueBook book;                          ///< Venue-native book
        const std::string quote_currency;        ///< Normalized quote currency
        std::atomic<VenueState> state{VenueState::REGISTERED};
        bool aggregate_pending{false};           ///< Contribution awaits a rate (writer_mutex)
        mutable std::mutex metrics_mutex;        ///< Protects metrics
        VenueMetrics metrics;                    ///< Per-venue statistics
    };

    using EntryPtr = std::shared_ptr<VenueEntry>;

    EntryPtr find_entry(Venue venue) const;
    std::vector<std::pair<Venue, EntryPtr>> snapshot_entries() const;

    /**
     * @brief Replace a venue's aggregate contribution from its book
     *
     * Caller holds entry.writer_mutex.
     *
     * @param depth Levels per side to fold (0 = full book)
     * @return ErrorCode OK, RATE_STALE, or INVALID_SIZE (a level total would
     *         overflow); on error the venue is left out of the aggregate
     */
    ErrorCode seed_aggregate(Venue venue, VenueEntry& entry, size_t depth);

    /**
     * @brief USD value of one unit of the venue's quote currency
     *
     * @return 1.0 for USD venues, the fresh rate, or std::nullopt if stale
     */
    std::optional<double> usd_rate(const VenueEntry& entry) const;

    /**
     * @brief Map a venue grid key onto the aggregate grid
     *
     * Seeding and streaming both go through here, so a venue level always
     * lands on the same aggregated level.
     */
    std::optional<int64_t> aggregate_key(const VenueEntry& entry, int64_t venue_key,
                                         double rate) const;

    /**
     * @brief Sum of every venue level that maps onto one aggregated level
     *
     * Caller holds entry.writer_mutex.
     *
     * @param total Receives the fixed-point sum
     * @return ErrorCode OK, or INVALID_SIZE if the sum overflows
     */
    ErrorCode venue_total_at(const VenueEntry& entry, int64_t agg_key, double rate,
                             Side side, int64_t& total) const;

    void record_rejection(VenueEntry& entry);
    void record_update(VenueEntry& entry, uint64_t latency_ns);

    AggregatorConfig config_;                      ///< Engine settings
    UsdConverter converter_;                       ///< USD rate cache
    AggregatedBook aggregated_;                    ///< Cross-venue book
    MetricsCollector metrics_;                     ///< Engine-wide metrics

    mutable std::shared_mutex registry_mutex_;     ///< Protects venues_
    std::map<Venue, EntryPtr> venues_;             ///< Registered venues

    mutable std::mutex callback_mutex_;            ///< Protects crossed_callback_
    AggregatedBook::CrossedCallback crossed_callback_;  ///< User crossed callback
};

} // namespace aggbook
