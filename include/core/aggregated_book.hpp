/**
 * @file aggregated_book.hpp
 * @brief Cross-venue aggregated order book with per-venue attribution
 *
 * Merges the liquidity of every registered venue onto one common price grid.
 * Each price level keeps the resting size contributed by each venue together
 * with a cached running total, so any single venue's liquidity can be added,
 * replaced or wiped without disturbing the others.
 *
 * **Features:**
 * - Venue-summed depth with attribution (which venues quote a level)
 * - O(1) total maintenance per contribution change
 * - Atomic per-venue re-seeding (replace_venue)
 * - Crossed book observation (best bid >= best ask)
 *
 * **Performance:**
 * - Update: O(log L + log V), L = levels per side, V = venues at the level
 * - Depth: O(K * V) where K = requested depth
 * - Clear venue: O(M log L) where M = levels the venue quotes
 *
 * @author Market Data Handler Team
 * @date 2025-01-15
 */

#pragma once

#include "core/errors.hpp"
#include "core/price_grid.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace aggbook {

/**
 * @brief One venue's share of an aggregated level
 */
struct VenueContribution {
    Venue venue;  ///< Contributing venue
    double size;  ///< Resting size from this venue

    VenueContribution()
        : venue(Venue::UNKNOWN)
        , size(0.0) {}

    VenueContribution(Venue v, double s)
        : venue(v)
        , size(s) {}
};

/**
 * @brief Aggregated price level with attribution
 *
 * total_size is the venue-summed size; sources lists every contributing
 * venue in enumeration order.
 */
struct AggregatedDepthLevel {
    double price{0.0};                      ///< Grid price
    double total_size{0.0};                 ///< Sum over venues
    std::vector<VenueContribution> sources; ///< Per-venue contributions
};

/**
 * @brief Top-of-book depth of the aggregate
 */
struct AggregatedDepth {
    std::vector<AggregatedDepthLevel> bids;  ///< Descending price
    std::vector<AggregatedDepthLevel> asks;  ///< Ascending price
    uint64_t timestamp_ns{0};                ///< Snapshot timestamp
};

/**
 * @brief Observation of a crossed aggregate (best bid >= best ask)
 *
 * Surfaced for collaborators; the book never resolves the cross itself.
 */
struct CrossedBookObservation {
    AggregatedDepthLevel best_bid;  ///< Best bid with attribution
    AggregatedDepthLevel best_ask;  ///< Best ask with attribution
    uint64_t timestamp_ns{0};       ///< Detection time

    /**
     * @brief Get overlap (bid - ask), >= 0 by construction
     */
    double overlap() const { return best_bid.price - best_ask.price; }
};

/**
 * @brief Venue-attributed aggregated order book
 *
 * **Architecture:**
 * - Per side: ordered map price key -> Level
 * - Level: map venue -> fixed size, plus running total
 * - Per venue: index of the keys it contributes to (fast clear_venue)
 * - One reader-writer lock; a reader never observes a level whose total
 *   differs from the sum of its contributions
 *
 * **Update Semantics:**
 * - update() is absolute per (venue, level): it replaces the venue's
 *   contribution, total += new - old
 * - size <= 0 removes the venue's contribution; an empty level is erased
 * - Prices arrive already normalized (e.g. USD) and are quantized to the
 *   aggregate grid; distinct venue prices that round to the same grid point
 *   collapse into one level
 *
 * @code
 * AggregatedBook agg(2);
 *
 * agg.update(100.00, 5.0, true, Venue::BINANCE_SPOT);
 * agg.update(100.00, 3.0, true, Venue::OKX_SPOT);
 *
 * auto bid = agg.best_bid();
 * // bid->price == 100.00, bid->total_size == 8.0,
 * // bid->sources == {BINANCE_SPOT: 5.0, OKX_SPOT: 3.0}
 *
 * agg.clear_venue(Venue::OKX_SPOT);   // bid->total_size now 5.0
 * @endcode
 *
 * @note Thread-safe: multiple readers, one writer at a time
 */
class AggregatedBook {
public:
    /**
     * @brief Callback for crossed book observations
     *
     * Invoked outside the book lock, once per transition into the
     * crossed state.
     */
    using CrossedCallback = std::function<void(const CrossedBookObservation&)>;

    /**
     * @brief Construct empty aggregate
     *
     * @param precision Common grid decimals
     * @throws InvalidPriceError if precision is out of range
     */
    explicit AggregatedBook(int precision);

    AggregatedBook(const AggregatedBook&) = delete;
    AggregatedBook& operator=(const AggregatedBook&) = delete;

    /**
     * @brief Set one venue's contribution at a price level
     *
     * @param price Normalized price
     * @param size Venue's new resting size (<= 0 removes its contribution)
     * @param is_bid True for bid side
     * @param venue Contributing venue
     * @return ErrorCode OK, INVALID_PRICE, INVALID_SIZE (non-finite, above
     *         MAX_SIZE, or a level total that would overflow) or UNKNOWN_VENUE
     *
     * @note Thread-safe (write lock)
     */
    ErrorCode update(double price, double size, bool is_bid, Venue venue);

    /**
     * @brief update() for a caller that already holds a grid key and fixed size
     *
     * @param key Price key on this book's grid (must be > 0)
     * @param size_fixed Venue's new fixed-point size (<= 0 removes it)
     */
    ErrorCode update_key(int64_t key, int64_t size_fixed, bool is_bid, Venue venue);

    /**
     * @brief Remove a venue's contribution from every level
     *
     * Levels left without contributors are removed. Other venues'
     * contributions are untouched.
     *
     * @param venue Venue to wipe
     * @return size_t Number of (side, level) contributions removed
     *
     * @note Thread-safe (write lock)
     */
    size_t clear_venue(Venue venue);

    /**
     * @brief Atomically replace a venue's whole contribution
     *
     * Equivalent to clear_venue() followed by update() for every level,
     * performed under one write lock so readers never see a half-seeded
     * venue. Validation happens before anything is touched: on error the
     * venue's previous contribution is left intact.
     *
     * Levels that quantize to the same grid price are summed: they are
     * distinct venue levels that collapse onto one aggregated level.
     *
     * @param venue Venue to re-seed
     * @param bids Normalized bid levels
     * @param asks Normalized ask levels
     * @return ErrorCode OK, INVALID_PRICE, INVALID_SIZE or UNKNOWN_VENUE
     */
    ErrorCode replace_venue(Venue venue,
                            const std::vector<PriceSize>& bids,
                            const std::vector<PriceSize>& asks);

    /**
     * @brief Grid key -> fixed-point size for one side
     */
    using KeyedSizes = std::map<int64_t, int64_t>;

    /**
     * @brief replace_venue() for already quantized and summed levels
     */
    ErrorCode replace_venue_keys(Venue venue, const KeyedSizes& bids, const KeyedSizes& asks);

    /**
     * @brief Get top n aggregated levels per side
     *
     * @param n Max levels per side; 0 returns empty sequences
     * @return AggregatedDepth Bids descending, asks ascending, with sources
     *
     * @note Thread-safe (read lock)
     */
    AggregatedDepth get_depth_with_prices(size_t n) const;

    std::optional<AggregatedDepthLevel> best_bid() const;
    std::optional<AggregatedDepthLevel> best_ask() const;
    std::optional<std::pair<double, double>> best_bid_ask_prices() const;
    std::optional<double> get_spread() const;
    std::optional<double> get_mid_price() const;

    /**
     * @brief Get one venue's contribution at a level
     *
     * @return double Size, 0.0 if the venue does not quote the level
     */
    double volume_from_venue(double price, Side side, Venue venue) const;

    /**
     * @brief Get all contributions at a level
     *
     * @return Contributions in venue order, empty if no such level
     */
    std::vector<VenueContribution> sources_at(double price, Side side) const;

    /**
     * @brief Check whether the aggregate is crossed
     *
     * @return Observation if best bid >= best ask, std::nullopt otherwise
     */
    std::optional<CrossedBookObservation> check_crossed() const;

    /**
     * @brief Set crossed book callback
     *
     * @param callback Callback function (may be empty to disable)
     *
     * @warning Callback must not call back into mutating methods of this book
     */
    void set_crossed_callback(CrossedCallback callback);

    /**
     * @brief Number of venues with at least one contribution
     */
    size_t venue_count() const;

    size_t level_count(Side side) const;
    bool contains_venue(Venue venue) const;

    /**
     * @brief Verify that every level's total equals its contributions' sum
     *
     * @return true if the invariant holds for every level on both sides
     */
    bool totals_consistent() const;

    /**
     * @brief Number of transitions into the crossed state observed
     */
    uint64_t crossed_events() const;

    /**
     * @brief Remove all levels from all venues
     */
    void clear();

    int precision() const { return grid_.precision(); }
    const PriceGrid& grid() const { return grid_; }

private:
    /**
     * @brief One aggregated price level
     */
    struct Level {
        std::map<Venue, int64_t> contributions;  ///< venue -> fixed size
        int64_t total{0};                        ///< Running sum of contributions
    };

    /**
     * @brief Keys a venue currently contributes to
     */
    struct VenueIndex {
        std::set<int64_t> bids;
        std::set<int64_t> asks;

        bool empty() const { return bids.empty() && asks.empty(); }
    };

    using BidLevels = std::map<int64_t, Level, std::greater<int64_t>>;
    using AskLevels = std::map<int64_t, Level>;
    /**
     * @brief Sum of every other venue's size at a level
     */
    template<typename LevelMap>
    static int64_t others_at(const LevelMap& levels, int64_t key, Venue venue);

    /**
     * @brief Check that a contribution keeps the level total within int64_t
     */
    template<typename LevelMap>
    static bool fits(const LevelMap& levels, const KeyedSizes& sizes, Venue venue);

    /**
     * @return false (nothing changed) if the level total would overflow
     */
    template<typename LevelMap>
    static bool set_contribution(LevelMap& levels, std::set<int64_t>& keys,
                                 int64_t key, Venue venue, int64_t size_fixed);

    template<typename LevelMap>
    static size_t remove_venue_keys(LevelMap& levels, const std::set<int64_t>& keys,
                                    Venue venue);

    template<typename LevelMap>
    static bool side_consistent(const LevelMap& levels);

    AggregatedDepthLevel make_level(int64_t key, const Level& level) const;

    ErrorCode quantize_side(const std::vector<PriceSize>& levels, KeyedSizes& out) const;

    size_t clear_venue_locked(Venue venue);
    std::optional<CrossedBookObservation> check_crossed_locked() const;

    /**
     * @brief Track crossed state after a mutation
     *
     * Must be called with the write lock held. Returns the observation to
     * publish if this mutation moved the book into the crossed state.
     */
    std::optional<CrossedBookObservation> refresh_crossed_locked();

    void publish(std::unique_lock<std::shared_mutex>& lock,
                 std::optional<CrossedBookObservation> observation);

    PriceGrid grid_;                       ///< Common grid
    mutable std::shared_mutex mutex_;      ///< Protects everything below
    BidLevels bids_;                       ///< Aggregated bids
    AskLevels asks_;                       ///< Aggregated asks
    std::map<Venue, VenueIndex> venues_;   ///< Per-venue key index
    bool crossed_{false};                  ///< Crossed after last mutation
    uint64_t crossed_events_{0};           ///< Transitions into crossed state
    CrossedCallback crossed_callback_;     ///< Observation callback
};

} // namespace aggbook
