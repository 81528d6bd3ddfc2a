/**
 * @file venue_book.hpp
 * @brief Single-venue order book fed by snapshots and absolute diffs
 *
 * Holds one venue's current bid/ask state as two ordered maps from
 * quantized price to fixed-point resting size. Populated by apply_snapshot()
 * and mutated afterwards only by update().
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
#include <optional>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace aggbook {

/**
 * @brief Order book for one venue
 *
 * **Invariants:**
 * - Every stored size is strictly positive
 * - Precision is fixed for the book's lifetime
 * - Bids iterate high to low, asks low to high
 *
 * **Update Semantics:**
 * - update() is absolute: it states the new resting size at a price
 * - size <= 0 removes the level (no-op if absent)
 * - apply_snapshot() replaces both sides entirely, all-or-nothing
 *
 * @code
 * VenueBook book(2);
 *
 * book.apply_snapshot({{100.00, 5.0}, {99.50, 2.0}},
 *                     {{100.50, 1.0}});
 *
 * book.update(100.00, 3.0, true);    // bid at 100.00 now 3.0
 * book.update(99.50, 0.0, true);     // removes 99.50
 *
 * auto depth = book.get_depth_with_prices(10);
 * // depth.bids = [(100.00, 3.0)], depth.asks = [(100.50, 1.0)]
 * @endcode
 *
 * @note Thread-safe: concurrent readers, one writer at a time. Callers
 *       still serialize writers per venue so that diff order is preserved.
 */
class VenueBook {
public:
    /**
     * @brief Construct empty book
     *
     * @param precision Quantization decimals, fixed for the book's life
     * @throws InvalidPriceError if precision is out of range
     */
    explicit VenueBook(int precision);

    // Non-copyable
    VenueBook(const VenueBook&) = delete;
    VenueBook& operator=(const VenueBook&) = delete;

    /**
     * @brief Replace the entire book
     *
     * Quantizes every level with the book's precision. Levels with
     * size <= 0 are dropped; when two entries quantize to the same price
     * the later one wins. Applying the same snapshot twice yields the same
     * state.
     *
     * @param bids Bid levels in any order
     * @param asks Ask levels in any order
     * @return ErrorCode OK, INVALID_PRICE or INVALID_SIZE (non-finite or
     *         above MAX_SIZE); on error the previous state is left untouched
     */
    ErrorCode apply_snapshot(const std::vector<PriceSize>& bids,
                             const std::vector<PriceSize>& asks);

    /**
     * @brief Apply one absolute level change
     *
     * @param price Venue price
     * @param size New resting size (<= 0 removes the level)
     * @param is_bid True for bid side
     * @return ErrorCode OK, INVALID_PRICE or INVALID_SIZE
     */
    ErrorCode update(double price, double size, bool is_bid);

    /**
     * @brief Get top n levels per side
     *
     * @param n Max levels per side; 0 returns empty sequences
     * @return DepthSnapshot Bids descending, asks ascending
     */
    DepthSnapshot get_depth_with_prices(size_t n) const;

    std::optional<DepthLevel> best_bid() const;
    std::optional<DepthLevel> best_ask() const;

    /**
     * @brief Get best bid and ask prices
     *
     * @return Pair (bid, ask) if both sides are non-empty
     */
    std::optional<std::pair<double, double>> best_bid_ask_prices() const;

    std::optional<double> get_spread() const;
    std::optional<double> get_mid_price() const;

    /**
     * @brief Get resting size at a price
     *
     * @return double Size, or 0.0 if no level (or price invalid)
     */
    double get_size_at(double price, Side side) const;

    /**
     * @brief (price key, fixed size) pair on this book's grid
     */
    using KeyedLevel = std::pair<int64_t, int64_t>;

    /**
     * @brief Get top n levels of one side as grid keys, best first
     */
    std::vector<KeyedLevel> get_keyed_levels(Side side, size_t n) const;

    /**
     * @brief Get every level of one side with low_key <= key <= high_key
     *
     * Used to fold all venue levels that map onto one coarser price.
     */
    std::vector<KeyedLevel> get_keyed_levels_between(Side side, int64_t low_key,
                                                     int64_t high_key) const;

    int64_t get_fixed_size_at(int64_t key, Side side) const;

    /**
     * @brief Restore a level to a known fixed size (0 removes it)
     *
     * Lets the owner undo an update the aggregate refused.
     */
    void set_fixed_size(int64_t key, int64_t size_fixed, Side side);

    size_t bid_depth() const;
    size_t ask_depth() const;
    bool empty() const;

    /**
     * @brief Remove all levels
     *
     * Used when a venue is resynced; the next apply_snapshot() reseeds it.
     */
    void clear();

    int precision() const { return grid_.precision(); }
    const PriceGrid& grid() const { return grid_; }

    /**
     * @brief Number of mutations applied so far
     */
    uint64_t sequence() const;

    uint64_t last_update_ns() const;

private:
    using BidMap = std::map<int64_t, int64_t, std::greater<int64_t>>;
    using AskMap = std::map<int64_t, int64_t>;

    /**
     * @brief Quantize and insert levels into a side map
     *
     * @return ErrorCode OK or the first validation failure
     */
    template<typename MapT>
    ErrorCode build_side(const std::vector<PriceSize>& levels, MapT& out) const;

    template<typename MapT>
    static void collect(const MapT& side, size_t n, const PriceGrid& grid,
                        std::vector<DepthLevel>& out);

    PriceGrid grid_;                   ///< Quantization grid
    mutable std::shared_mutex mutex_;  ///< Protects bids_, asks_ and counters
    BidMap bids_;                      ///< Price key -> fixed size (descending)
    AskMap asks_;                      ///< Price key -> fixed size (ascending)
    uint64_t sequence_{0};             ///< Mutation counter
    uint64_t last_update_ns_{0};       ///< Last mutation timestamp
};

} // namespace aggbook
