/**
 * @file price_grid.hpp
 * @brief Fixed-precision price quantization
 *
 * Maps floating prices onto integer keys (price * 10^precision, rounded to
 * nearest) so that prices from venues with different tick sizes compare and
 * merge exactly. Every map in the engine is keyed by these integers.
 *
 * @author Market Data Handler Team
 * @date 2025-01-15
 */

#pragma once

#include <cstdint>
#include <optional>

namespace aggbook {

/**
 * @brief Fixed-precision price grid
 *
 * **Quantization:**
 * - key = llround(price * 10^precision)
 * - Rejected: NaN, infinity, price <= 0, key == 0, key overflow
 *
 * @code
 * PriceGrid grid(2);
 * auto key = grid.quantize(100.004);   // 10000
 * double p = grid.to_price(*key);      // 100.00
 *
 * grid.quantize(-1.0);                 // std::nullopt
 * @endcode
 *
 * @note Immutable after construction, safe to share between threads
 */
class PriceGrid {
public:
    static constexpr int MAX_PRECISION = 12;  ///< Largest supported number of decimals

    /**
     * @brief Construct grid with a fixed number of decimals
     *
     * @param precision Decimal digits, in [0, MAX_PRECISION]
     * @throws InvalidPriceError if precision is out of range
     */
    explicit PriceGrid(int precision);

    /**
     * @brief Quantize a price onto the grid
     *
     * @param price Floating price
     * @return std::optional<int64_t> Grid key, or std::nullopt if the
     *         price is not finite, not positive, rounds to zero, or does
     *         not fit in 64 bits at this precision
     */
    std::optional<int64_t> quantize(double price) const;

    /**
     * @brief Convert a grid key back to a price
     */
    double to_price(int64_t key) const {
        return static_cast<double>(key) / static_cast<double>(scale_);
    }

    int precision() const { return precision_; }

    /**
     * @brief Get 10^precision
     */
    int64_t scale() const { return scale_; }

    /**
     * @brief Get the smallest representable price step
     */
    double tick_size() const { return 1.0 / static_cast<double>(scale_); }

    /**
     * @brief Check whether a precision is supported
     */
    static bool is_valid_precision(int precision) {
        return precision >= 0 && precision <= MAX_PRECISION;
    }

private:
    int precision_;  ///< Decimal digits
    int64_t scale_;  ///< 10^precision
};

} // namespace aggbook
