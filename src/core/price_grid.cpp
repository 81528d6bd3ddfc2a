/**
 * @file price_grid.cpp
 * @brief Price grid implementation
 */

#include "core/price_grid.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <string>

namespace aggbook {

PriceGrid::PriceGrid(int precision)
    : precision_(precision)
    , scale_(1) {
    if (!is_valid_precision(precision)) {
        throw InvalidPriceError("PriceGrid: precision " + std::to_string(precision) +
                                " outside [0, " + std::to_string(MAX_PRECISION) + "]");
    }
    for (int i = 0; i < precision_; ++i) {
        scale_ *= 10;
    }
}

std::optional<int64_t> PriceGrid::quantize(double price) const {
    if (!std::isfinite(price) || price <= 0.0) {
        return std::nullopt;
    }

    double scaled = price * static_cast<double>(scale_);

    // 2^63 is exactly representable; anything at or above it overflows llround
    if (scaled >= 9223372036854775808.0) {
        return std::nullopt;
    }

    int64_t key = static_cast<int64_t>(std::llround(scaled));
    if (key <= 0) {
        return std::nullopt;
    }

    return key;
}

} // namespace aggbook
