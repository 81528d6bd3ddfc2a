/**
 * @file level_parser.hpp
 * @brief Parse venue string price levels into PriceSize
 *
 * Venue REST snapshots and WebSocket diffs carry prices and sizes as decimal
 * strings. Adapters run them through parse_price_levels() before handing
 * them to BookManager.
 *
 * @author Market Data Handler Team
 * @date 2025-01-15
 */

#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace aggbook {

/**
 * @brief Result of parsing a batch of string levels
 */
struct ParsedLevels {
    std::vector<PriceSize> levels;  ///< Successfully parsed levels, input order
    size_t skipped{0};              ///< Entries that did not parse
};

/**
 * @brief Parse one decimal string
 *
 * Accepts the whole string only (no trailing characters); leading and
 * trailing whitespace is ignored.
 *
 * @return Value, or std::nullopt if the string is not a finite number
 */
std::optional<double> parse_decimal(const std::string& text);

/**
 * @brief Parse (price, size) string pairs
 *
 * Entries whose price or size does not parse are skipped and counted.
 * Values are not validated further; quantization rejects non-positive
 * prices later.
 *
 * @code
 * auto parsed = parse_price_levels({{"50000.10", "1.5"}, {"bad", "2"}});
 * // parsed.levels == {(50000.10, 1.5)}, parsed.skipped == 1
 * @endcode
 */
ParsedLevels parse_price_levels(const std::vector<std::pair<std::string, std::string>>& raw);

} // namespace aggbook
