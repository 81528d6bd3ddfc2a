/**
 * @file level_parser.cpp
 * @brief String level parsing implementation
 */

#include "feed/level_parser.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace aggbook {

std::optional<double> parse_decimal(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    if (begin == end) {
        return std::nullopt;
    }

    std::string trimmed = text.substr(begin, end - begin);
    char* parse_end = nullptr;
    errno = 0;
    double value = std::strtod(trimmed.c_str(), &parse_end);

    if (parse_end != trimmed.c_str() + trimmed.size() || errno == ERANGE ||
        !std::isfinite(value)) {
        return std::nullopt;
    }

    return value;
}

ParsedLevels parse_price_levels(const std::vector<std::pair<std::string, std::string>>& raw) {
    ParsedLevels result;
    result.levels.reserve(raw.size());

    for (const auto& [price_text, size_text] : raw) {
        auto price = parse_decimal(price_text);
        auto size = parse_decimal(size_text);
        if (!price || !size) {
            ++result.skipped;
            continue;
        }
        result.levels.emplace_back(*price, *size);
    }

    if (result.skipped > 0) {
        spdlog::warn("parse_price_levels: Skipped {} of {} levels", result.skipped, raw.size());
    }

    return result;
}

} // namespace aggbook
