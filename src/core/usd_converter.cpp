/**
 * @file usd_converter.cpp
 * @brief USD conversion cache implementation
 */

#include "core/usd_converter.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <mutex>

namespace aggbook {

UsdConverter::UsdConverter(uint64_t ttl_ns, Clock clock)
    : ttl_ns_(ttl_ns)
    , clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = get_monotonic_ns;
    }
}

std::string UsdConverter::normalize(const std::string& currency) {
    std::string out = currency;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

bool UsdConverter::is_base(const std::string& currency) {
    return normalize(currency) == BASE_CURRENCY;
}

bool UsdConverter::is_fresh(const CachedRate& cached, uint64_t now) const {
    // A clock reading before the refresh counts as age 0
    uint64_t age = now > cached.refreshed_ns ? now - cached.refreshed_ns : 0;
    return age < ttl_ns_;
}

ErrorCode UsdConverter::update_rate(const std::string& currency, double usd_rate) {
    if (!std::isfinite(usd_rate) || usd_rate <= 0.0) {
        spdlog::warn("UsdConverter: Rejected rate {} for {}", usd_rate, currency);
        return ErrorCode::INVALID_PRICE;
    }

    std::string key = normalize(currency);
    if (key == BASE_CURRENCY) {
        return usd_rate == 1.0 ? ErrorCode::OK : ErrorCode::INVALID_PRICE;
    }

    uint64_t now = clock_();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    rates_[key] = CachedRate{usd_rate, now};

    spdlog::debug("UsdConverter: {} = {} USD", key, usd_rate);
    return ErrorCode::OK;
}

UsdQuote UsdConverter::convert(const std::string& currency, double amount) const {
    UsdQuote quote;

    if (!std::isfinite(amount)) {
        quote.error = ErrorCode::INVALID_PRICE;
        return quote;
    }

    auto rate = get_rate(currency);
    if (!rate) {
        quote.error = ErrorCode::RATE_STALE;
        return quote;
    }

    quote.error = ErrorCode::OK;
    quote.rate = *rate;
    quote.usd_value = amount * *rate;
    return quote;
}

std::optional<double> UsdConverter::get_rate(const std::string& currency) const {
    std::string key = normalize(currency);
    if (key == BASE_CURRENCY) {
        return 1.0;
    }

    uint64_t now = clock_();

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = rates_.find(key);
    if (it == rates_.end() || !is_fresh(it->second, now)) {
        return std::nullopt;
    }
    return it->second.rate;
}

bool UsdConverter::needs_refresh(const std::string& currency) const {
    return !get_rate(currency).has_value();
}

std::optional<uint64_t> UsdConverter::last_refreshed_ns(const std::string& currency) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = rates_.find(normalize(currency));
    if (it == rates_.end()) {
        return std::nullopt;
    }
    return it->second.refreshed_ns;
}

std::vector<std::string> UsdConverter::currencies() const {
    std::vector<std::string> result;

    std::shared_lock<std::shared_mutex> lock(mutex_);
    result.reserve(rates_.size());
    for (const auto& [currency, cached] : rates_) {
        result.push_back(currency);
    }
    std::sort(result.begin(), result.end());

    return result;
}

} // namespace aggbook
