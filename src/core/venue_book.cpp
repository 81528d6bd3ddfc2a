/**
 * @file venue_book.cpp
 * @brief Single-venue order book implementation
 */

#include "core/venue_book.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <mutex>

namespace aggbook {

VenueBook::VenueBook(int precision)
    : grid_(precision) {
}

template<typename MapT>
ErrorCode VenueBook::build_side(const std::vector<PriceSize>& levels, MapT& out) const {
    for (const auto& level : levels) {
        if (!is_valid_size(level.size)) {
            return ErrorCode::INVALID_SIZE;
        }

        auto key = grid_.quantize(level.price);
        if (!key) {
            return ErrorCode::INVALID_PRICE;
        }

        int64_t size_fixed = size_to_fixed(level.size);
        if (size_fixed <= 0) {
            // A zero level in a snapshot is not state; an earlier duplicate is dropped too
            out.erase(*key);
            continue;
        }

        out[*key] = size_fixed;
    }

    return ErrorCode::OK;
}

ErrorCode VenueBook::apply_snapshot(const std::vector<PriceSize>& bids,
                                    const std::vector<PriceSize>& asks) {
    // Build outside the lock so readers are only blocked for the swap
    BidMap new_bids;
    AskMap new_asks;

    ErrorCode err = build_side(bids, new_bids);
    if (err == ErrorCode::OK) {
        err = build_side(asks, new_asks);
    }
    if (err != ErrorCode::OK) {
        spdlog::debug("VenueBook: Snapshot rejected ({}), previous state kept",
                      error_code_to_string(err));
        return err;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    bids_.swap(new_bids);
    asks_.swap(new_asks);
    ++sequence_;
    last_update_ns_ = get_timestamp_ns();

    return ErrorCode::OK;
}

ErrorCode VenueBook::update(double price, double size, bool is_bid) {
    if (!is_valid_size(size)) {
        return ErrorCode::INVALID_SIZE;
    }

    auto key = grid_.quantize(price);
    if (!key) {
        return ErrorCode::INVALID_PRICE;
    }

    int64_t size_fixed = size_to_fixed(size);

    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (is_bid) {
        if (size_fixed > 0) {
            bids_[*key] = size_fixed;
        } else {
            bids_.erase(*key);
        }
    } else {
        if (size_fixed > 0) {
            asks_[*key] = size_fixed;
        } else {
            asks_.erase(*key);
        }
    }

    ++sequence_;
    last_update_ns_ = get_timestamp_ns();

    return ErrorCode::OK;
}

template<typename MapT>
void VenueBook::collect(const MapT& side, size_t n, const PriceGrid& grid,
                        std::vector<DepthLevel>& out) {
    out.reserve(std::min(n, side.size()));
    for (const auto& [key, size_fixed] : side) {
        if (out.size() >= n) {
            break;
        }
        out.emplace_back(grid.to_price(key), size_from_fixed(size_fixed));
    }
}

DepthSnapshot VenueBook::get_depth_with_prices(size_t n) const {
    DepthSnapshot snapshot;

    std::shared_lock<std::shared_mutex> lock(mutex_);
    collect(bids_, n, grid_, snapshot.bids);
    collect(asks_, n, grid_, snapshot.asks);
    snapshot.sequence_number = sequence_;
    snapshot.timestamp_ns = get_timestamp_ns();

    return snapshot;
}

std::optional<DepthLevel> VenueBook::best_bid() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (bids_.empty()) {
        return std::nullopt;
    }
    const auto& [key, size_fixed] = *bids_.begin();
    return DepthLevel(grid_.to_price(key), size_from_fixed(size_fixed));
}

std::optional<DepthLevel> VenueBook::best_ask() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (asks_.empty()) {
        return std::nullopt;
    }
    const auto& [key, size_fixed] = *asks_.begin();
    return DepthLevel(grid_.to_price(key), size_from_fixed(size_fixed));
}

std::optional<std::pair<double, double>> VenueBook::best_bid_ask_prices() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (bids_.empty() || asks_.empty()) {
        return std::nullopt;
    }
    return std::make_pair(grid_.to_price(bids_.begin()->first),
                          grid_.to_price(asks_.begin()->first));
}

std::optional<double> VenueBook::get_spread() const {
    auto prices = best_bid_ask_prices();
    if (!prices) {
        return std::nullopt;
    }
    return prices->second - prices->first;
}

std::optional<double> VenueBook::get_mid_price() const {
    auto prices = best_bid_ask_prices();
    if (!prices) {
        return std::nullopt;
    }
    return (prices->first + prices->second) / 2.0;
}

double VenueBook::get_size_at(double price, Side side) const {
    auto key = grid_.quantize(price);
    if (!key) {
        return 0.0;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (side == Side::BID) {
        auto it = bids_.find(*key);
        return it == bids_.end() ? 0.0 : size_from_fixed(it->second);
    }
    auto it = asks_.find(*key);
    return it == asks_.end() ? 0.0 : size_from_fixed(it->second);
}

std::vector<VenueBook::KeyedLevel> VenueBook::get_keyed_levels(Side side, size_t n) const {
    std::vector<KeyedLevel> out;

    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (side == Side::BID) {
        out.reserve(std::min(n, bids_.size()));
        for (auto it = bids_.begin(); it != bids_.end() && out.size() < n; ++it) {
            out.emplace_back(it->first, it->second);
        }
    } else {
        out.reserve(std::min(n, asks_.size()));
        for (auto it = asks_.begin(); it != asks_.end() && out.size() < n; ++it) {
            out.emplace_back(it->first, it->second);
        }
    }
    return out;
}

std::vector<VenueBook::KeyedLevel> VenueBook::get_keyed_levels_between(Side side, int64_t low_key,
                                                                       int64_t high_key) const {
    std::vector<KeyedLevel> out;
    if (low_key > high_key) {
        return out;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (side == Side::BID) {
        // Descending map: lower_bound finds the first key <= high_key
        for (auto it = bids_.lower_bound(high_key); it != bids_.end() && it->first >= low_key; ++it) {
            out.emplace_back(it->first, it->second);
        }
    } else {
        for (auto it = asks_.lower_bound(low_key); it != asks_.end() && it->first <= high_key; ++it) {
            out.emplace_back(it->first, it->second);
        }
    }
    return out;
}

int64_t VenueBook::get_fixed_size_at(int64_t key, Side side) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (side == Side::BID) {
        auto it = bids_.find(key);
        return it == bids_.end() ? 0 : it->second;
    }
    auto it = asks_.find(key);
    return it == asks_.end() ? 0 : it->second;
}

void VenueBook::set_fixed_size(int64_t key, int64_t size_fixed, Side side) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (side == Side::BID) {
        if (size_fixed > 0) {
            bids_[key] = size_fixed;
        } else {
            bids_.erase(key);
        }
    } else {
        if (size_fixed > 0) {
            asks_[key] = size_fixed;
        } else {
            asks_.erase(key);
        }
    }
    ++sequence_;
    last_update_ns_ = get_timestamp_ns();
}

size_t VenueBook::bid_depth() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return bids_.size();
}

size_t VenueBook::ask_depth() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return asks_.size();
}

bool VenueBook::empty() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return bids_.empty() && asks_.empty();
}

void VenueBook::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    bids_.clear();
    asks_.clear();
    ++sequence_;
    last_update_ns_ = get_timestamp_ns();
}

uint64_t VenueBook::sequence() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sequence_;
}

uint64_t VenueBook::last_update_ns() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return last_update_ns_;
}

} // namespace aggbook
