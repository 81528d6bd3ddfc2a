/**
 * @file aggregated_book.cpp
 * @brief Aggregated order book implementation
 */

#include "core/aggregated_book.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <mutex>

namespace aggbook {

AggregatedBook::AggregatedBook(int precision)
    : grid_(precision) {
    spdlog::debug("AggregatedBook: Created with precision {}", precision);
}

template<typename LevelMap>
int64_t AggregatedBook::others_at(const LevelMap& levels, int64_t key, Venue venue) {
    auto level_it = levels.find(key);
    if (level_it == levels.end()) {
        return 0;
    }
    const auto& level = level_it->second;
    auto contrib_it = level.contributions.find(venue);
    return level.total - (contrib_it == level.contributions.end() ? 0 : contrib_it->second);
}

template<typename LevelMap>
bool AggregatedBook::fits(const LevelMap& levels, const KeyedSizes& sizes, Venue venue) {
    for (const auto& [key, size_fixed] : sizes) {
        if (size_fixed > std::numeric_limits<int64_t>::max() - others_at(levels, key, venue)) {
            return false;
        }
    }
    return true;
}

template<typename LevelMap>
bool AggregatedBook::set_contribution(LevelMap& levels, std::set<int64_t>& keys,
                                      int64_t key, Venue venue, int64_t size_fixed) {
    if (size_fixed > 0) {
        int64_t others = others_at(levels, key, venue);
        if (size_fixed > std::numeric_limits<int64_t>::max() - others) {
            return false;
        }
        auto& level = levels[key];
        level.contributions[venue] = size_fixed;
        level.total = others + size_fixed;
        keys.insert(key);
        return true;
    }

    auto level_it = levels.find(key);
    if (level_it == levels.end()) {
        return true;
    }

    auto& level = level_it->second;
    auto contrib_it = level.contributions.find(venue);
    if (contrib_it == level.contributions.end()) {
        return true;
    }

    level.total -= contrib_it->second;
    level.contributions.erase(contrib_it);
    keys.erase(key);

    if (level.contributions.empty()) {
        levels.erase(level_it);
    }
    return true;
}

template<typename LevelMap>
size_t AggregatedBook::remove_venue_keys(LevelMap& levels, const std::set<int64_t>& keys,
                                         Venue venue) {
    size_t removed = 0;

    for (int64_t key : keys) {
        auto level_it = levels.find(key);
        if (level_it == levels.end()) {
            continue;
        }

        auto& level = level_it->second;
        auto contrib_it = level.contributions.find(venue);
        if (contrib_it == level.contributions.end()) {
            continue;
        }

        level.total -= contrib_it->second;
        level.contributions.erase(contrib_it);
        ++removed;

        if (level.contributions.empty()) {
            levels.erase(level_it);
        }
    }

    return removed;
}

template<typename LevelMap>
bool AggregatedBook::side_consistent(const LevelMap& levels) {
    for (const auto& [key, level] : levels) {
        if (level.contributions.empty()) {
            return false;
        }
        int64_t sum = 0;
        for (const auto& [venue, size_fixed] : level.contributions) {
            if (size_fixed <= 0) {
                return false;
            }
            sum += size_fixed;
        }
        if (sum != level.total) {
            return false;
        }
    }
    return true;
}

ErrorCode AggregatedBook::update(double price, double size, bool is_bid, Venue venue) {
    if (venue == Venue::UNKNOWN) {
        return ErrorCode::UNKNOWN_VENUE;
    }
    if (!is_valid_size(size)) {
        return ErrorCode::INVALID_SIZE;
    }

    auto key = grid_.quantize(price);
    if (!key) {
        return ErrorCode::INVALID_PRICE;
    }

    return update_key(*key, size_to_fixed(size), is_bid, venue);
}

ErrorCode AggregatedBook::update_key(int64_t key, int64_t size_fixed, bool is_bid, Venue venue) {
    if (venue == Venue::UNKNOWN) {
        return ErrorCode::UNKNOWN_VENUE;
    }
    if (key <= 0) {
        return ErrorCode::INVALID_PRICE;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto& index = venues_[venue];
    bool applied = is_bid ? set_contribution(bids_, index.bids, key, venue, size_fixed)
                          : set_contribution(asks_, index.asks, key, venue, size_fixed);
    if (index.empty()) {
        venues_.erase(venue);
    }
    if (!applied) {
        spdlog::warn("AggregatedBook: {} size at key {} would overflow the level total",
                     venue_to_string(venue), key);
        return ErrorCode::INVALID_SIZE;
    }

    publish(lock, refresh_crossed_locked());
    return ErrorCode::OK;
}

size_t AggregatedBook::clear_venue_locked(Venue venue) {
    auto it = venues_.find(venue);
    if (it == venues_.end()) {
        return 0;
    }

    size_t removed = remove_venue_keys(bids_, it->second.bids, venue);
    removed += remove_venue_keys(asks_, it->second.asks, venue);
    venues_.erase(it);

    return removed;
}

size_t AggregatedBook::clear_venue(Venue venue) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    size_t removed = clear_venue_locked(venue);
    if (removed > 0) {
        spdlog::debug("AggregatedBook: Cleared {} levels of {}",
                      removed, venue_to_string(venue));
    }

    publish(lock, refresh_crossed_locked());
    return removed;
}

ErrorCode AggregatedBook::quantize_side(const std::vector<PriceSize>& levels,
                                        KeyedSizes& out) const {
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
            continue;
        }

        // Distinct levels on one grid price add up
        int64_t& slot = out[*key];
        if (size_fixed > std::numeric_limits<int64_t>::max() - slot) {
            return ErrorCode::INVALID_SIZE;
        }
        slot += size_fixed;
    }
    return ErrorCode::OK;
}

ErrorCode AggregatedBook::replace_venue(Venue venue,
                                        const std::vector<PriceSize>& bids,
                                        const std::vector<PriceSize>& asks) {
    if (venue == Venue::UNKNOWN) {
        return ErrorCode::UNKNOWN_VENUE;
    }

    KeyedSizes new_bids;
    KeyedSizes new_asks;

    ErrorCode err = quantize_side(bids, new_bids);
    if (err == ErrorCode::OK) {
        err = quantize_side(asks, new_asks);
    }
    if (err != ErrorCode::OK) {
        return err;
    }

    return replace_venue_keys(venue, new_bids, new_asks);
}

ErrorCode AggregatedBook::replace_venue_keys(Venue venue, const KeyedSizes& bids,
                                             const KeyedSizes& asks) {
    if (venue == Venue::UNKNOWN) {
        return ErrorCode::UNKNOWN_VENUE;
    }
    for (const auto* side : {&bids, &asks}) {
        if (!side->empty() && side->begin()->first <= 0) {
            return ErrorCode::INVALID_PRICE;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    // Checked against the other venues only, so the swap below cannot fail halfway
    if (!fits(bids_, bids, venue) || !fits(asks_, asks, venue)) {
        spdlog::warn("AggregatedBook: Seeding {} would overflow a level total",
                     venue_to_string(venue));
        return ErrorCode::INVALID_SIZE;
    }

    clear_venue_locked(venue);

    VenueIndex index;
    for (const auto& [key, size_fixed] : bids) {
        set_contribution(bids_, index.bids, key, venue, size_fixed);
    }
    for (const auto& [key, size_fixed] : asks) {
        set_contribution(asks_, index.asks, key, venue, size_fixed);
    }
    if (!index.empty()) {
        venues_[venue] = std::move(index);
    }

    spdlog::debug("AggregatedBook: Seeded {} with {} bids, {} asks",
                  venue_to_string(venue), bids.size(), asks.size());

    publish(lock, refresh_crossed_locked());
    return ErrorCode::OK;
}

AggregatedDepthLevel AggregatedBook::make_level(int64_t key, const Level& level) const {
    AggregatedDepthLevel out;
    out.price = grid_.to_price(key);
    out.total_size = size_from_fixed(level.total);
    out.sources.reserve(level.contributions.size());
    for (const auto& [venue, size_fixed] : level.contributions) {
        out.sources.emplace_back(venue, size_from_fixed(size_fixed));
    }
    return out;
}

AggregatedDepth AggregatedBook::get_depth_with_prices(size_t n) const {
    AggregatedDepth depth;

    std::shared_lock<std::shared_mutex> lock(mutex_);

    depth.bids.reserve(std::min(n, bids_.size()));
    for (const auto& [key, level] : bids_) {
        if (depth.bids.size() >= n) {
            break;
        }
        depth.bids.push_back(make_level(key, level));
    }

    depth.asks.reserve(std::min(n, asks_.size()));
    for (const auto& [key, level] : asks_) {
        if (depth.asks.size() >= n) {
            break;
        }
        depth.asks.push_back(make_level(key, level));
    }

    depth.timestamp_ns = get_timestamp_ns();
    return depth;
}

std::optional<AggregatedDepthLevel> AggregatedBook::best_bid() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (bids_.empty()) {
        return std::nullopt;
    }
    return make_level(bids_.begin()->first, bids_.begin()->second);
}

std::optional<AggregatedDepthLevel> AggregatedBook::best_ask() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (asks_.empty()) {
        return std::nullopt;
    }
    return make_level(asks_.begin()->first, asks_.begin()->second);
}

std::optional<std::pair<double, double>> AggregatedBook::best_bid_ask_prices() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (bids_.empty() || asks_.empty()) {
        return std::nullopt;
    }
    return std::make_pair(grid_.to_price(bids_.begin()->first),
                          grid_.to_price(asks_.begin()->first));
}

std::optional<double> AggregatedBook::get_spread() const {
    auto prices = best_bid_ask_prices();
    if (!prices) {
        return std::nullopt;
    }
    return prices->second - prices->first;
}

std::optional<double> AggregatedBook::get_mid_price() const {
    auto prices = best_bid_ask_prices();
    if (!prices) {
        return std::nullopt;
    }
    return (prices->first + prices->second) / 2.0;
}

double AggregatedBook::volume_from_venue(double price, Side side, Venue venue) const {
    auto key = grid_.quantize(price);
    if (!key) {
        return 0.0;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);

    const std::map<Venue, int64_t>* contributions = nullptr;
    if (side == Side::BID) {
        auto it = bids_.find(*key);
        if (it != bids_.end()) {
            contributions = &it->second.contributions;
        }
    } else {
        auto it = asks_.find(*key);
        if (it != asks_.end()) {
            contributions = &it->second.contributions;
        }
    }

    if (!contributions) {
        return 0.0;
    }
    auto it = contributions->find(venue);
    return it == contributions->end() ? 0.0 : size_from_fixed(it->second);
}

std::vector<VenueContribution> AggregatedBook::sources_at(double price, Side side) const {
    auto key = grid_.quantize(price);
    if (!key) {
        return {};
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);

    if (side == Side::BID) {
        auto it = bids_.find(*key);
        if (it != bids_.end()) {
            return make_level(it->first, it->second).sources;
        }
    } else {
        auto it = asks_.find(*key);
        if (it != asks_.end()) {
            return make_level(it->first, it->second).sources;
        }
    }
    return {};
}

std::optional<CrossedBookObservation> AggregatedBook::check_crossed_locked() const {
    if (bids_.empty() || asks_.empty()) {
        return std::nullopt;
    }

    const auto& [bid_key, bid_level] = *bids_.begin();
    const auto& [ask_key, ask_level] = *asks_.begin();

    if (bid_key < ask_key) {
        return std::nullopt;
    }

    CrossedBookObservation observation;
    observation.best_bid = make_level(bid_key, bid_level);
    observation.best_ask = make_level(ask_key, ask_level);
    observation.timestamp_ns = get_timestamp_ns();
    return observation;
}

std::optional<CrossedBookObservation> AggregatedBook::check_crossed() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return check_crossed_locked();
}

std::optional<CrossedBookObservation> AggregatedBook::refresh_crossed_locked() {
    bool crossed = !bids_.empty() && !asks_.empty() &&
                   bids_.begin()->first >= asks_.begin()->first;

    if (!crossed) {
        crossed_ = false;
        return std::nullopt;
    }
    if (crossed_) {
        return std::nullopt;  // Already reported
    }

    crossed_ = true;
    ++crossed_events_;
    return check_crossed_locked();
}

void AggregatedBook::publish(std::unique_lock<std::shared_mutex>& lock,
                             std::optional<CrossedBookObservation> observation) {
    if (!observation) {
        return;
    }

    spdlog::warn("AggregatedBook: Crossed book, bid {:.{}f} >= ask {:.{}f}",
                 observation->best_bid.price, grid_.precision(),
                 observation->best_ask.price, grid_.precision());

    CrossedCallback callback = crossed_callback_;

    // Release lock before callback
    lock.unlock();
    if (callback) {
        callback(*observation);
    }
}

void AggregatedBook::set_crossed_callback(CrossedCallback callback) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    crossed_callback_ = std::move(callback);
}

size_t AggregatedBook::venue_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return venues_.size();
}

size_t AggregatedBook::level_count(Side side) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return side == Side::BID ? bids_.size() : asks_.size();
}

bool AggregatedBook::contains_venue(Venue venue) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return venues_.count(venue) > 0;
}

bool AggregatedBook::totals_consistent() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return side_consistent(bids_) && side_consistent(asks_);
}

uint64_t AggregatedBook::crossed_events() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return crossed_events_;
}

void AggregatedBook::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    bids_.clear();
    asks_.clear();
    venues_.clear();
    crossed_ = false;
}

} // namespace aggbook
