/**
 * @file simulated_feed.cpp
 * @brief Synthetic venue feed implementation
 */

#include "feed/simulated_feed.hpp"
#include "feed/level_parser.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iterator>
#include <string>

namespace aggbook {

SimulatedVenueFeed::SimulatedVenueFeed(BookManager& manager, Venue venue,
                                       const SimulatedFeedConfig& config)
    : manager_(manager)
    , venue_(venue)
    , config_(config)
    , gen_(config.seed != 0 ? config.seed : std::random_device{}())
    , walk_dist_(-0.3, 0.3)
    , size_dist_(0.1, 5.0)
    , unit_dist_(0.0, 1.0) {
    if (config_.level_spacing <= 0.0) {
        config_.level_spacing = 1.0;
    }
    if (config_.quote_rate <= 0.0) {
        config_.quote_rate = 1.0;
    }
    if (config_.snapshot_depth == 0) {
        config_.snapshot_depth = 1;
    }
    mid_ticks_ = config_.base_price / config_.quote_rate / config_.level_spacing;
}

SimulatedVenueFeed::~SimulatedVenueFeed() {
    stop();
}

void SimulatedVenueFeed::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    worker_ = std::thread(&SimulatedVenueFeed::run, this);
    spdlog::info("{} feed started ({} updates/sec)", venue_to_string(venue_),
                 config_.updates_per_sec);
}

void SimulatedVenueFeed::stop() {
    running_.store(false, std::memory_order_release);
    if (worker_.joinable()) {
        worker_.join();
        spdlog::info("{} feed stopped after {} updates, {} snapshots",
                     venue_to_string(venue_), updates_sent(), snapshots_sent());
    }
}

double SimulatedVenueFeed::tick_to_price(int64_t tick) const {
    double scale = std::pow(10.0, config_.precision);
    return std::round(static_cast<double>(tick) * config_.level_spacing * scale) / scale;
}

ErrorCode SimulatedVenueFeed::publish_snapshot() {
    bids_.clear();
    asks_.clear();

    // Venues deliver snapshots as decimal strings
    std::vector<std::pair<std::string, std::string>> raw_bids;
    std::vector<std::pair<std::string, std::string>> raw_asks;

    int64_t best_bid = static_cast<int64_t>(std::ceil(mid_ticks_)) - 1;
    int64_t best_ask = static_cast<int64_t>(std::floor(mid_ticks_)) + 1;

    for (size_t i = 0; i < config_.snapshot_depth; ++i) {
        int64_t bid_tick = best_bid - static_cast<int64_t>(i);
        int64_t ask_tick = best_ask + static_cast<int64_t>(i);
        if (bid_tick > 0) {
            double size = size_dist_(gen_);
            bids_[bid_tick] = size;
            raw_bids.emplace_back(fmt::format("{:.{}f}", tick_to_price(bid_tick), config_.precision),
                                  fmt::format("{:.8f}", size));
        }
        double size = size_dist_(gen_);
        asks_[ask_tick] = size;
        raw_asks.emplace_back(fmt::format("{:.{}f}", tick_to_price(ask_tick), config_.precision),
                              fmt::format("{:.8f}", size));
    }

    ParsedLevels bids = parse_price_levels(raw_bids);
    ParsedLevels asks = parse_price_levels(raw_asks);

    ErrorCode result = manager_.apply_snapshot(venue_, bids.levels, asks.levels);
    if (result == ErrorCode::OK || result == ErrorCode::RATE_STALE) {
        snapshots_sent_.fetch_add(1, std::memory_order_relaxed);
    } else {
        errors_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("{} snapshot rejected: {}", venue_to_string(venue_), error_code_to_string(result));
    }
    return result;
}

ErrorCode SimulatedVenueFeed::send(int64_t tick, double size, bool is_bid) {
    ErrorCode result = manager_.update_orderbook(venue_, tick_to_price(tick), size, is_bid);
    switch (result) {
        case ErrorCode::OK:
        case ErrorCode::RATE_STALE:
            updates_sent_.fetch_add(1, std::memory_order_relaxed);
            break;
        default:
            errors_.fetch_add(1, std::memory_order_relaxed);
            spdlog::debug("{} diff rejected: {}", venue_to_string(venue_), error_code_to_string(result));
            break;
    }
    return result;
}

ErrorCode SimulatedVenueFeed::step() {
    mid_ticks_ += walk_dist_(gen_);
    if (mid_ticks_ < 2.0) {
        mid_ticks_ = 2.0;
    }

    ErrorCode result = ErrorCode::OK;

    // Drop levels the new mid has crossed
    while (!bids_.empty() && static_cast<double>(bids_.rbegin()->first) >= mid_ticks_) {
        result = send(bids_.rbegin()->first, 0.0, true);
        bids_.erase(std::prev(bids_.end()));
    }
    while (!asks_.empty() && static_cast<double>(asks_.begin()->first) <= mid_ticks_) {
        result = send(asks_.begin()->first, 0.0, false);
        asks_.erase(asks_.begin());
    }

    bool is_bid = unit_dist_(gen_) < 0.5;
    auto offset = static_cast<int64_t>(unit_dist_(gen_) * static_cast<double>(config_.snapshot_depth));
    auto& side = is_bid ? bids_ : asks_;
    int64_t tick = is_bid ? static_cast<int64_t>(std::ceil(mid_ticks_)) - 1 - offset
                          : static_cast<int64_t>(std::floor(mid_ticks_)) + 1 + offset;
    if (tick <= 0) {
        return result;
    }

    auto it = side.find(tick);
    if (it != side.end() && unit_dist_(gen_) < 0.15) {
        side.erase(it);
        result = send(tick, 0.0, is_bid);
    } else {
        double size = size_dist_(gen_);
        side[tick] = size;
        result = send(tick, size, is_bid);
    }

    // Keep the feed's own book bounded as the mid wanders
    while (side.size() > 2 * config_.snapshot_depth) {
        auto far = is_bid ? side.begin() : std::prev(side.end());
        int64_t far_tick = far->first;
        side.erase(far);
        result = send(far_tick, 0.0, is_bid);
    }

    return result;
}

ErrorCode SimulatedVenueFeed::reconnect() {
    spdlog::warn("{} simulated disconnect, resyncing", venue_to_string(venue_));
    ErrorCode result = manager_.resync_venue(venue_);
    if (result != ErrorCode::OK) {
        errors_.fetch_add(1, std::memory_order_relaxed);
        return result;
    }
    return publish_snapshot();
}

void SimulatedVenueFeed::run() {
    using Clock = std::chrono::steady_clock;

    ErrorCode initial = publish_snapshot();
    if (initial != ErrorCode::OK && initial != ErrorCode::RATE_STALE) {
        spdlog::error("{} initial snapshot failed: {}", venue_to_string(venue_),
                      error_code_to_string(initial));
    }

    auto interval = std::chrono::microseconds(
        1000000 / std::max<uint32_t>(config_.updates_per_sec, 1));
    auto next_update = Clock::now();
    auto last_disconnect = Clock::now();

    while (running_.load(std::memory_order_acquire)) {
        auto now = Clock::now();

        if (config_.disconnect_interval_sec > 0 &&
            now - last_disconnect >= std::chrono::seconds(config_.disconnect_interval_sec)) {
            ErrorCode result = reconnect();
            if (result != ErrorCode::OK && result != ErrorCode::RATE_STALE) {
                spdlog::error("{} resync failed: {}", venue_to_string(venue_),
                              error_code_to_string(result));
            }
            last_disconnect = now;
        }

        if (step() == ErrorCode::INVALID_STATE) {
            // Resynced from elsewhere; the next step retries if this fails too
            ErrorCode result = publish_snapshot();
            spdlog::debug("{} re-snapshot after resync: {}", venue_to_string(venue_),
                          error_code_to_string(result));
        }

        next_update += interval;
        std::this_thread::sleep_until(next_update);
    }
}

} // namespace aggbook
