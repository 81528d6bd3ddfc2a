/**
 * @file book_manager.cpp
 * @brief Book manager implementation
 */

#include "core/book_manager.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <limits>

namespace aggbook {

namespace {

std::optional<double> level_price(const std::optional<DepthLevel>& level) {
    if (!level) {
        return std::nullopt;
    }
    return level->price;
}

} // namespace

BookManager::BookManager(const AggregatorConfig& config, UsdConverter::Clock clock)
    : config_(config)
    , converter_(ms_to_ns(config.usd_rate_ttl_ms), std::move(clock))
    , aggregated_(config.price_precision) {

    aggregated_.set_crossed_callback([this](const CrossedBookObservation& observation) {
        metrics_.increment_crossed();

        AggregatedBook::CrossedCallback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = crossed_callback_;
        }
        if (callback) {
            callback(observation);
        }
    });

    spdlog::info("BookManager: Created (precision={}, aggregation_depth={}, rate_ttl={}ms)",
                 config_.price_precision, config_.aggregation_depth, config_.usd_rate_ttl_ms);
}

BookManager::EntryPtr BookManager::find_entry(Venue venue) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    auto it = venues_.find(venue);
    return it == venues_.end() ? nullptr : it->second;
}

std::vector<std::pair<Venue, BookManager::EntryPtr>> BookManager::snapshot_entries() const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    return std::vector<std::pair<Venue, EntryPtr>>(venues_.begin(), venues_.end());
}

ErrorCode BookManager::add_venue(Venue venue, int precision, const std::string& quote_currency) {
    if (venue == Venue::UNKNOWN) {
        spdlog::warn("BookManager: Cannot register Venue::UNKNOWN");
        return ErrorCode::UNKNOWN_VENUE;
    }
    if (!PriceGrid::is_valid_precision(precision)) {
        spdlog::warn("BookManager: Invalid precision {} for {}", precision, venue_to_string(venue));
        return ErrorCode::INVALID_PRICE;
    }

    std::string currency = quote_currency.empty()
        ? std::string(UsdConverter::BASE_CURRENCY)
        : UsdConverter::normalize(quote_currency);

    std::unique_lock<std::shared_mutex> lock(registry_mutex_);

    if (venues_.count(venue) > 0) {
        spdlog::warn("BookManager: {} already registered", venue_to_string(venue));
        return ErrorCode::DUPLICATE_VENUE;
    }

    venues_[venue] = std::make_shared<VenueEntry>(precision, currency);

    spdlog::info("BookManager: Registered {} (precision={}, quote={})",
                 venue_to_string(venue), precision, currency);
    return ErrorCode::OK;
}

ErrorCode BookManager::remove_venue(Venue venue) {
    // Wipe under the registry lock so a concurrent re-registration cannot
    // be cleared by this removal
    std::unique_lock<std::shared_mutex> lock(registry_mutex_);

    auto it = venues_.find(venue);
    if (it == venues_.end()) {
        return ErrorCode::UNKNOWN_VENUE;
    }

    EntryPtr entry = it->second;
    {
        std::lock_guard<std::mutex> writer(entry->writer_mutex);
        entry->state.store(VenueState::UNREGISTERED);
        aggregated_.clear_venue(venue);
    }
    venues_.erase(it);

    spdlog::info("BookManager: Removed {}", venue_to_string(venue));
    return ErrorCode::OK;
}

std::optional<double> BookManager::usd_rate(const VenueEntry& entry) const {
    if (UsdConverter::is_base(entry.quote_currency)) {
        return 1.0;
    }
    return converter_.get_rate(entry.quote_currency);
}

std::optional<int64_t> BookManager::aggregate_key(const VenueEntry& entry, int64_t venue_key,
                                                  double rate) const {
    return aggregated_.grid().quantize(entry.book.grid().to_price(venue_key) * rate);
}

ErrorCode BookManager::venue_total_at(const VenueEntry& entry, int64_t agg_key, double rate,
                                      Side side, int64_t& total) const {
    // Venue keys whose converted price rounds to agg_key, widened by one key
    // each way; the exact membership test below settles the edges
    double venue_scale = static_cast<double>(entry.book.grid().scale());
    double agg_scale = static_cast<double>(aggregated_.grid().scale());
    double low = (static_cast<double>(agg_key) - 0.5) / agg_scale / rate * venue_scale;
    double high = (static_cast<double>(agg_key) + 0.5) / agg_scale / rate * venue_scale;
    int64_t low_key = std::max<int64_t>(1, static_cast<int64_t>(std::floor(low)) - 1);
    int64_t high_key = static_cast<int64_t>(std::ceil(high)) + 1;

    total = 0;
    for (const auto& [venue_key, size_fixed] :
         entry.book.get_keyed_levels_between(side, low_key, high_key)) {
        if (aggregate_key(entry, venue_key, rate) != agg_key) {
            continue;
        }
        if (size_fixed > std::numeric_limits<int64_t>::max() - total) {
            return ErrorCode::INVALID_SIZE;
        }
        total += size_fixed;
    }
    return ErrorCode::OK;
}

ErrorCode BookManager::seed_aggregate(Venue venue, VenueEntry& entry, size_t depth) {
    auto rate = usd_rate(entry);

    if (!rate) {
        aggregated_.clear_venue(venue);
        if (!entry.aggregate_pending) {
            spdlog::warn("BookManager: {} rate stale, {} removed from aggregate",
                         entry.quote_currency, venue_to_string(venue));
        }
        entry.aggregate_pending = true;
        metrics_.increment_stale_rates();
        return ErrorCode::RATE_STALE;
    }

    size_t n = depth == 0 ? std::numeric_limits<size_t>::max() : depth;
    size_t skipped = 0;
    bool overflow = false;

    auto fold = [&](Side side, AggregatedBook::KeyedSizes& out) {
        for (const auto& [venue_key, size_fixed] : entry.book.get_keyed_levels(side, n)) {
            auto agg_key = aggregate_key(entry, venue_key, *rate);
            if (!agg_key) {
                ++skipped;
                continue;
            }
            int64_t& slot = out[*agg_key];
            if (size_fixed > std::numeric_limits<int64_t>::max() - slot) {
                overflow = true;
                return;
            }
            slot += size_fixed;
        }
    };

    AggregatedBook::KeyedSizes bids;
    AggregatedBook::KeyedSizes asks;
    fold(Side::BID, bids);
    fold(Side::ASK, asks);

    if (skipped > 0) {
        spdlog::debug("BookManager: {} levels of {} not representable on aggregate grid",
                      skipped, venue_to_string(venue));
    }

    ErrorCode err = overflow ? ErrorCode::INVALID_SIZE
                             : aggregated_.replace_venue_keys(venue, bids, asks);
    if (err != ErrorCode::OK) {
        aggregated_.clear_venue(venue);
        entry.aggregate_pending = true;
        spdlog::error("BookManager: Failed to seed {} into aggregate: {}",
                      venue_to_string(venue), error_code_to_string(err));
        return err;
    }

    entry.aggregate_pending = false;
    return ErrorCode::OK;
}

void BookManager::record_rejection(VenueEntry& entry) {
    metrics_.increment_rejections();

    std::lock_guard<std::mutex> lock(entry.metrics_mutex);
    ++entry.metrics.rejected_updates;
}

void BookManager::record_update(VenueEntry& entry, uint64_t latency_ns) {
    metrics_.record_update_latency_ns(latency_ns);
    metrics_.increment_updates();

    auto bid = level_price(entry.book.best_bid());
    auto ask = level_price(entry.book.best_ask());

    std::lock_guard<std::mutex> lock(entry.metrics_mutex);
    entry.metrics.update_latency(latency_ns);
    entry.metrics.update_prices(bid, ask);
    entry.metrics.last_update_ns = get_timestamp_ns();
}

ErrorCode BookManager::apply_snapshot(Venue venue,
                                      const std::vector<PriceSize>& bids,
                                      const std::vector<PriceSize>& asks) {
    uint64_t start = get_monotonic_ns();

    auto entry = find_entry(venue);
    if (!entry) {
        spdlog::warn("BookManager: Snapshot for unregistered venue {}", venue_to_string(venue));
        metrics_.increment_rejections();
        return ErrorCode::UNKNOWN_VENUE;
    }

    std::lock_guard<std::mutex> writer(entry->writer_mutex);

    if (entry->state.load() == VenueState::UNREGISTERED) {
        return ErrorCode::UNKNOWN_VENUE;
    }

    ErrorCode err = entry->book.apply_snapshot(bids, asks);
    if (err != ErrorCode::OK) {
        spdlog::warn("BookManager: Snapshot for {} rejected: {}",
                     venue_to_string(venue), error_code_to_string(err));
        record_rejection(*entry);
        return err;
    }

    if (entry->state.load() == VenueState::REGISTERED) {
        entry->state.store(VenueState::SNAPSHOTTED);
    }

    ErrorCode result = seed_aggregate(venue, *entry, config_.aggregation_depth);

    uint64_t latency_ns = get_monotonic_ns() - start;
    metrics_.record_snapshot_latency_ns(latency_ns);
    metrics_.increment_snapshots();

    auto bid = level_price(entry->book.best_bid());
    auto ask = level_price(entry->book.best_ask());
    {
        std::lock_guard<std::mutex> lock(entry->metrics_mutex);
        ++entry->metrics.snapshots_applied;
        if (result == ErrorCode::RATE_STALE) {
            ++entry->metrics.stale_rate_updates;
        }
        entry->metrics.update_prices(bid, ask);
        entry->metrics.last_update_ns = get_timestamp_ns();
    }

    spdlog::info("BookManager: Snapshot for {} installed ({} bids, {} asks)",
                 venue_to_string(venue), entry->book.bid_depth(), entry->book.ask_depth());
    return result;
}

ErrorCode BookManager::update_orderbook(Venue venue, double price, double size, bool is_bid) {
    uint64_t start = get_monotonic_ns();

    auto entry = find_entry(venue);
    if (!entry) {
        spdlog::warn("BookManager: Update for unregistered venue {}", venue_to_string(venue));
        metrics_.increment_rejections();
        return ErrorCode::UNKNOWN_VENUE;
    }

    std::lock_guard<std::mutex> writer(entry->writer_mutex);

    VenueState state = entry->state.load();
    if (state == VenueState::UNREGISTERED) {
        return ErrorCode::UNKNOWN_VENUE;
    }
    if (state == VenueState::REGISTERED) {
        spdlog::debug("BookManager: Update for {} before snapshot", venue_to_string(venue));
        record_rejection(*entry);
        return ErrorCode::INVALID_STATE;
    }

    // Validate against both grids before touching either view
    if (!is_valid_size(size)) {
        record_rejection(*entry);
        return ErrorCode::INVALID_SIZE;
    }

    auto venue_key = entry->book.grid().quantize(price);
    if (!venue_key) {
        record_rejection(*entry);
        return ErrorCode::INVALID_PRICE;
    }

    Side side = is_bid ? Side::BID : Side::ASK;
    std::optional<double> rate;
    std::optional<int64_t> agg_key;
    if (!entry->aggregate_pending) {
        rate = usd_rate(*entry);
        if (rate) {
            agg_key = aggregate_key(*entry, *venue_key, *rate);
            if (!agg_key) {
                record_rejection(*entry);
                return ErrorCode::INVALID_PRICE;
            }
        }
    }

    int64_t previous = entry->book.get_fixed_size_at(*venue_key, side);
    ErrorCode err = entry->book.update(price, size, is_bid);
    if (err != ErrorCode::OK) {
        record_rejection(*entry);
        return err;
    }

    ErrorCode result = ErrorCode::OK;

    if (entry->aggregate_pending) {
        result = seed_aggregate(venue, *entry, config_.aggregation_depth);
    } else if (agg_key) {
        int64_t total = 0;
        result = venue_total_at(*entry, *agg_key, *rate, side, total);
        if (result == ErrorCode::OK) {
            result = aggregated_.update_key(*agg_key, total, is_bid, venue);
        }
    } else {
        aggregated_.clear_venue(venue);
        entry->aggregate_pending = true;
        metrics_.increment_stale_rates();
        spdlog::warn("BookManager: {} rate stale, {} removed from aggregate",
                     entry->quote_currency, venue_to_string(venue));
        result = ErrorCode::RATE_STALE;
    }

    if (result == ErrorCode::INVALID_SIZE) {
        // The aggregate refused the level; undo it so both views agree
        entry->book.set_fixed_size(*venue_key, previous, side);
        record_rejection(*entry);
        return result;
    }

    if (state == VenueState::SNAPSHOTTED) {
        entry->state.store(VenueState::LIVE);
    }

    if (result == ErrorCode::RATE_STALE) {
        std::lock_guard<std::mutex> lock(entry->metrics_mutex);
        ++entry->metrics.stale_rate_updates;
    }

    record_update(*entry, get_monotonic_ns() - start);
    return result;
}

ErrorCode BookManager::resync_venue(Venue venue) {
    auto entry = find_entry(venue);
    if (!entry) {
        return ErrorCode::UNKNOWN_VENUE;
    }

    std::lock_guard<std::mutex> writer(entry->writer_mutex);

    if (entry->state.load() == VenueState::UNREGISTERED) {
        return ErrorCode::UNKNOWN_VENUE;
    }

    size_t removed = aggregated_.clear_venue(venue);
    entry->book.clear();
    entry->state.store(VenueState::REGISTERED);
    entry->aggregate_pending = false;

    metrics_.increment_resyncs();
    {
        std::lock_guard<std::mutex> lock(entry->metrics_mutex);
        ++entry->metrics.reconnects;
        entry->metrics.update_prices(std::nullopt, std::nullopt);
    }

    spdlog::info("BookManager: Resync {} ({} aggregate levels dropped)",
                 venue_to_string(venue), removed);
    return ErrorCode::OK;
}

ErrorCode BookManager::update_aggregated_orderbook() {
    ErrorCode result = ErrorCode::OK;
    size_t seeded = 0;

    for (auto& [venue, entry] : snapshot_entries()) {
        std::lock_guard<std::mutex> writer(entry->writer_mutex);

        VenueState state = entry->state.load();
        if (state == VenueState::UNREGISTERED) {
            continue;
        }
        if (state == VenueState::REGISTERED) {
            aggregated_.clear_venue(venue);
            continue;
        }

        ErrorCode err = seed_aggregate(venue, *entry, config_.aggregation_depth);
        if (err == ErrorCode::OK) {
            ++seeded;
        } else {
            result = err;
        }
    }

    spdlog::info("BookManager: Aggregate rebuilt from {} venues", seeded);
    return result;
}

ErrorCode BookManager::update_usd_rate(const std::string& currency, double usd_rate) {
    ErrorCode err = converter_.update_rate(currency, usd_rate);
    if (err != ErrorCode::OK) {
        return err;
    }
    if (UsdConverter::is_base(currency)) {
        return ErrorCode::OK;
    }

    std::string normalized = UsdConverter::normalize(currency);
    size_t reseeded = 0;

    for (auto& [venue, entry] : snapshot_entries()) {
        if (entry->quote_currency != normalized) {
            continue;
        }

        std::lock_guard<std::mutex> writer(entry->writer_mutex);

        VenueState state = entry->state.load();
        if (state == VenueState::UNREGISTERED || state == VenueState::REGISTERED) {
            continue;
        }

        if (seed_aggregate(venue, *entry, config_.aggregation_depth) == ErrorCode::OK) {
            ++reseeded;
        }
    }

    spdlog::info("BookManager: {} = {} USD, {} venues re-seeded", normalized, usd_rate, reseeded);
    return ErrorCode::OK;
}

ErrorCode BookManager::update_metrics(Venue venue, uint64_t latency_ns,
                                      std::optional<double> best_bid,
                                      std::optional<double> best_ask) {
    auto entry = find_entry(venue);
    if (!entry) {
        return ErrorCode::UNKNOWN_VENUE;
    }

    std::lock_guard<std::mutex> lock(entry->metrics_mutex);
    entry->metrics.last_update_latency_ns = latency_ns;
    entry->metrics.max_update_latency_ns =
        std::max(entry->metrics.max_update_latency_ns, latency_ns);
    entry->metrics.update_prices(best_bid, best_ask);
    entry->metrics.last_update_ns = get_timestamp_ns();

    return ErrorCode::OK;
}

std::map<Venue, VenueMetrics> BookManager::get_metrics() const {
    std::map<Venue, VenueMetrics> result;

    for (const auto& [venue, entry] : snapshot_entries()) {
        std::lock_guard<std::mutex> lock(entry->metrics_mutex);
        result[venue] = entry->metrics;
    }

    return result;
}

std::optional<VenueMetrics> BookManager::get_venue_metrics(Venue venue) const {
    auto entry = find_entry(venue);
    if (!entry) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(entry->metrics_mutex);
    return entry->metrics;
}

MetricsCollector::Summary BookManager::get_engine_metrics() const {
    return metrics_.get_summary();
}

std::optional<DepthSnapshot> BookManager::get_venue_depth(Venue venue, size_t n) const {
    auto entry = find_entry(venue);
    if (!entry) {
        return std::nullopt;
    }
    return entry->book.get_depth_with_prices(n);
}

AggregatedDepth BookManager::get_aggregated_depth(size_t n) const {
    return aggregated_.get_depth_with_prices(n);
}

VenueState BookManager::get_venue_state(Venue venue) const {
    auto entry = find_entry(venue);
    if (!entry) {
        return VenueState::UNREGISTERED;
    }
    return entry->state.load();
}

bool BookManager::is_aggregate_pending(Venue venue) const {
    auto entry = find_entry(venue);
    if (!entry) {
        return false;
    }

    std::lock_guard<std::mutex> writer(entry->writer_mutex);
    return entry->aggregate_pending;
}

std::optional<std::string> BookManager::get_quote_currency(Venue venue) const {
    auto entry = find_entry(venue);
    if (!entry) {
        return std::nullopt;
    }
    return entry->quote_currency;
}

std::vector<Venue> BookManager::get_venues() const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);

    std::vector<Venue> result;
    result.reserve(venues_.size());
    for (const auto& [venue, entry] : venues_) {
        result.push_back(venue);
    }
    return result;
}

size_t BookManager::venue_count() const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    return venues_.size();
}

void BookManager::set_crossed_callback(AggregatedBook::CrossedCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    crossed_callback_ = std::move(callback);
}

} // namespace aggbook
