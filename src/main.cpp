/**
 * @file main.cpp
 * @brief Aggregation engine demo
 *
 * Registers the configured venues, drives each with a simulated feed and
 * prints the USD aggregated book with per-venue attribution once a second.
 *
 * Usage:
 *   aggbook_demo [config.yaml]
 *   aggbook_demo --write-example <file>
 *
 * @author Market Data Handler Team
 * @date 2025-01-15
 */

#include "config/configuration_manager.hpp"
#include "core/book_manager.hpp"
#include "feed/simulated_feed.hpp"
#include "utils/logging.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace aggbook;

namespace {

std::atomic<bool> shutdown_requested{false};

void signal_handler(int) {
    shutdown_requested.store(true);
}

void print_separator() {
    std::cout << std::string(96, '=') << '\n';
}

std::string format_sources(const AggregatedDepthLevel& level) {
    std::ostringstream out;
    for (size_t i = 0; i < level.sources.size(); ++i) {
        if (i > 0) {
            out << ' ';
        }
        out << venue_to_key(level.sources[i].venue) << '='
            << std::fixed << std::setprecision(4) << level.sources[i].size;
    }
    return out.str();
}

void print_aggregated_depth(const AggregatedDepth& depth, int precision) {
    std::cout << "\nAggregated Book (USD)\n";
    print_separator();
    std::cout << std::left << std::setw(14) << "Bid Size"
              << std::setw(14) << "Bid Price"
              << std::setw(14) << "Ask Price"
              << std::setw(14) << "Ask Size"
              << "Sources (bid | ask)\n";
    print_separator();

    size_t rows = std::max(depth.bids.size(), depth.asks.size());
    for (size_t i = 0; i < rows; ++i) {
        std::string bid_sources;
        std::string ask_sources;

        if (i < depth.bids.size()) {
            const auto& bid = depth.bids[i];
            std::cout << std::setw(14) << std::fixed << std::setprecision(4) << bid.total_size
                      << std::setw(14) << std::fixed << std::setprecision(precision) << bid.price;
            bid_sources = format_sources(bid);
        } else {
            std::cout << std::setw(28) << " ";
        }

        if (i < depth.asks.size()) {
            const auto& ask = depth.asks[i];
            std::cout << std::setw(14) << std::fixed << std::setprecision(precision) << ask.price
                      << std::setw(14) << std::fixed << std::setprecision(4) << ask.total_size;
            ask_sources = format_sources(ask);
        } else {
            std::cout << std::setw(28) << " ";
        }

        std::cout << bid_sources << " | " << ask_sources << '\n';
    }
    print_separator();
}

void print_metrics(const BookManager& manager) {
    std::cout << "\nVenue Metrics\n";
    print_separator();
    std::cout << std::left << std::setw(16) << "Venue"
              << std::setw(12) << "State"
              << std::setw(10) << "Updates"
              << std::setw(10) << "Stale"
              << std::setw(10) << "Resyncs"
              << std::setw(12) << "Last"
              << std::setw(12) << "Avg"
              << std::setw(12) << "Max" << '\n';
    print_separator();

    for (const auto& entry : manager.get_metrics()) {
        const VenueMetrics& m = entry.second;
        std::cout << std::setw(16) << venue_to_string(entry.first)
                  << std::setw(12) << venue_state_to_string(manager.get_venue_state(entry.first))
                  << std::setw(10) << m.updates_processed
                  << std::setw(10) << m.stale_rate_updates
                  << std::setw(10) << m.reconnects
                  << std::setw(12) << format_duration(m.last_update_latency_ns)
                  << std::setw(12) << format_duration(static_cast<uint64_t>(m.avg_update_latency_ns))
                  << std::setw(12) << format_duration(m.max_update_latency_ns) << '\n';
    }

    auto engine = manager.get_engine_metrics();
    std::cout << "\nEngine: " << engine.updates << " updates, "
              << engine.snapshots << " snapshots, "
              << engine.rejections << " rejected, "
              << engine.crossed_events << " crossed, "
              << "p50 " << format_duration(engine.update_p50_ns) << ", "
              << "p99 " << format_duration(engine.update_p99_ns) << '\n';

    const AggregatedBook& aggregate = manager.get_aggregated_orderbook();
    if (auto spread = aggregate.get_spread()) {
        std::cout << "Spread: " << std::fixed << std::setprecision(aggregate.precision())
                  << *spread << " USD";
        if (auto mid = aggregate.get_mid_price()) {
            std::cout << "  Mid: " << *mid << " USD";
        }
        std::cout << '\n';
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        if (argc >= 3 && std::string(argv[1]) == "--write-example") {
            if (!ConfigurationManager::create_example(argv[2])) {
                std::cerr << "Failed to write " << argv[2] << '\n';
                return 1;
            }
            std::cout << "Wrote example configuration to " << argv[2] << '\n';
            return 0;
        }

        ConfigurationManager config_manager;
        if (argc >= 2 && !config_manager.load(argv[1])) {
            std::cerr << "Failed to load configuration from " << argv[1] << '\n';
            return 1;
        }

        auto errors = config_manager.validate();
        if (!errors.empty()) {
            for (const auto& error : errors) {
                std::cerr << "Config error: " << error << '\n';
            }
            return 1;
        }

        SystemConfig config = config_manager.get_config();
        init_logging(config.logging);

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        BookManager manager(config.aggregator);
        manager.set_crossed_callback([](const CrossedBookObservation& obs) {
            spdlog::info("Aggregate crossed by {:.8f} USD", obs.overlap());
        });

        for (const auto& rate : config.simulation.usd_rates) {
            ErrorCode result = manager.update_usd_rate(rate.first, rate.second);
            if (result != ErrorCode::OK) {
                spdlog::error("Rejected USD rate for {}: {}", rate.first, error_code_to_string(result));
                return 1;
            }
        }

        std::vector<std::unique_ptr<SimulatedVenueFeed>> feeds;
        uint32_t seed = 1;
        for (Venue venue : config_manager.get_enabled_venues()) {
            auto venue_cfg = config_manager.get_venue_config(venue);
            ErrorCode result = manager.add_venue(venue, venue_cfg->precision, venue_cfg->quote_currency);
            if (result != ErrorCode::OK) {
                spdlog::error("Failed to register {}: {}", venue_to_string(venue),
                              error_code_to_string(result));
                return 1;
            }

            SimulatedFeedConfig feed_cfg;
            feed_cfg.base_price = config.simulation.base_price;
            feed_cfg.precision = venue_cfg->precision;
            feed_cfg.level_spacing = 0.5;
            feed_cfg.snapshot_depth = std::min<size_t>(venue_cfg->snapshot_depth, 50);
            feed_cfg.updates_per_sec = config.simulation.updates_per_sec;
            feed_cfg.disconnect_interval_sec = config.simulation.disconnect_interval_sec;
            feed_cfg.seed = seed++;
            if (auto rate = manager.usd_converter().get_rate(venue_cfg->quote_currency)) {
                feed_cfg.quote_rate = *rate;
            }
            feeds.push_back(std::make_unique<SimulatedVenueFeed>(manager, venue, feed_cfg));
        }

        spdlog::info("Aggregating {} venues at precision {}", manager.venue_count(),
                     config.aggregator.price_precision);

        for (auto& feed : feeds) {
            feed->start();
        }

        auto started = std::chrono::steady_clock::now();
        while (!shutdown_requested.load()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));

            // Stand-in for the rate feed: refresh configured rates
            for (const auto& rate : config.simulation.usd_rates) {
                ErrorCode result = manager.update_usd_rate(rate.first, rate.second);
                if (result != ErrorCode::OK) {
                    spdlog::warn("Rate refresh for {} failed: {}", rate.first,
                                 error_code_to_string(result));
                }
            }

            print_aggregated_depth(manager.get_aggregated_depth(config.simulation.print_depth),
                                   config.aggregator.price_precision);
            print_metrics(manager);

            if (config.simulation.duration_sec > 0 &&
                std::chrono::steady_clock::now() - started >=
                    std::chrono::seconds(config.simulation.duration_sec)) {
                break;
            }
        }

        for (auto& feed : feeds) {
            feed->stop();
        }

        const AggregatedBook& aggregate = manager.get_aggregated_orderbook();
        if (!aggregate.totals_consistent()) {
            spdlog::error("Aggregated level totals diverged from venue contributions");
            shutdown_logging();
            return 1;
        }

        spdlog::info("Shutdown complete");
        shutdown_logging();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << '\n';
        return 1;
    }
}
