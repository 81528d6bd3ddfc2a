/**
 * @file test_simulated_feed.cpp
 * @brief Unit tests for SimulatedVenueFeed
 */

#include <gtest/gtest.h>
#include "feed/simulated_feed.hpp"
#include <chrono>
#include <memory>
#include <thread>

using namespace aggbook;

class SimulatedFeedTest : public ::testing::Test {
protected:
    void SetUp() override {
        AggregatorConfig config;
        config.price_precision = 2;
        manager = std::make_unique<BookManager>(config);
        ASSERT_EQ(manager->add_venue(Venue::COINBASE, 2), ErrorCode::OK);

        feed_config.base_price = 100.0;
        feed_config.precision = 2;
        feed_config.level_spacing = 0.5;
        feed_config.snapshot_depth = 5;
        feed_config.updates_per_sec = 1000;
        feed_config.seed = 7;
    }

    std::unique_ptr<BookManager> manager;
    SimulatedFeedConfig feed_config;
};

TEST_F(SimulatedFeedTest, SnapshotSeedsBothViews) {
    SimulatedVenueFeed feed(*manager, Venue::COINBASE, feed_config);

    ASSERT_EQ(feed.publish_snapshot(), ErrorCode::OK);
    EXPECT_EQ(feed.snapshots_sent(), 1);
    EXPECT_EQ(manager->get_venue_state(Venue::COINBASE), VenueState::SNAPSHOTTED);

    auto depth = manager->get_venue_depth(Venue::COINBASE, 10).value();
    ASSERT_EQ(depth.bids.size(), 5);
    ASSERT_EQ(depth.asks.size(), 5);
    EXPECT_DOUBLE_EQ(depth.bids[0].price, 99.50);
    EXPECT_DOUBLE_EQ(depth.asks[0].price, 100.50);

    EXPECT_EQ(manager->get_aggregated_orderbook().level_count(Side::BID), 5);
}

TEST_F(SimulatedFeedTest, StepsKeepBookUncrossed) {
    SimulatedVenueFeed feed(*manager, Venue::COINBASE, feed_config);
    ASSERT_EQ(feed.publish_snapshot(), ErrorCode::OK);

    for (int i = 0; i < 500; ++i) {
        ASSERT_EQ(feed.step(), ErrorCode::OK);
    }

    EXPECT_GE(feed.updates_sent(), 500);
    EXPECT_EQ(feed.errors(), 0);
    EXPECT_EQ(manager->get_venue_state(Venue::COINBASE), VenueState::LIVE);

    auto prices = manager->get_aggregated_orderbook().best_bid_ask_prices();
    ASSERT_TRUE(prices.has_value());
    EXPECT_LT(prices->first, prices->second);
    EXPECT_FALSE(manager->get_aggregated_orderbook().check_crossed().has_value());

    // Single venue: aggregate mirrors the venue book
    auto venue_depth = manager->get_venue_depth(Venue::COINBASE, 1000).value();
    auto agg_depth = manager->get_aggregated_depth(1000);
    ASSERT_EQ(venue_depth.bids.size(), agg_depth.bids.size());
    ASSERT_EQ(venue_depth.asks.size(), agg_depth.asks.size());
    EXPECT_LE(venue_depth.bids.size(), 2 * feed_config.snapshot_depth);
    EXPECT_TRUE(manager->get_aggregated_orderbook().totals_consistent());
}

TEST_F(SimulatedFeedTest, ReconnectResyncsVenue) {
    SimulatedVenueFeed feed(*manager, Venue::COINBASE, feed_config);
    ASSERT_EQ(feed.publish_snapshot(), ErrorCode::OK);
    ASSERT_EQ(feed.step(), ErrorCode::OK);

    ASSERT_EQ(feed.reconnect(), ErrorCode::OK);

    EXPECT_EQ(manager->get_venue_state(Venue::COINBASE), VenueState::SNAPSHOTTED);
    EXPECT_EQ(manager->get_venue_metrics(Venue::COINBASE)->reconnects, 1);
    EXPECT_EQ(feed.snapshots_sent(), 2);
}

TEST_F(SimulatedFeedTest, QuotesInVenueCurrency) {
    ASSERT_EQ(manager->add_venue(Venue::BINANCE_SPOT, 2, "USDT"), ErrorCode::OK);
    ASSERT_EQ(manager->update_usd_rate("USDT", 0.5), ErrorCode::OK);

    feed_config.quote_rate = 0.5;
    SimulatedVenueFeed feed(*manager, Venue::BINANCE_SPOT, feed_config);
    ASSERT_EQ(feed.publish_snapshot(), ErrorCode::OK);

    // 199.50 USDT on the venue, 99.75 USD in the aggregate
    EXPECT_DOUBLE_EQ(manager->get_venue_depth(Venue::BINANCE_SPOT, 1)->bids[0].price, 199.50);
    EXPECT_DOUBLE_EQ(manager->get_aggregated_orderbook().best_bid()->price, 99.75);
}

TEST_F(SimulatedFeedTest, UnregisteredVenueCountsErrors) {
    SimulatedVenueFeed feed(*manager, Venue::KRAKEN, feed_config);

    EXPECT_EQ(feed.publish_snapshot(), ErrorCode::UNKNOWN_VENUE);
    EXPECT_EQ(feed.errors(), 1);
    EXPECT_EQ(feed.snapshots_sent(), 0);
}

TEST_F(SimulatedFeedTest, WorkerThreadStreams) {
    SimulatedVenueFeed feed(*manager, Venue::COINBASE, feed_config);

    feed.start();
    EXPECT_TRUE(feed.is_running());
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    feed.stop();

    EXPECT_FALSE(feed.is_running());
    EXPECT_EQ(feed.snapshots_sent(), 1);
    EXPECT_GT(feed.updates_sent(), 0);
    EXPECT_EQ(manager->get_venue_state(Venue::COINBASE), VenueState::LIVE);
    EXPECT_TRUE(manager->get_aggregated_orderbook().totals_consistent());
}
