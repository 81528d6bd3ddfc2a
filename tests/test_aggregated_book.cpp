/**
 * @file test_aggregated_book.cpp
 * @brief Unit tests for AggregatedBook
 */

#include <gtest/gtest.h>
#include "core/aggregated_book.hpp"
#include <cmath>
#include <random>
#include <vector>

using namespace aggbook;

class AggregatedBookTest : public ::testing::Test {
protected:
    AggregatedBook book{2};

    static double source_size(const std::vector<VenueContribution>& sources, Venue venue) {
        for (const auto& source : sources) {
            if (source.venue == venue) {
                return source.size;
            }
        }
        return 0.0;
    }
};

// ============================================================================
// Contributions and totals
// ============================================================================

TEST_F(AggregatedBookTest, VenuesSumAtSharedLevel) {
    ASSERT_EQ(book.update(100.00, 5.0, true, Venue::BINANCE_SPOT), ErrorCode::OK);
    ASSERT_EQ(book.update(100.00, 3.0, true, Venue::COINBASE), ErrorCode::OK);

    auto best = book.best_bid();
    ASSERT_TRUE(best.has_value());
    EXPECT_DOUBLE_EQ(best->price, 100.00);
    EXPECT_DOUBLE_EQ(best->total_size, 8.0);
    ASSERT_EQ(best->sources.size(), 2);
    EXPECT_DOUBLE_EQ(source_size(best->sources, Venue::BINANCE_SPOT), 5.0);
    EXPECT_DOUBLE_EQ(source_size(best->sources, Venue::COINBASE), 3.0);
}

TEST_F(AggregatedBookTest, UpdateOverwritesVenueContribution) {
    book.update(100.00, 5.0, true, Venue::BINANCE_SPOT);
    book.update(100.00, 3.0, true, Venue::COINBASE);
    book.update(100.00, 2.0, true, Venue::BINANCE_SPOT);

    EXPECT_DOUBLE_EQ(book.best_bid()->total_size, 5.0);
    EXPECT_DOUBLE_EQ(book.volume_from_venue(100.00, Side::BID, Venue::BINANCE_SPOT), 2.0);
    EXPECT_TRUE(book.totals_consistent());
}

TEST_F(AggregatedBookTest, ZeroSizeRemovesOnlyThatVenue) {
    book.update(100.50, 4.0, false, Venue::KRAKEN);
    book.update(100.50, 1.0, false, Venue::OKX_SPOT);

    book.update(100.50, 0.0, false, Venue::KRAKEN);

    auto sources = book.sources_at(100.50, Side::ASK);
    ASSERT_EQ(sources.size(), 1);
    EXPECT_EQ(sources[0].venue, Venue::OKX_SPOT);
    EXPECT_DOUBLE_EQ(book.best_ask()->total_size, 1.0);
}

TEST_F(AggregatedBookTest, LastContributorRemovalDeletesLevel) {
    book.update(99.00, 1.0, true, Venue::COINBASE);
    book.update(99.00, 0.0, true, Venue::COINBASE);

    EXPECT_EQ(book.level_count(Side::BID), 0);
    EXPECT_FALSE(book.contains_venue(Venue::COINBASE));
}

TEST_F(AggregatedBookTest, RemovingAbsentContributionIsNoop) {
    book.update(99.00, 1.0, true, Venue::COINBASE);

    EXPECT_EQ(book.update(99.00, 0.0, true, Venue::KRAKEN), ErrorCode::OK);
    EXPECT_EQ(book.update(98.00, 0.0, true, Venue::COINBASE), ErrorCode::OK);

    EXPECT_EQ(book.level_count(Side::BID), 1);
    EXPECT_DOUBLE_EQ(book.best_bid()->total_size, 1.0);
}

TEST_F(AggregatedBookTest, RejectsInvalidInput) {
    EXPECT_EQ(book.update(-1.0, 1.0, true, Venue::COINBASE), ErrorCode::INVALID_PRICE);
    EXPECT_EQ(book.update(std::nan(""), 1.0, true, Venue::COINBASE), ErrorCode::INVALID_PRICE);
    EXPECT_EQ(book.update(100.0, std::nan(""), true, Venue::COINBASE), ErrorCode::INVALID_SIZE);
    EXPECT_EQ(book.update(100.0, 1.0, true, Venue::UNKNOWN), ErrorCode::UNKNOWN_VENUE);

    EXPECT_EQ(book.level_count(Side::BID), 0);
    EXPECT_EQ(book.venue_count(), 0);
}

TEST_F(AggregatedBookTest, CoarseVenuePricesCollapseOntoGrid) {
    AggregatedBook coarse(1);
    coarse.update(100.04, 1.0, true, Venue::BINANCE_SPOT);
    coarse.update(99.96, 2.0, true, Venue::COINBASE);

    ASSERT_EQ(coarse.level_count(Side::BID), 1);
    EXPECT_DOUBLE_EQ(coarse.best_bid()->price, 100.0);
    EXPECT_DOUBLE_EQ(coarse.best_bid()->total_size, 3.0);
}

TEST_F(AggregatedBookTest, ReplaceSumsVenueLevelsOnSameGridPrice) {
    ASSERT_EQ(book.replace_venue(Venue::COINBASE, {{100.001, 5.0}, {100.004, 3.0}}, {}),
              ErrorCode::OK);

    ASSERT_EQ(book.level_count(Side::BID), 1);
    EXPECT_DOUBLE_EQ(book.volume_from_venue(100.00, Side::BID, Venue::COINBASE), 8.0);
    EXPECT_TRUE(book.totals_consistent());
}

// ============================================================================
// Size limits
// ============================================================================

TEST_F(AggregatedBookTest, RejectsSizeAboveLimit) {
    EXPECT_EQ(book.update(100.0, 1e11, true, Venue::BINANCE_SPOT), ErrorCode::INVALID_SIZE);
    EXPECT_EQ(book.update(100.0, INFINITY, true, Venue::BINANCE_SPOT), ErrorCode::INVALID_SIZE);
    EXPECT_EQ(book.level_count(Side::BID), 0);

    EXPECT_EQ(book.replace_venue(Venue::OKX_SPOT, {{100.0, 1e11}}, {}), ErrorCode::INVALID_SIZE);
    EXPECT_FALSE(book.contains_venue(Venue::OKX_SPOT));
}

TEST_F(AggregatedBookTest, EveryVenueAtLimitSumsExactly) {
    const Venue venues[] = {Venue::BINANCE_SPOT, Venue::BINANCE_USDM, Venue::BINANCE_COINM,
                            Venue::OKX_SPOT,     Venue::BYBIT_SPOT,   Venue::BYBIT_PERP,
                            Venue::COINBASE,     Venue::KRAKEN};
    for (Venue venue : venues) {
        ASSERT_EQ(book.update(100.0, MAX_SIZE, true, venue), ErrorCode::OK);
    }

    EXPECT_DOUBLE_EQ(book.best_bid()->total_size, 8 * MAX_SIZE);
    EXPECT_EQ(book.best_bid()->sources.size(), 8);
    EXPECT_TRUE(book.totals_consistent());
}

TEST_F(AggregatedBookTest, OverflowingTotalIsRejected) {
    // Nine maximal levels summed onto 100.00 for one venue
    std::vector<PriceSize> bids(9, PriceSize(100.0, MAX_SIZE));
    ASSERT_EQ(book.replace_venue(Venue::COINBASE, bids, {}), ErrorCode::OK);
    EXPECT_DOUBLE_EQ(book.best_bid()->total_size, 9 * MAX_SIZE);

    EXPECT_EQ(book.update(100.0, MAX_SIZE, true, Venue::OKX_SPOT), ErrorCode::INVALID_SIZE);
    EXPECT_DOUBLE_EQ(book.best_bid()->total_size, 9 * MAX_SIZE);
    EXPECT_DOUBLE_EQ(book.volume_from_venue(100.0, Side::BID, Venue::OKX_SPOT), 0.0);
    EXPECT_FALSE(book.contains_venue(Venue::OKX_SPOT));
    EXPECT_TRUE(book.totals_consistent());

    EXPECT_EQ(book.update(100.0, 1.0, true, Venue::OKX_SPOT), ErrorCode::OK);
    EXPECT_TRUE(book.totals_consistent());
}

TEST_F(AggregatedBookTest, OverflowingReplaceKeepsPreviousContribution) {
    book.replace_venue(Venue::KRAKEN, {{100.00, 1.0}}, {{101.00, 2.0}});

    std::vector<PriceSize> bids(10, PriceSize(99.0, MAX_SIZE));
    EXPECT_EQ(book.replace_venue(Venue::KRAKEN, bids, {}), ErrorCode::INVALID_SIZE);

    EXPECT_DOUBLE_EQ(book.volume_from_venue(100.00, Side::BID, Venue::KRAKEN), 1.0);
    EXPECT_DOUBLE_EQ(book.volume_from_venue(101.00, Side::ASK, Venue::KRAKEN), 2.0);
    EXPECT_EQ(book.level_count(Side::BID), 1);
    EXPECT_TRUE(book.totals_consistent());
}

// ============================================================================
// Venue isolation
// ============================================================================

TEST_F(AggregatedBookTest, ClearVenueLeavesOthersUnchanged) {
    book.update(100.00, 5.0, true, Venue::BINANCE_SPOT);
    book.update(100.00, 3.0, true, Venue::COINBASE);
    book.update(99.50, 7.0, true, Venue::BINANCE_SPOT);
    book.update(100.50, 2.0, false, Venue::BINANCE_SPOT);
    book.update(101.00, 6.0, false, Venue::COINBASE);

    size_t removed = book.clear_venue(Venue::BINANCE_SPOT);
    EXPECT_EQ(removed, 3);

    EXPECT_DOUBLE_EQ(book.volume_from_venue(100.00, Side::BID, Venue::COINBASE), 3.0);
    EXPECT_DOUBLE_EQ(book.volume_from_venue(101.00, Side::ASK, Venue::COINBASE), 6.0);
    EXPECT_DOUBLE_EQ(book.volume_from_venue(100.00, Side::BID, Venue::BINANCE_SPOT), 0.0);

    EXPECT_EQ(book.level_count(Side::BID), 1);
    EXPECT_EQ(book.level_count(Side::ASK), 1);
    EXPECT_FALSE(book.contains_venue(Venue::BINANCE_SPOT));
    EXPECT_TRUE(book.totals_consistent());
}

TEST_F(AggregatedBookTest, ClearUnknownVenueRemovesNothing) {
    book.update(100.00, 5.0, true, Venue::BINANCE_SPOT);
    EXPECT_EQ(book.clear_venue(Venue::KRAKEN), 0);
    EXPECT_EQ(book.level_count(Side::BID), 1);
}

TEST_F(AggregatedBookTest, TwoVenueScenario) {
    ASSERT_EQ(book.replace_venue(Venue::BINANCE_SPOT, {{100.00, 5.0}}, {}), ErrorCode::OK);
    ASSERT_EQ(book.replace_venue(Venue::COINBASE, {{100.00, 3.0}}, {}), ErrorCode::OK);

    auto best = book.best_bid();
    ASSERT_TRUE(best.has_value());
    EXPECT_DOUBLE_EQ(best->price, 100.00);
    EXPECT_DOUBLE_EQ(best->total_size, 8.0);
    EXPECT_DOUBLE_EQ(source_size(best->sources, Venue::BINANCE_SPOT), 5.0);
    EXPECT_DOUBLE_EQ(source_size(best->sources, Venue::COINBASE), 3.0);

    book.update(100.00, 0.0, true, Venue::BINANCE_SPOT);

    best = book.best_bid();
    ASSERT_TRUE(best.has_value());
    EXPECT_DOUBLE_EQ(best->total_size, 3.0);
    ASSERT_EQ(best->sources.size(), 1);
    EXPECT_EQ(best->sources[0].venue, Venue::COINBASE);

    book.clear_venue(Venue::COINBASE);

    EXPECT_FALSE(book.best_bid().has_value());
    EXPECT_TRUE(book.get_depth_with_prices(10).bids.empty());
}

// ============================================================================
// Re-seeding
// ============================================================================

TEST_F(AggregatedBookTest, ReplaceVenueDropsStaleLevels) {
    book.replace_venue(Venue::KRAKEN, {{100.00, 1.0}, {99.00, 2.0}}, {{101.00, 1.0}});
    book.update(100.00, 4.0, true, Venue::COINBASE);

    ASSERT_EQ(book.replace_venue(Venue::KRAKEN, {{98.00, 5.0}}, {{102.00, 1.0}}), ErrorCode::OK);

    EXPECT_DOUBLE_EQ(book.volume_from_venue(99.00, Side::BID, Venue::KRAKEN), 0.0);
    EXPECT_DOUBLE_EQ(book.volume_from_venue(98.00, Side::BID, Venue::KRAKEN), 5.0);
    EXPECT_DOUBLE_EQ(book.best_bid()->total_size, 4.0);
    EXPECT_DOUBLE_EQ(book.best_ask()->price, 102.00);
    EXPECT_TRUE(book.totals_consistent());
}

TEST_F(AggregatedBookTest, InvalidReplaceKeepsPreviousContribution) {
    book.replace_venue(Venue::KRAKEN, {{100.00, 1.0}}, {});

    EXPECT_EQ(book.replace_venue(Venue::KRAKEN, {{99.00, 1.0}, {-1.0, 1.0}}, {}),
              ErrorCode::INVALID_PRICE);
    EXPECT_DOUBLE_EQ(book.volume_from_venue(100.00, Side::BID, Venue::KRAKEN), 1.0);
    EXPECT_DOUBLE_EQ(book.volume_from_venue(99.00, Side::BID, Venue::KRAKEN), 0.0);
}

TEST_F(AggregatedBookTest, ReplaceWithEmptyBookRemovesVenue) {
    book.replace_venue(Venue::KRAKEN, {{100.00, 1.0}}, {});
    ASSERT_EQ(book.replace_venue(Venue::KRAKEN, {}, {}), ErrorCode::OK);

    EXPECT_FALSE(book.contains_venue(Venue::KRAKEN));
    EXPECT_EQ(book.level_count(Side::BID), 0);
}

// ============================================================================
// Depth queries
// ============================================================================

TEST_F(AggregatedBookTest, DepthOrderingAndTruncation) {
    book.update(99.00, 1.0, true, Venue::COINBASE);
    book.update(100.00, 1.0, true, Venue::KRAKEN);
    book.update(99.50, 1.0, true, Venue::OKX_SPOT);
    book.update(102.00, 1.0, false, Venue::COINBASE);
    book.update(101.00, 1.0, false, Venue::KRAKEN);

    auto depth = book.get_depth_with_prices(2);
    ASSERT_EQ(depth.bids.size(), 2);
    ASSERT_EQ(depth.asks.size(), 2);
    EXPECT_DOUBLE_EQ(depth.bids[0].price, 100.00);
    EXPECT_DOUBLE_EQ(depth.bids[1].price, 99.50);
    EXPECT_DOUBLE_EQ(depth.asks[0].price, 101.00);
    EXPECT_DOUBLE_EQ(depth.asks[1].price, 102.00);

    EXPECT_TRUE(book.get_depth_with_prices(0).bids.empty());
    EXPECT_EQ(book.get_depth_with_prices(100).bids.size(), 3);
}

TEST_F(AggregatedBookTest, SpreadAndMid) {
    book.update(100.00, 1.0, true, Venue::COINBASE);
    book.update(101.00, 1.0, false, Venue::KRAKEN);

    EXPECT_DOUBLE_EQ(book.get_spread().value(), 1.0);
    EXPECT_DOUBLE_EQ(book.get_mid_price().value(), 100.5);
}

// ============================================================================
// Crossed observations
// ============================================================================

TEST_F(AggregatedBookTest, CrossedCallbackFiresOnTransition) {
    std::vector<CrossedBookObservation> observed;
    book.set_crossed_callback([&observed](const CrossedBookObservation& obs) {
        observed.push_back(obs);
    });

    book.update(100.00, 1.0, false, Venue::COINBASE);
    book.update(99.00, 1.0, true, Venue::KRAKEN);
    EXPECT_TRUE(observed.empty());
    EXPECT_FALSE(book.check_crossed().has_value());

    book.update(100.50, 2.0, true, Venue::KRAKEN);
    ASSERT_EQ(observed.size(), 1);
    EXPECT_DOUBLE_EQ(observed[0].best_bid.price, 100.50);
    EXPECT_DOUBLE_EQ(observed[0].best_ask.price, 100.00);
    EXPECT_DOUBLE_EQ(observed[0].overlap(), 0.5);

    // Still crossed: no repeat
    book.update(100.25, 1.0, true, Venue::OKX_SPOT);
    EXPECT_EQ(observed.size(), 1);
    EXPECT_TRUE(book.check_crossed().has_value());

    // Uncross then cross again
    book.update(100.50, 0.0, true, Venue::KRAKEN);
    book.update(100.25, 0.0, true, Venue::OKX_SPOT);
    EXPECT_FALSE(book.check_crossed().has_value());
    book.update(100.00, 1.0, true, Venue::OKX_SPOT);

    EXPECT_EQ(observed.size(), 2);
    EXPECT_EQ(book.crossed_events(), 2);
}

TEST_F(AggregatedBookTest, CallbackMayReadBook) {
    size_t levels_seen = 0;
    book.set_crossed_callback([this, &levels_seen](const CrossedBookObservation&) {
        levels_seen = book.level_count(Side::BID);
    });

    book.update(100.00, 1.0, false, Venue::COINBASE);
    book.update(100.00, 1.0, true, Venue::KRAKEN);

    EXPECT_EQ(levels_seen, 1);
}

// ============================================================================
// Sum invariant under random operations
// ============================================================================

TEST_F(AggregatedBookTest, TotalsStayConsistentUnderRandomOperations) {
    std::mt19937 gen(42);
    std::uniform_int_distribution<int> venue_dist(1, 8);
    std::uniform_int_distribution<int> tick_dist(0, 20);
    std::uniform_int_distribution<int> op_dist(0, 9);
    std::uniform_real_distribution<double> size_dist(0.0, 5.0);

    for (int i = 0; i < 5000; ++i) {
        Venue venue = static_cast<Venue>(venue_dist(gen));
        double price = 100.0 + tick_dist(gen) * 0.01;
        int op = op_dist(gen);

        if (op == 0) {
            book.clear_venue(venue);
        } else if (op <= 3) {
            book.update(price, 0.0, op == 1, venue);
        } else {
            book.update(price, size_dist(gen), op % 2 == 0, venue);
        }

        if (i % 250 == 0) {
            ASSERT_TRUE(book.totals_consistent()) << "after operation " << i;
        }
    }

    EXPECT_TRUE(book.totals_consistent());

    // Every reported total equals the sum of its sources
    auto depth = book.get_depth_with_prices(100);
    for (const auto& level : depth.bids) {
        double sum = 0.0;
        for (const auto& source : level.sources) {
            sum += source.size;
        }
        EXPECT_NEAR(level.total_size, sum, 1e-7);
    }
}

TEST_F(AggregatedBookTest, ClearResetsEverything) {
    book.update(100.00, 1.0, true, Venue::COINBASE);
    book.update(101.00, 1.0, false, Venue::KRAKEN);
    book.clear();

    EXPECT_EQ(book.venue_count(), 0);
    EXPECT_EQ(book.level_count(Side::BID), 0);
    EXPECT_EQ(book.level_count(Side::ASK), 0);
}
