/**
 * @file test_configuration.cpp
 * @brief Unit tests for configuration management
 */

#include <gtest/gtest.h>
#include "config/configuration_manager.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace aggbook;

class ConfigurationManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_config_path = std::filesystem::temp_directory_path() / "aggbook_test_config.yaml";
        create_test_config();
    }

    void TearDown() override {
        if (std::filesystem::exists(test_config_path)) {
            std::filesystem::remove(test_config_path);
        }
    }

    void create_test_config() {
        std::ofstream file(test_config_path);
        file << R"(
aggregator:
  price_precision: 3
  aggregation_depth: 25
  usd_rate_ttl_ms: 5000

venues:
  binance_spot:
    enabled: true
    precision: 2
    quote_currency: USDT
    snapshot_depth: 500
  okx_spot:
    enabled: false
    precision: 1
    quote_currency: USDT
  coinbase:
    precision: 2
    quote_currency: USD
    snapshot_depth: 50

logging:
  level: "debug"
  async: true
  log_file: "/tmp/aggbook_test.log"
  max_files: 3

simulation:
  duration_sec: 30
  updates_per_sec: 50
  base_price: 2500.0
  usd_rates:
    USDT: 0.9995
)";
    }

    ConfigurationManager manager;
    std::filesystem::path test_config_path;
};

// ============================================================================
// Defaults
// ============================================================================

TEST_F(ConfigurationManagerTest, DefaultConfiguration) {
    auto config = manager.get_config();

    EXPECT_EQ(config.aggregator.price_precision, 2);
    EXPECT_EQ(config.aggregator.aggregation_depth, 0);
    EXPECT_EQ(config.aggregator.usd_rate_ttl_ms, 60000);
    EXPECT_EQ(config.venues.size(), 3);
    EXPECT_EQ(config.venues.at(Venue::BINANCE_SPOT).quote_currency, "USDT");
    EXPECT_EQ(config.venues.at(Venue::KRAKEN).precision, 1);
    EXPECT_DOUBLE_EQ(config.simulation.usd_rates.at("USDT"), 1.0);
    EXPECT_TRUE(manager.validate().empty());
}

// ============================================================================
// Loading
// ============================================================================

TEST_F(ConfigurationManagerTest, LoadFromFile) {
    ASSERT_TRUE(manager.load(test_config_path.string()));

    auto config = manager.get_config();
    EXPECT_EQ(config.aggregator.price_precision, 3);
    EXPECT_EQ(config.aggregator.aggregation_depth, 25);
    EXPECT_EQ(config.aggregator.usd_rate_ttl_ms, 5000);

    // Explicit venues section replaces the defaults
    EXPECT_EQ(config.venues.size(), 3);
    EXPECT_EQ(config.venues.count(Venue::KRAKEN), 0);

    const auto& binance = config.venues.at(Venue::BINANCE_SPOT);
    EXPECT_TRUE(binance.enabled);
    EXPECT_EQ(binance.precision, 2);
    EXPECT_EQ(binance.quote_currency, "USDT");
    EXPECT_EQ(binance.snapshot_depth, 500);

    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_TRUE(config.logging.async);
    EXPECT_EQ(config.logging.max_files, 3);

    EXPECT_EQ(config.simulation.duration_sec, 30);
    EXPECT_EQ(config.simulation.updates_per_sec, 50);
    EXPECT_DOUBLE_EQ(config.simulation.base_price, 2500.0);
    EXPECT_DOUBLE_EQ(config.simulation.usd_rates.at("USDT"), 0.9995);

    EXPECT_EQ(manager.get_filename(), test_config_path.string());
}

TEST_F(ConfigurationManagerTest, MissingKeysUseDefaults) {
    ASSERT_TRUE(manager.load_from_string(R"(
venues:
  kraken: {}
)"));

    auto venue = manager.get_venue_config(Venue::KRAKEN);
    ASSERT_TRUE(venue.has_value());
    EXPECT_TRUE(venue->enabled);
    EXPECT_EQ(venue->precision, 2);
    EXPECT_EQ(venue->quote_currency, "USD");
    EXPECT_EQ(venue->snapshot_depth, 1000);
    EXPECT_EQ(manager.get_config().aggregator.price_precision, 2);
}

TEST_F(ConfigurationManagerTest, UnknownVenueIsSkipped) {
    ASSERT_TRUE(manager.load_from_string(R"(
venues:
  mtgox:
    precision: 2
  bybit_spot:
    precision: 2
    quote_currency: USDT
)"));

    auto config = manager.get_config();
    ASSERT_EQ(config.venues.size(), 1);
    EXPECT_EQ(config.venues.begin()->first, Venue::BYBIT_SPOT);
}

TEST_F(ConfigurationManagerTest, LoadNonExistentFile) {
    EXPECT_FALSE(manager.load("/nonexistent/aggbook.yaml"));
    EXPECT_EQ(manager.get_config().venues.size(), 3);
}

TEST_F(ConfigurationManagerTest, MalformedYamlKeepsCurrentConfig) {
    ASSERT_TRUE(manager.load(test_config_path.string()));

    EXPECT_FALSE(manager.load_from_string("aggregator: [unclosed"));

    EXPECT_EQ(manager.get_config().aggregator.price_precision, 3);
}

TEST_F(ConfigurationManagerTest, EnabledVenuesInEnumerationOrder) {
    ASSERT_TRUE(manager.load(test_config_path.string()));

    auto venues = manager.get_enabled_venues();
    ASSERT_EQ(venues.size(), 2);
    EXPECT_EQ(venues[0], Venue::BINANCE_SPOT);
    EXPECT_EQ(venues[1], Venue::COINBASE);
    EXPECT_FALSE(manager.get_venue_config(Venue::KRAKEN).has_value());
}

TEST_F(ConfigurationManagerTest, EnvironmentVariableSubstitution) {
    setenv("AGGBOOK_TEST_LOG_DIR", "/var/log/aggbook", 1);

    ASSERT_TRUE(manager.load_from_string(R"(
logging:
  log_file: "${AGGBOOK_TEST_LOG_DIR}/engine.log"
venues:
  coinbase:
    quote_currency: "${AGGBOOK_TEST_UNSET_VARIABLE}"
)"));

    auto config = manager.get_config();
    EXPECT_EQ(config.logging.log_file, "/var/log/aggbook/engine.log");
    EXPECT_EQ(config.venues.at(Venue::COINBASE).quote_currency, "${AGGBOOK_TEST_UNSET_VARIABLE}");

    unsetenv("AGGBOOK_TEST_LOG_DIR");
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ConfigurationManagerTest, ValidationCatchesBadValues) {
    ASSERT_TRUE(manager.load_from_string(R"(
aggregator:
  price_precision: 13
  usd_rate_ttl_ms: 0
venues:
  coinbase:
    precision: -1
    quote_currency: ""
    snapshot_depth: 0
logging:
  level: "verbose"
simulation:
  updates_per_sec: 0
  base_price: -5
  usd_rates:
    USDT: 0
)"));

    auto errors = manager.validate();
    EXPECT_GE(errors.size(), 9);
}

TEST_F(ConfigurationManagerTest, ValidationRequiresEnabledVenue) {
    ASSERT_TRUE(manager.load_from_string(R"(
venues:
  coinbase:
    enabled: false
)"));

    auto errors = manager.validate();
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0], "No enabled venues configured");
}

// ============================================================================
// Saving and reloading
// ============================================================================

TEST_F(ConfigurationManagerTest, SaveAndReload) {
    ASSERT_TRUE(manager.load(test_config_path.string()));

    auto saved_path = std::filesystem::temp_directory_path() / "aggbook_saved_config.yaml";
    ASSERT_TRUE(manager.save(saved_path.string()));

    ConfigurationManager reloaded;
    ASSERT_TRUE(reloaded.load(saved_path.string()));

    auto original = manager.get_config();
    auto copy = reloaded.get_config();
    EXPECT_EQ(copy.aggregator.price_precision, original.aggregator.price_precision);
    EXPECT_EQ(copy.aggregator.aggregation_depth, original.aggregator.aggregation_depth);
    EXPECT_EQ(copy.venues.size(), original.venues.size());
    EXPECT_EQ(copy.venues.at(Venue::OKX_SPOT).enabled, false);
    EXPECT_EQ(copy.logging.log_file, original.logging.log_file);
    EXPECT_DOUBLE_EQ(copy.simulation.usd_rates.at("USDT"), 0.9995);

    std::filesystem::remove(saved_path);
}

TEST_F(ConfigurationManagerTest, CreateExampleWritesValidConfig) {
    auto example_path = std::filesystem::temp_directory_path() / "aggbook_example_config.yaml";
    ASSERT_TRUE(ConfigurationManager::create_example(example_path.string()));

    ConfigurationManager loaded;
    ASSERT_TRUE(loaded.load(example_path.string()));
    EXPECT_TRUE(loaded.validate().empty());
    EXPECT_EQ(loaded.get_enabled_venues().size(), 3);

    std::filesystem::remove(example_path);
}

TEST_F(ConfigurationManagerTest, ReloadNotifiesCallback) {
    int notifications = 0;
    int seen_precision = 0;
    manager.set_change_callback([&](const SystemConfig& config) {
        ++notifications;
        seen_precision = config.aggregator.price_precision;
    });

    EXPECT_FALSE(manager.reload());  // No file yet

    ASSERT_TRUE(manager.load(test_config_path.string()));
    ASSERT_TRUE(manager.reload());

    EXPECT_EQ(notifications, 2);
    EXPECT_EQ(seen_precision, 3);
}
