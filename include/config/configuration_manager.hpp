/**
 * @file configuration_manager.hpp
 * @brief YAML-based configuration for the aggregation engine
 *
 * Loads the aggregator, venue, logging and simulation settings from a YAML
 * file or string, validates them, and can write them back out.
 *
 * **Features:**
 * - YAML configuration parsing (yaml-cpp)
 * - Defaults for every field
 * - Validation with readable error list
 * - Reload with change notification
 * - ${ENV} substitution in string values
 *
 * @author Market Data Handler Team
 * @date 2025-01-15
 */

#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace aggbook {

/**
 * @brief Aggregated book settings
 */
struct AggregatorConfig {
    int price_precision{2};            ///< Common grid decimals
    size_t aggregation_depth{0};       ///< Levels per venue folded on re-seed (0 = full book)
    uint64_t usd_rate_ttl_ms{60000};   ///< USD rate lifetime
};

/**
 * @brief Per-venue settings
 */
struct VenueConfig {
    Venue venue{Venue::UNKNOWN};       ///< Venue identifier
    bool enabled{true};                ///< Register this venue
    int precision{2};                  ///< Venue book decimals
    std::string quote_currency{"USD"}; ///< Currency prices are quoted in
    size_t snapshot_depth{1000};       ///< Levels requested per snapshot
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
    std::string level{"info"};                                  ///< Log level
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v"};  ///< Log pattern
    bool async{false};                                          ///< Async logging
    std::string log_file;                                       ///< Log file path (empty = console only)
    size_t max_file_size{10485760};                             ///< Max file size (10MB)
    size_t max_files{5};                                        ///< Max rotating files
};

/**
 * @brief Demo feed simulation settings
 */
struct SimulationConfig {
    uint32_t duration_sec{10};                ///< Run time (0 = until signalled)
    uint32_t updates_per_sec{200};            ///< Diffs per venue per second
    double base_price{50000.0};               ///< Starting mid price in USD
    size_t print_depth{10};                   ///< Aggregated levels printed
    uint32_t disconnect_interval_sec{0};      ///< Simulated disconnect period (0 = never)
    std::map<std::string, double> usd_rates;  ///< Initial quote currency rates
};

/**
 * @brief Complete system configuration
 */
struct SystemConfig {
    AggregatorConfig aggregator;            ///< Aggregator config
    std::map<Venue, VenueConfig> venues;    ///< Venue configs
    LoggingConfig logging;                  ///< Logging config
    SimulationConfig simulation;            ///< Simulation config
};

/**
 * @brief Configuration manager
 *
 * **Configuration File Format:**
 * ```yaml
 * aggregator:
 *   price_precision: 2
 *   aggregation_depth: 0
 *   usd_rate_ttl_ms: 60000
 *
 * venues:
 *   binance_spot:
 *     enabled: true
 *     precision: 2
 *     quote_currency: USDT
 *   coinbase:
 *     precision: 2
 *     quote_currency: USD
 *
 * logging:
 *   level: "info"
 *   log_file: "${HOME}/aggbook.log"
 * ```
 *
 * Unknown venue keys are logged and skipped.
 *
 * @code
 * ConfigurationManager config;
 * if (!config.load("aggbook.yaml")) {
 *     return 1;
 * }
 *
 * for (Venue venue : config.get_enabled_venues()) {
 *     auto venue_cfg = config.get_venue_config(venue);
 *     manager.add_venue(venue, venue_cfg->precision, venue_cfg->quote_currency);
 * }
 * @endcode
 *
 * @note Thread-safe
 */
class ConfigurationManager {
public:
    /**
     * @brief Callback for configuration changes
     */
    using ConfigChangeCallback = std::function<void(const SystemConfig&)>;

    /**
     * @brief Construct with default configuration
     */
    ConfigurationManager();

    /**
     * @brief Load configuration from YAML file
     *
     * @param filename YAML configuration file path
     * @return bool True if loaded successfully; on failure the current
     *         configuration is kept
     *
     * @note Triggers change callback on success
     */
    bool load(const std::string& filename);

    /**
     * @brief Load configuration from string
     *
     * @param yaml_content YAML content
     * @return bool True if parsed successfully
     */
    bool load_from_string(const std::string& yaml_content);

    /**
     * @brief Save configuration to file
     *
     * @param filename Output file path
     * @return bool True if saved successfully
     */
    bool save(const std::string& filename) const;

    /**
     * @brief Serialize configuration to YAML text
     */
    std::string to_yaml() const;

    /**
     * @brief Get complete system configuration (copy)
     */
    SystemConfig get_config() const;

    /**
     * @brief Get venue configuration
     *
     * @return Configuration, or std::nullopt if the venue is not configured
     */
    std::optional<VenueConfig> get_venue_config(Venue venue) const;

    /**
     * @brief Get enabled venues in enumeration order
     */
    std::vector<Venue> get_enabled_venues() const;

    /**
     * @brief Validate configuration
     *
     * @return std::vector<std::string> Validation errors (empty if valid)
     *
     * @code
     * for (const auto& error : config.validate()) {
     *     spdlog::error("Config error: {}", error);
     * }
     * @endcode
     */
    std::vector<std::string> validate() const;

    void set_change_callback(ConfigChangeCallback callback);

    /**
     * @brief Reload configuration from the last loaded file
     *
     * @return bool True if reloaded successfully
     */
    bool reload();

    std::string get_filename() const;

    /**
     * @brief Create default configuration
     *
     * Two USD-quoted venues and one USDT venue at precision 2.
     */
    static SystemConfig create_default();

    /**
     * @brief Write the default configuration to a file
     *
     * @param filename Output file path
     * @return bool True if created successfully
     */
    static bool create_example(const std::string& filename);

private:
    mutable std::mutex mutex_;              ///< Protects members below
    SystemConfig config_;                   ///< Current configuration
    std::string filename_;                  ///< Configuration file path
    ConfigChangeCallback change_callback_;  ///< Change callback

    /**
     * @brief Parse YAML content into a configuration
     *
     * @param yaml_content YAML string
     * @param out Receives the parsed configuration (defaults for absent keys)
     * @return bool True if parsed successfully
     */
    bool parse_yaml(const std::string& yaml_content, SystemConfig& out) const;

    static std::string emit_yaml(const SystemConfig& config);

    /**
     * @brief Substitute environment variables
     *
     * @param value String with ${VAR} placeholders
     * @return std::string Substituted string (unset variables are left as is)
     */
    std::string substitute_env_vars(const std::string& value) const;
};

} // namespace aggbook
