/**
 * @file configuration_manager.cpp
 * @brief Configuration manager implementation
 */

#include "config/configuration_manager.hpp"
#include "core/price_grid.hpp"
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>

namespace aggbook {

namespace {

bool is_known_level(const std::string& level) {
    return level == "trace" || level == "debug" || level == "info" ||
           level == "warn" || level == "error" || level == "critical" || level == "off";
}

} // namespace

ConfigurationManager::ConfigurationManager() {
    config_ = create_default();
}

bool ConfigurationManager::load(const std::string& filename) {
    std::string content;

    try {
        std::ifstream file(filename);
        if (!file.is_open()) {
            spdlog::error("ConfigurationManager: Failed to open file {}", filename);
            return false;
        }

        content.assign((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    } catch (const std::exception& e) {
        spdlog::error("ConfigurationManager: Exception reading {}: {}", filename, e.what());
        return false;
    }

    SystemConfig parsed;
    if (!parse_yaml(content, parsed)) {
        return false;
    }

    ConfigChangeCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = parsed;
        filename_ = filename;
        callback = change_callback_;
    }

    spdlog::info("ConfigurationManager: Loaded configuration from {}", filename);

    if (callback) {
        callback(parsed);
    }

    return true;
}

bool ConfigurationManager::load_from_string(const std::string& yaml_content) {
    SystemConfig parsed;
    if (!parse_yaml(yaml_content, parsed)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    config_ = parsed;
    return true;
}

std::string ConfigurationManager::emit_yaml(const SystemConfig& config) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    // Aggregator
    out << YAML::Key << "aggregator";
    out << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "price_precision" << YAML::Value << config.aggregator.price_precision;
    out << YAML::Key << "aggregation_depth" << YAML::Value << config.aggregator.aggregation_depth;
    out << YAML::Key << "usd_rate_ttl_ms" << YAML::Value << config.aggregator.usd_rate_ttl_ms;
    out << YAML::EndMap;

    // Venues
    out << YAML::Key << "venues";
    out << YAML::Value << YAML::BeginMap;
    for (const auto& [venue, cfg] : config.venues) {
        out << YAML::Key << venue_to_key(venue);
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "enabled" << YAML::Value << cfg.enabled;
        out << YAML::Key << "precision" << YAML::Value << cfg.precision;
        out << YAML::Key << "quote_currency" << YAML::Value << cfg.quote_currency;
        out << YAML::Key << "snapshot_depth" << YAML::Value << cfg.snapshot_depth;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    // Logging
    out << YAML::Key << "logging";
    out << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "level" << YAML::Value << config.logging.level;
    out << YAML::Key << "pattern" << YAML::Value << config.logging.pattern;
    out << YAML::Key << "async" << YAML::Value << config.logging.async;
    out << YAML::Key << "log_file" << YAML::Value << config.logging.log_file;
    out << YAML::Key << "max_file_size" << YAML::Value << config.logging.max_file_size;
    out << YAML::Key << "max_files" << YAML::Value << config.logging.max_files;
    out << YAML::EndMap;

    // Simulation
    out << YAML::Key << "simulation";
    out << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "duration_sec" << YAML::Value << config.simulation.duration_sec;
    out << YAML::Key << "updates_per_sec" << YAML::Value << config.simulation.updates_per_sec;
    out << YAML::Key << "base_price" << YAML::Value << config.simulation.base_price;
    out << YAML::Key << "print_depth" << YAML::Value << config.simulation.print_depth;
    out << YAML::Key << "disconnect_interval_sec" << YAML::Value
        << config.simulation.disconnect_interval_sec;
    out << YAML::Key << "usd_rates" << YAML::Value << config.simulation.usd_rates;
    out << YAML::EndMap;

    out << YAML::EndMap;
    return out.c_str();
}

std::string ConfigurationManager::to_yaml() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return emit_yaml(config_);
}

bool ConfigurationManager::save(const std::string& filename) const {
    try {
        std::string yaml = to_yaml();

        std::ofstream file(filename);
        if (!file.is_open()) {
            spdlog::error("ConfigurationManager: Failed to open {} for writing", filename);
            return false;
        }
        file << yaml << '\n';

        spdlog::info("ConfigurationManager: Saved configuration to {}", filename);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("ConfigurationManager: Failed to save {}: {}", filename, e.what());
        return false;
    }
}

SystemConfig ConfigurationManager::get_config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

std::optional<VenueConfig> ConfigurationManager::get_venue_config(Venue venue) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = config_.venues.find(venue);
    if (it == config_.venues.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Venue> ConfigurationManager::get_enabled_venues() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Venue> enabled;
    for (const auto& [venue, cfg] : config_.venues) {
        if (cfg.enabled) {
            enabled.push_back(venue);
        }
    }

    return enabled;
}

std::vector<std::string> ConfigurationManager::validate() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> errors;

    // Aggregator
    if (!PriceGrid::is_valid_precision(config_.aggregator.price_precision)) {
        errors.push_back("aggregator.price_precision must be in [0, " +
                         std::to_string(PriceGrid::MAX_PRECISION) + "]");
    }
    if (config_.aggregator.usd_rate_ttl_ms == 0) {
        errors.push_back("aggregator.usd_rate_ttl_ms must be > 0");
    }

    // Venues
    size_t enabled = 0;
    for (const auto& [venue, cfg] : config_.venues) {
        if (!cfg.enabled) {
            continue;
        }
        ++enabled;

        std::string key = venue_to_key(venue);
        if (!PriceGrid::is_valid_precision(cfg.precision)) {
            errors.push_back("venues." + key + ".precision must be in [0, " +
                             std::to_string(PriceGrid::MAX_PRECISION) + "]");
        }
        if (cfg.quote_currency.empty()) {
            errors.push_back("venues." + key + ".quote_currency is empty");
        }
        if (cfg.snapshot_depth == 0) {
            errors.push_back("venues." + key + ".snapshot_depth must be > 0");
        }
    }
    if (enabled == 0) {
        errors.push_back("No enabled venues configured");
    }

    // Logging
    if (!is_known_level(config_.logging.level)) {
        errors.push_back("logging.level '" + config_.logging.level + "' is not a valid level");
    }
    if (!config_.logging.log_file.empty() &&
        (config_.logging.max_file_size == 0 || config_.logging.max_files == 0)) {
        errors.push_back("logging.max_file_size and logging.max_files must be > 0");
    }

    // Simulation
    if (config_.simulation.updates_per_sec == 0) {
        errors.push_back("simulation.updates_per_sec must be > 0");
    }
    if (!(config_.simulation.base_price > 0.0)) {
        errors.push_back("simulation.base_price must be > 0");
    }
    for (const auto& [currency, rate] : config_.simulation.usd_rates) {
        if (!(rate > 0.0)) {
            errors.push_back("simulation.usd_rates." + currency + " must be > 0");
        }
    }

    return errors;
}

void ConfigurationManager::set_change_callback(ConfigChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    change_callback_ = std::move(callback);
}

bool ConfigurationManager::reload() {
    std::string filename = get_filename();
    if (filename.empty()) {
        spdlog::warn("ConfigurationManager: No filename set, cannot reload");
        return false;
    }

    return load(filename);
}

std::string ConfigurationManager::get_filename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return filename_;
}

SystemConfig ConfigurationManager::create_default() {
    SystemConfig config;

    VenueConfig binance;
    binance.venue = Venue::BINANCE_SPOT;
    binance.precision = 2;
    binance.quote_currency = "USDT";
    binance.snapshot_depth = 1000;
    config.venues[Venue::BINANCE_SPOT] = binance;

    VenueConfig coinbase;
    coinbase.venue = Venue::COINBASE;
    coinbase.precision = 2;
    coinbase.quote_currency = "USD";
    coinbase.snapshot_depth = 50;
    config.venues[Venue::COINBASE] = coinbase;

    VenueConfig kraken;
    kraken.venue = Venue::KRAKEN;
    kraken.precision = 1;
    kraken.quote_currency = "USD";
    kraken.snapshot_depth = 100;
    config.venues[Venue::KRAKEN] = kraken;

    config.simulation.usd_rates["USDT"] = 1.0;

    return config;
}

bool ConfigurationManager::create_example(const std::string& filename) {
    ConfigurationManager manager;
    return manager.save(filename);
}

bool ConfigurationManager::parse_yaml(const std::string& yaml_content, SystemConfig& out) const {
    try {
        YAML::Node root = YAML::Load(yaml_content);
        SystemConfig config = create_default();

        // Parse aggregator
        if (root["aggregator"]) {
            auto agg = root["aggregator"];
            config.aggregator.price_precision = agg["price_precision"].as<int>(2);
            config.aggregator.aggregation_depth = agg["aggregation_depth"].as<size_t>(0);
            config.aggregator.usd_rate_ttl_ms = agg["usd_rate_ttl_ms"].as<uint64_t>(60000);
        }

        // Parse venues; an explicit section replaces the defaults
        if (root["venues"]) {
            config.venues.clear();

            for (const auto& item : root["venues"]) {
                std::string key = item.first.as<std::string>();
                Venue venue = venue_from_string(key);
                if (venue == Venue::UNKNOWN) {
                    spdlog::warn("ConfigurationManager: Skipping unknown venue '{}'", key);
                    continue;
                }

                const YAML::Node& node = item.second;
                VenueConfig cfg;
                cfg.venue = venue;
                cfg.enabled = node["enabled"].as<bool>(true);
                cfg.precision = node["precision"].as<int>(2);
                cfg.quote_currency = substitute_env_vars(node["quote_currency"].as<std::string>("USD"));
                cfg.snapshot_depth = node["snapshot_depth"].as<size_t>(1000);

                config.venues[venue] = cfg;
            }
        }

        // Parse logging
        if (root["logging"]) {
            auto log = root["logging"];
            config.logging.level = log["level"].as<std::string>("info");
            config.logging.pattern = log["pattern"].as<std::string>(config.logging.pattern);
            config.logging.async = log["async"].as<bool>(false);
            config.logging.log_file = substitute_env_vars(log["log_file"].as<std::string>(""));
            config.logging.max_file_size = log["max_file_size"].as<size_t>(10485760);
            config.logging.max_files = log["max_files"].as<size_t>(5);
        }

        // Parse simulation
        if (root["simulation"]) {
            auto sim = root["simulation"];
            config.simulation.duration_sec = sim["duration_sec"].as<uint32_t>(10);
            config.simulation.updates_per_sec = sim["updates_per_sec"].as<uint32_t>(200);
            config.simulation.base_price = sim["base_price"].as<double>(50000.0);
            config.simulation.print_depth = sim["print_depth"].as<size_t>(10);
            config.simulation.disconnect_interval_sec =
                sim["disconnect_interval_sec"].as<uint32_t>(0);
            if (sim["usd_rates"]) {
                config.simulation.usd_rates =
                    sim["usd_rates"].as<std::map<std::string, double>>();
            }
        }

        out = std::move(config);
        return true;

    } catch (const YAML::Exception& e) {
        spdlog::error("ConfigurationManager: YAML parse error: {}", e.what());
        return false;
    } catch (const std::exception& e) {
        spdlog::error("ConfigurationManager: Parse error: {}", e.what());
        return false;
    }
}

std::string ConfigurationManager::substitute_env_vars(const std::string& value) const {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find("${", pos)) != std::string::npos) {
        size_t end = result.find('}', pos);
        if (end == std::string::npos) {
            break;
        }

        std::string var_name = result.substr(pos + 2, end - pos - 2);
        const char* env_value = std::getenv(var_name.c_str());

        if (env_value) {
            result.replace(pos, end - pos + 1, env_value);
            pos += std::strlen(env_value);
        } else {
            pos = end + 1;
        }
    }

    return result;
}

} // namespace aggbook
