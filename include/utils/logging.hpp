/**
 * @file logging.hpp
 * @brief spdlog bootstrap from LoggingConfig
 *
 * @author Market Data Handler Team
 * @date 2025-01-15
 */

#pragma once

#include "config/configuration_manager.hpp"
#include <spdlog/common.h>
#include <string>

namespace aggbook {

/**
 * @brief Parse a level name
 *
 * @param level "trace", "debug", "info", "warn", "error", "critical" or "off"
 * @return spdlog::level::level_enum Matching level, info for unknown names
 */
spdlog::level::level_enum parse_log_level(const std::string& level);

/**
 * @brief Install the default "aggbook" logger
 *
 * Colour console sink, plus a rotating file sink when log_file is set.
 * With async enabled the logger runs on spdlog's thread pool. If the file
 * sink cannot be created the logger falls back to console only.
 *
 * @code
 * auto config = ConfigurationManager::create_default();
 * config.logging.level = "debug";
 * init_logging(config.logging);
 * spdlog::info("ready");
 * @endcode
 */
void init_logging(const LoggingConfig& config);

/**
 * @brief Flush and drop all loggers
 */
void shutdown_logging();

} // namespace aggbook
