/**
 * @file logging.cpp
 * @brief Logging bootstrap implementation
 */

#include "utils/logging.hpp"
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <memory>
#include <vector>

namespace aggbook {

namespace {

constexpr const char* LOGGER_NAME = "aggbook";
constexpr size_t ASYNC_QUEUE_SIZE = 8192;

} // namespace

spdlog::level::level_enum parse_log_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

void init_logging(const LoggingConfig& config) {
    auto level = parse_log_level(config.level);

    spdlog::drop(LOGGER_NAME);

    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

        if (!config.log_file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.log_file, config.max_file_size, config.max_files));
        }

        std::shared_ptr<spdlog::logger> logger;
        if (config.async) {
            spdlog::init_thread_pool(ASYNC_QUEUE_SIZE, 1);
            logger = std::make_shared<spdlog::async_logger>(
                LOGGER_NAME, sinks.begin(), sinks.end(), spdlog::thread_pool(),
                spdlog::async_overflow_policy::block);
        } else {
            logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        }

        logger->set_level(level);
        logger->set_pattern(config.pattern);
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
        spdlog::set_level(level);

        if (!config.log_file.empty()) {
            spdlog::info("Logging to {} (level {})", config.log_file, config.level);
        }
    } catch (const spdlog::spdlog_ex& e) {
        std::fprintf(stderr, "[aggbook] init_logging failed (file=%s): %s\n",
                     config.log_file.c_str(), e.what());
        // Console only
        spdlog::drop(LOGGER_NAME);
        auto logger = spdlog::stdout_color_mt(LOGGER_NAME);
        logger->set_level(level);
        spdlog::set_default_logger(logger);
    }
}

void shutdown_logging() {
    spdlog::shutdown();
}

} // namespace aggbook
