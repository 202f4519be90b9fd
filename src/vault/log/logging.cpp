// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vault/log/logging.hpp>
#include <vault/core/url.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <mutex>
#include <vector>

namespace vault::log {

namespace {

constexpr const char* SECURITY_LOGGER = "security";
constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

std::mutex init_mutex;

std::shared_ptr<spdlog::logger> security_logger() {
    auto logger = spdlog::get(SECURITY_LOGGER);
    if (logger) return logger;

    std::lock_guard lock(init_mutex);
    logger = spdlog::get(SECURITY_LOGGER);
    if (logger) return logger;

    // Not initialized: share the default logger's sinks
    auto base = spdlog::default_logger();
    logger = std::make_shared<spdlog::logger>(SECURITY_LOGGER,
                                              base->sinks().begin(), base->sinks().end());
    logger->set_level(base->level());
    spdlog::register_logger(logger);
    return logger;
}

} // namespace

void init(const LogConfig& config) {
    std::lock_guard lock(init_mutex);

    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
    if (!config.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file, config.max_file_size, config.max_files));
        } catch (const spdlog::spdlog_ex& e) {
            // Keep logging to the console when the file cannot be opened
            if (sinks.empty()) {
                sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            }
            auto fallback = std::make_shared<spdlog::logger>("vault", sinks.begin(), sinks.end());
            fallback->warn("Logging: cannot open log file {}: {}", config.file, e.what());
        }
    }

    auto level = spdlog::level::from_str(config.level);

    spdlog::drop("vault");
    spdlog::drop(SECURITY_LOGGER);

    auto logger = std::make_shared<spdlog::logger>("vault", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern(LOG_PATTERN);
    spdlog::set_default_logger(logger);

    auto security = std::make_shared<spdlog::logger>(SECURITY_LOGGER, sinks.begin(), sinks.end());
    security->set_level(level);
    security->set_pattern(LOG_PATTERN);
    spdlog::register_logger(security);

    spdlog::flush_on(spdlog::level::warn);
}

void security_event(std::string_view operation, bool success, std::string_view details) {
    auto logger = security_logger();
    if (success) {
        logger->info("{} succeeded: {}", operation, details);
    } else {
        logger->warn("{} failed: {}", operation, details);
    }
}

std::string redact_url(std::string_view url) {
    auto parsed = core::Url::parse(url);
    if (!parsed) {
        return "<invalid url>";
    }
    return parsed->redacted();
}

} // namespace vault::log
