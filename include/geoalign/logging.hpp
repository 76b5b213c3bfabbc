#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace geoalign {

// Library-wide logger named "geoalign", writing to stderr.
// Initial level is "info" unless GEOALIGN_LOG_LEVEL names another spdlog level.
std::shared_ptr<spdlog::logger> logger();

// Accepts spdlog level names: trace, debug, info, warn, error, critical, off.
void set_log_level(const std::string& level);

} // namespace geoalign

#define GEOALIGN_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::geoalign::logger(), __VA_ARGS__)
#define GEOALIGN_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::geoalign::logger(), __VA_ARGS__)
#define GEOALIGN_LOG_INFO(...)  SPDLOG_LOGGER_INFO(::geoalign::logger(), __VA_ARGS__)
#define GEOALIGN_LOG_WARN(...)  SPDLOG_LOGGER_WARN(::geoalign::logger(), __VA_ARGS__)
#define GEOALIGN_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::geoalign::logger(), __VA_ARGS__)
