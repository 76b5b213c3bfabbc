#include "geoalign/logging.hpp"

#include <cstdlib>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace geoalign {

namespace {
constexpr const char* LOGGER_NAME = "geoalign";
constexpr const char* LEVEL_ENV = "GEOALIGN_LOG_LEVEL";
}

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, [] {
        instance = spdlog::get(LOGGER_NAME);
        if (!instance) {
            instance = spdlog::stderr_color_mt(LOGGER_NAME);
            instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        }
        spdlog::level::level_enum level = spdlog::level::info;
        if (const char* env = std::getenv(LEVEL_ENV)) {
            level = spdlog::level::from_str(env);
        }
        instance->set_level(level);
        instance->flush_on(spdlog::level::warn);
    });
    return instance;
}

void set_log_level(const std::string& level) {
    logger()->set_level(spdlog::level::from_str(level));
}

} // namespace geoalign
