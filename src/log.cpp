#include "pickler/log.hpp"
#include "pickler/types.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>

namespace pickler {

namespace {

constexpr const char* LOGGER_NAME = "pickler";

spdlog::level::level_enum level_from_environment() {
    const char* value = std::getenv(LOG_LEVEL_ENV);
    if (!value || !*value) {
        return spdlog::level::warn;
    }
    return spdlog::level::from_str(value);
}

std::shared_ptr<spdlog::logger> create_logger() {
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }
    auto log = spdlog::stderr_color_mt(LOGGER_NAME);
    log->set_level(level_from_environment());
    return log;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = create_logger();
    return instance;
}

} // namespace pickler
