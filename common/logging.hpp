#ifndef PANELROUTE_COMMON_LOGGING_HPP
#define PANELROUTE_COMMON_LOGGING_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <string>

namespace panelroute {
namespace logging {

constexpr const char* LOGGER_NAME = "panelroute";
constexpr const char* LEVEL_ENV = "PANELROUTE_LOG_LEVEL";

// spdlog level name ("trace" .. "critical", "warn", "off"). Null or
// unrecognized names give info.
inline spdlog::level::level_enum parse_level(const char* name) {
    if (!name) {
        return spdlog::level::info;
    }
    std::string text(name);
    spdlog::level::level_enum level = spdlog::level::from_str(text);
    // from_str answers off for names it does not know
    if (level == spdlog::level::off && text != "off") {
        return spdlog::level::info;
    }
    return level;
}

// Process-wide stderr logger; routing failures go to warn, search
// details to debug
inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::get(LOGGER_NAME);
        if (!log) {
            log = spdlog::stderr_color_mt(LOGGER_NAME);
        }
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        log->set_level(parse_level(std::getenv(LEVEL_ENV)));
        return log;
    }();
    return logger;
}

}  // namespace logging
}  // namespace panelroute

#endif // PANELROUTE_COMMON_LOGGING_HPP
