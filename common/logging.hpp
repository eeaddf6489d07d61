#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>

namespace animatic {
namespace logging {

constexpr const char* kLoggerName = "animatic";
constexpr const char* kLevelVariable = "ANIMATIC_LOG_LEVEL";

// spdlog level names ("trace", "debug", "info", "warning"/"warn",
// "error"/"err", "critical", "off"). std::nullopt for anything else.
inline std::optional<spdlog::level::level_enum> parse_level(const std::string& name) {
    spdlog::level::level_enum level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return std::nullopt;
    }
    return level;
}

// Shared stderr logger. Level comes from ANIMATIC_LOG_LEVEL, default info.
inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::stderr_color_mt(kLoggerName);
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        log->set_level(spdlog::level::info);
        // Flushed at warn and above
        log->flush_on(spdlog::level::warn);

        if (const char* level_env = std::getenv(kLevelVariable)) {
            if (auto level = parse_level(level_env)) {
                log->set_level(*level);
            } else {
                log->warn("Ignoring {}={}: not a log level", kLevelVariable, level_env);
            }
        }
        return log;
    }();
    return logger;
}

// Lowers the level to debug; a more verbose level already set is kept
inline void enable_verbose() {
    auto log = get_logger();
    if (log->level() > spdlog::level::debug) {
        log->set_level(spdlog::level::debug);
    }
}

}  // namespace logging
}  // namespace animatic
