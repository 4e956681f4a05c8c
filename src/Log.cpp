#include "jsonbuilder/Log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace jsonbuilder {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (!spdlog::get(kLoggerName)) {
            spdlog::stderr_color_mt(kLoggerName);
        }
    });
    auto log = spdlog::get(kLoggerName);
    // Dropped from the registry by the application; keep logging somewhere
    return log ? log : spdlog::default_logger();
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace jsonbuilder
