#include <lfq/log.hpp>

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace lfq {

namespace {

constexpr const char* kLevelEnv = "LFQ_LOG_LEVEL";

std::shared_ptr<spdlog::logger> create_logger() {
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }

    std::shared_ptr<spdlog::logger> log;
    try {
        log = spdlog::stderr_color_mt(kLoggerName);
    } catch (const spdlog::spdlog_ex&) {
        // Registered concurrently by the application between get() and stderr_color_mt().
        log = spdlog::get(kLoggerName);
        if (log) {
            return log;
        }
        throw;
    }

    log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [tid %t] %v");
    log->set_level(spdlog::level::warn);

    if (const char* env = std::getenv(kLevelEnv)) {
        log->set_level(spdlog::level::from_str(std::string(env)));
    }
    return log;
}

}  // namespace

std::shared_ptr<spdlog::logger> logger() {
    static const std::shared_ptr<spdlog::logger> instance = create_logger();
    return instance;
}

void set_log_level(spdlog::level::level_enum level) { logger()->set_level(level); }

}  // namespace lfq
