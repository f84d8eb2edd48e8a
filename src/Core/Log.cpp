/**
 * @file Log.cpp
 * @brief Library logger setup
 */

#include <FaceGate/Core/Log.h>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <string>

namespace FaceGate::Log {

namespace {

spdlog::level::level_enum InitialLevel() {
    const char* env = std::getenv("FACEGATE_LOG_LEVEL");
    if (env == nullptr || *env == '\0') {
        return spdlog::level::info;
    }
    // from_str maps unknown names to "off"; keep info in that case
    spdlog::level::level_enum level = spdlog::level::from_str(env);
    if (level == spdlog::level::off && std::string(env) != "off") {
        return spdlog::level::info;
    }
    return level;
}

std::shared_ptr<spdlog::logger> CreateLogger() {
    auto existing = spdlog::get(LOGGER_NAME);
    if (existing) {
        return existing;
    }
    auto logger = spdlog::stderr_color_mt(LOGGER_NAME);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    logger->set_level(InitialLevel());
    return logger;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> Get() {
    static std::shared_ptr<spdlog::logger> logger = CreateLogger();
    return logger;
}

void SetLevel(spdlog::level::level_enum level) {
    Get()->set_level(level);
}

} // namespace FaceGate::Log
