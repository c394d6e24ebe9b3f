#include "common/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace eap {

namespace {
constexpr const char* kLoggerName = "eap";
}

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get(kLoggerName);
        if (existing) return existing;
        auto created = spdlog::stdout_color_mt(kLoggerName);
        created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        created->set_level(spdlog::level::info);
        return created;
    }();
    return instance;
}

void setLogLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace eap
