#pragma once

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace utils {

constexpr const char* INTERNAL_LOGGER = "internal_logger";

/**
 * @brief Logger for protocol chatter, silent unless enabled by the CLI
 */
inline auto internal_logger() -> std::shared_ptr<spdlog::logger>
{
    static auto logger = [] {
        auto existing = spdlog::get(INTERNAL_LOGGER);
        if (existing) {
            return existing;
        }

        auto created = spdlog::stderr_color_mt(INTERNAL_LOGGER);
        created->set_level(spdlog::level::off);
        return created;
    }();

    return logger;
}

}  // namespace utils
