/**
 * @file log.cpp
 * @brief Library logger
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "mpcint/core/log.h"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace mpcint {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get("mpcint");
        if (existing) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt("mpcint");
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace mpcint
