/**
 * @file log.h
 * @brief Library logger
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef MPCINT_CORE_LOG_H
#define MPCINT_CORE_LOG_H

#include <memory>

#include <spdlog/spdlog.h>

namespace mpcint {

/**
 * @brief Shared "mpcint" logger (stderr sink, created on first use)
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the level of the "mpcint" logger
 */
void set_log_level(spdlog::level::level_enum level);

} // namespace mpcint

#endif // MPCINT_CORE_LOG_H
