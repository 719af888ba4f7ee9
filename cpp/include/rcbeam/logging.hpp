#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace rcbeam {

/**
 * @brief Shared "rcbeam" logger
 *
 * Created on first use with a stderr color sink at level "warn".
 * If a logger named "rcbeam" is already registered with spdlog
 * (e.g. by a host application), that logger is used instead.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the level of the "rcbeam" logger
 */
void set_log_level(spdlog::level::level_enum level);

} // namespace rcbeam
