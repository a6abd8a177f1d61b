#pragma once

/** \file log.hpp
 *  \brief Library logger (spdlog).
 *
 * All components log through the shared "embdb" logger. It is created on first use with a
 * stderr colour sink; applications may replace it with set_logger() before any VectorDb is
 * constructed.
 */

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace embdb::core {

/** \brief Shared library logger; never null. */
auto logger() -> std::shared_ptr<spdlog::logger>;

/** \brief Replace the library logger (null restores the default). */
void set_logger(std::shared_ptr<spdlog::logger> replacement);

/** \brief Parse "trace|debug|info|warn|error|critical|off"; returns false on unknown names. */
bool parse_log_level(std::string_view name, spdlog::level::level_enum& out);

} // namespace embdb::core
