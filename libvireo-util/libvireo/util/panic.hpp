#pragma once

#include <cstdlib>
#include <libvireo/util/logger.hpp>

namespace vireo::util {

/**
 * @brief Logs the message and crashes. Reserved for broken invariants after which the program state cannot be
 * trusted anymore.
 *
 */
template <typename... Args>
[[noreturn]] inline void panic(Logger& logger, Logger::FormatWithLocation fmt_loc, const Args&... args) {
  logger.log(LogLevel::Err, false, fmt_loc.loc, fmt_loc.value, args...);
  logger.err("Program has crashed!");
  std::abort();
}

}  // namespace vireo::util
