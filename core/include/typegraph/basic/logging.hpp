// typegraph/basic/logging.hpp - Process-wide log configuration
//
// All components log through the spdlog default logger with a
// "[Component] message" convention. The CLI configures it once.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace typegraph
{

enum class LogLevel : uint8_t {
  Quiet,    // warnings and errors only
  Info,     // progress summary
  Verbose,  // every type and member
};

/**
 * Install a colored stderr logger as the spdlog default and set its level.
 *
 * Safe to call more than once; later calls only adjust the level.
 */
void configure_logging(LogLevel level);

[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

[[nodiscard]] std::string_view to_string(LogLevel level) noexcept;

}  // namespace typegraph
