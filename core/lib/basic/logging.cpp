// typegraph/basic/logging.cpp - spdlog setup
#include "typegraph/basic/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace typegraph
{

namespace
{

constexpr const char * k_logger_name = "typegraph";

spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept
{
  switch (level) {
    case LogLevel::Quiet:
      return spdlog::level::warn;
    case LogLevel::Info:
      return spdlog::level::info;
    case LogLevel::Verbose:
      return spdlog::level::debug;
  }
  return spdlog::level::info;
}

}  // namespace

void configure_logging(LogLevel level)
{
  auto logger = spdlog::get(k_logger_name);
  if (!logger) {
    logger = spdlog::stderr_color_mt(k_logger_name);
    logger->set_pattern("%^[%l]%$ %v");
    spdlog::set_default_logger(logger);
  }
  logger->set_level(to_spdlog_level(level));
}

std::optional<LogLevel> parse_log_level(std::string_view text) noexcept
{
  if (text == "quiet") return LogLevel::Quiet;
  if (text == "info") return LogLevel::Info;
  if (text == "verbose") return LogLevel::Verbose;
  return std::nullopt;
}

std::string_view to_string(LogLevel level) noexcept
{
  switch (level) {
    case LogLevel::Quiet:
      return "quiet";
    case LogLevel::Info:
      return "info";
    case LogLevel::Verbose:
      return "verbose";
  }
  return "info";
}

}  // namespace typegraph
