#pragma once

/// @file log.h
/// Stage loggers built on spdlog.

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace volmap {
namespace log {

/// Install the logger for a lifecycle stage (`pre-up`, `container-startup`,
/// ...).  Lines are prefixed `[volmap:<stage>]`.  Calling again replaces
/// the previous logger.
void init(const std::string& stage,
          spdlog::level::level_enum level = spdlog::level::info);

/// The current stage logger.  Falls back to a plain `volmap` logger when
/// init() has not been called, so library code can always log.
std::shared_ptr<spdlog::logger> get();

/// Parse `trace|debug|info|warn|error|critical|off`.
/// @throws ConfigError for anything else.
spdlog::level::level_enum parse_level(const std::string& name);

} // namespace log
} // namespace volmap
