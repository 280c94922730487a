#pragma once
/*
===========================================================
Core: Logging
FILE: cpp/engine/core/logging.hpp
===========================================================
  - One process-wide threshold; the assessment pipeline logs DEBUG traces
    and a WARN when input blocks, the CLI logs INFO/ERROR.
  - Section/load, composers, solver and curves never log.
  - Line format: "<UTC ms timestamp> <LEVEL> arbor: <message>".
  - WARN/ERROR to stderr, DEBUG/INFO to stdout. Nothing here throws.
===========================================================
*/

#include <optional>
#include <string>
#include <string_view>

namespace arbor {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

void set_log_level(LogLevel lvl) noexcept;
LogLevel get_log_level() noexcept;

// Case-insensitive level name; "warning" is accepted for WARN.
std::optional<LogLevel> parse_log_level(std::string_view s) noexcept;

// ARBOR_LOG_LEVEL=debug|info|warn|error; unset or invalid leaves the level alone.
void init_log_level_from_env() noexcept;

// Lets callers skip building expensive trace strings.
bool log_enabled(LogLevel lvl) noexcept;

void log(LogLevel lvl, const std::string& msg) noexcept;

inline void log_debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
inline void log_info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
inline void log_warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
inline void log_error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }

}  // namespace arbor
