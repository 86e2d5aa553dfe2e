// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TESSERA_LOG_INIT_HPP
#define TESSERA_LOG_INIT_HPP

#include <optional>
#include <string>

#include "tessera_console_sink.hpp"
#include "tessera_file_sink.hpp"
#include "tessera_log_severity.hpp"

namespace tessera {
namespace logging {

/**
 * Logging configuration for tessera processes.
 */
struct LoggingConfig {
  // Console sink
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  // File sink
  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

/**
 * Parse a string to severity_level.
 * Accepts: "debug", "info", "warn", "warning", "error", "fatal" (case-insensitive)
 *
 * @return The parsed level, or std::nullopt if invalid
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply environment variable overrides to a LoggingConfig.
 *
 * Supported environment variables:
 *   TESSERA_LOG_LEVEL           - Global level (overrides both console and file)
 *   TESSERA_LOG_CONSOLE_LEVEL   - Console sink level
 *   TESSERA_LOG_FILE_LEVEL      - File sink level
 *   TESSERA_LOG_FILE_DIR        - Log file directory
 *   TESSERA_LOG_FORMAT          - File format ("json" or "text")
 *   TESSERA_LOG_FILE_ENABLED    - Enable file logging ("true" or "false")
 *   TESSERA_LOG_CONSOLE_ENABLED - Enable console logging ("true" or "false")
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Initialize logging. Calling it again without shutdown_logging() is a no-op.
 */
void init_logging(const LoggingConfig& config);

/**
 * Console at INFO with colors, file sink disabled.
 */
void init_logging_default();

/**
 * Stop async sink threads, flush pending records and detach all sinks.
 */
void shutdown_logging();

void flush_logging();

/**
 * Shut down and re-initialize with a new config (env overrides applied).
 */
void reconfigure_logging(const LoggingConfig& config);

bool is_logging_initialized();

}  // namespace logging
}  // namespace tessera

#endif  // TESSERA_LOG_INIT_HPP
