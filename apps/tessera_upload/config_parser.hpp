// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TESSERA_UPLOAD_CONFIG_PARSER_HPP
#define TESSERA_UPLOAD_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>

// Forward declarations
namespace tessera {
namespace logging {
struct LoggingConfig;
}
namespace uploader {
struct UploadEngineConfig;
struct TransferClientConfig;
}  // namespace uploader
}  // namespace tessera

namespace tessera {
namespace app {

/**
 * Backend API access
 */
struct ApiConfig {
  std::string base_url;              // e.g. https://api.example.com/api/upload
  std::string auth_token;            // Overridden by TESSERA_API_TOKEN
  std::string project_complete_url;  // Empty disables the notification
  int request_timeout_ms = 30000;
  bool verify_ssl = true;
  std::string user_agent = "tessera-uploader/1.0";
};

struct TransferSettings {
  int default_chunk_size_mb = 8;
  int max_concurrent_chunks = 3;
  int part_timeout_ms = 120000;
  double interrupted_completion_threshold = 0.95;
};

struct RetrySettings {
  int max_attempts = 3;
  int initial_delay_ms = 2000;
  int max_delay_ms = 10000;
  int max_jitter_ms = 500;
  bool jitter = true;
};

struct StateSettings {
  std::string db_path = "/var/lib/tessera/upload_state.db";
  int max_age_hours = 24;
  int cleanup_interval_s = 300;
};

/**
 * Logging section as written in YAML. Levels and format stay strings here and
 * are resolved by convert_logging_config().
 */
struct LoggingSettings {
  bool console_enabled = true;
  bool console_colors = true;
  std::string console_level = "info";

  bool file_enabled = false;
  std::string file_level = "debug";
  std::string file_directory = "/var/log/tessera";
  std::string file_pattern = "tessera_upload_%Y%m%d_%H%M%S.log";
  std::string file_format = "json";  // json or text
  uint64_t rotation_size_mb = 50;
  int max_files = 10;
  bool rotate_at_midnight = true;
};

struct UploaderAppConfig {
  ApiConfig api;
  TransferSettings transfer;
  RetrySettings retry;
  StateSettings state;
  LoggingSettings logging;
};

/**
 * Convert LoggingSettings to tessera::logging::LoggingConfig.
 * Unknown level names keep the library defaults.
 */
void convert_logging_config(
  const LoggingSettings& yaml_config, ::tessera::logging::LoggingConfig& log_config
);

void convert_engine_config(
  const UploaderAppConfig& config, ::tessera::uploader::UploadEngineConfig& engine_config
);

void convert_client_config(
  const UploaderAppConfig& config, ::tessera::uploader::TransferClientConfig& client_config
);

/**
 * Apply TESSERA_API_TOKEN and TESSERA_API_BASE_URL when set and non-empty
 */
void apply_env_overrides(UploaderAppConfig& config);

class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file
   */
  bool load_from_file(const std::string& path, UploaderAppConfig& config);

  /**
   * Load configuration from YAML string
   */
  bool load_from_string(const std::string& yaml_content, UploaderAppConfig& config);

  /**
   * Validate configuration
   */
  static bool validate(const UploaderAppConfig& config, std::string& error_msg);

  /**
   * Get last error message
   */
  std::string get_last_error() const {
    return last_error_;
  }

private:
  bool parse_api(const YAML::Node& node, ApiConfig& api);
  bool parse_transfer(const YAML::Node& node, TransferSettings& transfer);
  bool parse_retry(const YAML::Node& node, RetrySettings& retry);
  bool parse_state(const YAML::Node& node, StateSettings& state);
  bool parse_logging(const YAML::Node& node, LoggingSettings& logging);

  // Last error message
  mutable std::string last_error_;
};

}  // namespace app
}  // namespace tessera

#endif  // TESSERA_UPLOAD_CONFIG_PARSER_HPP
