// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <cstdlib>
#include <fstream>

#include <tessera_log_init.hpp>
#include <transfer_client.hpp>
#include <upload_engine.hpp>

namespace tessera {
namespace app {

namespace {

bool require_map(const YAML::Node& node, const char* section, std::string& error) {
  if (!node.IsMap()) {
    error = std::string("Section '") + section + "' must be a map";
    return false;
  }
  return true;
}

bool starts_with_http(const std::string& url) {
  return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

}  // namespace

// ============================================================================
// ConfigParser Implementation
// ============================================================================

bool ConfigParser::load_from_file(const std::string& path, UploaderAppConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, UploaderAppConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);
    if (node.IsNull()) {
      return true;  // Empty document keeps the defaults
    }
    if (!node.IsMap()) {
      last_error_ = "Configuration root must be a map";
      return false;
    }

    if (node["api"] && !parse_api(node["api"], config.api)) {
      return false;
    }
    if (node["transfer"] && !parse_transfer(node["transfer"], config.transfer)) {
      return false;
    }
    if (node["retry"] && !parse_retry(node["retry"], config.retry)) {
      return false;
    }
    if (node["state"] && !parse_state(node["state"], config.state)) {
      return false;
    }
    if (node["logging"] && !parse_logging(node["logging"], config.logging)) {
      return false;
    }

    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::parse_api(const YAML::Node& node, ApiConfig& api) {
  if (!require_map(node, "api", last_error_)) {
    return false;
  }
  if (node["base_url"]) {
    api.base_url = node["base_url"].as<std::string>();
  }
  if (node["auth_token"]) {
    api.auth_token = node["auth_token"].as<std::string>();
  }
  if (node["project_complete_url"]) {
    api.project_complete_url = node["project_complete_url"].as<std::string>();
  }
  if (node["request_timeout_ms"]) {
    api.request_timeout_ms = node["request_timeout_ms"].as<int>();
  }
  if (node["verify_ssl"]) {
    api.verify_ssl = node["verify_ssl"].as<bool>();
  }
  if (node["user_agent"]) {
    api.user_agent = node["user_agent"].as<std::string>();
  }
  return true;
}

bool ConfigParser::parse_transfer(const YAML::Node& node, TransferSettings& transfer) {
  if (!require_map(node, "transfer", last_error_)) {
    return false;
  }
  if (node["default_chunk_size_mb"]) {
    transfer.default_chunk_size_mb = node["default_chunk_size_mb"].as<int>();
  }
  if (node["max_concurrent_chunks"]) {
    transfer.max_concurrent_chunks = node["max_concurrent_chunks"].as<int>();
  }
  if (node["part_timeout_ms"]) {
    transfer.part_timeout_ms = node["part_timeout_ms"].as<int>();
  }
  if (node["interrupted_completion_threshold"]) {
    transfer.interrupted_completion_threshold =
      node["interrupted_completion_threshold"].as<double>();
  }
  return true;
}

bool ConfigParser::parse_retry(const YAML::Node& node, RetrySettings& retry) {
  if (!require_map(node, "retry", last_error_)) {
    return false;
  }
  if (node["max_attempts"]) {
    retry.max_attempts = node["max_attempts"].as<int>();
  }
  if (node["initial_delay_ms"]) {
    retry.initial_delay_ms = node["initial_delay_ms"].as<int>();
  }
  if (node["max_delay_ms"]) {
    retry.max_delay_ms = node["max_delay_ms"].as<int>();
  }
  if (node["max_jitter_ms"]) {
    retry.max_jitter_ms = node["max_jitter_ms"].as<int>();
  }
  if (node["jitter"]) {
    retry.jitter = node["jitter"].as<bool>();
  }
  return true;
}

bool ConfigParser::parse_state(const YAML::Node& node, StateSettings& state) {
  if (!require_map(node, "state", last_error_)) {
    return false;
  }
  if (node["db_path"]) {
    state.db_path = node["db_path"].as<std::string>();
  }
  if (node["max_age_hours"]) {
    state.max_age_hours = node["max_age_hours"].as<int>();
  }
  if (node["cleanup_interval_s"]) {
    state.cleanup_interval_s = node["cleanup_interval_s"].as<int>();
  }
  return true;
}

bool ConfigParser::parse_logging(const YAML::Node& node, LoggingSettings& logging) {
  if (!require_map(node, "logging", last_error_)) {
    return false;
  }

  // Parse console section
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (console["level"]) {
      logging.console_level = console["level"].as<std::string>();
    }
  }

  // Parse file section
  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"]) {
      logging.file_level = file["level"].as<std::string>();
    }
    if (file["directory"]) {
      logging.file_directory = file["directory"].as<std::string>();
    }
    if (file["pattern"]) {
      logging.file_pattern = file["pattern"].as<std::string>();
    }
    if (file["format"]) {
      logging.file_format = file["format"].as<std::string>();
    }
    if (file["rotation_size_mb"]) {
      logging.rotation_size_mb = file["rotation_size_mb"].as<uint64_t>();
    }
    if (file["max_files"]) {
      logging.max_files = file["max_files"].as<int>();
    }
    if (file["rotate_at_midnight"]) {
      logging.rotate_at_midnight = file["rotate_at_midnight"].as<bool>();
    }
  }
  return true;
}

bool ConfigParser::validate(const UploaderAppConfig& config, std::string& error_msg) {
  if (config.api.base_url.empty()) {
    error_msg = "api.base_url is not configured";
    return false;
  }
  if (!starts_with_http(config.api.base_url)) {
    error_msg = "Invalid api.base_url - must start with http:// or https://";
    return false;
  }
  if (!config.api.project_complete_url.empty() &&
      !starts_with_http(config.api.project_complete_url)) {
    error_msg = "Invalid api.project_complete_url - must start with http:// or https://";
    return false;
  }
  if (config.api.request_timeout_ms <= 0) {
    error_msg = "Invalid api.request_timeout_ms - must be > 0";
    return false;
  }

  if (config.transfer.default_chunk_size_mb < 1 || config.transfer.default_chunk_size_mb > 5120) {
    error_msg = "Invalid transfer.default_chunk_size_mb - must be between 1 and 5120";
    return false;
  }
  if (config.transfer.max_concurrent_chunks < 1 || config.transfer.max_concurrent_chunks > 16) {
    error_msg = "Invalid transfer.max_concurrent_chunks - must be between 1 and 16";
    return false;
  }
  if (config.transfer.part_timeout_ms <= 0) {
    error_msg = "Invalid transfer.part_timeout_ms - must be > 0";
    return false;
  }
  if (config.transfer.interrupted_completion_threshold <= 0.0 ||
      config.transfer.interrupted_completion_threshold > 1.0) {
    error_msg = "Invalid transfer.interrupted_completion_threshold - must be in (0, 1]";
    return false;
  }

  if (config.retry.max_attempts < 1 || config.retry.max_attempts > 100) {
    error_msg = "Invalid retry.max_attempts - must be between 1 and 100";
    return false;
  }
  if (config.retry.initial_delay_ms < 0) {
    error_msg = "Invalid retry.initial_delay_ms - must be >= 0";
    return false;
  }
  if (config.retry.max_delay_ms < config.retry.initial_delay_ms) {
    error_msg = "Invalid retry.max_delay_ms - must be >= initial_delay_ms";
    return false;
  }
  if (config.retry.max_jitter_ms < 0) {
    error_msg = "Invalid retry.max_jitter_ms - must be >= 0";
    return false;
  }

  if (config.state.db_path.empty()) {
    error_msg = "state.db_path is empty";
    return false;
  }
  if (config.state.max_age_hours < 1) {
    error_msg = "Invalid state.max_age_hours - must be >= 1";
    return false;
  }
  if (config.state.cleanup_interval_s < 1) {
    error_msg = "Invalid state.cleanup_interval_s - must be >= 1";
    return false;
  }

  if (config.logging.file_format != "json" && config.logging.file_format != "text") {
    error_msg = "Logging file format must be 'json' or 'text'";
    return false;
  }

  return true;
}

void apply_env_overrides(UploaderAppConfig& config) {
  const char* token = std::getenv("TESSERA_API_TOKEN");
  if (token && *token) {
    config.api.auth_token = token;
  }
  const char* base_url = std::getenv("TESSERA_API_BASE_URL");
  if (base_url && *base_url) {
    config.api.base_url = base_url;
  }
}

void convert_logging_config(
  const LoggingSettings& yaml_config, ::tessera::logging::LoggingConfig& log_config
) {
  // Console settings
  log_config.console_enabled = yaml_config.console_enabled;
  log_config.console_colors = yaml_config.console_colors;
  if (auto level = ::tessera::logging::parse_severity_level(yaml_config.console_level)) {
    log_config.console_level = *level;
  }

  // File settings
  log_config.file_enabled = yaml_config.file_enabled;
  if (auto level = ::tessera::logging::parse_severity_level(yaml_config.file_level)) {
    log_config.file_level = *level;
  }

  log_config.file_config.directory = yaml_config.file_directory;
  log_config.file_config.file_pattern = yaml_config.file_pattern;
  log_config.file_config.format_json = (yaml_config.file_format == "json");
  log_config.file_config.rotation_size_mb = yaml_config.rotation_size_mb;
  log_config.file_config.max_files = yaml_config.max_files;
  log_config.file_config.rotate_at_midnight = yaml_config.rotate_at_midnight;
}

void convert_engine_config(
  const UploaderAppConfig& config, ::tessera::uploader::UploadEngineConfig& engine_config
) {
  engine_config.default_chunk_size =
    static_cast<uint64_t>(config.transfer.default_chunk_size_mb) * 1024 * 1024;
  engine_config.interrupted_completion_threshold = config.transfer.interrupted_completion_threshold;
  engine_config.scheduler.max_concurrent_chunks = config.transfer.max_concurrent_chunks;
  engine_config.scheduler.part_timeout = std::chrono::milliseconds(config.transfer.part_timeout_ms);

  engine_config.scheduler.retry.max_attempts = config.retry.max_attempts;
  engine_config.scheduler.retry.initial_delay = std::chrono::milliseconds(config.retry.initial_delay_ms);
  engine_config.scheduler.retry.max_delay = std::chrono::milliseconds(config.retry.max_delay_ms);
  engine_config.scheduler.retry.max_jitter = std::chrono::milliseconds(config.retry.max_jitter_ms);
  engine_config.scheduler.retry.jitter = config.retry.jitter;

  engine_config.max_session_age = std::chrono::hours(config.state.max_age_hours);
  engine_config.cleanup_interval = std::chrono::seconds(config.state.cleanup_interval_s);
}

void convert_client_config(
  const UploaderAppConfig& config, ::tessera::uploader::TransferClientConfig& client_config
) {
  client_config.api_base_url = config.api.base_url;
  client_config.auth_token = config.api.auth_token;
  client_config.project_complete_url = config.api.project_complete_url;
  client_config.request_timeout = std::chrono::milliseconds(config.api.request_timeout_ms);
}

}  // namespace app
}  // namespace tessera
