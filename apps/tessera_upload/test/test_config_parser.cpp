// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_config_parser.cpp
 * @brief Unit tests for ConfigParser and UploaderAppConfig
 *
 * Tests YAML parsing, validation, environment overrides and the conversion
 * into engine, client and logging configuration.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <tessera_log_init.hpp>
#include <transfer_client.hpp>
#include <upload_engine.hpp>

#include "../config_parser.hpp"

namespace fs = std::filesystem;

using namespace tessera::app;

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigParserTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() /
                ("tessera_config_test_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(test_dir_);
    unsetenv("TESSERA_API_TOKEN");
    unsetenv("TESSERA_API_BASE_URL");
  }

  void TearDown() override {
    unsetenv("TESSERA_API_TOKEN");
    unsetenv("TESSERA_API_BASE_URL");
    if (fs::exists(test_dir_)) {
      fs::remove_all(test_dir_);
    }
  }

  std::string write_test_file(const std::string& filename, const std::string& content) {
    auto path = test_dir_ / filename;
    std::ofstream file(path);
    file << content;
    return path.string();
  }

  static UploaderAppConfig valid_config() {
    UploaderAppConfig config;
    config.api.base_url = "https://api.example.com/api/upload";
    return config;
  }

  fs::path test_dir_;
};

// ============================================================================
// Parsing
// ============================================================================

TEST_F(ConfigParserTest, ParseFullConfig) {
  const std::string yaml = R"(
api:
  base_url: https://api.example.com/api/upload
  auth_token: abc
  project_complete_url: https://api.example.com/api/projects/complete
  request_timeout_ms: 15000
  verify_ssl: false
transfer:
  default_chunk_size_mb: 16
  max_concurrent_chunks: 4
  part_timeout_ms: 60000
  interrupted_completion_threshold: 0.9
retry:
  max_attempts: 5
  initial_delay_ms: 500
  max_delay_ms: 4000
  max_jitter_ms: 100
  jitter: false
state:
  db_path: /tmp/tessera/state.db
  max_age_hours: 48
  cleanup_interval_s: 60
logging:
  console:
    enabled: true
    colors: false
    level: warn
  file:
    enabled: true
    level: debug
    directory: /tmp/tessera/logs
    format: text
    rotation_size_mb: 10
    max_files: 3
)";

  ConfigParser parser;
  UploaderAppConfig config;
  ASSERT_TRUE(parser.load_from_string(yaml, config)) << parser.get_last_error();

  EXPECT_EQ(config.api.base_url, "https://api.example.com/api/upload");
  EXPECT_EQ(config.api.auth_token, "abc");
  EXPECT_EQ(config.api.request_timeout_ms, 15000);
  EXPECT_FALSE(config.api.verify_ssl);
  EXPECT_EQ(config.transfer.default_chunk_size_mb, 16);
  EXPECT_EQ(config.transfer.max_concurrent_chunks, 4);
  EXPECT_DOUBLE_EQ(config.transfer.interrupted_completion_threshold, 0.9);
  EXPECT_EQ(config.retry.max_attempts, 5);
  EXPECT_FALSE(config.retry.jitter);
  EXPECT_EQ(config.state.db_path, "/tmp/tessera/state.db");
  EXPECT_EQ(config.state.max_age_hours, 48);
  EXPECT_EQ(config.logging.console_level, "warn");
  EXPECT_FALSE(config.logging.console_colors);
  EXPECT_TRUE(config.logging.file_enabled);
  EXPECT_EQ(config.logging.file_format, "text");
  EXPECT_EQ(config.logging.max_files, 3);

  std::string error;
  EXPECT_TRUE(ConfigParser::validate(config, error)) << error;
}

TEST_F(ConfigParserTest, MissingSectionsKeepDefaults) {
  ConfigParser parser;
  UploaderAppConfig config;
  ASSERT_TRUE(parser.load_from_string("api:\n  base_url: http://localhost:9000\n", config));

  EXPECT_EQ(config.transfer.default_chunk_size_mb, 8);
  EXPECT_EQ(config.transfer.max_concurrent_chunks, 3);
  EXPECT_DOUBLE_EQ(config.transfer.interrupted_completion_threshold, 0.95);
  EXPECT_EQ(config.retry.max_attempts, 3);
  EXPECT_EQ(config.retry.initial_delay_ms, 2000);
  EXPECT_EQ(config.retry.max_delay_ms, 10000);
  EXPECT_EQ(config.state.max_age_hours, 24);
}

TEST_F(ConfigParserTest, EmptyDocumentKeepsDefaults) {
  ConfigParser parser;
  UploaderAppConfig config;
  EXPECT_TRUE(parser.load_from_string("", config));
  EXPECT_TRUE(config.api.base_url.empty());
}

TEST_F(ConfigParserTest, LoadFromFile) {
  auto path = write_test_file("upload.yaml", "api:\n  base_url: https://x.example.com\n");

  ConfigParser parser;
  UploaderAppConfig config;
  ASSERT_TRUE(parser.load_from_file(path, config)) << parser.get_last_error();
  EXPECT_EQ(config.api.base_url, "https://x.example.com");
}

TEST_F(ConfigParserTest, MissingFileReportsError) {
  ConfigParser parser;
  UploaderAppConfig config;
  EXPECT_FALSE(parser.load_from_file((test_dir_ / "missing.yaml").string(), config));
  EXPECT_NE(parser.get_last_error().find("not found"), std::string::npos);
}

TEST_F(ConfigParserTest, MalformedYamlReportsError) {
  ConfigParser parser;
  UploaderAppConfig config;
  EXPECT_FALSE(parser.load_from_string("api: [unclosed", config));
  EXPECT_FALSE(parser.get_last_error().empty());
}

TEST_F(ConfigParserTest, WrongScalarTypeReportsError) {
  ConfigParser parser;
  UploaderAppConfig config;
  EXPECT_FALSE(parser.load_from_string("transfer:\n  max_concurrent_chunks: many\n", config));
  EXPECT_NE(parser.get_last_error().find("Failed to parse YAML"), std::string::npos);
}

TEST_F(ConfigParserTest, SectionMustBeMap) {
  ConfigParser parser;
  UploaderAppConfig config;
  EXPECT_FALSE(parser.load_from_string("retry: 3\n", config));
  EXPECT_EQ(parser.get_last_error(), "Section 'retry' must be a map");
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ConfigParserTest, ValidateRequiresBaseUrl) {
  UploaderAppConfig config;
  std::string error;
  EXPECT_FALSE(ConfigParser::validate(config, error));
  EXPECT_EQ(error, "api.base_url is not configured");

  config.api.base_url = "ftp://example.com";
  EXPECT_FALSE(ConfigParser::validate(config, error));
}

TEST_F(ConfigParserTest, ValidateRanges) {
  std::string error;

  auto config = valid_config();
  config.transfer.max_concurrent_chunks = 0;
  EXPECT_FALSE(ConfigParser::validate(config, error));

  config = valid_config();
  config.transfer.interrupted_completion_threshold = 1.5;
  EXPECT_FALSE(ConfigParser::validate(config, error));

  config = valid_config();
  config.retry.max_attempts = 0;
  EXPECT_FALSE(ConfigParser::validate(config, error));

  config = valid_config();
  config.retry.initial_delay_ms = 5000;
  config.retry.max_delay_ms = 1000;
  EXPECT_FALSE(ConfigParser::validate(config, error));
  EXPECT_NE(error.find("max_delay_ms"), std::string::npos);

  config = valid_config();
  config.state.db_path.clear();
  EXPECT_FALSE(ConfigParser::validate(config, error));

  config = valid_config();
  config.logging.file_format = "xml";
  EXPECT_FALSE(ConfigParser::validate(config, error));

  EXPECT_TRUE(ConfigParser::validate(valid_config(), error)) << error;
}

// ============================================================================
// Environment overrides and conversion
// ============================================================================

TEST_F(ConfigParserTest, EnvironmentOverridesToken) {
  auto config = valid_config();
  config.api.auth_token = "from-file";

  setenv("TESSERA_API_TOKEN", "from-env", 1);
  setenv("TESSERA_API_BASE_URL", "https://override.example.com", 1);
  apply_env_overrides(config);

  EXPECT_EQ(config.api.auth_token, "from-env");
  EXPECT_EQ(config.api.base_url, "https://override.example.com");
}

TEST_F(ConfigParserTest, EmptyEnvironmentValueIsIgnored) {
  auto config = valid_config();
  config.api.auth_token = "from-file";

  setenv("TESSERA_API_TOKEN", "", 1);
  apply_env_overrides(config);
  EXPECT_EQ(config.api.auth_token, "from-file");
}

TEST_F(ConfigParserTest, ConvertEngineConfig) {
  auto config = valid_config();
  config.transfer.default_chunk_size_mb = 16;
  config.transfer.max_concurrent_chunks = 5;
  config.retry.initial_delay_ms = 100;
  config.retry.jitter = false;
  config.state.max_age_hours = 2;

  tessera::uploader::UploadEngineConfig engine_config;
  convert_engine_config(config, engine_config);

  EXPECT_EQ(engine_config.default_chunk_size, 16ULL * 1024 * 1024);
  EXPECT_EQ(engine_config.scheduler.max_concurrent_chunks, 5);
  EXPECT_EQ(engine_config.scheduler.retry.initial_delay, std::chrono::milliseconds(100));
  EXPECT_FALSE(engine_config.scheduler.retry.jitter);
  EXPECT_EQ(engine_config.max_session_age, std::chrono::hours(2));
}

TEST_F(ConfigParserTest, ConvertClientConfig) {
  auto config = valid_config();
  config.api.auth_token = "token";
  config.api.request_timeout_ms = 5000;

  tessera::uploader::TransferClientConfig client_config;
  convert_client_config(config, client_config);

  EXPECT_EQ(client_config.api_base_url, "https://api.example.com/api/upload");
  EXPECT_EQ(client_config.auth_token, "token");
  EXPECT_EQ(client_config.request_timeout, std::chrono::milliseconds(5000));
}

TEST_F(ConfigParserTest, ConvertLoggingConfig) {
  LoggingSettings settings;
  settings.console_level = "error";
  settings.file_level = "bogus";
  settings.file_enabled = true;
  settings.file_format = "text";
  settings.file_directory = "/tmp/tessera-logs";

  tessera::logging::LoggingConfig log_config;
  auto default_file_level = log_config.file_level;
  convert_logging_config(settings, log_config);

  EXPECT_EQ(log_config.console_level, tessera::logging::severity_level::error);
  EXPECT_EQ(log_config.file_level, default_file_level);
  EXPECT_TRUE(log_config.file_enabled);
  EXPECT_FALSE(log_config.file_config.format_json);
  EXPECT_EQ(log_config.file_config.directory, "/tmp/tessera-logs");
}
