// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_file_sink.cpp
 * @brief Unit tests for the rotating file sink and its formatters
 */

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "tessera_file_sink.hpp"
#include "tessera_log_init.hpp"
#include "tessera_log_macros.hpp"

namespace fs = std::filesystem;

using namespace tessera::logging;

// ============================================================================
// escape_json
// ============================================================================

TEST(EscapeJsonTest, PlainTextUnchanged) {
  EXPECT_EQ(escape_json("upload started"), "upload started");
}

TEST(EscapeJsonTest, EscapesQuotesAndBackslashes) {
  EXPECT_EQ(escape_json("say \"hi\""), "say \\\"hi\\\"");
  EXPECT_EQ(escape_json("C:\\path"), "C:\\\\path");
}

TEST(EscapeJsonTest, EscapesControlCharacters) {
  EXPECT_EQ(escape_json("a\nb\tc\rd"), "a\\nb\\tc\\rd");
  std::string ctrl = "x";
  ctrl += '\x01';
  EXPECT_EQ(escape_json(ctrl), "x\\u0001");
}

// ============================================================================
// File sink output
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() /
                ("tessera_file_sink_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(test_dir_);

    if (is_logging_initialized()) {
      shutdown_logging();
    }
  }

  void TearDown() override {
    if (is_logging_initialized()) {
      shutdown_logging();
    }
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  std::string readAllLogs() const {
    std::ostringstream out;
    for (const auto& entry : fs::directory_iterator(test_dir_)) {
      std::ifstream in(entry.path());
      out << in.rdbuf();
    }
    return out.str();
  }

  LoggingConfig fileOnlyConfig(bool json) const {
    LoggingConfig config;
    config.console_enabled = false;
    config.file_enabled = true;
    config.file_level = severity_level::debug;
    config.file_config.directory = test_dir_.string();
    config.file_config.file_pattern = "test_%N.log";
    config.file_config.rotate_at_midnight = false;
    config.file_config.format_json = json;
    return config;
  }

  fs::path test_dir_;
};

TEST_F(FileSinkTest, CreateWithConfig) {
  FileSinkConfig config;
  config.directory = test_dir_.string();
  config.file_pattern = "create_%N.log";

  auto sink = create_file_sink(config, severity_level::info);
  ASSERT_NE(sink, nullptr);
}

TEST_F(FileSinkTest, JsonLinesCarryUploadContext) {
  init_logging(fileOnlyConfig(true));

  {
    TESSERA_LOG_SCOPED_UPLOAD(std::string("proj-1"), std::string("upload-9"));
    TESSERA_LOG_INFO("Part uploaded" << kv("part", 2));
  }
  TESSERA_LOG_WARN("No context \"quoted\"");

  shutdown_logging();

  std::string logs = readAllLogs();
  EXPECT_NE(logs.find("\"project_id\":\"proj-1\""), std::string::npos);
  EXPECT_NE(logs.find("\"upload_id\":\"upload-9\""), std::string::npos);
  EXPECT_NE(logs.find("Part uploaded part=2"), std::string::npos);
  EXPECT_NE(logs.find("No context \\\"quoted\\\""), std::string::npos);
}

TEST_F(FileSinkTest, TextFormatAppendsContext) {
  init_logging(fileOnlyConfig(false));

  {
    TESSERA_LOG_SCOPED_UPLOAD(std::string("proj-2"), std::string("upload-3"));
    TESSERA_LOG_ERROR("Upload failed");
  }

  shutdown_logging();

  std::string logs = readAllLogs();
  EXPECT_NE(logs.find("Upload failed"), std::string::npos);
  EXPECT_NE(logs.find("project_id=proj-2"), std::string::npos);
  EXPECT_NE(logs.find("upload_id=upload-3"), std::string::npos);
}

TEST_F(FileSinkTest, SeverityFilterDropsLowerLevels) {
  LoggingConfig config = fileOnlyConfig(true);
  config.file_level = severity_level::warn;
  init_logging(config);

  TESSERA_LOG_INFO("filtered info record");
  TESSERA_LOG_ERROR("kept error record");

  shutdown_logging();

  std::string logs = readAllLogs();
  EXPECT_EQ(logs.find("filtered info record"), std::string::npos);
  EXPECT_NE(logs.find("kept error record"), std::string::npos);
}

TEST_F(FileSinkTest, UncreatableDirectoryFallsBack) {
  FileSinkConfig config;
  config.directory = "/proc/tessera_cannot_create";
  config.file_pattern = "fallback_%N.log";

  auto sink = create_file_sink(config, severity_level::info);
  ASSERT_NE(sink, nullptr);
}
