// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "tessera_file_sink.hpp"

#include <boost/filesystem.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>

#include <cstdio>
#include <iostream>
#include <optional>
#include <sstream>

#include "tessera_console_sink.hpp"

namespace tessera {
namespace logging {

namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;
namespace sinks = boost::log::sinks;

std::string escape_json(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 16);
  for (unsigned char c : s) {
    const char* replacement = nullptr;
    if (c == '"') {
      replacement = "\\\"";
    } else if (c == '\\') {
      replacement = "\\\\";
    } else if (c == '\n') {
      replacement = "\\n";
    } else if (c == '\r') {
      replacement = "\\r";
    } else if (c == '\t') {
      replacement = "\\t";
    }

    if (replacement != nullptr) {
      out += replacement;
    } else if (c < 0x20) {
      char hex[8];
      std::snprintf(hex, sizeof(hex), "\\u%04x", static_cast<unsigned>(c));
      out += hex;
    } else {
      out += static_cast<char>(c);
    }
  }
  return out;
}

namespace {

template <typename T>
std::optional<T> attr(boost::log::record_view const& rec, const char* name) {
  auto value = boost::log::extract<T>(name, rec);
  if (!value) {
    return std::nullopt;
  }
  return *value;
}

void append_json_field(
  boost::log::formatting_ostream& strm, const char* key, const std::string& value
) {
  strm << ",\"" << key << "\":\"" << escape_json(value) << "\"";
}

/**
 * One JSON object per line: ts, level, msg, then thread_id and the upload
 * context keys when the record carries them.
 */
void json_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  std::ostringstream ts;
  if (auto time_stamp = attr<boost::posix_time::ptime>(rec, "TimeStamp")) {
    ts << *time_stamp;
  }
  std::ostringstream level;
  if (auto sev = attr<severity_level>(rec, "Severity")) {
    level << *sev;
  }

  strm << "{\"ts\":\"" << ts.str() << "\"";
  append_json_field(strm, "level", level.str());
  append_json_field(strm, "msg", rec[expr::smessage].get());

  using thread_id_t = boost::log::attributes::current_thread_id::value_type;
  if (auto tid = attr<thread_id_t>(rec, "ThreadID")) {
    std::ostringstream id;
    id << *tid;
    append_json_field(strm, "thread_id", id.str());
  }
  if (auto project = attr<std::string>(rec, kProjectIdAttr)) {
    append_json_field(strm, "project_id", *project);
  }
  if (auto upload = attr<std::string>(rec, kUploadIdAttr)) {
    append_json_field(strm, "upload_id", *upload);
  }
  strm << "}";
}

// [ts] [level] message {project=.. upload=..}
void text_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  strm << "[";
  if (auto time_stamp = attr<boost::posix_time::ptime>(rec, "TimeStamp")) {
    strm << *time_stamp;
  }
  strm << "] ";
  if (auto sev = attr<severity_level>(rec, "Severity")) {
    strm << "[" << *sev << "] ";
  }
  strm << rec[expr::smessage];
  format_upload_context(rec, strm);
}

/**
 * Create the configured directory, or fall back to /tmp when that fails
 */
std::string resolve_log_directory(const std::string& configured) {
  boost::filesystem::path dir(configured);
  if (boost::filesystem::is_directory(dir)) {
    return configured;
  }

  boost::system::error_code ec;
  boost::filesystem::create_directories(dir, ec);
  if (!ec) {
    return configured;
  }

  // Logging is not up yet, so stderr is the only channel
  std::cerr << "[tessera_logging] cannot create log directory '" << configured
            << "': " << ec.message() << ", using /tmp\n";
  return "/tmp";
}

}  // namespace

boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level
) {
  const std::string directory = resolve_log_directory(config.directory);

  auto backend = boost::make_shared<sinks::text_file_backend>(
    keywords::file_name = directory + "/" + config.file_pattern,
    keywords::rotation_size = config.rotation_size_mb * 1024 * 1024,
    keywords::auto_flush = true
  );
  if (config.rotate_at_midnight) {
    backend->set_time_based_rotation(sinks::file::rotation_at_time_point(0, 0, 0));
  }
  backend->set_file_collector(
    sinks::file::make_collector(keywords::target = directory, keywords::max_files = config.max_files)
  );
  backend->scan_for_files();

  auto sink = boost::make_shared<async_file_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  sink->set_formatter(config.format_json ? &json_formatter : &text_formatter);
  return sink;
}

}  // namespace logging
}  // namespace tessera
