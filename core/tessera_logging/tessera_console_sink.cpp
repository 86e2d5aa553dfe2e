// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "tessera_console_sink.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>

#include <iostream>
#include <string>

namespace tessera {
namespace logging {

namespace expr = boost::log::expressions;

namespace {

const char* severity_color(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "\033[36m";  // Cyan
    case severity_level::info:
      return "\033[32m";  // Green
    case severity_level::warn:
      return "\033[33m";  // Yellow
    case severity_level::error:
      return "\033[31m";  // Red
    case severity_level::fatal:
      return "\033[35m";  // Magenta
  }
  return "";
}

constexpr const char* kResetColor = "\033[0m";

void console_format(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm, bool use_colors
) {
  strm << "[";
  auto time_stamp = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
  if (time_stamp) {
    strm << *time_stamp;
  }
  strm << "] ";

  auto sev = boost::log::extract<severity_level>("Severity", rec);
  if (sev) {
    if (use_colors) {
      strm << severity_color(*sev) << "[" << *sev << "]" << kResetColor << " ";
    } else {
      strm << "[" << *sev << "] ";
    }
  }

  strm << rec[expr::smessage];
  format_upload_context(rec, strm);
}

}  // namespace

void format_upload_context(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm
) {
  auto project = boost::log::extract<std::string>(kProjectIdAttr, rec);
  auto upload = boost::log::extract<std::string>(kUploadIdAttr, rec);
  if (project || upload) {
    strm << " |";
    if (project) strm << " project_id=" << *project;
    if (upload) strm << " upload_id=" << *upload;
  }
}

boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level, bool use_colors
) {
  auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
  backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
  backend->auto_flush(true);

  auto sink = boost::make_shared<async_console_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  sink->set_formatter(
    [use_colors](boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
      console_format(rec, strm, use_colors);
    }
  );

  return sink;
}

}  // namespace logging
}  // namespace tessera
