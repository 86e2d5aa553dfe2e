// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "tessera_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

#include "tessera_log_macros.hpp"

namespace tessera {
namespace logging {

namespace {

/**
 * Sinks attached to the Boost.Log core by init_logging()
 */
struct SinkRegistry {
  std::mutex mutex;
  boost::shared_ptr<async_console_sink_t> console;
  boost::shared_ptr<async_file_sink_t> file;
  bool active = false;
};

SinkRegistry& registry() {
  static SinkRegistry instance;
  return instance;
}

std::string lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::optional<bool> parse_switch(const std::string& value) {
  const std::string v = lowercase(value);
  if (v == "1" || v == "true" || v == "yes" || v == "on") {
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "off") {
    return false;
  }
  return std::nullopt;
}

// Stop the async frontend first so its queue is drained into the backend
template <typename Sink>
void detach_sink(boost::shared_ptr<Sink>& sink) {
  if (!sink) {
    return;
  }
  boost::log::core::get()->remove_sink(sink);
  sink->stop();
  sink->flush();
  sink.reset();
}

struct EnvOverride {
  const char* name;
  std::function<void(LoggingConfig&, const std::string&)> apply;
};

// Order matters: TESSERA_LOG_LEVEL sets both sinks, the per-sink variables refine it
const std::vector<EnvOverride>& env_overrides() {
  static const std::vector<EnvOverride> table = {
    {"TESSERA_LOG_LEVEL",
     [](LoggingConfig& c, const std::string& v) {
       if (auto level = parse_severity_level(v)) {
         c.console_level = *level;
         c.file_level = *level;
       }
     }},
    {"TESSERA_LOG_CONSOLE_LEVEL",
     [](LoggingConfig& c, const std::string& v) {
       if (auto level = parse_severity_level(v)) {
         c.console_level = *level;
       }
     }},
    {"TESSERA_LOG_FILE_LEVEL",
     [](LoggingConfig& c, const std::string& v) {
       if (auto level = parse_severity_level(v)) {
         c.file_level = *level;
       }
     }},
    {"TESSERA_LOG_CONSOLE_ENABLED",
     [](LoggingConfig& c, const std::string& v) {
       if (auto on = parse_switch(v)) {
         c.console_enabled = *on;
       }
     }},
    {"TESSERA_LOG_FILE_ENABLED",
     [](LoggingConfig& c, const std::string& v) {
       if (auto on = parse_switch(v)) {
         c.file_enabled = *on;
       }
     }},
    {"TESSERA_LOG_FILE_DIR",
     [](LoggingConfig& c, const std::string& v) { c.file_config.directory = v; }},
    {"TESSERA_LOG_FORMAT",
     [](LoggingConfig& c, const std::string& v) {
       c.file_config.format_json = (lowercase(v) == "json");
     }},
  };
  return table;
}

}  // namespace

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  static const std::pair<const char*, severity_level> kNames[] = {
    {"debug", severity_level::debug},  {"info", severity_level::info},
    {"warn", severity_level::warn},    {"warning", severity_level::warn},
    {"error", severity_level::error},  {"fatal", severity_level::fatal},
  };

  const std::string name = lowercase(level_str);
  for (const auto& entry : kNames) {
    if (name == entry.first) {
      return entry.second;
    }
  }
  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  for (const auto& entry : env_overrides()) {
    const char* raw = std::getenv(entry.name);
    if (raw == nullptr || raw[0] == '\0') {
      continue;
    }
    entry.apply(config, raw);
  }
}

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

void init_logging(const LoggingConfig& config) {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  if (reg.active) {
    return;
  }

  boost::log::add_common_attributes();
  auto core = boost::log::core::get();

  if (config.console_enabled) {
    reg.console = create_console_sink(config.console_level, config.console_colors);
    core->add_sink(reg.console);
  }
  if (config.file_enabled) {
    reg.file = create_file_sink(config.file_config, config.file_level);
    core->add_sink(reg.file);
  }

  reg.active = true;
}

void init_logging_default() {
  LoggingConfig config;
  config.file_enabled = false;
  init_logging(config);
}

void shutdown_logging() {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  if (!reg.active) {
    return;
  }

  detach_sink(reg.console);
  detach_sink(reg.file);
  reg.active = false;
}

void flush_logging() {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  if (reg.console) {
    reg.console->flush();
  }
  if (reg.file) {
    reg.file->flush();
  }
}

void reconfigure_logging(const LoggingConfig& config) {
  LoggingConfig effective = config;
  apply_env_overrides(effective);
  shutdown_logging();
  init_logging(effective);
}

bool is_logging_initialized() {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  return reg.active;
}

}  // namespace logging
}  // namespace tessera
