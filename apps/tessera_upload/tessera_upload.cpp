// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <tessera_log_init.hpp>

#include <event_channel.hpp>
#include <http_client.hpp>
#include <session_store.hpp>
#include <transfer_client.hpp>
#include <upload_engine.hpp>

#include "config_parser.hpp"

#define TESSERA_LOG_COMPONENT "tessera_upload"
#include <tessera_log_macros.hpp>

namespace tessera {
namespace app {

namespace {

using namespace ::tessera::uploader;

std::atomic<bool> g_should_exit(false);

void signal_handler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_should_exit.store(true);
  }
}

void print_usage(const char* program_name) {
  std::cout
    << "Usage: " << program_name << " [--config PATH] <command> [OPTIONS]\n"
    << "\n"
    << "Tessera Upload - resumable multipart file uploader\n"
    << "\n"
    << "Commands:\n"
    << "  start                 Upload a file (--project, --file, [--mime], [--key])\n"
    << "  resume                Resume an interrupted upload with its original file\n"
    << "                        (--upload-id, --file, [--project], [--key])\n"
    << "  resume-interrupted    Finalize an interrupted upload without the file (--project)\n"
    << "  cancel                Cancel an upload and abort it remotely (--upload-id)\n"
    << "  acknowledge           Forget a failed upload (--upload-id)\n"
    << "  list                  Print every persisted session as a JSON line\n"
    << "  cleanup               Delete stale sessions ([--max-age-hours N] or --all)\n"
    << "  info                  Print session store statistics\n"
    << "\n"
    << "Options:\n"
    << "  --config PATH         Path to YAML configuration file\n"
    << "  --project ID          Project the upload belongs to\n"
    << "  --file PATH           Local file to upload\n"
    << "  --mime TYPE           MIME type sent to the backend (default: application/octet-stream)\n"
    << "  --upload-id ID        Upload id returned by start\n"
    << "  --key KEY             Destination object key\n"
    << "  --max-age-hours N     Age limit for cleanup (default: state.max_age_hours)\n"
    << "  --all                 Delete every session on cleanup\n"
    << "  --help                Show this help message\n"
    << "\n"
    << "Environment:\n"
    << "  TESSERA_API_TOKEN     Overrides api.auth_token\n"
    << "  TESSERA_API_BASE_URL  Overrides api.base_url\n"
    << "  TESSERA_LOG_LEVEL     Overrides both log sink levels\n"
    << "\n"
    << "Events are printed to stdout as JSON lines. Ctrl+C stops the upload and keeps\n"
    << "its state so it can be resumed later.\n"
    << "\n"
    << "Examples:\n"
    << "  " << program_name << " --config config/tessera_upload.yaml start \\\n"
    << "    --project p1 --file /media/lecture_01.mp4\n"
    << "\n"
    << "  " << program_name << " --config config/tessera_upload.yaml resume \\\n"
    << "    --upload-id 2~abc --file /media/lecture_01.mp4\n"
    << std::endl;
}

struct CliOptions {
  std::string config_file;
  std::string command;
  std::string project_id;
  std::string file_path;
  std::string mime_type = "application/octet-stream";
  std::string upload_id;
  std::string destination_key;
  int max_age_hours = -1;
  bool all = false;
};

std::string file_name_of(const std::string& path) {
  auto pos = path.find_last_of('/');
  return pos == std::string::npos ? path : path.substr(pos + 1);
}

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

nlohmann::json session_to_json(const UploadSession& session) {
  nlohmann::json j;
  j["uploadId"] = session.upload_id;
  j["projectId"] = session.project_id;
  j["key"] = session.destination_key;
  j["fileName"] = session.file_name;
  j["fileSize"] = session.file_size;
  j["chunkSize"] = session.chunk_size;
  j["status"] = uploadStatusToString(session.status);
  j["progress"] = session.progress;
  j["uploadedBytes"] = session.uploadedBytes();
  j["parts"] = session.parts.size();
  j["startedAt"] = to_epoch_ms(session.started_at);
  j["lastActivity"] = to_epoch_ms(session.last_activity);
  if (!session.last_error.empty()) {
    j["error"] = session.last_error;
  }
  return j;
}

void print_result(const CommandResult& result) {
  nlohmann::json j;
  j["success"] = result.success;
  j["uploadId"] = result.upload_id;
  j["message"] = result.message;
  if (!result.success) {
    j["errorCode"] = result.codeString();
  }
  std::cout << j.dump() << std::endl;
}

/**
 * Remembers the first terminal event seen for one upload
 */
class TerminalWatcher {
public:
  void onEvent(const UploadEvent& event) {
    if (event.type == UploadEventType::PROGRESS || event.type == UploadEventType::PAUSED) {
      return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!upload_id_.empty() && event.upload_id != upload_id_) {
      return;
    }
    if (!terminal_) {
      terminal_ = event.type;
      cv_.notify_all();
    }
  }

  void watch(const std::string& upload_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    upload_id_ = upload_id;
  }

  /**
   * Wait until a terminal event arrives or a signal asks to exit
   *
   * @return true if a terminal event arrived
   */
  bool waitOrInterrupt(UploadEventType& type) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!terminal_) {
      if (g_should_exit.load()) {
        return false;
      }
      cv_.wait_for(lock, std::chrono::milliseconds(200));
    }
    type = *terminal_;
    return true;
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::string upload_id_;
  std::optional<UploadEventType> terminal_;
};

/**
 * Engine with its collaborators, wired from the application config
 */
struct EngineHost {
  TerminalWatcher watcher;  // Outlives the event channel
  std::shared_ptr<SessionStore> store;
  std::shared_ptr<EventChannel> events;
  std::unique_ptr<UploadEngine> engine;

  explicit EngineHost(const UploaderAppConfig& config, std::shared_ptr<SessionStore> session_store)
      : store(std::move(session_store))
      , events(std::make_shared<EventChannel>()) {
    BeastHttpClient::Config http_config;
    http_config.user_agent = config.api.user_agent;
    http_config.verify_peer = config.api.verify_ssl;
    auto http = std::make_shared<BeastHttpClient>(http_config);

    TransferClientConfig client_config;
    convert_client_config(config, client_config);
    auto client = std::make_shared<HttpTransferClient>(client_config, http);

    UploadEngineConfig engine_config;
    convert_engine_config(config, engine_config);

    events->subscribe([this](const UploadEvent& event) {
      std::cout << event.toJson().dump() << std::endl;
      watcher.onEvent(event);
    });

    engine = std::make_unique<UploadEngine>(engine_config, client, store, events);
    engine->start();
  }

  ~EngineHost() {
    engine->shutdown();
    events->drain();
  }
};

/**
 * Block until the upload ends; a signal shuts the engine down instead
 */
int await_upload(EngineHost& host, const std::string& upload_id) {
  host.watcher.watch(upload_id);

  UploadEventType terminal = UploadEventType::PROGRESS;
  if (!host.watcher.waitOrInterrupt(terminal)) {
    TESSERA_LOG_INFO("Interrupted, stopping upload" << logging::kv("upload_id", upload_id));
    host.engine->shutdown();
    std::cerr << "Upload interrupted. Resume with: resume --upload-id " << upload_id
              << " --file <path>" << std::endl;
    return 130;
  }
  return terminal == UploadEventType::COMPLETE ? 0 : 1;
}

int run_start(const CliOptions& options, EngineHost& host) {
  if (options.project_id.empty() || options.file_path.empty()) {
    std::cerr << "Error: start requires --project and --file" << std::endl;
    return 2;
  }

  StartRequest request;
  request.file.path = options.file_path;
  request.file.name = file_name_of(options.file_path);
  request.file.mime_type = options.mime_type;
  request.project_id = options.project_id;
  request.destination_key = options.destination_key;

  // Watch before starting so a fast completion is not missed
  host.watcher.watch("");
  CommandResult result = host.engine->startUpload(request);
  print_result(result);
  if (!result.success) {
    return 1;
  }
  return await_upload(host, result.upload_id);
}

int run_resume(const CliOptions& options, EngineHost& host) {
  if (options.upload_id.empty() || options.file_path.empty()) {
    std::cerr << "Error: resume requires --upload-id and --file" << std::endl;
    return 2;
  }

  ResumeWithFileRequest request;
  request.file.path = options.file_path;
  request.file.name = file_name_of(options.file_path);
  request.file.mime_type = options.mime_type;
  request.upload_id = options.upload_id;
  request.project_id = options.project_id;
  request.destination_key = options.destination_key;

  // Missing identifiers are taken from the stored session
  if (request.project_id.empty() || request.destination_key.empty()) {
    auto stored = host.store->get(options.upload_id);
    if (stored) {
      if (request.project_id.empty()) {
        request.project_id = stored->project_id;
      }
      if (request.destination_key.empty()) {
        request.destination_key = stored->destination_key;
      }
    }
  }

  host.watcher.watch(options.upload_id);
  CommandResult result = host.engine->resumeWithFile(request);
  print_result(result);
  if (!result.success) {
    return 1;
  }
  return await_upload(host, result.upload_id);
}

int run_session_command(const CliOptions& options, EngineHost& host) {
  CommandResult result;
  if (options.command == "resume-interrupted") {
    if (options.project_id.empty()) {
      std::cerr << "Error: resume-interrupted requires --project" << std::endl;
      return 2;
    }
    result = host.engine->resumeInterrupted(options.project_id);
  } else {
    if (options.upload_id.empty()) {
      std::cerr << "Error: " << options.command << " requires --upload-id" << std::endl;
      return 2;
    }
    result = options.command == "cancel" ? host.engine->cancel(options.upload_id)
                                         : host.engine->acknowledgeFailure(options.upload_id);
  }
  print_result(result);
  return result.success ? 0 : 1;
}

int run_store_command(const CliOptions& options, const UploaderAppConfig& config, SessionStore& store) {
  if (options.command == "list") {
    for (const auto& session : store.listAll()) {
      std::cout << session_to_json(session).dump() << std::endl;
    }
    return 0;
  }

  if (options.command == "cleanup") {
    size_t removed = 0;
    if (options.all) {
      removed = store.clearAll();
    } else {
      int hours = options.max_age_hours > 0 ? options.max_age_hours : config.state.max_age_hours;
      removed = store.reapOlderThan(std::chrono::hours(hours));
    }
    std::cout << nlohmann::json{{"removed", removed}}.dump() << std::endl;
    return 0;
  }

  // info
  StoreInfo info = store.info();
  nlohmann::json j;
  j["dbPath"] = store.dbPath();
  j["totalSessions"] = info.total_sessions;
  j["totalBytes"] = info.total_bytes;
  for (auto status : {UploadStatus::UPLOADING, UploadStatus::PAUSED, UploadStatus::FAILED}) {
    j["byStatus"][uploadStatusToString(status)] = store.countByStatus(status);
  }
  std::cout << j.dump() << std::endl;
  return 0;
}

bool is_known_command(const std::string& command) {
  static const char* const kCommands[] = {
    "start", "resume", "resume-interrupted", "cancel", "acknowledge", "list", "cleanup", "info"
  };
  for (const char* known : kCommands) {
    if (command == known) {
      return true;
    }
  }
  return false;
}

}  // namespace

}  // namespace app
}  // namespace tessera

int main(int argc, char* argv[]) {
  using namespace tessera::app;

  // Check for help flag
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    }
  }

  // Step 1: Parse command line arguments
  CliOptions options;
  for (int i = 1; i < argc; ++i) {
    auto take_value = [&](const char* flag, std::string& out) {
      if (i + 1 < argc) {
        out = argv[++i];
        return true;
      }
      std::cerr << "Error: " << flag << " requires an argument" << std::endl;
      return false;
    };

    if (strcmp(argv[i], "--config") == 0) {
      if (!take_value("--config", options.config_file)) {
        return 2;
      }
    } else if (strcmp(argv[i], "--project") == 0) {
      if (!take_value("--project", options.project_id)) {
        return 2;
      }
    } else if (strcmp(argv[i], "--file") == 0) {
      if (!take_value("--file", options.file_path)) {
        return 2;
      }
    } else if (strcmp(argv[i], "--mime") == 0) {
      if (!take_value("--mime", options.mime_type)) {
        return 2;
      }
    } else if (strcmp(argv[i], "--upload-id") == 0) {
      if (!take_value("--upload-id", options.upload_id)) {
        return 2;
      }
    } else if (strcmp(argv[i], "--key") == 0) {
      if (!take_value("--key", options.destination_key)) {
        return 2;
      }
    } else if (strcmp(argv[i], "--max-age-hours") == 0) {
      std::string value;
      if (!take_value("--max-age-hours", value)) {
        return 2;
      }
      options.max_age_hours = std::atoi(value.c_str());
    } else if (strcmp(argv[i], "--all") == 0) {
      options.all = true;
    } else if (argv[i][0] != '-' && options.command.empty()) {
      options.command = argv[i];
    } else {
      std::cerr << "Error: Unknown argument: " << argv[i] << std::endl;
      print_usage(argv[0]);
      return 2;
    }
  }

  if (!is_known_command(options.command)) {
    std::cerr << "Error: a command is required" << std::endl;
    print_usage(argv[0]);
    return 2;
  }

  // Step 2: Load configuration file if specified, then environment overrides
  UploaderAppConfig config;
  if (!options.config_file.empty()) {
    ConfigParser parser;
    if (!parser.load_from_file(options.config_file, config)) {
      std::cerr << "Error: Failed to load config file '" << options.config_file
                << "': " << parser.get_last_error() << std::endl;
      return 1;
    }
  }
  apply_env_overrides(config);

  bool needs_api = options.command != "list" && options.command != "cleanup" &&
                   options.command != "info";
  std::string error_msg;
  if (needs_api && !ConfigParser::validate(config, error_msg)) {
    std::cerr << "Error: Invalid configuration: " << error_msg << std::endl;
    return 1;
  }

  // Step 3: Initialize logging; the console sink writes to stderr, events go to stdout
  tessera::logging::LoggingConfig log_config;
  convert_logging_config(config.logging, log_config);
  tessera::logging::apply_env_overrides(log_config);
  tessera::logging::init_logging(log_config);

  int exit_code = 1;
  try {
    auto store = std::make_shared<tessera::uploader::SessionStore>(config.state.db_path);

    if (!needs_api) {
      exit_code = run_store_command(options, config, *store);
    } else {
      std::signal(SIGINT, signal_handler);
      std::signal(SIGTERM, signal_handler);

      EngineHost host(config, store);
      if (options.command == "start") {
        exit_code = run_start(options, host);
      } else if (options.command == "resume") {
        exit_code = run_resume(options, host);
      } else {
        exit_code = run_session_command(options, host);
      }
    }
  } catch (const tessera::uploader::UploadError& e) {
    std::cerr << "Error: " << tessera::uploader::sanitizeErrorMessage(e.what()) << std::endl;
    TESSERA_LOG_ERROR("Command failed" << tessera::logging::kv("code", tessera::uploader::errorCodeToString(e.code())));
    exit_code = 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    exit_code = 1;
  }

  tessera::logging::shutdown_logging();
  return exit_code;
}
