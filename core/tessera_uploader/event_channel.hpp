// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TESSERA_EVENT_CHANNEL_HPP
#define TESSERA_EVENT_CHANNEL_HPP

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace tessera {
namespace uploader {

enum class UploadEventType { PROGRESS, COMPLETE, PAUSED, CANCELLED, ERROR };

inline std::string uploadEventTypeToString(UploadEventType type) {
  switch (type) {
    case UploadEventType::PROGRESS:
      return "progress";
    case UploadEventType::COMPLETE:
      return "complete";
    case UploadEventType::PAUSED:
      return "paused";
    case UploadEventType::CANCELLED:
      return "cancelled";
    case UploadEventType::ERROR:
      return "error";
  }
  return "unknown";
}

/**
 * Payload delivered to host subscribers
 */
struct UploadEvent {
  UploadEventType type = UploadEventType::PROGRESS;
  std::string project_id;
  std::string upload_id;
  int progress = 0;  // 0-100
  uint64_t uploaded_bytes = 0;
  uint64_t total_bytes = 0;
  int current_chunk = 0;
  int total_chunks = 0;
  double speed_bytes_per_sec = 0.0;
  double eta_seconds = 0.0;
  std::string step;  // Human-readable description
  std::string final_key;   // COMPLETE only
  std::string error;       // ERROR only, sanitized
  std::string error_code;  // ERROR only
  bool retryable = false;  // ERROR only

  nlohmann::json toJson() const;
};

/**
 * Typed publish/subscribe channel for upload events
 *
 * publish() only enqueues. A single dispatcher thread delivers events in
 * publish order, so handlers may call back into the engine without deadlock.
 * A handler that throws is logged and skipped; other subscribers still run.
 */
class EventChannel {
public:
  using SubscriptionId = uint64_t;
  using EventHandler = std::function<void(const UploadEvent&)>;

  EventChannel();

  /**
   * Destructor - delivers queued events, then stops the dispatcher
   */
  ~EventChannel();

  // Non-copyable
  EventChannel(const EventChannel&) = delete;
  EventChannel& operator=(const EventChannel&) = delete;

  /**
   * Receive every event
   */
  SubscriptionId subscribe(EventHandler handler);

  /**
   * Receive events of one type only
   */
  SubscriptionId subscribe(UploadEventType type, EventHandler handler);

  /**
   * @return true if the subscription existed
   */
  bool unsubscribe(SubscriptionId id);

  void publish(UploadEvent event);

  /**
   * Wait until every event published so far has been delivered
   *
   * Returns false on timeout, or immediately when called from a handler.
   */
  bool drain(std::chrono::milliseconds timeout = std::chrono::seconds(5));

  size_t subscriberCount() const;

private:
  struct Subscription {
    std::optional<UploadEventType> filter;
    EventHandler handler;
  };

  void dispatchLoop();

  mutable std::mutex mutex_;
  std::condition_variable queue_cv_;
  std::condition_variable idle_cv_;
  std::deque<UploadEvent> queue_;
  std::map<SubscriptionId, Subscription> subscribers_;
  SubscriptionId next_id_ = 1;
  bool dispatching_ = false;
  bool stopping_ = false;
  std::thread dispatcher_;
};

}  // namespace uploader
}  // namespace tessera

#endif  // TESSERA_EVENT_CHANNEL_HPP
