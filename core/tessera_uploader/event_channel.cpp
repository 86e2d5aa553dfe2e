// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "event_channel.hpp"

#include <vector>

#define TESSERA_LOG_COMPONENT "event_channel"
#include <tessera_log_macros.hpp>

namespace tessera {
namespace uploader {

using logging::kv;

nlohmann::json UploadEvent::toJson() const {
  nlohmann::json data;
  data["type"] = uploadEventTypeToString(type);
  data["project_id"] = project_id;
  data["upload_id"] = upload_id;
  data["progress"] = progress;
  data["uploaded_bytes"] = uploaded_bytes;
  data["total_bytes"] = total_bytes;
  data["step"] = step;

  if (total_chunks > 0) {
    data["current_chunk"] = current_chunk;
    data["total_chunks"] = total_chunks;
  }
  if (type == UploadEventType::PROGRESS) {
    data["speed_bytes_per_sec"] = speed_bytes_per_sec;
    data["eta_seconds"] = eta_seconds;
  }
  if (!final_key.empty()) {
    data["final_key"] = final_key;
  }
  if (type == UploadEventType::ERROR) {
    data["error"] = error;
    data["error_code"] = error_code;
    data["retryable"] = retryable;
  }
  return data;
}

EventChannel::EventChannel() {
  dispatcher_ = std::thread(&EventChannel::dispatchLoop, this);
}

EventChannel::~EventChannel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  queue_cv_.notify_all();

  if (dispatcher_.joinable()) {
    dispatcher_.join();
  }
}

EventChannel::SubscriptionId EventChannel::subscribe(EventHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  SubscriptionId id = next_id_++;
  subscribers_[id] = Subscription{std::nullopt, std::move(handler)};
  return id;
}

EventChannel::SubscriptionId EventChannel::subscribe(UploadEventType type, EventHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  SubscriptionId id = next_id_++;
  subscribers_[id] = Subscription{type, std::move(handler)};
  return id;
}

bool EventChannel::unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.erase(id) > 0;
}

void EventChannel::publish(UploadEvent event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      TESSERA_LOG_DEBUG(
        "Event dropped after shutdown" << kv("type", uploadEventTypeToString(event.type))
      );
      return;
    }
    queue_.push_back(std::move(event));
  }
  queue_cv_.notify_one();
}

bool EventChannel::drain(std::chrono::milliseconds timeout) {
  if (std::this_thread::get_id() == dispatcher_.get_id()) {
    return false;
  }

  std::unique_lock<std::mutex> lock(mutex_);
  return idle_cv_.wait_for(lock, timeout, [this] { return queue_.empty() && !dispatching_; });
}

size_t EventChannel::subscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

void EventChannel::dispatchLoop() {
  std::unique_lock<std::mutex> lock(mutex_);

  while (true) {
    queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
    if (queue_.empty()) {
      // stopping_ and nothing left to deliver
      break;
    }

    UploadEvent event = std::move(queue_.front());
    queue_.pop_front();
    dispatching_ = true;

    std::vector<EventHandler> handlers;
    for (const auto& entry : subscribers_) {
      if (!entry.second.filter || *entry.second.filter == event.type) {
        handlers.push_back(entry.second.handler);
      }
    }

    lock.unlock();
    for (const auto& handler : handlers) {
      try {
        handler(event);
      } catch (const std::exception& e) {
        TESSERA_LOG_ERROR(
          "Event handler threw" << kv("type", uploadEventTypeToString(event.type))
                                << kv("error", e.what())
        );
      }
    }
    lock.lock();

    dispatching_ = false;
    if (queue_.empty()) {
      idle_cv_.notify_all();
    }
  }

  dispatching_ = false;
  idle_cv_.notify_all();
}

}  // namespace uploader
}  // namespace tessera
