// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TESSERA_CANCELLATION_TOKEN_HPP
#define TESSERA_CANCELLATION_TOKEN_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace tessera {
namespace uploader {

namespace detail {

struct CancellationState {
  std::atomic<bool> cancelled{false};
  std::shared_ptr<const CancellationState> parent;

  bool isCancelled() const {
    for (const CancellationState* s = this; s != nullptr; s = s->parent.get()) {
      if (s->cancelled.load(std::memory_order_acquire)) {
        return true;
      }
    }
    return false;
  }
};

}  // namespace detail

/**
 * Read side of a cancellation signal
 *
 * Cheap to copy. A default-constructed token is never cancelled.
 * A token observes its own source and every ancestor source.
 */
class CancellationToken {
public:
  CancellationToken() = default;

  bool isCancelled() const {
    return state_ && state_->isCancelled();
  }

  /**
   * Sleep for up to duration, returning early on cancellation
   *
   * @return true if the token was cancelled
   */
  bool waitFor(std::chrono::milliseconds duration) const {
    constexpr std::chrono::milliseconds kSlice{10};
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!isCancelled()) {
      auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        return false;
      }
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
      std::this_thread::sleep_for(std::min(remaining, kSlice));
    }
    return true;
  }

private:
  friend class CancellationSource;

  explicit CancellationToken(std::shared_ptr<const detail::CancellationState> state)
      : state_(std::move(state)) {}

  std::shared_ptr<const detail::CancellationState> state_;
};

/**
 * Write side of a cancellation signal
 *
 * A source created from a parent token is cancelled when the parent is,
 * but cancelling the child leaves the parent untouched.
 */
class CancellationSource {
public:
  CancellationSource()
      : state_(std::make_shared<detail::CancellationState>()) {}

  explicit CancellationSource(const CancellationToken& parent)
      : state_(std::make_shared<detail::CancellationState>()) {
    state_->parent = parent.state_;
  }

  void cancel() {
    state_->cancelled.store(true, std::memory_order_release);
  }

  bool isCancelled() const {
    return state_->isCancelled();
  }

  CancellationToken token() const {
    return CancellationToken(state_);
  }

private:
  std::shared_ptr<detail::CancellationState> state_;
};

}  // namespace uploader
}  // namespace tessera

#endif  // TESSERA_CANCELLATION_TOKEN_HPP
