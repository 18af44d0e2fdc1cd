/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace tasks {

namespace internal {
struct CancellationState {
  std::mutex mutex;
  std::condition_variable cv;
  bool cancelled = false;
};
}  // namespace internal

/*
 * Read-only view of a CancellationSource. Cheap to copy; every copy observes
 * the same signal. A default-constructed token is never cancelled.
 */
class CancellationToken {
 public:
  CancellationToken();

  auto cancelled() const -> bool;

  /*
   * Blocks for up to `timeout`, returning early if cancellation is requested.
   * Returns true iff the token was cancelled.
   */
  auto WaitFor(std::chrono::milliseconds timeout) const -> bool;

 private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<internal::CancellationState>);

  std::shared_ptr<internal::CancellationState> state_;
};

class CancellationSource {
 public:
  CancellationSource();

  auto token() const -> CancellationToken;

  /* Signals every token handed out by this source. Idempotent. */
  auto Cancel() -> void;
  auto cancelled() const -> bool;

  CancellationSource(const CancellationSource&) = delete;
  CancellationSource& operator=(const CancellationSource&) = delete;

 private:
  std::shared_ptr<internal::CancellationState> state_;
};

}  // namespace tasks
