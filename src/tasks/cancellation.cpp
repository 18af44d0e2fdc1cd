/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "cancellation.hpp"

#include <chrono>
#include <memory>
#include <mutex>

namespace tasks {

CancellationToken::CancellationToken()
    : state_(std::make_shared<internal::CancellationState>()) {}

CancellationToken::CancellationToken(
    std::shared_ptr<internal::CancellationState> state)
    : state_(state) {}

auto CancellationToken::cancelled() const -> bool {
  std::lock_guard<std::mutex> lock{state_->mutex};
  return state_->cancelled;
}

auto CancellationToken::WaitFor(std::chrono::milliseconds timeout) const
    -> bool {
  std::unique_lock<std::mutex> lock{state_->mutex};
  return state_->cv.wait_for(lock, timeout,
                             [&]() { return state_->cancelled; });
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<internal::CancellationState>()) {}

auto CancellationSource::token() const -> CancellationToken {
  return CancellationToken{state_};
}

auto CancellationSource::Cancel() -> void {
  {
    std::lock_guard<std::mutex> lock{state_->mutex};
    state_->cancelled = true;
  }
  state_->cv.notify_all();
}

auto CancellationSource::cancelled() const -> bool {
  std::lock_guard<std::mutex> lock{state_->mutex};
  return state_->cancelled;
}

}  // namespace tasks
