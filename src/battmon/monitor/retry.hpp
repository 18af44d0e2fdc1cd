/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "monitor/clock.hpp"
#include "monitor/device_updater.hpp"
#include "tasks/cancellation.hpp"

namespace monitor {

/*
 * Bounded retry around a whole device update. Only attempts that broke the
 * device's link are retried; a successful read, a peripheral without a
 * battery service, and cancellation are all final.
 */
class RetryPolicy {
 public:
  static constexpr uint8_t kDefaultAttempts = 3;
  static constexpr std::chrono::milliseconds kDefaultDelay{1000};

  explicit RetryPolicy(IClock& clock,
                       uint8_t attempts = kDefaultAttempts,
                       std::chrono::milliseconds delay = kDefaultDelay)
      : clock_(clock), attempts_(attempts), delay_(delay) {}

  template <typename Fn>
  auto Run(Fn&& attempt, const tasks::CancellationToken& cancel)
      -> AttemptOutcome {
    AttemptOutcome res = AttemptOutcome::kCancelled;
    for (uint8_t i = 0; i < attempts_; i++) {
      if (i > 0 && clock_.SleepFor(delay_, cancel)) {
        return AttemptOutcome::kCancelled;
      }
      res = std::invoke(attempt);
      if (res != AttemptOutcome::kLinkBroken) {
        return res;
      }
    }
    return res;
  }

  auto attempts() const -> uint8_t { return attempts_; }
  auto delay() const -> std::chrono::milliseconds { return delay_; }

 private:
  IClock& clock_;
  const uint8_t attempts_;
  const std::chrono::milliseconds delay_;
};

}  // namespace monitor
