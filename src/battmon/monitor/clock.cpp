/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "monitor/clock.hpp"

#include <chrono>

#include "esp_timer.h"

namespace monitor {

auto SystemClock::Now() -> std::chrono::milliseconds {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::microseconds{esp_timer_get_time()});
}

auto SystemClock::SleepFor(std::chrono::milliseconds duration,
                           const tasks::CancellationToken& cancel) -> bool {
  return cancel.WaitFor(duration);
}

}  // namespace monitor
