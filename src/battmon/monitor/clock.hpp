/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#pragma once

#include <chrono>

#include "tasks/cancellation.hpp"

namespace monitor {

/* Source of time for the monitor, swappable so that tests don't wait. */
class IClock {
 public:
  virtual ~IClock() {}

  /* Monotonic time since some arbitrary, fixed point. */
  virtual auto Now() -> std::chrono::milliseconds = 0;

  /*
   * Blocks the calling task for `duration`, or until `cancel` fires. Returns
   * true iff the sleep was cut short by cancellation.
   */
  virtual auto SleepFor(std::chrono::milliseconds duration,
                        const tasks::CancellationToken& cancel) -> bool = 0;
};

class SystemClock : public IClock {
 public:
  auto Now() -> std::chrono::milliseconds override;
  auto SleepFor(std::chrono::milliseconds,
                const tasks::CancellationToken&) -> bool override;
};

}  // namespace monitor
