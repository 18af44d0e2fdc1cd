/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#pragma once

#include <atomic>
#include <chrono>
#include <memory>

#include "freertos/FreeRTOS.h"
#include "freertos/timers.h"

#include "monitor/config.hpp"
#include "monitor/monitor.hpp"
#include "tasks/cancellation.hpp"
#include "tasks/tasks.hpp"

namespace monitor {

/*
 * Runs a Monitor on its own dedicated task. A periodic timer asks for a cycle
 * every so often, and the monitor's interval decides whether anything
 * actually happens. Everything that touches the monitor is funnelled through
 * the same single worker, so cycles, rescans, and shutdown never overlap.
 */
class PollTask {
 public:
  static constexpr std::chrono::seconds kTickPeriod{30};
  static constexpr std::chrono::seconds kReleaseBudget{5};

  /* Starts the worker, and synchronously initialises the monitor on it. */
  static auto Start(Monitor&) -> PollTask*;

  ~PollTask();

  /* Asks for a cycle, if there isn't one queued already. */
  auto Tick() -> void;

  /* Polls every device now, ignoring the refresh interval. */
  auto Refresh() -> void;

  /* Re-discovers bonded peripherals, then polls them. */
  auto Rescan() -> void;

  auto Reconfigure(const Config&) -> void;

  /*
   * Cancels any cycle in progress and releases every link. Waits at most
   * kReleaseBudget for the release to finish. Returns false if it didn't.
   */
  auto Stop() -> bool;

  auto stopped() const -> bool { return cancel_.cancelled(); }

  PollTask(const PollTask&) = delete;
  PollTask& operator=(const PollTask&) = delete;

 private:
  PollTask(Monitor&, std::unique_ptr<tasks::WorkerPool>);

  auto RunCycle() -> void;

  Monitor& monitor_;
  std::unique_ptr<tasks::WorkerPool> worker_;
  tasks::CancellationSource cancel_;
  TimerHandle_t timer_;
  std::atomic<bool> tick_pending_;
};

}  // namespace monitor
