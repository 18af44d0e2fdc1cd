/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#pragma once

#include <atomic>
#include <chrono>
#include <optional>

#include "monitor/clock.hpp"
#include "monitor/device_registry.hpp"
#include "monitor/device_updater.hpp"
#include "monitor/retry.hpp"
#include "monitor/sensors.hpp"
#include "tasks/cancellation.hpp"

namespace monitor {

/*
 * Drives polling cycles. Every device is visited in registry order, one at a
 * time, with each device's result published before the next one starts.
 *
 * Cycles are rate limited: a tick that comes sooner than `interval` after the
 * start of the previous cycle does nothing at all.
 */
class Scheduler {
 public:
  enum class State {
    kIdle,
    kRunning,
    kCancelled,
  };

  Scheduler(DeviceRegistry&,
            DeviceUpdater&,
            RetryPolicy&,
            SensorSync&,
            IClock&,
            std::chrono::minutes interval);

  /* Runs a cycle if one is due. Returns true iff a cycle was started. */
  auto Tick(const tasks::CancellationToken&) -> bool;

  /* Makes the next tick run a cycle regardless of when the last one was. */
  auto ForceNext() -> void;

  auto interval(std::chrono::minutes) -> void;
  auto interval() const -> std::chrono::minutes {
    return interval_.load();
  }

  auto state() const -> State { return state_; }
  auto cycles() const -> uint32_t { return cycles_; }

 private:
  auto LogSummary() -> void;

  DeviceRegistry& registry_;
  DeviceUpdater& updater_;
  RetryPolicy& retry_;
  SensorSync& sync_;
  IClock& clock_;

  // Written by the polling task, read by anyone.
  std::atomic<std::chrono::minutes> interval_;
  std::optional<std::chrono::milliseconds> last_start_;
  std::atomic<State> state_;
  std::atomic<uint32_t> cycles_;
};

auto StateName(Scheduler::State) -> const char*;

}  // namespace monitor
