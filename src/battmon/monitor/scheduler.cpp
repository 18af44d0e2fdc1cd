/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "monitor/scheduler.hpp"

#include <chrono>
#include <string>

#include "esp_log.h"

namespace monitor {

[[maybe_unused]] static constexpr char kTag[] = "sched";

Scheduler::Scheduler(DeviceRegistry& registry,
                     DeviceUpdater& updater,
                     RetryPolicy& retry,
                     SensorSync& sync,
                     IClock& clock,
                     std::chrono::minutes interval)
    : registry_(registry),
      updater_(updater),
      retry_(retry),
      sync_(sync),
      clock_(clock),
      interval_(interval),
      last_start_(),
      state_(State::kIdle),
      cycles_(0) {}

auto Scheduler::Tick(const tasks::CancellationToken& cancel) -> bool {
  if (state_ == State::kCancelled) {
    return false;
  }
  if (cancel.cancelled()) {
    state_ = State::kCancelled;
    return false;
  }

  auto now = clock_.Now();
  if (last_start_ && now - *last_start_ < interval_.load()) {
    ESP_LOGD(kTag, "cycle not due yet");
    return false;
  }

  state_ = State::kRunning;
  last_start_ = now;
  cycles_++;

  auto ids = registry_.Ids();
  ESP_LOGD(kTag, "cycle %lu: %u devices", static_cast<unsigned long>(cycles_),
           static_cast<unsigned>(ids.size()));

  for (const auto& id : ids) {
    if (cancel.cancelled()) {
      ESP_LOGI(kTag, "cycle cancelled");
      state_ = State::kCancelled;
      return true;
    }
    auto before = registry_.Get(id);
    AttemptOutcome res =
        retry_.Run([&]() { return updater_.Attempt(id, cancel); }, cancel);
    if (res == AttemptOutcome::kLinkBroken) {
      updater_.ResetExhausted(id);
    }

    auto view = registry_.Get(id);
    if (res == AttemptOutcome::kCancelled) {
      // An earlier attempt may already have been committed.
      if (view && view != before) {
        sync_.Publish(*view);
      }
      ESP_LOGI(kTag, "cycle cancelled");
      state_ = State::kCancelled;
      return true;
    }
    if (view) {
      sync_.Publish(*view);
    }
  }

  LogSummary();
  state_ = State::kIdle;
  return true;
}

auto Scheduler::ForceNext() -> void {
  last_start_.reset();
}

auto Scheduler::interval(std::chrono::minutes i) -> void {
  interval_.store(i);
}

auto Scheduler::LogSummary() -> void {
  for (const auto& d : registry_.Snapshot()) {
    ESP_LOGI(kTag, "Device: %s, Status: %s, Battery: %u%%", d.name.c_str(),
             StatusName(d.status), d.percent);
  }
}

auto StateName(Scheduler::State s) -> const char* {
  switch (s) {
    case Scheduler::State::kIdle:
      return "idle";
    case Scheduler::State::kRunning:
      return "running";
    case Scheduler::State::kCancelled:
    default:
      return "cancelled";
  }
}

}  // namespace monitor
