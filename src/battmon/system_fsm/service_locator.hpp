/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#pragma once

#include <assert.h>
#include <memory>
#include <optional>

#include "drivers/ble_central.hpp"
#include "drivers/nvs.hpp"
#include "monitor/clock.hpp"
#include "monitor/monitor.hpp"
#include "monitor/poll_task.hpp"
#include "tasks/tasks.hpp"

namespace system_fsm {

class ServiceLocator {
 public:
  ServiceLocator();

  auto nvs() -> drivers::NvsStorage& {
    assert(nvs_ != nullptr);
    return *nvs_;
  }

  auto nvs(std::unique_ptr<drivers::NvsStorage> i) { nvs_ = std::move(i); }

  auto has_bluetooth() -> bool { return ble_ != nullptr; }

  auto ble() -> drivers::IBleCentral& {
    assert(ble_ != nullptr);
    return *ble_;
  }

  auto ble(std::unique_ptr<drivers::IBleCentral> i) { ble_ = std::move(i); }

  auto clock() -> monitor::IClock& {
    assert(clock_ != nullptr);
    return *clock_;
  }

  auto clock(std::unique_ptr<monitor::IClock> i) { clock_ = std::move(i); }

  auto has_monitor() -> bool { return monitor_ != nullptr; }

  auto monitor() -> monitor::Monitor& {
    assert(monitor_ != nullptr);
    return *monitor_;
  }

  auto monitor(std::unique_ptr<monitor::Monitor> i) { monitor_ = std::move(i); }

  auto poll_task() -> std::optional<monitor::PollTask*> {
    if (!poll_task_) {
      return {};
    }
    return poll_task_.get();
  }

  auto poll_task(std::unique_ptr<monitor::PollTask> i) {
    poll_task_ = std::move(i);
  }

  auto bg_worker() -> tasks::WorkerPool& {
    assert(bg_worker_ != nullptr);
    return *bg_worker_;
  }

  auto bg_worker(std::unique_ptr<tasks::WorkerPool> w) -> void {
    bg_worker_ = std::move(w);
  }

  // Not copyable or movable.
  ServiceLocator(const ServiceLocator&) = delete;
  ServiceLocator& operator=(const ServiceLocator&) = delete;

 private:
  std::unique_ptr<drivers::NvsStorage> nvs_;
  std::unique_ptr<drivers::IBleCentral> ble_;
  std::unique_ptr<monitor::IClock> clock_;

  std::unique_ptr<monitor::Monitor> monitor_;
  std::unique_ptr<monitor::PollTask> poll_task_;

  std::unique_ptr<tasks::WorkerPool> bg_worker_;
};

}  // namespace system_fsm
