/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "monitor/poll_task.hpp"

#include <chrono>
#include <future>
#include <memory>

#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/projdefs.h"
#include "freertos/timers.h"

namespace monitor {

[[maybe_unused]] static constexpr char kTag[] = "poll";

static void tick_cb(TimerHandle_t timer) {
  PollTask* instance = reinterpret_cast<PollTask*>(pvTimerGetTimerID(timer));
  instance->Tick();
}

auto PollTask::Start(Monitor& monitor) -> PollTask* {
  auto worker = tasks::WorkerPool::Start<tasks::Type::kMonitor>(1);
  PollTask* instance = new PollTask(monitor, std::move(worker));

  // Discovery is a one-off at boot; block until it's done so that the display
  // fields exist before anyone goes looking for them.
  instance->worker_
      ->Dispatch<void>([&monitor]() {
        monitor.Initialize();
      })
      .get();

  xTimerStart(instance->timer_, portMAX_DELAY);
  instance->Tick();
  return instance;
}

PollTask::PollTask(Monitor& monitor, std::unique_ptr<tasks::WorkerPool> worker)
    : monitor_(monitor),
      worker_(std::move(worker)),
      cancel_(),
      timer_(xTimerCreate("POLL",
                          pdMS_TO_TICKS(std::chrono::milliseconds{kTickPeriod}
                                            .count()),
                          true,
                          this,
                          tick_cb)),
      tick_pending_(false) {}

PollTask::~PollTask() {
  xTimerStop(timer_, portMAX_DELAY);
  xTimerDelete(timer_, portMAX_DELAY);
}

auto PollTask::Tick() -> void {
  if (cancel_.cancelled()) {
    return;
  }
  // Called from the timer task, which mustn't block. If the worker is still
  // busy with the previous cycle, this tick would just be gated anyway.
  if (tick_pending_.exchange(true)) {
    return;
  }
  worker_->Dispatch<void>([this]() { RunCycle(); });
}

auto PollTask::RunCycle() -> void {
  tick_pending_ = false;
  monitor_.RunCycle(cancel_.token());
}

auto PollTask::Refresh() -> void {
  if (cancel_.cancelled()) {
    return;
  }
  worker_->Dispatch<void>([this]() {
    monitor_.ForceRefresh();
    RunCycle();
  });
}

auto PollTask::Rescan() -> void {
  if (cancel_.cancelled()) {
    return;
  }
  worker_->Dispatch<void>([this]() {
    monitor_.Rescan();
    RunCycle();
  });
}

auto PollTask::Reconfigure(const Config& config) -> void {
  worker_->Dispatch<void>([this, config]() { monitor_.Reconfigure(config); });
}

auto PollTask::Stop() -> bool {
  if (cancel_.cancelled()) {
    return true;
  }
  ESP_LOGI(kTag, "stopping");
  cancel_.Cancel();
  xTimerStop(timer_, portMAX_DELAY);

  auto released =
      worker_->Dispatch<void>([this]() { monitor_.Shutdown(); });
  if (released.wait_for(kReleaseBudget) != std::future_status::ready) {
    ESP_LOGW(kTag, "links not released after %llds; giving up",
             static_cast<long long>(kReleaseBudget.count()));
    return false;
  }
  ESP_LOGI(kTag, "all links released");
  return true;
}

}  // namespace monitor
