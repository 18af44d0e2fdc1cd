/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include <memory>

#include "esp_log.h"

#include "events/event_queue.hpp"
#include "monitor/poll_task.hpp"
#include "system_fsm/system_events.hpp"
#include "system_fsm/system_fsm.hpp"

namespace system_fsm {
namespace states {

[[maybe_unused]] static const char kTag[] = "RUN";

void Running::entry() {
  if (!sServices->has_monitor()) {
    return;
  }
  if (!sServices->poll_task()) {
    ESP_LOGI(kTag, "starting monitor");
    sServices->poll_task(std::unique_ptr<monitor::PollTask>{
        monitor::PollTask::Start(sServices->monitor())});
  }
}

void Running::exit() {}

void Running::react(const ConfigChanged& ev) {
  auto task = sServices->poll_task();
  if (!task) {
    return;
  }
  ESP_LOGI(kTag, "applying new config");
  (*task)->Reconfigure(ev.config);
}

void Running::react(const StopRequested&) {
  transit<ShuttingDown>();
}

}  // namespace states
}  // namespace system_fsm
