/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "esp_log.h"

#include "monitor/poll_task.hpp"
#include "system_fsm/system_fsm.hpp"

namespace system_fsm {
namespace states {

[[maybe_unused]] static const char kTag[] = "SHUTDOWN";

void ShuttingDown::entry() {
  auto task = sServices->poll_task();
  if (task && !(*task)->Stop()) {
    ESP_LOGW(kTag, "some links may still be open");
  }
  if (!sServices->nvs().Write()) {
    ESP_LOGW(kTag, "failed to flush settings");
  }
  ESP_LOGI(kTag, "monitor stopped; safe to power off");
}

}  // namespace states
}  // namespace system_fsm
