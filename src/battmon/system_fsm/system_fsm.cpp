/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "system_fsm/system_fsm.hpp"

#include "esp_log.h"

#include "events/event_queue.hpp"
#include "system_fsm/service_locator.hpp"
#include "system_fsm/system_events.hpp"

[[maybe_unused]] static const char kTag[] = "system";

namespace system_fsm {

std::shared_ptr<ServiceLocator> SystemState::sServices;

console::AppConsole* SystemState::sAppConsole;

void SystemState::react(const FatalError& err) {
  if (!is_in_state<states::Error>()) {
    transit<states::Error>();
  }
}

namespace states {

void Error::entry() {
  ESP_LOGE(kTag, "unrecoverable error; waiting for reboot");
}

}  // namespace states

}  // namespace system_fsm

FSM_INITIAL_STATE(system_fsm::SystemState, system_fsm::states::Booting)
