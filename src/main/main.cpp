/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "freertos/FreeRTOS.h"
#include "freertos/portmacro.h"

#include "tinyfsm.hpp"

#include "events/event_queue.hpp"
#include "system_fsm/system_events.hpp"
#include "system_fsm/system_fsm.hpp"

extern "C" void app_main(void) {
  tinyfsm::FsmList<system_fsm::SystemState>::start();

  auto* event_queue = events::queues::System();
  while (1) {
    event_queue->Service(portMAX_DELAY);
  }
}
