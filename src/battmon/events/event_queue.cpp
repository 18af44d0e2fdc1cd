/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "events/event_queue.hpp"

#include <utility>

#include "esp_log.h"

#include "system_fsm/system_fsm.hpp"

namespace events {

[[maybe_unused]] static constexpr char kTag[] = "events";

using Item = std::function<void(void)>*;

Queue::Queue() : handle_(xQueueCreate(kDepth, sizeof(Item))) {}

Queue::~Queue() {
  Item item;
  while (xQueueReceive(handle_, &item, 0)) {
    delete item;
  }
  vQueueDelete(handle_);
}

auto Queue::Add(std::function<void(void)> fn) -> void {
  Item item = new std::function<void(void)>(std::move(fn));
  if (!xQueueSend(handle_, &item, portMAX_DELAY)) {
    ESP_LOGE(kTag, "dropped event");
    delete item;
  }
}

auto Queue::Service(TickType_t max_wait) -> bool {
  Item item;
  if (!xQueueReceive(handle_, &item, max_wait)) {
    return false;
  }
  do {
    std::invoke(*item);
    delete item;
  } while (xQueueReceive(handle_, &item, 0));
  return true;
}

namespace queues {
static Queue sSystem;

auto System() -> Queue* {
  return &sSystem;
}
}  // namespace queues

static SystemDispatcher sSystem{queues::System()};

auto System() -> SystemDispatcher& {
  return sSystem;
}

}  // namespace events
