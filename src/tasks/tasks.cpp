/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "tasks.hpp"

#include <functional>

#include "esp_heap_caps.h"
#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/portmacro.h"

namespace tasks {

[[maybe_unused]] static constexpr char kTag[] = "tasks";

template <>
auto Name<Type::kMonitor>() -> std::string {
  return "monitor";
}
template <>
auto Name<Type::kBackgroundWorker>() -> std::string {
  return "worker";
}

// The Bluedroid calls made during a cycle are shallow, but log formatting and
// the odd std::vector of discovery results add up. Kept in internal ram, since
// the BT controller is fussy about what memory its callers live in.
template <>
auto AllocateStack<Type::kMonitor>() -> std::span<StackType_t> {
  constexpr std::size_t size = 8 * 1024;
  static StackType_t sStack[size];
  return {sStack, size};
}
// Background workers mostly run console commands and NVS writes. These are
// unremarkable in their stack usage, so each one gets a modest PSRAM stack.
template <>
auto AllocateStack<Type::kBackgroundWorker>() -> std::span<StackType_t> {
  std::size_t size = 16 * 1024;
  return {static_cast<StackType_t*>(heap_caps_malloc(size, MALLOC_CAP_SPIRAM)),
          size};
}

/*
 * Please keep the priorities below in descending order for better readability.
 */

// Polling is never urgent; a cycle taking a few ms longer because something
// else was scheduled first is invisible to the user. It does however block on
// the BT stack's own tasks, so it must sit below them.
template <>
auto Priority<Type::kMonitor>() -> UBaseType_t {
  return 3;
}
template <>
auto Priority<Type::kBackgroundWorker>() -> UBaseType_t {
  return 1;
}

auto WorkerPool::Main(void* q) -> void {
  QueueHandle_t queue = reinterpret_cast<QueueHandle_t>(q);
  while (1) {
    WorkItem item;
    if (xQueueReceive(queue, &item, portMAX_DELAY)) {
      std::invoke(*item);
      delete item;
    }
  }
}

static constexpr size_t kMaxPendingItems = 8;

auto WorkerPool::CreateQueue() -> QueueHandle_t {
  return xQueueCreate(kMaxPendingItems, sizeof(WorkItem));
}

WorkerPool::WorkerPool(QueueHandle_t queue) : queue_(queue) {}

WorkerPool::~WorkerPool() {
  // Workers are started once at boot and live for as long as the firmware
  // does; their tasks still reference the queue.
  ESP_LOGE(kTag, "worker pool destroyed");
}

template <>
auto WorkerPool::Dispatch(const std::function<void(void)> fn)
    -> std::future<void> {
  std::shared_ptr<std::promise<void>> promise =
      std::make_shared<std::promise<void>>();
  WorkItem item = new std::function<void(void)>([=]() {
    std::invoke(fn);
    promise->set_value();
  });
  xQueueSend(queue_, &item, portMAX_DELAY);
  return promise->get_future();
}

}  // namespace tasks
