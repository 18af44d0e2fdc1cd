/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <span>
#include <string>

#include "esp_heap_caps.h"
#include "freertos/FreeRTOS.h"
#include "freertos/portmacro.h"
#include "freertos/projdefs.h"
#include "freertos/queue.h"
#include "freertos/task.h"

namespace tasks {

/*
 * Enumeration of every task (basically a thread) started within the firmware.
 * These are centralised so that it is easier to reason about the relative
 * priorities of tasks, as well as the amount and location of memory allocated
 * to each one.
 */
enum class Type {
  // Runs battery polling cycles. Exactly one of these exists, since the radio
  // stack copes badly with concurrent GATT operations.
  kMonitor,
  // Task for async background work
  kBackgroundWorker,
};

template <Type t>
auto Name() -> std::string;
template <Type t>
auto AllocateStack() -> std::span<StackType_t>;
template <Type t>
auto Priority() -> UBaseType_t;

class WorkerPool {
 private:
  QueueHandle_t queue_;
  using WorkItem = std::function<void(void)>*;
  static auto Main(void* instance) -> void;

  explicit WorkerPool(QueueHandle_t queue);

 public:
  /*
   * Starts `num_workers` tasks of the given type, all servicing the same
   * queue. A pool with a single worker executes its items strictly in the
   * order they were dispatched.
   */
  template <Type t>
  static auto Start(size_t num_workers) -> std::unique_ptr<WorkerPool> {
    std::unique_ptr<WorkerPool> pool{new WorkerPool(CreateQueue())};
    for (size_t i = 0; i < num_workers; i++) {
      auto stack = AllocateStack<t>();
      // Task buffers must be in internal ram. Thankfully they're fairly small.
      auto buffer = reinterpret_cast<StaticTask_t*>(heap_caps_malloc(
          sizeof(StaticTask_t), MALLOC_CAP_INTERNAL | MALLOC_CAP_8BIT));

      std::string name = Name<t>() + "_" + std::to_string(i);

      xTaskCreateStatic(&Main, name.c_str(), stack.size(), pool->queue_,
                        Priority<t>(), stack.data(), buffer);
    }
    return pool;
  }

  ~WorkerPool();

  /*
   * Schedules the given function to be executed on the worker task, and
   * asynchronously returns the result as a future.
   */
  template <typename T>
  auto Dispatch(const std::function<T(void)> fn) -> std::future<T> {
    std::shared_ptr<std::promise<T>> promise =
        std::make_shared<std::promise<T>>();
    WorkItem item =
        new std::function([=]() { promise->set_value(std::invoke(fn)); });
    xQueueSend(queue_, &item, portMAX_DELAY);
    return promise->get_future();
  }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

 private:
  static auto CreateQueue() -> QueueHandle_t;
};

/* Specialisation of Evaluate for functions that return nothing. */
template <>
auto WorkerPool::Dispatch(const std::function<void(void)> fn)
    -> std::future<void>;

}  // namespace tasks
