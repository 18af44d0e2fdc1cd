/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#pragma once

#include <functional>

#include "freertos/FreeRTOS.h"
#include "freertos/portmacro.h"
#include "freertos/queue.h"
#include "tinyfsm.hpp"

#include "system_fsm/system_fsm.hpp"

namespace events {

/*
 * Bounded queue of work to be run on whichever task services it. Used to
 * funnel every state machine event onto the main task, so that reactions
 * never run concurrently with one another.
 */
class Queue {
 public:
  static constexpr UBaseType_t kDepth = 8;

  Queue();
  ~Queue();

  /* Blocks while the queue is full. */
  auto Add(std::function<void(void)> fn) -> void;

  /*
   * Waits up to `max_wait` for work to arrive, then runs everything that is
   * pending. Returns true if anything ran.
   */
  auto Service(TickType_t max_wait) -> bool;

  Queue(Queue const&) = delete;
  void operator=(Queue const&) = delete;

 private:
  QueueHandle_t handle_;
};

namespace queues {
auto System() -> Queue*;
}  // namespace queues

/*
 * Hands events to the system state machine from any task. The reaction runs
 * later, on the task servicing the system queue.
 */
class SystemDispatcher {
 public:
  explicit SystemDispatcher(Queue* queue) : queue_(queue) {}

  template <typename Event>
  auto Dispatch(const Event& ev) -> void {
    queue_->Add([=]() {
      tinyfsm::FsmList<system_fsm::SystemState>::template dispatch<Event>(ev);
    });
  }

  SystemDispatcher(SystemDispatcher const&) = delete;
  void operator=(SystemDispatcher const&) = delete;

 private:
  Queue* queue_;
};

auto System() -> SystemDispatcher&;

}  // namespace events
