/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#pragma once

#include <memory>

#include "tinyfsm.hpp"

#include "app_console/app_console.hpp"
#include "system_fsm/service_locator.hpp"
#include "system_fsm/system_events.hpp"

namespace system_fsm {

/*
 * State machine for the overall system state. Responsible for bringing up the
 * config store and radio, and for starting and stopping the monitor.
 */
class SystemState : public tinyfsm::Fsm<SystemState> {
 public:
  virtual ~SystemState() {}

  virtual void entry() {}
  virtual void exit() {}

  /* Fallback event handler. Does nothing. */
  void react(const tinyfsm::Event& ev) {}

  void react(const FatalError&);

  virtual void react(const BootComplete&) {}
  virtual void react(const ConfigChanged&) {}
  virtual void react(const StopRequested&) {}

 protected:
  static std::shared_ptr<ServiceLocator> sServices;

  static console::AppConsole* sAppConsole;
};

namespace states {

/*
 * Initial state. Opens the config store, brings up the radio, and builds the
 * monitor.
 */
class Booting : public SystemState {
 public:
  void entry() override;

  void react(const BootComplete&) override;
  using SystemState::react;
};

/*
 * Most common state. Peripherals are polled periodically.
 */
class Running : public SystemState {
 public:
  void entry() override;
  void exit() override;

  void react(const ConfigChanged&) override;
  void react(const StopRequested&) override;

  using SystemState::react;
};

/*
 * Polling has stopped and every link has been released. Nothing left to do
 * except wait to be powered off.
 */
class ShuttingDown : public SystemState {
 public:
  void entry() override;

  using SystemState::react;
};

/*
 * Something unrecoverably bad went wrong. Awaits reboot.
 */
class Error : public SystemState {
 public:
  void entry() override;

  using SystemState::react;
};

}  // namespace states

}  // namespace system_fsm
