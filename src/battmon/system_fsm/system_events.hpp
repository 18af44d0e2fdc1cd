/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#pragma once

#include <memory>

#include "tinyfsm.hpp"

#include "monitor/config.hpp"
#include "system_fsm/service_locator.hpp"

namespace system_fsm {

/*
 * Sent by SysState when the system has finished with its boot and self-test,
 * and is now ready to run normally.
 */
struct BootComplete : tinyfsm::Event {
  std::shared_ptr<ServiceLocator> services;
};

/*
 * May be sent by any component to indicate that the system has experienced an
 * unrecoverable error. This should be used sparingly, as it essentially brings
 * down the device.
 */
struct FatalError : tinyfsm::Event {};

/* Sent when the user has changed the monitor's persisted settings. */
struct ConfigChanged : tinyfsm::Event {
  monitor::Config config;
};

/*
 * Requests that polling stop for good, and that every link be released in
 * preparation for power off.
 */
struct StopRequested : tinyfsm::Event {};

}  // namespace system_fsm
