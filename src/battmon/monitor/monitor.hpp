/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#pragma once

#include <memory>
#include <mutex>

#include "drivers/ble_central.hpp"
#include "monitor/clock.hpp"
#include "monitor/config.hpp"
#include "monitor/connection_manager.hpp"
#include "monitor/device_registry.hpp"
#include "monitor/device_updater.hpp"
#include "monitor/enumerator.hpp"
#include "monitor/gatt_reader.hpp"
#include "monitor/retry.hpp"
#include "monitor/scheduler.hpp"
#include "monitor/sensors.hpp"
#include "tasks/cancellation.hpp"

namespace monitor {

/*
 * Battery monitor for bonded BLE peripherals. Wires the polling pipeline
 * together, and exposes the lifecycle hooks that its host calls.
 *
 * None of these methods are thread safe with respect to each other; the host
 * must call them all from the same task. Reading the registry or the sensor
 * panel is safe from anywhere.
 */
class Monitor {
 public:
  Monitor(drivers::IBleCentral&, IClock&, const Config&);
  ~Monitor();

  /* Discovers bonded peripherals and sets up their display fields. */
  auto Initialize() -> void;

  /* Polls every device, if a cycle is due. Returns true if a cycle ran. */
  auto RunCycle(const tasks::CancellationToken&) -> bool;

  /*
   * Releases every cached link and resets the display fields. The caller is
   * responsible for cancelling any cycle that is still in progress first.
   */
  auto Shutdown() -> void;

  /* Re-runs discovery, replacing every tracked device. */
  auto Rescan() -> void;

  /* Makes the next call to RunCycle poll regardless of the interval. */
  auto ForceRefresh() -> void;

  auto Reconfigure(const Config&) -> void;

  auto config() const -> Config;
  auto registry() -> DeviceRegistry& { return registry_; }
  auto panel() -> SensorPanel& { return panel_; }
  auto scheduler() -> Scheduler& { return scheduler_; }

  Monitor(const Monitor&) = delete;
  Monitor& operator=(const Monitor&) = delete;

 private:
  auto Load() -> void;

  mutable std::mutex config_mutex_;
  Config config_;
  bool shut_down_;

  DeviceRegistry registry_;
  SensorPanel panel_;
  SensorSync sync_;

  Enumerator enumerator_;
  ConnectionManager connections_;
  GattReader reader_;
  DeviceUpdater updater_;
  RetryPolicy retry_;
  Scheduler scheduler_;
};

}  // namespace monitor
