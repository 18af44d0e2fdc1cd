/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#pragma once

#include <memory>
#include <string>

#include "result.hpp"

#include "drivers/ble_central.hpp"
#include "monitor/device_registry.hpp"
#include "monitor/failure.hpp"
#include "tasks/cancellation.hpp"

namespace monitor {

/*
 * A link that is usable for the duration of one update attempt. Either
 * borrowed from the registry (`fresh` is empty), or newly opened and owned by
 * the lease until the attempt's outcome is committed.
 */
struct LinkLease {
  drivers::ILeLink* link;
  std::unique_ptr<drivers::ILeLink> fresh;

  auto is_fresh() const -> bool { return fresh != nullptr; }
};

class ConnectionManager {
 public:
  ConnectionManager(drivers::IBleCentral&, DeviceRegistry&);

  /*
   * Returns the device's cached link if it is still connected. Otherwise,
   * resolves the device's address and opens a new link to it. A new link is
   * never installed into the registry here.
   */
  auto EnsureLink(const std::string& id, const tasks::CancellationToken&)
      -> cpp::result<LinkLease, Failure>;

 private:
  drivers::IBleCentral& central_;
  DeviceRegistry& registry_;
};

}  // namespace monitor
