/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#pragma once

#include <cstdint>

#include "result.hpp"

#include "drivers/ble_central.hpp"
#include "drivers/bluetooth_types.hpp"
#include "monitor/failure.hpp"
#include "tasks/cancellation.hpp"

namespace monitor {

/* Battery Service, 0000180F-0000-1000-8000-00805F9B34FB */
static constexpr uint16_t kBatteryServiceUuid = 0x180F;
/* Battery Level characteristic, 00002A19-0000-1000-8000-00805F9B34FB */
static constexpr uint16_t kBatteryLevelUuid = 0x2A19;

/*
 * Reads the battery percentage of a connected peripheral via the standard
 * GATT Battery Service. Service and characteristic discovery always bypass
 * the stack's attribute cache, since cached handles go stale across
 * reconnections on some peripherals.
 */
class GattReader {
 public:
  auto ReadBattery(drivers::ILeLink&, const tasks::CancellationToken&)
      -> cpp::result<uint8_t, Failure>;
};

}  // namespace monitor
