/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#pragma once

#include <optional>
#include <vector>

#include "drivers/ble_central.hpp"
#include "drivers/bluetooth_types.hpp"

namespace monitor {

struct Discovery {
  std::vector<drivers::bluetooth::Peripheral> peripherals;
  // Set if the host's bond list couldn't be read. Never fatal.
  std::optional<drivers::bluetooth::PlatformError> error;
};

/* Lists the bonded peripherals that are worth tracking. */
class Enumerator {
 public:
  explicit Enumerator(drivers::IBleCentral& central) : central_(central) {}

  auto Enumerate() -> Discovery;

 private:
  drivers::IBleCentral& central_;
};

}  // namespace monitor
