/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "drivers/ble_central.hpp"

namespace monitor {

enum class Status {
  kUnknown,
  kDisconnected,
  kConnected,
  kConnectedNoBatteryService,
  kUnreachable,
  kAccessDenied,
  kError,
};

/* The text shown to users for a given status. */
auto StatusName(Status) -> const char*;

/* Whether a record with this status must be holding a live link. */
auto StatusHoldsLink(Status) -> bool;

/*
 * Everything tracked about a single peripheral. Owned by the DeviceRegistry;
 * nothing outside the registry ever holds a reference to one of these.
 */
struct DeviceRecord {
  std::string id;
  std::string name;
  Status status;
  // Only meaningful immediately after a successful read.
  uint8_t percent;
  std::unique_ptr<drivers::ILeLink> link;
};

/* Copy of the parts of a DeviceRecord that are safe to hand out. */
struct DeviceView {
  std::string id;
  std::string name;
  Status status;
  uint8_t percent;
  bool has_link;

  bool operator==(const DeviceView&) const = default;
};

}  // namespace monitor
