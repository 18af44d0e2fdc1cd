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
#include "monitor/connection_manager.hpp"
#include "monitor/device_registry.hpp"
#include "monitor/failure.hpp"
#include "monitor/gatt_reader.hpp"
#include "tasks/cancellation.hpp"

namespace monitor {

enum class AttemptOutcome {
  // Battery level read and recorded.
  kSucceeded,
  // Peripheral is connected but has nothing for us; retrying won't help.
  kLinkPreserved,
  // Link was discarded; a later attempt may do better.
  kLinkBroken,
  // Abandoned because of cancellation. Nothing was recorded.
  kCancelled,
};

/*
 * Performs a single attempt at updating one device: obtain a link, read the
 * battery level, classify any failure, and commit the result.
 *
 * The result is committed as one registry update, so a device's status,
 * percentage and link always change together. Any link displaced by the
 * commit is closed afterwards, outside the registry's lock.
 */
class DeviceUpdater {
 public:
  DeviceUpdater(DeviceRegistry&, ConnectionManager&, GattReader&);

  auto Attempt(const std::string& id, const tasks::CancellationToken&)
      -> AttemptOutcome;

  /*
   * Records that every attempt for this device broke its link. The device is
   * shown as Disconnected, whatever the last attempt's failure was.
   */
  auto ResetExhausted(const std::string& id) -> void;

 private:
  enum class LinkAction {
    kKeep,
    kDrop,
    kReplace,
  };

  auto Commit(const std::string& id,
              Status,
              uint8_t percent,
              LinkAction,
              std::unique_ptr<drivers::ILeLink> replacement) -> void;

  auto Fail(const std::string& id, const Failure&, LinkLease* lease)
      -> AttemptOutcome;

  DeviceRegistry& registry_;
  ConnectionManager& connections_;
  GattReader& reader_;
};

}  // namespace monitor
