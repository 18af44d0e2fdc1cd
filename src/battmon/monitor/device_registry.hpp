/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "drivers/ble_central.hpp"
#include "drivers/bluetooth_types.hpp"
#include "monitor/device_record.hpp"

namespace monitor {

/*
 * The authoritative set of tracked peripherals, in discovery order.
 *
 * All access goes through this class. Reads return copies, and writes are
 * applied as a single read-modify-write under the registry's lock, so readers
 * on other tasks never see a record half-updated. The lock is never held
 * while talking to the Bluetooth stack.
 */
class DeviceRegistry {
 public:
  DeviceRegistry();
  ~DeviceRegistry();

  /*
   * Replaces every record with a fresh one per peripheral. Links owned by the
   * old records are closed once they are no longer reachable.
   */
  auto Load(const std::vector<drivers::bluetooth::Peripheral>&) -> void;

  auto Ids() const -> std::vector<std::string>;
  auto Size() const -> size_t;

  auto Get(const std::string& id) const -> std::optional<DeviceView>;
  auto Snapshot() const -> std::vector<DeviceView>;

  /*
   * Applies `fn` to the record with the given id, atomically. Returns false if
   * there is no such record.
   */
  auto Update(const std::string& id,
              const std::function<void(DeviceRecord&)>& fn) -> bool;

  /*
   * Borrows the link cached for `id`, if any. Only the task that drives
   * updates may call this, since that is the only task that ever replaces or
   * removes a link.
   */
  auto Link(const std::string& id) -> drivers::ILeLink*;

  /*
   * Detaches every cached link so that the caller can release them. Records
   * that held a link are left Disconnected.
   */
  auto TakeAllLinks() -> std::vector<std::unique_ptr<drivers::ILeLink>>;

  DeviceRegistry(const DeviceRegistry&) = delete;
  DeviceRegistry& operator=(const DeviceRegistry&) = delete;

 private:
  auto Find(const std::string& id) -> DeviceRecord*;
  auto Find(const std::string& id) const -> const DeviceRecord*;

  mutable std::mutex mutex_;
  std::vector<DeviceRecord> records_;
};

}  // namespace monitor
