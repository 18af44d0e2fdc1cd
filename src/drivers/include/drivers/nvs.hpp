/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#pragma once

#include <stdint.h>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "esp_err.h"
#include "nvs.h"

#include "drivers/bluetooth_types.hpp"

namespace drivers {

/*
 * Wrapper for a single NVS setting, with its backing value cached in memory.
 * NVS values that are just plain old data should generally use these for
 * simpler implementation.
 */
template <typename T>
class Setting {
 public:
  Setting(const char* name) : name_(name), val_(), dirty_(false) {}

  auto set(const std::optional<T>&& v) -> void {
    if (val_.has_value() != v.has_value() || (v && *val_ != *v)) {
      val_ = v;
      dirty_ = true;
    }
  }
  auto get() -> std::optional<T>& { return val_; }

  /* Reads the stored value from NVS and parses it into the correct type. */
  auto load(nvs_handle_t) -> std::optional<T>;
  /* Encodes the given value and writes it to NVS. */
  auto store(nvs_handle_t, T v) -> void;

  auto read(nvs_handle_t nvs) -> void { val_ = load(nvs); }
  auto write(nvs_handle_t nvs) -> void {
    if (!dirty_) {
      return;
    }
    dirty_ = false;
    if (val_) {
      store(nvs, *val_);
    } else {
      nvs_erase_key(nvs, name_);
    }
  }

 private:
  const char* name_;
  std::optional<T> val_;
  bool dirty_;
};

/*
 * Persistent configuration for the monitor. Values are returned exactly as
 * stored (or empty if absent); deciding what a missing or nonsensical value
 * means is left to the caller.
 */
class NvsStorage {
 public:
  static auto OpenSync() -> NvsStorage*;

  auto Read() -> void;
  auto Write() -> bool;

  auto RefreshIntervalMinutes() -> std::optional<uint16_t>;
  auto RefreshIntervalMinutes(std::optional<uint16_t>) -> void;

  auto Debug() -> std::optional<bool>;
  auto Debug(std::optional<bool>) -> void;

  /* Display names of bonded peripherals, keyed by identity address. */
  auto BluetoothNames() -> std::vector<bluetooth::MacAndName>;
  auto BluetoothName(const bluetooth::mac_addr_t&, std::optional<std::string>)
      -> void;

  explicit NvsStorage(nvs_handle_t);
  ~NvsStorage();

 private:
  auto DowngradeSchemaSync() -> bool;
  auto SchemaVersionSync() -> uint8_t;

  std::mutex mutex_;
  nvs_handle_t handle_;

  Setting<uint16_t> refresh_minutes_;
  Setting<uint8_t> debug_;
  Setting<std::vector<bluetooth::MacAndName>> bt_names_;
};

}  // namespace drivers
