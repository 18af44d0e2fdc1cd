/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "drivers/bluetooth_types.hpp"
#include "monitor/device_record.hpp"

namespace monitor {

static constexpr char kNameLabel[] = "Name";
static constexpr char kStatusLabel[] = "Status";
static constexpr char kBatteryLabel[] = "Battery Level";
static constexpr char kBatteryUnit[] = "%";

/* The group of display fields belonging to a single device. */
struct SensorContainer {
  // Empty for the placeholder shown when there are no devices.
  std::string id;
  std::string title;
  std::string name;
  std::string status;
  uint8_t battery;

  bool operator==(const SensorContainer&) const = default;
};

/*
 * Display fields for every tracked device. Rebuilt whenever the set of
 * devices changes, and otherwise only ever written to by SensorSync. Safe to
 * read from any task.
 */
class SensorPanel {
 public:
  static constexpr char kPlaceholderTitle[] =
      "Bluetooth Device - None Detected";
  static constexpr char kPlaceholderName[] = "None";
  static constexpr char kPlaceholderStatus[] = "No devices found";

  SensorPanel();

  auto Rebuild(const std::vector<drivers::bluetooth::Peripheral>&) -> void;

  /* Returns false if there are no fields for this device. */
  auto Set(const std::string& id, const std::string& status, uint8_t battery)
      -> bool;

  /* Puts every device's fields back to their disconnected state. */
  auto ResetAll() -> void;

  auto Containers() const -> std::vector<SensorContainer>;
  auto Find(const std::string& id) const -> std::optional<SensorContainer>;

 private:
  mutable std::mutex mutex_;
  std::vector<SensorContainer> containers_;
};

/* Copies a device's latest result into its display fields. */
class SensorSync {
 public:
  explicit SensorSync(SensorPanel& panel) : panel_(panel) {}

  auto Publish(const DeviceView&) -> void;

 private:
  SensorPanel& panel_;
};

}  // namespace monitor
