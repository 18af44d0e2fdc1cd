/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "monitor/sensors.hpp"

#include <mutex>

#include "esp_log.h"

namespace monitor {

[[maybe_unused]] static constexpr char kTag[] = "sensors";

static constexpr char kTitlePrefix[] = "Bluetooth Device - ";

SensorPanel::SensorPanel() {
  Rebuild({});
}

auto SensorPanel::Rebuild(
    const std::vector<drivers::bluetooth::Peripheral>& peripherals) -> void {
  std::vector<SensorContainer> fresh;
  for (const auto& p : peripherals) {
    fresh.push_back(SensorContainer{
        .id = p.id,
        .title = kTitlePrefix + p.name,
        .name = p.name,
        .status = StatusName(Status::kDisconnected),
        .battery = 0,
    });
  }
  if (fresh.empty()) {
    fresh.push_back(SensorContainer{
        .id = {},
        .title = kPlaceholderTitle,
        .name = kPlaceholderName,
        .status = kPlaceholderStatus,
        .battery = 0,
    });
  }

  std::lock_guard<std::mutex> lock{mutex_};
  containers_ = std::move(fresh);
}

auto SensorPanel::Set(const std::string& id,
                      const std::string& status,
                      uint8_t battery) -> bool {
  if (id.empty()) {
    return false;
  }
  std::lock_guard<std::mutex> lock{mutex_};
  for (auto& c : containers_) {
    if (c.id == id) {
      c.status = status;
      c.battery = battery;
      return true;
    }
  }
  return false;
}

auto SensorPanel::ResetAll() -> void {
  std::lock_guard<std::mutex> lock{mutex_};
  for (auto& c : containers_) {
    if (c.id.empty()) {
      continue;
    }
    c.status = StatusName(Status::kDisconnected);
    c.battery = 0;
  }
}

auto SensorPanel::Containers() const -> std::vector<SensorContainer> {
  std::lock_guard<std::mutex> lock{mutex_};
  return containers_;
}

auto SensorPanel::Find(const std::string& id) const
    -> std::optional<SensorContainer> {
  std::lock_guard<std::mutex> lock{mutex_};
  for (const auto& c : containers_) {
    if (c.id == id) {
      return c;
    }
  }
  return {};
}

auto SensorSync::Publish(const DeviceView& device) -> void {
  if (!panel_.Set(device.id, StatusName(device.status), device.percent)) {
    ESP_LOGW(kTag, "no display fields for %s", device.id.c_str());
  }
}

}  // namespace monitor
