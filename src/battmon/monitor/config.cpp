/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "monitor/config.hpp"

#include "esp_log.h"

namespace monitor {

[[maybe_unused]] static constexpr char kTag[] = "config";

static constexpr const char* kMonitorTags[] = {
    "monitor", "registry", "connect", "gatt",      "update",
    "sched",   "sensors",  "ble",     "enumerate", "poll",
};

auto Config::FromRaw(std::optional<uint16_t> refresh_minutes,
                     std::optional<bool> debug) -> Config {
  uint16_t minutes = refresh_minutes.value_or(kDefaultRefreshMinutes);
  if (minutes == 0) {
    ESP_LOGW(kTag, "refresh interval must be positive; using %u minutes",
             kDefaultRefreshMinutes);
    minutes = kDefaultRefreshMinutes;
  }
  return Config{
      .refresh_interval = std::chrono::minutes{minutes},
      .debug = debug.value_or(false),
  };
}

auto Config::Load(drivers::NvsStorage& nvs) -> Config {
  return FromRaw(nvs.RefreshIntervalMinutes(), nvs.Debug());
}

auto Config::ApplyLogLevel() const -> void {
  esp_log_level_t level = debug ? ESP_LOG_DEBUG : ESP_LOG_INFO;
  for (const char* tag : kMonitorTags) {
    esp_log_level_set(tag, level);
  }
}

}  // namespace monitor
