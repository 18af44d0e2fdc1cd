/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include "drivers/nvs.hpp"

namespace monitor {

/* User-adjustable settings, already checked and with defaults applied. */
struct Config {
  static constexpr uint16_t kDefaultRefreshMinutes = 5;

  std::chrono::minutes refresh_interval;
  bool debug;

  /* Missing or nonsensical values are replaced by their defaults. */
  static auto FromRaw(std::optional<uint16_t> refresh_minutes,
                      std::optional<bool> debug) -> Config;
  static auto Load(drivers::NvsStorage&) -> Config;

  /* Sets how chatty the monitor's log tags are. */
  auto ApplyLogLevel() const -> void;

  bool operator==(const Config&) const = default;
};

}  // namespace monitor
