/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "monitor/enumerator.hpp"

#include "esp_log.h"

namespace monitor {

[[maybe_unused]] static constexpr char kTag[] = "enumerate";

auto Enumerator::Enumerate() -> Discovery {
  auto res = central_.PairedPeripherals();
  if (res.has_error()) {
    ESP_LOGE(kTag, "DiscoveryFailure: %s (code %d)",
             drivers::bluetooth::KindName(res.error().kind), res.error().code);
    return Discovery{.peripherals = {}, .error = res.error()};
  }

  Discovery out{};
  for (const auto& p : res.value()) {
    if (p.name.empty()) {
      ESP_LOGD(kTag, "skipping unnamed peripheral %s", p.id.c_str());
      continue;
    }
    ESP_LOGI(kTag, "found '%s' (%s)", p.name.c_str(), p.id.c_str());
    out.peripherals.push_back(p);
  }
  return out;
}

}  // namespace monitor
