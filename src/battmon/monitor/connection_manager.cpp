/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "monitor/connection_manager.hpp"

#include <memory>
#include <utility>

#include "esp_log.h"

#include "drivers/bluetooth_types.hpp"

namespace monitor {

[[maybe_unused]] static constexpr char kTag[] = "connect";

using drivers::bluetooth::PlatformError;

ConnectionManager::ConnectionManager(drivers::IBleCentral& central,
                                     DeviceRegistry& registry)
    : central_(central), registry_(registry) {}

auto ConnectionManager::EnsureLink(const std::string& id,
                                   const tasks::CancellationToken& cancel)
    -> cpp::result<LinkLease, Failure> {
  drivers::ILeLink* cached = registry_.Link(id);
  if (cached && cached->IsConnected()) {
    ESP_LOGD(kTag, "reusing link to %s", id.c_str());
    return LinkLease{.link = cached, .fresh = {}};
  }
  if (cached) {
    ESP_LOGD(kTag, "cached link to %s went stale", id.c_str());
  }

  auto addr = central_.ResolveAddress(id, cancel);
  if (addr.has_error()) {
    const PlatformError& err = addr.error();
    if (err.kind == PlatformError::Kind::kNotFound) {
      return cpp::fail(Failure{FailureKind::kNotFound, err});
    }
    return cpp::fail(Failure{FailureKind::kAddressResolutionFailed, err});
  }

  auto opened = central_.OpenLink(addr.value(), cancel);
  if (opened.has_error()) {
    return cpp::fail(Failure{FailureKind::kLinkFailed, opened.error()});
  }
  std::unique_ptr<drivers::ILeLink> link = std::move(opened.value());
  if (!link) {
    return cpp::fail(Failure{FailureKind::kLinkFailed, {}});
  }

  ESP_LOGD(kTag, "opened new link to %s", id.c_str());
  drivers::ILeLink* raw = link.get();
  return LinkLease{.link = raw, .fresh = std::move(link)};
}

}  // namespace monitor
