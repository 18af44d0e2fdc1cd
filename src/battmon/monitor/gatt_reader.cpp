/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "monitor/gatt_reader.hpp"

#include <algorithm>
#include <cstdint>

#include "esp_log.h"

namespace monitor {

[[maybe_unused]] static constexpr char kTag[] = "gatt";

using drivers::bluetooth::CacheMode;
using drivers::bluetooth::PlatformError;
using drivers::bluetooth::Uuid;

/*
 * A discovery request that failed outright. Only the stack telling us there
 * is no such attribute counts as absent; anything else might mean the link is
 * no longer usable.
 */
static auto DiscoveryFailure(const PlatformError& err, FailureKind absent)
    -> Failure {
  switch (err.kind) {
    case PlatformError::Kind::kNotFound:
      return Failure{absent, err};
    case PlatformError::Kind::kUnreachable:
    case PlatformError::Kind::kTimedOut:
      return Failure{FailureKind::kUnreachable, err};
    case PlatformError::Kind::kAccessDenied:
      return Failure{FailureKind::kAccessDenied, err};
    case PlatformError::Kind::kProtocolError:
    case PlatformError::Kind::kCancelled:
    case PlatformError::Kind::kUnknown:
    default:
      return Failure{FailureKind::kGeneric, err};
  }
}

auto GattReader::ReadBattery(drivers::ILeLink& link,
                             const tasks::CancellationToken& cancel)
    -> cpp::result<uint8_t, Failure> {
  auto services = link.Services(Uuid::FromShort(kBatteryServiceUuid),
                                CacheMode::kUncached, cancel);
  if (services.has_error()) {
    return cpp::fail(
        DiscoveryFailure(services.error(), FailureKind::kServiceNotFound));
  }
  if (services.value().empty()) {
    return cpp::fail(Failure{FailureKind::kServiceNotFound, {}});
  }

  auto characteristics =
      link.Characteristics(services.value().front(),
                           Uuid::FromShort(kBatteryLevelUuid),
                           CacheMode::kUncached, cancel);
  if (characteristics.has_error()) {
    return cpp::fail(DiscoveryFailure(characteristics.error(),
                                      FailureKind::kCharacteristicNotFound));
  }
  if (characteristics.value().empty()) {
    return cpp::fail(Failure{FailureKind::kCharacteristicNotFound, {}});
  }

  auto value = link.Read(characteristics.value().front(), cancel);
  if (value.has_error()) {
    return cpp::fail(Failure{FailureKind::kReadFailed, value.error()});
  }
  if (value.value().empty()) {
    return cpp::fail(Failure{FailureKind::kReadFailed, {}});
  }

  // Battery Level is a single uint8 percentage; anything after it is ignored.
  uint8_t raw = value.value().front();
  if (raw > 100) {
    ESP_LOGW(kTag, "clamping out of range battery level %u", raw);
  }
  return std::min<uint8_t>(raw, 100);
}

}  // namespace monitor
