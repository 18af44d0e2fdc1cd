/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "monitor/device_updater.hpp"

#include <memory>
#include <utility>

#include "esp_log.h"

#include "drivers/bluetooth_types.hpp"

namespace monitor {

[[maybe_unused]] static constexpr char kTag[] = "update";

DeviceUpdater::DeviceUpdater(DeviceRegistry& registry,
                             ConnectionManager& connections,
                             GattReader& reader)
    : registry_(registry), connections_(connections), reader_(reader) {}

auto DeviceUpdater::Attempt(const std::string& id,
                            const tasks::CancellationToken& cancel)
    -> AttemptOutcome {
  if (cancel.cancelled()) {
    return AttemptOutcome::kCancelled;
  }

  auto lease = connections_.EnsureLink(id, cancel);
  if (lease.has_error()) {
    return Fail(id, lease.error(), nullptr);
  }

  auto percent = reader_.ReadBattery(*lease.value().link, cancel);
  if (percent.has_error()) {
    return Fail(id, percent.error(), &lease.value());
  }

  ESP_LOGD(kTag, "%s: battery at %u%%", id.c_str(), percent.value());
  if (lease.value().is_fresh()) {
    Commit(id, Status::kConnected, percent.value(), LinkAction::kReplace,
           std::move(lease.value().fresh));
  } else {
    Commit(id, Status::kConnected, percent.value(), LinkAction::kKeep, {});
  }
  return AttemptOutcome::kSucceeded;
}

auto DeviceUpdater::ResetExhausted(const std::string& id) -> void {
  ESP_LOGW(kTag, "%s: giving up until the next cycle", id.c_str());
  Commit(id, Status::kDisconnected, 0, LinkAction::kDrop, {});
}

auto DeviceUpdater::Fail(const std::string& id,
                         const Failure& failure,
                         LinkLease* lease) -> AttemptOutcome {
  if (failure.IsCancellation()) {
    ESP_LOGD(kTag, "%s: attempt cancelled", id.c_str());
    if (lease && lease->fresh) {
      lease->fresh->Close();
    }
    return AttemptOutcome::kCancelled;
  }

  Verdict verdict = Classify(failure);
  if (failure.cause) {
    ESP_LOGW(kTag, "%s: %s (%s, code %d)", id.c_str(),
             FailureName(failure.kind),
             drivers::bluetooth::KindName(failure.cause->kind),
             failure.cause->code);
  } else {
    ESP_LOGW(kTag, "%s: %s", id.c_str(), FailureName(failure.kind));
  }

  if (verdict.disposition == LinkDisposition::kPreserve) {
    if (lease && lease->is_fresh()) {
      Commit(id, verdict.status, 0, LinkAction::kReplace,
             std::move(lease->fresh));
    } else {
      Commit(id, verdict.status, 0, LinkAction::kKeep, {});
    }
    return AttemptOutcome::kLinkPreserved;
  }

  if (lease && lease->fresh) {
    lease->fresh->Close();
    lease->fresh.reset();
  }
  Commit(id, verdict.status, 0, LinkAction::kDrop, {});
  return AttemptOutcome::kLinkBroken;
}

auto DeviceUpdater::Commit(const std::string& id,
                           Status status,
                           uint8_t percent,
                           LinkAction action,
                           std::unique_ptr<drivers::ILeLink> replacement)
    -> void {
  std::unique_ptr<drivers::ILeLink> displaced;
  bool found = registry_.Update(id, [&](DeviceRecord& r) {
    r.status = status;
    r.percent = percent;
    switch (action) {
      case LinkAction::kKeep:
        break;
      case LinkAction::kDrop:
        displaced = std::move(r.link);
        break;
      case LinkAction::kReplace:
        displaced = std::move(r.link);
        r.link = std::move(replacement);
        break;
    }
  });

  if (!found) {
    ESP_LOGW(kTag, "%s was removed mid-update", id.c_str());
  }
  if (displaced) {
    displaced->Close();
  }
  // Only left over if the record vanished before we could install it.
  if (replacement) {
    replacement->Close();
  }
}

}  // namespace monitor
