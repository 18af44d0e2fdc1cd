/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#pragma once

#include <optional>

#include "drivers/bluetooth_types.hpp"
#include "monitor/device_record.hpp"

namespace monitor {

enum class FailureKind {
  kDiscoveryFailure,
  kNotFound,
  kAddressResolutionFailed,
  kLinkFailed,
  kUnreachable,
  kAccessDenied,
  kServiceNotFound,
  kCharacteristicNotFound,
  kReadFailed,
  kGeneric,
};

auto FailureName(FailureKind) -> const char*;

/*
 * Why a step of a device update didn't succeed. `cause` is the platform error
 * that triggered it, where there was one; it refines how some kinds are
 * classified, and is otherwise only logged.
 */
struct Failure {
  FailureKind kind;
  std::optional<drivers::bluetooth::PlatformError> cause;

  /* True if this failure only happened because we were told to stop. */
  auto IsCancellation() const -> bool;
};

enum class LinkDisposition {
  kBreak,
  kPreserve,
};

struct Verdict {
  LinkDisposition disposition;
  Status status;

  bool operator==(const Verdict&) const = default;
};

/*
 * Decides what a failure means for the device's cached link, and what the
 * user should be shown. The resulting status is never a success status for a
 * link-breaking failure.
 */
auto Classify(const Failure&) -> Verdict;

}  // namespace monitor
