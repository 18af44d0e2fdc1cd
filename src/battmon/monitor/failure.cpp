/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "monitor/failure.hpp"

#include "drivers/bluetooth_types.hpp"

namespace monitor {

using Kind = drivers::bluetooth::PlatformError::Kind;

auto FailureName(FailureKind kind) -> const char* {
  switch (kind) {
    case FailureKind::kDiscoveryFailure:
      return "DiscoveryFailure";
    case FailureKind::kNotFound:
      return "NotFound";
    case FailureKind::kAddressResolutionFailed:
      return "AddressResolutionFailed";
    case FailureKind::kLinkFailed:
      return "LinkFailed";
    case FailureKind::kUnreachable:
      return "Unreachable";
    case FailureKind::kAccessDenied:
      return "AccessDenied";
    case FailureKind::kServiceNotFound:
      return "ServiceNotFound";
    case FailureKind::kCharacteristicNotFound:
      return "CharacteristicNotFound";
    case FailureKind::kReadFailed:
      return "ReadFailed";
    case FailureKind::kGeneric:
    default:
      return "Generic";
  }
}

auto Failure::IsCancellation() const -> bool {
  return cause && cause->kind == Kind::kCancelled;
}

static auto ClassifyReadFailure(const Failure& f) -> Status {
  if (!f.cause) {
    // Read completed, but with nothing in it.
    return Status::kError;
  }
  switch (f.cause->kind) {
    case Kind::kUnreachable:
    case Kind::kTimedOut:
      return Status::kUnreachable;
    case Kind::kAccessDenied:
      return Status::kAccessDenied;
    default:
      return Status::kError;
  }
}

auto Classify(const Failure& f) -> Verdict {
  switch (f.kind) {
    case FailureKind::kServiceNotFound:
    case FailureKind::kCharacteristicNotFound:
      return {LinkDisposition::kPreserve, Status::kConnectedNoBatteryService};
    case FailureKind::kNotFound:
    case FailureKind::kLinkFailed:
      return {LinkDisposition::kBreak, Status::kDisconnected};
    case FailureKind::kUnreachable:
      return {LinkDisposition::kBreak, Status::kUnreachable};
    case FailureKind::kAccessDenied:
      return {LinkDisposition::kBreak, Status::kAccessDenied};
    case FailureKind::kReadFailed:
      return {LinkDisposition::kBreak, ClassifyReadFailure(f)};
    case FailureKind::kAddressResolutionFailed:
    case FailureKind::kDiscoveryFailure:
    case FailureKind::kGeneric:
    default:
      return {LinkDisposition::kBreak, Status::kError};
  }
}

}  // namespace monitor
