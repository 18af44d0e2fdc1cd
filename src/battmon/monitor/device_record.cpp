/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "monitor/device_record.hpp"

namespace monitor {

auto StatusName(Status s) -> const char* {
  switch (s) {
    case Status::kUnknown:
      return "Unknown";
    case Status::kDisconnected:
      return "Disconnected";
    case Status::kConnected:
      return "Connected";
    case Status::kConnectedNoBatteryService:
      return "Connected (No Battery Service)";
    case Status::kUnreachable:
      return "Unreachable";
    case Status::kAccessDenied:
      return "Access Denied";
    case Status::kError:
    default:
      return "Error";
  }
}

auto StatusHoldsLink(Status s) -> bool {
  return s == Status::kConnected || s == Status::kConnectedNoBatteryService;
}

}  // namespace monitor
