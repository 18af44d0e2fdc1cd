/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "monitor/failure.hpp"

#include <string>

#include "catch2/catch.hpp"

#include "monitor/device_record.hpp"
#include "fakes.hpp"

namespace monitor {

using fakes::Error;
using Kind = drivers::bluetooth::PlatformError::Kind;

TEST_CASE("failure classification", "[unit]") {
  SECTION("missing battery service keeps the link") {
    Verdict v = Classify(Failure{FailureKind::kServiceNotFound, {}});
    CHECK(v.disposition == LinkDisposition::kPreserve);
    CHECK(v.status == Status::kConnectedNoBatteryService);
  }

  SECTION("missing battery level characteristic keeps the link") {
    Verdict v = Classify(Failure{FailureKind::kCharacteristicNotFound, {}});
    CHECK(v.disposition == LinkDisposition::kPreserve);
    CHECK(v.status == Status::kConnectedNoBatteryService);
  }

  SECTION("connection problems show as disconnected") {
    CHECK(Classify(Failure{FailureKind::kNotFound, {}}) ==
          Verdict{LinkDisposition::kBreak, Status::kDisconnected});
    CHECK(Classify(Failure{FailureKind::kLinkFailed,
                           Error(Kind::kUnreachable)}) ==
          Verdict{LinkDisposition::kBreak, Status::kDisconnected});
  }

  SECTION("transport failures keep their category") {
    CHECK(Classify(Failure{FailureKind::kUnreachable, {}}) ==
          Verdict{LinkDisposition::kBreak, Status::kUnreachable});
    CHECK(Classify(Failure{FailureKind::kAccessDenied, {}}) ==
          Verdict{LinkDisposition::kBreak, Status::kAccessDenied});
  }

  SECTION("read failures are refined by their cause") {
    CHECK(Classify(Failure{FailureKind::kReadFailed,
                           Error(Kind::kUnreachable)})
              .status == Status::kUnreachable);
    CHECK(Classify(Failure{FailureKind::kReadFailed, Error(Kind::kTimedOut)})
              .status == Status::kUnreachable);
    CHECK(Classify(Failure{FailureKind::kReadFailed,
                           Error(Kind::kAccessDenied)})
              .status == Status::kAccessDenied);
    CHECK(Classify(Failure{FailureKind::kReadFailed,
                           Error(Kind::kProtocolError)})
              .status == Status::kError);
    CHECK(Classify(Failure{FailureKind::kReadFailed, {}}).status ==
          Status::kError);
    CHECK(Classify(Failure{FailureKind::kReadFailed, {}}).disposition ==
          LinkDisposition::kBreak);
  }

  SECTION("everything else is an error") {
    for (auto kind : {FailureKind::kAddressResolutionFailed,
                      FailureKind::kDiscoveryFailure, FailureKind::kGeneric}) {
      CHECK(Classify(Failure{kind, {}}) ==
            Verdict{LinkDisposition::kBreak, Status::kError});
    }
  }

  SECTION("breaking failures never report a connected status") {
    for (int i = 0; i <= static_cast<int>(FailureKind::kGeneric); i++) {
      Verdict v = Classify(Failure{static_cast<FailureKind>(i), {}});
      if (v.disposition == LinkDisposition::kBreak) {
        CHECK_FALSE(StatusHoldsLink(v.status));
      } else {
        CHECK(StatusHoldsLink(v.status));
      }
    }
  }

  SECTION("only a cancelled cause counts as cancellation") {
    CHECK(Failure{FailureKind::kGeneric, Error(Kind::kCancelled)}
              .IsCancellation());
    CHECK_FALSE(Failure{FailureKind::kGeneric, Error(Kind::kUnknown)}
                    .IsCancellation());
    CHECK_FALSE(Failure{FailureKind::kGeneric, {}}.IsCancellation());
  }
}

TEST_CASE("status display names", "[unit]") {
  CHECK(std::string{StatusName(Status::kConnected)} == "Connected");
  CHECK(std::string{StatusName(Status::kConnectedNoBatteryService)} ==
        "Connected (No Battery Service)");
  CHECK(std::string{StatusName(Status::kAccessDenied)} == "Access Denied");
  CHECK(std::string{StatusName(Status::kUnknown)} == "Unknown");
}

}  // namespace monitor
