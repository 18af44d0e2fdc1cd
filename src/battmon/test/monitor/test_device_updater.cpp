/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "monitor/device_updater.hpp"

#include <chrono>
#include <memory>

#include "catch2/catch.hpp"

#include "monitor/connection_manager.hpp"
#include "monitor/device_registry.hpp"
#include "monitor/gatt_reader.hpp"
#include "monitor/retry.hpp"
#include "fakes.hpp"

namespace monitor {

using drivers::bluetooth::Peripheral;
using fakes::Error;
using Kind = drivers::bluetooth::PlatformError::Kind;

TEST_CASE("single device update attempts", "[unit]") {
  fakes::FakeCentral central;
  auto& dev = central.Add("A1", "Headset");
  DeviceRegistry registry;
  registry.Load({Peripheral{.id = "A1", .name = "Headset"}});
  ConnectionManager connections{central, registry};
  GattReader reader;
  DeviceUpdater updater{registry, connections, reader};
  tasks::CancellationSource cancel;

  SECTION("success installs the new link") {
    dev.script.value = {73};
    CHECK(updater.Attempt("A1", cancel.token()) ==
          AttemptOutcome::kSucceeded);

    auto view = registry.Get("A1");
    CHECK(view->status == Status::kConnected);
    CHECK(view->percent == 73);
    CHECK(view->has_link);
    CHECK(dev.last_link().close_calls == 0);

    SECTION("and reuses it next time") {
      dev.last_link().script.value = {70};
      CHECK(updater.Attempt("A1", cancel.token()) ==
            AttemptOutcome::kSucceeded);
      CHECK(dev.opens == 1);
      CHECK(registry.Get("A1")->percent == 70);
    }

    SECTION("and replaces it once it has dropped") {
      dev.last_link().connected = false;
      CHECK(updater.Attempt("A1", cancel.token()) ==
            AttemptOutcome::kSucceeded);
      CHECK(dev.opens == 2);
      CHECK(dev.links[0]->close_calls == 1);
      CHECK(dev.links[1]->close_calls == 0);
      CHECK(registry.Get("A1")->has_link);
    }

    SECTION("and drops it when the peripheral stops answering") {
      dev.last_link().script.read_error = Error(Kind::kUnreachable);
      CHECK(updater.Attempt("A1", cancel.token()) ==
            AttemptOutcome::kLinkBroken);
      auto after = registry.Get("A1");
      CHECK(after->status == Status::kUnreachable);
      CHECK(after->percent == 0);
      CHECK_FALSE(after->has_link);
      CHECK(dev.last_link().close_calls == 1);
    }

    registry.TakeAllLinks();
  }

  SECTION("missing battery service keeps the link") {
    dev.script.services = {};
    CHECK(updater.Attempt("A1", cancel.token()) ==
          AttemptOutcome::kLinkPreserved);

    auto view = registry.Get("A1");
    CHECK(view->status == Status::kConnectedNoBatteryService);
    CHECK(view->percent == 0);
    CHECK(view->has_link);
    CHECK(dev.last_link().close_calls == 0);

    registry.TakeAllLinks();
  }

  SECTION("vendor error during discovery drops the link") {
    dev.script.services_error = Error(Kind::kProtocolError);
    CHECK(updater.Attempt("A1", cancel.token()) ==
          AttemptOutcome::kLinkBroken);

    auto view = registry.Get("A1");
    CHECK(view->status == Status::kError);
    CHECK(view->percent == 0);
    CHECK_FALSE(view->has_link);
    CHECK(dev.last_link().close_calls == 1);
  }

  SECTION("giving up leaves the device disconnected") {
    dev.script.read_error = Error(Kind::kUnreachable);
    REQUIRE(updater.Attempt("A1", cancel.token()) ==
            AttemptOutcome::kLinkBroken);
    REQUIRE(registry.Get("A1")->status == Status::kUnreachable);

    updater.ResetExhausted("A1");
    auto view = registry.Get("A1");
    CHECK(view->status == Status::kDisconnected);
    CHECK(view->percent == 0);
    CHECK_FALSE(view->has_link);
  }

  SECTION("failed read closes the new link") {
    dev.script.read_error = Error(Kind::kAccessDenied);
    CHECK(updater.Attempt("A1", cancel.token()) ==
          AttemptOutcome::kLinkBroken);

    auto view = registry.Get("A1");
    CHECK(view->status == Status::kAccessDenied);
    CHECK_FALSE(view->has_link);
    CHECK(dev.last_link().close_calls == 1);
  }

  SECTION("connection failure") {
    dev.open_error = Error(Kind::kUnreachable);
    CHECK(updater.Attempt("A1", cancel.token()) ==
          AttemptOutcome::kLinkBroken);
    CHECK(registry.Get("A1")->status == Status::kDisconnected);
  }

  SECTION("cancellation records nothing") {
    dev.script.services_error = Error(Kind::kCancelled);
    CHECK(updater.Attempt("A1", cancel.token()) ==
          AttemptOutcome::kCancelled);

    auto view = registry.Get("A1");
    CHECK(view->status == Status::kUnknown);
    CHECK_FALSE(view->has_link);
    CHECK(dev.last_link().close_calls == 1);
  }

  SECTION("does nothing once already cancelled") {
    cancel.Cancel();
    CHECK(updater.Attempt("A1", cancel.token()) ==
          AttemptOutcome::kCancelled);
    CHECK(central.calls() == 0);
  }
}

TEST_CASE("retrying device updates", "[unit]") {
  fakes::FakeClock clock;
  RetryPolicy retry{clock};
  tasks::CancellationSource cancel;
  int attempts = 0;

  SECTION("defaults") {
    CHECK(retry.attempts() == 3);
    CHECK(retry.delay() == std::chrono::milliseconds{1000});
  }

  SECTION("success is final") {
    auto res = retry.Run(
        [&]() {
          attempts++;
          return AttemptOutcome::kSucceeded;
        },
        cancel.token());
    CHECK(res == AttemptOutcome::kSucceeded);
    CHECK(attempts == 1);
    CHECK(clock.sleeps.empty());
  }

  SECTION("a preserved link is final") {
    auto res = retry.Run(
        [&]() {
          attempts++;
          return AttemptOutcome::kLinkPreserved;
        },
        cancel.token());
    CHECK(res == AttemptOutcome::kLinkPreserved);
    CHECK(attempts == 1);
  }

  SECTION("broken links are retried with a delay between attempts") {
    auto res = retry.Run(
        [&]() {
          attempts++;
          return AttemptOutcome::kLinkBroken;
        },
        cancel.token());
    CHECK(res == AttemptOutcome::kLinkBroken);
    CHECK(attempts == 3);
    CHECK(clock.sleeps == std::vector<std::chrono::milliseconds>{
                              std::chrono::milliseconds{1000},
                              std::chrono::milliseconds{1000}});
  }

  SECTION("stops retrying once an attempt succeeds") {
    auto res = retry.Run(
        [&]() {
          attempts++;
          return attempts < 2 ? AttemptOutcome::kLinkBroken
                              : AttemptOutcome::kSucceeded;
        },
        cancel.token());
    CHECK(res == AttemptOutcome::kSucceeded);
    CHECK(attempts == 2);
    CHECK(clock.sleeps.size() == 1);
  }

  SECTION("cancellation cuts the delay short") {
    auto res = retry.Run(
        [&]() {
          attempts++;
          cancel.Cancel();
          return AttemptOutcome::kLinkBroken;
        },
        cancel.token());
    CHECK(res == AttemptOutcome::kCancelled);
    CHECK(attempts == 1);
  }
}

}  // namespace monitor
