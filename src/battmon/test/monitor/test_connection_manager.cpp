/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "monitor/connection_manager.hpp"

#include <memory>

#include "catch2/catch.hpp"

#include "monitor/device_registry.hpp"
#include "fakes.hpp"

namespace monitor {

using drivers::bluetooth::Peripheral;
using fakes::Error;
using Kind = drivers::bluetooth::PlatformError::Kind;

TEST_CASE("establishing links", "[unit]") {
  fakes::FakeCentral central;
  central.Add("A1", "Headset");
  DeviceRegistry registry;
  registry.Load({Peripheral{.id = "A1", .name = "Headset"}});
  ConnectionManager connections{central, registry};
  tasks::CancellationToken token;

  SECTION("opens a new link when there is none cached") {
    auto lease = connections.EnsureLink("A1", token);
    REQUIRE(lease.has_value());
    CHECK(lease.value().is_fresh());
    CHECK(lease.value().link == lease.value().fresh.get());
    CHECK(central.device("A1").resolves == 1);
    CHECK(central.device("A1").opens == 1);

    // Installing it is someone else's job.
    CHECK_FALSE(registry.Get("A1")->has_link);
    lease.value().fresh->Close();
  }

  SECTION("with a cached link") {
    auto state = std::make_shared<fakes::LinkState>();
    registry.Update("A1", [&](DeviceRecord& r) {
      r.status = Status::kConnected;
      r.link = std::make_unique<fakes::FakeLink>(state);
    });

    SECTION("reuses it while it's connected") {
      auto lease = connections.EnsureLink("A1", token);
      REQUIRE(lease.has_value());
      CHECK_FALSE(lease.value().is_fresh());
      CHECK(lease.value().link == registry.Link("A1"));
      CHECK(central.device("A1").resolves == 0);
      CHECK(central.device("A1").opens == 0);
    }

    SECTION("reconnects once it has dropped") {
      state->connected = false;
      auto lease = connections.EnsureLink("A1", token);
      REQUIRE(lease.has_value());
      CHECK(lease.value().is_fresh());
      CHECK(central.device("A1").resolves == 1);
      CHECK(central.device("A1").opens == 1);
      lease.value().fresh->Close();
    }

    registry.TakeAllLinks();
  }

  SECTION("peripheral is no longer bonded") {
    central.device("A1").resolve_error = Error(Kind::kNotFound);
    auto lease = connections.EnsureLink("A1", token);
    REQUIRE(lease.has_error());
    CHECK(lease.error().kind == FailureKind::kNotFound);
    CHECK(central.device("A1").opens == 0);
  }

  SECTION("address lookup fails") {
    central.device("A1").resolve_error = Error(Kind::kProtocolError);
    auto lease = connections.EnsureLink("A1", token);
    REQUIRE(lease.has_error());
    CHECK(lease.error().kind == FailureKind::kAddressResolutionFailed);
    REQUIRE(lease.error().cause);
    CHECK(lease.error().cause->kind == Kind::kProtocolError);
  }

  SECTION("link can't be opened") {
    central.device("A1").open_error = Error(Kind::kTimedOut);
    auto lease = connections.EnsureLink("A1", token);
    REQUIRE(lease.has_error());
    CHECK(lease.error().kind == FailureKind::kLinkFailed);
  }

  SECTION("cancelled while opening") {
    central.device("A1").open_error = Error(Kind::kCancelled);
    auto lease = connections.EnsureLink("A1", token);
    REQUIRE(lease.has_error());
    CHECK(lease.error().IsCancellation());
  }
}

}  // namespace monitor
