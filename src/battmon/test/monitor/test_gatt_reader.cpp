/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "monitor/gatt_reader.hpp"

#include <memory>

#include "catch2/catch.hpp"

#include "monitor/failure.hpp"
#include "fakes.hpp"

namespace monitor {

using fakes::Error;
using Kind = drivers::bluetooth::PlatformError::Kind;

TEST_CASE("reading the battery service", "[unit]") {
  auto state = std::make_shared<fakes::LinkState>();
  fakes::FakeLink link{state};
  tasks::CancellationToken token;
  GattReader reader;

  SECTION("reads the level from the standard characteristic") {
    state->script.value = {73};
    auto res = reader.ReadBattery(link, token);
    REQUIRE(res.has_value());
    CHECK(res.value() == 73);

    REQUIRE(state->last_service_uuid);
    CHECK(state->last_service_uuid->AsShort() == kBatteryServiceUuid);
    REQUIRE(state->last_characteristic_uuid);
    CHECK(state->last_characteristic_uuid->AsShort() == kBatteryLevelUuid);
    CHECK(state->read_calls == 1);
  }

  SECTION("always bypasses the attribute cache") {
    REQUIRE(reader.ReadBattery(link, token).has_value());
    REQUIRE(state->cache_modes.size() == 2);
    CHECK(state->cache_modes[0] == fakes::CacheMode::kUncached);
    CHECK(state->cache_modes[1] == fakes::CacheMode::kUncached);
  }

  SECTION("ignores trailing bytes") {
    state->script.value = {55, 1, 2};
    CHECK(reader.ReadBattery(link, token).value() == 55);
  }

  SECTION("clamps nonsense levels") {
    state->script.value = {250};
    CHECK(reader.ReadBattery(link, token).value() == 100);
  }

  SECTION("no battery service") {
    state->script.services = {};
    auto res = reader.ReadBattery(link, token);
    REQUIRE(res.has_error());
    CHECK(res.error().kind == FailureKind::kServiceNotFound);
    CHECK(state->characteristics_calls == 0);
  }

  SECTION("stack reports the service doesn't exist") {
    state->script.services_error = Error(Kind::kNotFound);
    auto res = reader.ReadBattery(link, token);
    REQUIRE(res.has_error());
    CHECK(res.error().kind == FailureKind::kServiceNotFound);
  }

  SECTION("service discovery rejected by the peripheral") {
    state->script.services_error = Error(Kind::kProtocolError);
    auto res = reader.ReadBattery(link, token);
    REQUIRE(res.has_error());
    CHECK(res.error().kind == FailureKind::kGeneric);
    CHECK(Classify(res.error()) ==
          Verdict{LinkDisposition::kBreak, Status::kError});
  }

  SECTION("characteristic discovery fails for an unknown reason") {
    state->script.characteristics_error = Error(Kind::kUnknown);
    auto res = reader.ReadBattery(link, token);
    REQUIRE(res.has_error());
    CHECK(res.error().kind == FailureKind::kGeneric);
    CHECK(state->read_calls == 0);
  }

  SECTION("no battery level characteristic") {
    state->script.characteristics = {};
    auto res = reader.ReadBattery(link, token);
    REQUIRE(res.has_error());
    CHECK(res.error().kind == FailureKind::kCharacteristicNotFound);
    CHECK(state->read_calls == 0);
  }

  SECTION("peripheral went away mid-discovery") {
    state->script.characteristics_error = Error(Kind::kUnreachable);
    auto res = reader.ReadBattery(link, token);
    REQUIRE(res.has_error());
    CHECK(res.error().kind == FailureKind::kUnreachable);
  }

  SECTION("discovery needs pairing") {
    state->script.services_error = Error(Kind::kAccessDenied);
    auto res = reader.ReadBattery(link, token);
    REQUIRE(res.has_error());
    CHECK(res.error().kind == FailureKind::kAccessDenied);
  }

  SECTION("cancelled discovery") {
    state->script.services_error = Error(Kind::kCancelled);
    auto res = reader.ReadBattery(link, token);
    REQUIRE(res.has_error());
    CHECK(res.error().IsCancellation());
  }

  SECTION("read failed") {
    state->script.read_error = Error(Kind::kTimedOut);
    auto res = reader.ReadBattery(link, token);
    REQUIRE(res.has_error());
    CHECK(res.error().kind == FailureKind::kReadFailed);
    REQUIRE(res.error().cause);
    CHECK(res.error().cause->kind == Kind::kTimedOut);
  }

  SECTION("empty read") {
    state->script.value = {};
    auto res = reader.ReadBattery(link, token);
    REQUIRE(res.has_error());
    CHECK(res.error().kind == FailureKind::kReadFailed);
    CHECK_FALSE(res.error().cause);
  }
}

}  // namespace monitor
