/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "monitor/device_registry.hpp"

#include <memory>
#include <string>
#include <vector>

#include "catch2/catch.hpp"

#include "fakes.hpp"

namespace monitor {

using drivers::bluetooth::Peripheral;

TEST_CASE("device registry", "[unit]") {
  DeviceRegistry registry;
  registry.Load({Peripheral{.id = "A1", .name = "Headset"},
                 Peripheral{.id = "B2", .name = "Mouse"}});

  SECTION("starts every device unknown, in discovery order") {
    REQUIRE(registry.Size() == 2);
    CHECK(registry.Ids() == std::vector<std::string>{"A1", "B2"});

    auto a1 = registry.Get("A1");
    REQUIRE(a1);
    CHECK(a1->name == "Headset");
    CHECK(a1->status == Status::kUnknown);
    CHECK(a1->percent == 0);
    CHECK_FALSE(a1->has_link);
  }

  SECTION("ignores duplicate ids") {
    registry.Load({Peripheral{.id = "A1", .name = "Headset"},
                   Peripheral{.id = "A1", .name = "Headset again"}});
    REQUIRE(registry.Size() == 1);
    CHECK(registry.Get("A1")->name == "Headset");
  }

  SECTION("unknown ids") {
    CHECK_FALSE(registry.Get("C3"));
    CHECK(registry.Link("C3") == nullptr);
    CHECK_FALSE(registry.Update("C3", [](DeviceRecord&) {}));
  }

  SECTION("updates apply to a single record") {
    auto state = std::make_shared<fakes::LinkState>();
    bool found = registry.Update("A1", [&](DeviceRecord& r) {
      r.status = Status::kConnected;
      r.percent = 42;
      r.link = std::make_unique<fakes::FakeLink>(state);
    });
    CHECK(found);

    auto a1 = registry.Get("A1");
    CHECK(a1->status == Status::kConnected);
    CHECK(a1->percent == 42);
    CHECK(a1->has_link);
    CHECK(registry.Link("A1") != nullptr);

    auto b2 = registry.Get("B2");
    CHECK(b2->status == Status::kUnknown);
    CHECK_FALSE(b2->has_link);

    SECTION("taking every link leaves the device disconnected") {
      auto links = registry.TakeAllLinks();
      CHECK(links.size() == 1);
      CHECK(registry.Get("A1")->status == Status::kDisconnected);
      CHECK(registry.Get("A1")->percent == 0);
      CHECK_FALSE(registry.Get("A1")->has_link);
      // Closing is the caller's job.
      CHECK(state->close_calls == 0);
      links.front()->Close();
    }

    SECTION("reloading closes links held by the old records") {
      registry.Load({Peripheral{.id = "A1", .name = "Headset"}});
      CHECK(state->close_calls == 1);
      CHECK(registry.Get("A1")->status == Status::kUnknown);
      CHECK_FALSE(registry.Get("A1")->has_link);
      CHECK_FALSE(registry.Get("B2"));
    }
  }

  SECTION("snapshots are copies") {
    auto before = registry.Snapshot();
    registry.Update("B2", [](DeviceRecord& r) { r.percent = 10; });
    CHECK(before[1].percent == 0);
    CHECK(registry.Snapshot()[1].percent == 10);
  }
}

}  // namespace monitor
