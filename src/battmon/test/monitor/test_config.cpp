/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "monitor/config.hpp"

#include <chrono>

#include "catch2/catch.hpp"

namespace monitor {

TEST_CASE("monitor configuration", "[unit]") {
  SECTION("defaults") {
    Config c = Config::FromRaw({}, {});
    CHECK(c.refresh_interval == std::chrono::minutes{5});
    CHECK_FALSE(c.debug);
  }

  SECTION("stored values") {
    Config c = Config::FromRaw(15, true);
    CHECK(c.refresh_interval == std::chrono::minutes{15});
    CHECK(c.debug);
  }

  SECTION("zero interval falls back to the default") {
    Config c = Config::FromRaw(0, false);
    CHECK(c.refresh_interval == std::chrono::minutes{5});
  }
}

}  // namespace monitor
