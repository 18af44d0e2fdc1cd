/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include <cstdint>

#include "freertos/FreeRTOS.h"

#include "catch_runner.hpp"
#include "esp_console.h"
#include "esp_log.h"

#include "dev_console/console.hpp"

void RegisterCatch2() {
  esp_console_cmd_t cmd{
      .command = "catch",
      .help = "Execute the catch2 test runner. Use -? for options.",
      .hint = NULL,
      .func = &exec_catch2,
      .argtable = NULL};
  esp_console_cmd_register(&cmd);
}

namespace console {

class TestConsole : public Console {
 protected:
  auto RegisterExtraComponents() -> void override { RegisterCatch2(); }
  auto GetStackSizeKiB() -> uint16_t override {
    // Catch2 needs a particularly large stack.
    return 64;
  }
};

}  // namespace console

extern "C" void app_main(void) {
  esp_log_level_set("*", ESP_LOG_WARN);

  // Run everything once at boot, then leave the console up for reruns.
  char arg[] = "catch";
  char* argv[] = {arg};
  exec_catch2(1, argv);

  console::Console* c = new console::TestConsole();
  c->Launch();
}
