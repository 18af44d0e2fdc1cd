/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "dev_console/console.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <optional>
#include <string>

#include "esp_console.h"
#include "esp_log.h"
#include "esp_system.h"

namespace console {

struct LevelName {
  const char* name;
  esp_log_level_t level;
};

static constexpr LevelName kLevels[] = {
    {"VERBOSE", ESP_LOG_VERBOSE}, {"DEBUG", ESP_LOG_DEBUG},
    {"INFO", ESP_LOG_INFO},       {"WARN", ESP_LOG_WARN},
    {"ERROR", ESP_LOG_ERROR},     {"NONE", ESP_LOG_NONE},
};

static auto ParseLevel(std::string raw) -> std::optional<esp_log_level_t> {
  std::transform(raw.begin(), raw.end(), raw.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  for (const auto& l : kLevels) {
    if (raw == l.name) {
      return l.level;
    }
  }
  return {};
}

int CmdLogLevel(int argc, char** argv) {
  static const std::string usage =
      "usage: loglevel [tag] [VERBOSE,DEBUG,INFO,WARN,ERROR,NONE]";
  if (argc < 2 || argc > 3) {
    std::cout << usage << std::endl;
    return 1;
  }

  // With only a level, it applies to every tag.
  const char* tag = argc == 3 ? argv[1] : "*";
  auto level = ParseLevel(argv[argc - 1]);
  if (!level) {
    std::cout << usage << std::endl;
    return 1;
  }

  esp_log_level_set(tag, *level);
  return 0;
}

void RegisterLogLevel() {
  esp_console_cmd_t cmd{
      .command = "loglevel",
      .help = "Sets the log level of one tag, or of every tag",
      .hint = "tag level",
      .func = &CmdLogLevel,
      .argtable = NULL};
  esp_console_cmd_register(&cmd);
}

Console::Console() {}
Console::~Console() {}

auto Console::RegisterCommonComponents() -> void {
  esp_console_register_help_command();
  RegisterLogLevel();
}

auto Console::Launch() -> void {
  esp_console_repl_t* repl = nullptr;
  esp_console_repl_config_t repl_config = ESP_CONSOLE_REPL_CONFIG_DEFAULT();
  repl_config.max_history_len = 16;
  repl_config.prompt = " →";
  repl_config.max_cmdline_length = 256;
  repl_config.task_stack_size = 1024 * GetStackSizeKiB();

  esp_console_dev_uart_config_t hw_config =
      ESP_CONSOLE_DEV_UART_CONFIG_DEFAULT();
  ESP_ERROR_CHECK(esp_console_new_repl_uart(&hw_config, &repl_config, &repl));

  RegisterCommonComponents();
  RegisterExtraComponents();

  ESP_ERROR_CHECK(esp_console_start_repl(repl));
}

}  // namespace console
