/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "app_console/app_console.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#include "esp_console.h"
#include "esp_log.h"

#include "drivers/bluetooth_types.hpp"
#include "events/event_queue.hpp"
#include "monitor/config.hpp"
#include "monitor/scheduler.hpp"
#include "system_fsm/system_events.hpp"

namespace console {

std::shared_ptr<system_fsm::ServiceLocator> AppConsole::sServices;

int CmdBtStatus(int argc, char** argv) {
  static const std::string usage = "usage: bt_status";
  if (argc != 1) {
    std::cout << usage << std::endl;
    return 1;
  }

  auto& services = AppConsole::sServices;
  if (!services->has_monitor()) {
    std::cout << "bluetooth unavailable" << std::endl;
    return 0;
  }
  auto& monitor = services->monitor();
  auto& scheduler = monitor.scheduler();

  std::cout << "scheduler: " << monitor::StateName(scheduler.state())
            << ", cycles: " << scheduler.cycles()
            << ", interval: " << scheduler.interval().count() << " min"
            << std::endl;
  std::cout << "debug logging: " << (monitor.config().debug ? "on" : "off")
            << std::endl;

  for (const auto& c : monitor.panel().Containers()) {
    std::cout << c.title << std::endl;
    std::cout << "  " << monitor::kNameLabel << ": " << c.name << std::endl;
    std::cout << "  " << monitor::kStatusLabel << ": " << c.status
              << std::endl;
    std::cout << "  " << monitor::kBatteryLabel << ": "
              << static_cast<int>(c.battery) << monitor::kBatteryUnit
              << std::endl;
  }
  return 0;
}

void RegisterBtStatus() {
  esp_console_cmd_t cmd{
      .command = "bt_status",
      .help = "Prints the battery level and status of each bonded device",
      .hint = NULL,
      .func = &CmdBtStatus,
      .argtable = NULL};
  esp_console_cmd_register(&cmd);
}

int CmdBtRefresh(int argc, char** argv) {
  static const std::string usage = "usage: bt_refresh";
  if (argc != 1) {
    std::cout << usage << std::endl;
    return 1;
  }
  auto task = AppConsole::sServices->poll_task();
  if (!task) {
    std::cout << "monitor is not running" << std::endl;
    return 1;
  }
  (*task)->Refresh();
  return 0;
}

void RegisterBtRefresh() {
  esp_console_cmd_t cmd{.command = "bt_refresh",
                        .help = "Polls every device now",
                        .hint = NULL,
                        .func = &CmdBtRefresh,
                        .argtable = NULL};
  esp_console_cmd_register(&cmd);
}

int CmdBtRescan(int argc, char** argv) {
  static const std::string usage = "usage: bt_rescan";
  if (argc != 1) {
    std::cout << usage << std::endl;
    return 1;
  }
  auto task = AppConsole::sServices->poll_task();
  if (!task) {
    std::cout << "monitor is not running" << std::endl;
    return 1;
  }
  (*task)->Rescan();
  return 0;
}

void RegisterBtRescan() {
  esp_console_cmd_t cmd{
      .command = "bt_rescan",
      .help = "Re-reads the list of bonded devices, then polls them",
      .hint = NULL,
      .func = &CmdBtRescan,
      .argtable = NULL};
  esp_console_cmd_register(&cmd);
}

int CmdBtName(int argc, char** argv) {
  static const std::string usage = "usage: bt_name [address] (name)";
  if (argc < 2 || argc > 3) {
    std::cout << usage << std::endl;
    return 1;
  }
  auto mac = drivers::bluetooth::MacFromString(argv[1]);
  if (!mac) {
    std::cout << "bad address '" << argv[1] << "'" << std::endl;
    std::cout << usage << std::endl;
    return 1;
  }

  auto& nvs = AppConsole::sServices->nvs();
  if (argc == 3) {
    nvs.BluetoothName(*mac, std::string{argv[2]});
  } else {
    nvs.BluetoothName(*mac, {});
  }
  if (!nvs.Write()) {
    std::cout << "failed to save" << std::endl;
    return 1;
  }

  std::cout << "saved; run bt_rescan to pick up the change" << std::endl;
  return 0;
}

void RegisterBtName() {
  esp_console_cmd_t cmd{
      .command = "bt_name",
      .help = "Sets the display name of a bonded device. Omitting the name "
              "stops the device from being monitored.",
      .hint = "address name",
      .func = &CmdBtName,
      .argtable = NULL};
  esp_console_cmd_register(&cmd);
}

int CmdBtConfig(int argc, char** argv) {
  static const std::string usage =
      "usage: bt_config [refresh_min N] [debug on|off]";
  if (argc % 2 != 1) {
    std::cout << usage << std::endl;
    return 1;
  }

  auto& nvs = AppConsole::sServices->nvs();
  if (argc == 1) {
    auto config = monitor::Config::Load(nvs);
    std::cout << "refresh_min: " << config.refresh_interval.count()
              << std::endl;
    std::cout << "debug: " << (config.debug ? "on" : "off") << std::endl;
    return 0;
  }

  for (int i = 1; i < argc; i += 2) {
    std::string key = argv[i];
    std::string val = argv[i + 1];
    if (key == "refresh_min") {
      char* end = nullptr;
      long minutes = std::strtol(val.c_str(), &end, 10);
      if (end == val.c_str() || *end != '\0' || minutes < 1 ||
          minutes > UINT16_MAX) {
        std::cout << "refresh_min must be a positive number of minutes"
                  << std::endl;
        return 1;
      }
      nvs.RefreshIntervalMinutes(static_cast<uint16_t>(minutes));
    } else if (key == "debug") {
      if (val == "on") {
        nvs.Debug(true);
      } else if (val == "off") {
        nvs.Debug(false);
      } else {
        std::cout << usage << std::endl;
        return 1;
      }
    } else {
      std::cout << usage << std::endl;
      return 1;
    }
  }

  if (!nvs.Write()) {
    std::cout << "failed to save" << std::endl;
    return 1;
  }

  events::System().Dispatch(
      system_fsm::ConfigChanged{.config = monitor::Config::Load(nvs)});
  return 0;
}

void RegisterBtConfig() {
  esp_console_cmd_t cmd{
      .command = "bt_config",
      .help = "Prints or changes the monitor's settings",
      .hint = "key value",
      .func = &CmdBtConfig,
      .argtable = NULL};
  esp_console_cmd_register(&cmd);
}

int CmdBtStop(int argc, char** argv) {
  static const std::string usage = "usage: bt_stop";
  if (argc != 1) {
    std::cout << usage << std::endl;
    return 1;
  }
  events::System().Dispatch(system_fsm::StopRequested{});
  return 0;
}

void RegisterBtStop() {
  esp_console_cmd_t cmd{
      .command = "bt_stop",
      .help = "Stops polling and disconnects from every device",
      .hint = NULL,
      .func = &CmdBtStop,
      .argtable = NULL};
  esp_console_cmd_register(&cmd);
}

auto AppConsole::RegisterExtraComponents() -> void {
  RegisterBtStatus();
  RegisterBtRefresh();
  RegisterBtRescan();
  RegisterBtName();
  RegisterBtConfig();
  RegisterBtStop();
}

}  // namespace console
