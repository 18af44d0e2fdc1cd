/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "system_fsm/system_fsm.hpp"

#include <memory>

#include "esp_err.h"
#include "esp_log.h"
#include "freertos/FreeRTOS.h"

#include "app_console/app_console.hpp"
#include "drivers/ble_central.hpp"
#include "drivers/nvs.hpp"
#include "events/event_queue.hpp"
#include "monitor/clock.hpp"
#include "monitor/config.hpp"
#include "monitor/monitor.hpp"
#include "system_fsm/service_locator.hpp"
#include "system_fsm/system_events.hpp"
#include "tasks/tasks.hpp"

namespace system_fsm {
namespace states {

[[maybe_unused]] static const char kTag[] = "BOOT";

auto Booting::entry() -> void {
  ESP_LOGI(kTag, "beginning battmon boot");
  sServices.reset(new ServiceLocator());

  // Everything else is configured from NVS, so without it there's no point
  // going any further.
  std::unique_ptr<drivers::NvsStorage> nvs{drivers::NvsStorage::OpenSync()};
  if (!nvs) {
    events::System().Dispatch(FatalError{});
    return;
  }
  sServices->nvs(std::move(nvs));

  monitor::Config config = monitor::Config::Load(sServices->nvs());
  config.ApplyLogLevel();

  ESP_LOGI(kTag, "starting bg worker");
  sServices->bg_worker(
      tasks::WorkerPool::Start<tasks::Type::kBackgroundWorker>(1));

  ESP_LOGI(kTag, "init bluetooth");
  drivers::BleCentral* ble = drivers::BleCentral::Create(sServices->nvs());
  if (ble) {
    sServices->ble(std::unique_ptr<drivers::IBleCentral>{ble});
    sServices->clock(std::make_unique<monitor::SystemClock>());
    sServices->monitor(std::make_unique<monitor::Monitor>(
        sServices->ble(), sServices->clock(), config));
  } else {
    // Not fatal; we just have nothing to monitor. The console still works.
    ESP_LOGE(kTag, "bluetooth unavailable; monitor disabled");
  }

  BootComplete ev{.services = sServices};
  events::System().Dispatch(ev);
}

auto Booting::react(const BootComplete& ev) -> void {
  ESP_LOGI(kTag, "bootup completely successfully");

  sServices->bg_worker().Dispatch<void>([&] {
    sAppConsole = new console::AppConsole();
    sAppConsole->sServices = sServices;
    sAppConsole->Launch();
  });

  transit<Running>();
}

}  // namespace states
}  // namespace system_fsm
