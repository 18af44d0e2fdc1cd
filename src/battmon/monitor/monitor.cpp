/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "monitor/monitor.hpp"

#include "esp_log.h"

namespace monitor {

[[maybe_unused]] static constexpr char kTag[] = "monitor";

Monitor::Monitor(drivers::IBleCentral& central,
                 IClock& clock,
                 const Config& config)
    : config_mutex_(),
      config_(config),
      shut_down_(false),
      registry_(),
      panel_(),
      sync_(panel_),
      enumerator_(central),
      connections_(central, registry_),
      reader_(),
      updater_(registry_, connections_, reader_),
      retry_(clock),
      scheduler_(registry_,
                 updater_,
                 retry_,
                 sync_,
                 clock,
                 config.refresh_interval) {}

Monitor::~Monitor() {
  if (!shut_down_) {
    Shutdown();
  }
}

auto Monitor::Initialize() -> void {
  Config config = this->config();
  config.ApplyLogLevel();
  ESP_LOGI(kTag, "polling every %lld minutes",
           static_cast<long long>(config.refresh_interval.count()));
  Load();
}

auto Monitor::RunCycle(const tasks::CancellationToken& cancel) -> bool {
  if (shut_down_) {
    return false;
  }
  return scheduler_.Tick(cancel);
}

auto Monitor::Shutdown() -> void {
  shut_down_ = true;
  auto links = registry_.TakeAllLinks();
  ESP_LOGI(kTag, "releasing %u links", static_cast<unsigned>(links.size()));
  for (auto& link : links) {
    link->Close();
  }
  panel_.ResetAll();
}

auto Monitor::Rescan() -> void {
  if (shut_down_) {
    return;
  }
  Load();
  scheduler_.ForceNext();
}

auto Monitor::ForceRefresh() -> void {
  scheduler_.ForceNext();
}

auto Monitor::Reconfigure(const Config& config) -> void {
  {
    std::lock_guard<std::mutex> lock{config_mutex_};
    config_ = config;
  }
  config.ApplyLogLevel();
  scheduler_.interval(config.refresh_interval);
}

auto Monitor::config() const -> Config {
  std::lock_guard<std::mutex> lock{config_mutex_};
  return config_;
}

auto Monitor::Load() -> void {
  Discovery found = enumerator_.Enumerate();
  if (found.error) {
    ESP_LOGW(kTag, "continuing with no devices");
  }
  registry_.Load(found.peripherals);
  panel_.Rebuild(found.peripherals);
}

}  // namespace monitor
