/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "monitor/device_registry.hpp"

#include <memory>
#include <mutex>
#include <utility>

#include "esp_log.h"

namespace monitor {

[[maybe_unused]] static constexpr char kTag[] = "registry";

static auto ToView(const DeviceRecord& r) -> DeviceView {
  return DeviceView{
      .id = r.id,
      .name = r.name,
      .status = r.status,
      .percent = r.percent,
      .has_link = r.link != nullptr,
  };
}

DeviceRegistry::DeviceRegistry() {}

DeviceRegistry::~DeviceRegistry() {
  for (const auto& r : records_) {
    if (r.link) {
      ESP_LOGW(kTag, "'%s' still holds a link at teardown", r.name.c_str());
    }
  }
}

auto DeviceRegistry::Load(
    const std::vector<drivers::bluetooth::Peripheral>& peripherals) -> void {
  std::vector<DeviceRecord> fresh;
  for (const auto& p : peripherals) {
    bool duplicate = false;
    for (const auto& r : fresh) {
      if (r.id == p.id) {
        duplicate = true;
        break;
      }
    }
    if (duplicate) {
      ESP_LOGW(kTag, "ignoring duplicate peripheral %s", p.id.c_str());
      continue;
    }
    fresh.push_back(DeviceRecord{
        .id = p.id,
        .name = p.name,
        .status = Status::kUnknown,
        .percent = 0,
        .link = {},
    });
  }

  std::vector<DeviceRecord> old;
  {
    std::lock_guard<std::mutex> lock{mutex_};
    std::swap(old, records_);
    records_ = std::move(fresh);
  }

  for (auto& r : old) {
    if (r.link) {
      ESP_LOGD(kTag, "releasing link to '%s'", r.name.c_str());
      r.link->Close();
      r.link.reset();
    }
  }
  ESP_LOGI(kTag, "tracking %u devices", static_cast<unsigned>(Size()));
}

auto DeviceRegistry::Ids() const -> std::vector<std::string> {
  std::lock_guard<std::mutex> lock{mutex_};
  std::vector<std::string> out;
  out.reserve(records_.size());
  for (const auto& r : records_) {
    out.push_back(r.id);
  }
  return out;
}

auto DeviceRegistry::Size() const -> size_t {
  std::lock_guard<std::mutex> lock{mutex_};
  return records_.size();
}

auto DeviceRegistry::Get(const std::string& id) const
    -> std::optional<DeviceView> {
  std::lock_guard<std::mutex> lock{mutex_};
  auto r = Find(id);
  if (!r) {
    return {};
  }
  return ToView(*r);
}

auto DeviceRegistry::Snapshot() const -> std::vector<DeviceView> {
  std::lock_guard<std::mutex> lock{mutex_};
  std::vector<DeviceView> out;
  out.reserve(records_.size());
  for (const auto& r : records_) {
    out.push_back(ToView(r));
  }
  return out;
}

auto DeviceRegistry::Update(const std::string& id,
                            const std::function<void(DeviceRecord&)>& fn)
    -> bool {
  std::lock_guard<std::mutex> lock{mutex_};
  auto r = Find(id);
  if (!r) {
    return false;
  }
  fn(*r);
  if (StatusHoldsLink(r->status) != (r->link != nullptr)) {
    ESP_LOGE(kTag, "'%s' is %s but %s a link", r->name.c_str(),
             StatusName(r->status), r->link ? "holds" : "lacks");
  }
  return true;
}

auto DeviceRegistry::Link(const std::string& id) -> drivers::ILeLink* {
  std::lock_guard<std::mutex> lock{mutex_};
  auto r = Find(id);
  if (!r) {
    return nullptr;
  }
  return r->link.get();
}

auto DeviceRegistry::TakeAllLinks()
    -> std::vector<std::unique_ptr<drivers::ILeLink>> {
  std::lock_guard<std::mutex> lock{mutex_};
  std::vector<std::unique_ptr<drivers::ILeLink>> out;
  for (auto& r : records_) {
    if (!r.link) {
      continue;
    }
    out.push_back(std::move(r.link));
    r.status = Status::kDisconnected;
    r.percent = 0;
  }
  return out;
}

auto DeviceRegistry::Find(const std::string& id) -> DeviceRecord* {
  for (auto& r : records_) {
    if (r.id == id) {
      return &r;
    }
  }
  return nullptr;
}

auto DeviceRegistry::Find(const std::string& id) const -> const DeviceRecord* {
  for (const auto& r : records_) {
    if (r.id == id) {
      return &r;
    }
  }
  return nullptr;
}

}  // namespace monitor
