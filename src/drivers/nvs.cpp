/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "drivers/nvs.hpp"

#include <cstdint>
#include <memory>

#include "cppbor.h"
#include "cppbor_parse.h"
#include "esp_log.h"
#include "nvs.h"
#include "nvs_flash.h"

#include "drivers/bluetooth_types.hpp"

namespace drivers {

[[maybe_unused]] static constexpr char kTag[] = "nvm";
static constexpr uint8_t kSchemaVersion = 1;

static constexpr char kNamespace[] = "battmon";

static constexpr char kKeyVersion[] = "ver";
static constexpr char kKeyRefreshMinutes[] = "refresh_min";
static constexpr char kKeyDebug[] = "debug";
static constexpr char kKeyBluetoothNames[] = "bt_names";

static auto nvs_get_string(nvs_handle_t nvs, const char* key)
    -> std::optional<std::string> {
  size_t len = 0;
  if (nvs_get_blob(nvs, key, NULL, &len) != ESP_OK) {
    return {};
  }
  auto raw = std::unique_ptr<char[]>{new char[len]};
  if (nvs_get_blob(nvs, key, raw.get(), &len) != ESP_OK) {
    return {};
  }
  return {{raw.get(), len}};
}

template <>
auto Setting<uint16_t>::load(nvs_handle_t nvs) -> std::optional<uint16_t> {
  uint16_t out;
  if (nvs_get_u16(nvs, name_, &out) != ESP_OK) {
    return {};
  }
  return out;
}

template <>
auto Setting<uint16_t>::store(nvs_handle_t nvs, uint16_t v) -> void {
  nvs_set_u16(nvs, name_, v);
}

template <>
auto Setting<uint8_t>::load(nvs_handle_t nvs) -> std::optional<uint8_t> {
  uint8_t out;
  if (nvs_get_u8(nvs, name_, &out) != ESP_OK) {
    return {};
  }
  return out;
}

template <>
auto Setting<uint8_t>::store(nvs_handle_t nvs, uint8_t v) -> void {
  nvs_set_u8(nvs, name_, v);
}

template <>
auto Setting<std::vector<bluetooth::MacAndName>>::load(nvs_handle_t nvs)
    -> std::optional<std::vector<bluetooth::MacAndName>> {
  auto raw = nvs_get_string(nvs, name_);
  if (!raw) {
    return {};
  }
  auto [parsed, unused, err] = cppbor::parseWithViews(
      reinterpret_cast<const uint8_t*>(raw->data()), raw->size());
  if (!parsed || parsed->type() != cppbor::MAP) {
    ESP_LOGW(kTag, "ignoring malformed '%s': %s", name_, err.c_str());
    return {};
  }
  std::vector<bluetooth::MacAndName> res;
  for (const auto& i : *parsed->asMap()) {
    auto mac_item = i.first->asViewBstr();
    auto name_item = i.second->asViewTstr();
    if (!mac_item || !name_item) {
      continue;
    }
    auto mac = mac_item->view();
    auto name = name_item->view();
    if (mac.size() != sizeof(bluetooth::mac_addr_t)) {
      continue;
    }
    bluetooth::MacAndName entry{
        .mac = {},
        .name = {name.begin(), name.end()},
    };
    std::copy(mac.begin(), mac.end(), entry.mac.begin());
    res.push_back(entry);
  }
  return res;
}

template <>
auto Setting<std::vector<bluetooth::MacAndName>>::store(
    nvs_handle_t nvs,
    std::vector<bluetooth::MacAndName> v) -> void {
  cppbor::Map cbor{};
  for (const auto& i : v) {
    cbor.add(cppbor::Bstr{{i.mac.data(), i.mac.size()}}, cppbor::Tstr{i.name});
  }
  auto encoded = cbor.encode();
  nvs_set_blob(nvs, name_, encoded.data(), encoded.size());
}

auto NvsStorage::OpenSync() -> NvsStorage* {
  esp_err_t err = nvs_flash_init();
  if (err == ESP_ERR_NVS_NO_FREE_PAGES ||
      err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
    ESP_LOGW(kTag, "partition needs initialisation");
    nvs_flash_erase();
    err = nvs_flash_init();
  }
  if (err != ESP_OK) {
    ESP_LOGE(kTag, "failed to init nvm: %s", esp_err_to_name(err));
    return nullptr;
  }

  nvs_handle_t handle;
  if ((err = nvs_open(kNamespace, NVS_READWRITE, &handle)) != ESP_OK) {
    ESP_LOGE(kTag, "failed to open nvs namespace: %s", esp_err_to_name(err));
    return nullptr;
  }

  std::unique_ptr<NvsStorage> instance = std::make_unique<NvsStorage>(handle);
  if (instance->SchemaVersionSync() < kSchemaVersion &&
      !instance->DowngradeSchemaSync()) {
    ESP_LOGW(kTag, "failed to init namespace");
    return nullptr;
  }

  instance->Read();

  ESP_LOGI(kTag, "nvm storage initialised okay");
  return instance.release();
}

NvsStorage::NvsStorage(nvs_handle_t handle)
    : handle_(handle),
      refresh_minutes_(kKeyRefreshMinutes),
      debug_(kKeyDebug),
      bt_names_(kKeyBluetoothNames) {}

NvsStorage::~NvsStorage() {
  nvs_close(handle_);
  nvs_flash_deinit();
}

auto NvsStorage::Read() -> void {
  std::lock_guard<std::mutex> lock{mutex_};
  refresh_minutes_.read(handle_);
  debug_.read(handle_);
  bt_names_.read(handle_);
}

auto NvsStorage::Write() -> bool {
  std::lock_guard<std::mutex> lock{mutex_};
  refresh_minutes_.write(handle_);
  debug_.write(handle_);
  bt_names_.write(handle_);
  return nvs_commit(handle_) == ESP_OK;
}

auto NvsStorage::DowngradeSchemaSync() -> bool {
  ESP_LOGW(kTag, "namespace needs downgrading");
  nvs_erase_all(handle_);
  nvs_set_u8(handle_, kKeyVersion, kSchemaVersion);
  return nvs_commit(handle_) == ESP_OK;
}

auto NvsStorage::SchemaVersionSync() -> uint8_t {
  uint8_t ret;
  if (nvs_get_u8(handle_, kKeyVersion, &ret) != ESP_OK) {
    return UINT8_MAX;
  }
  return ret;
}

auto NvsStorage::RefreshIntervalMinutes() -> std::optional<uint16_t> {
  std::lock_guard<std::mutex> lock{mutex_};
  return refresh_minutes_.get();
}

auto NvsStorage::RefreshIntervalMinutes(std::optional<uint16_t> val) -> void {
  std::lock_guard<std::mutex> lock{mutex_};
  refresh_minutes_.set(std::move(val));
}

auto NvsStorage::Debug() -> std::optional<bool> {
  std::lock_guard<std::mutex> lock{mutex_};
  auto raw = debug_.get();
  if (!raw) {
    return {};
  }
  return *raw > 0;
}

auto NvsStorage::Debug(std::optional<bool> en) -> void {
  std::lock_guard<std::mutex> lock{mutex_};
  if (en) {
    debug_.set(static_cast<uint8_t>(*en));
  } else {
    debug_.set({});
  }
}

auto NvsStorage::BluetoothNames() -> std::vector<bluetooth::MacAndName> {
  std::lock_guard<std::mutex> lock{mutex_};
  return bt_names_.get().value_or(std::vector<bluetooth::MacAndName>{});
}

auto NvsStorage::BluetoothName(const bluetooth::mac_addr_t& mac,
                               std::optional<std::string> name) -> void {
  std::lock_guard<std::mutex> lock{mutex_};
  auto val = bt_names_.get();
  if (!val) {
    val.emplace();
  }

  bool mut = false;
  bool found = false;
  for (auto it = val->begin(); it != val->end(); it++) {
    if (it->mac == mac) {
      if (name) {
        it->name = *name;
      } else {
        val->erase(it);
      }
      found = true;
      mut = true;
      break;
    }
  }

  if (!found && name) {
    val->push_back(bluetooth::MacAndName{
        .mac = mac,
        .name = *name,
    });
    mut = true;
  }

  if (mut) {
    bt_names_.set(*val);
  }
}

}  // namespace drivers
