/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "drivers/ble_central.hpp"

#include <stdint.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "esp_bt.h"
#include "esp_bt_defs.h"
#include "esp_bt_main.h"
#include "esp_err.h"
#include "esp_gap_ble_api.h"
#include "esp_gatt_defs.h"
#include "esp_gattc_api.h"
#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/projdefs.h"
#include "freertos/queue.h"

#include "drivers/bluetooth_types.hpp"
#include "drivers/nvs.hpp"
#include "tasks/cancellation.hpp"

namespace drivers {

[[maybe_unused]] static constexpr char kTag[] = "ble";

static constexpr uint16_t kAppId = 0x0b47;
static constexpr size_t kMaxPendingCompletions = 16;
static constexpr size_t kMaxCharacteristics = 8;

static constexpr std::chrono::milliseconds kRegisterTimeout{2000};
static constexpr std::chrono::milliseconds kOpenTimeout{10000};
static constexpr std::chrono::milliseconds kGattTimeout{5000};
static constexpr std::chrono::milliseconds kCloseTimeout{2000};
// How often a blocked request wakes to check whether it has been cancelled.
static constexpr std::chrono::milliseconds kPollSlice{50};

static constexpr uint16_t kAnyConnection = 0xFFFF;

using bluetooth::PlatformError;

static BleCentral* sInstance = nullptr;

static auto gattc_cb(esp_gattc_cb_event_t event,
                     esp_gatt_if_t gattc_if,
                     esp_ble_gattc_cb_param_t* param) -> void {
  if (sInstance) {
    sInstance->HandleGattcEvent(event, gattc_if, param);
  }
}

static auto gap_cb(esp_gap_ble_cb_event_t event, esp_ble_gap_cb_param_t* param)
    -> void {
  if (sInstance) {
    sInstance->HandleGapEvent(event, param);
  }
}

static auto MakeError(PlatformError::Kind kind, int code) -> PlatformError {
  return PlatformError{.kind = kind, .code = code};
}

static auto ErrorForStatus(esp_gatt_status_t status) -> PlatformError {
  switch (status) {
    case ESP_GATT_INSUF_AUTHENTICATION:
    case ESP_GATT_INSUF_AUTHORIZATION:
    case ESP_GATT_INSUF_ENCRYPTION:
    case ESP_GATT_INSUF_KEY_SIZE:
    case ESP_GATT_READ_NOT_PERMIT:
      return MakeError(PlatformError::Kind::kAccessDenied, status);
    case ESP_GATT_NOT_FOUND:
      return MakeError(PlatformError::Kind::kNotFound, status);
    // Bluedroid's catch-all status; in practice, the link went away under us.
    case ESP_GATT_ERROR:
      return MakeError(PlatformError::Kind::kUnreachable, status);
    default:
      return MakeError(PlatformError::Kind::kProtocolError, status);
  }
}

static auto ToEspUuid(const bluetooth::Uuid& uuid) -> esp_bt_uuid_t {
  esp_bt_uuid_t out;
  std::memset(&out, 0, sizeof(out));
  auto alias = uuid.AsShort();
  if (alias) {
    out.len = ESP_UUID_LEN_16;
    out.uuid.uuid16 = *alias;
  } else {
    // Bluedroid stores 128 bit UUIDs little-endian.
    out.len = ESP_UUID_LEN_128;
    std::reverse_copy(uuid.bytes.begin(), uuid.bytes.end(),
                      out.uuid.uuid128);
  }
  return out;
}

auto BleCentral::Create(NvsStorage& nvs) -> BleCentral* {
  // We only use BLE, so the classic controller's memory can be given back.
  esp_bt_controller_mem_release(ESP_BT_MODE_CLASSIC_BT);

  esp_bt_controller_config_t config = BT_CONTROLLER_INIT_CONFIG_DEFAULT();
  esp_err_t err;
  if ((err = esp_bt_controller_init(&config)) != ESP_OK) {
    ESP_LOGE(kTag, "initialize controller failed %s", esp_err_to_name(err));
    return nullptr;
  }
  if ((err = esp_bt_controller_enable(ESP_BT_MODE_BLE)) != ESP_OK) {
    ESP_LOGE(kTag, "enable controller failed %s", esp_err_to_name(err));
    return nullptr;
  }
  if ((err = esp_bluedroid_init()) != ESP_OK) {
    ESP_LOGE(kTag, "initialize bluedroid failed %s", esp_err_to_name(err));
    return nullptr;
  }
  if ((err = esp_bluedroid_enable()) != ESP_OK) {
    ESP_LOGE(kTag, "enable bluedroid failed %s", esp_err_to_name(err));
    return nullptr;
  }

  std::unique_ptr<BleCentral> instance{new BleCentral(nvs)};
  sInstance = instance.get();
  if (!instance->Register()) {
    sInstance = nullptr;
    return nullptr;
  }
  return instance.release();
}

BleCentral::BleCentral(NvsStorage& nvs)
    : nvs_(nvs),
      gattc_if_(ESP_GATT_IF_NONE),
      completions_(
          xQueueCreate(kMaxPendingCompletions, sizeof(Completion))) {}

BleCentral::~BleCentral() {
  sInstance = nullptr;
  esp_ble_gattc_app_unregister(gattc_if_);
  esp_bluedroid_disable();
  esp_bluedroid_deinit();
  esp_bt_controller_disable();
  esp_bt_controller_deinit();
  vQueueDelete(completions_);
}

auto BleCentral::Register() -> bool {
  // Bond with peripherals, so that reconnections can re-use keys instead of
  // pairing again.
  esp_ble_auth_req_t auth = ESP_LE_AUTH_BOND;
  esp_ble_gap_set_security_param(ESP_BLE_SM_AUTHEN_REQ_MODE, &auth,
                                 sizeof(auth));
  esp_ble_io_cap_t iocap = ESP_IO_CAP_NONE;
  esp_ble_gap_set_security_param(ESP_BLE_SM_IOCAP_MODE, &iocap, sizeof(iocap));

  esp_err_t err = esp_ble_gap_register_callback(gap_cb);
  if (err != ESP_OK) {
    ESP_LOGE(kTag, "Error initialising GAP: %s %d", esp_err_to_name(err), err);
    return false;
  }
  err = esp_ble_gattc_register_callback(gattc_cb);
  if (err != ESP_OK) {
    ESP_LOGE(kTag, "Error initialising GATTC: %s %d", esp_err_to_name(err),
             err);
    return false;
  }
  err = esp_ble_gattc_app_register(kAppId);
  if (err != ESP_OK) {
    ESP_LOGE(kTag, "Error registering GATTC app: %s %d", esp_err_to_name(err),
             err);
    return false;
  }

  auto res = Await(
      [](const Completion& c) { return c.type == ESP_GATTC_REG_EVT; },
      kAnyConnection, kRegisterTimeout, nullptr);
  if (res.has_error()) {
    ESP_LOGE(kTag, "GATTC app registration %s",
             bluetooth::KindName(res.error().kind));
    return false;
  }
  if (res.value().status != ESP_GATT_OK) {
    ESP_LOGE(kTag, "GATTC app registration failed: %d", res.value().status);
    return false;
  }
  ESP_LOGI(kTag, "gattc registered as if %u", gattc_if_.load());
  return true;
}

auto BleCentral::PairedPeripherals()
    -> cpp::result<std::vector<bluetooth::Peripheral>, PlatformError> {
  int num = esp_ble_get_bond_device_num();
  if (num < 0) {
    ESP_LOGE(kTag, "failed to count bonded devices");
    return cpp::fail(MakeError(PlatformError::Kind::kUnknown, num));
  }

  std::vector<esp_ble_bond_dev_t> bonded(num);
  if (num > 0) {
    esp_err_t err = esp_ble_get_bond_device_list(&num, bonded.data());
    if (err != ESP_OK) {
      ESP_LOGE(kTag, "failed to list bonded devices: %s",
               esp_err_to_name(err));
      return cpp::fail(MakeError(PlatformError::Kind::kUnknown, err));
    }
    bonded.resize(num);
  }

  auto names = nvs_.BluetoothNames();
  std::vector<bluetooth::Peripheral> out;
  for (const auto& dev : bonded) {
    bluetooth::mac_addr_t mac;
    std::copy(std::begin(dev.bd_addr), std::end(dev.bd_addr), mac.begin());

    std::string name;
    for (const auto& n : names) {
      if (n.mac == mac) {
        name = n.name;
        break;
      }
    }
    out.push_back(bluetooth::Peripheral{
        .id = bluetooth::MacToString(mac),
        .name = name,
    });
  }
  return out;
}

auto BleCentral::ResolveAddress(const std::string& id,
                                const tasks::CancellationToken& cancel)
    -> cpp::result<bluetooth::LeAddress, PlatformError> {
  if (cancel.cancelled()) {
    return cpp::fail(MakeError(PlatformError::Kind::kCancelled, 0));
  }
  auto mac = bluetooth::MacFromString(id);
  if (!mac) {
    ESP_LOGW(kTag, "malformed peripheral id '%s'", id.c_str());
    return cpp::fail(MakeError(PlatformError::Kind::kProtocolError,
                          ESP_ERR_INVALID_ARG));
  }

  int num = esp_ble_get_bond_device_num();
  if (num < 0) {
    return cpp::fail(MakeError(PlatformError::Kind::kUnknown, num));
  }
  std::vector<esp_ble_bond_dev_t> bonded(num);
  if (num > 0) {
    esp_err_t err = esp_ble_get_bond_device_list(&num, bonded.data());
    if (err != ESP_OK) {
      return cpp::fail(MakeError(PlatformError::Kind::kUnknown, err));
    }
    bonded.resize(num);
  }

  for (const auto& dev : bonded) {
    if (!std::equal(mac->begin(), mac->end(), std::begin(dev.bd_addr))) {
      continue;
    }
    bluetooth::LeAddress addr{
        .mac = *mac,
        .type = BLE_ADDR_TYPE_PUBLIC,
    };
    // With identity information, the bond's address is the identity address
    // and the stack resolves whatever private address the peripheral is
    // currently using.
    if (dev.bond_key.key_mask & ESP_LE_KEY_PID) {
      addr.type = dev.bond_key.pid_key.addr_type;
    }
    return addr;
  }
  return cpp::fail(MakeError(PlatformError::Kind::kNotFound, ESP_ERR_NOT_FOUND));
}

auto BleCentral::OpenLink(const bluetooth::LeAddress& addr,
                          const tasks::CancellationToken& cancel)
    -> cpp::result<std::unique_ptr<ILeLink>, PlatformError> {
  if (cancel.cancelled()) {
    return cpp::fail(MakeError(PlatformError::Kind::kCancelled, 0));
  }
  Drain();

  esp_bd_addr_t bda;
  std::copy(addr.mac.begin(), addr.mac.end(), bda);
  esp_err_t err =
      esp_ble_gattc_open(gattc_if_, bda,
                         static_cast<esp_ble_addr_type_t>(addr.type), true);
  if (err != ESP_OK) {
    ESP_LOGW(kTag, "open request rejected: %s", esp_err_to_name(err));
    return cpp::fail(MakeError(PlatformError::Kind::kUnreachable, err));
  }

  auto res = Await(
      [&](const Completion& c) {
        return c.type == ESP_GATTC_OPEN_EVT && c.remote == addr.mac;
      },
      kAnyConnection, kOpenTimeout, &cancel);
  if (res.has_error()) {
    // Stop the stack from completing the connection behind our back.
    esp_ble_gap_disconnect(bda);
    return cpp::fail(res.error());
  }
  if (res.value().status != ESP_GATT_OK) {
    ESP_LOGI(kTag, "open failed with status %d", res.value().status);
    return cpp::fail(ErrorForStatus(res.value().status));
  }

  uint16_t conn_id = res.value().conn_id;
  auto link = std::make_unique<LeLink>(*this, conn_id, addr);
  {
    std::lock_guard<std::mutex> lock{links_mutex_};
    links_[conn_id] = link.get();
  }
  ESP_LOGD(kTag, "opened link %u to %s", conn_id,
           bluetooth::MacToString(addr.mac).c_str());
  return std::unique_ptr<ILeLink>{std::move(link)};
}

auto BleCentral::HandleGattcEvent(esp_gattc_cb_event_t event,
                                  esp_gatt_if_t gattc_if,
                                  esp_ble_gattc_cb_param_t* param) -> void {
  Completion c{};
  c.type = event;
  c.conn_id = kAnyConnection;
  c.status = ESP_GATT_OK;

  switch (event) {
    case ESP_GATTC_REG_EVT:
      if (param->reg.app_id != kAppId) {
        return;
      }
      gattc_if_ = gattc_if;
      c.status = param->reg.status;
      break;
    case ESP_GATTC_OPEN_EVT:
      c.conn_id = param->open.conn_id;
      c.status = param->open.status;
      std::copy(std::begin(param->open.remote_bda),
                std::end(param->open.remote_bda), c.remote.begin());
      break;
    case ESP_GATTC_DIS_SRVC_CMPL_EVT:
      c.conn_id = param->dis_srvc_cmpl.conn_id;
      c.status = param->dis_srvc_cmpl.status;
      break;
    case ESP_GATTC_SEARCH_RES_EVT:
      c.conn_id = param->search_res.conn_id;
      c.start_handle = param->search_res.start_handle;
      c.end_handle = param->search_res.end_handle;
      break;
    case ESP_GATTC_SEARCH_CMPL_EVT:
      c.conn_id = param->search_cmpl.conn_id;
      c.status = param->search_cmpl.status;
      break;
    case ESP_GATTC_READ_CHAR_EVT:
      c.conn_id = param->read.conn_id;
      c.status = param->read.status;
      c.value_length = std::min<uint16_t>(param->read.value_len,
                                          bluetooth::internal::kMaxValueLength);
      if (param->read.value && c.value_length > 0) {
        std::copy_n(param->read.value, c.value_length, c.value.begin());
      }
      break;
    case ESP_GATTC_CLOSE_EVT:
      c.conn_id = param->close.conn_id;
      c.status = param->close.status;
      break;
    case ESP_GATTC_DISCONNECT_EVT: {
      c.conn_id = param->disconnect.conn_id;
      std::copy(std::begin(param->disconnect.remote_bda),
                std::end(param->disconnect.remote_bda), c.remote.begin());
      ESP_LOGD(kTag, "link %u disconnected, reason 0x%x", c.conn_id,
               param->disconnect.reason);
      std::lock_guard<std::mutex> lock{links_mutex_};
      auto it = links_.find(c.conn_id);
      if (it != links_.end()) {
        it->second->OnDisconnected();
      }
      break;
    }
    default:
      ESP_LOGD(kTag, "unhandled GATTC event: %u", event);
      return;
  }

  if (xQueueSend(completions_, &c, 0) != pdTRUE) {
    ESP_LOGW(kTag, "dropping GATTC event %u; nobody is listening", event);
  }
}

auto BleCentral::HandleGapEvent(esp_gap_ble_cb_event_t event,
                                esp_ble_gap_cb_param_t* param) -> void {
  switch (event) {
    case ESP_GAP_BLE_SEC_REQ_EVT:
      // Peripherals ask for encryption before exposing their battery level;
      // we only ever talk to devices we're already bonded with, so accept.
      esp_ble_gap_security_rsp(param->ble_security.ble_req.bd_addr, true);
      break;
    case ESP_GAP_BLE_AUTH_CMPL_EVT:
      if (!param->ble_security.auth_cmpl.success) {
        ESP_LOGW(kTag, "authentication failed, reason 0x%x",
                 param->ble_security.auth_cmpl.fail_reason);
      }
      break;
    default:
      break;
  }
}

auto BleCentral::Await(const Matcher& matcher,
                       uint16_t conn_id,
                       std::chrono::milliseconds timeout,
                       const tasks::CancellationToken* cancel,
                       std::vector<Completion>* interim)
    -> cpp::result<Completion, PlatformError> {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  Completion c;
  while (std::chrono::steady_clock::now() < deadline) {
    if (cancel && cancel->cancelled()) {
      return cpp::fail(MakeError(PlatformError::Kind::kCancelled, 0));
    }
    if (xQueueReceive(completions_, &c, pdMS_TO_TICKS(kPollSlice.count())) !=
        pdTRUE) {
      continue;
    }
    if (matcher(c)) {
      return c;
    }
    if (conn_id == kAnyConnection || c.conn_id != conn_id) {
      // Left over from an earlier request.
      continue;
    }
    if (c.type == ESP_GATTC_DISCONNECT_EVT) {
      return cpp::fail(MakeError(PlatformError::Kind::kUnreachable, ESP_GATT_ERROR));
    }
    if (interim && c.type == ESP_GATTC_SEARCH_RES_EVT) {
      interim->push_back(c);
    }
  }
  return cpp::fail(MakeError(PlatformError::Kind::kTimedOut, ESP_ERR_TIMEOUT));
}

auto BleCentral::Drain() -> void {
  xQueueReset(completions_);
}

auto BleCentral::Forget(uint16_t conn_id) -> void {
  std::lock_guard<std::mutex> lock{links_mutex_};
  links_.erase(conn_id);
}

LeLink::LeLink(BleCentral& central,
               uint16_t conn_id,
               bluetooth::LeAddress addr)
    : central_(central),
      conn_id_(conn_id),
      addr_(addr),
      connected_(true),
      closed_(false),
      cache_fresh_(false) {}

LeLink::~LeLink() {
  if (!closed_) {
    ESP_LOGW(kTag, "link %u destroyed without being closed", conn_id_);
  }
  central_.Forget(conn_id_);
}

auto LeLink::IsConnected() -> bool {
  return !closed_ && connected_;
}

auto LeLink::OnDisconnected() -> void {
  connected_ = false;
}

auto LeLink::RefreshCache(const tasks::CancellationToken& cancel)
    -> cpp::result<void, PlatformError> {
  esp_bd_addr_t bda;
  std::copy(addr_.mac.begin(), addr_.mac.end(), bda);
  esp_err_t err = esp_ble_gattc_cache_refresh(bda);
  if (err != ESP_OK) {
    return cpp::fail(MakeError(PlatformError::Kind::kProtocolError, err));
  }
  uint16_t conn_id = conn_id_;
  auto res = central_.Await(
      [=](const bluetooth::internal::GattcCompletion& c) {
        return c.type == ESP_GATTC_DIS_SRVC_CMPL_EVT && c.conn_id == conn_id;
      },
      conn_id_, kGattTimeout, &cancel);
  if (res.has_error()) {
    return cpp::fail(res.error());
  }
  if (res.value().status != ESP_GATT_OK) {
    return cpp::fail(ErrorForStatus(res.value().status));
  }
  return {};
}

auto LeLink::Services(const bluetooth::Uuid& uuid,
                      bluetooth::CacheMode mode,
                      const tasks::CancellationToken& cancel)
    -> cpp::result<std::vector<bluetooth::ServiceHandle>, PlatformError> {
  if (cancel.cancelled()) {
    return cpp::fail(MakeError(PlatformError::Kind::kCancelled, 0));
  }
  if (!IsConnected()) {
    return cpp::fail(MakeError(PlatformError::Kind::kUnreachable, ESP_GATT_ERROR));
  }
  central_.Drain();

  if (mode == bluetooth::CacheMode::kUncached) {
    auto refreshed = RefreshCache(cancel);
    if (refreshed.has_error()) {
      return cpp::fail(refreshed.error());
    }
    cache_fresh_ = true;
  }

  esp_bt_uuid_t filter = ToEspUuid(uuid);
  esp_err_t err =
      esp_ble_gattc_search_service(central_.gattc_if_, conn_id_, &filter);
  if (err != ESP_OK) {
    return cpp::fail(MakeError(PlatformError::Kind::kProtocolError, err));
  }

  uint16_t conn_id = conn_id_;
  std::vector<bluetooth::internal::GattcCompletion> found;
  auto res = central_.Await(
      [=](const bluetooth::internal::GattcCompletion& c) {
        return c.type == ESP_GATTC_SEARCH_CMPL_EVT && c.conn_id == conn_id;
      },
      conn_id_, kGattTimeout, &cancel, &found);
  if (res.has_error()) {
    return cpp::fail(res.error());
  }
  if (res.value().status != ESP_GATT_OK) {
    return cpp::fail(ErrorForStatus(res.value().status));
  }

  std::vector<bluetooth::ServiceHandle> out;
  for (const auto& c : found) {
    out.push_back(bluetooth::ServiceHandle{
        .start = c.start_handle,
        .end = c.end_handle,
    });
  }
  return out;
}

auto LeLink::Characteristics(const bluetooth::ServiceHandle& service,
                             const bluetooth::Uuid& uuid,
                             bluetooth::CacheMode mode,
                             const tasks::CancellationToken& cancel)
    -> cpp::result<std::vector<bluetooth::CharacteristicHandle>,
                   PlatformError> {
  if (cancel.cancelled()) {
    return cpp::fail(MakeError(PlatformError::Kind::kCancelled, 0));
  }
  if (!IsConnected()) {
    return cpp::fail(MakeError(PlatformError::Kind::kUnreachable, ESP_GATT_ERROR));
  }

  // Bluedroid discovers characteristics along with their service, so a
  // lookup is only stale if no refresh happened since the last one.
  if (mode == bluetooth::CacheMode::kUncached && !cache_fresh_) {
    central_.Drain();
    auto refreshed = RefreshCache(cancel);
    if (refreshed.has_error()) {
      return cpp::fail(refreshed.error());
    }
  }
  cache_fresh_ = false;

  esp_bt_uuid_t filter = ToEspUuid(uuid);
  esp_gattc_char_elem_t results[kMaxCharacteristics];
  uint16_t count = kMaxCharacteristics;
  esp_gatt_status_t status = esp_ble_gattc_get_char_by_uuid(
      central_.gattc_if_, conn_id_, service.start, service.end, filter, results,
      &count);
  if (status == ESP_GATT_NOT_FOUND || status == ESP_GATT_INVALID_HANDLE) {
    return std::vector<bluetooth::CharacteristicHandle>{};
  }
  if (status != ESP_GATT_OK) {
    return cpp::fail(ErrorForStatus(status));
  }

  std::vector<bluetooth::CharacteristicHandle> out;
  for (uint16_t i = 0; i < count; i++) {
    out.push_back(bluetooth::CharacteristicHandle{
        .handle = results[i].char_handle,
        .properties = results[i].properties,
    });
  }
  return out;
}

auto LeLink::Read(const bluetooth::CharacteristicHandle& characteristic,
                  const tasks::CancellationToken& cancel)
    -> cpp::result<std::vector<uint8_t>, PlatformError> {
  if (cancel.cancelled()) {
    return cpp::fail(MakeError(PlatformError::Kind::kCancelled, 0));
  }
  if (!IsConnected()) {
    return cpp::fail(MakeError(PlatformError::Kind::kUnreachable, ESP_GATT_ERROR));
  }
  central_.Drain();

  esp_err_t err =
      esp_ble_gattc_read_char(central_.gattc_if_, conn_id_,
                              characteristic.handle, ESP_GATT_AUTH_REQ_NONE);
  if (err != ESP_OK) {
    return cpp::fail(MakeError(PlatformError::Kind::kProtocolError, err));
  }

  uint16_t conn_id = conn_id_;
  auto res = central_.Await(
      [=](const bluetooth::internal::GattcCompletion& c) {
        return c.type == ESP_GATTC_READ_CHAR_EVT && c.conn_id == conn_id;
      },
      conn_id_, kGattTimeout, &cancel);
  if (res.has_error()) {
    return cpp::fail(res.error());
  }
  if (res.value().status != ESP_GATT_OK) {
    return cpp::fail(ErrorForStatus(res.value().status));
  }
  const auto& c = res.value();
  return std::vector<uint8_t>(c.value.begin(),
                              c.value.begin() + c.value_length);
}

auto LeLink::Close() -> void {
  if (closed_) {
    return;
  }
  closed_ = true;

  if (!connected_) {
    central_.Forget(conn_id_);
    return;
  }

  central_.Drain();
  esp_err_t err = esp_ble_gattc_close(central_.gattc_if_, conn_id_);
  if (err != ESP_OK) {
    ESP_LOGW(kTag, "close of link %u rejected: %s", conn_id_,
             esp_err_to_name(err));
    central_.Forget(conn_id_);
    return;
  }

  uint16_t conn_id = conn_id_;
  auto res = central_.Await(
      [=](const bluetooth::internal::GattcCompletion& c) {
        return (c.type == ESP_GATTC_CLOSE_EVT ||
                c.type == ESP_GATTC_DISCONNECT_EVT) &&
               c.conn_id == conn_id;
      },
      kAnyConnection, kCloseTimeout, nullptr);
  if (res.has_error()) {
    ESP_LOGW(kTag, "link %u did not confirm close (%s); abandoning it",
             conn_id_, bluetooth::KindName(res.error().kind));
  }
  connected_ = false;
  central_.Forget(conn_id_);
}

}  // namespace drivers
