/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "esp_bt_defs.h"
#include "esp_gap_ble_api.h"
#include "esp_gatt_defs.h"
#include "esp_gattc_api.h"
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "result.hpp"

#include "drivers/bluetooth_types.hpp"
#include "drivers/nvs.hpp"
#include "tasks/cancellation.hpp"

namespace drivers {

/*
 * An established low-energy connection to a single peripheral. Owned by
 * whoever opened it; must be explicitly closed before being destroyed.
 *
 * Every operation that goes over the air accepts a cancellation token, and
 * returns early with PlatformError::Kind::kCancelled once it fires.
 */
class ILeLink {
 public:
  virtual ~ILeLink() {}

  /* Whether the link was still up as of the last event from the stack. */
  virtual auto IsConnected() -> bool = 0;

  virtual auto Services(const bluetooth::Uuid&,
                        bluetooth::CacheMode,
                        const tasks::CancellationToken&)
      -> cpp::result<std::vector<bluetooth::ServiceHandle>,
                     bluetooth::PlatformError> = 0;

  virtual auto Characteristics(const bluetooth::ServiceHandle&,
                               const bluetooth::Uuid&,
                               bluetooth::CacheMode,
                               const tasks::CancellationToken&)
      -> cpp::result<std::vector<bluetooth::CharacteristicHandle>,
                     bluetooth::PlatformError> = 0;

  virtual auto Read(const bluetooth::CharacteristicHandle&,
                    const tasks::CancellationToken&)
      -> cpp::result<std::vector<uint8_t>, bluetooth::PlatformError> = 0;

  /*
   * Tears down the connection. Waits a bounded amount of time for the stack
   * to confirm, and gives up (leaving the stack to clean up on its own) if it
   * doesn't. Safe to call more than once.
   */
  virtual auto Close() -> void = 0;
};

/*
 * The parts of the host's Bluetooth stack needed to poll peripherals for
 * their battery level.
 */
class IBleCentral {
 public:
  virtual ~IBleCentral() {}

  /* Lists every peripheral the host is bonded with, named or not. */
  virtual auto PairedPeripherals()
      -> cpp::result<std::vector<bluetooth::Peripheral>,
                     bluetooth::PlatformError> = 0;

  /* Looks up the radio address currently associated with a peripheral id. */
  virtual auto ResolveAddress(const std::string& id,
                              const tasks::CancellationToken&)
      -> cpp::result<bluetooth::LeAddress, bluetooth::PlatformError> = 0;

  virtual auto OpenLink(const bluetooth::LeAddress&,
                        const tasks::CancellationToken&)
      -> cpp::result<std::unique_ptr<ILeLink>, bluetooth::PlatformError> = 0;
};

namespace bluetooth {
namespace internal {

static constexpr size_t kMaxValueLength = 32;

/*
 * Copy of the interesting parts of a GATTC callback. The stack frees its own
 * parameters as soon as the callback returns, so everything we might want
 * later is copied in here and passed around by value.
 */
struct GattcCompletion {
  esp_gattc_cb_event_t type;
  uint16_t conn_id;
  esp_gatt_status_t status;
  mac_addr_t remote;
  uint16_t start_handle;
  uint16_t end_handle;
  std::array<uint8_t, kMaxValueLength> value;
  uint16_t value_length;
};

}  // namespace internal
}  // namespace bluetooth

class LeLink;

/*
 * IBleCentral implemented on top of the Bluedroid GATT client.
 *
 * Bluedroid is entirely callback driven; this class turns each request into a
 * blocking call by waiting for the matching completion event. Only one
 * request may be in flight at a time, which the monitor guarantees by making
 * every call from the same task.
 */
class BleCentral : public IBleCentral {
 public:
  static auto Create(NvsStorage& nvs) -> BleCentral*;

  ~BleCentral();

  auto PairedPeripherals()
      -> cpp::result<std::vector<bluetooth::Peripheral>,
                     bluetooth::PlatformError> override;

  auto ResolveAddress(const std::string& id, const tasks::CancellationToken&)
      -> cpp::result<bluetooth::LeAddress, bluetooth::PlatformError> override;

  auto OpenLink(const bluetooth::LeAddress&, const tasks::CancellationToken&)
      -> cpp::result<std::unique_ptr<ILeLink>,
                     bluetooth::PlatformError> override;

  auto HandleGattcEvent(esp_gattc_cb_event_t,
                        esp_gatt_if_t,
                        esp_ble_gattc_cb_param_t*) -> void;
  auto HandleGapEvent(esp_gap_ble_cb_event_t, esp_ble_gap_cb_param_t*) -> void;

  BleCentral(const BleCentral&) = delete;
  BleCentral& operator=(const BleCentral&) = delete;

 private:
  friend class LeLink;

  explicit BleCentral(NvsStorage& nvs);

  using Completion = bluetooth::internal::GattcCompletion;
  using Matcher = std::function<bool(const Completion&)>;

  auto Register() -> bool;

  /*
   * Blocks until a completion accepted by `matcher` arrives. Search results
   * for `conn_id` that arrive in the meantime are appended to `interim`, if
   * given. A disconnection of `conn_id` ends the wait early.
   */
  auto Await(const Matcher& matcher,
             uint16_t conn_id,
             std::chrono::milliseconds timeout,
             const tasks::CancellationToken* cancel,
             std::vector<Completion>* interim = nullptr)
      -> cpp::result<Completion, bluetooth::PlatformError>;

  /* Drops completions left behind by earlier requests that timed out. */
  auto Drain() -> void;

  auto Forget(uint16_t conn_id) -> void;

  NvsStorage& nvs_;
  std::atomic<esp_gatt_if_t> gattc_if_;
  QueueHandle_t completions_;

  std::mutex links_mutex_;
  std::map<uint16_t, LeLink*> links_;
};

class LeLink : public ILeLink {
 public:
  LeLink(BleCentral& central, uint16_t conn_id, bluetooth::LeAddress addr);
  ~LeLink();

  auto IsConnected() -> bool override;

  auto Services(const bluetooth::Uuid&,
                bluetooth::CacheMode,
                const tasks::CancellationToken&)
      -> cpp::result<std::vector<bluetooth::ServiceHandle>,
                     bluetooth::PlatformError> override;

  auto Characteristics(const bluetooth::ServiceHandle&,
                       const bluetooth::Uuid&,
                       bluetooth::CacheMode,
                       const tasks::CancellationToken&)
      -> cpp::result<std::vector<bluetooth::CharacteristicHandle>,
                     bluetooth::PlatformError> override;

  auto Read(const bluetooth::CharacteristicHandle&,
            const tasks::CancellationToken&)
      -> cpp::result<std::vector<uint8_t>, bluetooth::PlatformError> override;

  auto Close() -> void override;

  auto OnDisconnected() -> void;

 private:
  auto RefreshCache(const tasks::CancellationToken&)
      -> cpp::result<void, bluetooth::PlatformError>;

  BleCentral& central_;
  const uint16_t conn_id_;
  const bluetooth::LeAddress addr_;
  std::atomic<bool> connected_;
  bool closed_;
  // Set by an uncached service discovery; consumed by the uncached
  // characteristic lookup that follows it.
  bool cache_fresh_;
};

}  // namespace drivers
