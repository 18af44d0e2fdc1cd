/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "result.hpp"

#include "drivers/ble_central.hpp"
#include "drivers/bluetooth_types.hpp"
#include "monitor/clock.hpp"
#include "tasks/cancellation.hpp"

namespace monitor {
namespace fakes {

using drivers::bluetooth::CacheMode;
using drivers::bluetooth::CharacteristicHandle;
using drivers::bluetooth::LeAddress;
using drivers::bluetooth::Peripheral;
using drivers::bluetooth::PlatformError;
using drivers::bluetooth::ServiceHandle;
using drivers::bluetooth::Uuid;

/* How a fake peripheral answers GATT requests over a link. */
struct LinkScript {
  std::optional<PlatformError> services_error;
  std::vector<ServiceHandle> services{ServiceHandle{.start = 1, .end = 8}};

  std::optional<PlatformError> characteristics_error;
  std::vector<CharacteristicHandle> characteristics{
      CharacteristicHandle{.handle = 3, .properties = 0x12}};

  std::optional<PlatformError> read_error;
  std::vector<uint8_t> value{73};

  // Runs at the start of every read, e.g. to cancel part way through a cycle.
  std::function<void(void)> on_read;
};

/*
 * Everything observable about one fake link. Shared between the link and the
 * test, so that it can still be inspected once the link has been destroyed.
 */
struct LinkState {
  LinkScript script;
  bool connected = true;

  int services_calls = 0;
  int characteristics_calls = 0;
  int read_calls = 0;
  int close_calls = 0;

  std::optional<Uuid> last_service_uuid;
  std::optional<Uuid> last_characteristic_uuid;
  std::vector<CacheMode> cache_modes;
};

class FakeLink : public drivers::ILeLink {
 public:
  explicit FakeLink(std::shared_ptr<LinkState> state) : state_(state) {}

  auto IsConnected() -> bool override {
    return state_->connected && state_->close_calls == 0;
  }

  auto Services(const Uuid& uuid,
                CacheMode mode,
                const tasks::CancellationToken&)
      -> cpp::result<std::vector<ServiceHandle>, PlatformError> override {
    state_->services_calls++;
    state_->last_service_uuid = uuid;
    state_->cache_modes.push_back(mode);
    if (state_->script.services_error) {
      return cpp::fail(*state_->script.services_error);
    }
    return state_->script.services;
  }

  auto Characteristics(const ServiceHandle&,
                       const Uuid& uuid,
                       CacheMode mode,
                       const tasks::CancellationToken&)
      -> cpp::result<std::vector<CharacteristicHandle>, PlatformError>
      override {
    state_->characteristics_calls++;
    state_->last_characteristic_uuid = uuid;
    state_->cache_modes.push_back(mode);
    if (state_->script.characteristics_error) {
      return cpp::fail(*state_->script.characteristics_error);
    }
    return state_->script.characteristics;
  }

  auto Read(const CharacteristicHandle&, const tasks::CancellationToken&)
      -> cpp::result<std::vector<uint8_t>, PlatformError> override {
    state_->read_calls++;
    if (state_->script.on_read) {
      state_->script.on_read();
    }
    if (state_->script.read_error) {
      return cpp::fail(*state_->script.read_error);
    }
    return state_->script.value;
  }

  auto Close() -> void override { state_->close_calls++; }

 private:
  std::shared_ptr<LinkState> state_;
};

/* A bonded peripheral, as far as the fake central is concerned. */
struct FakeDevice {
  std::string name;

  std::optional<PlatformError> resolve_error;
  std::optional<PlatformError> open_error;
  // Copied into every link opened to this device.
  LinkScript script;

  int resolves = 0;
  int opens = 0;
  std::vector<std::shared_ptr<LinkState>> links;

  auto last_link() -> LinkState& { return *links.back(); }
};

class FakeCentral : public drivers::IBleCentral {
 public:
  std::optional<PlatformError> paired_error;
  int paired_calls = 0;

  /* Adds a bonded peripheral. Devices are listed in the order they're added. */
  auto Add(const std::string& id, const std::string& name) -> FakeDevice& {
    order_.push_back(id);
    auto& dev = devices_[id];
    dev.name = name;
    return dev;
  }

  auto device(const std::string& id) -> FakeDevice& {
    return devices_.at(id);
  }

  /* Total number of calls made into the platform, of any kind. */
  auto calls() const -> int {
    int total = paired_calls;
    for (const auto& [id, dev] : devices_) {
      total += dev.resolves + dev.opens;
      for (const auto& link : dev.links) {
        total += link->services_calls + link->characteristics_calls +
                 link->read_calls + link->close_calls;
      }
    }
    return total;
  }

  auto PairedPeripherals()
      -> cpp::result<std::vector<Peripheral>, PlatformError> override {
    paired_calls++;
    if (paired_error) {
      return cpp::fail(*paired_error);
    }
    std::vector<Peripheral> out;
    for (const auto& id : order_) {
      out.push_back(Peripheral{.id = id, .name = devices_.at(id).name});
    }
    return out;
  }

  auto ResolveAddress(const std::string& id, const tasks::CancellationToken&)
      -> cpp::result<LeAddress, PlatformError> override {
    auto it = devices_.find(id);
    if (it == devices_.end()) {
      return cpp::fail(
          PlatformError{.kind = PlatformError::Kind::kNotFound, .code = 0});
    }
    it->second.resolves++;
    if (it->second.resolve_error) {
      return cpp::fail(*it->second.resolve_error);
    }
    LeAddress addr{.mac = {}, .type = 0};
    addr.mac[5] = static_cast<uint8_t>(IndexOf(id));
    return addr;
  }

  auto OpenLink(const LeAddress& addr, const tasks::CancellationToken&)
      -> cpp::result<std::unique_ptr<drivers::ILeLink>, PlatformError>
      override {
    auto& dev = devices_.at(order_.at(addr.mac[5]));
    dev.opens++;
    if (dev.open_error) {
      return cpp::fail(*dev.open_error);
    }
    auto state = std::make_shared<LinkState>();
    state->script = dev.script;
    dev.links.push_back(state);
    return std::unique_ptr<drivers::ILeLink>{new FakeLink(state)};
  }

 private:
  auto IndexOf(const std::string& id) const -> size_t {
    for (size_t i = 0; i < order_.size(); i++) {
      if (order_[i] == id) {
        return i;
      }
    }
    return 0;
  }

  std::vector<std::string> order_;
  std::map<std::string, FakeDevice> devices_;
};

/* A clock that only moves when told to, and never actually sleeps. */
class FakeClock : public IClock {
 public:
  std::chrono::milliseconds now{0};
  std::vector<std::chrono::milliseconds> sleeps;

  auto Now() -> std::chrono::milliseconds override { return now; }

  auto SleepFor(std::chrono::milliseconds duration,
                const tasks::CancellationToken& cancel) -> bool override {
    sleeps.push_back(duration);
    if (cancel.cancelled()) {
      return true;
    }
    now += duration;
    return false;
  }

  auto Advance(std::chrono::milliseconds by) -> void { now += by; }
};

inline auto Error(PlatformError::Kind kind) -> PlatformError {
  return PlatformError{.kind = kind, .code = -1};
}

}  // namespace fakes
}  // namespace monitor
