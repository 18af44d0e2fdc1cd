/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace drivers {
namespace bluetooth {

typedef std::array<uint8_t, 6> mac_addr_t;

struct MacAndName {
  mac_addr_t mac;
  std::string name;

  bool operator==(const MacAndName&) const = default;
};

/*
 * A peripheral that the host has bonded with. `id` is stable across
 * reconnections and address rotation, and is the key used everywhere else to
 * refer to this peripheral.
 */
struct Peripheral {
  std::string id;
  std::string name;

  bool operator==(const Peripheral&) const = default;
};

/* Radio-level address of a peripheral, as needed to open an LE link. */
struct LeAddress {
  mac_addr_t mac;
  // Public vs. random; mirrors the controller's address type encoding.
  uint8_t type;

  bool operator==(const LeAddress&) const = default;
};

/* 128 bit UUID, stored in big-endian (i.e. display) order. */
struct Uuid {
  std::array<uint8_t, 16> bytes;

  /* Expands a 16 bit SIG-assigned UUID using the Bluetooth base UUID. */
  static auto FromShort(uint16_t) -> Uuid;

  /* The 16 bit alias of this UUID, if it is based on the Bluetooth base. */
  auto AsShort() const -> std::optional<uint16_t>;

  auto ToString() const -> std::string;

  bool operator==(const Uuid&) const = default;
};

enum class CacheMode {
  kCached,
  kUncached,
};

/* Opaque handle to a discovered GATT service. */
struct ServiceHandle {
  uint16_t start;
  uint16_t end;
};

/* Opaque handle to a discovered GATT characteristic. */
struct CharacteristicHandle {
  uint16_t handle;
  uint8_t properties;
};

/*
 * Failure reported by the platform's Bluetooth stack. `code` is the stack's
 * own error or GATT status value; it is only ever logged.
 */
struct PlatformError {
  enum class Kind {
    // The host has no record of the peripheral.
    kNotFound,
    // The peripheral did not respond, or the link dropped mid-operation.
    kUnreachable,
    // Authentication, encryption, or permission requirements not met.
    kAccessDenied,
    // Any other non-success status reported by the remote or the stack.
    kProtocolError,
    kTimedOut,
    kCancelled,
    kUnknown,
  };

  Kind kind;
  int code;
};

auto KindName(PlatformError::Kind) -> const char*;

auto MacToString(const mac_addr_t&) -> std::string;
auto MacFromString(const std::string&) -> std::optional<mac_addr_t>;

}  // namespace bluetooth
}  // namespace drivers
