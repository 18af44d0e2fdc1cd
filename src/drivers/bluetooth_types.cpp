/*
 * Copyright 2023 jacqueline <me@jacqueline.id.au>
 *
 * SPDX-License-Identifier: GPL-3.0-only
 */

#include "drivers/bluetooth_types.hpp"

#include <cctype>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace drivers {
namespace bluetooth {

// 0000xxxx-0000-1000-8000-00805F9B34FB
static constexpr std::array<uint8_t, 16> kBaseUuid{
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x10, 0x00,
    0x80, 0x00, 0x00, 0x80, 0x5F, 0x9B, 0x34, 0xFB,
};

auto Uuid::FromShort(uint16_t alias) -> Uuid {
  Uuid out{.bytes = kBaseUuid};
  out.bytes[2] = static_cast<uint8_t>(alias >> 8);
  out.bytes[3] = static_cast<uint8_t>(alias & 0xFF);
  return out;
}

auto Uuid::AsShort() const -> std::optional<uint16_t> {
  for (size_t i = 0; i < bytes.size(); i++) {
    if (i == 2 || i == 3) {
      continue;
    }
    if (bytes[i] != kBaseUuid[i]) {
      return {};
    }
  }
  return static_cast<uint16_t>((bytes[2] << 8) | bytes[3]);
}

auto Uuid::ToString() const -> std::string {
  std::ostringstream str;
  str << std::uppercase << std::hex << std::setfill('0');
  for (size_t i = 0; i < bytes.size(); i++) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      str << '-';
    }
    str << std::setw(2) << static_cast<int>(bytes[i]);
  }
  return str.str();
}

auto KindName(PlatformError::Kind kind) -> const char* {
  switch (kind) {
    case PlatformError::Kind::kNotFound:
      return "not found";
    case PlatformError::Kind::kUnreachable:
      return "unreachable";
    case PlatformError::Kind::kAccessDenied:
      return "access denied";
    case PlatformError::Kind::kProtocolError:
      return "protocol error";
    case PlatformError::Kind::kTimedOut:
      return "timed out";
    case PlatformError::Kind::kCancelled:
      return "cancelled";
    case PlatformError::Kind::kUnknown:
    default:
      return "unknown";
  }
}

auto MacToString(const mac_addr_t& mac) -> std::string {
  std::ostringstream str;
  str << std::hex << std::setfill('0');
  for (size_t i = 0; i < mac.size(); i++) {
    if (i > 0) {
      str << ':';
    }
    str << std::setw(2) << static_cast<int>(mac[i]);
  }
  return str.str();
}

auto MacFromString(const std::string& str) -> std::optional<mac_addr_t> {
  // Exactly "xx:xx:xx:xx:xx:xx"; either case.
  if (str.size() != 17) {
    return {};
  }
  mac_addr_t out{};
  for (size_t i = 0; i < out.size(); i++) {
    size_t pos = i * 3;
    if (i > 0 && str[pos - 1] != ':') {
      return {};
    }
    if (!std::isxdigit(static_cast<unsigned char>(str[pos])) ||
        !std::isxdigit(static_cast<unsigned char>(str[pos + 1]))) {
      return {};
    }
    out[i] = static_cast<uint8_t>(std::stoi(str.substr(pos, 2), nullptr, 16));
  }
  return out;
}

}  // namespace bluetooth
}  // namespace drivers
