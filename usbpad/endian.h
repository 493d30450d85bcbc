// Copyright (c) 2023, Adam Simpkins
#pragma once

#include <cstdint>

namespace usbpad {

// All multi-byte fields on the USB bus are little-endian.

constexpr uint16_t load_le16(const uint8_t *p) {
  return static_cast<uint16_t>((static_cast<uint16_t>(p[1]) << 8) | p[0]);
}

constexpr void store_le16(uint8_t *p, uint16_t value) {
  p[0] = static_cast<uint8_t>(value & 0xff);
  p[1] = static_cast<uint8_t>((value >> 8) & 0xff);
}

constexpr void store_le32(uint8_t *p, uint32_t value) {
  p[0] = static_cast<uint8_t>(value & 0xff);
  p[1] = static_cast<uint8_t>((value >> 8) & 0xff);
  p[2] = static_cast<uint8_t>((value >> 16) & 0xff);
  p[3] = static_cast<uint8_t>((value >> 24) & 0xff);
}

} // namespace usbpad
