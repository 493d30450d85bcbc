// Copyright (c) 2023, Adam Simpkins
#pragma once

#include <cstdint>
#include <cstdlib>
#include <type_traits>
#include <utility>

namespace usbpad {

/**
 * Encode a value from 0 to 99 as two BCD digits.
 *
 * Out of range values fail to compile when evaluated at compile time, and
 * are clamped to 99 at runtime.
 */
constexpr uint8_t bcd_encode(uint8_t x) {
  if (x > 99) {
    if (std::is_constant_evaluated()) {
      abort();
    }
    return 0x99;
  }
  return static_cast<uint8_t>(((x / 10) << 4) | (x % 10));
}

/**
 * Decode two BCD digits.
 *
 * Nibbles above 9 are not valid BCD; they fail to compile at compile time
 * and are decoded as-is at runtime.
 */
constexpr uint8_t bcd_decode(uint8_t x) {
  const uint8_t tens = x >> 4;
  const uint8_t ones = x & 0x0f;
  if (std::is_constant_evaluated() && (tens > 9 || ones > 9)) {
    abort();
  }
  return static_cast<uint8_t>(tens * 10 + ones);
}

/**
 * Build a 16-bit BCD version number, as used in the bcdUSB, bcdDevice, and
 * bcdHID descriptor fields.  e.g., bcd_version(1, 11) returns 0x0111.
 */
constexpr uint16_t bcd_version(uint8_t major, uint8_t minor) {
  return static_cast<uint16_t>((bcd_encode(major) << 8) | bcd_encode(minor));
}

/**
 * Split a 16-bit BCD version number into its (major, minor) parts.
 */
constexpr std::pair<uint8_t, uint8_t> bcd_version_parts(uint16_t bcd) {
  return {bcd_decode(static_cast<uint8_t>(bcd >> 8)),
          bcd_decode(static_cast<uint8_t>(bcd & 0xff))};
}

} // namespace usbpad
