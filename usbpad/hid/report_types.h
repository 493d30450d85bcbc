// Copyright (c) 2023, Adam Simpkins
#pragma once

/*
 * Item types used to build HID report descriptors.
 */

#include <cstdint>

namespace usbpad::hid {

// The upper 6 bits of an item prefix byte: the item tag and type.
// The lower two bits encode the payload size and are filled in by
// ReportDescriptor.
enum class ItemPrefix : uint8_t {
  // Main items
  Input = 0x80,
  Output = 0x90,
  Collection = 0xa0,
  Feature = 0xb0,
  EndCollection = 0xc0,
  // Global items
  UsagePage = 0x04,
  LogicalMinimum = 0x14,
  LogicalMaximum = 0x24,
  PhysicalMinimum = 0x34,
  PhysicalMaximum = 0x44,
  UnitExponent = 0x54,
  Unit = 0x64,
  ReportSize = 0x74,
  ReportID = 0x84,
  ReportCount = 0x94,
  Push = 0xa4,
  Pop = 0xb4,
  // Local items
  Usage = 0x08,
  UsageMinimum = 0x18,
  UsageMaximum = 0x28,
  DesignatorIndex = 0x38,
  DesignatorMinimum = 0x48,
  DesignatorMaximum = 0x58,
  StringIndex = 0x78,
  StringMinimum = 0x88,
  StringMaximum = 0x98,
  Delimiter = 0xa8,
};

enum class CollectionType : uint8_t {
  Physical = 0x00,    // e.g., group of axes
  Application = 0x01, // e.g., mouse, keyboard, gamepad
  Logical = 0x02,     // interrelated data
  Report = 0x03,
  NamedArray = 0x04,
  UsageSwitch = 0x05,
  UsageModifier = 0x06,
  // 0x80 - 0xff are vendor-defined
};

/**
 * Builder for the data byte of an Input, Output, or Feature item.
 *
 * All flags default to 0: Data, Array, Absolute, No Wrap, Linear,
 * Preferred State, No Null Position, Non Volatile.  The ninth
 * (Buffered Bytes) flag needs a 2-byte item; ReportDescriptor::input_u16()
 * and friends can be used for that.
 */
template <typename Self>
class MainItemFlags {
public:
  constexpr MainItemFlags() noexcept = default;
  constexpr explicit MainItemFlags(uint8_t bits) noexcept : bits_(bits) {}

  constexpr uint8_t u8() const {
    return bits_;
  }

  constexpr Self &data() {
    return with_bit(0, false);
  }
  constexpr Self &constant() {
    return with_bit(0, true);
  }
  constexpr Self &array() {
    return with_bit(1, false);
  }
  constexpr Self &variable() {
    return with_bit(1, true);
  }
  constexpr Self &absolute() {
    return with_bit(2, false);
  }
  constexpr Self &relative() {
    return with_bit(2, true);
  }
  constexpr Self &no_wrap() {
    return with_bit(3, false);
  }
  constexpr Self &wrap() {
    return with_bit(3, true);
  }
  constexpr Self &linear() {
    return with_bit(4, false);
  }
  constexpr Self &non_linear() {
    return with_bit(4, true);
  }
  constexpr Self &preferred_state() {
    return with_bit(5, false);
  }
  constexpr Self &no_preferred_state() {
    return with_bit(5, true);
  }
  constexpr Self &no_null_position() {
    return with_bit(6, false);
  }
  constexpr Self &null_position() {
    return with_bit(6, true);
  }

protected:
  constexpr Self &with_bit(uint8_t n, bool set) {
    const auto mask = static_cast<uint8_t>(1u << n);
    bits_ = set ? (bits_ | mask) : (bits_ & ~mask);
    return *static_cast<Self *>(this);
  }

private:
  uint8_t bits_ = 0;
};

class Input : public MainItemFlags<Input> {
public:
  using MainItemFlags::MainItemFlags;
};

// Bit 7 (volatile) is reserved for Input items, but used by Output and
// Feature items.
class Output : public MainItemFlags<Output> {
public:
  using MainItemFlags::MainItemFlags;

  constexpr Output &non_volatile() {
    return with_bit(7, false);
  }
  constexpr Output &is_volatile() {
    return with_bit(7, true);
  }
};

class Feature : public MainItemFlags<Feature> {
public:
  using MainItemFlags::MainItemFlags;

  constexpr Feature &non_volatile() {
    return with_bit(7, false);
  }
  constexpr Feature &is_volatile() {
    return with_bit(7, true);
  }
};

} // namespace usbpad::hid
