// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/hid/HidReportDescriptor.h"
#include "usbpad/hid/usage/button.h"
#include "usbpad/hid/usage/generic_desktop.h"
#include "usbpad/hid/usage/usage_page.h"

#include <asel/buf_view.h>

#include <array>
#include <cstdint>
#include <optional>
#include <system_error>

namespace usbpad::hid {

/**
 * Button bits in SwitchGamepadReport::buttons.
 */
enum class SwitchButton : uint16_t {
  Y = 0x0001,
  B = 0x0002,
  A = 0x0004,
  X = 0x0008,
  L = 0x0010,
  R = 0x0020,
  ZL = 0x0040,
  ZR = 0x0080,
  Minus = 0x0100,
  Plus = 0x0200,
  LStick = 0x0400,
  RStick = 0x0800,
  Home = 0x1000,
  Capture = 0x2000,
};

constexpr uint16_t operator|(SwitchButton a, SwitchButton b) {
  return static_cast<uint16_t>(static_cast<uint16_t>(a) |
                               static_cast<uint16_t>(b));
}
constexpr uint16_t operator|(uint16_t a, SwitchButton b) {
  return static_cast<uint16_t>(a | static_cast<uint16_t>(b));
}

/**
 * D-pad positions, clockwise from Up.  Center is the hat switch null state.
 */
enum class SwitchHat : uint8_t {
  Up = 0,
  UpRight = 1,
  Right = 2,
  DownRight = 3,
  Down = 4,
  DownLeft = 5,
  Left = 6,
  UpLeft = 7,
  Center = 8,
};

/**
 * The input report sent by a Switch-compatible gamepad.
 *
 * On the wire this is 8 bytes, with the fields in declaration order and
 * buttons stored little-endian.
 */
struct SwitchGamepadReport {
  static constexpr size_t kSize = 8;
  static constexpr uint8_t kStickCenter = 0x80;
  // The hat switch is a 4-bit field.
  static constexpr uint8_t kMaxHat = 0x0f;

  using Packed = std::array<uint8_t, kSize>;

  uint16_t buttons = 0;
  uint8_t hat = static_cast<uint8_t>(SwitchHat::Center);
  uint8_t padding = 0;
  uint8_t lx = kStickCenter;
  uint8_t ly = kStickCenter;
  uint8_t rx = kStickCenter;
  uint8_t ry = kStickCenter;

  bool operator==(const SwitchGamepadReport &) const = default;

  void press(SwitchButton button) {
    buttons = buttons | button;
  }
  void release(SwitchButton button) {
    buttons = static_cast<uint16_t>(buttons & ~static_cast<uint16_t>(button));
  }
  bool is_pressed(SwitchButton button) const {
    return (buttons & static_cast<uint16_t>(button)) != 0;
  }
  void set_hat(SwitchHat h) {
    hat = static_cast<uint8_t>(h);
  }

  /**
   * Encode the report into its wire format.
   *
   * Returns Error::SerializationError if a field does not fit in the width
   * given to it by the report descriptor.
   */
  [[nodiscard]] std::error_code pack(Packed &out) const;

  /**
   * Encode the report into a caller-supplied buffer, which must be at least
   * kSize bytes long.
   */
  [[nodiscard]] std::error_code pack_into(uint8_t *buf, size_t size) const;

  /**
   * Decode a report from its wire format.
   *
   * Returns std::nullopt if fewer than kSize bytes are supplied.  The
   * constant bits of the hat byte are discarded.
   */
  static std::optional<SwitchGamepadReport> unpack(asel::buf_view data);
};

/**
 * The report descriptor for SwitchGamepadReport.
 */
constexpr auto make_switch_gamepad_report_descriptor() {
  return ReportDescriptor()
      .usage_page(UsagePage::GenericDesktop)
      .usage(GenericDesktopUsage::Gamepad)
      .collection(CollectionType::Application)
      // 16 buttons, one bit each
      .logical_min(0)
      .logical_max(1)
      .physical_min(0)
      .physical_max(1)
      .report_size(1)
      .report_count(16)
      .usage_page(UsagePage::Button)
      .usage_min(button_usage(1))
      .usage_max(button_usage(16))
      .input(Input().data().variable())
      // Hat switch: 8 positions in the low nibble, with a null state
      .usage_page(UsagePage::GenericDesktop)
      .logical_max(7)
      .physical_max_i16(315)
      .report_size(4)
      .report_count(1)
      .unit(0x14) // English rotation, degrees
      .usage(GenericDesktopUsage::HatSwitch)
      .input(Input().data().variable().null_position())
      .unit(0)
      // High nibble of the hat byte
      .input(Input().constant())
      // Padding byte
      .report_size(8)
      .input(Input().constant())
      // Left and right sticks
      .logical_max_i16(255)
      .physical_max_i16(255)
      .usage(GenericDesktopUsage::X)
      .usage(GenericDesktopUsage::Y)
      .usage(GenericDesktopUsage::Z)
      .usage(GenericDesktopUsage::Rz)
      .report_count(4)
      .input(Input().data().variable())
      // Vendor-defined output report, 8 bytes
      .usage_page_u16(kVendorUsagePageMin)
      .usage_u16(0x2621)
      .report_count(8)
      .output(Output().data().variable())
      .end_collection();
}

} // namespace usbpad::hid
