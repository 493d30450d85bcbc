// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/hid/usage/usage_page.h"

namespace usbpad::hid {

/**
 * Usages for the Generic Desktop page (0x01)
 *
 * HID Usage Tables v1.3, section 4
 */
enum class GenericDesktopUsage : uint8_t {
  Undefined = 0x00,
  Pointer = 0x01,
  Mouse = 0x02,
  Joystick = 0x04,
  Gamepad = 0x05,
  Keyboard = 0x06,
  Keypad = 0x07,
  MultiAxisController = 0x08,
  X = 0x30,
  Y = 0x31,
  Z = 0x32,
  Rx = 0x33,
  Ry = 0x34,
  Rz = 0x35,
  Slider = 0x36,
  Dial = 0x37,
  Wheel = 0x38,
  HatSwitch = 0x39,
};
template <>
struct is_usage_type<GenericDesktopUsage> : std::true_type {};

} // namespace usbpad::hid
