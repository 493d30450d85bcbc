// Copyright (c) 2023, Adam Simpkins
#pragma once

#include <cstdint>

namespace usbpad::hid {

/**
 * The HID specification version implemented here (bcdHID).
 */
constexpr uint16_t kHidVersionBcd = 0x0111;

/**
 * bInterfaceProtocol values for HID interfaces.
 *
 * The HID 1.11 spec only defines Keyboard and Mouse for the boot subclass;
 * the other values are used in the wild for boot-subclass game controllers.
 */
enum class InterfaceProtocol : uint8_t {
  None = 0x00,
  Keyboard = 0x01,
  Mouse = 0x02,
  Joystick = 0x04,
  Gamepad = 0x05,
  Generic = 0x06,
  Vendor = 0xff,
};

/**
 * Most HID interfaces describe their data with a report descriptor and leave
 * the subclass unset.  The Boot subclass indicates that the interface also
 * supports a fixed, pre-defined report format usable by simple hosts such as
 * BIOS code.
 */
enum class HidSubclass : uint8_t {
  None = 0x00,
  Boot = 0x01,
};

/**
 * Interfaces with a protocol are boot interfaces; interfaces without one do
 * not use a subclass.
 */
constexpr HidSubclass subclass_for_protocol(InterfaceProtocol protocol) {
  return protocol == InterfaceProtocol::None ? HidSubclass::None
                                             : HidSubclass::Boot;
}

/**
 * The protocol selected with SET_PROTOCOL.
 */
enum class HidProtocol : uint8_t {
  Boot = 0x00,
  Report = 0x01,
};

enum class HidRequest : uint8_t {
  GetReport = 0x01,
  GetIdle = 0x02,
  GetProtocol = 0x03,
  SetReport = 0x09,
  SetIdle = 0x0a,
  SetProtocol = 0x0b,
};

enum class HidReportType : uint8_t {
  Input = 1,
  Output = 2,
  Feature = 3,
};

/**
 * bCountryCode values.  Only keyboards normally set this, to identify the
 * layout of their key caps.
 */
enum class HidCountry : uint8_t {
  NotSupported = 0,
  International = 13,
  Japan = 15,
  UK = 32,
  US = 33,
};

} // namespace usbpad::hid
