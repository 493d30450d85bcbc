// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/usb_types.h"

#include <cstdint>
#include <cstdlib>
#include <type_traits>

namespace usbpad {

enum class DescriptorType : uint8_t {
  Device = 1,
  Config = 2,
  String = 3,
  Interface = 4,
  Endpoint = 5,
  DeviceQualifier = 6,
  OtherSpeedConfig = 7,
  InterfacePower = 8,
  Hid = 0x21,
  HidReport = 0x22,
  HidPhysical = 0x23,
};

/**
 * Create the setup wValue field for a given descriptor type and descriptor
 * index.
 */
constexpr uint16_t desc_setup_value(DescriptorType type, uint8_t index = 0) {
  return static_cast<uint16_t>((static_cast<uint16_t>(type) << 8) | index);
}

enum class UsbClass : uint8_t {
  PerInterface = 0x00,
  Audio = 0x01,
  Cdc = 0x02,
  Hid = 0x03,
  Physical = 0x05,
  Image = 0x06,
  Printer = 0x07,
  MassStorage = 0x08,
  Hub = 0x09,
  CdcData = 0x0a,
  Video = 0x0e,
  Miscellaneous = 0xef,
  VendorSpecific = 0xff,
};

enum class EndpointSync : uint8_t {
  NoSync = 0,
  Async = 1 << 2,
  Adaptive = 2 << 2,
  Sync = 3 << 2,
};

enum class EndpointUsage : uint8_t {
  Data = 0,
  Feedback = 1 << 4,
  ImplicitFeedback = 2 << 4,
  // (3 << 4) is reserved
};

/**
 * Attribute bits for the bmAttributes field in the config descriptor.
 *
 * Bit 7 is reserved and must always be set; ConfigDescriptor takes care of
 * that.
 */
enum class ConfigAttr : uint8_t {
  None = 0x00,
  RemoteWakeup = 0x20,
  SelfPowered = 0x40,
};

inline constexpr ConfigAttr operator|(ConfigAttr a1, ConfigAttr a2) {
  return static_cast<ConfigAttr>(static_cast<uint8_t>(a1) |
                                 static_cast<uint8_t>(a2));
}

inline constexpr ConfigAttr operator&(ConfigAttr a1, ConfigAttr a2) {
  return static_cast<ConfigAttr>(static_cast<uint8_t>(a1) &
                                 static_cast<uint8_t>(a2));
}

/**
 * The bMaxPower field of the config descriptor, in units of 2mA.
 */
class UsbMilliamps {
public:
  explicit constexpr UsbMilliamps(uint16_t milliamps)
      : value_(static_cast<uint8_t>(milliamps > kMaxMilliamps
                                        ? 0xff
                                        : (milliamps + 1) / 2)) {
    if (std::is_constant_evaluated() && milliamps > kMaxMilliamps) {
      abort(); // value too large to express
    }
  }

  constexpr uint8_t value_in_2ma() const { return value_; }
  constexpr uint16_t milliamps() const {
    return static_cast<uint16_t>(value_) * 2;
  }

private:
  static constexpr uint16_t kMaxMilliamps = 0xff * 2;

  uint8_t value_{0};
};

/**
 * Language IDs for string descriptors.
 *
 * This only lists a handful of common values; any other LANGID can be used by
 * casting the numeric value.
 */
enum class Language : uint16_t {
  Chinese_Taiwan = 0x0404,
  Chinese_PRC = 0x0804,
  Danish = 0x0406,
  Dutch_Netherlands = 0x0413,
  English_US = 0x0409,
  English_UK = 0x0809,
  Finnish = 0x040b,
  French_Standard = 0x040c,
  German_Standard = 0x0407,
  Italian_Standard = 0x0410,
  Japanese = 0x0411,
  Korean = 0x0412,
  Norwegian_Bokmal = 0x0414,
  Polish = 0x0415,
  Portuguese_Brazil = 0x0416,
  Russian = 0x0419,
  Spanish_Modern_Sort = 0x0c0a,
  Swedish = 0x041d,
  HID_Usage_Data_Descriptor = 0x04ff,
};

/**
 * Create the setup wIndex field for a given descriptor language.
 */
constexpr uint16_t desc_setup_index(Language lang) {
  return static_cast<uint16_t>(lang);
}

} // namespace usbpad
