// Copyright (c) 2023, Adam Simpkins
#pragma once

#include <cstdint>
#include <type_traits>

namespace usbpad::hid {

/*
 * Usage Pages from the HID Usage Tables v1.3 spec
 * https://usb.org/sites/default/files/hut1_3_0.pdf
 *
 * Only pages that fit in a single byte are listed, so that
 * ReportDescriptor::usage_page() can always use a 1-byte item.  Use
 * usage_page_u16() for vendor-defined pages.
 */
enum class UsagePage : uint8_t {
  Undefined = 0x00,
  GenericDesktop = 0x01,
  SimulationControls = 0x02,
  VRControls = 0x03,
  SportControls = 0x04,
  GameControls = 0x05,
  GenericDeviceControls = 0x06,
  KeyCodes = 0x07,
  LEDs = 0x08,
  Button = 0x09,
  Ordinal = 0x0a,
  Consumer = 0x0c,
  Haptics = 0x0e,
  PhysicalInputDevice = 0x0f,
  Arcade = 0x91,
  GamingDevice = 0x92,
};

// Vendor-defined usage pages are 0xff00 through 0xffff
constexpr uint16_t kVendorUsagePageMin = 0xff00;

/**
 * Traits class marking an enum as a set of usage values for some usage page.
 *
 * ReportDescriptor::usage() and friends only accept enum types marked this
 * way.
 */
template <typename T>
struct is_usage_type : std::false_type {};

template <typename T>
inline constexpr bool is_usage_type_v = is_usage_type<T>::value;

} // namespace usbpad::hid
