// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/hid/usage/usage_page.h"

namespace usbpad::hid {

/**
 * Usages for the Button page (0x09)
 *
 * Button usages are simply the button number, starting at 1.
 * Usage 0 means no button is pressed.
 */
enum class ButtonUsage : uint8_t {
  NoButton = 0,
  Primary = 1,
  Secondary = 2,
  Tertiary = 3,
};
template <>
struct is_usage_type<ButtonUsage> : std::true_type {};

constexpr ButtonUsage button_usage(uint8_t button_number) {
  return static_cast<ButtonUsage>(button_number);
}

} // namespace usbpad::hid
