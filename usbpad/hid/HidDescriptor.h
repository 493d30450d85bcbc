// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/bcd.h"
#include "usbpad/desc/DescriptorView.h"
#include "usbpad/desc/types.h"
#include "usbpad/endian.h"
#include "usbpad/hid/types.h"

#include <array>
#include <cstdint>
#include <utility>

namespace usbpad::hid {

namespace detail {

template <typename Derived>
class HidDescriptorFields {
public:
  constexpr uint16_t hid_version_bcd() const { return load_le16(ptr() + 2); }
  constexpr std::pair<uint8_t, uint8_t> hid_version() const {
    return bcd_version_parts(hid_version_bcd());
  }
  constexpr HidCountry country() const {
    return static_cast<HidCountry>(ptr()[4]);
  }
  constexpr uint8_t num_descriptors() const { return ptr()[5]; }
  constexpr DescriptorType report_descriptor_type() const {
    return static_cast<DescriptorType>(ptr()[6]);
  }
  constexpr uint16_t report_descriptor_length() const {
    return load_le16(ptr() + 7);
  }

private:
  constexpr const uint8_t *ptr() const {
    return static_cast<const Derived *>(this)->bytes();
  }
};

} // namespace detail

/**
 * A HID class descriptor, describing a single report descriptor.
 *
 * This is placed in the configuration descriptor immediately after the HID
 * interface descriptor, and is also returned for HID class GET_DESCRIPTOR
 * requests.
 */
class HidDescriptor : public detail::HidDescriptorFields<HidDescriptor> {
public:
  static constexpr size_t kSize = 9;

  constexpr explicit HidDescriptor(uint16_t report_descriptor_length = 0)
      : data_{{
            kSize, // bLength
            static_cast<uint8_t>(DescriptorType::Hid),
            kHidVersionBcd & 0xff, // bcdHID
            kHidVersionBcd >> 8,   //
            0,                     // bCountryCode
            1,                     // bNumDescriptors
            static_cast<uint8_t>(DescriptorType::HidReport),
            static_cast<uint8_t>(report_descriptor_length & 0xff),
            static_cast<uint8_t>(report_descriptor_length >> 8),
        }} {}

  constexpr const std::array<uint8_t, kSize> &data() const { return data_; }
  constexpr const uint8_t *bytes() const { return data_.data(); }

  constexpr HidDescriptor &set_country(HidCountry country) {
    data_[4] = static_cast<uint8_t>(country);
    return *this;
  }
  constexpr HidDescriptor &set_report_descriptor_length(uint16_t length) {
    store_le16(&data_[7], length);
    return *this;
  }
  constexpr HidDescriptor &set_hid_version(uint8_t major, uint8_t minor) {
    store_le16(&data_[2], bcd_version(major, minor));
    return *this;
  }

private:
  std::array<uint8_t, kSize> data_ = {};
};

class HidDescriptorParser
    : public DescriptorView<HidDescriptor::kSize>,
      public detail::HidDescriptorFields<HidDescriptorParser> {
public:
  using DescriptorView::DescriptorView;
  using DescriptorView::bytes;
};

} // namespace usbpad::hid
