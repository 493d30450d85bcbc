// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/desc/DescriptorView.h"
#include "usbpad/desc/types.h"

#include <array>
#include <cstdint>

namespace usbpad {

namespace detail {

template <typename Derived>
class InterfaceDescriptorFields {
public:
  constexpr uint8_t interface_number() const { return at(2); }
  constexpr uint8_t alt_setting() const { return at(3); }
  constexpr uint8_t num_endpoints() const { return at(4); }
  constexpr uint8_t get_class() const { return at(5); }
  constexpr uint8_t subclass() const { return at(6); }
  constexpr uint8_t protocol() const { return at(7); }
  // The index of a string descriptor describing this interface.
  constexpr uint8_t string_index() const { return at(8); }

private:
  constexpr uint8_t at(size_t n) const {
    return static_cast<const Derived *>(this)->bytes()[n];
  }
};

} // namespace detail

/**
 * A USB interface descriptor.
 *
 * When added to a ConfigDescriptor with add_interface(), the
 * bInterfaceNumber and bNumEndpoints fields are filled in automatically.
 */
class InterfaceDescriptor
    : public detail::InterfaceDescriptorFields<InterfaceDescriptor> {
public:
  static constexpr size_t kSize = 9;

  constexpr InterfaceDescriptor(UsbClass usb_class = UsbClass::PerInterface,
                                uint8_t subclass = 0,
                                uint8_t protocol = 0)
      : data_{{
            kSize, // bLength
            static_cast<uint8_t>(DescriptorType::Interface),
            0,                               // bInterfaceNumber
            0,                               // bAlternateSetting
            0,                               // bNumEndpoints
            static_cast<uint8_t>(usb_class), // bInterfaceClass
            subclass,                        // bInterfaceSubClass
            protocol,                        // bInterfaceProtocol
            0,                               // iInterface
        }} {}

  constexpr const std::array<uint8_t, kSize> &data() const { return data_; }
  constexpr const uint8_t *bytes() const { return data_.data(); }

  constexpr InterfaceDescriptor &set_interface_number(uint8_t num) {
    data_[2] = num;
    return *this;
  }
  constexpr InterfaceDescriptor &set_alt_setting(uint8_t value) {
    data_[3] = value;
    return *this;
  }
  constexpr InterfaceDescriptor &set_num_endpoints(uint8_t num) {
    data_[4] = num;
    return *this;
  }
  constexpr InterfaceDescriptor &
  set_class(UsbClass usb_class, uint8_t subclass, uint8_t protocol) {
    data_[5] = static_cast<uint8_t>(usb_class);
    data_[6] = subclass;
    data_[7] = protocol;
    return *this;
  }
  constexpr InterfaceDescriptor &set_string_index(uint8_t index) {
    data_[8] = index;
    return *this;
  }

private:
  std::array<uint8_t, kSize> data_ = {};
};

class InterfaceDescriptorParser
    : public DescriptorView<InterfaceDescriptor::kSize>,
      public detail::InterfaceDescriptorFields<InterfaceDescriptorParser> {
public:
  using DescriptorView::DescriptorView;
  using DescriptorView::bytes;
};

} // namespace usbpad
