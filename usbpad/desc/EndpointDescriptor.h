// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/desc/DescriptorView.h"
#include "usbpad/desc/types.h"
#include "usbpad/endian.h"

#include <array>
#include <cstdint>

namespace usbpad {

namespace detail {

template <typename Derived>
class EndpointDescriptorFields {
public:
  constexpr EndpointAddress address() const { return EndpointAddress(at(2)); }
  constexpr uint8_t endpoint_number() const { return at(2) & 0x0f; }
  constexpr Direction direction() const {
    return static_cast<Direction>(at(2) & 0x80);
  }
  constexpr EndpointType type() const {
    return static_cast<EndpointType>(at(3) & 0x03);
  }
  constexpr EndpointSync sync_type() const {
    return static_cast<EndpointSync>(at(3) & 0x0c);
  }
  constexpr EndpointUsage usage() const {
    return static_cast<EndpointUsage>(at(3) & 0x30);
  }
  constexpr uint8_t attributes() const { return at(3); }
  constexpr uint16_t max_packet_size() const {
    return load_le16(static_cast<const Derived *>(this)->bytes() + 4);
  }
  constexpr uint8_t interval() const { return at(6); }

private:
  constexpr uint8_t at(size_t n) const {
    return static_cast<const Derived *>(this)->bytes()[n];
  }
};

} // namespace detail

/**
 * A USB endpoint descriptor.
 */
class EndpointDescriptor
    : public detail::EndpointDescriptorFields<EndpointDescriptor> {
public:
  static constexpr size_t kSize = 7;

  constexpr EndpointDescriptor(EndpointType type = EndpointType::Control,
                               Direction dir = Direction::Out,
                               uint8_t endpoint_num = 0)
      : data_{{
            kSize, // bLength
            static_cast<uint8_t>(DescriptorType::Endpoint),
            EndpointAddress(EndpointNumber(endpoint_num), dir)
                .value(),               // bEndpointAddress
            static_cast<uint8_t>(type), // bmAttributes
            0,                          // wMaxPacketSize
            0,                          //
            0,                          // bInterval
        }} {}

  constexpr const std::array<uint8_t, kSize> &data() const { return data_; }
  constexpr const uint8_t *bytes() const { return data_.data(); }

  constexpr EndpointDescriptor &set_address(EndpointAddress addr) {
    data_[2] = addr.value();
    return *this;
  }
  constexpr EndpointDescriptor &set_address(Direction dir,
                                            uint8_t endpoint_num) {
    return set_address(EndpointAddress(EndpointNumber(endpoint_num), dir));
  }

  // The sync and usage bits are only meaningful for isochronous endpoints.
  constexpr EndpointDescriptor &
  set_type(EndpointType type,
           EndpointSync sync = EndpointSync::NoSync,
           EndpointUsage usage = EndpointUsage::Data) {
    data_[3] = static_cast<uint8_t>(type) | static_cast<uint8_t>(sync) |
               static_cast<uint8_t>(usage);
    return *this;
  }

  constexpr EndpointDescriptor &set_max_packet_size(uint16_t mps) {
    store_le16(&data_[4], mps);
    return *this;
  }

  /**
   * Set the polling interval.
   *
   * For full speed interrupt endpoints this is in milliseconds (1-255).
   */
  constexpr EndpointDescriptor &set_interval(uint8_t interval) {
    data_[6] = interval;
    return *this;
  }

private:
  std::array<uint8_t, kSize> data_ = {};
};

class EndpointDescriptorParser
    : public DescriptorView<EndpointDescriptor::kSize>,
      public detail::EndpointDescriptorFields<EndpointDescriptorParser> {
public:
  using DescriptorView::DescriptorView;
  using DescriptorView::bytes;
};

} // namespace usbpad
