// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/desc/DescriptorView.h"
#include "usbpad/desc/EndpointDescriptor.h"
#include "usbpad/desc/InterfaceDescriptor.h"
#include "usbpad/desc/types.h"
#include "usbpad/endian.h"

#include <asel/buf_view.h>

#include <array>
#include <cstdint>
#include <limits>
#include <optional>

namespace usbpad {

/**
 * A USB configuration descriptor.
 *
 * Config descriptors are variable length: the 9-byte configuration header is
 * followed by all of the interface, class-specific, and endpoint descriptors
 * of the configuration.  The class is templatized on the overall length so
 * that complete config descriptors can be built at compile time.
 *
 * The add_*() methods do not modify the current object, but instead return a
 * new, larger ConfigDescriptor.
 */
template <size_t TotalLength = 9, uint8_t NumInterfaces = 0>
class ConfigDescriptor {
public:
  static constexpr size_t kSize = 9;
  static constexpr size_t kTotalLength = TotalLength;
  static constexpr uint8_t kNumInterfaces = NumInterfaces;

  static_assert(TotalLength <= std::numeric_limits<uint16_t>::max(),
                "config descriptor data is too large");

  constexpr ConfigDescriptor(uint8_t value = 1,
                             ConfigAttr attr = ConfigAttr::None,
                             UsbMilliamps max_power = UsbMilliamps(100),
                             uint8_t string_index = 0)
      : data_{{
            kSize, // bLength
            static_cast<uint8_t>(DescriptorType::Config),
            kTotalLength & 0xff,        // wTotalLength
            (kTotalLength >> 8) & 0xff, //
            kNumInterfaces,             // bNumInterfaces
            value,                      // bConfigurationValue
            string_index,               // iConfiguration
            attr_byte(attr),            // bmAttributes
            max_power.value_in_2ma(),   // bMaxPower
        }} {}

  constexpr const std::array<uint8_t, kTotalLength> &data() const {
    return data_;
  }

  /**
   * Append an interface descriptor.
   *
   * The bInterfaceNumber field of the supplied descriptor is ignored:
   * interfaces are numbered in the order they are added.  bNumEndpoints is
   * reset to 0 and incremented by each subsequent add_endpoint() call.
   */
  constexpr ConfigDescriptor<TotalLength + InterfaceDescriptor::kSize,
                             NumInterfaces + 1>
  add_interface(const InterfaceDescriptor &intf) const {
    auto numbered = InterfaceDescriptor(intf)
                        .set_interface_number(NumInterfaces)
                        .set_num_endpoints(0);
    return ConfigDescriptor<TotalLength + InterfaceDescriptor::kSize,
                            NumInterfaces + 1>(
        data_, numbered.data(), /*last_intf_offset=*/TotalLength);
  }

  /**
   * Append an endpoint descriptor, and increment bNumEndpoints of the most
   * recently added interface.
   */
  constexpr ConfigDescriptor<TotalLength + EndpointDescriptor::kSize,
                             NumInterfaces>
  add_endpoint(const EndpointDescriptor &endpoint) const {
    ConfigDescriptor<TotalLength + EndpointDescriptor::kSize, NumInterfaces>
        result(data_, endpoint.data(), last_intf_offset_);
    if (last_intf_offset_ != 0) {
      result.data_[last_intf_offset_ + 4] += 1;
    }
    return result;
  }

  /**
   * Append an arbitrary class-specific descriptor, such as a HID descriptor.
   *
   * The descriptor data is copied as-is.
   */
  template <size_t N>
  constexpr ConfigDescriptor<TotalLength + N, NumInterfaces>
  add_descriptor(const std::array<uint8_t, N> &desc) const {
    return ConfigDescriptor<TotalLength + N, NumInterfaces>(
        data_, desc, last_intf_offset_);
  }

  constexpr uint16_t total_length() const { return load_le16(&data_[2]); }
  constexpr uint8_t num_interfaces() const { return data_[4]; }

  constexpr ConfigDescriptor &set_value(uint8_t v) {
    data_[5] = v;
    return *this;
  }
  constexpr uint8_t value() const { return data_[5]; }

  // string index is the index of a string descriptor describing this
  // configuration.
  constexpr ConfigDescriptor &set_string_index(uint8_t index) {
    data_[6] = index;
    return *this;
  }
  constexpr uint8_t string_index() const { return data_[6]; }

  constexpr ConfigDescriptor &set_attributes(ConfigAttr attr) {
    data_[7] = attr_byte(attr);
    return *this;
  }
  constexpr ConfigAttr attributes() const {
    return static_cast<ConfigAttr>(data_[7] & 0x7f);
  }

  constexpr ConfigDescriptor &set_max_power(UsbMilliamps ma) {
    data_[8] = ma.value_in_2ma();
    return *this;
  }
  constexpr UsbMilliamps max_power() const {
    return UsbMilliamps(static_cast<uint16_t>(data_[8] * 2));
  }

private:
  template <size_t X, uint8_t Y> friend class ConfigDescriptor;

  static constexpr uint8_t attr_byte(ConfigAttr attr) {
    return 0x80 | static_cast<uint8_t>(attr);
  }

  // Build a descriptor by appending desc to the data of a smaller one, then
  // fix up the header fields that depend on the total length.
  template <size_t PrevLength, size_t N>
  constexpr ConfigDescriptor(const std::array<uint8_t, PrevLength> &prev,
                             const std::array<uint8_t, N> &desc,
                             uint32_t last_intf_offset)
      : last_intf_offset_(last_intf_offset) {
    static_assert(PrevLength + N == TotalLength);
    for (size_t n = 0; n < PrevLength; ++n) {
      data_[n] = prev[n];
    }
    for (size_t n = 0; n < N; ++n) {
      data_[PrevLength + n] = desc[n];
    }
    store_le16(&data_[2], static_cast<uint16_t>(kTotalLength));
    data_[4] = kNumInterfaces;
  }

  std::array<uint8_t, TotalLength> data_ = {};
  // Offset of the most recently added interface descriptor, or 0 if no
  // interfaces have been added.
  uint32_t last_intf_offset_ = 0;
};

/**
 * Parses config descriptor data from an existing buffer.
 *
 * The buffer may contain just the 9-byte configuration header, or the full
 * wTotalLength bytes including all interface and endpoint descriptors.
 */
class ConfigDescriptorParser : public DescriptorView<9, /*ExactSize=*/false> {
public:
  using DescriptorView::DescriptorView;

  constexpr uint16_t total_length() const { return load_le16(bytes() + 2); }
  constexpr uint8_t num_interfaces() const { return bytes()[4]; }
  constexpr uint8_t value() const { return bytes()[5]; }
  constexpr uint8_t string_index() const { return bytes()[6]; }
  constexpr ConfigAttr attributes() const {
    return static_cast<ConfigAttr>(bytes()[7] & 0x7f);
  }
  constexpr UsbMilliamps max_power() const {
    return UsbMilliamps(static_cast<uint16_t>(bytes()[8] * 2));
  }

  /**
   * Find the Nth descriptor of the given type that follows the configuration
   * header.
   *
   * Returns std::nullopt if there is no such descriptor, or if the descriptor
   * chain is malformed.
   */
  std::optional<asel::buf_view> find(DescriptorType type,
                                     size_t nth = 0) const {
    const auto buf = data();
    size_t offset = bytes()[0];
    while (offset + 2 <= buf.size()) {
      const uint8_t len = buf[offset];
      if (len < 2 || offset + len > buf.size()) {
        return std::nullopt;
      }
      if (buf[offset + 1] == static_cast<uint8_t>(type)) {
        if (nth == 0) {
          return asel::buf_view(buf.data() + offset, len);
        }
        --nth;
      }
      offset += len;
    }
    return std::nullopt;
  }
};

} // namespace usbpad
