// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/bcd.h"
#include "usbpad/desc/DescriptorView.h"
#include "usbpad/desc/types.h"
#include "usbpad/endian.h"

#include <array>
#include <cstdint>
#include <utility>

namespace usbpad {

namespace detail {

/**
 * Read accessors shared by DeviceDescriptor and DeviceDescriptorParser.
 *
 * Derived must provide a bytes() method returning a pointer to the 18 bytes
 * of serialized descriptor data.
 */
template <typename Derived>
class DeviceDescriptorFields {
public:
  constexpr uint8_t get_class() const { return at(4); }
  constexpr uint8_t subclass() const { return at(5); }
  constexpr uint8_t protocol() const { return at(6); }
  constexpr uint8_t ep0_max_pkt_size() const { return at(7); }
  constexpr uint16_t vendor() const { return load_le16(ptr() + 8); }
  constexpr uint16_t product() const { return load_le16(ptr() + 10); }
  constexpr uint16_t device_release_bcd() const {
    return load_le16(ptr() + 12);
  }
  constexpr std::pair<uint8_t, uint8_t> device_release() const {
    return bcd_version_parts(device_release_bcd());
  }
  constexpr uint8_t mfgr_str_idx() const { return at(14); }
  constexpr uint8_t product_str_idx() const { return at(15); }
  constexpr uint8_t serial_str_idx() const { return at(16); }
  constexpr uint8_t num_configs() const { return at(17); }
  constexpr uint16_t usb_version_bcd() const { return load_le16(ptr() + 2); }
  constexpr std::pair<uint8_t, uint8_t> usb_version() const {
    return bcd_version_parts(usb_version_bcd());
  }

private:
  constexpr const uint8_t *ptr() const {
    return static_cast<const Derived *>(this)->bytes();
  }
  constexpr uint8_t at(size_t n) const { return ptr()[n]; }
};

} // namespace detail

/**
 * A USB device descriptor.
 *
 * Device descriptors are stored in serialized form, since the serialized form
 * is what GET_DESCRIPTOR needs to return.  They are normally built once at
 * compile time by a constexpr function and placed in the device's
 * StaticDescriptorMap.
 *
 * The bMaxPacketSize0 field may not match the packet size negotiated during
 * bus enumeration.  StdControlHandler patches this field in the response when
 * necessary, so the descriptor itself can stay in read-only memory.
 */
class DeviceDescriptor
    : public detail::DeviceDescriptorFields<DeviceDescriptor> {
public:
  static constexpr size_t kSize = 18;
  static constexpr uint8_t kDefaultMfgrStrIdx = 1;
  static constexpr uint8_t kDefaultProductStrIdx = 2;
  static constexpr uint8_t kDefaultSerialStrIdx = 3;

  constexpr DeviceDescriptor()
      : data_{{
            kSize, // bLength
            static_cast<uint8_t>(DescriptorType::Device),
            0x00,                  // bcdUSB: 2.00
            0x02,                  //
            0,                     // bDeviceClass
            0,                     // bDeviceSubClass
            0,                     // bDeviceProtocol
            64,                    // bMaxPacketSize0
            0,                     // idVendor
            0,                     //
            0,                     // idProduct
            0,                     //
            0,                     // bcdDevice
            0,                     //
            kDefaultMfgrStrIdx,    // iManufacturer
            kDefaultProductStrIdx, // iProduct
            kDefaultSerialStrIdx,  // iSerialNumber
            1,                     // bNumConfigurations
        }} {}

  constexpr const std::array<uint8_t, kSize> &data() const { return data_; }
  constexpr std::array<uint8_t, kSize> &data() { return data_; }
  constexpr const uint8_t *bytes() const { return data_.data(); }

  constexpr DeviceDescriptor &
  set_class(UsbClass usb_class, uint8_t subclass, uint8_t protocol) {
    data_[4] = static_cast<uint8_t>(usb_class);
    data_[5] = subclass;
    data_[6] = protocol;
    return *this;
  }
  constexpr DeviceDescriptor &set_ep0_max_pkt_size(uint8_t mps) {
    data_[7] = mps;
    return *this;
  }
  constexpr DeviceDescriptor &set_vendor(uint16_t vendor) {
    store_le16(&data_[8], vendor);
    return *this;
  }
  constexpr DeviceDescriptor &set_product(uint16_t product) {
    store_le16(&data_[10], product);
    return *this;
  }
  constexpr DeviceDescriptor &set_product(uint16_t vendor, uint16_t product) {
    return set_vendor(vendor).set_product(product);
  }
  constexpr DeviceDescriptor &set_device_release(uint8_t major,
                                                 uint8_t minor) {
    return set_device_release_bcd(bcd_version(major, minor));
  }
  constexpr DeviceDescriptor &set_device_release_bcd(uint16_t release) {
    store_le16(&data_[12], release);
    return *this;
  }
  constexpr DeviceDescriptor &set_usb_version(uint8_t major, uint8_t minor) {
    store_le16(&data_[2], bcd_version(major, minor));
    return *this;
  }

  constexpr DeviceDescriptor &set_mfgr_str_idx(uint8_t idx) {
    data_[14] = idx;
    return *this;
  }
  constexpr DeviceDescriptor &set_product_str_idx(uint8_t idx) {
    data_[15] = idx;
    return *this;
  }
  constexpr DeviceDescriptor &set_serial_str_idx(uint8_t idx) {
    data_[16] = idx;
    return *this;
  }
  constexpr DeviceDescriptor &set_num_configs(uint8_t num) {
    data_[17] = num;
    return *this;
  }

private:
  std::array<uint8_t, kSize> data_ = {};
};

/**
 * Parses device descriptor data from an existing buffer.
 */
class DeviceDescriptorParser
    : public DescriptorView<DeviceDescriptor::kSize>,
      public detail::DeviceDescriptorFields<DeviceDescriptorParser> {
public:
  using DescriptorView::DescriptorView;
  using DescriptorView::bytes;
};

} // namespace usbpad
