// Copyright (c) 2023, Adam Simpkins
#include "usbpad/bcd.h"
#include "usbpad/desc/ConfigDescriptor.h"
#include "usbpad/desc/DeviceDescriptor.h"
#include "usbpad/desc/EndpointDescriptor.h"
#include "usbpad/desc/InterfaceDescriptor.h"
#include "usbpad/desc/StaticDescriptorMap.h"
#include "usbpad/hid/HidDescriptor.h"
#include "usbpad/hid/gamepad/SwitchGamepadInterface.h"
#include "usbpad/hid/types.h"

#include <asel/test/TestCase.h>
#include <asel/test/checks.h>

namespace usbpad {
namespace {

constexpr auto make_descriptor_map() {
  DeviceDescriptor dev;
  dev.set_vendor(0x0f0d);
  dev.set_product(0x0092);
  dev.set_device_release(1, 0);

  auto cfg = hid::SwitchGamepadInterface::update_config_descriptor(
      ConfigDescriptor(1, ConfigAttr::RemoteWakeup),
      /*endpoint_num=*/1,
      /*string_index=*/4);

  return StaticDescriptorMap()
      .add_device_descriptor(dev)
      .add_language_ids(Language::English_US)
      .add_string(dev.mfgr_str_idx(), "HORI CO.,LTD.", Language::English_US)
      .add_string(dev.product_str_idx(), "usbpad", Language::English_US)
      .add_string(dev.serial_str_idx(), "12345678", Language::English_US)
      .add_string(4, "Switch Gamepad", Language::English_US)
      .add_config_descriptor(cfg);
}

const auto kDescriptors = make_descriptor_map();

} // namespace

ASEL_TEST(Descriptors, device) {
  auto dev_desc = kDescriptors.get_descriptor(DescriptorType::Device);
  ASEL_ASSERT_TRUE(dev_desc);
  ASEL_EXPECT_EQ(dev_desc->size(), 18);
  std::array<uint8_t, 18> expected_dev_desc = {{
      18,   // length
      1,    // descriptor type: device
      0,    // USB minor version
      2,    // USB major version
      0,    // class
      0,    // subclass
      0,    // protocol
      64,   // max_packet size
      0x0d, // vendor (lower half)
      0x0f, // vendor (upper half)
      0x92, // product (lower half)
      0x00, // product (upper half)
      0x00, // device version (lower half)
      0x01, // device version (upper half)
      1,    // manufacturer string index
      2,    // product string index
      3,    // serial string index
      1,    // num configurations
  }};
  ASEL_EXPECT_EQ(*dev_desc, expected_dev_desc);

  DeviceDescriptorParser parser(*dev_desc);
  ASEL_EXPECT_EQ(parser.vendor(), 0x0f0d);
  ASEL_EXPECT_EQ(parser.product(), 0x0092);
  ASEL_EXPECT_EQ(parser.device_release_bcd(), 0x0100);
  ASEL_EXPECT_EQ(parser.usb_version_bcd(), 0x0200);
}

ASEL_TEST(Descriptors, config) {
  auto cfg_desc = kDescriptors.get_descriptor(DescriptorType::Config);
  ASEL_ASSERT_TRUE(cfg_desc);
  const auto report_desc_len =
      hid::SwitchGamepadInterface::kReportDescriptor.size();

  std::array<uint8_t, 34> expected_cfg_desc = {{
      // Config descriptor
      9,    // length
      2,    // descriptor type: config
      34,   // total length (lower half)
      0,    // total length (upper half)
      1,    // num interfaces
      1,    // config ID
      0,    // string index
      0xa0, // attributes: bus powered, remote wakeup
      50,   // max power, in 2mA units
      // Interface descriptor
      9,    // length
      4,    // descriptor type: interface
      0,    // interface number
      0,    // alternate setting
      1,    // num endpoints
      3,    // class: HID
      1,    // subclass: boot
      5,    // protocol: gamepad
      4,    // string index
      // HID descriptor
      9,    // length
      0x21, // descriptor type: HID
      0x11, // bcdHID (lower half)
      0x01, // bcdHID (upper half)
      0,    // country code
      1,    // num descriptors
      0x22, // descriptor type: report
      static_cast<uint8_t>(report_desc_len & 0xff),
      static_cast<uint8_t>(report_desc_len >> 8),
      // Endpoint descriptor
      7,    // length
      5,    // descriptor type: endpoint
      0x81, // address: endpoint 1 IN
      3,    // attributes: interrupt
      8,    // max packet size (lower half)
      0,    // max packet size (upper half)
      1,    // interval
  }};
  ASEL_EXPECT_EQ(*cfg_desc, expected_cfg_desc);

  ConfigDescriptorParser parser(*cfg_desc);
  ASEL_EXPECT_EQ(parser.total_length(), 34);
  ASEL_EXPECT_EQ(parser.num_interfaces(), 1);
  ASEL_EXPECT_EQ(parser.value(), 1);
  ASEL_EXPECT_TRUE(parser.attributes() == ConfigAttr::RemoteWakeup);
  ASEL_EXPECT_EQ(parser.max_power().value_in_2ma(), 50);

  auto hid_desc = parser.find(DescriptorType::Hid);
  ASEL_ASSERT_TRUE(hid_desc);
  hid::HidDescriptorParser hid_parser(*hid_desc);
  ASEL_EXPECT_EQ(hid_parser.hid_version_bcd(), 0x0111);
  ASEL_EXPECT_EQ(hid_parser.report_descriptor_length(), report_desc_len);

  auto ep_desc = parser.find(DescriptorType::Endpoint);
  ASEL_ASSERT_TRUE(ep_desc);
  EndpointDescriptorParser ep_parser(*ep_desc);
  ASEL_EXPECT_EQ(ep_parser.endpoint_number(), 1);
  ASEL_EXPECT_TRUE(ep_parser.direction() == Direction::In);
  ASEL_EXPECT_TRUE(ep_parser.type() == EndpointType::Interrupt);
  ASEL_EXPECT_EQ(ep_parser.max_packet_size(), 8);
  ASEL_EXPECT_EQ(ep_parser.interval(), 1);

  ASEL_EXPECT_FALSE(parser.find(DescriptorType::Endpoint, 1));
  ASEL_EXPECT_FALSE(parser.find(DescriptorType::String));
}

ASEL_TEST(Descriptors, strings) {
  auto lang_ids = kDescriptors.get_descriptor(DescriptorType::String, 0);
  ASEL_ASSERT_TRUE(lang_ids);
  std::array<uint8_t, 4> expected_lang_ids = {{4, 3, 0x09, 0x04}};
  ASEL_EXPECT_EQ(*lang_ids, expected_lang_ids);

  auto product = kDescriptors.get_string_descriptor(2, Language::English_US);
  ASEL_ASSERT_TRUE(product);
  std::array<uint8_t, 14> expected_product = {{
      14, 3, 'u', 0, 's', 0, 'b', 0, 'p', 0, 'a', 0, 'd', 0,
  }};
  ASEL_EXPECT_EQ(*product, expected_product);

  auto intf = kDescriptors.get_string_descriptor(4, Language::English_US);
  ASEL_ASSERT_TRUE(intf);
  ASEL_EXPECT_EQ(intf->size(), 2 + 2 * 14);

  // Strings are only registered for the languages they were added with
  ASEL_EXPECT_FALSE(
      kDescriptors.get_string_descriptor(2, Language::German_Standard));
  ASEL_EXPECT_FALSE(kDescriptors.get_string_descriptor(5, Language::English_US));
}

ASEL_TEST(Descriptors, compile_time_lookup) {
  constexpr auto map = make_descriptor_map();
  static_assert(map.has_descriptor(DescriptorType::Device));
  static_assert(map.has_descriptor(DescriptorType::Config, 0));
  static_assert(!map.has_descriptor(DescriptorType::Config, 1));
  static_assert(map.has_string(4, Language::English_US));
  static_assert(!map.has_string(4, Language::German_Standard));
  static_assert(map.num_descriptors == 7);

  // The same lookup works at runtime
  ASEL_EXPECT_TRUE(kDescriptors.has_descriptor(DescriptorType::String, 0));
  ASEL_EXPECT_FALSE(kDescriptors.has_string(5, Language::English_US));
}

ASEL_TEST(Descriptors, utf8_strings) {
  constexpr auto desc = detail::make_string_descriptor<4>("\xc3\xa9t");
  // "ét": two UTF-16 code units
  ASEL_EXPECT_EQ(desc[0], 6);
  ASEL_EXPECT_EQ(desc[1], 3);
  ASEL_EXPECT_EQ(desc[2], 0xe9);
  ASEL_EXPECT_EQ(desc[3], 0x00);
  ASEL_EXPECT_EQ(desc[4], 't');
  ASEL_EXPECT_EQ(desc[5], 0x00);
}

ASEL_TEST(Descriptors, hid_descriptor) {
  hid::HidDescriptor desc(80);
  std::array<uint8_t, 9> expected = {{
      9, 0x21, 0x11, 0x01, 0, 1, 0x22, 80, 0,
  }};
  ASEL_EXPECT_EQ(asel::buf_view(desc.bytes(), hid::HidDescriptor::kSize),
                 expected);

  desc.set_country(hid::HidCountry::Japan).set_report_descriptor_length(300);
  ASEL_EXPECT_TRUE(desc.country() == hid::HidCountry::Japan);
  ASEL_EXPECT_EQ(desc.report_descriptor_length(), 300);
  ASEL_EXPECT_EQ(desc.data()[7], 0x2c);
  ASEL_EXPECT_EQ(desc.data()[8], 0x01);

  desc.set_hid_version(1, 10);
  ASEL_EXPECT_EQ(desc.hid_version_bcd(), 0x0110);
}

ASEL_TEST(Descriptors, endpoint_count) {
  // bNumEndpoints is updated by each add_endpoint() call, and endpoint
  // descriptors are attributed to the most recent interface.
  constexpr auto cfg =
      ConfigDescriptor()
          .add_interface(InterfaceDescriptor(UsbClass::VendorSpecific))
          .add_endpoint(EndpointDescriptor(EndpointType::Bulk, Direction::In, 1)
                            .set_max_packet_size(64))
          .add_endpoint(
              EndpointDescriptor(EndpointType::Bulk, Direction::Out, 1)
                  .set_max_packet_size(64))
          .add_interface(InterfaceDescriptor(UsbClass::VendorSpecific));
  static_assert(cfg.kTotalLength == 9 + 9 + 7 + 7 + 9);
  ASEL_EXPECT_EQ(cfg.num_interfaces(), 2);
  ASEL_EXPECT_EQ(cfg.total_length(), 41);

  const auto &data = cfg.data();
  // First interface
  ASEL_EXPECT_EQ(data[9 + 2], 0);
  ASEL_EXPECT_EQ(data[9 + 4], 2);
  // Second interface
  ASEL_EXPECT_EQ(data[32 + 2], 1);
  ASEL_EXPECT_EQ(data[32 + 4], 0);
}

ASEL_TEST(Descriptors, endpoint_address) {
  constexpr auto in1 = EndpointAddress::in(1);
  static_assert(in1.value() == 0x81);
  ASEL_EXPECT_TRUE(in1.is_in());
  ASEL_EXPECT_EQ(in1.number().value(), 1);
  ASEL_EXPECT_EQ(in1.mask(), 0x0002);

  const auto out3 = EndpointAddress::out(3);
  ASEL_EXPECT_FALSE(out3.is_in());
  ASEL_EXPECT_EQ(out3.value(), 0x03);
  ASEL_EXPECT_EQ(out3.mask(), 0x0008);
  ASEL_EXPECT_FALSE(out3.number().is_control_pipe());

  // Reserved bits 4-6 are not part of the endpoint number
  ASEL_EXPECT_EQ(EndpointAddress(0xf2).number().value(), 2);
  ASEL_EXPECT_TRUE(EndpointAddress(0x80).number().is_control_pipe());

  const auto ep_desc = EndpointDescriptor()
                           .set_address(EndpointAddress::in(2))
                           .set_type(EndpointType::Bulk);
  ASEL_EXPECT_EQ(ep_desc.endpoint_number(), 2);
  ASEL_EXPECT_TRUE(ep_desc.direction() == Direction::In);
  ASEL_EXPECT_TRUE(ep_desc.type() == EndpointType::Bulk);
}

ASEL_TEST(Bcd, runtime_values) {
  static_assert(bcd_encode(42) == 0x42);
  static_assert(bcd_version_parts(0x0111).second == 11);

  // Values computed at runtime are not range checked at compile time
  volatile uint8_t input = 150;
  ASEL_EXPECT_EQ(bcd_encode(input), 0x99);
  input = 100;
  ASEL_EXPECT_EQ(bcd_encode(input), 0x99);
  input = 99;
  ASEL_EXPECT_EQ(bcd_encode(input), 0x99);
  input = 7;
  ASEL_EXPECT_EQ(bcd_encode(input), 0x07);

  // Invalid nibbles are decoded as-is
  input = 0x1a;
  ASEL_EXPECT_EQ(bcd_decode(input), 20);
  input = 0xf0;
  ASEL_EXPECT_EQ(bcd_decode(input), 150);
  input = 0x99;
  ASEL_EXPECT_EQ(bcd_decode(input), 99);
}

} // namespace usbpad
