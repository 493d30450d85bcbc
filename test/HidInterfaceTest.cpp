// Copyright (c) 2023, Adam Simpkins
#include "usbpad/hid/HidInterface.h"

#include "usbpad/UsbDevice.h"
#include "usbpad/hid/types.h"
#include "usbpad/hw/mock/MockDevice.h"
#include "test/lib/GamepadTestDevice.h"
#include "test/lib/mock_utils.h"
#include "usbpad/hid/HidDescriptor.h"

#include <asel/test/TestCase.h>
#include <asel/test/checks.h>

using namespace usbpad::device;
using namespace usbpad::hid;

namespace usbpad::test {

namespace {

constexpr uint8_t kHidIn = 0xa1;  // IN, Interface, Class request
constexpr uint8_t kHidOut = 0x21; // OUT, Interface, Class request

constexpr SetupPacket hid_request(uint8_t request_type,
                                  HidRequest request,
                                  uint16_t value,
                                  uint16_t length) {
  return make_setup(
      request_type, static_cast<uint8_t>(request), value, 0, length);
}

constexpr uint16_t report_value(HidReportType type, uint8_t id) {
  return static_cast<uint16_t>((static_cast<uint16_t>(type) << 8) | id);
}

} // namespace

ASEL_TEST(HidInterface, get_descriptor) {
  UsbDevice<GamepadTestDevice, MockDevice> usb;
  ASEL_ASSERT_TRUE(attach_mock_device(usb));
  auto *const hw = usb.hw();

  const auto &report_desc = SwitchGamepadInterface::kReportDescriptor;
  std::vector<uint8_t> reply;
  ASEL_ASSERT_TRUE(mock_ctrl_in(
      hw,
      make_setup(0x81, // IN, Interface, Standard request
                 static_cast<uint8_t>(StdRequestType::GetDescriptor),
                 desc_setup_value(DescriptorType::HidReport),
                 0,
                 256),
      reply));
  ASEL_EXPECT_EQ(view(reply), report_desc.data());

  ASEL_ASSERT_TRUE(mock_ctrl_in(
      hw,
      make_setup(0x81,
                 static_cast<uint8_t>(StdRequestType::GetDescriptor),
                 desc_setup_value(DescriptorType::Hid),
                 0,
                 9),
      reply));
  HidDescriptorParser hid_desc(view(reply));
  ASEL_ASSERT_TRUE(hid_desc.valid());
  ASEL_EXPECT_EQ(hid_desc.report_descriptor_length(), report_desc.size());
  ASEL_EXPECT_EQ(hid_desc.num_descriptors(), 1);

  // Physical descriptors are not supported
  ASEL_EXPECT_TRUE(mock_ctrl_expect_stall(
      hw,
      make_setup(0x81,
                 static_cast<uint8_t>(StdRequestType::GetDescriptor),
                 desc_setup_value(DescriptorType::HidPhysical),
                 0,
                 64)));
}

ASEL_TEST(HidInterface, idle) {
  UsbDevice<GamepadTestDevice, MockDevice> usb;
  ASEL_ASSERT_TRUE(attach_mock_device(usb));
  auto *const hw = usb.hw();

  std::vector<uint8_t> reply;
  ASEL_ASSERT_TRUE(
      mock_ctrl_in(hw, hid_request(kHidIn, HidRequest::GetIdle, 0, 1), reply));
  ASEL_EXPECT_EQ(view(reply),
                 (std::array<uint8_t, 1>{
                     {SwitchGamepadInterface::kDefaultIdle4ms}}));

  // SET_IDLE for report ID 0 applies to all reports
  ASEL_EXPECT_TRUE(mock_ctrl_out(
      hw, hid_request(kHidOut, HidRequest::SetIdle, (25 << 8) | 0, 0)));
  ASEL_ASSERT_TRUE(
      mock_ctrl_in(hw, hid_request(kHidIn, HidRequest::GetIdle, 0, 1), reply));
  ASEL_EXPECT_EQ(view(reply), (std::array<uint8_t, 1>{{25}}));
  auto *const queue = usb.dev().gamepad().report_map()->get_report_queue(0);
  ASEL_ASSERT_TRUE(queue != nullptr);
  ASEL_EXPECT_EQ(queue->idle_4ms(), 25);

  // Unknown report IDs are rejected
  ASEL_EXPECT_TRUE(mock_ctrl_expect_stall(
      hw, hid_request(kHidOut, HidRequest::SetIdle, (25 << 8) | 3, 0)));
  ASEL_EXPECT_TRUE(mock_ctrl_expect_stall(
      hw, hid_request(kHidIn, HidRequest::GetIdle, 3, 1)));
}

ASEL_TEST(HidInterface, protocol) {
  UsbDevice<GamepadTestDevice, MockDevice> usb;
  ASEL_ASSERT_TRUE(attach_mock_device(usb));
  auto *const hw = usb.hw();
  auto &gamepad = usb.dev().gamepad();

  std::vector<uint8_t> reply;
  const auto get_protocol = hid_request(kHidIn, HidRequest::GetProtocol, 0, 1);
  ASEL_ASSERT_TRUE(mock_ctrl_in(hw, get_protocol, reply));
  ASEL_EXPECT_EQ(view(reply), (std::array<uint8_t, 1>{{1}}));

  // This is a boot interface, so the boot protocol can be selected
  ASEL_EXPECT_TRUE(mock_ctrl_out(
      hw, hid_request(kHidOut, HidRequest::SetProtocol, 0, 0)));
  ASEL_EXPECT_TRUE(gamepad.protocol() == HidProtocol::Boot);
  ASEL_ASSERT_TRUE(mock_ctrl_in(hw, get_protocol, reply));
  ASEL_EXPECT_EQ(view(reply), (std::array<uint8_t, 1>{{0}}));

  ASEL_EXPECT_TRUE(mock_ctrl_expect_stall(
      hw, hid_request(kHidOut, HidRequest::SetProtocol, 2, 0)));
  ASEL_EXPECT_TRUE(gamepad.protocol() == HidProtocol::Boot);

  // Reconfiguring the device returns to the report protocol
  ASEL_EXPECT_TRUE(mock_send_set_config(usb, GamepadTestDevice::kConfigId));
  ASEL_EXPECT_TRUE(gamepad.protocol() == HidProtocol::Report);
}

ASEL_TEST(HidInterface, get_report) {
  UsbDevice<GamepadTestDevice, MockDevice> usb;
  ASEL_ASSERT_TRUE(attach_mock_device(usb));
  auto *const hw = usb.hw();

  // The neutral report queued at configuration time
  std::vector<uint8_t> reply;
  ASEL_ASSERT_TRUE(mock_ctrl_in(
      hw,
      hid_request(kHidIn,
                  HidRequest::GetReport,
                  report_value(HidReportType::Input, 0),
                  8),
      reply));
  ASEL_EXPECT_EQ(view(reply),
                 (std::array<uint8_t, 8>{
                     {0x00, 0x00, 0x08, 0x00, 0x80, 0x80, 0x80, 0x80}}));

  // A short read
  ASEL_ASSERT_TRUE(mock_ctrl_in(
      hw,
      hid_request(kHidIn,
                  HidRequest::GetReport,
                  report_value(HidReportType::Input, 0),
                  3),
      reply));
  ASEL_EXPECT_EQ(view(reply), (std::array<uint8_t, 3>{{0x00, 0x00, 0x08}}));

  ASEL_EXPECT_TRUE(mock_ctrl_expect_stall(
      hw,
      hid_request(kHidIn,
                  HidRequest::GetReport,
                  report_value(HidReportType::Input, 4),
                  8)));
  ASEL_EXPECT_TRUE(mock_ctrl_expect_stall(
      hw,
      hid_request(kHidIn,
                  HidRequest::GetReport,
                  report_value(HidReportType::Feature, 0),
                  8)));
}

ASEL_TEST(HidInterface, set_report) {
  UsbDevice<GamepadTestDevice, MockDevice> usb;
  ASEL_ASSERT_TRUE(attach_mock_device(usb));
  auto *const hw = usb.hw();
  auto &gamepad = usb.dev().gamepad();

  const std::array<uint8_t, 8> output = {{1, 2, 3, 4, 5, 6, 7, 8}};
  ASEL_EXPECT_TRUE(mock_ctrl_out(
      hw,
      hid_request(kHidOut,
                  HidRequest::SetReport,
                  report_value(HidReportType::Output, 0),
                  8),
      asel::buf_view(output.data(), output.size())));
  ASEL_EXPECT_EQ(gamepad.num_output_reports(), 1);
  ASEL_EXPECT_EQ(asel::buf_view(gamepad.last_output_report().data(), 8),
                 output);

  // The output report can be read back
  std::vector<uint8_t> reply;
  ASEL_ASSERT_TRUE(mock_ctrl_in(
      hw,
      hid_request(kHidIn,
                  HidRequest::GetReport,
                  report_value(HidReportType::Output, 0),
                  8),
      reply));
  ASEL_EXPECT_EQ(view(reply), output);

  // Feature reports are not accepted
  ASEL_EXPECT_TRUE(mock_ctrl_expect_stall(
      hw,
      hid_request(kHidOut,
                  HidRequest::SetReport,
                  report_value(HidReportType::Feature, 0),
                  8),
      asel::buf_view(output.data(), output.size())));

  // Neither are reports larger than the SET_REPORT buffer
  ASEL_EXPECT_TRUE(mock_ctrl_expect_stall(
      hw,
      hid_request(kHidOut,
                  HidRequest::SetReport,
                  report_value(HidReportType::Output, 0),
                  HidInterface::kMaxSetReportSize + 1)));
  ASEL_EXPECT_EQ(gamepad.num_output_reports(), 1);
}

ASEL_TEST(HidInterface, unconfigured) {
  UsbDevice<GamepadTestDevice, MockDevice> usb;
  ASEL_ASSERT_TRUE(enumerate_mock_device(usb));

  // HID requests fail until the interface exists
  ASEL_EXPECT_TRUE(mock_ctrl_expect_stall(
      usb.hw(), hid_request(kHidIn, HidRequest::GetProtocol, 0, 1)));
}

} // namespace usbpad::test
