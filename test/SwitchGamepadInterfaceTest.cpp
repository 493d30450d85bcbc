// Copyright (c) 2023, Adam Simpkins
#include "usbpad/hid/gamepad/SwitchGamepadInterface.h"

#include "usbpad/DeviceEvent.h"
#include "usbpad/Error.h"
#include "usbpad/UsbDevice.h"
#include "usbpad/hw/mock/MockDevice.h"
#include "test/lib/GamepadTestDevice.h"
#include "test/lib/mock_utils.h"

#include <asel/chrono.h>
#include <asel/test/TestCase.h>
#include <asel/test/checks.h>

#include <chrono>
#include <vector>

using namespace usbpad::device;
using namespace usbpad::hid;

namespace usbpad::test {

namespace {

using GamepadUsbDevice = UsbDevice<GamepadTestDevice, MockDevice>;

constexpr std::array<uint8_t, 8> kNeutralReport = {
    {0x00, 0x00, 0x08, 0x00, 0x80, 0x80, 0x80, 0x80}};

class RecordingCallback : public SwitchGamepadCallback {
public:
  void on_output_report(asel::buf_view data) override {
    reports.emplace_back(data.data(), data.data() + data.size());
  }

  std::vector<std::vector<uint8_t>> reports;
};

} // namespace

ASEL_TEST(SwitchGamepad, neutral_report_on_configure) {
  GamepadUsbDevice usb;
  ASEL_ASSERT_TRUE(attach_mock_device(usb));

  const auto &ep = usb.hw()->in_eps[GamepadTestDevice::kInEndpointNum];
  ASEL_EXPECT_EQ(ep.max_packet_size, SwitchGamepadInterface::kMaxPacketSize);
  ASEL_ASSERT_TRUE(ep.xfer_in_progress);
  ASEL_EXPECT_EQ(kNeutralReport, ep.cur_xfer_buf());
}

ASEL_TEST(SwitchGamepad, write_report) {
  GamepadUsbDevice usb;
  ASEL_ASSERT_TRUE(attach_mock_device(usb));
  auto *const hw = usb.hw();
  auto &gamepad = usb.dev().gamepad();
  constexpr auto ep_num = GamepadTestDevice::kInEndpointNum;

  // The first report is queued while the neutral report is still in flight
  SwitchGamepadReport report;
  report.press(SwitchButton::B);
  report.set_hat(SwitchHat::Right);
  report.lx = 0x20;
  ASEL_EXPECT_FALSE(gamepad.write_report(report));
  ASEL_EXPECT_EQ(kNeutralReport, hw->in_eps[ep_num].cur_xfer_buf());

  const std::array<uint8_t, 8> expected1 = {
      {0x02, 0x00, 0x02, 0x00, 0x20, 0x80, 0x80, 0x80}};
  hw->complete_in_xfer(ep_num);
  ASEL_ASSERT_TRUE(hw->in_eps[ep_num].xfer_in_progress);
  ASEL_EXPECT_EQ(expected1, hw->in_eps[ep_num].cur_xfer_buf());

  // Two more reports while the first is in flight: the newest one wins
  report.release(SwitchButton::B);
  report.press(SwitchButton::ZR);
  ASEL_EXPECT_FALSE(gamepad.write_report(report));
  report.ry = 0xff;
  ASEL_EXPECT_FALSE(gamepad.write_report(report));

  const std::array<uint8_t, 8> expected2 = {
      {0x80, 0x00, 0x02, 0x00, 0x20, 0x80, 0x80, 0xff}};
  hw->complete_in_xfer(ep_num);
  ASEL_ASSERT_TRUE(hw->in_eps[ep_num].xfer_in_progress);
  ASEL_EXPECT_EQ(expected2, hw->in_eps[ep_num].cur_xfer_buf());

  // Nothing left to send
  hw->complete_in_xfer(ep_num);
  ASEL_EXPECT_FALSE(hw->in_eps[ep_num].xfer_in_progress);
}

ASEL_TEST(SwitchGamepad, write_report_errors) {
  GamepadUsbDevice usb;
  auto &gamepad = usb.dev().gamepad();
  SwitchGamepadReport report;

  ASEL_ASSERT_TRUE(enumerate_mock_device(usb));
  ASEL_EXPECT_TRUE(gamepad.write_report(report) ==
                   make_error_code(Error::NotConfigured));

  ASEL_ASSERT_TRUE(mock_send_set_config(usb, GamepadTestDevice::kConfigId));
  ASEL_EXPECT_FALSE(gamepad.write_report(report));

  // Encoding errors are reported even when configured
  report.hat = 0x20;
  ASEL_EXPECT_TRUE(gamepad.write_report(report) ==
                   make_error_code(Error::SerializationError));

  ASEL_ASSERT_TRUE(mock_send_set_config(usb, 0));
  report.hat = static_cast<uint8_t>(SwitchHat::Up);
  ASEL_EXPECT_TRUE(gamepad.write_report(report) ==
                   make_error_code(Error::NotConfigured));
  ASEL_EXPECT_FALSE(usb.hw()->in_eps[1].xfer_in_progress);
}

ASEL_TEST(SwitchGamepad, write_while_suspended) {
  GamepadUsbDevice usb;
  ASEL_ASSERT_TRUE(attach_mock_device(usb));
  auto *const hw = usb.hw();
  auto &gamepad = usb.dev().gamepad();
  hw->complete_in_xfer(1);
  ASEL_EXPECT_FALSE(hw->in_eps[1].xfer_in_progress);

  ASEL_ASSERT_TRUE(hw->post_event(SuspendEvent{}));
  ASEL_EXPECT_TRUE(usb.process_events());
  ASEL_EXPECT_TRUE(usb.manager()->state() == DeviceState::SuspendedConfigured);

  // The configuration is still valid while suspended
  SwitchGamepadReport report;
  report.press(SwitchButton::A);
  report.set_hat(SwitchHat::Left);
  ASEL_EXPECT_FALSE(gamepad.write_report(report));

  ASEL_ASSERT_TRUE(hw->post_event(ResumeEvent{}));
  ASEL_EXPECT_TRUE(usb.process_events());
  ASEL_EXPECT_TRUE(usb.manager()->is_configured());

  const std::array<uint8_t, 8> expected = {
      {0x04, 0x00, 0x06, 0x00, 0x80, 0x80, 0x80, 0x80}};
  ASEL_ASSERT_TRUE(hw->in_eps[1].xfer_in_progress);
  ASEL_EXPECT_EQ(expected, hw->in_eps[1].cur_xfer_buf());
  hw->complete_in_xfer(1);
  ASEL_EXPECT_FALSE(hw->in_eps[1].xfer_in_progress);
}

ASEL_TEST(SwitchGamepad, idle_resend) {
  GamepadUsbDevice usb;
  ASEL_ASSERT_TRUE(attach_mock_device(usb));
  auto *const hw = usb.hw();
  auto &gamepad = usb.dev().gamepad();

  hw->complete_in_xfer(1);
  ASEL_EXPECT_FALSE(hw->in_eps[1].xfer_in_progress);

  // Once the idle period expires the current report is sent again
  gamepad.poll(asel::chrono::steady_clock::now() + std::chrono::seconds(1));
  ASEL_ASSERT_TRUE(hw->in_eps[1].xfer_in_progress);
  ASEL_EXPECT_EQ(kNeutralReport, hw->in_eps[1].cur_xfer_buf());

  // With an idle rate of 0 reports are only sent when they change
  hw->complete_in_xfer(1);
  ASEL_EXPECT_TRUE(mock_ctrl_out(
      hw,
      make_setup(0x21, static_cast<uint8_t>(HidRequest::SetIdle), 0, 0, 0)));
  gamepad.poll(asel::chrono::steady_clock::now() + std::chrono::seconds(10));
  ASEL_EXPECT_FALSE(hw->in_eps[1].xfer_in_progress);
}

ASEL_TEST(SwitchGamepad, output_reports) {
  GamepadUsbDevice usb;
  ASEL_ASSERT_TRUE(attach_mock_device(usb));
  auto &gamepad = usb.dev().gamepad();
  RecordingCallback callback;
  gamepad.set_callback(&callback);

  const std::array<uint8_t, 3> short_report = {{0xaa, 0xbb, 0xcc}};
  ASEL_EXPECT_TRUE(mock_ctrl_out(
      usb.hw(),
      make_setup(0x21,
                 static_cast<uint8_t>(HidRequest::SetReport),
                 0x0200, // Output report, ID 0
                 0,
                 short_report.size()),
      asel::buf_view(short_report.data(), short_report.size())));

  ASEL_ASSERT_TRUE(callback.reports.size() == 1);
  ASEL_EXPECT_EQ(view(callback.reports[0]), short_report);
  const std::array<uint8_t, 8> expected = {
      {0xaa, 0xbb, 0xcc, 0x00, 0x00, 0x00, 0x00, 0x00}};
  ASEL_EXPECT_EQ(expected, gamepad.last_output_report());

  // Reports are not delivered for rejected requests
  ASEL_EXPECT_FALSE(gamepad.set_report(
      HidReportType::Output,
      1,
      asel::buf_view(short_report.data(), short_report.size())));
  ASEL_EXPECT_EQ(callback.reports.size(), 1);
  ASEL_EXPECT_EQ(gamepad.num_output_reports(), 1);
}

ASEL_TEST(SwitchGamepad, bus_reset) {
  GamepadUsbDevice usb;
  ASEL_ASSERT_TRUE(attach_mock_device(usb));
  auto &gamepad = usb.dev().gamepad();
  const auto resets = usb.dev().num_resets();

  SwitchGamepadReport report;
  report.press(SwitchButton::Home);
  ASEL_EXPECT_FALSE(gamepad.write_report(report));

  usb.manager()->on_bus_reset();
  ASEL_EXPECT_EQ(usb.dev().num_resets(), resets + 1);
  ASEL_EXPECT_FALSE(usb.manager()->is_configured());
  ASEL_EXPECT_TRUE(gamepad.write_report(report) ==
                   make_error_code(Error::NotConfigured));

  // Reports queued before the reset are discarded, and the device starts
  // over from the neutral report once configured again.
  ASEL_ASSERT_TRUE(attach_mock_device(usb));
  ASEL_ASSERT_TRUE(usb.hw()->in_eps[1].xfer_in_progress);
  ASEL_EXPECT_EQ(kNeutralReport, usb.hw()->in_eps[1].cur_xfer_buf());
  usb.hw()->complete_in_xfer(1);
  ASEL_EXPECT_FALSE(usb.hw()->in_eps[1].xfer_in_progress);
}

} // namespace usbpad::test
