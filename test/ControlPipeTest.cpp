// Copyright (c) 2023, Adam Simpkins
#include "usbpad/device/MessagePipe.h"

#include "usbpad/DeviceEvent.h"
#include "usbpad/UsbDevice.h"
#include "usbpad/hw/mock/MockDevice.h"
#include "test/lib/GamepadTestDevice.h"
#include "test/lib/mock_utils.h"

#include <asel/test/TestCase.h>
#include <asel/test/checks.h>

using namespace usbpad::device;

namespace usbpad::test {

namespace {

using GamepadUsbDevice = UsbDevice<GamepadTestDevice, MockDevice>;

constexpr SetupPacket get_device_descriptor(uint16_t length) {
  return make_setup(0x80, // IN, Device, Standard request
                    static_cast<uint8_t>(StdRequestType::GetDescriptor),
                    desc_setup_value(DescriptorType::Device),
                    0,
                    length);
}

bool ep0_stalled(MockDevice *hw) {
  return hw->in_eps[0].stalled && hw->out_eps[0].stalled;
}

} // namespace

ASEL_TEST(ControlPipe, setup_during_transfer) {
  GamepadUsbDevice usb;
  ASEL_ASSERT_TRUE(enumerate_mock_device(usb));
  auto *const hw = usb.hw();

  hw->setup_received(get_device_descriptor(18));
  ASEL_ASSERT_TRUE(hw->in_eps[0].xfer_in_progress);
  ASEL_EXPECT_EQ(hw->in_eps[0].cur_xfer_size, 18);

  // A second SETUP before the first transfer finishes aborts the transfer
  hw->setup_received(get_device_descriptor(18));
  ASEL_EXPECT_TRUE(ep0_stalled(hw));

  // The next request starts over from a clean state
  std::vector<uint8_t> reply;
  ASEL_ASSERT_TRUE(mock_ctrl_in(hw, get_device_descriptor(18), reply));
  ASEL_EXPECT_EQ(reply.size(), 18);
}

ASEL_TEST(ControlPipe, setup_during_status_stage) {
  GamepadUsbDevice usb;
  ASEL_ASSERT_TRUE(enumerate_mock_device(usb));
  auto *const hw = usb.hw();

  hw->setup_received(get_device_descriptor(18));
  hw->complete_in_xfer(0);
  ASEL_ASSERT_TRUE(hw->out_eps[0].xfer_in_progress);

  hw->setup_received(get_device_descriptor(18));
  ASEL_EXPECT_TRUE(ep0_stalled(hw));
}

ASEL_TEST(ControlPipe, in_xfer_failed) {
  GamepadUsbDevice usb;
  ASEL_ASSERT_TRUE(enumerate_mock_device(usb));
  auto *const hw = usb.hw();

  hw->setup_received(get_device_descriptor(18));
  ASEL_ASSERT_TRUE(hw->post_event(
      InXferFailedEvent(0, XferFailReason::Timeout)));
  ASEL_EXPECT_TRUE(hw->process_events());
  ASEL_EXPECT_TRUE(ep0_stalled(hw));

  std::vector<uint8_t> reply;
  ASEL_EXPECT_TRUE(mock_ctrl_in(hw, get_device_descriptor(8), reply));
}

ASEL_TEST(ControlPipe, unexpected_completion) {
  GamepadUsbDevice usb;
  ASEL_ASSERT_TRUE(enumerate_mock_device(usb));
  auto *const hw = usb.hw();

  // Completion events while idle are reported as errors and stall the pipe
  ASEL_ASSERT_TRUE(hw->post_event(InXferCompleteEvent(0)));
  ASEL_EXPECT_TRUE(hw->process_events());
  ASEL_EXPECT_TRUE(ep0_stalled(hw));

  ASEL_ASSERT_TRUE(hw->post_event(OutXferCompleteEvent(0, 0)));
  ASEL_EXPECT_TRUE(hw->process_events());
  ASEL_EXPECT_TRUE(ep0_stalled(hw));

  // Data arriving for an OUT transfer that was never started
  hw->setup_received(get_device_descriptor(18));
  ASEL_ASSERT_TRUE(hw->post_event(OutXferCompleteEvent(0, 4)));
  ASEL_EXPECT_TRUE(hw->process_events());
  ASEL_EXPECT_TRUE(ep0_stalled(hw));

  std::vector<uint8_t> reply;
  ASEL_EXPECT_TRUE(mock_ctrl_in(hw, get_device_descriptor(18), reply));
}

ASEL_TEST(ControlPipe, bus_reset_aborts_transfer) {
  GamepadUsbDevice usb;
  ASEL_ASSERT_TRUE(attach_mock_device(usb));
  auto *const hw = usb.hw();

  hw->setup_received(get_device_descriptor(18));
  ASEL_ASSERT_TRUE(hw->in_eps[0].xfer_in_progress);
  usb.manager()->on_bus_reset();
  usb.manager()->on_enum_done(UsbSpeed::Full);

  // The aborted transfer does not interfere with the next request
  std::vector<uint8_t> reply;
  ASEL_EXPECT_TRUE(mock_ctrl_in(hw, get_device_descriptor(18), reply));
  ASEL_EXPECT_TRUE(usb.manager()->state() == DeviceState::Default);
}

} // namespace usbpad::test
