// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/SetupPacket.h"
#include "usbpad/UsbDevice.h"

#include <asel/buf_view.h>

#include <cstdint>
#include <vector>

namespace usbpad {
class MockDevice;
}

namespace usbpad::test {

/**
 * Drive a MockDevice through steps as if it were attached to a bus and
 * configured by a host.
 *
 * This is mainly intended as a convenience function that unit tests can use
 * to get the device into a normal state so they can begin functionality
 * testing.
 *
 * This walks through the steps that a host would do to set the address and the
 * configuration.  If anything goes wrong during this process
 * ASEL_ADD_FAILURE() is called to mark the current test as a failure, and
 * false is returned.  True is returned on success.
 */
bool attach_mock_device(MockDevice *hw, device::EndpointManager *ep_manager);
template <typename UsbDeviceImpl, typename HwDeviceType>
bool attach_mock_device(device::UsbDevice<UsbDeviceImpl, HwDeviceType> &usb) {
  return attach_mock_device(usb.hw(), usb.manager());
}

/**
 * Like attach_mock_device(), but stop once the device is in the Address
 * state, without sending SET_CONFIGURATION.
 */
bool enumerate_mock_device(MockDevice *hw,
                           device::EndpointManager *ep_manager,
                           uint8_t address = 12);
template <typename UsbDeviceImpl, typename HwDeviceType>
bool enumerate_mock_device(
    device::UsbDevice<UsbDeviceImpl, HwDeviceType> &usb) {
  return enumerate_mock_device(usb.hw(), usb.manager());
}

bool mock_send_set_config(MockDevice *hw, uint8_t config_id);
template <typename UsbDeviceImpl, typename HwDeviceType>
bool mock_send_set_config(device::UsbDevice<UsbDeviceImpl, HwDeviceType> &usb,
                          uint8_t config_id) {
  return mock_send_set_config(usb.hw(), config_id);
}
bool mock_send_get_config(MockDevice *hw, uint8_t &config_id);
template <typename UsbDeviceImpl, typename HwDeviceType>
bool mock_send_get_config(device::UsbDevice<UsbDeviceImpl, HwDeviceType> &usb,
                          uint8_t &config_id) {
  return mock_send_get_config(usb.hw(), config_id);
}

inline asel::buf_view view(const std::vector<uint8_t> &buf) {
  return asel::buf_view(buf.data(), buf.size());
}

constexpr SetupPacket make_setup(uint8_t request_type,
                                 uint8_t request,
                                 uint16_t value,
                                 uint16_t index,
                                 uint16_t length) {
  return SetupPacket::make(request_type, request, value, index, length);
}

/**
 * Perform a complete control IN transfer, including the status stage.
 *
 * The data sent by the device is stored in reply.  Returns false, and marks
 * the current test as failed, if the device does not respond normally.
 */
bool mock_ctrl_in(MockDevice *hw,
                  const SetupPacket &packet,
                  std::vector<uint8_t> &reply);

/**
 * Perform a complete control OUT transfer, sending data in the data stage.
 *
 * Returns false, and marks the current test as failed, if the device does not
 * accept the request.
 */
bool mock_ctrl_out(MockDevice *hw,
                   const SetupPacket &packet,
                   asel::buf_view data = asel::buf_view());

/**
 * Send a control request that is expected to be rejected with a STALL.
 *
 * Returns true if the device stalled the request.  For OUT requests with a
 * data stage, data is supplied to the device before checking for the STALL.
 */
bool mock_ctrl_expect_stall(MockDevice *hw,
                            const SetupPacket &packet,
                            asel::buf_view data = asel::buf_view());

} // namespace usbpad::test
