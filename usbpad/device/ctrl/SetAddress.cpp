// Copyright (c) 2023, Adam Simpkins
#include "usbpad/device/ctrl/SetAddress.h"

#include "usbpad/SetupPacket.h"
#include "usbpad/device/EndpointManager.h"
#include "usbpad/device/MessagePipe.h"
#include "usbpad/log.h"

namespace usbpad::device {

void SetAddress::start(const SetupPacket &packet) {
  if (packet.length > 0 || packet.value > 127) {
    USBPAD_LOGW("invalid SET_ADDRESS request: value=%u length=%u",
                packet.value,
                packet.length);
    error();
    return;
  }
  address_ = static_cast<uint8_t>(packet.value);
  USBPAD_LOGI("SET_ADDRESS: %u", address_);

  // Some hardware needs to know about the new address before the status
  // phase is sent.
  pipe()->manager()->set_address_early(address_);
  ack();
}

void SetAddress::out_data_received(uint32_t bytes_received) {
  // We never call start_read(), so we don't expect to ever receive data
  USBPAD_LOGE("unexpected OUT data received for SET_ADDRESS");
}

void SetAddress::xfer_failed(XferFailReason reason) {
  USBPAD_LOGW("SET_ADDRESS failed: reason=%d", static_cast<int>(reason));
}

void SetAddress::ack_complete() {
  pipe()->manager()->set_address(address_);
}

} // namespace usbpad::device
