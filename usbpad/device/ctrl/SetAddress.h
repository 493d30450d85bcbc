// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/device/CtrlOutXfer.h"

namespace usbpad::device {

/**
 * Handles a SET_ADDRESS request.
 *
 * The new address only takes effect once the status phase of the request has
 * completed, since the host expects the acknowledgement from the old address.
 */
class SetAddress : public CtrlOutXfer {
public:
  using CtrlOutXfer::CtrlOutXfer;

  void start(const SetupPacket &packet) override;
  void out_data_received(uint32_t bytes_received) override;
  void xfer_failed(XferFailReason reason) override;
  void ack_complete() override;

private:
  uint8_t address_ = 0;
};

} // namespace usbpad::device
