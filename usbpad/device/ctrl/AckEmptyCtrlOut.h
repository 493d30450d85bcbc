// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/device/CtrlOutXfer.h"

namespace usbpad::device {

/**
 * Acknowledges an OUT request that carries no data.
 *
 * This is used for requests like SET_CONFIGURATION and SET_FEATURE, where all
 * of the work is done while processing the SETUP packet.  Requests with a
 * non-zero wLength are failed.
 */
class AckEmptyCtrlOut : public CtrlOutXfer {
public:
  using CtrlOutXfer::CtrlOutXfer;

  void start(const SetupPacket &packet) override;
  void out_data_received(uint32_t bytes_received) override;
  void xfer_failed(XferFailReason reason) override;
};

} // namespace usbpad::device
