// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/device/CtrlInXfer.h"
#include "usbpad/device/CtrlOutXfer.h"
#include "usbpad/log.h"

namespace usbpad::device {

/*
 * Transfer handlers that simply fail the request with a STALL error.
 *
 * Returning a null handler from process_in_setup() or process_out_setup()
 * would also stall the request, but additionally logs an error about the
 * request being unhandled.  These make it clear that the request is being
 * rejected on purpose.
 */

class StallCtrlIn : public CtrlInXfer {
public:
  using CtrlInXfer::CtrlInXfer;

  void start(const SetupPacket &packet) override {
    error();
  }
  void xfer_acked() override {
    USBPAD_LOGE("xfer_acked() called for StallCtrlIn");
  }
  void xfer_failed(XferFailReason reason) override {}
};

class StallCtrlOut : public CtrlOutXfer {
public:
  using CtrlOutXfer::CtrlOutXfer;

  void start(const SetupPacket &packet) override {
    error();
  }
  void out_data_received(uint32_t bytes_received) override {
    USBPAD_LOGE("out_data_received() called for StallCtrlOut");
  }
  void xfer_failed(XferFailReason reason) override {}
};

} // namespace usbpad::device
