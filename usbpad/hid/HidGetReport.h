// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/device/CtrlInXfer.h"

#include <asel/array.h>
#include <asel/buf_view.h>

#include <cstdint>

namespace usbpad::hid {

/**
 * Responds to a GET_REPORT request.
 *
 * A copy of the report is taken when the request arrives, so the response is
 * not affected by reports queued while the transfer is in progress.
 */
class HidGetReport : public device::CtrlInXfer {
public:
  static constexpr size_t kMaxReportSize = 64;

  HidGetReport(device::MessagePipe *pipe, asel::buf_view report);

  void start(const SetupPacket &packet) override;
  void xfer_failed(XferFailReason reason) override;

private:
  asel::array<uint8_t, kMaxReportSize> data_;
  uint16_t size_ = 0;
};

} // namespace usbpad::hid
