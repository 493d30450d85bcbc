// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/device/CtrlOutXfer.h"
#include "usbpad/hid/types.h"

#include <cstdint>

namespace usbpad::hid {

class HidInterface;

/**
 * Receives the data for a SET_REPORT request and passes it to the
 * HidInterface.
 *
 * The data is read into a buffer owned by the interface: only one control
 * transfer can be in progress at a time.
 */
class HidSetReport : public device::CtrlOutXfer {
public:
  HidSetReport(device::MessagePipe *pipe,
               HidInterface *intf,
               uint8_t *buf,
               size_t buf_size)
      : CtrlOutXfer(pipe), intf_(intf), buf_(buf), buf_size_(buf_size) {}

  void start(const SetupPacket &packet) override;
  void out_data_received(uint32_t bytes_received) override;
  void xfer_failed(XferFailReason reason) override;

private:
  HidInterface *const intf_ = nullptr;
  uint8_t *const buf_ = nullptr;
  size_t const buf_size_ = 0;
  HidReportType report_type_ = HidReportType::Output;
  uint8_t report_id_ = 0;
};

} // namespace usbpad::hid
