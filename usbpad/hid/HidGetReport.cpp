// Copyright (c) 2023, Adam Simpkins
#include "usbpad/hid/HidGetReport.h"

#include "usbpad/SetupPacket.h"
#include "usbpad/log.h"

#include <algorithm>
#include <cstring>

namespace usbpad::hid {

HidGetReport::HidGetReport(device::MessagePipe *pipe, asel::buf_view report)
    : CtrlInXfer(pipe),
      size_(static_cast<uint16_t>(std::min(report.size(), data_.size()))) {
  memcpy(data_.data(), report.data(), size_);
}

void HidGetReport::start(const SetupPacket &packet) {
  send_full(data_.data(), std::min(packet.length, size_));
}

void HidGetReport::xfer_failed(XferFailReason reason) {
  USBPAD_LOGW("HID GET_REPORT xfer failed: reason=%d",
              static_cast<int>(reason));
}

} // namespace usbpad::hid
