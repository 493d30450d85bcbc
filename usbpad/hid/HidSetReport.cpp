// Copyright (c) 2023, Adam Simpkins
#include "usbpad/hid/HidSetReport.h"

#include "usbpad/SetupPacket.h"
#include "usbpad/hid/HidInterface.h"
#include "usbpad/log.h"

#include <asel/buf_view.h>

namespace usbpad::hid {

void HidSetReport::start(const SetupPacket &packet) {
  report_type_ = static_cast<HidReportType>(packet.value_high());
  report_id_ = packet.value_low();
  if (packet.length > buf_size_) {
    USBPAD_LOGW("HID SET_REPORT too large: %u bytes", packet.length);
    error();
    return;
  }
  if (packet.length == 0) {
    out_data_received(0);
    return;
  }
  start_read(buf_, packet.length);
}

void HidSetReport::out_data_received(uint32_t bytes_received) {
  if (intf_->set_report(
          report_type_, report_id_, asel::buf_view(buf_, bytes_received))) {
    USBPAD_LOGV("HID SET_REPORT succeeded");
    ack();
  } else {
    USBPAD_LOGW("HID SET_REPORT rejected: type=%u id=%u",
                static_cast<unsigned>(report_type_),
                report_id_);
    error();
  }
}

void HidSetReport::xfer_failed(XferFailReason reason) {
  USBPAD_LOGW("HID SET_REPORT xfer failed: reason=%d",
              static_cast<int>(reason));
}

} // namespace usbpad::hid
