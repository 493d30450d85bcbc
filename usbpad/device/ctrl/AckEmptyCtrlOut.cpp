// Copyright (c) 2023, Adam Simpkins
#include "usbpad/device/ctrl/AckEmptyCtrlOut.h"

#include "usbpad/SetupPacket.h"
#include "usbpad/log.h"

#include <cinttypes>

namespace usbpad::device {

void AckEmptyCtrlOut::start(const SetupPacket &packet) {
  if (packet.length != 0) {
    USBPAD_LOGE("received OUT SETUP packet with unexpected non-zero length "
                "%" PRIu16 " request_type=%#" PRIx8 " request=%#" PRIx8,
                packet.length,
                packet.request_type,
                packet.request);
    error();
    return;
  }
  ack();
}

void AckEmptyCtrlOut::out_data_received(uint32_t bytes_received) {
  // We never call start_read(), so we don't expect to ever receive data
  USBPAD_LOGE("unexpected OUT data received for empty control transfer");
}

void AckEmptyCtrlOut::xfer_failed(XferFailReason reason) {
  USBPAD_LOGD("empty control OUT transfer failed: reason=%d",
              static_cast<int>(reason));
}

} // namespace usbpad::device
