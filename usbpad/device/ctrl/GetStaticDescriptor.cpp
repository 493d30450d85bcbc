// Copyright (c) 2023, Adam Simpkins
#include "usbpad/device/ctrl/GetStaticDescriptor.h"

#include "usbpad/SetupPacket.h"
#include "usbpad/log.h"

#include <algorithm>

namespace usbpad::device {

void GetStaticDescriptor::start(const SetupPacket &packet) {
  // Hosts commonly ask for only a prefix of a descriptor: e.g., the 9-byte
  // config descriptor header first, to learn wTotalLength.
  send_full(desc_.data(),
            std::min(static_cast<size_t>(packet.length), desc_.size()));
}

void GetStaticDescriptor::xfer_acked() {
  USBPAD_LOGV("GET_DESCRIPTOR xfer acked");
}

void GetStaticDescriptor::xfer_failed(XferFailReason reason) {
  USBPAD_LOGW("GET_DESCRIPTOR xfer failed: reason=%d", static_cast<int>(reason));
}

} // namespace usbpad::device
