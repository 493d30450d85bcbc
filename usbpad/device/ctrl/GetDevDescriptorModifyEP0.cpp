// Copyright (c) 2023, Adam Simpkins
#include "usbpad/device/ctrl/GetDevDescriptorModifyEP0.h"

#include "usbpad/SetupPacket.h"
#include "usbpad/log.h"

#include <algorithm>
#include <cstring>

namespace usbpad::device {

GetDevDescriptorModifyEP0::GetDevDescriptorModifyEP0(MessagePipe *pipe,
                                                     asel::buf_view buf,
                                                     uint8_t correct_ep0_mps)
    : CtrlInXfer(pipe) {
  // buf has already been validated by DeviceDescriptorParser
  memcpy(desc_.data().data(),
         buf.data(),
         std::min(buf.size(), desc_.data().size()));
  desc_.set_ep0_max_pkt_size(correct_ep0_mps);
}

void GetDevDescriptorModifyEP0::start(const SetupPacket &packet) {
  const auto &data = desc_.data();
  send_full(data.data(),
            std::min(static_cast<size_t>(packet.length), data.size()));
}

void GetDevDescriptorModifyEP0::xfer_acked() {
  USBPAD_LOGV("GET_DESCRIPTOR for modified device descriptor acked");
}

void GetDevDescriptorModifyEP0::xfer_failed(XferFailReason reason) {
  USBPAD_LOGW("GET_DESCRIPTOR modified EP0 MPS xfer failed: reason=%d",
              static_cast<int>(reason));
}

} // namespace usbpad::device
