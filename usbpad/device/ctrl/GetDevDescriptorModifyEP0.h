// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/desc/DeviceDescriptor.h"
#include "usbpad/device/CtrlInXfer.h"

#include <asel/buf_view.h>

namespace usbpad::device {

/**
 * A handler for GET_DESCRIPTOR that returns a copy of the device descriptor
 * with bMaxPacketSize0 replaced by the negotiated endpoint 0 packet size.
 *
 * This is only needed when the negotiated size differs from the one in the
 * read-only descriptor, which should be rare (e.g., on a low speed bus).
 */
class GetDevDescriptorModifyEP0 : public CtrlInXfer {
public:
  GetDevDescriptorModifyEP0(MessagePipe *pipe,
                            asel::buf_view buf,
                            uint8_t correct_ep0_mps);

  void start(const SetupPacket &packet) override;
  void xfer_acked() override;
  void xfer_failed(XferFailReason reason) override;

private:
  DeviceDescriptor desc_;
};

} // namespace usbpad::device
