// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/device/CtrlInXfer.h"

#include <asel/buf_view.h>

namespace usbpad::device {

/**
 * Responds to GET_DESCRIPTOR with a descriptor that remains valid for the
 * lifetime of the device (typically one stored in a StaticDescriptorMap).
 */
class GetStaticDescriptor : public CtrlInXfer {
public:
  GetStaticDescriptor(MessagePipe *pipe, asel::buf_view desc)
      : CtrlInXfer(pipe), desc_(desc) {}

  void start(const SetupPacket &packet) override;
  void xfer_acked() override;
  void xfer_failed(XferFailReason reason) override;

private:
  asel::buf_view desc_;
};

} // namespace usbpad::device
