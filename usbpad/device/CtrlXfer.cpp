// Copyright (c) 2023, Adam Simpkins
#include "usbpad/device/CtrlXfer.h"

#include "usbpad/device/CtrlInXfer.h"
#include "usbpad/device/CtrlOutXfer.h"
#include "usbpad/device/MessagePipe.h"
#include "usbpad/log.h"

namespace usbpad::device {

MessagePipe *CtrlXfer::live_pipe(const char *operation) const {
  if (!pipe_) {
    USBPAD_LOGD("ignoring %s on a cancelled control transfer", operation);
  }
  return pipe_;
}

void CtrlInXfer::send_partial(const void *data, size_t size) {
  if (auto *pipe = live_pipe("send_partial")) {
    pipe->start_in_write(data, size, /*is_final=*/false);
  }
}

void CtrlInXfer::send_final(const void *data, size_t size) {
  if (auto *pipe = live_pipe("send_final")) {
    pipe->start_in_write(data, size, /*is_final=*/true);
  }
}

void CtrlInXfer::error() {
  if (auto *pipe = live_pipe("IN error")) {
    pipe->fail_in_xfer();
  }
}

void CtrlOutXfer::start_read(void *data, uint32_t size) {
  if (auto *pipe = live_pipe("start_read")) {
    pipe->start_out_read(data, size);
  }
}

void CtrlOutXfer::ack() {
  if (auto *pipe = live_pipe("ack")) {
    pipe->ack_out_xfer();
  }
}

void CtrlOutXfer::error() {
  if (auto *pipe = live_pipe("OUT error")) {
    pipe->fail_out_xfer();
  }
}

} // namespace usbpad::device
