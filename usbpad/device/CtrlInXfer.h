// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/device/CtrlXfer.h"

#include <cstddef>
#include <cstdint>

namespace usbpad::device {

/**
 * A control IN transfer: the device answers a SETUP packet with data.
 *
 * The implementation sends its reply from start(), or later from the USB
 * task if the data is not ready yet.  Replies longer than one buffer can be
 * sent in pieces with send_partial().
 */
class CtrlInXfer : public CtrlXfer {
public:
  explicit CtrlInXfer(MessagePipe *pipe) : CtrlXfer(pipe) {}

  /**
   * Send the complete reply.
   *
   * The data must stay valid until xfer_acked() or xfer_failed() is called.
   */
  void send_full(const void *data, size_t size) {
    send_final(data, size);
  }

  /**
   * Send part of the reply.
   *
   * size must be a multiple of the pipe's max packet size.  Nothing else may
   * be sent until partial_write_complete() is called, and the data must stay
   * valid until then.
   */
  void send_partial(const void *data, size_t size);

  /**
   * Send the last piece of the reply.
   */
  void send_final(const void *data, size_t size);

  /**
   * Reject the request with a STALL.
   *
   * This destroys the object before returning.
   */
  void error();

  /**
   * The host has acknowledged the reply.  The object is destroyed next.
   */
  virtual void xfer_acked() {}

  virtual void partial_write_complete() {}
};

} // namespace usbpad::device
