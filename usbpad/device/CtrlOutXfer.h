// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/device/CtrlXfer.h"

#include <cstddef>
#include <cstdint>

namespace usbpad::device {

/**
 * A control OUT transfer: the host sends a request, possibly with a data
 * stage, and the device accepts it with ack() or rejects it with error().
 *
 * If the request is processed on another task, the result must be posted
 * back to the USB task before calling ack() or error().
 */
class CtrlOutXfer : public CtrlXfer {
public:
  explicit CtrlOutXfer(MessagePipe *pipe) : CtrlXfer(pipe) {}

  /**
   * Receive up to size bytes of the data stage.
   *
   * Reads may be split into several calls if every read but the last is a
   * multiple of the endpoint 0 max packet size.  out_data_received() is
   * called when each read finishes.
   */
  void start_read(void *data, uint32_t size);

  /**
   * Accept the request.  All data must have been read first.
   */
  void ack();

  /**
   * Reject the request with a STALL.
   *
   * This destroys the object before returning.
   */
  void error();

  /**
   * bytes_received is less than the requested size if the host ended the
   * data stage with a short packet.
   */
  virtual void out_data_received(uint32_t bytes_received) = 0;

  /**
   * The status stage sent by ack() has finished.  xfer_failed() may still be
   * called instead if the host does not accept the status stage.
   */
  virtual void ack_complete() {}
};

} // namespace usbpad::device
