// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/usbpad_types.h"

namespace usbpad {

struct SetupPacket;

namespace device {

class MessagePipe;

/**
 * State shared by control IN and OUT transfers.
 *
 * A transfer object is created by a ControlMessageHandler when a SETUP packet
 * arrives, and is owned by its MessagePipe until the transfer finishes.
 * Transfer objects must only be used from the main USB task.
 */
class CtrlXfer {
public:
  virtual ~CtrlXfer() = default;

  /**
   * The pipe carrying this transfer.
   *
   * This is null once the transfer has been cancelled.
   */
  MessagePipe *pipe() const {
    return pipe_;
  }

  /**
   * Called immediately after the transfer object has been created.
   */
  virtual void start(const SetupPacket &packet) = 0;

  /**
   * Called if the transfer fails for any reason other than the transfer
   * itself calling error().  The object is destroyed as soon as this returns.
   */
  virtual void xfer_failed(XferFailReason reason) = 0;

protected:
  explicit CtrlXfer(MessagePipe *pipe) : pipe_(pipe) {}

  // Returns the pipe, or logs and returns null if the transfer was cancelled
  // before the named operation was attempted.
  MessagePipe *live_pipe(const char *operation) const;

private:
  CtrlXfer(CtrlXfer const &) = delete;
  CtrlXfer &operator=(CtrlXfer const &) = delete;

  friend class MessagePipe;
  void invoke_xfer_failed(XferFailReason reason) {
    pipe_ = nullptr;
    xfer_failed(reason);
  }

  MessagePipe *pipe_ = nullptr;
};

} // namespace device
} // namespace usbpad
