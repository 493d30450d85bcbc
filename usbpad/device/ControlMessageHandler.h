// Copyright (c) 2023, Adam Simpkins
#pragma once

namespace usbpad {
struct SetupPacket;
}

namespace usbpad::device {

class MessagePipe;
class CtrlInXfer;
class CtrlOutXfer;

/**
 * Something that SETUP requests can be addressed to: the device itself,
 * one of its interfaces, or one of its endpoints.
 *
 * When a request arrives on a message pipe, the handler for its recipient
 * creates the transfer object with pipe->new_in_handler() or
 * pipe->new_out_handler().  Returning nullptr rejects the request, and the
 * pipe answers it with a STALL.  The defaults reject everything.
 */
class ControlMessageHandler {
public:
  constexpr ControlMessageHandler() noexcept = default;
  virtual ~ControlMessageHandler() noexcept = default;

  virtual CtrlOutXfer *process_out_setup(MessagePipe *pipe,
                                         const SetupPacket &packet) {
    return nullptr;
  }
  virtual CtrlInXfer *process_in_setup(MessagePipe *pipe,
                                       const SetupPacket &packet) {
    return nullptr;
  }

private:
  ControlMessageHandler(ControlMessageHandler const &) = delete;
  ControlMessageHandler &operator=(ControlMessageHandler const &) = delete;
};

} // namespace usbpad::device
