// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/usbpad_types.h"

#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>

namespace usbpad {
struct SetupPacket;
}

namespace usbpad::device {

class EndpointManager;
class ControlMessageHandler;
class CtrlInXfer;
class CtrlOutXfer;

/**
 * The implementation of a Message Pipe.
 *
 * Message pipes are defined by section 5.3.2.2 of the USB 2.0 spec.
 *
 * This class keeps track of the state of the current control transfer, and
 * invokes the message handler on receipt of SETUP, IN, or OUT packets on the
 * pipe.  A ControlMessageHandler is informed of each new SETUP message, and
 * returns a CtrlInXfer or CtrlOutXfer object that carries out that single
 * transfer.
 *
 * Control transfers basically act like RPC calls from the host to the device.
 * A message pipe can only have a single transfer in progress at a time.
 *
 * In practice message pipes are almost always used solely for endpoint 0
 * (the "Default Control Pipe").
 */
class MessagePipe {
public:
  /**
   * The current transfer state of the pipe.
   */
  enum class Status : uint8_t {
    // No control transfer in progress
    Idle,
    // We have received a SETUP packet for an OUT transfer, and are currently
    // processing that transfer.
    OutXfer,
    // We have completed processing an OUT transfer are sending the final
    // 0-length IN transaction to acknowledge the transfer.
    OutAck,
    // We have received a SETUP packet for an IN transfer,
    // but have not yet prepared IN data to send to the host.
    InSetupReceived,
    // We are sending IN data, and more data remains to be sent after the
    // current write.
    InSendPartial,
    // We are sending the last portion of IN data.
    InSendFinal,
    // We have sent all data for an IN transfer, and are waiting for the host
    // to acknowledge the transfer.
    InStatus,
  };

  constexpr MessagePipe(EndpointManager *mgr,
                        uint8_t endpoint_num,
                        ControlMessageHandler *handler) noexcept
      : manager_(mgr), handler_(handler), endpoint_num_(endpoint_num) {}
  ~MessagePipe();

  EndpointManager *manager() const {
    return manager_;
  }
  ControlMessageHandler *handler() const {
    return handler_;
  }
  uint8_t endpoint_num() const {
    return endpoint_num_;
  }
  Status status() const {
    return status_;
  }

  ////////////////////////////////////////////////////////////////////
  // Methods to be invoked by EndpointManager to inform us of events
  ////////////////////////////////////////////////////////////////////

  /**
   * on_unconfigured() will be invoked when the pipe is reset.
   *
   * The most common cause for this is a bus reset, or if the USB device state
   * is reset locally.  Any in-progress transfer is failed with the given
   * reason.
   */
  void on_unconfigured(XferFailReason reason);

  void on_setup_received(const SetupPacket &packet);

  void on_in_xfer_complete();
  void on_in_xfer_failed(XferFailReason reason);

  void on_out_xfer_complete(uint32_t bytes_read);
  void on_out_xfer_failed(XferFailReason reason);

  ////////////////////////////////////////////////////////////////////
  // Methods to be invoked by the current CtrlInXfer or CtrlOutXfer
  ////////////////////////////////////////////////////////////////////

  /**
   * Begin receiving data for the current control OUT transfer.
   */
  void start_out_read(void *data, size_t size);

  /**
   * Acknowledge an OUT transfer as successful.
   *
   * This should be invoked after the transfer has read and processed all of
   * its data.
   */
  void ack_out_xfer();

  /**
   * Fail an OUT transfer by returning a STALL error to the host.
   *
   * Note that this method immediately destroys the CtrlOutXfer.
   */
  void fail_out_xfer();

  /**
   * Send data for the current control IN transfer.
   *
   * is_final should be false if there is more data to send after this, in
   * which case size must be an exact multiple of the endpoint maximum packet
   * size, and CtrlInXfer::partial_write_complete() is invoked once the write
   * finishes.  If is_final is true then xfer_acked() is invoked instead once
   * the host acknowledges the data.
   */
  void start_in_write(const void *data, size_t size, bool is_final = true);

  /**
   * Fail an IN transfer by returning a STALL error to the host.
   *
   * Note that this method immediately destroys the CtrlInXfer.
   */
  void fail_in_xfer();

  template <typename Handler, typename... Args>
  std::enable_if_t<std::is_base_of_v<CtrlInXfer, Handler>, Handler *>
  new_in_handler(Args &&...args) {
    // TODO: give each MessagePipe a fixed storage area for the current
    // transfer handler, rather than doing a heap allocation here.
    return new Handler(std::forward<Args>(args)...);
  }
  template <typename Handler, typename... Args>
  std::enable_if_t<std::is_base_of_v<CtrlOutXfer, Handler>, Handler *>
  new_out_handler(Args &&...args) {
    return new Handler(std::forward<Args>(args)...);
  }

private:
  MessagePipe(MessagePipe const &) = delete;
  MessagePipe &operator=(MessagePipe const &) = delete;

  // Invoke xfer_failed() on the current transfer, and set the pipe to return
  // a STALL error to the host.
  void fail_current_xfer(XferFailReason reason);
  // Invoke xfer_failed() on the current transfer and destroy it, leaving the
  // pipe Idle.  (Does not STALL.)
  void invoke_xfer_failed(XferFailReason reason);
  // Destroy the current CtrlInXfer object, and reset the state to Idle
  void destroy_in_xfer();
  // Destroy the current CtrlOutXfer object, and reset the state to Idle
  void destroy_out_xfer();

  bool in_status() const {
    return status_ == Status::InSetupReceived ||
           status_ == Status::InSendPartial ||
           status_ == Status::InSendFinal || status_ == Status::InStatus;
  }

  EndpointManager *const manager_ = nullptr;
  ControlMessageHandler *const handler_ = nullptr;

  // A message pipe uses both the IN and OUT endpoints with this number.
  uint8_t const endpoint_num_ = 0;

  Status status_ = Status::Idle;

  union CurrentXfer {
    constexpr CurrentXfer() : idle(nullptr) {}

    // Idle is set when status_ is Idle
    void *idle;
    // out is set during OUT transfers (status is Out*)
    CtrlOutXfer *out;
    // in is set during IN transfers (status is In*)
    CtrlInXfer *in;
  } xfer_;
};

} // namespace usbpad::device
