// Copyright (c) 2023, Adam Simpkins
#include "usbpad/device/MessagePipe.h"

#include "usbpad/SetupPacket.h"
#include "usbpad/device/ControlMessageHandler.h"
#include "usbpad/device/CtrlInXfer.h"
#include "usbpad/device/CtrlOutXfer.h"
#include "usbpad/device/EndpointManager.h"
#include "usbpad/log.h"

namespace usbpad::device {

namespace {
void log_setup(const char *prefix, const SetupPacket &packet) {
  USBPAD_LOGW("%s: request_type=0x%02x request=0x%02x "
              "value=0x%04x index=0x%04x length=0x%04x",
              prefix,
              packet.request_type,
              packet.request,
              packet.value,
              packet.index,
              packet.length);
}
} // namespace

MessagePipe::~MessagePipe() {
  on_unconfigured(XferFailReason::LocalReset);
}

void MessagePipe::on_unconfigured(XferFailReason reason) {
  invoke_xfer_failed(reason);
}

void MessagePipe::on_setup_received(const SetupPacket &packet) {
  USBPAD_LOGD("SETUP received: request_type=0x%02x request=0x%02x "
              "value=0x%04x index=0x%04x length=0x%04x",
              packet.request_type,
              packet.request,
              packet.value,
              packet.index,
              packet.length);

  if (status_ != Status::Idle) [[unlikely]] {
    // The hardware layer filters out retransmitted SETUP packets, so this
    // generally indicates a bug in a transfer implementation: e.g., a
    // CtrlInXfer that sent a different amount of data than the wLength field
    // specified, so the host moved on before we did.
    USBPAD_LOGE("received SETUP packet when existing control transfer is in "
                "progress: state=%d",
                static_cast<int>(status_));
    fail_current_xfer(XferFailReason::ProtocolError);
    return;
  }

  if (packet.get_direction() == Direction::Out) {
    auto *xfer = handler_->process_out_setup(this, packet);
    if (!xfer) {
      log_setup("unhandled SETUP OUT packet", packet);
      manager_->stall_message_pipe(endpoint_num_);
      return;
    }
    status_ = Status::OutXfer;
    xfer_.out = xfer;
    xfer->start(packet);
  } else {
    auto *xfer = handler_->process_in_setup(this, packet);
    if (!xfer) {
      log_setup("unhandled SETUP IN packet", packet);
      manager_->stall_message_pipe(endpoint_num_);
      return;
    }
    status_ = Status::InSetupReceived;
    xfer_.in = xfer;
    xfer->start(packet);
  }
}

void MessagePipe::on_in_xfer_complete() {
  switch (status_) {
  case Status::InSendPartial:
    xfer_.in->partial_write_complete();
    return;
  case Status::InSendFinal:
    USBPAD_LOGV("control IN write complete");
    status_ = Status::InStatus;
    // Wait for the host to acknowledge our data with a 0-length OUT packet.
    manager_->start_ctrl_in_ack(this);
    return;
  case Status::OutAck:
    USBPAD_LOGV("control OUT status complete");
    xfer_.out->ack_complete();
    destroy_out_xfer();
    return;
  case Status::Idle:
  case Status::OutXfer:
  case Status::InSetupReceived:
  case Status::InStatus:
    break;
  }

  USBPAD_LOGE("control EP%u received IN xfer complete in unexpected state %d",
              endpoint_num_,
              static_cast<int>(status_));
  fail_current_xfer(XferFailReason::SoftwareError);
}

void MessagePipe::on_in_xfer_failed(XferFailReason reason) {
  USBPAD_LOGW("control IN failure: status=%d, reason=%d",
              static_cast<int>(status_),
              static_cast<int>(reason));
  fail_current_xfer(reason);
}

void MessagePipe::on_out_xfer_complete(uint32_t bytes_read) {
  switch (status_) {
  case Status::OutXfer:
    xfer_.out->out_data_received(bytes_read);
    return;
  case Status::InStatus:
    USBPAD_LOGV("control IN status successfully ACKed");
    xfer_.in->xfer_acked();
    destroy_in_xfer();
    return;
  case Status::Idle:
  case Status::OutAck:
  case Status::InSetupReceived:
  case Status::InSendPartial:
  case Status::InSendFinal:
    break;
  }
  USBPAD_LOGE("control EP%u received OUT xfer complete in unexpected state %d",
              endpoint_num_,
              static_cast<int>(status_));
  fail_current_xfer(XferFailReason::SoftwareError);
}

void MessagePipe::on_out_xfer_failed(XferFailReason reason) {
  USBPAD_LOGW("control OUT failure: status=%d, reason=%d",
              static_cast<int>(status_),
              static_cast<int>(reason));
  fail_current_xfer(reason);
}

void MessagePipe::start_out_read(void *data, size_t size) {
  if (status_ != Status::OutXfer) [[unlikely]] {
    USBPAD_LOGE("start_out_read() called in unexpected state %d",
                static_cast<int>(status_));
    fail_current_xfer(XferFailReason::SoftwareError);
    return;
  }

  manager_->start_ctrl_out_read(this, data, size);
}

void MessagePipe::ack_out_xfer() {
  if (status_ != Status::OutXfer) [[unlikely]] {
    USBPAD_LOGE("ack_out_xfer() called in unexpected state %d",
                static_cast<int>(status_));
    fail_current_xfer(XferFailReason::SoftwareError);
    return;
  }

  status_ = Status::OutAck;
  manager_->start_ctrl_out_ack(this);
}

void MessagePipe::fail_out_xfer() {
  if (status_ != Status::OutXfer) [[unlikely]] {
    USBPAD_LOGE("fail_out_xfer() called in unexpected state %d",
                static_cast<int>(status_));
    fail_current_xfer(XferFailReason::SoftwareError);
    return;
  }

  destroy_out_xfer();
  manager_->stall_message_pipe(endpoint_num_);
}

void MessagePipe::start_in_write(const void *data, size_t size, bool is_final) {
  if (status_ != Status::InSetupReceived && status_ != Status::InSendPartial)
      [[unlikely]] {
    USBPAD_LOGE("start_in_write() called in unexpected state %d",
                static_cast<int>(status_));
    fail_current_xfer(XferFailReason::SoftwareError);
    return;
  }

  status_ = is_final ? Status::InSendFinal : Status::InSendPartial;
  manager_->start_ctrl_in_write(this, data, size);
}

void MessagePipe::fail_in_xfer() {
  if (status_ != Status::InSetupReceived && status_ != Status::InSendPartial)
      [[unlikely]] {
    USBPAD_LOGE("fail_in_xfer() called in unexpected state %d",
                static_cast<int>(status_));
    fail_current_xfer(XferFailReason::SoftwareError);
    return;
  }

  destroy_in_xfer();
  manager_->stall_message_pipe(endpoint_num_);
}

void MessagePipe::fail_current_xfer(XferFailReason reason) {
  // The transfer must be notified while status_ still says which kind of
  // transfer is active.
  invoke_xfer_failed(reason);
  manager_->stall_message_pipe(endpoint_num_);
}

void MessagePipe::invoke_xfer_failed(XferFailReason reason) {
  // TODO: this may run from inside one of the CtrlInXfer or CtrlOutXfer
  // methods.  Deferring destruction of the xfer object to the next task loop
  // iteration would let those methods touch their members after the call.
  switch (status_) {
  case Status::Idle:
    return;
  case Status::OutXfer:
  case Status::OutAck:
    xfer_.out->invoke_xfer_failed(reason);
    destroy_out_xfer();
    return;
  case Status::InSetupReceived:
  case Status::InSendPartial:
  case Status::InSendFinal:
  case Status::InStatus:
    xfer_.in->invoke_xfer_failed(reason);
    destroy_in_xfer();
    return;
  }

  USBPAD_LOGE("fail xfer in unknown control endpoint state %d",
              static_cast<int>(status_));
}

void MessagePipe::destroy_in_xfer() {
  if (!in_status()) [[unlikely]] {
    USBPAD_LOGE("destroy_in_xfer() called in state %d",
                static_cast<int>(status_));
    return;
  }
  delete xfer_.in;
  xfer_.idle = nullptr;
  status_ = Status::Idle;
}

void MessagePipe::destroy_out_xfer() {
  if (status_ != Status::OutXfer && status_ != Status::OutAck) [[unlikely]] {
    USBPAD_LOGE("destroy_out_xfer() called in state %d",
                static_cast<int>(status_));
    return;
  }
  delete xfer_.out;
  xfer_.idle = nullptr;
  status_ = Status::Idle;
}

} // namespace usbpad::device
