// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/device/ControlMessageHandler.h"
#include "usbpad/device/MessagePipe.h"
#include "usbpad/log.h"
#include "usbpad/usbpad_types.h"

#include <cstdint>

namespace usbpad::device {

class EndpointManager;

/**
 * Handler for the default control pipe.
 *
 * In addition to SETUP processing, this receives the device-level bus events
 * that are relevant to endpoint 0.
 */
class EndpointZeroCallback : public ControlMessageHandler {
public:
  virtual void on_reset(XferFailReason reason) {}
  virtual void on_enum_done(UsbSpeed speed, uint8_t max_packet_size) {}
  virtual void on_suspend() {}
  virtual void on_resume() {}
};

/**
 * This class manages state for the Default Control Pipe (endpoint 0).
 *
 * This largely consists of the MessagePipe for endpoint 0, plus a few
 * device state callbacks that are specific to endpoint 0.
 */
class EndpointZero {
public:
  constexpr EndpointZero(EndpointManager *mgr, EndpointZeroCallback *callback)
      : pipe_(mgr, /*endpoint_num*/ 0, callback) {}

  EndpointManager *manager() const {
    return pipe_.manager();
  }
  uint8_t endpoint_num() const {
    return 0;
  }
  MessagePipe::Status status() const {
    return pipe_.status();
  }

  ////////////////////////////////////////////////////////////////////
  // Methods to be invoked by EndpointManager to inform us of events
  ////////////////////////////////////////////////////////////////////

  /**
   * Called after the device has been enumerated on the bus, with the
   * maximum packet size chosen for endpoint 0.
   */
  void on_enum_done(UsbSpeed speed, uint8_t max_packet_size) {
    USBPAD_LOGD("EP0 max packet size: %u", max_packet_size);
    callback()->on_enum_done(speed, max_packet_size);
  }

  /**
   * Called when the bus is reset, or the device is reset locally.
   *
   * The pipe is not stalled: a reset flushes all hardware transfers anyway.
   */
  void on_reset(XferFailReason reason) {
    pipe_.on_unconfigured(reason);
    callback()->on_reset(reason);
  }

  // Bus suspend (more than 3ms idle) and the activity that ends it
  void on_suspend() {
    callback()->on_suspend();
  }
  void on_resume() {
    callback()->on_resume();
  }

  void on_setup_received(const SetupPacket &packet) {
    pipe_.on_setup_received(packet);
  }
  void on_in_xfer_complete() {
    pipe_.on_in_xfer_complete();
  }
  void on_in_xfer_failed(XferFailReason reason) {
    pipe_.on_in_xfer_failed(reason);
  }
  void on_out_xfer_complete(uint32_t bytes_read) {
    pipe_.on_out_xfer_complete(bytes_read);
  }
  void on_out_xfer_failed(XferFailReason reason) {
    pipe_.on_out_xfer_failed(reason);
  }

private:
  EndpointZero(EndpointZero const &) = delete;
  EndpointZero &operator=(EndpointZero const &) = delete;

  EndpointZeroCallback *callback() {
    // The MessagePipe stores our callback as its handler.  Rather than storing
    // a second copy of this pointer, just downcast it back.
    return static_cast<EndpointZeroCallback *>(pipe_.handler());
  }

  MessagePipe pipe_;
};

} // namespace usbpad::device
