// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/device/ControlMessageHandler.h"
#include "usbpad/usbpad_types.h"

namespace usbpad::device {

/**
 * Base class for IN endpoints other than endpoint 0.
 *
 * Non-standard SETUP requests addressed to the endpoint are forwarded to its
 * ControlMessageHandler methods.
 */
class InEndpoint : public ControlMessageHandler {
public:
  constexpr InEndpoint() = default;

  /**
   * on_in_ep_unconfigured() will be called when the endpoint is closed.
   *
   * This can happen when the bus is reset, or if SET_CONFIGURATION is called
   * to change the device configuration.  Any transfer in progress has been
   * aborted by the time this is called.
   */
  virtual void on_in_ep_unconfigured(XferFailReason reason) {}

  virtual void on_in_xfer_complete() = 0;
  virtual void on_in_xfer_failed(XferFailReason reason) = 0;

private:
  InEndpoint(InEndpoint const &) = delete;
  InEndpoint &operator=(InEndpoint const &) = delete;
};

} // namespace usbpad::device
