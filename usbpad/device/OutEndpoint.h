// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/device/ControlMessageHandler.h"
#include "usbpad/usbpad_types.h"

#include <cstdint>

namespace usbpad::device {

/**
 * Base class for OUT endpoints other than endpoint 0.
 */
class OutEndpoint : public ControlMessageHandler {
public:
  constexpr OutEndpoint() = default;

  /**
   * on_out_ep_unconfigured() will be called when the endpoint is closed.
   *
   * This can happen when the bus is reset, or if SET_CONFIGURATION is called
   * to change the device configuration.
   */
  virtual void on_out_ep_unconfigured(XferFailReason reason) {}

  virtual void on_out_xfer_complete(uint32_t bytes_read) = 0;
  virtual void on_out_xfer_failed(XferFailReason reason) = 0;

private:
  OutEndpoint(OutEndpoint const &) = delete;
  OutEndpoint &operator=(OutEndpoint const &) = delete;
};

} // namespace usbpad::device
