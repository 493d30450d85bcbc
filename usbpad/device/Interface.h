// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/device/ControlMessageHandler.h"

#include <cstdint>

namespace usbpad::device {

/**
 * A pure virtual class defining the API that any device interface must
 * implement.
 *
 * This derives from ControlMessageHandler, since control messages on
 * endpoint 0 may be addressed to a specific interface.  The Interface object
 * is asked to process any SETUP messages sent to it on endpoint 0.
 */
class Interface : public ControlMessageHandler {
public:
  constexpr Interface() noexcept = default;

  /**
   * unconfigure() will be called when the interface is unconfigured.
   *
   * This can happen when the bus is reset, or if SET_CONFIGURATION is called
   * to change the device configuration.
   */
  virtual void unconfigure() {}

  /**
   * Return the currently selected alternate setting.
   */
  virtual uint8_t alt_setting() const {
    return 0;
  }

  /**
   * Handle a SET_INTERFACE request.
   *
   * Returns false if the alternate setting is not supported, causing the
   * request to be failed with a STALL.  Interfaces without alternate settings
   * only accept setting 0.
   */
  virtual bool set_alt_setting(uint8_t alt) {
    return alt == 0;
  }

private:
  Interface(Interface const &) = delete;
  Interface &operator=(Interface const &) = delete;
};

} // namespace usbpad::device
