// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/device/EndpointZero.h"

#include <asel/buf_view.h>

#include <cstdint>
#include <optional>

namespace usbpad::device {

class StdControlHandlerCallback {
public:
  virtual bool set_configuration(uint8_t config_id) = 0;
  virtual std::optional<asel::buf_view> get_descriptor(uint16_t value,
                                                       uint16_t index) = 0;

  // Reported in the GET_STATUS response for the device
  virtual bool is_self_powered() const {
    return false;
  }

  virtual void on_reset(XferFailReason reason) {}
  virtual void on_enum_done(UsbSpeed speed) {}
  virtual void on_suspend() {}
  virtual void on_resume() {}

protected:
  ~StdControlHandlerCallback() = default;
};

/**
 * StdControlHandler processes SETUP requests on the device's default control
 * pipe.
 *
 * Standard device requests are handled directly.  Standard requests with an
 * interface or endpoint recipient are handled here where the USB spec defines
 * their behavior (GET_STATUS, CLEAR_FEATURE, SET_FEATURE, GET_INTERFACE,
 * SET_INTERFACE), and everything else addressed to an interface or endpoint
 * is forwarded to that object.  Vendor requests and class requests for the
 * device recipient are rejected.
 */
class StdControlHandler : public EndpointZeroCallback {
public:
  constexpr explicit StdControlHandler(StdControlHandlerCallback *callback)
      : callback_(callback) {}

  void on_reset(XferFailReason reason) override;
  void on_enum_done(UsbSpeed speed, uint8_t max_packet_size) override;
  void on_suspend() override;
  void on_resume() override;

  CtrlOutXfer *process_out_setup(MessagePipe *pipe,
                                 const SetupPacket &packet) override;
  CtrlInXfer *process_in_setup(MessagePipe *pipe,
                               const SetupPacket &packet) override;

private:
  StdControlHandler(StdControlHandler const &) = delete;
  StdControlHandler &operator=(StdControlHandler const &) = delete;

  CtrlOutXfer *process_std_device_out(MessagePipe *pipe,
                                      const SetupPacket &packet);
  CtrlInXfer *process_std_device_in(MessagePipe *pipe,
                                    const SetupPacket &packet);
  CtrlOutXfer *process_interface_out(MessagePipe *pipe,
                                     const SetupPacket &packet);
  CtrlInXfer *process_interface_in(MessagePipe *pipe,
                                   const SetupPacket &packet);
  CtrlOutXfer *process_endpoint_out(MessagePipe *pipe,
                                    const SetupPacket &packet);
  CtrlInXfer *process_endpoint_in(MessagePipe *pipe,
                                  const SetupPacket &packet);

  CtrlOutXfer *process_set_configuration(MessagePipe *pipe,
                                         const SetupPacket &packet);
  CtrlOutXfer *process_device_feature(MessagePipe *pipe,
                                      const SetupPacket &packet,
                                      bool set);
  CtrlInXfer *process_get_descriptor(MessagePipe *pipe,
                                     const SetupPacket &packet);

  StdControlHandlerCallback *const callback_ = nullptr;
  uint8_t ep0_max_packet_size_ = 64;
};

} // namespace usbpad::device
