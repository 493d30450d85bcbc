// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/DeviceEvent.h"
#include "usbpad/usb_types.h"
#include "usbpad/usbpad_config.h"
#include "usbpad/usbpad_types.h"

#include <cstdint>
#include <system_error>

namespace usbpad {

namespace device {
class EndpointManager;
}

class HWDeviceBase {
public:
  constexpr HWDeviceBase() noexcept = default;

  // With USBPAD_CONFIG_HW_MULTI the device methods are virtual so that the
  // hardware implementation can be selected at runtime.  Otherwise there is
  // only one possible implementation, known at compile time, and each
  // hardware class simply provides non-virtual methods with these
  // signatures.
#if USBPAD_CONFIG_HW_MULTI
  virtual ~HWDeviceBase() = default;

  [[nodiscard]] virtual std::error_code init(device::EndpointManager *mgr) = 0;
  virtual void reset() = 0;

  virtual bool process_events() = 0;
  [[nodiscard]] virtual bool post_event(const DeviceEvent &event) = 0;

  virtual void set_address(uint8_t address) = 0;
  virtual void set_address_early(uint8_t address) = 0;

  virtual bool configure_ep0(uint8_t max_packet_size) = 0;
  [[nodiscard]] virtual bool open_in_endpoint(uint8_t endpoint_num,
                                              EndpointType type,
                                              uint16_t max_packet_size) = 0;
  [[nodiscard]] virtual bool open_out_endpoint(uint8_t endpoint_num,
                                               EndpointType type,
                                               uint16_t max_packet_size) = 0;
  virtual void close_in_endpoint(uint8_t endpoint_num) = 0;
  virtual void close_out_endpoint(uint8_t endpoint_num) = 0;

  [[nodiscard]] virtual XferStartResult
  start_write(uint8_t endpoint, const void *data, uint32_t size) = 0;
  [[nodiscard]] virtual XferStartResult
  start_read(uint8_t endpoint, void *data, uint32_t size) = 0;

  virtual void stall_control_endpoint(uint8_t endpoint_num) = 0;
  virtual void set_in_endpoint_stall(uint8_t endpoint_num, bool stall) = 0;
  virtual void set_out_endpoint_stall(uint8_t endpoint_num, bool stall) = 0;
#endif

private:
  HWDeviceBase(HWDeviceBase const &) = delete;
  HWDeviceBase &operator=(HWDeviceBase const &) = delete;
};

} // namespace usbpad
