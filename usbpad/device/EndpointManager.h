// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/device/EndpointZero.h"
#include "usbpad/hw/HWDevice.h"
#include "usbpad/usb_types.h"
#include "usbpad/usbpad_config.h"
#include "usbpad/usbpad_types.h"

#include <asel/array.h>
#include <asel/range.h>
#include <asel/utility.h>

#include <cstdint>
#include <optional>
#include <system_error>

namespace usbpad::device {

class Interface;
class InEndpoint;
class OutEndpoint;

/**
 * This class is the main gateway between the hardware-independent code and the
 * hardware-specific layer.
 *
 * This class keeps track of the HWDevice implementation, as well as the
 * endpoints and interfaces defined by the application.  It is also the main
 * API that the HWDevice implementations use when informing the higher-level
 * code of hardware events that have occurred.
 */
class EndpointManager {
public:
  static constexpr size_t kMaxNumInterfaces = USBPAD_CONFIG_MAX_INTERFACES;
  static constexpr size_t kMaxNumInEndpoints = USBPAD_CONFIG_MAX_IN_ENDPOINTS;
  static constexpr size_t kMaxNumOutEndpoints =
      USBPAD_CONFIG_MAX_OUT_ENDPOINTS;

  constexpr explicit EndpointManager(
      HWDevice *hw, EndpointZeroCallback *ep0_callback) noexcept
      : hw_(hw), ep0_(this, ep0_callback) {}

  /**
   * Initialize the USB device.
   *
   * This accepts any arguments accepted by the underlying hardware device's
   * init() call, and forwards those to the hardware.
   */
  template <typename... Args>
  [[nodiscard]] std::error_code init(Args... args) {
    return hw_->init(this, asel::forward<Args>(args)...);
  }

  /**
   * Reset and de-initialize the USB device.
   */
  void reset();

  DeviceState state() const {
    return state_;
  }
  uint8_t config_id() const {
    return config_id_;
  }
  bool is_suspended() const {
    return dev_state_is_suspended(state_);
  }
  bool is_configured() const {
    return state_ == DeviceState::Configured;
  }

  bool remote_wakeup_enabled() const {
    return remote_wakeup_enabled_;
  }
  void set_remote_wakeup_enabled(bool enabled) {
    remote_wakeup_enabled_ = enabled;
  }

  /**
   * Set the device address.
   *
   * SET_ADDRESS requests are unusual: the address change must only be
   * applied after the status phase of the request completes.  This method
   * should be called from CtrlOutXfer::ack_complete() for the SET_ADDRESS
   * request.  During normal request processing (before sending the
   * acknowledgement), set_address_early() should be invoked instead.
   */
  void set_address(uint8_t address);

  /**
   * Informs the hardware of an upcoming address change, without applying it.
   */
  void set_address_early(uint8_t address);

  /**
   * Mark the device as configured.
   *
   * This should generally only be invoked when handling a SET_CONFIGURATION
   * request on endpoint 0, after all of the endpoints for this configuration
   * have been opened.
   *
   * Returns false if the device is not in the Address state, config_id is 0,
   * or too many interfaces are supplied.
   */
  [[nodiscard]] bool set_configured(uint8_t config_id,
                                    asel::range<Interface *const> interfaces);
  template <size_t N>
  [[nodiscard]] bool
  set_configured(uint8_t config_id,
                 const asel::array<Interface *, N> &interfaces) {
    return set_configured(config_id,
                          asel::range<Interface *const>(interfaces));
  }
  template <typename... IntfT>
  [[nodiscard]] bool set_configured(uint8_t config_id,
                                    Interface *intf1,
                                    IntfT *...other_interfaces) {
    asel::array intf_array(
        asel::to_array<Interface *>({intf1, other_interfaces...}));
    return set_configured(config_id,
                          asel::range<Interface *const>(intf_array));
  }

  /**
   * Unconfigure the device.
   *
   * This closes all endpoints other than endpoint 0 and puts the device back
   * in the Address state.  In-progress transfers on those endpoints fail with
   * XferFailReason::ConfigChanged.
   */
  void unconfigure();

  [[nodiscard]] bool open_in_endpoint(uint8_t endpoint_num,
                                      InEndpoint *endpoint,
                                      EndpointType type,
                                      uint16_t max_packet_size);
  [[nodiscard]] bool open_out_endpoint(uint8_t endpoint_num,
                                       OutEndpoint *endpoint,
                                       EndpointType type,
                                       uint16_t max_packet_size);

  /**
   * Get an interface by number.
   *
   * Returns nullptr if no interface with this number is configured.
   */
  [[nodiscard]] Interface *get_interface(uint8_t number);
  [[nodiscard]] InEndpoint *get_in_endpoint(uint8_t endpoint_num);
  [[nodiscard]] OutEndpoint *get_out_endpoint(uint8_t endpoint_num);

  /**
   * Set or clear the Halt feature of an endpoint.
   *
   * Returns false if the endpoint is not open.  Endpoint 0 cannot be halted
   * this way; its STALL state is managed by the MessagePipe.
   */
  [[nodiscard]] bool set_endpoint_halt(EndpointAddress address, bool halt);

  /**
   * Returns whether an open endpoint is halted, or std::nullopt if the
   * endpoint is not open.  Endpoint 0 is never reported as halted.
   */
  std::optional<bool> is_endpoint_halted(EndpointAddress address) const;

  /**
   * Configure a message pipe to respond to any future IN or OUT tokens
   * with a STALL error.
   *
   * This stall state will automatically be cleared the next time a SETUP
   * packet is received from the host.
   *
   * This method should generally only be invoked by a MessagePipe.
   */
  void stall_message_pipe(uint8_t endpoint_num);

  /**
   * Send data for the current control IN transfer.
   *
   * This method should only be invoked by a MessagePipe.
   * on_in_xfer_complete() or on_in_xfer_failed() will be called on the
   * MessagePipe when the write is complete.  Note that on_in_xfer_failed() may
   * be invoked before start_ctrl_in_write() returns if there is an error
   * starting the write operation.
   */
  void start_ctrl_in_write(MessagePipe *pipe, const void *data, uint32_t size);

  /**
   * Begin waiting for the host to acknowledge the status phase of a control
   * IN transfer.  (The status phase of an IN transfer is a single 0-length OUT
   * packet.)
   */
  void start_ctrl_in_ack(MessagePipe *pipe);

  /**
   * Begin receiving data for the current control OUT transfer.
   *
   * on_out_xfer_complete() will be invoked on the pipe when either exactly
   * size bytes have been received, or the host sent a short packet ending
   * the transfer.  If the host sends more data than requested the read fails
   * with XferFailReason::BufferOverrun.
   */
  void start_ctrl_out_read(MessagePipe *pipe, void *data, uint32_t size);

  /**
   * Begin to successfully acknowledge the status phase of a control OUT
   * transfer.  (The status phase of an OUT transfer is a single 0-length IN
   * packet.)
   */
  void start_ctrl_out_ack(MessagePipe *pipe);

  /**
   * Start a write on an opened IN endpoint.
   *
   * On failure the endpoint's on_in_xfer_failed() is invoked before this
   * returns.
   */
  void start_in_write(uint8_t endpoint_num, const void *data, uint32_t size);

  /**
   * Start a read on an opened OUT endpoint.
   */
  void start_out_read(uint8_t endpoint_num, void *data, uint32_t size);

  HWDevice *hw() {
    return hw_;
  }

  ///////////////////////////////////////////////////////////////////////////
  // The following methods should only be invoked by HWDevice implementations
  //
  // These must be invoked from the main USB task, and should never be invoked
  // from interrupt handlers.
  ///////////////////////////////////////////////////////////////////////////

  void on_bus_reset();
  void on_suspend();
  void on_resume();
  void on_enum_done(UsbSpeed speed);
  void on_setup_received(uint8_t endpoint_num, const SetupPacket &packet);
  void on_in_xfer_complete(uint8_t endpoint_num);
  void on_in_xfer_failed(uint8_t endpoint_num, XferFailReason reason);
  void on_out_xfer_complete(uint8_t endpoint_num, uint32_t bytes_read);
  void on_out_xfer_failed(uint8_t endpoint_num, XferFailReason reason);

private:
  EndpointManager(EndpointManager const &) = delete;
  EndpointManager &operator=(EndpointManager const &) = delete;

  void unconfigure_endpoints_and_interfaces(XferFailReason reason);

  DeviceState state_ = DeviceState::Uninit;
  uint8_t config_id_ = 0;
  bool remote_wakeup_enabled_ = false;

  // Bitmasks of halted endpoints, indexed by endpoint number
  uint16_t in_halted_ = 0;
  uint16_t out_halted_ = 0;

  HWDevice *hw_ = nullptr;
  EndpointZero ep0_;

  // The currently configured interfaces.
  //
  // The set of interfaces is defined by the current configuration, and can
  // only be changed with a set_configured() or unconfigure() call.
  asel::array<Interface *, kMaxNumInterfaces> interfaces_ = {};

  // The currently opened endpoints.  Index 0 is never used here: endpoint 0
  // is always handled by ep0_.
  asel::array<InEndpoint *, kMaxNumInEndpoints> in_endpoints_ = {};
  asel::array<OutEndpoint *, kMaxNumOutEndpoints> out_endpoints_ = {};
};

} // namespace usbpad::device
