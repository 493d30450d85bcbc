// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/device/EndpointManager.h"
#include "usbpad/device/StdControlHandler.h"
#include "usbpad/hw/HWDevice.h"

#include <asel/buf_view.h>
#include <asel/utility.h>

#include <optional>
#include <system_error>

namespace usbpad::device {

/**
 * UsbDevice is the primary class for defining a USB device implementation.
 *
 * This is mostly a small glue layer that ties the hardware device, the
 * EndpointManager, and a StdControlHandler together.  The other parts of
 * libusbpad can be used directly if you want custom behavior for some
 * component.
 *
 * The UsbDeviceImpl template parameter is a class you provide with the
 * device-specific behavior.  It must provide:
 *
 * - A constructor accepting an EndpointManager*.
 *
 * - static constexpr auto make_descriptor_map()
 *   Called at compile time to build the StaticDescriptorMap that is used to
 *   answer GET_DESCRIPTOR requests.
 *
 * - bool set_configuration(uint8_t config_id, EndpointManager &mgr)
 *   Called for SET_CONFIGURATION requests with a non-zero config ID, after
 *   any previous configuration has been torn down.  It should open the
 *   configuration's endpoints, call EndpointManager::set_configured(), and
 *   return true, or return false if the config ID is not valid.
 *
 * It may optionally provide on_reset(XferFailReason), on_enum_done(UsbSpeed),
 * on_suspend(), on_resume(), and is_self_powered() to be informed of the
 * corresponding device events.
 */
template <typename UsbDeviceImpl, typename HwDeviceType = HWDevice>
class UsbDevice : private StdControlHandlerCallback {
public:
  UsbDevice() noexcept = default;

  /**
   * Initialize the USB device and connect to the bus.
   *
   * Arguments are forwarded to the hardware device's init() method.
   */
  template <typename... Args>
  [[nodiscard]] std::error_code init(Args... args) {
    return ep_manager_.init(asel::forward<Args>(args)...);
  }

  /**
   * Process pending hardware events.
   *
   * Returns true if any events were processed.
   */
  bool process_events() {
    return hw_.process_events();
  }

  HwDeviceType *hw() {
    return &hw_;
  }
  EndpointManager *manager() {
    return &ep_manager_;
  }

  static constexpr const auto &descriptor_map() {
    return descriptors_;
  }

  UsbDeviceImpl &dev() {
    return impl_;
  }

private:
  UsbDevice(UsbDevice const &) = delete;
  UsbDevice &operator=(UsbDevice const &) = delete;

  bool set_configuration(uint8_t config_id) override {
    return impl_.set_configuration(config_id, ep_manager_);
  }
  std::optional<asel::buf_view> get_descriptor(uint16_t value,
                                               uint16_t index) override {
    return descriptors_.get_descriptor_with_setup_ids(value, index);
  }
  bool is_self_powered() const override {
    if constexpr (requires(const UsbDeviceImpl &d) { d.is_self_powered(); }) {
      return impl_.is_self_powered();
    } else {
      return false;
    }
  }

  void on_reset(XferFailReason reason) override {
    if constexpr (requires { impl_.on_reset(reason); }) {
      impl_.on_reset(reason);
    }
  }
  void on_enum_done(UsbSpeed speed) override {
    if constexpr (requires { impl_.on_enum_done(speed); }) {
      impl_.on_enum_done(speed);
    }
  }
  void on_suspend() override {
    if constexpr (requires { impl_.on_suspend(); }) {
      impl_.on_suspend();
    }
  }
  void on_resume() override {
    if constexpr (requires { impl_.on_resume(); }) {
      impl_.on_resume();
    }
  }

  static constexpr auto descriptors_ = UsbDeviceImpl::make_descriptor_map();

  HwDeviceType hw_;
  StdControlHandler ctrl_handler_{this};
  EndpointManager ep_manager_{&hw_, &ctrl_handler_};
  UsbDeviceImpl impl_{&ep_manager_};
};

} // namespace usbpad::device
