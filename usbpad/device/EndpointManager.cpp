// Copyright (c) 2023, Adam Simpkins
#include "usbpad/device/EndpointManager.h"

#include "usbpad/device/InEndpoint.h"
#include "usbpad/device/Interface.h"
#include "usbpad/device/OutEndpoint.h"
#include "usbpad/log.h"

namespace usbpad::device {

void EndpointManager::reset() {
  USBPAD_LOGW("EndpointManager::reset() called");
  unconfigure_endpoints_and_interfaces(XferFailReason::LocalReset);
  ep0_.on_reset(XferFailReason::LocalReset);
  hw_->reset();
  state_ = DeviceState::Uninit;
  remote_wakeup_enabled_ = false;
}

void EndpointManager::on_bus_reset() {
  USBPAD_LOGI("on_bus_reset");
  unconfigure_endpoints_and_interfaces(XferFailReason::BusReset);
  ep0_.on_reset(XferFailReason::BusReset);
  state_ = DeviceState::Uninit;
  remote_wakeup_enabled_ = false;
}

void EndpointManager::on_suspend() {
  if (is_suspended()) {
    // Ignore spurious suspend events from the hardware
    return;
  }
  USBPAD_LOGI("on_suspend");

  state_ = dev_state_suspended(state_);

  // The bus is seen as suspended when first attached, before any reset.
  // That is not worth distinguishing from the normal uninitialized state.
  if (state_ != DeviceState::SuspendedUninit) {
    ep0_.on_suspend();
  }
}

void EndpointManager::on_resume() {
  if (!is_suspended()) {
    return;
  }
  USBPAD_LOGI("on_resume");
  state_ = dev_state_unsuspended(state_);
  if (state_ != DeviceState::Uninit) {
    ep0_.on_resume();
  }
}

void EndpointManager::on_enum_done(UsbSpeed speed) {
  USBPAD_LOGI("on_enum_done: speed=%d", static_cast<int>(speed));

  state_ = DeviceState::Default;
  config_id_ = 0;
  remote_wakeup_enabled_ = false;

  // EP0 max packet size requirements
  // - Must be 8 when low speed
  // - May be 8, 16, 32, or 64 when full speed; we always use 64
  const uint8_t max_packet_size = (speed == UsbSpeed::Low) ? 8 : 64;

  if (!hw_->configure_ep0(max_packet_size)) {
    USBPAD_LOGE("failed to configure endpoint 0");
    return;
  }
  ep0_.on_enum_done(speed, max_packet_size);
}

void EndpointManager::on_setup_received(uint8_t endpoint_num,
                                        const SetupPacket &packet) {
  if (dev_state_unsuspended(state_) == DeviceState::Uninit) {
    USBPAD_LOGW("ignoring USB setup packet before reset seen");
    return;
  }

  if (endpoint_num == 0) {
    ep0_.on_setup_received(packet);
  } else {
    // Message pipes on endpoints other than 0 are allowed by the USB spec,
    // but almost never used in practice.  We don't support them.
    USBPAD_LOGW("SETUP packet received on unexpected endpoint %u",
                endpoint_num);
  }
}

void EndpointManager::stall_message_pipe(uint8_t endpoint_num) {
  hw_->stall_control_endpoint(endpoint_num);
}

InEndpoint *EndpointManager::get_in_endpoint(uint8_t endpoint_num) {
  if (endpoint_num == 0 || endpoint_num >= in_endpoints_.size()) {
    return nullptr;
  }
  return in_endpoints_[endpoint_num];
}

OutEndpoint *EndpointManager::get_out_endpoint(uint8_t endpoint_num) {
  if (endpoint_num == 0 || endpoint_num >= out_endpoints_.size()) {
    return nullptr;
  }
  return out_endpoints_[endpoint_num];
}

void EndpointManager::on_in_xfer_complete(uint8_t endpoint_num) {
  if (endpoint_num == 0) {
    ep0_.on_in_xfer_complete();
    return;
  }
  auto *const ep = get_in_endpoint(endpoint_num);
  if (!ep) {
    USBPAD_LOGW(
        "received IN transfer complete event for unexpected endpoint %u",
        endpoint_num);
    return;
  }
  ep->on_in_xfer_complete();
}

void EndpointManager::on_in_xfer_failed(uint8_t endpoint_num,
                                        XferFailReason reason) {
  if (endpoint_num == 0) {
    ep0_.on_in_xfer_failed(reason);
    return;
  }
  auto *const ep = get_in_endpoint(endpoint_num);
  if (!ep) {
    USBPAD_LOGW("received IN transfer failed event for unexpected endpoint %u",
                endpoint_num);
    return;
  }
  ep->on_in_xfer_failed(reason);
}

void EndpointManager::on_out_xfer_complete(uint8_t endpoint_num,
                                           uint32_t bytes_read) {
  if (endpoint_num == 0) {
    ep0_.on_out_xfer_complete(bytes_read);
    return;
  }
  auto *const ep = get_out_endpoint(endpoint_num);
  if (!ep) {
    USBPAD_LOGW(
        "received OUT transfer complete event for unexpected endpoint %u",
        endpoint_num);
    return;
  }
  ep->on_out_xfer_complete(bytes_read);
}

void EndpointManager::on_out_xfer_failed(uint8_t endpoint_num,
                                         XferFailReason reason) {
  if (endpoint_num == 0) {
    ep0_.on_out_xfer_failed(reason);
    return;
  }
  auto *const ep = get_out_endpoint(endpoint_num);
  if (!ep) {
    USBPAD_LOGW(
        "received OUT transfer failed event for unexpected endpoint %u",
        endpoint_num);
    return;
  }
  ep->on_out_xfer_failed(reason);
}

void EndpointManager::set_address(uint8_t address) {
  // SET_ADDRESS with address 0 returns the device to the Default state
  state_ = (address == 0) ? DeviceState::Default : DeviceState::Address;
  hw_->set_address(address);
}

void EndpointManager::set_address_early(uint8_t address) {
  hw_->set_address_early(address);
}

Interface *EndpointManager::get_interface(uint8_t number) {
  if (number >= interfaces_.size()) {
    return nullptr;
  }
  return interfaces_[number];
}

bool EndpointManager::set_configured(
    uint8_t config_id, asel::range<Interface *const> interfaces) {
  // If SET_CONFIGURATION was called when the state was already Configured,
  // the caller must unconfigure() first to close the existing endpoints and
  // interfaces.
  if (state_ != DeviceState::Address) {
    USBPAD_LOGE("set_configured() called in unexpected device state %d",
                static_cast<int>(state_));
    return false;
  }
  if (config_id == 0) {
    USBPAD_LOGE("set_configured() called with config ID 0");
    return false;
  }
  if (interfaces.size() > interfaces_.size()) {
    USBPAD_LOGE("too many interfaces for configuration %u: %zu",
                config_id,
                interfaces.size());
    return false;
  }

  for (size_t n = 0; n < interfaces_.size(); ++n) {
    interfaces_[n] = (n < interfaces.size()) ? interfaces[n] : nullptr;
  }

  state_ = DeviceState::Configured;
  config_id_ = config_id;
  return true;
}

void EndpointManager::unconfigure() {
  USBPAD_LOGI("EndpointManager::unconfigure() invoked");

  unconfigure_endpoints_and_interfaces(XferFailReason::ConfigChanged);
  if (state_ == DeviceState::Configured) {
    state_ = DeviceState::Address;
  }
}

void EndpointManager::unconfigure_endpoints_and_interfaces(
    XferFailReason reason) {
  for (size_t n = 1; n < in_endpoints_.size(); ++n) {
    auto *const ep = in_endpoints_[n];
    in_endpoints_[n] = nullptr;
    if (ep != nullptr) {
      hw_->close_in_endpoint(n);
      ep->on_in_ep_unconfigured(reason);
    }
  }
  for (size_t n = 1; n < out_endpoints_.size(); ++n) {
    auto *const ep = out_endpoints_[n];
    out_endpoints_[n] = nullptr;
    if (ep != nullptr) {
      hw_->close_out_endpoint(n);
      ep->on_out_ep_unconfigured(reason);
    }
  }
  in_halted_ = 0;
  out_halted_ = 0;

  for (size_t n = 0; n < interfaces_.size(); ++n) {
    auto *const intf = interfaces_[n];
    interfaces_[n] = nullptr;
    if (intf != nullptr) {
      intf->unconfigure();
    }
  }

  config_id_ = 0;
}

bool EndpointManager::open_in_endpoint(uint8_t endpoint_num,
                                       InEndpoint *endpoint,
                                       EndpointType type,
                                       uint16_t max_packet_size) {
  if (dev_state_unsuspended(state_) != DeviceState::Address &&
      dev_state_unsuspended(state_) != DeviceState::Configured) {
    // Endpoints can only be opened once SET_ADDRESS has been processed.
    USBPAD_LOGE("cannot open IN endpoint %u in device state %d",
                endpoint_num,
                static_cast<int>(state_));
    return false;
  }

  if (endpoint_num == 0 || endpoint_num >= in_endpoints_.size()) {
    USBPAD_LOGE("cannot open IN endpoint %u: invalid endpoint number",
                endpoint_num);
    return false;
  }
  if (in_endpoints_[endpoint_num] != nullptr) {
    USBPAD_LOGE(
        "cannot open IN endpoint %u: this endpoint number is already in use",
        endpoint_num);
    return false;
  }

  if (!hw_->open_in_endpoint(endpoint_num, type, max_packet_size)) {
    USBPAD_LOGE("hardware failed to open IN endpoint %u", endpoint_num);
    return false;
  }
  in_endpoints_[endpoint_num] = endpoint;
  return true;
}

bool EndpointManager::open_out_endpoint(uint8_t endpoint_num,
                                        OutEndpoint *endpoint,
                                        EndpointType type,
                                        uint16_t max_packet_size) {
  if (dev_state_unsuspended(state_) != DeviceState::Address &&
      dev_state_unsuspended(state_) != DeviceState::Configured) {
    USBPAD_LOGE("cannot open OUT endpoint %u in device state %d",
                endpoint_num,
                static_cast<int>(state_));
    return false;
  }

  if (endpoint_num == 0 || endpoint_num >= out_endpoints_.size()) {
    USBPAD_LOGE("cannot open OUT endpoint %u: invalid endpoint number",
                endpoint_num);
    return false;
  }
  if (out_endpoints_[endpoint_num] != nullptr) {
    USBPAD_LOGE(
        "cannot open OUT endpoint %u: this endpoint number is already in use",
        endpoint_num);
    return false;
  }

  if (!hw_->open_out_endpoint(endpoint_num, type, max_packet_size)) {
    USBPAD_LOGE("hardware failed to open OUT endpoint %u", endpoint_num);
    return false;
  }
  out_endpoints_[endpoint_num] = endpoint;
  return true;
}

bool EndpointManager::set_endpoint_halt(EndpointAddress address, bool halt) {
  const uint8_t num = address.number().value();
  const uint16_t bit = address.mask();
  if (address.is_in()) {
    if (!get_in_endpoint(num)) {
      return false;
    }
    hw_->set_in_endpoint_stall(num, halt);
    in_halted_ = halt ? (in_halted_ | bit) : (in_halted_ & ~bit);
  } else {
    if (!get_out_endpoint(num)) {
      return false;
    }
    hw_->set_out_endpoint_stall(num, halt);
    out_halted_ = halt ? (out_halted_ | bit) : (out_halted_ & ~bit);
  }
  USBPAD_LOGD("endpoint 0x%02x halt=%d", address.value(), halt);
  return true;
}

std::optional<bool>
EndpointManager::is_endpoint_halted(EndpointAddress address) const {
  const uint8_t num = address.number().value();
  if (address.number().is_control_pipe()) {
    return false;
  }
  const uint16_t bit = address.mask();
  if (address.is_in()) {
    if (num >= in_endpoints_.size() || in_endpoints_[num] == nullptr) {
      return std::nullopt;
    }
    return (in_halted_ & bit) != 0;
  }
  if (num >= out_endpoints_.size() || out_endpoints_[num] == nullptr) {
    return std::nullopt;
  }
  return (out_halted_ & bit) != 0;
}

void EndpointManager::start_ctrl_in_write(MessagePipe *pipe,
                                          const void *data,
                                          uint32_t size) {
  auto status = hw_->start_write(pipe->endpoint_num(), data, size);
  if (status != XferStartResult::Ok) {
    USBPAD_LOGE("error starting control IN transfer: %d",
                static_cast<int>(status));
    pipe->on_in_xfer_failed(XferFailReason::SoftwareError);
  }
}

void EndpointManager::start_ctrl_in_ack(MessagePipe *pipe) {
  auto status = hw_->start_read(pipe->endpoint_num(), nullptr, 0);
  if (status != XferStartResult::Ok) {
    USBPAD_LOGE("error starting receipt of control IN ACK: %d",
                static_cast<int>(status));
    pipe->on_out_xfer_failed(XferFailReason::SoftwareError);
  }
}

void EndpointManager::start_ctrl_out_read(MessagePipe *pipe,
                                          void *data,
                                          uint32_t size) {
  auto status = hw_->start_read(pipe->endpoint_num(), data, size);
  if (status != XferStartResult::Ok) {
    USBPAD_LOGE("error starting control OUT transfer: %d",
                static_cast<int>(status));
    pipe->on_out_xfer_failed(XferFailReason::SoftwareError);
  }
}

void EndpointManager::start_ctrl_out_ack(MessagePipe *pipe) {
  auto status = hw_->start_write(pipe->endpoint_num(), nullptr, 0);
  if (status != XferStartResult::Ok) {
    USBPAD_LOGE("error starting control OUT ACK: %d", static_cast<int>(status));
    pipe->on_in_xfer_failed(XferFailReason::SoftwareError);
  }
}

void EndpointManager::start_in_write(uint8_t endpoint_num,
                                     const void *data,
                                     uint32_t size) {
  auto *const endpoint = get_in_endpoint(endpoint_num);
  if (!endpoint) {
    USBPAD_LOGE("attempted to start IN transfer on unopened endpoint %u",
                endpoint_num);
    return;
  }

  auto status = hw_->start_write(endpoint_num, data, size);
  if (status != XferStartResult::Ok) {
    USBPAD_LOGE("error starting IN transfer on endpoint %u: %d",
                endpoint_num,
                static_cast<int>(status));
    endpoint->on_in_xfer_failed(XferFailReason::SoftwareError);
  }
}

void EndpointManager::start_out_read(uint8_t endpoint_num,
                                     void *data,
                                     uint32_t size) {
  auto *const endpoint = get_out_endpoint(endpoint_num);
  if (!endpoint) {
    USBPAD_LOGE("attempted to start OUT transfer on unopened endpoint %u",
                endpoint_num);
    return;
  }

  auto status = hw_->start_read(endpoint_num, data, size);
  if (status != XferStartResult::Ok) {
    USBPAD_LOGE("error starting OUT transfer on endpoint %u: %d",
                endpoint_num,
                static_cast<int>(status));
    endpoint->on_out_xfer_failed(XferFailReason::SoftwareError);
  }
}

} // namespace usbpad::device
