// Copyright (c) 2023, Adam Simpkins
#include "usbpad/device/StdControlHandler.h"

#include "usbpad/SetupPacket.h"
#include "usbpad/desc/DeviceDescriptor.h"
#include "usbpad/device/EndpointManager.h"
#include "usbpad/device/InEndpoint.h"
#include "usbpad/device/Interface.h"
#include "usbpad/device/OutEndpoint.h"
#include "usbpad/device/ctrl/AckEmptyCtrlOut.h"
#include "usbpad/device/ctrl/GetDevDescriptorModifyEP0.h"
#include "usbpad/device/ctrl/GetStaticDescriptor.h"
#include "usbpad/device/ctrl/SendData.h"
#include "usbpad/device/ctrl/SetAddress.h"
#include "usbpad/device/ctrl/Stall.h"
#include "usbpad/log.h"

namespace usbpad::device {

void StdControlHandler::on_reset(XferFailReason reason) {
  callback_->on_reset(reason);
}

void StdControlHandler::on_enum_done(UsbSpeed speed,
                                     uint8_t max_packet_size) {
  ep0_max_packet_size_ = max_packet_size;
  callback_->on_enum_done(speed);
}

void StdControlHandler::on_suspend() {
  callback_->on_suspend();
}

void StdControlHandler::on_resume() {
  callback_->on_resume();
}

CtrlOutXfer *StdControlHandler::process_out_setup(MessagePipe *pipe,
                                                  const SetupPacket &packet) {
  switch (packet.get_recipient()) {
  case SetupRecipient::Device:
    if (packet.is_standard()) {
      return process_std_device_out(pipe, packet);
    }
    break;
  case SetupRecipient::Interface:
    return process_interface_out(pipe, packet);
  case SetupRecipient::Endpoint:
    return process_endpoint_out(pipe, packet);
  case SetupRecipient::Other:
    break;
  }

  // Vendor-specific device requests are not supported.  Applications that
  // need them can provide their own EndpointZeroCallback that delegates
  // everything else to a StdControlHandler.
  USBPAD_LOGW("rejecting unsupported SETUP OUT request 0x%02x 0x%02x",
              packet.request_type,
              packet.request);
  return pipe->new_out_handler<StallCtrlOut>(pipe);
}

CtrlInXfer *StdControlHandler::process_in_setup(MessagePipe *pipe,
                                                const SetupPacket &packet) {
  switch (packet.get_recipient()) {
  case SetupRecipient::Device:
    if (packet.is_standard()) {
      return process_std_device_in(pipe, packet);
    }
    break;
  case SetupRecipient::Interface:
    return process_interface_in(pipe, packet);
  case SetupRecipient::Endpoint:
    return process_endpoint_in(pipe, packet);
  case SetupRecipient::Other:
    break;
  }

  USBPAD_LOGW("rejecting unsupported SETUP IN request 0x%02x 0x%02x",
              packet.request_type,
              packet.request);
  return pipe->new_in_handler<StallCtrlIn>(pipe);
}

CtrlOutXfer *
StdControlHandler::process_std_device_out(MessagePipe *pipe,
                                          const SetupPacket &packet) {
  switch (packet.get_std_request()) {
  case StdRequestType::SetAddress:
    return pipe->new_out_handler<SetAddress>(pipe);
  case StdRequestType::SetConfiguration:
    return process_set_configuration(pipe, packet);
  case StdRequestType::SetFeature:
    return process_device_feature(pipe, packet, /*set=*/true);
  case StdRequestType::ClearFeature:
    return process_device_feature(pipe, packet, /*set=*/false);
  case StdRequestType::SetDescriptor:
    // The device-level descriptors are read-only.
    USBPAD_LOGW("rejecting SET_DESCRIPTOR request 0x%04x 0x%04x",
                packet.value,
                packet.index);
    return pipe->new_out_handler<StallCtrlOut>(pipe);
  default:
    break;
  }

  USBPAD_LOGW("unknown standard device OUT request %u", packet.request);
  return nullptr;
}

CtrlInXfer *
StdControlHandler::process_std_device_in(MessagePipe *pipe,
                                         const SetupPacket &packet) {
  auto *const mgr = pipe->manager();
  switch (packet.get_std_request()) {
  case StdRequestType::GetDescriptor:
    return process_get_descriptor(pipe, packet);
  case StdRequestType::GetConfiguration:
    return pipe->new_in_handler<SendU8>(pipe, mgr->config_id());
  case StdRequestType::GetStatus: {
    uint16_t status = 0;
    if (callback_->is_self_powered()) {
      status |= 0x01;
    }
    if (mgr->remote_wakeup_enabled()) {
      status |= 0x02;
    }
    return pipe->new_in_handler<SendU16>(pipe, status);
  }
  default:
    break;
  }

  USBPAD_LOGW("unknown standard device IN request %u", packet.request);
  return nullptr;
}

CtrlOutXfer *StdControlHandler::process_interface_out(
    MessagePipe *pipe, const SetupPacket &packet) {
  const uint8_t interface_num = packet.index_low();
  auto *const intf = pipe->manager()->get_interface(interface_num);
  if (!intf) {
    USBPAD_LOGW("received SETUP OUT request for unknown interface %u",
                interface_num);
    return pipe->new_out_handler<StallCtrlOut>(pipe);
  }

  if (packet.is_standard() &&
      packet.get_std_request() == StdRequestType::SetInterface) {
    const uint8_t alt = packet.value_low();
    if (!intf->set_alt_setting(alt)) {
      USBPAD_LOGW("rejecting SET_INTERFACE %u for interface %u",
                  alt,
                  interface_num);
      return pipe->new_out_handler<StallCtrlOut>(pipe);
    }
    return pipe->new_out_handler<AckEmptyCtrlOut>(pipe);
  }

  return intf->process_out_setup(pipe, packet);
}

CtrlInXfer *StdControlHandler::process_interface_in(MessagePipe *pipe,
                                                    const SetupPacket &packet) {
  const uint8_t interface_num = packet.index_low();
  auto *const intf = pipe->manager()->get_interface(interface_num);
  if (!intf) {
    USBPAD_LOGW("received SETUP IN request for unknown interface %u",
                interface_num);
    return pipe->new_in_handler<StallCtrlIn>(pipe);
  }

  if (packet.is_standard()) {
    const auto req = packet.get_std_request();
    if (req == StdRequestType::GetStatus) {
      // Interface status is reserved and always 0
      return pipe->new_in_handler<SendU16>(pipe, 0);
    } else if (req == StdRequestType::GetInterface) {
      return pipe->new_in_handler<SendU8>(pipe, intf->alt_setting());
    }
  }

  return intf->process_in_setup(pipe, packet);
}

CtrlOutXfer *StdControlHandler::process_endpoint_out(
    MessagePipe *pipe, const SetupPacket &packet) {
  auto *const mgr = pipe->manager();
  const EndpointAddress addr(packet.index_low());
  const uint8_t num = addr.number().value();

  if (packet.is_standard() &&
      (packet.get_std_request() == StdRequestType::SetFeature ||
       packet.get_std_request() == StdRequestType::ClearFeature)) {
    const bool set = packet.get_std_request() == StdRequestType::SetFeature;
    if (packet.value !=
        static_cast<uint16_t>(FeatureSelector::EndpointHalt)) {
      USBPAD_LOGW("unsupported endpoint feature %u", packet.value);
      return pipe->new_out_handler<StallCtrlOut>(pipe);
    }
    if (addr.number().is_control_pipe()) {
      // Endpoint 0 stalls are cleared by the next SETUP packet anyway
      if (set) {
        return pipe->new_out_handler<StallCtrlOut>(pipe);
      }
      return pipe->new_out_handler<AckEmptyCtrlOut>(pipe);
    }
    if (!mgr->set_endpoint_halt(addr, set)) {
      USBPAD_LOGW("%s_FEATURE(ENDPOINT_HALT) for unopened endpoint 0x%02x",
                  set ? "SET" : "CLEAR",
                  addr.value());
      return pipe->new_out_handler<StallCtrlOut>(pipe);
    }
    return pipe->new_out_handler<AckEmptyCtrlOut>(pipe);
  }

  ControlMessageHandler *handler = nullptr;
  if (addr.is_in()) {
    handler = mgr->get_in_endpoint(num);
  } else {
    handler = mgr->get_out_endpoint(num);
  }
  if (!handler) {
    USBPAD_LOGW("received SETUP OUT request for unknown endpoint 0x%02x",
                addr.value());
    return pipe->new_out_handler<StallCtrlOut>(pipe);
  }
  return handler->process_out_setup(pipe, packet);
}

CtrlInXfer *StdControlHandler::process_endpoint_in(MessagePipe *pipe,
                                                   const SetupPacket &packet) {
  auto *const mgr = pipe->manager();
  const EndpointAddress addr(packet.index_low());
  const uint8_t num = addr.number().value();

  if (packet.is_standard() &&
      packet.get_std_request() == StdRequestType::GetStatus) {
    const auto halted = mgr->is_endpoint_halted(addr);
    if (!halted.has_value()) {
      USBPAD_LOGW("GET_STATUS for unopened endpoint 0x%02x", addr.value());
      return pipe->new_in_handler<StallCtrlIn>(pipe);
    }
    return pipe->new_in_handler<SendU16>(pipe, *halted ? 1 : 0);
  }

  ControlMessageHandler *handler = nullptr;
  if (addr.is_in()) {
    handler = mgr->get_in_endpoint(num);
  } else {
    handler = mgr->get_out_endpoint(num);
  }
  if (!handler) {
    USBPAD_LOGW("received SETUP IN request for unknown endpoint 0x%02x",
                addr.value());
    return pipe->new_in_handler<StallCtrlIn>(pipe);
  }
  return handler->process_in_setup(pipe, packet);
}

CtrlOutXfer *
StdControlHandler::process_set_configuration(MessagePipe *pipe,
                                             const SetupPacket &packet) {
  auto *const mgr = pipe->manager();
  const uint8_t config_id = packet.value_low();
  USBPAD_LOGI("SET_CONFIGURATION: %u", config_id);

  const auto state = mgr->state();
  if (state != DeviceState::Address && state != DeviceState::Configured) {
    USBPAD_LOGW("SET_CONFIGURATION received in device state %d",
                static_cast<int>(state));
    return pipe->new_out_handler<StallCtrlOut>(pipe);
  }

  // Any existing configuration is torn down first, even if the new one is
  // then rejected.
  if (state == DeviceState::Configured) {
    mgr->unconfigure();
  }
  if (config_id != 0 && !callback_->set_configuration(config_id)) {
    USBPAD_LOGW("rejected SET_CONFIGURATION %u request", config_id);
    return pipe->new_out_handler<StallCtrlOut>(pipe);
  }

  return pipe->new_out_handler<AckEmptyCtrlOut>(pipe);
}

CtrlOutXfer *StdControlHandler::process_device_feature(
    MessagePipe *pipe, const SetupPacket &packet, bool set) {
  if (packet.value !=
      static_cast<uint16_t>(FeatureSelector::DeviceRemoteWakeup)) {
    // TEST_MODE is only valid for high speed devices
    USBPAD_LOGW("unsupported device feature %u", packet.value);
    return pipe->new_out_handler<StallCtrlOut>(pipe);
  }
  USBPAD_LOGI("remote wakeup %s", set ? "enabled" : "disabled");
  pipe->manager()->set_remote_wakeup_enabled(set);
  return pipe->new_out_handler<AckEmptyCtrlOut>(pipe);
}

CtrlInXfer *
StdControlHandler::process_get_descriptor(MessagePipe *pipe,
                                          const SetupPacket &packet) {
  const auto desc = callback_->get_descriptor(packet.value, packet.index);
  if (!desc) {
    // This is expected in many cases: e.g., devices that do not support
    // high-speed operation must fail requests for the DeviceQualifier
    // descriptor.
    USBPAD_LOGI(
        "GET_DESCRIPTOR request for non-existent descriptor 0x%04x 0x%04x",
        packet.value,
        packet.index);
    return pipe->new_in_handler<StallCtrlIn>(pipe);
  }

  USBPAD_LOGD(
      "GET_DESCRIPTOR request for 0x%04x 0x%04x", packet.value, packet.index);

  // The device descriptor's bMaxPacketSize0 must match the endpoint 0 packet
  // size negotiated for this bus.  If it doesn't, send a patched copy.
  if (packet.value == desc_setup_value(DescriptorType::Device) &&
      packet.index == 0) {
    DeviceDescriptorParser dd(*desc);
    if (dd.valid() && dd.ep0_max_pkt_size() != ep0_max_packet_size_) {
      USBPAD_LOGV("GET_DESCRIPTOR patching device descriptor EP0 max packet "
                  "size (%u -> %u)",
                  dd.ep0_max_pkt_size(),
                  ep0_max_packet_size_);
      return pipe->new_in_handler<GetDevDescriptorModifyEP0>(
          pipe, *desc, ep0_max_packet_size_);
    }
  }

  return pipe->new_in_handler<GetStaticDescriptor>(pipe, *desc);
}

} // namespace usbpad::device
