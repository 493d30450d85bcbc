// Copyright (c) 2023, Adam Simpkins
#include "usbpad/hid/HidInterface.h"

#include "usbpad/SetupPacket.h"
#include "usbpad/desc/types.h"
#include "usbpad/device/MessagePipe.h"
#include "usbpad/device/ctrl/AckEmptyCtrlOut.h"
#include "usbpad/device/ctrl/GetStaticDescriptor.h"
#include "usbpad/device/ctrl/SendData.h"
#include "usbpad/device/ctrl/Stall.h"
#include "usbpad/hid/HidGetReport.h"
#include "usbpad/hid/HidSetReport.h"
#include "usbpad/log.h"

using namespace usbpad::device;

namespace usbpad::hid {

void HidInterface::unconfigure() {
  // The protocol reverts to Report whenever the interface is reset
  protocol_ = HidProtocol::Report;
}

CtrlOutXfer *HidInterface::process_out_setup(MessagePipe *pipe,
                                             const SetupPacket &packet) {
  if (packet.is_class()) {
    switch (static_cast<HidRequest>(packet.request)) {
    case HidRequest::SetIdle:
      return set_idle(pipe, packet);
    case HidRequest::SetProtocol:
      return set_protocol(pipe, packet);
    case HidRequest::SetReport:
      return pipe->new_out_handler<HidSetReport>(
          pipe, this, set_report_buf_.data(), set_report_buf_.size());
    default:
      break;
    }
  } else if (packet.is_standard() &&
             packet.get_std_request() == StdRequestType::SetDescriptor) {
    USBPAD_LOGW("unsupported SET_DESCRIPTOR request for HID descriptor 0x%04x",
                packet.value);
    return pipe->new_out_handler<StallCtrlOut>(pipe);
  }

  USBPAD_LOGW("unhandled control OUT request (0x%02x 0x%02x) to HID interface",
              packet.request_type,
              packet.request);
  return nullptr;
}

CtrlInXfer *HidInterface::process_in_setup(MessagePipe *pipe,
                                           const SetupPacket &packet) {
  if (packet.is_standard()) {
    if (packet.get_std_request() == StdRequestType::GetDescriptor) {
      return get_descriptor(pipe, packet);
    }
  } else if (packet.is_class()) {
    switch (static_cast<HidRequest>(packet.request)) {
    case HidRequest::GetReport:
      return process_get_report(pipe, packet);
    case HidRequest::GetIdle:
      return get_idle(pipe, packet);
    case HidRequest::GetProtocol:
      USBPAD_LOGD("HID GET_PROTOCOL");
      return pipe->new_in_handler<SendU8>(pipe,
                                          static_cast<uint8_t>(protocol_));
    default:
      break;
    }
  }

  USBPAD_LOGW("unhandled control IN request (0x%02x 0x%02x) to HID interface",
              packet.request_type,
              packet.request);
  return nullptr;
}

CtrlOutXfer *HidInterface::set_idle(MessagePipe *pipe,
                                    const SetupPacket &packet) {
  const uint8_t duration_4ms = packet.value_high();
  const uint8_t report_id = packet.value_low();
  USBPAD_LOGI("HID SET_IDLE: report_id=%u duration=%u",
              report_id,
              duration_4ms);

  // Report ID 0 applies the idle rate to all input reports
  if (report_id == 0) {
    report_map_->set_idle_all(duration_4ms);
    return pipe->new_out_handler<AckEmptyCtrlOut>(pipe);
  }

  auto *const queue = report_map_->get_report_queue(report_id);
  if (!queue) {
    USBPAD_LOGW("received SET_IDLE request for unknown HID report %u",
                report_id);
    return pipe->new_out_handler<StallCtrlOut>(pipe);
  }
  queue->set_idle_4ms(duration_4ms);
  return pipe->new_out_handler<AckEmptyCtrlOut>(pipe);
}

CtrlOutXfer *HidInterface::set_protocol(MessagePipe *pipe,
                                        const SetupPacket &packet) {
  USBPAD_LOGI("HID SET_PROTOCOL %u", packet.value);
  if (packet.value == static_cast<uint16_t>(HidProtocol::Report)) {
    protocol_ = HidProtocol::Report;
  } else if (packet.value == static_cast<uint16_t>(HidProtocol::Boot) &&
             supports_boot_protocol()) {
    protocol_ = HidProtocol::Boot;
  } else {
    USBPAD_LOGW("rejecting HID SET_PROTOCOL %u", packet.value);
    return pipe->new_out_handler<StallCtrlOut>(pipe);
  }
  return pipe->new_out_handler<AckEmptyCtrlOut>(pipe);
}

CtrlInXfer *HidInterface::get_descriptor(MessagePipe *pipe,
                                         const SetupPacket &packet) {
  USBPAD_LOGD("HID GET_DESCRIPTOR: value=0x%04x", packet.value);
  // Physical descriptors are discouraged by the HID spec, and not supported.
  if (packet.value == desc_setup_value(DescriptorType::HidReport, 0)) {
    return pipe->new_in_handler<GetStaticDescriptor>(pipe,
                                                     report_descriptor_);
  } else if (packet.value == desc_setup_value(DescriptorType::Hid, 0)) {
    return pipe->new_in_handler<GetStaticDescriptor>(
        pipe, asel::buf_view(hid_descriptor_.bytes(), HidDescriptor::kSize));
  }

  USBPAD_LOGV("GET_DESCRIPTOR request for non-existent HID class "
              "descriptor 0x%04x",
              packet.value);
  return pipe->new_in_handler<StallCtrlIn>(pipe);
}

CtrlInXfer *HidInterface::process_get_report(MessagePipe *pipe,
                                             const SetupPacket &packet) {
  const auto report_type = static_cast<HidReportType>(packet.value_high());
  const uint8_t report_id = packet.value_low();
  USBPAD_LOGD("HID GET_REPORT: report_type=%u report_id=%u",
              static_cast<unsigned>(report_type),
              report_id);

  if (report_type == HidReportType::Input) {
    auto *const queue = report_map_->get_report_queue(report_id);
    if (!queue) {
      USBPAD_LOGW("received GET_REPORT request for unknown HID input report %u",
                  report_id);
      return pipe->new_in_handler<StallCtrlIn>(pipe);
    }
    return pipe->new_in_handler<HidGetReport>(
        pipe, asel::buf_view(queue->current_report(), queue->report_size()));
  }

  const auto report = get_report(report_type, report_id);
  if (!report) {
    USBPAD_LOGW("received GET_REPORT request for unknown HID report %u/%u",
                static_cast<unsigned>(report_type),
                report_id);
    return pipe->new_in_handler<StallCtrlIn>(pipe);
  }
  return pipe->new_in_handler<HidGetReport>(pipe, *report);
}

CtrlInXfer *HidInterface::get_idle(MessagePipe *pipe,
                                   const SetupPacket &packet) {
  const uint8_t report_id = packet.value_low();
  USBPAD_LOGD("HID GET_IDLE: report_id=%u", report_id);

  auto *const queue = report_map_->get_report_queue(report_id);
  if (!queue) {
    USBPAD_LOGW("received GET_IDLE request for unknown HID report %u",
                report_id);
    return pipe->new_in_handler<StallCtrlIn>(pipe);
  }
  return pipe->new_in_handler<SendU8>(pipe, queue->idle_4ms());
}

} // namespace usbpad::hid
