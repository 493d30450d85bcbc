// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/desc/InterfaceDescriptor.h"
#include "usbpad/device/Interface.h"
#include "usbpad/hid/HidDescriptor.h"
#include "usbpad/hid/HidInEndpoint.h"
#include "usbpad/hid/HidReportMap.h"
#include "usbpad/hid/types.h"

#include <asel/array.h>
#include <asel/buf_view.h>

#include <optional>

namespace usbpad::device {
class EndpointManager;
}

namespace usbpad::hid {

/**
 * A HID interface with a single interrupt IN endpoint.
 *
 * This handles the HID class requests.  Output and feature reports sent by
 * the host with SET_REPORT are passed to set_report(), which subclasses
 * override to accept them.
 */
class HidInterface : public device::Interface {
public:
  static constexpr size_t kMaxSetReportSize = 64;

  HidInterface(device::EndpointManager *manager,
               InterfaceProtocol protocol,
               asel::buf_view report_descriptor,
               HidReportMap *report_map,
               uint8_t in_endpoint_num,
               uint16_t max_packet_size) noexcept
      : report_descriptor_(report_descriptor),
        hid_descriptor_(
            static_cast<uint16_t>(report_descriptor.size())),
        report_map_(report_map),
        in_endpoint_(manager, in_endpoint_num, max_packet_size, report_map),
        interface_protocol_(protocol) {}

  HidInEndpoint &in_endpoint() {
    return in_endpoint_;
  }
  HidReportMap *report_map() {
    return report_map_;
  }
  HidProtocol protocol() const {
    return protocol_;
  }
  bool supports_boot_protocol() const {
    return interface_protocol_ != InterfaceProtocol::None;
  }

  /**
   * Open the interface's endpoints.  This should be called when handling
   * SET_CONFIGURATION, before EndpointManager::set_configured().
   */
  [[nodiscard]] bool open_endpoints() {
    return in_endpoint_.open();
  }

  void unconfigure() override;

  device::CtrlOutXfer *process_out_setup(device::MessagePipe *pipe,
                                         const SetupPacket &packet) override;
  device::CtrlInXfer *process_in_setup(device::MessagePipe *pipe,
                                       const SetupPacket &packet) override;

  /**
   * Handle the data from a SET_REPORT request.
   *
   * Returns false to reject the report, which fails the request with a STALL.
   */
  [[nodiscard]] virtual bool
  set_report(HidReportType type, uint8_t report_id, asel::buf_view data) {
    return false;
  }

  /**
   * Return the data for a GET_REPORT request for an output or feature report.
   * Input reports are answered from the report queues.
   */
  virtual std::optional<asel::buf_view> get_report(HidReportType type,
                                                   uint8_t report_id) {
    return std::nullopt;
  }

  static constexpr InterfaceDescriptor
  make_interface_descriptor(InterfaceProtocol protocol,
                            uint8_t string_index = 0) {
    return InterfaceDescriptor(
               UsbClass::Hid,
               static_cast<uint8_t>(subclass_for_protocol(protocol)),
               static_cast<uint8_t>(protocol))
        .set_string_index(string_index);
  }

private:
  device::CtrlOutXfer *set_idle(device::MessagePipe *pipe,
                                const SetupPacket &packet);
  device::CtrlOutXfer *set_protocol(device::MessagePipe *pipe,
                                    const SetupPacket &packet);
  device::CtrlInXfer *get_descriptor(device::MessagePipe *pipe,
                                     const SetupPacket &packet);
  device::CtrlInXfer *process_get_report(device::MessagePipe *pipe,
                                         const SetupPacket &packet);
  device::CtrlInXfer *get_idle(device::MessagePipe *pipe,
                               const SetupPacket &packet);

  // The report descriptor and report map are owned by the subclass.
  asel::buf_view const report_descriptor_;
  HidDescriptor const hid_descriptor_;
  HidReportMap *const report_map_ = nullptr;
  HidInEndpoint in_endpoint_;
  InterfaceProtocol const interface_protocol_ = InterfaceProtocol::None;
  HidProtocol protocol_ = HidProtocol::Report;
  asel::array<uint8_t, kMaxSetReportSize> set_report_buf_ = {};
};

} // namespace usbpad::hid
