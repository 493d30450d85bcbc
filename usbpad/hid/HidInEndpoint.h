// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/desc/EndpointDescriptor.h"
#include "usbpad/device/InEndpoint.h"
#include "usbpad/hid/HidReportMap.h"
#include "usbpad/usbpad_types.h"

#include <asel/buf_view.h>
#include <asel/chrono.h>

#include <cstdint>
#include <system_error>

namespace usbpad::device {
class EndpointManager;
}

namespace usbpad::hid {

/**
 * An interrupt IN endpoint that transmits HID INPUT reports.
 */
class HidInEndpoint : public device::InEndpoint {
public:
  constexpr HidInEndpoint(device::EndpointManager *manager,
                          uint8_t endpoint_num,
                          uint16_t max_packet_size,
                          HidReportMap *reports) noexcept
      : manager_(manager),
        reports_(reports),
        max_packet_size_(max_packet_size),
        endpoint_num_(endpoint_num) {}

  uint8_t endpoint_num() const {
    return endpoint_num_;
  }
  uint16_t max_packet_size() const {
    return max_packet_size_;
  }
  bool is_open() const {
    return open_;
  }
  bool xfer_in_progress() const {
    return xmit_queue_ != nullptr;
  }

  /**
   * Open the endpoint on the EndpointManager.
   *
   * Any reports that were queued while the endpoint was closed are
   * transmitted immediately.
   */
  [[nodiscard]] bool open();

  /**
   * Prepare to add a new INPUT report for the specified report ID.
   *
   * Returns the buffer where the report data should be written, or nullptr if
   * the report ID is unknown.  The caller must fill in the buffer and then
   * call add_report_complete() before returning to the USB task loop.
   */
  uint8_t *add_report_prepare(uint8_t report_id,
                              bool flush_previous_entries = false);
  void add_report_complete(uint8_t report_id);

  /**
   * Copy a complete INPUT report into the queue for the given report ID and
   * start transmitting it if the endpoint is idle.
   *
   * Fails with Error::UnknownReport if this endpoint has no such report, or
   * Error::SerializationError if the data is not exactly the report size.
   */
  std::error_code write_report(uint8_t report_id, asel::buf_view data);

  /**
   * Start a transmission if a report needs to be resent because its idle
   * period has elapsed.
   *
   * This should be called periodically from the USB task.
   */
  void poll(asel::chrono::steady_clock::time_point now);

  static constexpr EndpointDescriptor
  make_descriptor(uint8_t endpoint_num,
                  uint16_t max_packet_size,
                  uint8_t interval_ms = 10) {
    return EndpointDescriptor()
        .set_address(EndpointAddress::in(endpoint_num))
        .set_type(EndpointType::Interrupt)
        .set_max_packet_size(max_packet_size)
        .set_interval(interval_ms);
  }

  void on_in_ep_unconfigured(XferFailReason reason) override;
  void on_in_xfer_complete() override;
  void on_in_xfer_failed(XferFailReason reason) override;

private:
  HidInEndpoint(HidInEndpoint const &) = delete;
  HidInEndpoint &operator=(HidInEndpoint const &) = delete;

  void start_xfer(HidReportQueueBase *queue,
                  asel::chrono::steady_clock::time_point now);
  void finish_xfer();

  device::EndpointManager *const manager_ = nullptr;
  HidReportMap *const reports_ = nullptr;
  // The queue whose report is currently being transmitted
  HidReportQueueBase *xmit_queue_ = nullptr;
  uint16_t const max_packet_size_ = 0;
  uint8_t const endpoint_num_ = 0;
  bool open_ = false;
  bool send_zero_length_packet_ = false;
};

} // namespace usbpad::hid
