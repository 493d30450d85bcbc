// Copyright (c) 2023, Adam Simpkins
#include "usbpad/hid/HidInEndpoint.h"

#include "usbpad/Error.h"
#include "usbpad/device/EndpointManager.h"
#include "usbpad/log.h"

#include <cstring>

namespace usbpad::hid {

bool HidInEndpoint::open() {
  if (!manager_->open_in_endpoint(
          endpoint_num_, this, EndpointType::Interrupt, max_packet_size_)) {
    return false;
  }
  open_ = true;

  auto *const queue =
      reports_->get_next_pending_xfer(asel::chrono::steady_clock::now());
  if (queue) {
    start_xfer(queue, asel::chrono::steady_clock::now());
  }
  return true;
}

uint8_t *HidInEndpoint::add_report_prepare(uint8_t report_id,
                                           bool flush_previous_entries) {
  auto *const queue = reports_->get_report_queue(report_id);
  if (!queue) {
    USBPAD_LOGE("attempted to use unknown report ID %u on HID endpoint %u",
                report_id,
                endpoint_num_);
    return nullptr;
  }
  return queue->add_report_get_buffer(flush_previous_entries);
}

void HidInEndpoint::add_report_complete(uint8_t report_id) {
  if (!open_ || xfer_in_progress()) {
    // Sent later, once the endpoint is opened or the current transfer
    // finishes.
    return;
  }
  auto *const queue = reports_->get_report_queue(report_id);
  if (!queue) {
    USBPAD_LOGE("attempted to use unknown report ID %u on HID endpoint %u",
                report_id,
                endpoint_num_);
    return;
  }
  start_xfer(queue, asel::chrono::steady_clock::now());
}

std::error_code HidInEndpoint::write_report(uint8_t report_id,
                                            asel::buf_view data) {
  auto *const queue = reports_->get_report_queue(report_id);
  if (!queue) {
    return make_error_code(Error::UnknownReport);
  }
  if (data.size() != queue->report_size()) {
    USBPAD_LOGE("report %u is %u bytes, but %zu bytes were supplied",
                report_id,
                queue->report_size(),
                data.size());
    return make_error_code(Error::SerializationError);
  }

  memcpy(queue->add_report_get_buffer(), data.data(), data.size());
  add_report_complete(report_id);
  return std::error_code();
}

void HidInEndpoint::poll(asel::chrono::steady_clock::time_point now) {
  if (!open_ || xfer_in_progress()) {
    return;
  }
  auto *const queue = reports_->get_next_pending_xfer(now);
  if (queue) {
    start_xfer(queue, now);
  }
}

void HidInEndpoint::start_xfer(HidReportQueueBase *queue,
                               asel::chrono::steady_clock::time_point now) {
  const auto *const buf = queue->start_xmit(now);
  if (!buf) {
    return;
  }

  // A transfer ends with a short packet.  If the report is an exact multiple
  // of the packet size a zero-length packet is needed to end it, unless it
  // is the longest report, which the host knows cannot be followed by more
  // data.
  const auto report_size = queue->report_size();
  send_zero_length_packet_ =
      report_size != reports_->longest_report_size() &&
      (report_size % max_packet_size_) == 0;

  xmit_queue_ = queue;
  manager_->start_in_write(endpoint_num_, buf, report_size);
}

void HidInEndpoint::finish_xfer() {
  send_zero_length_packet_ = false;
  if (xmit_queue_) {
    xmit_queue_->xmit_finished();
    xmit_queue_ = nullptr;
  }
}

void HidInEndpoint::on_in_ep_unconfigured(XferFailReason reason) {
  USBPAD_LOGD("HID endpoint %u closed: reason=%d",
              endpoint_num_,
              static_cast<int>(reason));
  open_ = false;
  finish_xfer();
  reports_->reset_xmit_state();
}

void HidInEndpoint::on_in_xfer_complete() {
  if (send_zero_length_packet_) {
    send_zero_length_packet_ = false;
    manager_->start_in_write(endpoint_num_, nullptr, 0);
    return;
  }

  finish_xfer();
  poll(asel::chrono::steady_clock::now());
}

void HidInEndpoint::on_in_xfer_failed(XferFailReason reason) {
  USBPAD_LOGW("IN transfer failed on HID endpoint %u: reason=%d",
              endpoint_num_,
              static_cast<int>(reason));
  finish_xfer();
  if (reason == XferFailReason::SoftwareError) {
    // The write could not be started at all; retrying immediately would
    // just fail again.
    return;
  }
  poll(asel::chrono::steady_clock::now());
}

} // namespace usbpad::hid
