// Copyright (c) 2023, Adam Simpkins
#include "usbpad/hid/HidReportQueue.h"

#include "usbpad/log.h"

namespace usbpad::hid {

uint8_t *HidReportQueueBase::add_report_get_buffer(bool flush_queue) {
  if (flush_queue) {
    pending_count_ = 0;
  }

  // Pick any entry that is neither being transmitted nor waiting to be.
  uint8_t write_index = kNone;
  for (uint8_t n = 0; n < num_entries_; ++n) {
    if (n != xmit_index_ && !is_pending(n)) {
      write_index = n;
      break;
    }
  }
  if (write_index == kNone) {
    // The queue is full.  Drop the oldest untransmitted entry and reuse it.
    USBPAD_LOGD("HID report queue %u is full: dropped oldest report",
                report_id_);
    write_index = pop_pending();
  }

  push_pending(write_index);
  current_index_ = write_index;
  return entry(current_index_);
}

bool HidReportQueueBase::needs_xfer(
    asel::chrono::steady_clock::time_point now) const {
  if (xmit_in_progress()) {
    return false;
  }
  if (pending_count_ != 0) {
    return true;
  }
  if (idle_4ms_ == 0 || !ever_sent_) {
    return false;
  }
  return now >= time_last_sent_ + idle_period();
}

const uint8_t *
HidReportQueueBase::start_xmit(asel::chrono::steady_clock::time_point now) {
  if (xmit_in_progress()) {
    USBPAD_LOGE("attempted to start a second transmission for HID report %u",
                report_id_);
    return nullptr;
  }

  // With nothing new queued, resend the current state.
  xmit_index_ = (pending_count_ == 0) ? current_index_ : pop_pending();
  time_last_sent_ = now;
  ever_sent_ = true;
  return entry(xmit_index_);
}

void HidReportQueueBase::reset_xmit_state() {
  xmit_index_ = kNone;
  pending_count_ = 0;
  ever_sent_ = false;
}

bool HidReportQueueBase::is_pending(uint8_t index) const {
  for (uint8_t n = 0; n < pending_count_; ++n) {
    if (pending_[(pending_head_ + n) % num_entries_] == index) {
      return true;
    }
  }
  return false;
}

uint8_t HidReportQueueBase::pop_pending() {
  const auto index = pending_[pending_head_];
  pending_head_ = static_cast<uint8_t>((pending_head_ + 1) % num_entries_);
  --pending_count_;
  return index;
}

void HidReportQueueBase::push_pending(uint8_t index) {
  pending_[(pending_head_ + pending_count_) % num_entries_] = index;
  ++pending_count_;
}

} // namespace usbpad::hid
