// Copyright (c) 2023, Adam Simpkins
#pragma once

#include <asel/array.h>
#include <asel/chrono.h>

#include <chrono>
#include <cstdint>

namespace usbpad::hid {

/**
 * HidReportQueueBase holds the queue of INPUT report values waiting to be
 * sent for a single HID report ID.
 *
 * The queue always keeps the most recent report value (the "current" entry)
 * so that it can be resent when the idle period elapses or returned for
 * GET_REPORT.  The entry currently being transmitted is never overwritten.
 * If the queue fills up, the oldest untransmitted entry is dropped.
 *
 * The storage is provided by the HidReportQueue subclass.  This base class
 * holds all of the logic so that it is not instantiated once per report
 * size.
 *
 * All methods must be called from the main USB task.
 */
class HidReportQueueBase {
public:
  static constexpr uint8_t kNone = 0xff;

  uint8_t report_id() const {
    return report_id_;
  }
  uint16_t report_size() const {
    return report_size_;
  }

  /**
   * Add a new report to the queue, and return the buffer where its data
   * should be written.
   *
   * The caller must fill in the buffer before returning to the USB task loop.
   * If flush_queue is true, any older reports that have not been transmitted
   * yet are dropped.
   */
  uint8_t *add_report_get_buffer(bool flush_queue = false);

  /**
   * The most recent report value.
   */
  const uint8_t *current_report() const {
    return entry(current_index_);
  }

  /**
   * Returns true if a report should be transmitted now: either a new report
   * has not been sent yet, or the idle period has elapsed since the last
   * transmission.
   */
  bool needs_xfer(asel::chrono::steady_clock::time_point now) const;

  /**
   * Select the report to transmit and mark it as in progress.
   *
   * Returns nullptr if a transmission is already in progress for this queue.
   */
  const uint8_t *start_xmit(asel::chrono::steady_clock::time_point now);

  /**
   * Mark the in-progress transmission as finished (successfully or not).
   */
  void xmit_finished() {
    xmit_index_ = kNone;
  }
  bool xmit_in_progress() const {
    return xmit_index_ != kNone;
  }
  bool has_pending() const {
    return pending_count_ != 0;
  }

  /**
   * Reset the transmit state, e.g. when the endpoint is closed.
   * The current report value is preserved.
   */
  void reset_xmit_state();

  /**
   * Set the idle rate, in units of 4ms.  0 means the report is only sent
   * when its value changes.
   */
  void set_idle_4ms(uint8_t value) {
    idle_4ms_ = value;
  }
  uint8_t idle_4ms() const {
    return idle_4ms_;
  }
  std::chrono::milliseconds idle_period() const {
    return std::chrono::milliseconds(4 * static_cast<uint32_t>(idle_4ms_));
  }

protected:
  HidReportQueueBase(uint8_t *storage,
                     uint8_t *pending,
                     uint8_t report_id,
                     uint16_t report_size,
                     uint8_t num_entries,
                     uint8_t idle_4ms) noexcept
      : storage_(storage),
        pending_(pending),
        report_size_(report_size),
        report_id_(report_id),
        num_entries_(num_entries),
        idle_4ms_(idle_4ms) {}
  ~HidReportQueueBase() = default;

private:
  HidReportQueueBase(HidReportQueueBase const &) = delete;
  HidReportQueueBase &operator=(HidReportQueueBase const &) = delete;

  bool is_pending(uint8_t index) const;
  uint8_t pop_pending();
  void push_pending(uint8_t index);
  uint8_t *entry(uint8_t index) const {
    return storage_ + (static_cast<size_t>(index) * report_size_);
  }

  uint8_t *const storage_ = nullptr;
  // A FIFO of untransmitted entry indices, oldest first.
  uint8_t *const pending_ = nullptr;
  uint16_t const report_size_ = 0;
  uint8_t const report_id_ = 0;
  uint8_t const num_entries_ = 0;

  // Queue indices are in entries, not bytes.
  //
  // current_index_ holds the most recent report.
  uint8_t current_index_ = 0;
  // The entry currently being transmitted, or kNone.
  uint8_t xmit_index_ = kNone;
  uint8_t pending_head_ = 0;
  uint8_t pending_count_ = 0;

  uint8_t idle_4ms_ = 0;
  bool ever_sent_ = false;
  asel::chrono::steady_clock::time_point time_last_sent_;
};

/**
 * A HidReportQueue with storage for NumEntries reports of ReportSize bytes.
 *
 * ReportSize must include the 1-byte report ID prefix if the interface uses
 * report IDs.  At least 2 entries are required: one for the report being
 * transmitted and one for the newest report value.
 */
template <uint8_t ReportId, uint16_t ReportSize, uint8_t NumEntries = 2>
class HidReportQueue : public HidReportQueueBase {
public:
  static_assert(NumEntries >= 2,
                "HidReportQueue must contain at least 2 entries");
  static_assert(NumEntries < HidReportQueueBase::kNone,
                "HidReportQueue may not contain more than 254 entries");

  static constexpr uint8_t kReportId = ReportId;
  static constexpr uint16_t kReportSize = ReportSize;
  static constexpr uint8_t kNumEntries = NumEntries;

  explicit HidReportQueue(uint8_t idle_4ms = 0) noexcept
      : HidReportQueueBase(
            storage_.data(),
            pending_.data(),
            ReportId,
            ReportSize,
            NumEntries,
            idle_4ms) {}

private:
  asel::array<uint8_t, ReportSize * NumEntries> storage_ = {};
  asel::array<uint8_t, NumEntries> pending_ = {};
};

} // namespace usbpad::hid
