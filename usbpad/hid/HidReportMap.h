// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/hid/HidReportQueue.h"

#include <asel/chrono.h>

#include <algorithm>
#include <cstdint>
#include <tuple>

namespace usbpad::hid {

/**
 * HidReportMap maps report IDs to the HidReportQueue for each INPUT report
 * sent on a HID IN endpoint.
 */
class HidReportMap {
public:
  constexpr HidReportMap() noexcept = default;

  /**
   * Returns the queue for the given report ID, or nullptr if this map has no
   * such report.
   */
  virtual HidReportQueueBase *get_report_queue(uint8_t report_id) = 0;

  /**
   * Returns the first queue with a report that should be sent now,
   * or nullptr if nothing needs to be transmitted.
   */
  virtual HidReportQueueBase *
  get_next_pending_xfer(asel::chrono::steady_clock::time_point now) = 0;

  virtual uint16_t longest_report_size() const = 0;

  virtual void set_idle_all(uint8_t idle_4ms) = 0;
  virtual void reset_xmit_state() = 0;

protected:
  ~HidReportMap() = default;

private:
  HidReportMap(HidReportMap const &) = delete;
  HidReportMap &operator=(HidReportMap const &) = delete;
};

/**
 * The concrete HidReportMap, holding storage for one HidReportQueue per
 * report.
 *
 * Queues are checked in the order listed, so earlier reports take priority
 * when several need to be transmitted.
 */
template <typename... Queues>
class HidReportMapStorage final : public HidReportMap {
public:
  static_assert(sizeof...(Queues) > 0, "a HID report map needs a report");

  static constexpr size_t kNumReports = sizeof...(Queues);
  static constexpr uint16_t kLongestReportSize =
      std::max({Queues::kReportSize...});

  explicit HidReportMapStorage(uint8_t idle_4ms = 0) noexcept {
    std::apply([idle_4ms](auto &...q) { (q.set_idle_4ms(idle_4ms), ...); },
               queues_);
  }

  HidReportQueueBase *get_report_queue(uint8_t report_id) override {
    return find([report_id](HidReportQueueBase &q) {
      return q.report_id() == report_id;
    });
  }

  HidReportQueueBase *
  get_next_pending_xfer(asel::chrono::steady_clock::time_point now) override {
    return find([now](HidReportQueueBase &q) { return q.needs_xfer(now); });
  }

  uint16_t longest_report_size() const override {
    return kLongestReportSize;
  }

  void set_idle_all(uint8_t idle_4ms) override {
    std::apply([idle_4ms](auto &...q) { (q.set_idle_4ms(idle_4ms), ...); },
               queues_);
  }
  void reset_xmit_state() override {
    std::apply([](auto &...q) { (q.reset_xmit_state(), ...); }, queues_);
  }

  template <size_t N>
  auto &queue() {
    return std::get<N>(queues_);
  }

private:
  template <typename Pred>
  HidReportQueueBase *find(Pred &&pred) {
    HidReportQueueBase *result = nullptr;
    std::apply(
        [&](auto &...q) {
          ((result == nullptr && pred(q) ? (result = &q, true) : false), ...);
        },
        queues_);
    return result;
  }

  std::tuple<Queues...> queues_;
};

} // namespace usbpad::hid
