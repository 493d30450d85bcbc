// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/desc/ConfigDescriptor.h"
#include "usbpad/hid/HidDescriptor.h"
#include "usbpad/hid/HidInEndpoint.h"
#include "usbpad/hid/HidInterface.h"
#include "usbpad/hid/HidReportMap.h"
#include "usbpad/hid/HidReportQueue.h"
#include "usbpad/hid/gamepad/SwitchGamepadReport.h"

#include <asel/buf_view.h>

#include <array>
#include <cstdint>
#include <system_error>

namespace usbpad::device {
class EndpointManager;
}

namespace usbpad::hid {

class SwitchGamepadCallback {
public:
  /**
   * Called when the host sends an output report with SET_REPORT.
   */
  virtual void on_output_report(asel::buf_view data) = 0;

protected:
  ~SwitchGamepadCallback() = default;
};

/**
 * A boot-subclass gamepad interface compatible with the Nintendo Switch.
 *
 * This uses a single 8-byte interrupt IN endpoint polled every millisecond.
 * The host sends vendor-defined output reports with SET_REPORT on endpoint 0.
 */
class SwitchGamepadInterface : public HidInterface {
public:
  static constexpr uint16_t kMaxPacketSize = 8;
  static constexpr uint8_t kIntervalMs = 1;
  // 10ms, in units of 4ms
  static constexpr uint8_t kDefaultIdle4ms = 10 / 4;
  static constexpr uint8_t kReportId = 0;
  static constexpr size_t kOutputReportSize = 8;
  static constexpr char kInterfaceString[] = "Switch Gamepad";

  static constexpr auto kReportDescriptor =
      make_switch_gamepad_report_descriptor();

  using ReportQueue = HidReportQueue<kReportId, SwitchGamepadReport::kSize>;
  using OutputReport = std::array<uint8_t, kOutputReportSize>;

  SwitchGamepadInterface(device::EndpointManager *manager,
                         uint8_t in_endpoint_num) noexcept
      : HidInterface(manager,
                     InterfaceProtocol::Gamepad,
                     asel::buf_view(kReportDescriptor.data().data(),
                                    kReportDescriptor.size()),
                     &report_map_,
                     in_endpoint_num,
                     kMaxPacketSize),
        manager_(manager) {}

  void set_callback(SwitchGamepadCallback *callback) {
    callback_ = callback;
  }

  /**
   * Open the IN endpoint and queue a report with all controls at rest.
   *
   * This should be called while handling SET_CONFIGURATION, before the
   * interface is passed to EndpointManager::set_configured().
   */
  [[nodiscard]] bool configure();

  /**
   * Queue a new input report for transmission.
   *
   * Fails with Error::NotConfigured if the host has not configured the
   * device, or Error::SerializationError if the report cannot be encoded.
   * Reports written while the bus is suspended are sent after it resumes.
   */
  std::error_code write_report(const SwitchGamepadReport &report);

  /**
   * Resend the current report if its idle period has elapsed.
   */
  void poll(asel::chrono::steady_clock::time_point now) {
    in_endpoint().poll(now);
  }

  /**
   * The most recent output report received from the host.
   * This is all zeros until the host sends one.
   */
  const OutputReport &last_output_report() const {
    return output_report_;
  }
  uint32_t num_output_reports() const {
    return num_output_reports_;
  }

  [[nodiscard]] bool set_report(HidReportType type,
                                uint8_t report_id,
                                asel::buf_view data) override;
  std::optional<asel::buf_view> get_report(HidReportType type,
                                           uint8_t report_id) override;

  static constexpr InterfaceDescriptor
  make_interface_descriptor(uint8_t string_index = 0) {
    return HidInterface::make_interface_descriptor(InterfaceProtocol::Gamepad,
                                                   string_index);
  }

  static constexpr HidDescriptor make_hid_descriptor() {
    return HidDescriptor(static_cast<uint16_t>(kReportDescriptor.size()));
  }

  /**
   * Append the interface, HID, and endpoint descriptors for this interface
   * to a configuration descriptor.
   */
  template <size_t TotalLength, uint8_t NumInterfaces>
  static constexpr auto
  update_config_descriptor(ConfigDescriptor<TotalLength, NumInterfaces> cfg,
                           uint8_t endpoint_num,
                           uint8_t string_index = 0) {
    return cfg.add_interface(make_interface_descriptor(string_index))
        .add_descriptor(make_hid_descriptor().data())
        .add_endpoint(HidInEndpoint::make_descriptor(
            endpoint_num, kMaxPacketSize, kIntervalMs));
  }

private:
  std::error_code queue_report(const SwitchGamepadReport::Packed &data);

  device::EndpointManager *const manager_ = nullptr;
  SwitchGamepadCallback *callback_ = nullptr;
  HidReportMapStorage<ReportQueue> report_map_{kDefaultIdle4ms};
  OutputReport output_report_ = {};
  uint32_t num_output_reports_ = 0;
};

} // namespace usbpad::hid
