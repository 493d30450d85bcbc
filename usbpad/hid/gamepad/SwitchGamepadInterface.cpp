// Copyright (c) 2023, Adam Simpkins
#include "usbpad/hid/gamepad/SwitchGamepadInterface.h"

#include "usbpad/Error.h"
#include "usbpad/device/EndpointManager.h"
#include "usbpad/log.h"

#include <algorithm>

namespace usbpad::hid {

bool SwitchGamepadInterface::configure() {
  if (!open_endpoints()) {
    USBPAD_LOGE("failed to open gamepad IN endpoint %u",
                in_endpoint().endpoint_num());
    return false;
  }

  SwitchGamepadReport::Packed neutral;
  const auto ec = SwitchGamepadReport().pack(neutral);
  if (ec) {
    USBPAD_LOGE("error packing neutral gamepad report: %s",
                ec.message().c_str());
    return false;
  }
  const auto queue_ec = queue_report(neutral);
  if (queue_ec) {
    USBPAD_LOGE("error queueing neutral gamepad report: %s",
                queue_ec.message().c_str());
    return false;
  }
  return true;
}

std::error_code
SwitchGamepadInterface::write_report(const SwitchGamepadReport &report) {
  SwitchGamepadReport::Packed data;
  const auto ec = report.pack(data);
  if (ec) {
    USBPAD_LOGE("error packing SwitchGamepadReport: hat=%u", report.hat);
    return ec;
  }

  // The configuration survives a bus suspend.  Reports written while
  // suspended are queued and reach the host after it resumes the bus.
  if (dev_state_unsuspended(manager_->state()) != DeviceState::Configured) {
    return make_error_code(Error::NotConfigured);
  }
  return queue_report(data);
}

std::error_code SwitchGamepadInterface::queue_report(
    const SwitchGamepadReport::Packed &data) {
  return in_endpoint().write_report(kReportId,
                                    asel::buf_view(data.data(), data.size()));
}

bool SwitchGamepadInterface::set_report(HidReportType type,
                                        uint8_t report_id,
                                        asel::buf_view data) {
  if (type != HidReportType::Output || report_id != kReportId) {
    USBPAD_LOGW("gamepad rejecting SET_REPORT for report %u/%u",
                static_cast<unsigned>(type),
                report_id);
    return false;
  }
  if (data.size() > kOutputReportSize) {
    USBPAD_LOGW("gamepad output report too long: %zu bytes", data.size());
    return false;
  }

  // Short reports leave the remaining bytes zeroed.
  output_report_.fill(0);
  std::copy(data.data(), data.data() + data.size(), output_report_.begin());
  ++num_output_reports_;
  USBPAD_LOGD("gamepad output report received (%zu bytes)", data.size());

  if (callback_) {
    callback_->on_output_report(data);
  }
  return true;
}

std::optional<asel::buf_view>
SwitchGamepadInterface::get_report(HidReportType type, uint8_t report_id) {
  if (type != HidReportType::Output || report_id != kReportId) {
    return std::nullopt;
  }
  return asel::buf_view(output_report_.data(), output_report_.size());
}

} // namespace usbpad::hid
