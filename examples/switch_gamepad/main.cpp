// Copyright (c) 2023, Adam Simpkins
#include "usbpad/DeviceEvent.h"
#include "usbpad/UsbDevice.h"
#include "usbpad/desc/ConfigDescriptor.h"
#include "usbpad/desc/DeviceDescriptor.h"
#include "usbpad/desc/EndpointDescriptor.h"
#include "usbpad/desc/StaticDescriptorMap.h"
#include "usbpad/device/EndpointManager.h"
#include "usbpad/hid/HidDescriptor.h"
#include "usbpad/hid/gamepad/SwitchGamepadInterface.h"
#include "usbpad/hw/mock/MockDevice.h"
#include "usbpad/log.h"

#include <asel/chrono.h>

#include <array>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

using namespace usbpad;
using namespace usbpad::device;
using namespace usbpad::hid;
using namespace std::chrono_literals;

namespace {

constexpr uint32_t kDefaultTicks = 1000;
constexpr uint8_t kHostAddress = 5;

/**
 * A HORI-compatible Switch controller with a single gamepad interface.
 */
class SwitchGamepadDevice : public SwitchGamepadCallback {
public:
  static constexpr uint8_t kConfigId = 1;
  static constexpr uint8_t kHidInEndpointNum = 1;
  static constexpr uint8_t kInterfaceStrIdx = 4;

  explicit SwitchGamepadDevice(EndpointManager *manager)
      : gamepad_(manager, kHidInEndpointNum) {
    gamepad_.set_callback(this);
  }

  SwitchGamepadInterface &gamepad() {
    return gamepad_;
  }

  bool set_configuration(uint8_t config_id, EndpointManager &ep_mgr) {
    if (config_id != kConfigId) {
      return false;
    }
    if (!gamepad_.configure()) {
      ep_mgr.unconfigure();
      return false;
    }
    if (!ep_mgr.set_configured(config_id, &gamepad_)) {
      USBPAD_LOGE("error marking gamepad configuration active");
      ep_mgr.unconfigure();
      return false;
    }
    return true;
  }

  void on_suspend() {
    USBPAD_LOGI("gamepad suspended");
  }

  void on_output_report(asel::buf_view data) override {
    std::string hex;
    for (size_t n = 0; n < data.size(); ++n) {
      char buf[4];
      snprintf(buf, sizeof(buf), " %02x", data[n]);
      hex += buf;
    }
    USBPAD_LOGI("output report from host:%s", hex.c_str());
  }

  static constexpr auto make_descriptor_map() {
    DeviceDescriptor dev;
    dev.set_vendor(0x0f0d); // HORI
    dev.set_product(0x0092);
    dev.set_device_release(1, 0);

    auto cfg = SwitchGamepadInterface::update_config_descriptor(
        ConfigDescriptor(kConfigId, ConfigAttr::RemoteWakeup),
        kHidInEndpointNum,
        kInterfaceStrIdx);

    return StaticDescriptorMap()
        .add_device_descriptor(dev)
        .add_language_ids(Language::English_US)
        .add_string(dev.mfgr_str_idx(), "usbpad", Language::English_US)
        .add_string(dev.product_str_idx(), "usbpad Switch Gamepad",
                    Language::English_US)
        .add_string(dev.serial_str_idx(), "0001", Language::English_US)
        .add_string(kInterfaceStrIdx,
                    SwitchGamepadInterface::kInterfaceString,
                    Language::English_US)
        .add_config_descriptor(cfg);
  }

private:
  SwitchGamepadInterface gamepad_;
};

using GamepadUsb = UsbDevice<SwitchGamepadDevice, MockDevice>;

/**
 * Plays the role of the USB host, driving the device only through events
 * posted to the hardware event queue.
 */
class SimulatedHost {
public:
  explicit SimulatedHost(GamepadUsb *usb) : usb_(usb), hw_(usb->hw()) {}

  bool enumerate();

  /**
   * Collect an input report if one is being transmitted.
   *
   * Returns false if the event queue overflowed.
   */
  bool poll_interrupt_in();

  uint32_t num_reports() const {
    return num_reports_;
  }

private:
  bool post(const DeviceEvent &event) {
    if (!hw_->post_event(event)) {
      USBPAD_LOGE("host: hardware event queue overflow");
      return false;
    }
    usb_->process_events();
    return true;
  }

  bool control_in(const SetupPacket &pkt, std::vector<uint8_t> &reply);
  bool control_out(const SetupPacket &pkt, asel::buf_view data = {});
  bool get_descriptor(DescriptorType type,
                      uint8_t index,
                      uint16_t lang,
                      uint16_t length,
                      std::vector<uint8_t> &reply,
                      uint8_t recipient_type = 0x80);
  std::string get_string(uint8_t index);

  GamepadUsb *const usb_ = nullptr;
  MockDevice *const hw_ = nullptr;
  SwitchGamepadReport last_report_;
  uint32_t num_reports_ = 0;
};

bool SimulatedHost::control_in(const SetupPacket &pkt,
                               std::vector<uint8_t> &reply) {
  if (!post(SetupPacketEvent(pkt))) {
    return false;
  }
  auto &in_ep = hw_->in_eps[0];
  if (in_ep.stalled || !in_ep.xfer_in_progress) {
    USBPAD_LOGW("host: control IN request 0x%02x stalled", pkt.request);
    return false;
  }
  const auto data = in_ep.cur_xfer_buf();
  reply.assign(data.data(), data.data() + data.size());
  if (!post(InXferCompleteEvent(0))) {
    return false;
  }

  // Status stage
  if (!hw_->out_eps[0].xfer_in_progress) {
    USBPAD_LOGE("host: device did not start the status stage");
    return false;
  }
  return post(OutXferCompleteEvent(0, 0));
}

bool SimulatedHost::control_out(const SetupPacket &pkt, asel::buf_view data) {
  if (!post(SetupPacketEvent(pkt))) {
    return false;
  }
  if (data.size() > 0) {
    auto &out_ep = hw_->out_eps[0];
    if (out_ep.stalled || !out_ep.xfer_in_progress ||
        out_ep.cur_xfer_size < data.size()) {
      USBPAD_LOGW("host: control OUT request 0x%02x stalled", pkt.request);
      return false;
    }
    memcpy(out_ep.cur_xfer_data, data.data(), data.size());
    if (!post(OutXferCompleteEvent(0, static_cast<uint32_t>(data.size())))) {
      return false;
    }
  }

  auto &in_ep = hw_->in_eps[0];
  if (in_ep.stalled || !in_ep.xfer_in_progress || in_ep.cur_xfer_size != 0) {
    USBPAD_LOGW("host: control OUT request 0x%02x was not acknowledged",
                pkt.request);
    return false;
  }
  return post(InXferCompleteEvent(0));
}

bool SimulatedHost::get_descriptor(DescriptorType type,
                                   uint8_t index,
                                   uint16_t lang,
                                   uint16_t length,
                                   std::vector<uint8_t> &reply,
                                   uint8_t recipient_type) {
  SetupPacket pkt;
  pkt.request_type = recipient_type;
  pkt.request = static_cast<uint8_t>(StdRequestType::GetDescriptor);
  pkt.value = desc_setup_value(type, index);
  pkt.index = lang;
  pkt.length = length;
  return control_in(pkt, reply);
}

std::string SimulatedHost::get_string(uint8_t index) {
  std::vector<uint8_t> reply;
  if (!get_descriptor(DescriptorType::String,
                      index,
                      static_cast<uint16_t>(Language::English_US),
                      255,
                      reply) ||
      reply.size() < 2) {
    return "<none>";
  }
  // Only the ASCII subset of the UTF-16LE string is shown
  std::string result;
  for (size_t n = 2; n + 1 < reply.size(); n += 2) {
    result.push_back(reply[n + 1] == 0 && reply[n] < 0x80
                         ? static_cast<char>(reply[n])
                         : '?');
  }
  return result;
}

bool SimulatedHost::enumerate() {
  if (!post(BusResetEvent()) || !post(BusEnumDone(UsbSpeed::Full))) {
    return false;
  }

  std::vector<uint8_t> reply;
  if (!get_descriptor(DescriptorType::Device, 0, 0, 64, reply)) {
    return false;
  }
  DeviceDescriptorParser dev(asel::buf_view(reply.data(), reply.size()));
  if (!dev.valid()) {
    USBPAD_LOGE("host: bad device descriptor length %zu", reply.size());
    return false;
  }
  const auto product_idx = dev.product_str_idx();
  USBPAD_LOGI("host: found device %04x:%04x, EP0 max packet size %u",
              dev.vendor(),
              dev.product(),
              dev.ep0_max_pkt_size());

  SetupPacket set_address;
  set_address.request_type = 0x00;
  set_address.request = static_cast<uint8_t>(StdRequestType::SetAddress);
  set_address.value = kHostAddress;
  if (!control_out(set_address)) {
    return false;
  }
  USBPAD_LOGI("host: device address is now %u", hw_->address());

  if (!get_descriptor(DescriptorType::Config, 0, 0, 9, reply)) {
    return false;
  }
  const auto total_length =
      ConfigDescriptorParser(asel::buf_view(reply.data(), reply.size()))
          .total_length();
  if (!get_descriptor(DescriptorType::Config, 0, 0, total_length, reply)) {
    return false;
  }
  ConfigDescriptorParser cfg(asel::buf_view(reply.data(), reply.size()));
  if (!cfg.valid()) {
    USBPAD_LOGE("host: bad config descriptor length %zu", reply.size());
    return false;
  }
  const auto ep_desc = cfg.find(DescriptorType::Endpoint);
  const auto hid_desc = cfg.find(DescriptorType::Hid);
  if (!ep_desc || !hid_desc) {
    USBPAD_LOGE("host: incomplete configuration descriptor");
    return false;
  }
  EndpointDescriptorParser ep(*ep_desc);
  HidDescriptorParser hid(*hid_desc);
  const uint8_t config_value = cfg.value();
  const uint16_t report_desc_length = hid.report_descriptor_length();
  USBPAD_LOGI("host: config %u: %u interface(s), endpoint 0x%02x every %u ms",
              config_value,
              cfg.num_interfaces(),
              ep.address().value(),
              ep.interval());

  USBPAD_LOGI("host: product \"%s\"", get_string(product_idx).c_str());
  USBPAD_LOGI("host: interface \"%s\"",
              get_string(SwitchGamepadDevice::kInterfaceStrIdx).c_str());

  SetupPacket set_config;
  set_config.request_type = 0x00;
  set_config.request = static_cast<uint8_t>(StdRequestType::SetConfiguration);
  set_config.value = config_value;
  if (!control_out(set_config)) {
    return false;
  }

  // Interface-recipient GET_DESCRIPTOR for the HID report descriptor
  if (!get_descriptor(DescriptorType::HidReport,
                      0,
                      0,
                      report_desc_length,
                      reply,
                      /*recipient_type=*/0x81)) {
    return false;
  }
  USBPAD_LOGI("host: read %zu byte report descriptor", reply.size());

  // Set the player LEDs, the way a console does after enumeration
  const std::array<uint8_t, SwitchGamepadInterface::kOutputReportSize> leds =
      {{0x01, 0, 0, 0, 0, 0, 0, 0}};
  SetupPacket set_report;
  set_report.request_type = 0x21; // OUT, Interface, Class request
  set_report.request = static_cast<uint8_t>(HidRequest::SetReport);
  set_report.value = static_cast<uint16_t>(HidReportType::Output) << 8;
  set_report.length = leds.size();
  return control_out(set_report, asel::buf_view(leds.data(), leds.size()));
}

bool SimulatedHost::poll_interrupt_in() {
  const auto &ep = hw_->in_eps[SwitchGamepadDevice::kHidInEndpointNum];
  if (!ep.xfer_in_progress) {
    return true;
  }

  const auto report = SwitchGamepadReport::unpack(ep.cur_xfer_buf());
  if (!report) {
    USBPAD_LOGW("host: short input report of %zu bytes", ep.cur_xfer_size);
  } else if (num_reports_ == 0 || *report != last_report_) {
    USBPAD_LOGI("host: report %u: buttons=%04x hat=%u L=(%3u,%3u) R=(%3u,%3u)",
                num_reports_,
                report->buttons,
                report->hat,
                report->lx,
                report->ly,
                report->rx,
                report->ry);
    last_report_ = *report;
  } else {
    USBPAD_LOGD("host: report %u unchanged", num_reports_);
  }
  ++num_reports_;
  return post(InXferCompleteEvent(SwitchGamepadDevice::kHidInEndpointNum));
}

SwitchGamepadReport animate(uint32_t tick) {
  static constexpr SwitchButton kButtons[] = {
      SwitchButton::A,
      SwitchButton::B,
      SwitchButton::X,
      SwitchButton::Y,
      SwitchButton::L,
      SwitchButton::R,
      SwitchButton::ZL,
      SwitchButton::ZR,
  };
  constexpr size_t kNumButtons = sizeof(kButtons) / sizeof(kButtons[0]);

  SwitchGamepadReport report;
  // Hold each button for 50ms, then release it for 50ms
  if ((tick / 50) % 2 == 0) {
    report.press(kButtons[(tick / 100) % kNumButtons]);
  }
  report.set_hat(static_cast<SwitchHat>((tick / 125) % 9));

  // The left stick circles once per second, and the right stick sweeps along X
  constexpr double kPi = 3.14159265358979323846;
  const double angle = 2.0 * kPi * static_cast<double>(tick % 1000) / 1000.0;
  report.lx = static_cast<uint8_t>(0x80 + std::lround(127.0 * std::cos(angle)));
  report.ly = static_cast<uint8_t>(0x80 + std::lround(127.0 * std::sin(angle)));
  report.rx = static_cast<uint8_t>((tick / 4) % 256);
  report.ry = SwitchGamepadReport::kStickCenter;
  return report;
}

GamepadUsb usb;

} // namespace

int main(int argc, char **argv) {
  if (const char *env_level = getenv("USBPAD_LOG_LEVEL")) {
    const auto level = parse_log_level(env_level);
    if (!level) {
      USBPAD_LOGE("invalid USBPAD_LOG_LEVEL \"%s\"", env_level);
      return 2;
    }
    set_log_level(*level);
  }

  uint32_t num_ticks = kDefaultTicks;
  if (argc > 2) {
    fprintf(stderr, "usage: %s [NUM_TICKS]\n", argv[0]);
    return 2;
  } else if (argc == 2) {
    char *end = nullptr;
    const auto value = strtoul(argv[1], &end, 10);
    if (end == argv[1] || *end != '\0' || value == 0) {
      fprintf(stderr, "invalid tick count: %s\n", argv[1]);
      return 2;
    }
    num_ticks = static_cast<uint32_t>(value);
  }

  USBPAD_LOGI("Starting USB initialization...");
  const auto init_err = usb.init();
  if (init_err) {
    USBPAD_LOGE("error initializing USB device: %s",
                init_err.message().c_str());
    return 1;
  }

  SimulatedHost host(&usb);
  if (!host.enumerate()) {
    USBPAD_LOGE("enumeration failed");
    return 1;
  }

  USBPAD_LOGI("Running gamepad task for %u ms...", num_ticks);
  auto &gamepad = usb.dev().gamepad();
  SwitchGamepadReport prev_report;
  auto next_tick = std::chrono::steady_clock::now();
  for (uint32_t tick = 0; tick < num_ticks; ++tick) {
    const auto report = animate(tick);
    if (report != prev_report) {
      const auto err = gamepad.write_report(report);
      if (err) {
        USBPAD_LOGE("error writing gamepad report: %s", err.message().c_str());
        return 1;
      }
      prev_report = report;
    }
    gamepad.poll(asel::chrono::steady_clock::now());
    usb.process_events();
    if (!host.poll_interrupt_in()) {
      return 1;
    }

    next_tick += 1ms;
    std::this_thread::sleep_until(next_tick);
  }

  USBPAD_LOGI("host received %u input reports", host.num_reports());
  return 0;
}
