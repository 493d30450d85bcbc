// Copyright (c) 2023, Adam Simpkins
#include "usbpad/hw/mock/MockDevice.h"

#include "usbpad/SetupPacket.h"
#include "usbpad/device/EndpointManager.h"
#include "usbpad/log.h"

#include <asel/test/checks.h>

#include <variant>

namespace {

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // unnamed namespace

namespace usbpad {

std::error_code MockDevice::init(device::EndpointManager *mgr) {
  mgr_ = mgr;
  return {};
}

void MockDevice::reset() {
  for (size_t n = 0; n < out_eps.size(); ++n) {
    out_eps[n].reset();
  }
  for (size_t n = 0; n < in_eps.size(); ++n) {
    in_eps[n].reset();
  }
  address_ = 0;
  pending_address_ = 0;
  event_tail_.store(event_head_.load(std::memory_order_acquire),
                    std::memory_order_release);
}

bool MockDevice::post_event(const DeviceEvent &event) {
  const auto head = event_head_.load(std::memory_order_relaxed);
  const auto next = (head + 1) % events_.size();
  if (next == event_tail_.load(std::memory_order_acquire)) {
    USBPAD_LOGW("mock device event queue full; dropping event %zu",
                event.index());
    return false;
  }
  events_[head] = event;
  event_head_.store(next, std::memory_order_release);
  return true;
}

bool MockDevice::process_events() {
  bool processed_events = false;
  for (size_t n = 0; n < kEventQueueSize; ++n) {
    const auto tail = event_tail_.load(std::memory_order_relaxed);
    if (tail == event_head_.load(std::memory_order_acquire)) {
      break;
    }
    // Copy the event out before releasing the slot to the producer.
    const DeviceEvent event = events_[tail];
    event_tail_.store((tail + 1) % events_.size(), std::memory_order_release);

    processed_events = true;
    dispatch_event(event);
  }
  return processed_events;
}

void MockDevice::dispatch_event(const DeviceEvent &event) {
  if (!mgr_) {
    USBPAD_LOGE("mock device event received before init()");
    return;
  }
  std::visit(
      overloaded{
          [this](const BusResetEvent &) { mgr_->on_bus_reset(); },
          [this](const SuspendEvent &) { mgr_->on_suspend(); },
          [this](const ResumeEvent &) { mgr_->on_resume(); },
          [this](const BusEnumDone &ev) { mgr_->on_enum_done(ev.speed); },
          [this](const SetupPacketEvent &ev) { setup_received(ev.pkt); },
          [this](const InXferCompleteEvent &ev) {
            in_eps[ev.endpoint_num].xfer_in_progress = false;
            mgr_->on_in_xfer_complete(ev.endpoint_num);
          },
          [this](const InXferFailedEvent &ev) {
            in_eps[ev.endpoint_num].xfer_in_progress = false;
            mgr_->on_in_xfer_failed(ev.endpoint_num, ev.reason);
          },
          [this](const OutXferCompleteEvent &ev) {
            out_eps[ev.endpoint_num].xfer_in_progress = false;
            mgr_->on_out_xfer_complete(ev.endpoint_num, ev.bytes_read);
          },
          [this](const OutXferFailedEvent &ev) {
            out_eps[ev.endpoint_num].xfer_in_progress = false;
            mgr_->on_out_xfer_failed(ev.endpoint_num, ev.reason);
          },
      },
      event);
}

void MockDevice::set_address(uint8_t address) {
  address_ = address;
  pending_address_ = address;
}

void MockDevice::set_address_early(uint8_t address) {
  pending_address_ = address;
}

bool MockDevice::configure_ep0(uint8_t max_packet_size) {
  out_eps[0].max_packet_size = max_packet_size;
  in_eps[0].max_packet_size = max_packet_size;
  return true;
}

bool MockDevice::open_in_endpoint(uint8_t endpoint_num,
                                  EndpointType type,
                                  uint16_t max_packet_size) {
  if (endpoint_num == 0 || endpoint_num >= in_eps.size()) {
    return false;
  }
  if (in_eps[endpoint_num].max_packet_size != 0) {
    // endpoint already open
    return false;
  }

  in_eps[endpoint_num].max_packet_size = max_packet_size;
  return true;
}

bool MockDevice::open_out_endpoint(uint8_t endpoint_num,
                                   EndpointType type,
                                   uint16_t max_packet_size) {
  if (endpoint_num == 0 || endpoint_num >= out_eps.size()) {
    return false;
  }
  if (out_eps[endpoint_num].max_packet_size != 0) {
    // endpoint already open
    return false;
  }

  out_eps[endpoint_num].max_packet_size = max_packet_size;
  return true;
}

void MockDevice::close_in_endpoint(uint8_t endpoint_num) {
  if (endpoint_num < in_eps.size()) {
    in_eps[endpoint_num].reset();
  }
}

void MockDevice::close_out_endpoint(uint8_t endpoint_num) {
  if (endpoint_num < out_eps.size()) {
    out_eps[endpoint_num].reset();
  }
}

XferStartResult
MockDevice::start_write(uint8_t endpoint, const void *data, uint32_t size) {
  if (endpoint >= in_eps.size()) {
    return XferStartResult::EndpointNotConfigured;
  }
  auto &ep = in_eps[endpoint];
  if (ep.max_packet_size == 0) {
    return XferStartResult::EndpointNotConfigured;
  }
  if (ep.xfer_in_progress) {
    return XferStartResult::Busy;
  }
  ep.xfer_in_progress = true;
  ep.cur_xfer_data = data;
  ep.cur_xfer_size = size;
  return XferStartResult::Ok;
}

XferStartResult
MockDevice::start_read(uint8_t endpoint, void *data, uint32_t size) {
  if (endpoint >= out_eps.size()) {
    return XferStartResult::EndpointNotConfigured;
  }
  auto &ep = out_eps[endpoint];
  if (ep.max_packet_size == 0) {
    return XferStartResult::EndpointNotConfigured;
  }
  if (ep.xfer_in_progress) {
    return XferStartResult::Busy;
  }
  ep.xfer_in_progress = true;
  ep.cur_xfer_data = data;
  ep.cur_xfer_size = size;
  return XferStartResult::Ok;
}

void MockDevice::stall_control_endpoint(uint8_t endpoint_num) {
  in_eps[endpoint_num].stalled = true;
  out_eps[endpoint_num].stalled = true;
}

void MockDevice::set_in_endpoint_stall(uint8_t endpoint_num, bool stall) {
  in_eps[endpoint_num].stalled = stall;
}

void MockDevice::set_out_endpoint_stall(uint8_t endpoint_num, bool stall) {
  out_eps[endpoint_num].stalled = stall;
}

void MockDevice::setup_received(const SetupPacket &packet) {
  // A new SETUP packet clears any STALL on the control endpoint
  in_eps[0].stalled = false;
  out_eps[0].stalled = false;
  in_eps[0].xfer_in_progress = false;
  out_eps[0].xfer_in_progress = false;
  mgr_->on_setup_received(0, packet);
}

void MockDevice::complete_in_xfer(uint8_t endpoint_num) {
  auto &ep = in_eps[endpoint_num];
  if (!ASEL_EXPECT_TRUE(ep.xfer_in_progress)) {
    return;
  }
  ep.cur_xfer_data = nullptr;
  ep.cur_xfer_size = 0;
  ep.xfer_in_progress = false;
  mgr_->on_in_xfer_complete(endpoint_num);
}

void MockDevice::complete_out_xfer(uint8_t endpoint_num, int32_t bytes_read) {
  auto &ep = out_eps[endpoint_num];
  if (!ASEL_EXPECT_TRUE(ep.xfer_in_progress)) {
    return;
  }

  const uint32_t bytes_read_reply =
      bytes_read >= 0 ? static_cast<uint32_t>(bytes_read) : ep.cur_xfer_size;

  ep.cur_xfer_data = nullptr;
  ep.cur_xfer_size = 0;
  ep.xfer_in_progress = false;
  mgr_->on_out_xfer_complete(endpoint_num, bytes_read_reply);
}

void MockDevice::reset_in_stall(uint8_t endpoint_num) {
  in_eps[endpoint_num].stalled = false;
}

void MockDevice::reset_out_stall(uint8_t endpoint_num) {
  out_eps[endpoint_num].stalled = false;
}

} // namespace usbpad
