// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/DeviceEvent.h"
#include "usbpad/hw/HWDeviceBase.h"
#include "usbpad/usb_types.h"
#include "usbpad/usbpad_config.h"
#include "usbpad/usbpad_types.h"

#include <asel/array.h>
#include <asel/buf_view.h>

#include <atomic>
#include <cstddef>
#include <system_error>

namespace usbpad {

struct SetupPacket;

namespace device {
class EndpointManager;
}

/**
 * A mock hardware implementation, for use in unit tests and host-side
 * simulation.
 *
 * Tests can drive the device in two ways: the methods at the bottom of this
 * class deliver an event to the EndpointManager immediately, while
 * post_event() queues an event the same way an interrupt handler would, to be
 * dispatched by the next process_events() call.
 */
class MockDevice : public HWDeviceBase {
public:
  static constexpr size_t kMaxOutEndpoints = USBPAD_CONFIG_MAX_OUT_ENDPOINTS;
  static constexpr size_t kMaxInEndpoints = USBPAD_CONFIG_MAX_IN_ENDPOINTS;
  static constexpr size_t kEventQueueSize = USBPAD_CONFIG_EVENT_QUEUE_SIZE;

  template <typename BufType>
  struct EndpointState {
    void reset() {
      max_packet_size = 0;
      xfer_in_progress = false;
      stalled = false;
      cur_xfer_data = nullptr;
      cur_xfer_size = 0;
    }

    asel::buf_view cur_xfer_buf() const {
      return asel::buf_view(static_cast<const uint8_t *>(cur_xfer_data),
                            cur_xfer_size);
    }

    uint16_t max_packet_size = 0;
    bool xfer_in_progress = false;
    bool stalled = false;
    BufType cur_xfer_data = nullptr;
    size_t cur_xfer_size = 0;
  };
  using OutEndpointState = EndpointState<void *>;
  using InEndpointState = EndpointState<const void *>;

  MockDevice() noexcept = default;

  ////////////////////////////////////////////////////////////////////
  // HWDeviceBase APIs
  ////////////////////////////////////////////////////////////////////

  [[nodiscard]] std::error_code init(device::EndpointManager *mgr);
  void reset();

  /**
   * Dispatch queued events to the EndpointManager.
   *
   * At most kEventQueueSize events are dispatched per call, so that events
   * posted while dispatching cannot keep the caller busy forever.  Returns
   * true if any events were processed.
   */
  bool process_events();

  /**
   * Queue an event for the next process_events() call.
   *
   * This may be called from a different thread than process_events() (it
   * stands in for an interrupt handler), but only from one producer thread.
   * Returns false if the queue is full, in which case the event is dropped.
   */
  [[nodiscard]] bool post_event(const DeviceEvent &event);

  void set_address(uint8_t address);
  void set_address_early(uint8_t address);

  bool configure_ep0(uint8_t max_packet_size);
  [[nodiscard]] bool open_in_endpoint(uint8_t endpoint_num,
                                      EndpointType type,
                                      uint16_t max_packet_size);
  [[nodiscard]] bool open_out_endpoint(uint8_t endpoint_num,
                                       EndpointType type,
                                       uint16_t max_packet_size);
  void close_in_endpoint(uint8_t endpoint_num);
  void close_out_endpoint(uint8_t endpoint_num);

  [[nodiscard]] XferStartResult
  start_write(uint8_t endpoint, const void *data, uint32_t size);
  [[nodiscard]] XferStartResult
  start_read(uint8_t endpoint, void *data, uint32_t size);

  void stall_control_endpoint(uint8_t endpoint_num);
  void set_in_endpoint_stall(uint8_t endpoint_num, bool stall);
  void set_out_endpoint_stall(uint8_t endpoint_num, bool stall);

  uint8_t address() const {
    return address_;
  }
  uint8_t pending_address() const {
    return pending_address_;
  }

  asel::array<OutEndpointState, kMaxOutEndpoints> out_eps;
  asel::array<InEndpointState, kMaxInEndpoints> in_eps;

  ////////////////////////////////////////////////////////////////////
  // Methods to be invoked by test code
  ////////////////////////////////////////////////////////////////////

  void setup_received(const SetupPacket &packet);
  void complete_in_xfer(uint8_t endpoint_num);
  void complete_out_xfer(uint8_t endpoint_num, int32_t bytes_read = -1);
  void reset_in_stall(uint8_t endpoint_num);
  void reset_out_stall(uint8_t endpoint_num);

private:
  MockDevice(MockDevice const &) = delete;
  MockDevice &operator=(MockDevice const &) = delete;

  void dispatch_event(const DeviceEvent &event);

  device::EndpointManager *mgr_ = nullptr;
  uint8_t address_ = 0;
  uint8_t pending_address_ = 0;

  // A single-producer single-consumer ring buffer.  One slot is always left
  // empty to distinguish a full queue from an empty one.
  asel::array<DeviceEvent, kEventQueueSize + 1> events_ = {};
  std::atomic<size_t> event_head_{0};
  std::atomic<size_t> event_tail_{0};
};

} // namespace usbpad
