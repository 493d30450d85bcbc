// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/SetupPacket.h"
#include "usbpad/usbpad_types.h"

#include <cstdint>
#include <type_traits>
#include <variant>

namespace usbpad {

struct BusResetEvent {};
struct SuspendEvent {};
struct ResumeEvent {};

struct BusEnumDone {
  explicit constexpr BusEnumDone(UsbSpeed spd) : speed{spd} {}

  UsbSpeed speed = UsbSpeed::Low;
};

/*
 * The host may retransmit a SETUP packet if it thinks there was a
 * transmission error, and SETUP packets carry no transaction ID.  Hardware
 * implementations that can detect retransmissions (e.g., by waiting for the
 * first IN or OUT token of the data phase) should only post the last SETUP
 * packet received.  Otherwise a retransmitted SETUP simply cancels and
 * restarts the transfer.
 */
struct SetupPacketEvent {
  explicit constexpr SetupPacketEvent(const SetupPacket &p) : pkt(p) {}

  SetupPacket pkt;
};

struct InXferCompleteEvent {
  explicit constexpr InXferCompleteEvent(uint8_t epnum) : endpoint_num(epnum) {}

  uint8_t endpoint_num{0};
};

struct InXferFailedEvent {
  constexpr InXferFailedEvent(uint8_t epnum, XferFailReason r)
      : endpoint_num(epnum), reason(r) {}

  uint8_t endpoint_num{0};
  XferFailReason reason = XferFailReason::ProtocolError;
};

struct OutXferCompleteEvent {
  constexpr OutXferCompleteEvent(uint8_t epnum, uint32_t bytes)
      : endpoint_num(epnum), bytes_read(bytes) {}

  uint8_t endpoint_num{0};
  uint32_t bytes_read{0};
};

struct OutXferFailedEvent {
  constexpr OutXferFailedEvent(uint8_t epnum, XferFailReason r)
      : endpoint_num(epnum), reason(r) {}

  uint8_t endpoint_num{0};
  XferFailReason reason = XferFailReason::ProtocolError;
};

/**
 * Events reported by the hardware layer.
 *
 * Hardware implementations generally record these from interrupt context and
 * deliver them later from the main USB task, so they must be cheap to copy
 * into a queue.
 */
using DeviceEvent = std::variant<BusResetEvent,
                                 SuspendEvent,
                                 ResumeEvent,
                                 BusEnumDone,
                                 SetupPacketEvent,
                                 InXferCompleteEvent,
                                 InXferFailedEvent,
                                 OutXferCompleteEvent,
                                 OutXferFailedEvent>;
static_assert(std::is_trivially_copyable_v<DeviceEvent>,
              "DeviceEvent must be trivially copyable");

} // namespace usbpad
