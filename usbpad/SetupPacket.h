// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/usb_types.h"

namespace usbpad {

enum class SetupRecipient : uint8_t {
  Device = 0,
  Interface = 1,
  Endpoint = 2,
  Other = 3,
};

enum class SetupReqType : uint8_t {
  Standard = 0x00,
  Class = 0x20,
  Vendor = 0x40,
  Reserved = 0x60,
};

enum class StdRequestType : uint8_t {
  GetStatus = 0,
  ClearFeature = 1,
  SetFeature = 3,
  SetAddress = 5,
  GetDescriptor = 6,
  SetDescriptor = 7,
  GetConfiguration = 8,
  SetConfiguration = 9,
  GetInterface = 10,
  SetInterface = 11,
  SynchFrame = 12,
};

/**
 * Feature selectors for SET_FEATURE and CLEAR_FEATURE
 * (Table 9-6 in the USB 2.0 spec).
 */
enum class FeatureSelector : uint16_t {
  EndpointHalt = 0,
  DeviceRemoteWakeup = 1,
  TestMode = 2,
};

/**
 * The 8-byte SETUP packet that starts every control transfer.
 */
struct SetupPacket {
  static constexpr uint8_t kRequestTypeMask = 0x60;
  static constexpr uint8_t kRecipientMask = 0x1f;

  static constexpr uint8_t make_request_type(Direction dir,
                                             SetupRecipient recipient,
                                             SetupReqType type) {
    return static_cast<uint8_t>(dir) | static_cast<uint8_t>(type) |
           static_cast<uint8_t>(recipient);
  }

  static constexpr SetupPacket make(uint8_t request_type,
                                    uint8_t request,
                                    uint16_t value,
                                    uint16_t index,
                                    uint16_t length) {
    SetupPacket pkt;
    pkt.request_type = request_type;
    pkt.request = request;
    pkt.value = value;
    pkt.index = index;
    pkt.length = length;
    return pkt;
  }

  constexpr SetupReqType get_request_type() const {
    return static_cast<SetupReqType>(request_type & kRequestTypeMask);
  }
  constexpr bool is_standard() const {
    return get_request_type() == SetupReqType::Standard;
  }
  constexpr bool is_class() const {
    return get_request_type() == SetupReqType::Class;
  }
  constexpr Direction get_direction() const {
    return (request_type & 0x80) ? Direction::In : Direction::Out;
  }
  constexpr SetupRecipient get_recipient() const {
    return static_cast<SetupRecipient>(request_type & kRecipientMask);
  }

  // Should only be called if is_standard() is true
  constexpr StdRequestType get_std_request() const {
    return static_cast<StdRequestType>(request);
  }

  // Many requests pack two 8-bit arguments into wValue, e.g. the descriptor
  // type and index for GET_DESCRIPTOR, or the report type and ID for HID
  // report requests.
  constexpr uint8_t value_high() const {
    return static_cast<uint8_t>(value >> 8);
  }
  constexpr uint8_t value_low() const {
    return static_cast<uint8_t>(value & 0xff);
  }
  // The interface number or endpoint address for non-device recipients
  constexpr uint8_t index_low() const {
    return static_cast<uint8_t>(index & 0xff);
  }

  bool operator==(const SetupPacket&) const = default;

  uint8_t request_type = 0;
  uint8_t request = 0;
  uint16_t value = 0;
  uint16_t index = 0;
  uint16_t length = 0;
};

} // namespace usbpad
