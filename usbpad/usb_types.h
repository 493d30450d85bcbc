// Copyright (c) 2023, Adam Simpkins
#pragma once

#include <cstdint>

namespace usbpad {

enum class Direction : uint8_t {
  Out = 0,
  In = 0x80,
};

// bmAttributes transfer type bits of an endpoint descriptor
enum class EndpointType : uint8_t {
  Control = 0,
  Isochronous = 1,
  Bulk = 2,
  Interrupt = 3,
};

/**
 * A 4-bit endpoint number, without the direction bit.
 */
class EndpointNumber {
public:
  static constexpr uint8_t kMax = 15;

  explicit constexpr EndpointNumber(uint8_t number) : number_(number & kMax) {}

  constexpr uint8_t value() const {
    return number_;
  }
  constexpr bool is_control_pipe() const {
    return number_ == 0;
  }

private:
  uint8_t number_;
};

/**
 * An endpoint address as used in bEndpointAddress and in the wIndex field of
 * endpoint-recipient requests: bit 7 is the direction, bits 0-3 the number.
 */
class EndpointAddress {
public:
  explicit constexpr EndpointAddress(uint8_t address) : address_(address) {}
  explicit constexpr EndpointAddress(EndpointNumber num, Direction dir)
      : address_(num.value() | static_cast<uint8_t>(dir)) {}

  static constexpr EndpointAddress in(uint8_t number) {
    return EndpointAddress(EndpointNumber(number), Direction::In);
  }
  static constexpr EndpointAddress out(uint8_t number) {
    return EndpointAddress(EndpointNumber(number), Direction::Out);
  }

  constexpr Direction direction() const {
    return static_cast<Direction>(address_ & 0x80);
  }
  constexpr bool is_in() const {
    return direction() == Direction::In;
  }
  constexpr EndpointNumber number() const {
    return EndpointNumber(address_ & 0x0f);
  }

  /**
   * A single bit identifying this endpoint number, for per-direction
   * endpoint bitmasks.
   */
  constexpr uint16_t mask() const {
    return static_cast<uint16_t>(1u << number().value());
  }

  constexpr uint8_t value() const {
    return address_;
  }

  constexpr bool operator==(const EndpointAddress &) const = default;

private:
  uint8_t address_;
};

} // namespace usbpad
