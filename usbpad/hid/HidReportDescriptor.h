// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/hid/report_types.h"
#include "usbpad/hid/usage/usage_page.h"

#include <array>
#include <cstddef>
#include <cstdint>

namespace usbpad::hid {

namespace detail {
struct ReportDescriptorAppendTag {};
} // namespace detail

/**
 * A builder for HID Report Descriptors.
 *
 * This is intended to be evaluated at compile time, so the resulting
 * descriptor can live in read-only data.  A report descriptor is a sequence of
 * variable-length items rather than a fixed-size table, so every method that
 * adds an item returns a new, longer ReportDescriptor instead of modifying
 * this one.
 *
 * Item payloads are little-endian, and the size bits of each prefix always
 * match the payload width of the method used (1, 2, or 4 bytes).  Whether a
 * payload is interpreted as signed depends on the item: e.g., hosts treat
 * LogicalMaximum as signed only when LogicalMinimum is negative, so an
 * unsigned maximum of 255 with a minimum of 0 must use logical_max_i16().
 */
template <size_t Length = 0>
class ReportDescriptor {
public:
  static constexpr size_t kTotalLength = Length;

  constexpr ReportDescriptor() requires(Length == 0) = default;

  constexpr const std::array<uint8_t, Length> &data() const { return data_; }
  static constexpr size_t size() { return Length; }

  /*
   * Main items
   */

  constexpr auto input(Input flags) const {
    return item_u8(ItemPrefix::Input, flags.u8());
  }
  constexpr auto input_u16(uint16_t flags) const {
    return item_u16(ItemPrefix::Input, flags);
  }
  constexpr auto output(Output flags) const {
    return item_u8(ItemPrefix::Output, flags.u8());
  }
  constexpr auto output_u16(uint16_t flags) const {
    return item_u16(ItemPrefix::Output, flags);
  }
  constexpr auto feature(Feature flags) const {
    return item_u8(ItemPrefix::Feature, flags.u8());
  }
  constexpr auto feature_u16(uint16_t flags) const {
    return item_u16(ItemPrefix::Feature, flags);
  }

  // Every collection() must be matched by a later end_collection().
  constexpr auto collection(CollectionType type) const {
    return item_u8(ItemPrefix::Collection, static_cast<uint8_t>(type));
  }
  constexpr auto end_collection() const {
    return item(ItemPrefix::EndCollection);
  }

  /*
   * Global items
   */

  constexpr auto usage_page(UsagePage page) const {
    return item_u8(ItemPrefix::UsagePage, static_cast<uint8_t>(page));
  }
  constexpr auto usage_page_u16(uint16_t page) const {
    return item_u16(ItemPrefix::UsagePage, page);
  }

  constexpr auto logical_min(int8_t value) const {
    return item_u8(ItemPrefix::LogicalMinimum, static_cast<uint8_t>(value));
  }
  constexpr auto logical_min_i16(int16_t value) const {
    return item_u16(ItemPrefix::LogicalMinimum, static_cast<uint16_t>(value));
  }
  constexpr auto logical_min_i32(int32_t value) const {
    return item_u32(ItemPrefix::LogicalMinimum, static_cast<uint32_t>(value));
  }
  constexpr auto logical_max(int8_t value) const {
    return item_u8(ItemPrefix::LogicalMaximum, static_cast<uint8_t>(value));
  }
  constexpr auto logical_max_i16(int16_t value) const {
    return item_u16(ItemPrefix::LogicalMaximum, static_cast<uint16_t>(value));
  }
  constexpr auto logical_max_i32(int32_t value) const {
    return item_u32(ItemPrefix::LogicalMaximum, static_cast<uint32_t>(value));
  }

  constexpr auto physical_min(int8_t value) const {
    return item_u8(ItemPrefix::PhysicalMinimum, static_cast<uint8_t>(value));
  }
  constexpr auto physical_min_i16(int16_t value) const {
    return item_u16(ItemPrefix::PhysicalMinimum, static_cast<uint16_t>(value));
  }
  constexpr auto physical_min_i32(int32_t value) const {
    return item_u32(ItemPrefix::PhysicalMinimum, static_cast<uint32_t>(value));
  }
  constexpr auto physical_max(int8_t value) const {
    return item_u8(ItemPrefix::PhysicalMaximum, static_cast<uint8_t>(value));
  }
  constexpr auto physical_max_i16(int16_t value) const {
    return item_u16(ItemPrefix::PhysicalMaximum, static_cast<uint16_t>(value));
  }
  constexpr auto physical_max_i32(int32_t value) const {
    return item_u32(ItemPrefix::PhysicalMaximum, static_cast<uint32_t>(value));
  }

  constexpr auto unit_exponent(int8_t exp) const {
    return item_u8(ItemPrefix::UnitExponent, static_cast<uint8_t>(exp));
  }
  constexpr auto unit(uint8_t value) const {
    return item_u8(ItemPrefix::Unit, value);
  }
  constexpr auto unit_u16(uint16_t value) const {
    return item_u16(ItemPrefix::Unit, value);
  }
  constexpr auto unit_u32(uint32_t value) const {
    return item_u32(ItemPrefix::Unit, value);
  }

  // The size of each field, in bits.
  constexpr auto report_size(uint8_t bits) const {
    return item_u8(ItemPrefix::ReportSize, bits);
  }
  // Report ID 0 is reserved, and means the interface does not use report IDs.
  constexpr auto report_id(uint8_t id) const {
    return item_u8(ItemPrefix::ReportID, id);
  }
  constexpr auto report_count(uint8_t count) const {
    return item_u8(ItemPrefix::ReportCount, count);
  }
  constexpr auto report_count_u16(uint16_t count) const {
    return item_u16(ItemPrefix::ReportCount, count);
  }

  constexpr auto push() const {
    return item(ItemPrefix::Push);
  }
  constexpr auto pop() const {
    return item(ItemPrefix::Pop);
  }

  /*
   * Local items
   */

  template <typename T>
  requires is_usage_type_v<T>
  constexpr auto usage(T value) const {
    return item_u8(ItemPrefix::Usage, static_cast<uint8_t>(value));
  }
  constexpr auto usage_u8(uint8_t value) const {
    return item_u8(ItemPrefix::Usage, value);
  }
  constexpr auto usage_u16(uint16_t value) const {
    return item_u16(ItemPrefix::Usage, value);
  }

  template <typename T>
  requires is_usage_type_v<T>
  constexpr auto usage_min(T value) const {
    return item_u8(ItemPrefix::UsageMinimum, static_cast<uint8_t>(value));
  }
  constexpr auto usage_min_u16(uint16_t value) const {
    return item_u16(ItemPrefix::UsageMinimum, value);
  }

  template <typename T>
  requires is_usage_type_v<T>
  constexpr auto usage_max(T value) const {
    return item_u8(ItemPrefix::UsageMaximum, static_cast<uint8_t>(value));
  }
  constexpr auto usage_max_u16(uint16_t value) const {
    return item_u16(ItemPrefix::UsageMaximum, value);
  }

  /*
   * Raw item helpers, for item types without a dedicated method.
   */

  constexpr ReportDescriptor<Length + 1> item(ItemPrefix prefix) const {
    return append(std::array<uint8_t, 1>{{static_cast<uint8_t>(prefix)}});
  }
  constexpr ReportDescriptor<Length + 2> item_u8(ItemPrefix prefix,
                                                 uint8_t value) const {
    return append(std::array<uint8_t, 2>{{
        static_cast<uint8_t>(static_cast<uint8_t>(prefix) | 0x01),
        value,
    }});
  }
  constexpr ReportDescriptor<Length + 3> item_u16(ItemPrefix prefix,
                                                  uint16_t value) const {
    return append(std::array<uint8_t, 3>{{
        static_cast<uint8_t>(static_cast<uint8_t>(prefix) | 0x02),
        static_cast<uint8_t>(value & 0xff),
        static_cast<uint8_t>(value >> 8),
    }});
  }
  // Note that the size bits for a 4-byte payload are 0b11.
  constexpr ReportDescriptor<Length + 5> item_u32(ItemPrefix prefix,
                                                  uint32_t value) const {
    return append(std::array<uint8_t, 5>{{
        static_cast<uint8_t>(static_cast<uint8_t>(prefix) | 0x03),
        static_cast<uint8_t>(value & 0xff),
        static_cast<uint8_t>((value >> 8) & 0xff),
        static_cast<uint8_t>((value >> 16) & 0xff),
        static_cast<uint8_t>(value >> 24),
    }});
  }

private:
  template <size_t X>
  friend class ReportDescriptor;

  template <size_t N>
  constexpr ReportDescriptor<Length + N>
  append(const std::array<uint8_t, N> &item_data) const {
    ReportDescriptor<Length + N> result(detail::ReportDescriptorAppendTag{});
    for (size_t n = 0; n < Length; ++n) {
      result.data_[n] = data_[n];
    }
    for (size_t n = 0; n < N; ++n) {
      result.data_[Length + n] = item_data[n];
    }
    return result;
  }

  constexpr explicit ReportDescriptor(detail::ReportDescriptorAppendTag) {}

  std::array<uint8_t, Length> data_ = {};
};

} // namespace usbpad::hid
