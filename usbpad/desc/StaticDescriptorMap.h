// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/desc/ConfigDescriptor.h"
#include "usbpad/desc/DeviceDescriptor.h"
#include "usbpad/desc/StaticDescriptorMapUtils.h"

#include <asel/buf_view.h>

#include <array>
#include <limits>
#include <optional>
#include <type_traits>

namespace usbpad {

/**
 * A USB descriptor map constructed at compile time.
 *
 * This holds the device, configuration and string descriptors returned in
 * response to standard GET_DESCRIPTOR requests, so it can be stored in
 * read-only memory.  Each add_*() call returns a new, larger map.
 *
 * Adding two descriptors with the same wValue/wIndex pair is an error, and
 * causes a compile failure when the map is built in a constant expression.
 */
template <uint16_t NumDescriptors = 0, size_t DataLength = 0>
class StaticDescriptorMap {
public:
  static constexpr uint16_t num_descriptors = NumDescriptors;

  /**
   * Default constructor.
   *
   * Only valid for empty maps.
   */
  constexpr StaticDescriptorMap()
    requires(NumDescriptors == 0 && DataLength == 0)
  = default;

  /**
   * Add the device descriptor.
   */
  constexpr StaticDescriptorMap<NumDescriptors + 1,
                                DataLength + DeviceDescriptor::kSize>
  add_device_descriptor(const DeviceDescriptor &dev) const {
    return add_descriptor(DescriptorType::Device, 0, dev.data());
  }

  /**
   * Add string descriptor 0, which lists the supported language IDs.
   */
  template <typename... LangIDs>
  constexpr StaticDescriptorMap<NumDescriptors + 1,
                                DataLength + 4 + (2 * sizeof...(LangIDs))>
  add_language_ids(Language lang, LangIDs... rest) const {
    constexpr size_t kLen = 4 + (2 * sizeof...(LangIDs));
    std::array<uint8_t, kLen> desc = {};
    desc[0] = kLen;
    desc[1] = static_cast<uint8_t>(DescriptorType::String);
    detail::fill_lang_descriptor(desc.data() + 2, lang, rest...);
    return add_descriptor(DescriptorType::String, 0, desc);
  }

  /**
   * Add a configuration descriptor.
   *
   * Configuration descriptor indices are assigned in the order they are
   * added.
   */
  template <size_t ConfigTotalLength, uint8_t NumInterfaces>
  constexpr StaticDescriptorMap<NumDescriptors + 1,
                                DataLength + ConfigTotalLength>
  add_config_descriptor(
      const ConfigDescriptor<ConfigTotalLength, NumInterfaces> &cfg) const {
    return add_descriptor(
        DescriptorType::Config, count_config_descriptors(), cfg.data());
  }

  /**
   * Add a string descriptor with a specified index.
   *
   * This accepts the string data as UTF-8, and converts it to the UTF-16LE
   * encoding required for string descriptors.
   */
  template <size_t N>
  constexpr StaticDescriptorMap<NumDescriptors + 1, DataLength + N * 2>
  add_string(uint8_t index, const char (&str)[N], Language language) const {
    const auto desc = detail::make_string_descriptor<N>(str);
    return StaticDescriptorMap<NumDescriptors + 1, DataLength + N * 2>(
        *this,
        desc_setup_value(DescriptorType::String, index),
        desc_setup_index(language),
        desc,
        /*used_length=*/desc[0]);
  }

  template <size_t DescLen>
  constexpr StaticDescriptorMap<NumDescriptors + 1, DataLength + DescLen>
  add_descriptor(DescriptorType type,
                 uint8_t desc_index,
                 const std::array<uint8_t, DescLen> &desc) const {
    return add_descriptor_with_setup_ids(
        desc_setup_value(type, desc_index), 0, desc);
  }

  /**
   * Add a descriptor using the wValue and wIndex fields as found in a SETUP
   * packet.
   */
  template <size_t DescLen>
  constexpr StaticDescriptorMap<NumDescriptors + 1, DataLength + DescLen>
  add_descriptor_with_setup_ids(uint16_t wvalue,
                                uint16_t windex,
                                const std::array<uint8_t, DescLen> &desc) const {
    return StaticDescriptorMap<NumDescriptors + 1, DataLength + DescLen>(
        *this, wvalue, windex, desc, DescLen);
  }

  /**
   * Look up a descriptor by the wValue and wIndex fields from a GET_DESCRIPTOR
   * request.
   */
  std::optional<asel::buf_view>
  get_descriptor_with_setup_ids(uint16_t value, uint16_t index) const {
    const auto *entry = detail::find_usb_descriptor(index_, value, index);
    if (!entry) {
      return std::nullopt;
    }
    return asel::buf_view(data_.data() + entry->offset, entry->length);
  }

  constexpr bool has_descriptor(DescriptorType type,
                                uint8_t desc_index = 0) const {
    return detail::find_usb_descriptor(
               index_, desc_setup_value(type, desc_index), 0) != nullptr;
  }
  constexpr bool has_string(uint8_t index, Language language) const {
    return detail::find_usb_descriptor(
               index_,
               desc_setup_value(DescriptorType::String, index),
               desc_setup_index(language)) != nullptr;
  }

  std::optional<asel::buf_view> get_descriptor(DescriptorType type,
                                               uint8_t desc_index = 0) const {
    return get_descriptor_with_setup_ids(desc_setup_value(type, desc_index), 0);
  }

  /**
   * Look up a string descriptor.
   *
   * Returns the raw descriptor, which contains the 2-byte header followed by
   * the UTF-16LE string data.
   */
  std::optional<asel::buf_view> get_string_descriptor(uint8_t index,
                                                      Language language) const {
    return get_descriptor_with_setup_ids(
        desc_setup_value(DescriptorType::String, index),
        desc_setup_index(language));
  }

private:
  template <uint16_t X, size_t Y>
  friend class StaticDescriptorMap;

  template <size_t DescLen>
  constexpr StaticDescriptorMap(
      const StaticDescriptorMap<NumDescriptors - 1, DataLength - DescLen>
          &other,
      uint16_t value,
      uint16_t index,
      const std::array<uint8_t, DescLen> &desc,
      size_t used_length) {
    static_assert(DataLength <= std::numeric_limits<uint16_t>::max(),
                  "descriptor data is too large");

    constexpr size_t prev_len = DataLength - DescLen;
    for (size_t n = 0; n < prev_len; ++n) {
      data_[n] = other.data_[n];
    }
    for (size_t n = 0; n < DescLen; ++n) {
      data_[prev_len + n] = desc[n];
    }

    if (detail::find_usb_descriptor(other.index_, value, index)) {
      abort(); // Duplicate descriptor ID
    }
    for (size_t n = 0; n < NumDescriptors - 1; ++n) {
      index_[n] = other.index_[n];
    }
    auto &entry = index_[NumDescriptors - 1];
    entry.value = value;
    entry.index = index;
    entry.offset = static_cast<uint16_t>(prev_len);
    entry.length = static_cast<uint16_t>(used_length);
  }

  constexpr uint8_t count_config_descriptors() const {
    uint8_t count = 0;
    for (const auto &entry : index_) {
      if ((entry.value >> 8) == static_cast<uint8_t>(DescriptorType::Config)) {
        ++count;
      }
    }
    return count;
  }

  std::array<detail::StaticDescriptorMapEntry, NumDescriptors> index_ = {};
  std::array<uint8_t, DataLength> data_ = {};
};

} // namespace usbpad
