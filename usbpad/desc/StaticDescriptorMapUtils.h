// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/desc/types.h"

#include <asel/buf_view.h>

#include <array>
#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <string_view>

namespace usbpad::detail {

struct StaticDescriptorMapEntry {
  // The wValue field for this descriptor in a SETUP packet.
  // The upper byte is the descriptor type, the lower byte is the index.
  uint16_t value;
  // The wIndex field for this descriptor in a SETUP packet.
  // This is the language ID for string descriptors, and 0 otherwise.
  uint16_t index;
  // Offset of the descriptor data within the map's data storage
  uint16_t offset;
  uint16_t length;
};

/**
 * Find the index entry for the descriptor with the given SETUP wValue and
 * wIndex fields.  Returns nullptr if there is no such descriptor.
 *
 * This can be evaluated at compile time, so descriptor maps can be checked
 * with static_assert().
 */
template <size_t N>
constexpr const StaticDescriptorMapEntry *
find_usb_descriptor(const std::array<StaticDescriptorMapEntry, N> &entries,
                    uint16_t value,
                    uint16_t index) {
  for (const auto &entry : entries) {
    if (entry.value == value && entry.index == index) {
      return &entry;
    }
  }
  return nullptr;
}

/**
 * Decode one UTF-8 encoded code point from str, starting at idx.
 *
 * On success, stores the code point in *cp, advances idx past the encoded
 * character, and returns true.  Returns false on malformed or truncated input.
 */
[[nodiscard]] constexpr bool
decode_utf8(std::string_view str, size_t &idx, uint32_t *cp) {
  const auto byte = [&](size_t n) -> uint8_t {
    return static_cast<uint8_t>(str[n]);
  };

  const uint8_t lead = byte(idx);
  size_t extra;
  uint32_t c;
  if (lead < 0x80) {
    extra = 0;
    c = lead;
  } else if ((lead & 0xe0) == 0xc0) {
    extra = 1;
    c = lead & 0x1f;
  } else if ((lead & 0xf0) == 0xe0) {
    extra = 2;
    c = lead & 0x0f;
  } else if ((lead & 0xf8) == 0xf0) {
    extra = 3;
    c = lead & 0x07;
  } else {
    return false; // not a valid lead byte
  }

  if (idx + extra >= str.size()) {
    return false; // truncated
  }
  for (size_t n = 1; n <= extra; ++n) {
    const uint8_t cont = byte(idx + n);
    if ((cont & 0xc0) != 0x80) {
      return false;
    }
    c = (c << 6) | (cont & 0x3f);
  }

  idx += extra + 1;
  *cp = c;
  return true;
}

/**
 * Fill in a string descriptor from UTF-8 input.
 *
 * String descriptors hold UTF-16LE data.  Only code points in the Basic
 * Multilingual Plane are supported, since surrogate pairs would make the
 * output length impossible to compute from the input length at compile time.
 *
 * Any unused space at the end of buf is zero filled.
 */
[[nodiscard]] constexpr bool
fill_string_descriptor(uint8_t *buf, size_t buflen, std::string_view str) {
  if (buflen < 2) {
    return false;
  }
  size_t in_idx = 0;
  size_t out_idx = 2;
  while (in_idx < str.size()) {
    uint32_t c = 0;
    if (!decode_utf8(str, in_idx, &c)) {
      return false;
    }
    if (c > 0xffff) {
      return false;
    }
    if (out_idx + 2 > buflen || out_idx + 2 > 0xff) {
      return false;
    }
    buf[out_idx] = static_cast<uint8_t>(c & 0xff);
    buf[out_idx + 1] = static_cast<uint8_t>((c >> 8) & 0xff);
    out_idx += 2;
  }

  buf[0] = static_cast<uint8_t>(out_idx);
  buf[1] = static_cast<uint8_t>(DescriptorType::String);
  for (size_t n = out_idx; n < buflen; ++n) {
    buf[n] = 0;
  }
  return true;
}

/**
 * Make a string descriptor from a string literal.
 *
 * The output array is sized for the worst case, where every input byte is an
 * ASCII character and so expands to 2 bytes.  (The trailing nul byte in the
 * literal pays for the 2-byte descriptor header.)
 */
template <size_t N>
constexpr std::array<uint8_t, N * 2>
make_string_descriptor(const char (&str)[N]) {
  std::array<uint8_t, N * 2> out = {};
  if (N == 0 || str[N - 1] != '\0') {
    abort(); // the input string must be nul terminated
  }
  if (!fill_string_descriptor(
          out.data(), out.size(), std::string_view(str, N - 1))) {
    abort(); // invalid UTF-8, or code points outside the BMP
  }
  return out;
}

template <typename... LangIDs>
constexpr void fill_lang_descriptor(uint8_t *desc, LangIDs... langs) {
  size_t offset = 0;
  for (Language lang : {langs...}) {
    desc[offset] = static_cast<uint16_t>(lang) & 0xff;
    desc[offset + 1] = (static_cast<uint16_t>(lang) >> 8) & 0xff;
    offset += 2;
  }
}

} // namespace usbpad::detail
