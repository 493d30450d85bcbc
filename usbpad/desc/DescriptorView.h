// Copyright (c) 2023, Adam Simpkins
#pragma once

#include <asel/buf_view.h>

#include <cstdint>
#include <cstdlib>
#include <type_traits>

namespace usbpad {

/**
 * Base class for the descriptor parser classes.
 *
 * A DescriptorView points at existing serialized descriptor data, and does not
 * own it.  If constructed with a buffer of the wrong size the view is invalid,
 * and valid() must be checked before using any other accessor.  When
 * evaluated at compile time a bad buffer size is a compile error.
 *
 * If ExactSize is false the buffer only needs to be at least MinSize bytes
 * long.  (This is the case for config descriptors, which are followed by the
 * interface and endpoint descriptors.)
 */
template <size_t MinSize, bool ExactSize = true>
class DescriptorView {
public:
  static constexpr size_t kSize = MinSize;

  constexpr explicit DescriptorView(asel::buf_view buf)
      : data_(size_ok(buf.size()) ? buf.data() : nullptr), size_(buf.size()) {
    if (std::is_constant_evaluated() && !size_ok(buf.size())) {
      abort();
    }
  }
  constexpr DescriptorView(const uint8_t *data, size_t size)
      : DescriptorView(asel::buf_view(data, size)) {}

  constexpr bool valid() const { return data_ != nullptr; }
  constexpr explicit operator bool() const { return data_ != nullptr; }

  constexpr asel::buf_view data() const { return asel::buf_view(data_, size_); }
  constexpr const uint8_t *bytes() const { return data_; }

private:
  static constexpr bool size_ok(size_t size) {
    return ExactSize ? (size == MinSize) : (size >= MinSize);
  }

  const uint8_t *data_ = nullptr;
  size_t size_ = 0;
};

} // namespace usbpad
