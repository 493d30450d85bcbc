// Copyright (c) 2023, Adam Simpkins
#pragma once

#include <string>
#include <system_error>

namespace usbpad {

/**
 * Error codes returned by application-facing usbpad APIs.
 */
enum class Error : int {
  // A report could not be encoded into its wire format.
  SerializationError = 1,
  // The operation requires the device to be in the Configured state.
  NotConfigured = 2,
  // No report with the requested report ID exists.
  UnknownReport = 3,
};

class usbpad_error_category : public std::error_category {
public:
  const char *name() const noexcept override {
    return "usbpad";
  }
  std::string message(int condition) const override;
};

extern usbpad_error_category g_usbpad_error_category;

inline const std::error_category &usbpad_category() noexcept {
  return g_usbpad_error_category;
}

inline std::error_code make_error_code(Error err) {
  return std::error_code(static_cast<int>(err), g_usbpad_error_category);
}

} // namespace usbpad

namespace std {
template <>
struct is_error_code_enum<usbpad::Error> : true_type {};
} // namespace std
