// Copyright (c) 2023, Adam Simpkins
#include "usbpad/Error.h"

namespace usbpad {

usbpad_error_category g_usbpad_error_category;

std::string usbpad_error_category::message(int condition) const {
  switch (static_cast<Error>(condition)) {
  case Error::SerializationError:
    return "report serialization error";
  case Error::NotConfigured:
    return "device is not configured";
  case Error::UnknownReport:
    return "unknown report ID";
  }
  return "unknown usbpad error " + std::to_string(condition);
}

} // namespace usbpad
