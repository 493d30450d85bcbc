// Copyright (c) 2023, Adam Simpkins
#pragma once

#include "usbpad/usbpad_config.h"

#include <cstdio>
#include <optional>
#include <string_view>

namespace usbpad {

enum class LogLevel : int {
  Verbose = 10,
  Debug = 20,
  Info = 30,
  Warning = 40,
  Error = 50,
};

#define USBPAD_LOGV(arg, ...)                                                  \
  USBPAD_LOG_IMPL(::usbpad::LogLevel::Verbose, arg, ##__VA_ARGS__)
#define USBPAD_LOGD(arg, ...)                                                  \
  USBPAD_LOG_IMPL(::usbpad::LogLevel::Debug, arg, ##__VA_ARGS__)
#define USBPAD_LOGI(arg, ...)                                                  \
  USBPAD_LOG_IMPL(::usbpad::LogLevel::Info, arg, ##__VA_ARGS__)
#define USBPAD_LOGW(arg, ...)                                                  \
  USBPAD_LOG_IMPL(::usbpad::LogLevel::Warning, arg, ##__VA_ARGS__)
#define USBPAD_LOGE(arg, ...)                                                  \
  USBPAD_LOG_IMPL(::usbpad::LogLevel::Error, arg, ##__VA_ARGS__)

// Messages below USBPAD_CONFIG_LOG_LEVEL are compiled out entirely.
// set_log_level() can raise the threshold further at runtime.
#define USBPAD_LOG_IMPL(level, arg, ...)                                       \
  do {                                                                         \
    if (static_cast<int>(level) >= USBPAD_CONFIG_LOG_LEVEL &&                  \
        ::usbpad::log_enabled(level)) {                                        \
      ::usbpad::log_message((level), (arg), ##__VA_ARGS__);                    \
    }                                                                          \
  } while (0)

__attribute__((__format__ (__printf__, 2, 3)))
void log_message(LogLevel level, const char* fmt, ...);

void set_log_level(LogLevel level);
bool log_enabled(LogLevel level);

/**
 * Parse a log level name such as "debug" or "W".
 */
std::optional<LogLevel> parse_log_level(std::string_view name);

} // namespace usbpad
