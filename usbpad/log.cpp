// Copyright (c) 2023, Adam Simpkins
#include "usbpad/log.h"

#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>

namespace usbpad {

namespace {

std::atomic<int> g_log_level{USBPAD_CONFIG_LOG_LEVEL};

char level_char(LogLevel level) {
  switch (level) {
  case LogLevel::Verbose:
    return 'V';
  case LogLevel::Debug:
    return 'D';
  case LogLevel::Info:
    return 'I';
  case LogLevel::Warning:
    return 'W';
  case LogLevel::Error:
    return 'E';
  }
  return '?';
}

bool name_matches(std::string_view name, std::string_view level_name) {
  if (name.size() == 1) {
    return std::toupper(static_cast<unsigned char>(name[0])) ==
           std::toupper(static_cast<unsigned char>(level_name[0]));
  }
  if (name.size() != level_name.size()) {
    return false;
  }
  for (size_t n = 0; n < name.size(); ++n) {
    if (std::tolower(static_cast<unsigned char>(name[n])) != level_name[n]) {
      return false;
    }
  }
  return true;
}

} // namespace

void log_message(LogLevel level, const char *fmt, ...) {
  printf("%c usbpad: ", level_char(level));
  va_list ap;
  va_start(ap, fmt);
  vprintf(fmt, ap);
  va_end(ap);
  printf("\n");
}

void set_log_level(LogLevel level) {
  g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

bool log_enabled(LogLevel level) {
  return static_cast<int>(level) >=
         g_log_level.load(std::memory_order_relaxed);
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
  if (name.empty()) {
    return std::nullopt;
  }
  if (name_matches(name, "verbose")) {
    return LogLevel::Verbose;
  } else if (name_matches(name, "debug")) {
    return LogLevel::Debug;
  } else if (name_matches(name, "info")) {
    return LogLevel::Info;
  } else if (name_matches(name, "warning")) {
    return LogLevel::Warning;
  } else if (name_matches(name, "error")) {
    return LogLevel::Error;
  }
  return std::nullopt;
}

} // namespace usbpad
