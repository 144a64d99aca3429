#ifndef REX_COMMON_LOG_H
#define REX_COMMON_LOG_H

#include "rex/common/status.h"

#include <ostream>
#include <string_view>

enum rex_log_severity {
  REX_TRACE,
  REX_DEBUG,
  REX_INFO,
  REX_LOCALWARNING,
  REX_LOCALERROR,
  REX_GLOBALWARNING,
  REX_GLOBALERROR,
  REX_FATAL,
  REX_SEVERITY_COUNT
};

enum rex_log_channel {
  REX_GENERAL,
  REX_BUS,
  REX_ALLOCATOR,
  REX_DECISION,
  REX_REASONER,
  REX_SCHEDULER,
  REX_DAEMON,
  REX_CHANNEL_COUNT
};

rex_status
rex_log_init();

void
rex_log_set_severity(rex_log_severity severity);

rex_log_severity
rex_log_get_severity();

void
rex_log_set_channel_active(rex_log_channel channel, bool active);

void
rex_log_set_local_name(const char* name);

const char*
rex_log_severity_to_str(rex_log_severity severity);

const char*
rex_log_channel_to_str(rex_log_channel channel);

bool
rex_log_channel_from_str(std::string_view name, rex_log_channel* channel);

void
rex_log(rex_log_channel channel, rex_log_severity severity, const char* msg);

void
rex_log(rex_log_channel channel,
        rex_log_severity severity,
        std::string_view msg);

bool
rex_log_enabled(rex_log_channel channel, rex_log_severity severity);

inline std::ostream&
operator<<(std::ostream& o, rex_log_severity severity) {
  return o << rex_log_severity_to_str(severity);
}
inline std::ostream&
operator<<(std::ostream& o, rex_log_channel channel) {
  return o << rex_log_channel_to_str(channel);
}

#ifdef REX_LOG_INCLUDE_FMT
#include <fmt/format.h>

#include <iostream>
#include <iterator>

template<typename... Args>
void
rex_log(rex_log_channel channel,
        rex_log_severity severity,
        fmt::format_string<Args...> fmt,
        Args&&... args) {
  if(!rex_log_enabled(channel, severity))
    return;
  try {
    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf), fmt, std::forward<Args>(args)...);
    rex_log(channel, severity, std::string_view(buf.data(), buf.size()));
  } catch(const std::exception& e) {
    std::cerr << "!! Could not format log entry! Message: " << e.what()
              << std::endl;
  }
}
#endif

#endif
