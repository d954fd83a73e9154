// -----------------------------------------------------------------------------
// log.cpp - labelled line logger
// -----------------------------------------------------------------------------
#include "sechip/log.hpp"

#include <cstdio>
#include <iostream>

namespace sechip {

const char* to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:   return "DEBUG";
    case LogLevel::Info:    return "INFO";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error:   return "ERROR";
    case LogLevel::Off:     return "OFF";
  }
  return "?";
}

bool parse_log_level(const std::string& text, LogLevel& out) {
  if (text == "debug")   { out = LogLevel::Debug;   return true; }
  if (text == "info")    { out = LogLevel::Info;    return true; }
  if (text == "warning") { out = LogLevel::Warning; return true; }
  if (text == "error")   { out = LogLevel::Error;   return true; }
  if (text == "off")     { out = LogLevel::Off;     return true; }
  return false;
}

Logger::Logger(const char* label, LogLevel level)
: label_(label ? label : ""), level_(level) {}   // etl::string crops to capacity

void Logger::log(LogLevel level, const std::string& msg) const {
  if (!enabled(level)) return;
  std::ostream& os = sink_ ? *sink_ : std::cerr;
  os << '[' << label_.c_str() << "] " << to_string(level) << ' ' << msg << '\n';
}

std::string hex_u32(uint32_t v, int digits) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "0x%0*x", digits, static_cast<unsigned>(v));
  return buf;
}

} // namespace sechip
