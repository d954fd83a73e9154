/**
 * @file log.hpp
 * @brief Labelled line logger used by every chip component.
 *
 * @details
 * Each component owns one `Logger` with a short label ("base", "spi", "uap",
 * "session", "config", "host"). A line is written only when its level is at
 * or above the logger's threshold:
 *
 * ```
 * [uap] DEBUG register 0x120 value=0xffffffff slot=0: granted
 * [spi] WARNING csn_low refused in state PROCESSING
 * ```
 *
 * Output goes to one `std::ostream` (std::cerr unless redirected). Tests
 * point it at a std::ostringstream to assert on what was logged.
 */
#ifndef SECHIP_LOG_HPP
#define SECHIP_LOG_HPP

#include "etl/string.h"

#include <stdint.h>

#include <iosfwd>
#include <string>

namespace sechip {

enum class LogLevel : uint8_t { Debug = 0, Info = 1, Warning = 2, Error = 3, Off = 4 };

const char* to_string(LogLevel level);
/// "debug", "info", "warning", "error", "off"; false on anything else.
bool parse_log_level(const std::string& text, LogLevel& out);

class Logger {
public:
  using Label = etl::string<12>;

  explicit Logger(const char* label, LogLevel level = LogLevel::Warning);

  void set_level(LogLevel level) { level_ = level; }
  LogLevel level() const { return level_; }
  const Label& label() const { return label_; }

  /// Redirect output. nullptr restores std::cerr.
  void set_sink(std::ostream* sink) { sink_ = sink; }

  bool enabled(LogLevel level) const { return level != LogLevel::Off && level >= level_; }

  void log(LogLevel level, const std::string& msg) const;
  void debug(const std::string& msg) const   { log(LogLevel::Debug, msg); }
  void info(const std::string& msg) const    { log(LogLevel::Info, msg); }
  void warning(const std::string& msg) const { log(LogLevel::Warning, msg); }
  void error(const std::string& msg) const   { log(LogLevel::Error, msg); }

private:
  Label         label_;
  LogLevel      level_;
  std::ostream* sink_{nullptr};
};

/// "0x" + lowercase hex of @p v, at least @p digits wide.
std::string hex_u32(uint32_t v, int digits = 2);

} // namespace sechip

#endif // SECHIP_LOG_HPP
