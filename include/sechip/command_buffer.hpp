/**
 * @file command_buffer.hpp
 * @brief Keeps the last response so RESEND can replay it without re-running anything.
 *
 * The dispatcher stores the serialized frames of every response except the
 * answer to RESEND itself. RESEND reads them back byte for byte. Empty after
 * power-on and after power-off.
 */
#ifndef SECHIP_COMMAND_BUFFER_HPP
#define SECHIP_COMMAND_BUFFER_HPP

#include "sechip/errors.hpp"
#include "sechip/transport/spi_target.hpp"

namespace sechip {

class CommandBuffer {
public:
  /// Overwrites whatever was kept before.
  void store(const transport::Frames& frames) { frames_ = frames; }

  /// Copies the kept frames into @p out; Error::NoPreviousResponse when empty.
  Error replay(transport::Frames& out) const;

  bool empty() const { return frames_.empty(); }
  void reset() { frames_.clear(); }

private:
  transport::Frames frames_;
};

} // namespace sechip

#endif // SECHIP_COMMAND_BUFFER_HPP
