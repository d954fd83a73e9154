// -----------------------------------------------------------------------------
// command_buffer.cpp - resend storage
// -----------------------------------------------------------------------------
#include "sechip/command_buffer.hpp"

namespace sechip {

Error CommandBuffer::replay(transport::Frames& out) const {
  if (frames_.empty()) return Error::NoPreviousResponse;
  out = frames_;
  return Error::None;
}

} // namespace sechip
