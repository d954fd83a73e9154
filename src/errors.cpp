// -----------------------------------------------------------------------------
// errors.cpp - stable tokens for sechip::Error
//
// Tokens are part of the CLI output contract (status=error reason=<token>).
// Add new codes at the end; never rename an existing token.
// -----------------------------------------------------------------------------
#include "sechip/errors.hpp"

namespace sechip {

const char* to_string(Error e) {
  switch (e) {
    case Error::None:               return "ok";
    case Error::Encoding:           return "encoding_error";
    case Error::Size:               return "size_error";
    case Error::MalformedMessage:   return "malformed_message";
    case Error::UnknownMessage:     return "unknown_message";
    case Error::NoPreviousResponse: return "no_previous_response";
    case Error::Unauthorized:       return "unauthorized";
    case Error::Sequencing:         return "no_active_pairing_slot";
    case Error::InvalidAddress:     return "invalid_address";
    case Error::InvalidBitIndex:    return "invalid_bit_index";
    case Error::SlotNotWritable:    return "slot_not_writable";
    case Error::SlotEmpty:          return "slot_empty";
    case Error::NoSession:          return "no_session";
    case Error::Authentication:     return "authentication_failed";
    case Error::Handshake:          return "handshake_failed";
    case Error::InvalidObject:      return "invalid_object";
    case Error::ChipError:          return "chip_error";
    case Error::ChipBusy:           return "chip_busy";
    case Error::Transport:          return "transport_error";
  }
  return "unknown_error";
}

} // namespace sechip
