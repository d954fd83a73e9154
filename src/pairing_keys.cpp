// -----------------------------------------------------------------------------
// pairing_keys.cpp - pairing-key slots
//
// Slot states and write semantics: see include/sechip/pairing_keys.hpp
// An out-of-range slot reports Error::Unauthorized; the L3 result for it is
// UNAUTHORIZED.
// -----------------------------------------------------------------------------
#include "sechip/pairing_keys.hpp"

#include <algorithm>

namespace sechip {

const char* to_string(SlotState s) {
  switch (s) {
    case SlotState::Blank:   return "blank";
    case SlotState::Set:     return "set";
    case SlotState::Invalid: return "invalid";
  }
  return "?";
}

PairingKeys::PairingKeys() {
  for (auto& k : slots_) k.fill(0xFF);
}

SlotState PairingKeys::state(size_t slot) const {
  const Key& k = slots_[slot];
  if (std::all_of(k.begin(), k.end(), [](uint8_t b) { return b == 0xFF; })) return SlotState::Blank;
  if (std::all_of(k.begin(), k.end(), [](uint8_t b) { return b == 0x00; })) return SlotState::Invalid;
  return SlotState::Set;
}

Bytes PairingKeys::value(size_t slot) const {
  return Bytes(slots_[slot].begin(), slots_[slot].end());
}

Error PairingKeys::load(size_t slot, const Bytes& value) {
  if (!valid_slot(slot)) return Error::Unauthorized;
  if (value.size() != kPairingKeySize) return Error::Size;
  std::copy(value.begin(), value.end(), slots_[slot].begin());
  return Error::None;
}

Error PairingKeys::write(size_t slot, const Bytes& value) {
  if (!valid_slot(slot)) return Error::Unauthorized;
  if (value.size() != kPairingKeySize) return Error::Size;

  switch (state(slot)) {
    case SlotState::Invalid:
      return Error::SlotNotWritable;
    case SlotState::Blank:
      std::copy(value.begin(), value.end(), slots_[slot].begin());
      return Error::None;
    case SlotState::Set:
      for (size_t i = 0; i < kPairingKeySize; ++i) slots_[slot][i] &= value[i];   // bits only clear
      return Error::None;
  }
  return Error::None;
}

Error PairingKeys::read(size_t slot, Bytes& out) const {
  if (!valid_slot(slot)) return Error::Unauthorized;
  if (state(slot) != SlotState::Set) return Error::SlotEmpty;
  out = value(slot);
  return Error::None;
}

Error PairingKeys::invalidate(size_t slot) {
  if (!valid_slot(slot)) return Error::Unauthorized;
  slots_[slot].fill(0x00);
  return Error::None;
}

} // namespace sechip
