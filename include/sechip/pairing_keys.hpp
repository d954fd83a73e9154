/**
 * @file pairing_keys.hpp
 * @brief The four pairing-key slots holding host static public keys.
 *
 * @details
 * A slot's state follows from its 32 bytes:
 *
 * | State   | Value       | write(v)                  | read()    |
 * |---------|-------------|---------------------------|-----------|
 * | BLANK   | 32 x 0xFF   | stores v                  | SlotEmpty |
 * | SET     | anything    | stores old AND v          | value     |
 * | INVALID | 32 x 0x00   | SlotNotWritable, no change| SlotEmpty |
 *
 * Writes model one-time-programmable storage: bits can only go from 1 to 0,
 * which is why writing a SET slot ANDs the new value in.
 */
#ifndef SECHIP_PAIRING_KEYS_HPP
#define SECHIP_PAIRING_KEYS_HPP

#include "sechip/errors.hpp"
#include "sechip/wire.hpp"

#include "etl/array.h"

namespace sechip {

constexpr size_t kPairingSlotCount = 4;
constexpr size_t kPairingKeySize   = 32;

enum class SlotState : uint8_t { Blank = 0, Set = 1, Invalid = 2 };

const char* to_string(SlotState s);

class PairingKeys {
public:
  using Key = etl::array<uint8_t, kPairingKeySize>;

  PairingKeys();

  static bool valid_slot(size_t slot) { return slot < kPairingSlotCount; }
  static Bytes blank_value() { return Bytes(kPairingKeySize, 0xFF); }
  static Bytes invalid_value() { return Bytes(kPairingKeySize, 0x00); }

  SlotState state(size_t slot) const;
  Bytes     value(size_t slot) const;

  /// Provisioning path (construction, snapshot restore): stores @p value as is.
  Error load(size_t slot, const Bytes& value);

  Error write(size_t slot, const Bytes& value);
  Error read(size_t slot, Bytes& out) const;
  Error invalidate(size_t slot);

private:
  etl::array<Key, kPairingSlotCount> slots_;
};

} // namespace sechip

#endif // SECHIP_PAIRING_KEYS_HPP
