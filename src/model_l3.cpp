// -----------------------------------------------------------------------------
// model_l3.cpp - L3 command handlers of sechip::Model
//
// Every handler runs after the packet was opened. Order of checks:
//   1. slot range (pairing-key commands)  -> Unauthorized
//   2. UAP register for the command       -> Unauthorized / Sequencing
//   3. the operation itself               -> FAIL on any other error
// -----------------------------------------------------------------------------
#include "sechip/model.hpp"

#include <string>

namespace sechip {

Error Model::checked_slot(const Message& cmd, size_t& slot) const {
  slot = static_cast<size_t>(cmd.field("slot")->value());
  if (!PairingKeys::valid_slot(slot)) {
    base_log_.info("pairing slot " + std::to_string(slot) + " out of range");
    return Error::Unauthorized;
  }
  return Error::None;
}

Error Model::on_ping(const Message& cmd, Message& res) {
  const Error e = authorize(ConfigRegister::CFG_UAP_PING);
  if (!ok(e)) return e;
  return res.field("data_out")->set(cmd.field("data_in")->values());
}

Error Model::on_pairing_key_write(const Message& cmd, Message&) {
  size_t slot = 0;
  Error e = checked_slot(cmd, slot);
  if (ok(e)) e = authorize(ConfigRegister::CFG_UAP_PAIRING_KEY_WRITE);
  if (ok(e)) e = pairing_keys_.write(slot, cmd.field("s_hipub")->bytes());
  return e;
}

Error Model::on_pairing_key_read(const Message& cmd, Message& res) {
  size_t slot = 0;
  Error e = checked_slot(cmd, slot);
  if (ok(e)) e = authorize(ConfigRegister::CFG_UAP_PAIRING_KEY_READ);
  Bytes key;
  if (ok(e)) e = pairing_keys_.read(slot, key);
  if (ok(e)) e = res.field("s_hipub")->set_bytes(key);
  return e;
}

Error Model::on_pairing_key_invalidate(const Message& cmd, Message&) {
  size_t slot = 0;
  Error e = checked_slot(cmd, slot);
  if (ok(e)) e = authorize(ConfigRegister::CFG_UAP_PAIRING_KEY_INVALIDATE);
  if (ok(e)) e = pairing_keys_.invalidate(slot);
  return e;
}

// on_config_write() - Clear one bit of the reversible copy.
Error Model::on_config_write(const Message& cmd, Message&) {
  Error e = authorize(ConfigRegister::CFG_UAP_CONFIG_WRITE);
  if (!ok(e)) return e;

  const uint16_t address = static_cast<uint16_t>(cmd.field("address")->value());
  const int      bit     = static_cast<int>(cmd.field("bit_index")->value());
  e = config_.write_clear_bit(address, bit);
  base_log_.debug("config_write " + hex_u32(address, 3) + " bit " + std::to_string(bit) + ": " +
                  to_string(e));
  return e;
}

Error Model::on_config_read(const Message& cmd, Message& res) {
  Error e = authorize(ConfigRegister::CFG_UAP_CONFIG_READ);
  if (!ok(e)) return e;

  uint32_t value = 0;
  e = config_.read(static_cast<uint16_t>(cmd.field("address")->value()), value);
  if (ok(e)) e = res.field("value")->set_value(value);
  return e;
}

Error Model::on_random_value_get(const Message& cmd, Message& res) {
  const Error e = authorize(ConfigRegister::CFG_UAP_RANDOM_VALUE_GET);
  if (!ok(e)) return e;
  return res.field("random_data")->set_bytes(trng_.get(cmd.field("n_bytes")->value()));
}

} // namespace sechip
