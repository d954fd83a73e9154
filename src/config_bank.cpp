// -----------------------------------------------------------------------------
// config_bank.cpp - register enumeration and the i AND r bank
//
// Register table and caching rules: see include/sechip/config_bank.hpp
// Tests: tests/test_config_bank.cpp
// -----------------------------------------------------------------------------
#include "sechip/config_bank.hpp"

namespace sechip {

const ConfigRegister kAllRegisters[kRegisterCount] = {
  ConfigRegister::CFG_START_UP,
  ConfigRegister::CFG_SENSORS,
  ConfigRegister::CFG_DEBUG,
  ConfigRegister::CFG_GPO,
  ConfigRegister::CFG_SLEEP_MODE,
  ConfigRegister::CFG_UAP_PAIRING_KEY_WRITE,
  ConfigRegister::CFG_UAP_PAIRING_KEY_READ,
  ConfigRegister::CFG_UAP_PAIRING_KEY_INVALIDATE,
  ConfigRegister::CFG_UAP_CONFIG_WRITE,
  ConfigRegister::CFG_UAP_CONFIG_READ,
  ConfigRegister::CFG_UAP_PING,
  ConfigRegister::CFG_UAP_RANDOM_VALUE_GET
};

size_t register_index(ConfigRegister r) {
  for (size_t i = 0; i < kRegisterCount; ++i) {
    if (kAllRegisters[i] == r) return i;
  }
  return 0;   // unreachable for enumerators; casts from raw addresses go through register_from_address()
}

bool register_from_address(uint16_t address, ConfigRegister& out) {
  for (ConfigRegister r : kAllRegisters) {
    if (address_of(r) == address) {
      out = r;
      return true;
    }
  }
  return false;
}

const char* to_string(ConfigRegister r) {
  switch (r) {
    case ConfigRegister::CFG_START_UP:                   return "cfg_start_up";
    case ConfigRegister::CFG_SENSORS:                    return "cfg_sensors";
    case ConfigRegister::CFG_DEBUG:                      return "cfg_debug";
    case ConfigRegister::CFG_GPO:                        return "cfg_gpo";
    case ConfigRegister::CFG_SLEEP_MODE:                 return "cfg_sleep_mode";
    case ConfigRegister::CFG_UAP_PAIRING_KEY_WRITE:      return "cfg_uap_pairing_key_write";
    case ConfigRegister::CFG_UAP_PAIRING_KEY_READ:       return "cfg_uap_pairing_key_read";
    case ConfigRegister::CFG_UAP_PAIRING_KEY_INVALIDATE: return "cfg_uap_pairing_key_invalidate";
    case ConfigRegister::CFG_UAP_CONFIG_WRITE:           return "cfg_uap_config_write";
    case ConfigRegister::CFG_UAP_CONFIG_READ:            return "cfg_uap_config_read";
    case ConfigRegister::CFG_UAP_PING:                   return "cfg_uap_ping";
    case ConfigRegister::CFG_UAP_RANDOM_VALUE_GET:       return "cfg_uap_random_value_get";
  }
  return "?";
}

bool register_from_name(const std::string& name, ConfigRegister& out) {
  for (ConfigRegister r : kAllRegisters) {
    if (name == to_string(r)) {
      out = r;
      return true;
    }
  }
  return false;
}

// ---------- ConfigBank ----------

ConfigBank::ConfigBank(const ConfigObject& irreversible, const ConfigObject& reversible)
: irreversible_(irreversible), reversible_(reversible) {
  invalidate_cache();
}

uint32_t ConfigBank::read(ConfigRegister r) {
  const size_t i = register_index(r);
  if (!cached_[i]) {
    cache_.set(r, irreversible_.get(r) & reversible_.get(r));
    cached_[i] = true;
  }
  return cache_.get(r);
}

Error ConfigBank::read(uint16_t address, uint32_t& out) {
  ConfigRegister r;
  if (!register_from_address(address, r)) return Error::InvalidAddress;
  out = read(r);
  return Error::None;
}

Error ConfigBank::write_clear_bit(ConfigRegister r, int bit_index) {
  cached_[register_index(r)] = false;           // recomputed on next read, even when refused
  if (bit_index < 0 || bit_index >= 32) return Error::InvalidBitIndex;
  reversible_.set(r, reversible_.get(r) & ~(1u << bit_index));
  return Error::None;
}

Error ConfigBank::write_clear_bit(uint16_t address, int bit_index) {
  ConfigRegister r;
  if (!register_from_address(address, r)) return Error::InvalidAddress;
  return write_clear_bit(r, bit_index);
}

bool ConfigBank::is_cached(ConfigRegister r) const {
  return cached_[register_index(r)];
}

void ConfigBank::invalidate_cache() {
  cached_.fill(false);
}

} // namespace sechip
