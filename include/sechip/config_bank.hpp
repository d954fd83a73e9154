/**
 * @file config_bank.hpp
 * @brief Configuration registers: irreversible and reversible copies, effective value = i AND r.
 *
 * @details
 * ## Registers
 * A closed set of 32-bit registers addressed by byte address:
 *
 * | Register                        | Address | Purpose                              |
 * |---------------------------------|---------|--------------------------------------|
 * | CFG_START_UP                    | 0x000   | start-up behaviour                   |
 * | CFG_SENSORS                     | 0x008   | sensor enables                       |
 * | CFG_DEBUG                       | 0x010   | debug interface                      |
 * | CFG_GPO                         | 0x014   | GPO pin function                     |
 * | CFG_SLEEP_MODE                  | 0x018   | sleep mode enable                    |
 * | CFG_UAP_PAIRING_KEY_WRITE       | 0x020   | UAP: PAIRING_KEY_WRITE               |
 * | CFG_UAP_PAIRING_KEY_READ        | 0x024   | UAP: PAIRING_KEY_READ                |
 * | CFG_UAP_PAIRING_KEY_INVALIDATE  | 0x028   | UAP: PAIRING_KEY_INVALIDATE          |
 * | CFG_UAP_CONFIG_WRITE            | 0x040   | UAP: CONFIG_WRITE                    |
 * | CFG_UAP_CONFIG_READ             | 0x044   | UAP: CONFIG_READ                     |
 * | CFG_UAP_PING                    | 0x100   | UAP: PING                            |
 * | CFG_UAP_RANDOM_VALUE_GET        | 0x120   | UAP: RANDOM_VALUE_GET                |
 *
 * Every register defaults to 0xFFFFFFFF (all permissions, all features).
 *
 * ## Copies
 * - `ConfigObject` is one copy: one value per register.
 * - `ConfigBank` holds the irreversible copy (fixed at construction) and the
 *   reversible copy (bits can only be cleared). `read()` returns i AND r,
 *   computed on first use and cached until `invalidate_cache()` (power-off)
 *   or a write to that register.
 */
#ifndef SECHIP_CONFIG_BANK_HPP
#define SECHIP_CONFIG_BANK_HPP

#include "sechip/errors.hpp"

#include "etl/array.h"

#include <stddef.h>
#include <stdint.h>
#include <string>

namespace sechip {

enum class ConfigRegister : uint16_t {
  CFG_START_UP                   = 0x000,
  CFG_SENSORS                    = 0x008,
  CFG_DEBUG                      = 0x010,
  CFG_GPO                        = 0x014,
  CFG_SLEEP_MODE                 = 0x018,
  CFG_UAP_PAIRING_KEY_WRITE      = 0x020,
  CFG_UAP_PAIRING_KEY_READ       = 0x024,
  CFG_UAP_PAIRING_KEY_INVALIDATE = 0x028,
  CFG_UAP_CONFIG_WRITE           = 0x040,
  CFG_UAP_CONFIG_READ            = 0x044,
  CFG_UAP_PING                   = 0x100,
  CFG_UAP_RANDOM_VALUE_GET       = 0x120
};

constexpr size_t   kRegisterCount       = 12;
constexpr uint32_t kRegisterDefault     = 0xFFFFFFFFu;

/// Every register, in address order.
extern const ConfigRegister kAllRegisters[kRegisterCount];

inline uint16_t address_of(ConfigRegister r) { return static_cast<uint16_t>(r); }
/// Position of @p r in kAllRegisters.
size_t register_index(ConfigRegister r);

/// False when @p address is not one of the registers above.
bool register_from_address(uint16_t address, ConfigRegister& out);
/// Lowercase name ("cfg_uap_ping"), also the snapshot key.
const char* to_string(ConfigRegister r);
bool register_from_name(const std::string& name, ConfigRegister& out);

class ConfigObject {
public:
  ConfigObject() { values_.fill(kRegisterDefault); }

  uint32_t get(ConfigRegister r) const { return values_[register_index(r)]; }
  void     set(ConfigRegister r, uint32_t v) { values_[register_index(r)] = v; }

  bool operator==(const ConfigObject& o) const { return values_ == o.values_; }

private:
  etl::array<uint32_t, kRegisterCount> values_;
};

class ConfigBank {
public:
  ConfigBank() { invalidate_cache(); }
  ConfigBank(const ConfigObject& irreversible, const ConfigObject& reversible);

  /// Effective value (cached).
  uint32_t read(ConfigRegister r);
  Error    read(uint16_t address, uint32_t& out);

  /// Clear bit @p bit_index of the reversible copy. InvalidBitIndex outside 0..31.
  Error write_clear_bit(ConfigRegister r, int bit_index);
  Error write_clear_bit(uint16_t address, int bit_index);

  const ConfigObject& irreversible() const { return irreversible_; }
  const ConfigObject& reversible() const { return reversible_; }

  bool is_cached(ConfigRegister r) const;
  void invalidate_cache();

private:
  ConfigObject irreversible_;                 // write-once
  ConfigObject reversible_;
  ConfigObject cache_;
  etl::array<bool, kRegisterCount> cached_;
};

} // namespace sechip

#endif // SECHIP_CONFIG_BANK_HPP
