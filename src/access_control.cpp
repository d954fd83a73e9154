// -----------------------------------------------------------------------------
// access_control.cpp - UAP check
// -----------------------------------------------------------------------------
#include "sechip/access_control.hpp"
#include "sechip/pairing_keys.hpp"

#include <string>

namespace sechip {

const char* to_string(Access a) {
  switch (a) {
    case Access::Ok:           return "ok";
    case Access::Unauthorized: return "unauthorized";
    case Access::Fatal:        return "fatal";
  }
  return "?";
}

Access check(uint32_t value, int slot) {
  if (slot < 0 || slot >= static_cast<int>(kPairingSlotCount)) return Access::Fatal;
  return (value & (1u << slot)) ? Access::Ok : Access::Unauthorized;
}

Error AccessControl::authorize(ConfigBank& bank, ConfigRegister reg,
                               const SecureSession& session) const {
  if (!session.encryption_enabled()) {
    log_.debug(std::string(to_string(reg)) + ": encryption disabled, check bypassed");
    return Error::None;
  }

  const uint32_t value = bank.read(reg);
  const int      slot  = session.active_slot();
  const Access   a     = check(value, slot);
  const std::string line = std::string(to_string(reg)) + " value=" + hex_u32(value, 8) +
                           " slot=" + std::to_string(slot) + ": " + to_string(a);
  switch (a) {
    case Access::Ok:
      log_.debug(line);
      return Error::None;
    case Access::Unauthorized:
      log_.info(line);
      return Error::Unauthorized;
    case Access::Fatal:
      log_.error(line + " (no pairing slot recorded for this session)");
      return Error::Sequencing;
  }
  return Error::Sequencing;
}

} // namespace sechip
