/**
 * @file access_control.hpp
 * @brief User Access Privileges (UAP): per-register permission bits keyed by pairing slot.
 *
 * Bit `n` of a CFG_UAP_* register grants the command to sessions opened with
 * pairing slot `n` (slots 0..3). `check()` is the pure rule; `AccessControl`
 * applies it to the live bank and session and logs the decision.
 *
 * | Situation                         | Result        | Error            |
 * |-----------------------------------|---------------|------------------|
 * | encryption disabled               | (bypassed)    | None             |
 * | no active slot                    | Fatal         | Sequencing       |
 * | bit `slot` clear                  | Unauthorized  | Unauthorized     |
 * | bit `slot` set                    | Ok            | None             |
 */
#ifndef SECHIP_ACCESS_CONTROL_HPP
#define SECHIP_ACCESS_CONTROL_HPP

#include "sechip/config_bank.hpp"
#include "sechip/errors.hpp"
#include "sechip/log.hpp"
#include "sechip/secure_session.hpp"

#include <stdint.h>

namespace sechip {

enum class Access : uint8_t { Ok = 0, Unauthorized = 1, Fatal = 2 };

const char* to_string(Access a);

/// Ok iff bit @p slot of @p value is set; Fatal when @p slot is not 0..3.
Access check(uint32_t value, int slot);

class AccessControl {
public:
  explicit AccessControl(const Logger& log) : log_(log) {}

  /// Reads @p reg from @p bank and checks it against the session's active slot.
  Error authorize(ConfigBank& bank, ConfigRegister reg, const SecureSession& session) const;

private:
  const Logger& log_;
};

} // namespace sechip

#endif // SECHIP_ACCESS_CONTROL_HPP
