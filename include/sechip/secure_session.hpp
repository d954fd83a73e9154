/**
 * @file secure_session.hpp
 * @brief Secure channel: Noise KK1 handshake and the AES-256-GCM session built from it.
 *
 * @details
 * ## Handshake (Noise_KK1_25519_AESGCM_SHA256)
 * Both sides know both static keys (the chip's STPub, the host's SHiPub in the
 * pairing slot `pkey_index`). The host sends its ephemeral EHPub, the chip
 * answers with its ephemeral ETPub and an authentication tag:
 *
 * ```
 * name = "Noise_KK1_25519_AESGCM_SHA256" zero-padded to 32 bytes
 * h    = SHA256(name)
 * h    = SHA256(h || SHiPub) ; h = SHA256(h || STPub) ; h = SHA256(h || EHPub)
 * h    = SHA256(h || pkey_index) ; h = SHA256(h || ETPub)
 * ck          = HKDF(name, ee)       first output
 * ck          = HKDF(ck, se)         first output
 * ck, kAUTH   = HKDF(ck, es)
 * kCMD, kRES  = HKDF(ck, "")
 * T_TAUTH     = AES-GCM(kAUTH, nonce 0, "", aad = h).tag
 * ```
 *
 * `ee` is ephemeral-ephemeral, `se` host static with chip ephemeral, `es`
 * host ephemeral with chip static. The chip side is `respond_handshake()`,
 * the host side is `complete_handshake()` (which also checks T_TAUTH).
 *
 * ## Session
 * kCMD protects host-to-chip commands, kRES chip-to-host results. Each
 * direction has its own 32-bit counter; the 12-byte nonce is the counter
 * little-endian followed by zeros. Every seal or successful open advances it.
 *
 * | Side | seal              | open              |
 * |------|-------------------|-------------------|
 * | chip | encrypt_result()  | decrypt_command() |
 * | host | encrypt_command() | decrypt_result()  |
 *
 * An open that fails for any reason (short input, wrong tag) reports
 * `Error::Authentication` and nothing else.
 *
 * ## Encryption disabled
 * Fixed at construction. Sealing appends 16 zero bytes, opening strips the
 * last 16 bytes, no handshake is needed.
 */
#ifndef SECHIP_SECURE_SESSION_HPP
#define SECHIP_SECURE_SESSION_HPP

#include "sechip/errors.hpp"
#include "sechip/wire.hpp"

#include <stdint.h>

namespace sechip {

enum class SessionState : uint8_t { Unestablished = 0, Established = 1 };

const char* to_string(SessionState s);

class SecureSession {
public:
  static constexpr size_t kTagSize = 16;
  static constexpr int    kNoSlot  = -1;

  explicit SecureSession(bool encryption_enabled = true)
  : encryption_(encryption_enabled) {}

  bool         encryption_enabled() const { return encryption_; }
  SessionState state() const { return state_; }
  bool         established() const { return state_ == SessionState::Established; }
  /// Pairing slot the current session was opened with, kNoSlot when none.
  int          active_slot() const { return active_slot_; }

  // ---- chip side ----
  Error respond_handshake(const Bytes& s_tpriv, const Bytes& s_tpub, const Bytes& s_hpub,
                          const Bytes& e_hpub, uint8_t pkey_index, const Bytes& e_tpriv,
                          Bytes& e_tpub_out, Bytes& t_tauth_out);
  Error encrypt_result(const Bytes& plaintext, Bytes& out);
  Error decrypt_command(const Bytes& ct_and_tag, Bytes& out);

  // ---- host side ----
  Error complete_handshake(const Bytes& s_hpriv, const Bytes& s_hpub, const Bytes& s_tpub,
                           const Bytes& e_hpriv, const Bytes& e_hpub, uint8_t pkey_index,
                           const Bytes& e_tpub, const Bytes& t_tauth);
  Error encrypt_command(const Bytes& plaintext, Bytes& out);
  Error decrypt_result(const Bytes& ct_and_tag, Bytes& out);

  /// Zero keys, rewind counters, forget the slot, back to UNESTABLISHED.
  void invalidate();

  const Bytes& k_cmd() const { return k_cmd_; }
  const Bytes& k_res() const { return k_res_; }

private:
  /// Runs the key schedule; returns T_TAUTH and fills k_cmd_/k_res_.
  Bytes derive(const Bytes& s_hpub, const Bytes& s_tpub, const Bytes& e_hpub, uint8_t pkey_index,
               const Bytes& e_tpub, const Bytes& ee, const Bytes& se, const Bytes& es);
  Error seal(const Bytes& key, uint32_t& counter, const Bytes& plaintext, Bytes& out);
  Error open(const Bytes& key, uint32_t& counter, const Bytes& ct_and_tag, Bytes& out);

  bool         encryption_;
  SessionState state_{SessionState::Unestablished};
  int          active_slot_{kNoSlot};
  Bytes        k_cmd_;
  Bytes        k_res_;
  uint32_t     cmd_counter_{0};
  uint32_t     res_counter_{0};
};

} // namespace sechip

#endif // SECHIP_SECURE_SESSION_HPP
