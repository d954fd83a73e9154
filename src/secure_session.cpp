// -----------------------------------------------------------------------------
// secure_session.cpp - Noise KK1 key schedule and AES-GCM session
//
// Key schedule and nonce layout: see include/sechip/secure_session.hpp
// Tests: tests/test_secure_session.cpp
// -----------------------------------------------------------------------------
#include "sechip/secure_session.hpp"
#include "sechip/crypto.hpp"

#include <algorithm>
#include <cstring>

namespace sechip {

namespace {

const char kProtocolName[] = "Noise_KK1_25519_AESGCM_SHA256";

Bytes protocol_name() {
  Bytes name(32, 0x00);
  std::memcpy(name.data(), kProtocolName, sizeof(kProtocolName) - 1);
  return name;
}

Bytes mix(const Bytes& h, const Bytes& data) {
  Bytes in = h;
  in.insert(in.end(), data.begin(), data.end());
  return crypto::sha256(in);
}

Bytes make_nonce(uint32_t counter) {
  Bytes nonce(crypto::kGcmNonceSize, 0x00);
  for (int i = 0; i < 4; ++i) nonce[i] = static_cast<uint8_t>(counter >> (8 * i));
  return nonce;
}

void wipe(Bytes& b) {
  std::fill(b.begin(), b.end(), 0x00);
  b.clear();
}

} // namespace

const char* to_string(SessionState s) {
  return s == SessionState::Established ? "ESTABLISHED" : "UNESTABLISHED";
}

// ---------- key schedule ----------

Bytes SecureSession::derive(const Bytes& s_hpub, const Bytes& s_tpub, const Bytes& e_hpub,
                            uint8_t pkey_index, const Bytes& e_tpub, const Bytes& ee,
                            const Bytes& se, const Bytes& es) {
  const Bytes name = protocol_name();

  Bytes h = crypto::sha256(name);
  h = mix(h, s_hpub);
  h = mix(h, s_tpub);
  h = mix(h, e_hpub);
  h = mix(h, Bytes{pkey_index});
  h = mix(h, e_tpub);

  Bytes ck = crypto::noise_hkdf(name, ee).first;
  ck = crypto::noise_hkdf(ck, se).first;
  auto [ck3, k_auth] = crypto::noise_hkdf(ck, es);
  auto [k_cmd, k_res] = crypto::noise_hkdf(ck3, Bytes{});

  k_cmd_ = std::move(k_cmd);
  k_res_ = std::move(k_res);

  Bytes t_tauth = crypto::aes256gcm_encrypt(k_auth, make_nonce(0), Bytes{}, h);
  wipe(k_auth);
  wipe(ck);
  wipe(ck3);
  return t_tauth;
}

Error SecureSession::respond_handshake(const Bytes& s_tpriv, const Bytes& s_tpub,
                                       const Bytes& s_hpub, const Bytes& e_hpub,
                                       uint8_t pkey_index, const Bytes& e_tpriv,
                                       Bytes& e_tpub_out, Bytes& t_tauth_out) {
  invalidate();                                      // a new attempt always ends the old session

  const Bytes e_tpub = crypto::x25519_public(e_tpriv);
  const Bytes ee = crypto::x25519(e_tpriv, e_hpub);
  const Bytes se = crypto::x25519(e_tpriv, s_hpub);
  const Bytes es = crypto::x25519(s_tpriv, e_hpub);

  t_tauth_out  = derive(s_hpub, s_tpub, e_hpub, pkey_index, e_tpub, ee, se, es);
  e_tpub_out   = e_tpub;
  state_       = SessionState::Established;
  active_slot_ = pkey_index;
  return Error::None;
}

Error SecureSession::complete_handshake(const Bytes& s_hpriv, const Bytes& s_hpub,
                                        const Bytes& s_tpub, const Bytes& e_hpriv,
                                        const Bytes& e_hpub, uint8_t pkey_index,
                                        const Bytes& e_tpub, const Bytes& t_tauth) {
  invalidate();

  const Bytes ee = crypto::x25519(e_hpriv, e_tpub);
  const Bytes se = crypto::x25519(s_hpriv, e_tpub);
  const Bytes es = crypto::x25519(e_hpriv, s_tpub);

  const Bytes expected = derive(s_hpub, s_tpub, e_hpub, pkey_index, e_tpub, ee, se, es);
  if (expected != t_tauth) {
    invalidate();
    return Error::Handshake;
  }
  state_       = SessionState::Established;
  active_slot_ = pkey_index;
  return Error::None;
}

void SecureSession::invalidate() {
  wipe(k_cmd_);
  wipe(k_res_);
  cmd_counter_ = 0;
  res_counter_ = 0;
  active_slot_ = kNoSlot;
  state_       = SessionState::Unestablished;
}

// ---------- AEAD ----------

Error SecureSession::seal(const Bytes& key, uint32_t& counter, const Bytes& plaintext, Bytes& out) {
  if (!encryption_) {
    out = plaintext;
    out.insert(out.end(), kTagSize, 0x00);
    return Error::None;
  }
  if (!established()) return Error::NoSession;
  out = crypto::aes256gcm_encrypt(key, make_nonce(counter), plaintext, Bytes{});
  ++counter;
  return Error::None;
}

Error SecureSession::open(const Bytes& key, uint32_t& counter, const Bytes& ct_and_tag, Bytes& out) {
  if (!encryption_) {
    if (ct_and_tag.size() < kTagSize) return Error::Authentication;
    out.assign(ct_and_tag.begin(), ct_and_tag.end() - kTagSize);
    return Error::None;
  }
  if (!established()) return Error::NoSession;
  if (!crypto::aes256gcm_decrypt(key, make_nonce(counter), ct_and_tag, Bytes{}, out)) {
    return Error::Authentication;
  }
  ++counter;
  return Error::None;
}

Error SecureSession::encrypt_result(const Bytes& plaintext, Bytes& out) {
  return seal(k_res_, res_counter_, plaintext, out);
}

Error SecureSession::decrypt_command(const Bytes& ct_and_tag, Bytes& out) {
  return open(k_cmd_, cmd_counter_, ct_and_tag, out);
}

Error SecureSession::encrypt_command(const Bytes& plaintext, Bytes& out) {
  return seal(k_cmd_, cmd_counter_, plaintext, out);
}

Error SecureSession::decrypt_result(const Bytes& ct_and_tag, Bytes& out) {
  return open(k_res_, res_counter_, ct_and_tag, out);
}

} // namespace sechip
