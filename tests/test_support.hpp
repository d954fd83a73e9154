/**
 * @file test_support.hpp
 * @brief Fixed keys and model configurations shared by the test files.
 *
 * Everything here is deterministic: static keys are constant patterns (X25519
 * clamps any 32 bytes into a valid scalar) and the model's random source is
 * the repeated debug pattern.
 */
#pragma once

#include "host.hpp"
#include "sechip/crypto.hpp"
#include "sechip/model.hpp"

#include <string>

namespace sechip::test {

inline Bytes pattern(uint8_t first, size_t n = 32) {
    Bytes b(n);
    for (size_t i = 0; i < n; ++i) b[i] = static_cast<uint8_t>(first + i);
    return b;
}

inline Bytes text(const std::string& s) { return Bytes(s.begin(), s.end()); }

inline Bytes host_priv() { return pattern(0x10); }
inline Bytes chip_priv() { return pattern(0x40); }
inline Bytes host_eph()  { return pattern(0x70); }

/// A provisioned chip: host key in @p slot, certificate of @p cert_size bytes.
inline ModelConfig chip_config(size_t slot = 0, size_t cert_size = 200) {
    ModelConfig c;
    c.s_t_priv = chip_priv();
    c.i_pairing_keys.assign(kPairingSlotCount, PairingKeys::blank_value());
    c.i_pairing_keys[slot] = crypto::x25519_public(host_priv());
    c.x509_certificate = pattern(0x00, cert_size);
    c.chip_id          = pattern(0xC0, 128);
    c.riscv_fw_version = Bytes{0x00, 0x01, 0x02, 0x00};
    c.spect_fw_version = Bytes{0x00, 0x01, 0x00, 0x00};
    c.serial_code      = Bytes{0xDE, 0xAD, 0xBE, 0xEF};
    c.debug_random_value = Bytes{0xA5, 0x5A, 0x01, 0x3C};
    return c;
}

inline HostKeys host_keys(const Model& model, uint8_t slot = 0) {
    HostKeys k;
    k.s_h_priv = host_priv();
    k.s_h_pub  = crypto::x25519_public(k.s_h_priv);
    k.s_t_pub  = model.s_t_pub();
    k.pairing_key_index = slot;
    return k;
}

/// Serialized L2 request built from the default catalog.
inline Bytes request_frame(const Message& m) {
    Bytes out;
    if (!ok(m.to_bytes(out))) out.clear();
    return out;
}

} // namespace sechip::test
