/**
 * @file crypto.hpp
 * @brief Thin OpenSSL wrappers for the secure channel: X25519, SHA-256, HMAC, HKDF, AES-256-GCM.
 *
 * @details
 * All functions work on byte vectors. A failing OpenSSL call (allocation,
 * rejected key) throws `std::runtime_error`; the dispatcher turns that into a
 * GEN_ERR response. A tag that does not verify is not an exception:
 * `aes256gcm_decrypt()` returns false.
 */
#ifndef SECHIP_CRYPTO_HPP
#define SECHIP_CRYPTO_HPP

#include "sechip/wire.hpp"

#include <utility>

namespace sechip::crypto {

constexpr size_t kX25519KeySize = 32;
constexpr size_t kAesKeySize    = 32;
constexpr size_t kGcmNonceSize  = 12;
constexpr size_t kGcmTagSize    = 16;

Bytes sha256(const Bytes& data);
Bytes hmac_sha256(const Bytes& key, const Bytes& data);

/**
 * @brief Noise HKDF with two outputs.
 *
 * temp = HMAC(ck, ikm); out1 = HMAC(temp, 0x01); out2 = HMAC(temp, out1 || 0x02)
 */
std::pair<Bytes, Bytes> noise_hkdf(const Bytes& ck, const Bytes& ikm);

/// Public key for a raw 32-byte X25519 private key.
Bytes x25519_public(const Bytes& priv);
/// Raw shared secret X25519(priv, peer_pub).
Bytes x25519(const Bytes& priv, const Bytes& peer_pub);

/// Returns ciphertext || 16-byte tag.
Bytes aes256gcm_encrypt(const Bytes& key, const Bytes& nonce, const Bytes& plaintext,
                        const Bytes& aad);
/// Opens ciphertext || tag. False when the tag does not verify or input is shorter than a tag.
bool  aes256gcm_decrypt(const Bytes& key, const Bytes& nonce, const Bytes& ct_and_tag,
                        const Bytes& aad, Bytes& plaintext);

/// OpenSSL CSPRNG.
Bytes random_bytes(size_t n);

} // namespace sechip::crypto

#endif // SECHIP_CRYPTO_HPP
