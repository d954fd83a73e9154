// -----------------------------------------------------------------------------
// crypto.cpp - OpenSSL primitives for the secure channel
//
// Every EVP object is freed on every path before throwing.
// -----------------------------------------------------------------------------
#include "sechip/crypto.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <stdexcept>

namespace sechip::crypto {

Bytes sha256(const Bytes& data) {
  Bytes out(SHA256_DIGEST_LENGTH);
  if (!SHA256(data.data(), data.size(), out.data())) {
    throw std::runtime_error("SHA256 failed");
  }
  return out;
}

Bytes hmac_sha256(const Bytes& key, const Bytes& data) {
  unsigned int len = 0;
  Bytes out(EVP_MAX_MD_SIZE);
  if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
            data.data(), data.size(), out.data(), &len)) {
    throw std::runtime_error("HMAC(sha256) failed");
  }
  out.resize(len);
  return out;
}

std::pair<Bytes, Bytes> noise_hkdf(const Bytes& ck, const Bytes& ikm) {
  const Bytes temp = hmac_sha256(ck, ikm);
  Bytes out1 = hmac_sha256(temp, Bytes{0x01});
  Bytes in2  = out1;
  in2.push_back(0x02);
  Bytes out2 = hmac_sha256(temp, in2);
  return {std::move(out1), std::move(out2)};
}

// ---------- X25519 ----------

Bytes x25519_public(const Bytes& priv) {
  if (priv.size() != kX25519KeySize) throw std::runtime_error("x25519_public: bad key size");
  EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr, priv.data(), priv.size());
  if (!pkey) throw std::runtime_error("EVP_PKEY_new_raw_private_key failed");

  Bytes pub(kX25519KeySize);
  size_t len = pub.size();
  if (EVP_PKEY_get_raw_public_key(pkey, pub.data(), &len) != 1 || len != kX25519KeySize) {
    EVP_PKEY_free(pkey);
    throw std::runtime_error("EVP_PKEY_get_raw_public_key failed");
  }
  EVP_PKEY_free(pkey);
  return pub;
}

Bytes x25519(const Bytes& priv, const Bytes& peer_pub) {
  if (priv.size() != kX25519KeySize || peer_pub.size() != kX25519KeySize) {
    throw std::runtime_error("x25519: bad key size");
  }
  EVP_PKEY* key = EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr, priv.data(), priv.size());
  if (!key) throw std::runtime_error("EVP_PKEY_new_raw_private_key failed");
  EVP_PKEY* peer = EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr, peer_pub.data(), peer_pub.size());
  if (!peer) {
    EVP_PKEY_free(key);
    throw std::runtime_error("EVP_PKEY_new_raw_public_key failed");
  }
  EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new(key, nullptr);
  if (!ctx) {
    EVP_PKEY_free(peer);
    EVP_PKEY_free(key);
    throw std::runtime_error("EVP_PKEY_CTX_new failed");
  }

  Bytes secret(kX25519KeySize);
  size_t len = secret.size();
  const bool good = EVP_PKEY_derive_init(ctx) == 1 &&
                    EVP_PKEY_derive_set_peer(ctx, peer) == 1 &&
                    EVP_PKEY_derive(ctx, secret.data(), &len) == 1;
  EVP_PKEY_CTX_free(ctx);
  EVP_PKEY_free(peer);
  EVP_PKEY_free(key);
  if (!good) throw std::runtime_error("X25519 derive failed");   // includes low-order peer keys
  secret.resize(len);
  return secret;
}

// ---------- AES-256-GCM ----------

Bytes aes256gcm_encrypt(const Bytes& key, const Bytes& nonce, const Bytes& plaintext,
                        const Bytes& aad) {
  if (key.size() != kAesKeySize || nonce.size() != kGcmNonceSize) {
    throw std::runtime_error("aes256gcm_encrypt: invalid key/nonce size");
  }
  EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
  if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");

  Bytes out(plaintext.size() + kGcmTagSize);
  int len1 = 0, len2 = 0, aad_len = 0;
  int rc = EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr);
  if (rc == 1) rc = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()), nullptr);
  if (rc == 1) rc = EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce.data());
  if (rc == 1 && !aad.empty()) {
    rc = EVP_EncryptUpdate(ctx, nullptr, &aad_len, aad.data(), static_cast<int>(aad.size()));
  }
  if (rc == 1 && !plaintext.empty()) {
    rc = EVP_EncryptUpdate(ctx, out.data(), &len1, plaintext.data(), static_cast<int>(plaintext.size()));
  }
  if (rc == 1) rc = EVP_EncryptFinal_ex(ctx, out.data() + len1, &len2);
  if (rc == 1) {
    rc = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(kGcmTagSize),
                             out.data() + plaintext.size());
  }
  EVP_CIPHER_CTX_free(ctx);
  if (rc != 1) throw std::runtime_error("AES-256-GCM encrypt failed");
  return out;
}

bool aes256gcm_decrypt(const Bytes& key, const Bytes& nonce, const Bytes& ct_and_tag,
                       const Bytes& aad, Bytes& plaintext) {
  if (key.size() != kAesKeySize || nonce.size() != kGcmNonceSize) {
    throw std::runtime_error("aes256gcm_decrypt: invalid key/nonce size");
  }
  if (ct_and_tag.size() < kGcmTagSize) return false;
  const size_t ct_len = ct_and_tag.size() - kGcmTagSize;

  EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
  if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");

  Bytes out(ct_len);
  Bytes tag(ct_and_tag.end() - kGcmTagSize, ct_and_tag.end());
  int len1 = 0, len2 = 0, aad_len = 0;
  int rc = EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr);
  if (rc == 1) rc = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()), nullptr);
  if (rc == 1) rc = EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce.data());
  if (rc == 1 && !aad.empty()) {
    rc = EVP_DecryptUpdate(ctx, nullptr, &aad_len, aad.data(), static_cast<int>(aad.size()));
  }
  if (rc == 1 && ct_len > 0) {
    rc = EVP_DecryptUpdate(ctx, out.data(), &len1, ct_and_tag.data(), static_cast<int>(ct_len));
  }
  if (rc == 1) rc = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(kGcmTagSize), tag.data());
  if (rc != 1) {
    EVP_CIPHER_CTX_free(ctx);
    throw std::runtime_error("AES-256-GCM decrypt setup failed");
  }
  // Final is where the tag is checked; 0 here means authentication failed.
  const int verified = EVP_DecryptFinal_ex(ctx, out.data() + len1, &len2);
  EVP_CIPHER_CTX_free(ctx);
  if (verified != 1) return false;
  out.resize(static_cast<size_t>(len1 + len2));
  plaintext = std::move(out);
  return true;
}

Bytes random_bytes(size_t n) {
  Bytes out(n);
  if (n > 0 && RAND_bytes(out.data(), static_cast<int>(n)) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return out;
}

} // namespace sechip::crypto
