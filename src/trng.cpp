// -----------------------------------------------------------------------------
// trng.cpp - random source (OpenSSL or repeated debug pattern)
// -----------------------------------------------------------------------------
#include "sechip/trng.hpp"
#include "sechip/crypto.hpp"

namespace sechip {

Bytes Trng::get(size_t n) const {
  if (!deterministic()) return crypto::random_bytes(n);
  Bytes out;
  out.reserve(n);
  while (out.size() < n) out.push_back(debug_value_[out.size() % debug_value_.size()]);
  return out;
}

} // namespace sechip
