/**
 * @file trng.hpp
 * @brief Random source of the chip model.
 *
 * Two modes, chosen at construction:
 * - OpenSSL CSPRNG (default).
 * - Debug value: a fixed byte pattern repeated to the requested length. Makes
 *   ephemeral keys and RANDOM_VALUE_GET reproducible in tests.
 */
#ifndef SECHIP_TRNG_HPP
#define SECHIP_TRNG_HPP

#include "sechip/wire.hpp"

namespace sechip {

/// Length of a debug random value.
constexpr size_t kDebugRandomSize = 4;

class Trng {
public:
  Trng() = default;
  explicit Trng(const Bytes& debug_value) : debug_value_(debug_value) {}

  bool         deterministic() const { return !debug_value_.empty(); }
  const Bytes& debug_value() const { return debug_value_; }

  Bytes get(size_t n) const;

private:
  Bytes debug_value_;
};

} // namespace sechip

#endif // SECHIP_TRNG_HPP
