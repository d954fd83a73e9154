/**
 * @file hex.hpp
 * @brief Hex text <-> bytes, used by snapshots, the CLI and log lines.
 *
 * Decoding accepts upper or lower case and an optional "0x" prefix. It never
 * throws: a bad digit or an odd length returns false and leaves the output
 * unchanged.
 */
#ifndef SECHIP_HEX_HPP
#define SECHIP_HEX_HPP

#include "sechip/wire.hpp"

#include <string>

namespace sechip {

/// Lowercase, two digits per byte, no prefix.
std::string to_hex(const uint8_t* data, size_t len);
inline std::string to_hex(const Bytes& data) { return to_hex(data.data(), data.size()); }

bool hex_char_to_val(char c, uint8_t& out);
bool from_hex(const std::string& text, Bytes& out);

} // namespace sechip

#endif // SECHIP_HEX_HPP
