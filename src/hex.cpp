// -----------------------------------------------------------------------------
// hex.cpp - hex text helpers
// -----------------------------------------------------------------------------
#include "sechip/hex.hpp"

namespace sechip {

std::string to_hex(const uint8_t* data, size_t len) {
  static const char kDigits[] = "0123456789abcdef";
  std::string s;
  s.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    s += kDigits[data[i] >> 4];
    s += kDigits[data[i] & 0x0F];
  }
  return s;
}

bool hex_char_to_val(char c, uint8_t& out) {
  if ('0' <= c && c <= '9') { out = static_cast<uint8_t>(c - '0');      return true; }
  if ('A' <= c && c <= 'F') { out = static_cast<uint8_t>(c - 'A' + 10); return true; }
  if ('a' <= c && c <= 'f') { out = static_cast<uint8_t>(c - 'a' + 10); return true; }
  return false;
}

bool from_hex(const std::string& text, Bytes& out) {
  size_t start = 0;
  if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) start = 2;
  if ((text.size() - start) % 2 != 0) return false;     // two digits per byte

  Bytes tmp;
  tmp.reserve((text.size() - start) / 2);
  for (size_t i = start; i < text.size(); i += 2) {
    uint8_t hi = 0, lo = 0;
    if (!hex_char_to_val(text[i], hi) || !hex_char_to_val(text[i + 1], lo)) return false;
    tmp.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  out = std::move(tmp);
  return true;
}

} // namespace sechip
