// -----------------------------------------------------------------------------
// crc16.cpp - bitwise CRC-16 (poly 0x8005, MSB first)
// -----------------------------------------------------------------------------
#include "sechip/crc16.hpp"

namespace sechip {

uint16_t crc16(const uint8_t* data, size_t len) {
  uint16_t crc = 0x0000;
  for (size_t i = 0; i < len; ++i) {
    crc ^= static_cast<uint16_t>(data[i]) << 8;        // feed next byte into the top
    for (int bit = 0; bit < 8; ++bit) {
      if (crc & 0x8000) crc = static_cast<uint16_t>((crc << 1) ^ 0x8005);
      else              crc = static_cast<uint16_t>(crc << 1);
    }
  }
  return crc;
}

void crc16_write(uint8_t* buf, size_t len) {
  const uint16_t crc = crc16(buf, len);
  buf[len]     = static_cast<uint8_t>(crc >> 8);
  buf[len + 1] = static_cast<uint8_t>(crc & 0xFF);
}

} // namespace sechip
