/**
 * @file crc16.hpp
 * @brief CRC-16 used as the trailing integrity check of every L2 frame.
 *
 * Parameters: polynomial 0x8005, initial value 0x0000, input and output not
 * reflected, no final xor (the "BUYPASS" variant, check value 0xFEE8 for
 * "123456789"). Frames carry it most-significant byte first.
 */
#ifndef SECHIP_CRC16_HPP
#define SECHIP_CRC16_HPP

#include <stddef.h>
#include <stdint.h>

namespace sechip {

uint16_t crc16(const uint8_t* data, size_t len);

/// Append the CRC of buf[0..len) as two big-endian bytes at buf[len], buf[len+1].
void     crc16_write(uint8_t* buf, size_t len);

} // namespace sechip

#endif // SECHIP_CRC16_HPP
