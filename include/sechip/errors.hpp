/**
 * @file errors.hpp
 * @brief sechip error codes shared by every layer of the chip model.
 *
 * @details
 * The chip-side code never throws for protocol conditions. Every operation that
 * can fail returns one of these codes, and the dispatcher maps them onto the
 * L2 status byte or the L3 result byte the host sees.
 *
 * | Code                 | Raised by                         | Host sees            |
 * |----------------------|-----------------------------------|----------------------|
 * | Encoding             | wire codec (value too wide)       | GEN_ERR / FAIL       |
 * | Size                 | wire codec (too many elements)    | GEN_ERR / FAIL       |
 * | MalformedMessage     | framing (shape mismatch)          | CRC_ERR / FAIL       |
 * | UnknownMessage       | catalog lookup                    | UNKNOWN_REQ / INVALID_CMD |
 * | NoPreviousResponse   | command buffer                    | GEN_ERR              |
 * | Unauthorized         | access control, pairing slot      | UNAUTHORIZED         |
 * | Sequencing           | access control, no active slot    | GEN_ERR (logged)     |
 * | InvalidAddress       | config bank                       | FAIL                 |
 * | InvalidBitIndex      | config bank                       | FAIL                 |
 * | SlotNotWritable      | pairing keys (slot invalidated)   | FAIL                 |
 * | SlotEmpty            | pairing keys (blank/invalid read) | FAIL                 |
 * | NoSession            | secure session                    | NO_SESSION           |
 * | Authentication       | secure session (AEAD open)        | TAG_ERR              |
 * | Handshake            | secure session (handshake)        | HSK_ERR              |
 * | InvalidObject        | GET_INFO object/block             | GEN_ERR              |
 *
 * Host-side only (sechip::Host):
 *
 * | Code                 | Meaning                                          |
 * |----------------------|--------------------------------------------------|
 * | ChipError            | chip answered GEN_ERR or an unexpected status    |
 * | ChipBusy             | chip still busy after the configured poll count  |
 * | Transport            | chip select refused or response CRC wrong        |
 *
 * `to_string()` returns a stable lowercase token used in log lines and in the
 * CLI's `status=error reason=<token>` output. Tokens never change once shipped.
 */

#ifndef SECHIP_ERRORS_HPP
#define SECHIP_ERRORS_HPP

#include <stdint.h>

namespace sechip {

enum class Error : uint8_t {
  None = 0,
  Encoding,
  Size,
  MalformedMessage,
  UnknownMessage,
  NoPreviousResponse,
  Unauthorized,
  Sequencing,
  InvalidAddress,
  InvalidBitIndex,
  SlotNotWritable,
  SlotEmpty,
  NoSession,
  Authentication,
  Handshake,
  InvalidObject,
  ChipError,
  ChipBusy,
  Transport
};

/// Stable token for logs and CLI output ("size_error", "unauthorized", ...).
const char* to_string(Error e);

/// True when @p e is Error::None.
inline bool ok(Error e) { return e == Error::None; }

} // namespace sechip

#endif // SECHIP_ERRORS_HPP
