/**
 * @file catalog.hpp
 * @brief Concrete message catalog: identifiers, status codes and message shapes.
 *
 * @details
 * The core only needs a `SchemaCatalog`. This header provides the one this
 * project ships: the L1 control bytes, L2 request/response shapes and status
 * codes, L3 command/result shapes and result codes, plus the GET_INFO object
 * identifiers.
 *
 * Shapes are static tables (one `MessageSchema` per message kind). Response
 * and result shapes share the identifier of the request/command they answer.
 * Error replies use the empty shapes `kL2EmptyResponse` / `kL3EmptyResult`.
 *
 * | L2 request              | Id   | Data fields                           |
 * |-------------------------|------|---------------------------------------|
 * | GET_INFO                | 0x01 | object_id u8, block_index u8          |
 * | HANDSHAKE               | 0x02 | e_hpub u8[32], pkey_index u8          |
 * | ENCRYPTED_CMD           | 0x04 | l3_chunk u8[1..252]                   |
 * | ENCRYPTED_SESSION_ABT   | 0x08 | -                                     |
 * | RESEND                  | 0x10 | -                                     |
 * | SLEEP                   | 0x20 | sleep_kind u8                         |
 * | GET_LOG                 | 0xA2 | -                                     |
 * | MUTABLE_FW_ERASE        | 0xB2 | bank_id u8                            |
 * | STARTUP                 | 0xB3 | startup_id u8                         |
 *
 * | L3 command              | Id   | Data fields                           |
 * |-------------------------|------|---------------------------------------|
 * | PING                    | 0x01 | data_in u8[0..4096]                   |
 * | PAIRING_KEY_WRITE       | 0x10 | slot u16, padding u8, s_hipub u8[32]  |
 * | PAIRING_KEY_READ        | 0x11 | slot u16                              |
 * | PAIRING_KEY_INVALIDATE  | 0x12 | slot u16                              |
 * | CONFIG_WRITE            | 0x30 | address u16, bit_index u8             |
 * | CONFIG_READ             | 0x31 | address u16                           |
 * | RANDOM_VALUE_GET        | 0x50 | n_bytes u8                            |
 */

#ifndef SECHIP_CATALOG_HPP
#define SECHIP_CATALOG_HPP

#include "sechip/message.hpp"

#include <stddef.h>
#include <stdint.h>

namespace sechip {

// ============================== L1 ==============================
namespace l1 {
enum : uint8_t {
  GET_RESPONSE = 0xAA,        /**< first byte of a response-polling cycle */
  CHIP_READY   = 0x01,        /**< CHIP_STATUS: response can be read */
  CHIP_ALARM   = 0x02,        /**< CHIP_STATUS: alarm mode */
  CHIP_START   = 0x04         /**< CHIP_STATUS: start-up in progress */
};
} // namespace l1

// ============================== L2 ==============================
namespace l2 {

/// Largest data part of one L2 frame.
constexpr size_t kMaxData = 252;

enum : uint8_t {
  GET_INFO              = 0x01,
  HANDSHAKE             = 0x02,
  ENCRYPTED_CMD         = 0x04,
  ENCRYPTED_SESSION_ABT = 0x08,
  RESEND                = 0x10,
  SLEEP                 = 0x20,
  GET_LOG               = 0xA2,
  MUTABLE_FW_ERASE      = 0xB2,
  STARTUP               = 0xB3
};

/// L2 response status byte.
enum : uint8_t {
  REQ_OK      = 0x01,  /**< request executed */
  RES_OK      = 0x02,  /**< last chunk of an encrypted result */
  REQ_CONT    = 0x03,  /**< command chunk accepted, send the next one */
  RES_CONT    = 0x04,  /**< more result chunks follow */
  HSK_ERR     = 0x79,  /**< handshake failed */
  NO_SESSION  = 0x7A,  /**< encrypted command without a secure channel */
  TAG_ERR     = 0x7B,  /**< L3 packet failed authentication */
  CRC_ERR     = 0x7C,  /**< bad checksum or malformed frame */
  UNKNOWN_REQ = 0x7E,  /**< request id not recognised */
  GEN_ERR     = 0x7F,  /**< generic failure */
  NO_RESP     = 0xFF   /**< nothing to read */
};

/// GET_INFO object identifiers.
enum : uint8_t {
  OBJ_X509_CERTIFICATE = 0x00,
  OBJ_CHIP_ID          = 0x01,
  OBJ_RISCV_FW_VERSION = 0x02,
  OBJ_SPECT_FW_VERSION = 0x04
};

/// GET_INFO serves the certificate in blocks of this many bytes.
constexpr size_t kInfoBlockSize = 128;

/// STARTUP identifiers.
enum : uint8_t {
  STARTUP_REBOOT             = 0x01,  /**< reboot into the application firmware */
  STARTUP_MAINTENANCE_REBOOT = 0x03   /**< reboot and stay in start-up mode */
};

/// SPECT_FW_VERSION reported while in start-up mode.
constexpr uint32_t kStartupSpectVersion = 0x80000000;

extern const MessageSchema kGenericRequest;   ///< any id, data u8[0..255]
extern const MessageSchema kEmptyResponse;    ///< status only

} // namespace l2

// ============================== L3 ==============================
namespace l3 {

constexpr size_t kTagSize       = 16;
constexpr size_t kSizeFieldSize = 2;
constexpr size_t kMaxPingData   = 4096;

enum : uint8_t {
  PING                   = 0x01,
  PAIRING_KEY_WRITE      = 0x10,
  PAIRING_KEY_READ       = 0x11,
  PAIRING_KEY_INVALIDATE = 0x12,
  CONFIG_WRITE           = 0x30,
  CONFIG_READ            = 0x31,
  RANDOM_VALUE_GET       = 0x50
};

/// L3 result byte.
enum : uint8_t {
  OK           = 0xC3,
  FAIL         = 0x3C,
  UNAUTHORIZED = 0x01,
  INVALID_CMD  = 0x02
};

extern const MessageSchema kEmptyResult;      ///< result byte only

} // namespace l3

/// The catalog of every shape listed above.
const SchemaCatalog& default_catalog();

} // namespace sechip

#endif // SECHIP_CATALOG_HPP
