/**
 * @file host.hpp
 * @brief Host-side driver: talks to a chip model (or any ISpiTarget) the way host firmware would.
 *
 * @details
 * PURPOSE
 * -------
 * The chip model only reacts to chip-select edges and clocked bytes. This
 * driver is the other end of that wire. It lets a test or a tool:
 *   - Send an L2 request frame in one chip-select cycle.
 *   - Poll with GET_RESPONSE until the chip is ready, then read one response
 *     frame and check its CRC.
 *   - Run the host half of the secure-channel handshake.
 *   - Send an L3 command: seal it, cut it into ENCRYPTED_CMD chunks, collect
 *     the result chunks, open and parse the result.
 *
 * RELATIONSHIP TO OTHER FILES
 * ---------------------------
 * - **sechip/transport/spi_target.hpp**: the only thing the driver needs from
 *   the chip side.
 * - **sechip/catalog.hpp**: request shapes and status codes.
 * - **sechip/secure_session.hpp**: the host half of the key schedule
 *   (`complete_handshake`, `encrypt_command`, `decrypt_result`).
 * - **cli/main.cpp**: wraps these calls into command-line switches and prints
 *   `describe()` lines.
 *
 * POLLING
 * -------
 * Each GET_RESPONSE cycle costs one entry of the chip's busy schedule. The
 * driver re-polls up to `max_polls` times and then gives up with
 * `Error::ChipBusy`. A cycle that answers NO_RESP is returned as an L2Reply
 * with status NO_RESP; it is not an error.
 *
 * EXAMPLE FLOW
 * ------------
 *   Host host{model};
 *   L2Reply r;
 *   host.get_info(l2::OBJ_CHIP_ID, 0, r);   // r.status == REQ_OK, r.data == chip id
 *   describe(r)                            // "status=req_ok len=128"
 */
#ifndef SECHIP_HOST_HPP
#define SECHIP_HOST_HPP

#include "sechip/catalog.hpp"
#include "sechip/errors.hpp"
#include "sechip/log.hpp"
#include "sechip/message.hpp"
#include "sechip/secure_session.hpp"
#include "sechip/transport/spi_target.hpp"

#include <string>

namespace sechip {

/// Host identity: its static key pair and the slot the chip keeps its public key in.
struct HostKeys {
  Bytes   s_h_priv;
  Bytes   s_h_pub;
  Bytes   s_t_pub;             ///< chip static public key, known in advance
  uint8_t pairing_key_index{0};
};

/// One L2 response as read from the wire.
struct L2Reply {
  uint8_t chip_status{0};
  uint8_t status{l2::NO_RESP};
  Bytes   data;                ///< bytes between RSP_LEN and the CRC
  Bytes   frame;               ///< complete frame, CRC included
};

/// One L3 result after opening.
struct L3Reply {
  uint8_t l2_status{l2::NO_RESP};   ///< status of the last ENCRYPTED_CMD response
  uint8_t result{0};
  Message message;                  ///< bound to the result shape when result == OK
};

class Host {
public:
  explicit Host(transport::ISpiTarget& target, bool encryption = true,
                const SchemaCatalog& catalog = default_catalog());

  void     set_max_polls(unsigned n) { max_polls_ = n; }
  Logger&  log() { return log_; }
  const SecureSession& session() const { return session_; }

  /// Request message bound to the catalog shape of @p id (defaults filled).
  Message make_request(uint8_t id) const;
  /// L3 command message bound to the catalog shape of @p id.
  Message make_command(uint8_t id) const;

  // ---- L1/L2 plumbing ----
  Error send_frame(const Bytes& frame);
  Error read_response(L2Reply& out);
  Error transfer(const Message& req, L2Reply& out);

  // ---- L2 requests ----
  Error get_info(uint8_t object_id, uint8_t block_index, L2Reply& out);
  /// @p e_hpriv empty: a fresh ephemeral key from the OpenSSL RNG.
  Error handshake(const HostKeys& keys, L2Reply& out, const Bytes& e_hpriv = Bytes{});
  Error resend(L2Reply& out);
  Error abort_session(L2Reply& out);

  // ---- L3 ----
  Error send_command(const Message& cmd, L3Reply& out);

  /// Inverse of the chip's status mapping, for callers that want an Error.
  static Error error_for_status(uint8_t status);

private:
  transport::ISpiTarget& target_;
  const SchemaCatalog&   catalog_;
  SecureSession          session_;
  Logger                 log_{"host", LogLevel::Warning};
  unsigned               max_polls_{16};
};

/// Shell-friendly one-liner: "status=req_ok len=4 data=00000102".
std::string describe(const L2Reply& reply);
std::string status_name(uint8_t status);

} // namespace sechip

#endif // SECHIP_HOST_HPP
