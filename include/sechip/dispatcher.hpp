/**
 * @file dispatcher.hpp
 * @brief Frame in, frames out: checksum, lookup, handler call, error-to-status mapping.
 *
 * @details
 * ## L2 pipeline (`process()`)
 * ```
 * raw frame
 *   ├─ REQ_LEN or CRC wrong ............................ CRC_ERR
 *   ├─ id == RESEND ...................... replay CommandBuffer (GEN_ERR if empty)
 *   ├─ id not in catalog / no handler .................. UNKNOWN_REQ
 *   ├─ data does not fit the shape ..................... CRC_ERR
 *   └─ ChipApi handler ─┬─ Error::None ..... the handler's response frames
 *                       └─ Error::X ........ status-only frame, l2_status_for(X)
 * ```
 * Exceptions thrown below a handler (OpenSSL failures) are caught here and
 * become GEN_ERR. Every answer except RESEND's is stored in the CommandBuffer.
 *
 * ## L3 pipeline (`process_l3()`)
 * Takes a decrypted command, returns the plaintext result. Unknown command ->
 * INVALID_CMD, malformed -> FAIL, `Error::Unauthorized` -> UNAUTHORIZED, any
 * other handler error -> FAIL. `Error::Sequencing` is not a result: it is
 * returned to the caller and ends up as an L2 GEN_ERR.
 *
 * ## Handler tables
 * Two static arrays map the message id to a `ChipApi` member function. A new
 * message needs a shape in the catalog, a row here and a virtual in ChipApi.
 */
#ifndef SECHIP_DISPATCHER_HPP
#define SECHIP_DISPATCHER_HPP

#include "sechip/catalog.hpp"
#include "sechip/command_buffer.hpp"
#include "sechip/errors.hpp"
#include "sechip/log.hpp"
#include "sechip/message.hpp"
#include "sechip/transport/spi_target.hpp"

#include <vector>

namespace sechip {

using Replies = std::vector<Message>;

/**
 * @brief Operations a concrete chip model implements.
 *
 * L2 handlers fill @p out with complete response messages (status already
 * set). L3 handlers receive a result message bound to the command's result
 * shape with code OK and fill its fields. Returning an error discards any
 * partial output.
 */
class ChipApi {
public:
  virtual ~ChipApi() = default;

  // ---- L2 ----
  virtual Error on_get_info(const Message& req, Replies& out) = 0;
  virtual Error on_handshake(const Message& req, Replies& out) = 0;
  virtual Error on_encrypted_cmd(const Message& req, Replies& out) = 0;
  virtual Error on_session_abort(const Message& req, Replies& out) = 0;
  virtual Error on_sleep(const Message& req, Replies& out) = 0;
  virtual Error on_get_log(const Message& req, Replies& out) = 0;
  virtual Error on_mutable_fw_erase(const Message& req, Replies& out) = 0;
  virtual Error on_startup(const Message& req, Replies& out) = 0;

  // ---- L3 ----
  virtual Error on_ping(const Message& cmd, Message& res) = 0;
  virtual Error on_pairing_key_write(const Message& cmd, Message& res) = 0;
  virtual Error on_pairing_key_read(const Message& cmd, Message& res) = 0;
  virtual Error on_pairing_key_invalidate(const Message& cmd, Message& res) = 0;
  virtual Error on_config_write(const Message& cmd, Message& res) = 0;
  virtual Error on_config_read(const Message& cmd, Message& res) = 0;
  virtual Error on_random_value_get(const Message& cmd, Message& res) = 0;
};

class Dispatcher : public transport::IFrameProcessor {
public:
  Dispatcher(ChipApi& api, CommandBuffer& buffer, const Logger& log,
             const SchemaCatalog& catalog = default_catalog());

  // Holds references to its api and buffer; a copy would alias them.
  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  transport::Frames process(const uint8_t* raw, std::size_t len) override;
  transport::Frames process(const Bytes& raw) { return process(raw.data(), raw.size()); }

  /// Decrypted L3 command in, plaintext L3 result out.
  Error process_l3(const Bytes& command, Bytes& result);

  const SchemaCatalog& catalog() const { return catalog_; }

  /// Status-only L2 response message.
  static Message status_message(uint8_t status);
  /// L2 response message bound to the response shape of request @p id.
  Message response_for(uint8_t id, uint8_t status) const;

  static uint8_t l2_status_for(Error e);
  static uint8_t l3_result_for(Error e);

private:
  transport::Frames dispatch(const uint8_t* raw, std::size_t len);
  transport::Frames serialize(const Replies& replies);
  transport::Frames status_frame(uint8_t status);

  ChipApi&             api_;
  CommandBuffer&       buffer_;
  const Logger&        log_;
  const SchemaCatalog& catalog_;
};

} // namespace sechip

#endif // SECHIP_DISPATCHER_HPP
