// -----------------------------------------------------------------------------
// host.cpp - Implementation of the host-side driver
//
// API and polling policy: see include/host.hpp
// Tests: tests/test_end_to_end.cpp, tests/test_model_l2.cpp
// -----------------------------------------------------------------------------
#include "host.hpp"

#include "sechip/crc16.hpp"
#include "sechip/crypto.hpp"
#include "sechip/hex.hpp"

#include <algorithm>
#include <sstream>

namespace sechip {

Host::Host(transport::ISpiTarget& target, bool encryption, const SchemaCatalog& catalog)
: target_(target), catalog_(catalog), session_(encryption) {}

Message Host::make_request(uint8_t id) const {
  const MessageSchema* shape = catalog_.find(Layer::L2Request, id);
  if (shape) return Message(*shape);
  Message m(l2::kGenericRequest);       // id unknown to the catalog: send it anyway
  m.set_code(id);
  return m;
}

Message Host::make_command(uint8_t id) const {
  const MessageSchema* shape = catalog_.find(Layer::L3Command, id);
  return shape ? Message(*shape) : Message();
}

Error Host::error_for_status(uint8_t status) {
  switch (status) {
    case l2::REQ_OK:
    case l2::RES_OK:
    case l2::REQ_CONT:
    case l2::RES_CONT:    return Error::None;
    case l2::HSK_ERR:     return Error::Handshake;
    case l2::NO_SESSION:  return Error::NoSession;
    case l2::TAG_ERR:     return Error::Authentication;
    case l2::CRC_ERR:     return Error::MalformedMessage;
    case l2::UNKNOWN_REQ: return Error::UnknownMessage;
    default:              return Error::ChipError;
  }
}

// ---------- L1/L2 plumbing ----------

Error Host::send_frame(const Bytes& frame) {
  if (!target_.drive_csn_low()) {
    log_.error(std::string("csn_low refused by ") + target_.name());
    return Error::Transport;
  }
  transport::spi_send(target_, frame);
  target_.drive_csn_high();
  return Error::None;
}

// read_response() - Poll until ready, then read exactly one frame.
//
// Frame length comes from the RSP_LEN byte, so the read is two steps:
// header first, then RSP_LEN + 2 more bytes.
Error Host::read_response(L2Reply& out) {
  for (unsigned poll = 0; poll < max_polls_; ++poll) {
    if (!target_.drive_csn_low()) return Error::Transport;
    const uint8_t chip_status = target_.exchange_byte(l1::GET_RESPONSE);
    if (!(chip_status & l1::CHIP_READY)) {
      target_.drive_csn_high();
      log_.debug("chip busy, poll " + std::to_string(poll + 1));
      continue;
    }

    L2Reply r;
    r.chip_status = chip_status;
    r.status      = target_.exchange_byte(0x00);
    if (r.status == l2::NO_RESP) {
      target_.drive_csn_high();
      out = std::move(r);
      return Error::None;
    }
    const uint8_t len = target_.exchange_byte(0x00);
    r.frame = {r.status, len};
    const Bytes rest = transport::spi_send(target_, Bytes(static_cast<size_t>(len) + 2, 0x00));
    target_.drive_csn_high();
    r.frame.insert(r.frame.end(), rest.begin(), rest.end());

    const uint16_t crc = static_cast<uint16_t>((rest[len] << 8) | rest[len + 1]);
    if (crc16(r.frame.data(), r.frame.size() - 2) != crc) {
      log_.error("response CRC mismatch");
      return Error::Transport;
    }
    r.data.assign(rest.begin(), rest.begin() + len);
    out = std::move(r);
    return Error::None;
  }
  return Error::ChipBusy;
}

Error Host::transfer(const Message& req, L2Reply& out) {
  Bytes frame;
  Error e = req.to_bytes(frame);
  if (ok(e)) e = send_frame(frame);
  if (ok(e)) e = read_response(out);
  return e;
}

// ---------- L2 requests ----------

Error Host::get_info(uint8_t object_id, uint8_t block_index, L2Reply& out) {
  Message req = make_request(l2::GET_INFO);
  Error e = req.field("object_id")->set_value(object_id);
  if (ok(e)) e = req.field("block_index")->set_value(block_index);
  if (ok(e)) e = transfer(req, out);
  return e;
}

Error Host::handshake(const HostKeys& keys, L2Reply& out, const Bytes& e_hpriv) {
  session_.invalidate();
  const Bytes eph_priv = e_hpriv.empty() ? crypto::random_bytes(crypto::kX25519KeySize) : e_hpriv;
  const Bytes eph_pub  = crypto::x25519_public(eph_priv);

  Message req = make_request(l2::HANDSHAKE);
  Error e = req.field("e_hpub")->set_bytes(eph_pub);
  if (ok(e)) e = req.field("pkey_index")->set_value(keys.pairing_key_index);
  if (ok(e)) e = transfer(req, out);
  if (!ok(e)) return e;
  if (out.status != l2::REQ_OK) return error_for_status(out.status);
  if (out.data.size() != 48) return Error::MalformedMessage;

  const Bytes e_tpub(out.data.begin(), out.data.begin() + 32);
  const Bytes t_tauth(out.data.begin() + 32, out.data.end());
  e = session_.complete_handshake(keys.s_h_priv, keys.s_h_pub, keys.s_t_pub, eph_priv, eph_pub,
                                  keys.pairing_key_index, e_tpub, t_tauth);
  if (!ok(e)) log_.error("chip failed to prove its static key");
  return e;
}

Error Host::resend(L2Reply& out) {
  return transfer(make_request(l2::RESEND), out);
}

Error Host::abort_session(L2Reply& out) {
  session_.invalidate();
  return transfer(make_request(l2::ENCRYPTED_SESSION_ABT), out);
}

// ---------- L3 ----------

// send_command() - Seal, chunk, send, collect, open, parse.
//
// OUT: on Error::None, out.result is the L3 result byte and out.message the
//      parsed result (unbound when the result is not OK).
Error Host::send_command(const Message& cmd, L3Reply& out) {
  Bytes plaintext;
  Error e = cmd.to_bytes(plaintext);
  if (!ok(e)) return e;

  Bytes sealed;
  e = session_.encrypt_command(plaintext, sealed);
  if (!ok(e)) return e;

  Bytes packet;
  put_uint(packet, plaintext.size(), Dtype::U16);
  packet.insert(packet.end(), sealed.begin(), sealed.end());

  // Command chunks: every one but the last is answered with REQ_CONT.
  L2Reply reply;
  for (size_t off = 0; off < packet.size(); off += l2::kMaxData) {
    const size_t n = std::min(l2::kMaxData, packet.size() - off);
    Message req = make_request(l2::ENCRYPTED_CMD);
    e = req.field("l3_chunk")->set_bytes(packet.data() + off, n);
    if (ok(e)) e = transfer(req, reply);
    if (!ok(e)) return e;
    out.l2_status = reply.status;
    const bool last = off + n == packet.size();
    if (!last && reply.status != l2::REQ_CONT) return error_for_status(reply.status);
  }

  // Result chunks: RES_CONT ... RES_OK.
  Bytes rx;
  for (;;) {
    out.l2_status = reply.status;
    if (reply.status != l2::RES_CONT && reply.status != l2::RES_OK) {
      const Error se = error_for_status(reply.status);
      return ok(se) ? Error::ChipError : se;
    }
    rx.insert(rx.end(), reply.data.begin(), reply.data.end());
    if (reply.status == l2::RES_OK) break;
    e = read_response(reply);
    if (!ok(e)) return e;
  }

  if (rx.size() < l3::kSizeFieldSize + l3::kTagSize) return Error::MalformedMessage;
  const size_t size = get_uint(rx.data(), Dtype::U16);
  if (rx.size() != l3::kSizeFieldSize + size + l3::kTagSize) return Error::MalformedMessage;

  Bytes result;
  e = session_.decrypt_result(Bytes(rx.begin() + l3::kSizeFieldSize, rx.end()), result);
  if (!ok(e)) return e;
  if (result.empty()) return Error::MalformedMessage;

  out.result = result[0];
  if (out.result != l3::OK) {
    out.message = Message();
    return Error::None;
  }
  const MessageSchema* shape = catalog_.find(Layer::L3Result, cmd.code());
  return Message::from_bytes(shape ? *shape : l3::kEmptyResult, result.data(), result.size(),
                             out.message);
}

// ---------- text ----------

std::string status_name(uint8_t status) {
  switch (status) {
    case l2::REQ_OK:      return "req_ok";
    case l2::RES_OK:      return "res_ok";
    case l2::REQ_CONT:    return "req_cont";
    case l2::RES_CONT:    return "res_cont";
    case l2::HSK_ERR:     return "hsk_err";
    case l2::NO_SESSION:  return "no_session";
    case l2::TAG_ERR:     return "tag_err";
    case l2::CRC_ERR:     return "crc_err";
    case l2::UNKNOWN_REQ: return "unknown_req";
    case l2::GEN_ERR:     return "gen_err";
    case l2::NO_RESP:     return "no_resp";
  }
  return hex_u32(status);
}

std::string describe(const L2Reply& reply) {
  std::ostringstream os;
  os << "status=" << status_name(reply.status) << " len=" << reply.data.size();
  if (!reply.data.empty()) os << " data=" << to_hex(reply.data);
  return os.str();
}

} // namespace sechip
