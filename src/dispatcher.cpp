// -----------------------------------------------------------------------------
// dispatcher.cpp - Implementation of the L2/L3 dispatcher
//
// Pipeline, handler tables and error mapping: see include/sechip/dispatcher.hpp
// Tests: tests/test_dispatcher.cpp, tests/test_model_l2.cpp
//
// POLICY: nothing thrown by a handler leaves process(); every failure is a
// status frame.
// -----------------------------------------------------------------------------
#include "sechip/dispatcher.hpp"

#include <exception>
#include <iterator>
#include <string>

namespace sechip {

namespace {

using L2Handler = Error (ChipApi::*)(const Message&, Replies&);
using L3Handler = Error (ChipApi::*)(const Message&, Message&);

struct L2Route { uint8_t id; L2Handler handler; };
struct L3Route { uint8_t id; L3Handler handler; };

const L2Route kL2Routes[] = {
  {l2::GET_INFO,              &ChipApi::on_get_info},
  {l2::HANDSHAKE,             &ChipApi::on_handshake},
  {l2::ENCRYPTED_CMD,         &ChipApi::on_encrypted_cmd},
  {l2::ENCRYPTED_SESSION_ABT, &ChipApi::on_session_abort},
  {l2::SLEEP,                 &ChipApi::on_sleep},
  {l2::GET_LOG,               &ChipApi::on_get_log},
  {l2::MUTABLE_FW_ERASE,      &ChipApi::on_mutable_fw_erase},
  {l2::STARTUP,               &ChipApi::on_startup}
};

const L3Route kL3Routes[] = {
  {l3::PING,                   &ChipApi::on_ping},
  {l3::PAIRING_KEY_WRITE,      &ChipApi::on_pairing_key_write},
  {l3::PAIRING_KEY_READ,       &ChipApi::on_pairing_key_read},
  {l3::PAIRING_KEY_INVALIDATE, &ChipApi::on_pairing_key_invalidate},
  {l3::CONFIG_WRITE,           &ChipApi::on_config_write},
  {l3::CONFIG_READ,            &ChipApi::on_config_read},
  {l3::RANDOM_VALUE_GET,       &ChipApi::on_random_value_get}
};

L2Handler find_l2(uint8_t id) {
  for (const auto& r : kL2Routes) {
    if (r.id == id) return r.handler;
  }
  return nullptr;
}

L3Handler find_l3(uint8_t id) {
  for (const auto& r : kL3Routes) {
    if (r.id == id) return r.handler;
  }
  return nullptr;
}

} // namespace

Dispatcher::Dispatcher(ChipApi& api, CommandBuffer& buffer, const Logger& log,
                       const SchemaCatalog& catalog)
: api_(api), buffer_(buffer), log_(log), catalog_(catalog) {}

// ---------- status mapping ----------

uint8_t Dispatcher::l2_status_for(Error e) {
  switch (e) {
    case Error::None:             return l2::REQ_OK;
    case Error::MalformedMessage: return l2::CRC_ERR;
    case Error::UnknownMessage:   return l2::UNKNOWN_REQ;
    case Error::NoSession:        return l2::NO_SESSION;
    case Error::Authentication:   return l2::TAG_ERR;
    case Error::Handshake:        return l2::HSK_ERR;
    default:                      return l2::GEN_ERR;
  }
}

uint8_t Dispatcher::l3_result_for(Error e) {
  switch (e) {
    case Error::None:           return l3::OK;
    case Error::Unauthorized:   return l3::UNAUTHORIZED;
    case Error::UnknownMessage: return l3::INVALID_CMD;
    default:                    return l3::FAIL;
  }
}

Message Dispatcher::status_message(uint8_t status) {
  Message m(l2::kEmptyResponse);
  m.set_code(status);
  return m;
}

Message Dispatcher::response_for(uint8_t id, uint8_t status) const {
  const MessageSchema* shape = catalog_.find(Layer::L2Response, id);
  Message m(shape ? *shape : l2::kEmptyResponse);
  m.set_code(status);
  return m;
}

// ---------- L2 ----------

transport::Frames Dispatcher::process(const uint8_t* raw, std::size_t len) {
  // Generic view first: only REQ_LEN and CRC are checked here.
  Message generic;
  if (!ok(Message::from_bytes(l2::kGenericRequest, raw, len, generic)) ||
      !generic.has_valid_checksum()) {
    log_.info("request rejected: bad length or checksum");
    transport::Frames frames = status_frame(l2::CRC_ERR);
    buffer_.store(frames);
    return frames;
  }

  if (generic.code() == l2::RESEND) {
    transport::Frames frames;
    if (!ok(buffer_.replay(frames))) {
      log_.info("resend: nothing to resend");
      return status_frame(l2::GEN_ERR);
    }
    log_.debug("resend: replaying " + std::to_string(frames.size()) + " frame(s)");
    return frames;
  }

  transport::Frames frames = dispatch(raw, len);
  buffer_.store(frames);
  return frames;
}

// dispatch() - Resolve the shape, call the handler, serialize.
//
// PRE:  REQ_LEN and CRC already verified.
// OUT:  at least one frame.
transport::Frames Dispatcher::dispatch(const uint8_t* raw, std::size_t len) {
  Message req;
  const Error parsed = resolve(catalog_, Layer::L2Request, raw, len, req);
  const L2Handler handler = find_l2(raw[0]);
  if (parsed == Error::UnknownMessage || !handler) {
    log_.info("unknown request id " + hex_u32(raw[0]));
    return status_frame(l2::UNKNOWN_REQ);
  }
  if (!ok(parsed)) {
    log_.info(std::string(req.bound() ? req.schema().name : "request") + " malformed");
    return status_frame(l2::CRC_ERR);
  }

  log_.debug(std::string("request ") + req.schema().name);
  Replies replies;
  Error err = Error::None;
  try {
    err = (api_.*handler)(req, replies);
  } catch (const std::exception& ex) {
    log_.error(std::string(req.schema().name) + " failed: " + ex.what());
    return status_frame(l2::GEN_ERR);
  }

  if (!ok(err)) {
    if (err == Error::Sequencing) {
      log_.error(std::string(req.schema().name) + ": protocol driven out of order");
    } else {
      log_.info(std::string(req.schema().name) + ": " + to_string(err));
    }
    return status_frame(l2_status_for(err));
  }
  if (replies.empty()) replies.push_back(status_message(l2::REQ_OK));
  return serialize(replies);
}

transport::Frames Dispatcher::serialize(const Replies& replies) {
  transport::Frames frames;
  for (const auto& m : replies) {
    Bytes frame;
    const Error e = m.to_bytes(frame);
    if (!ok(e)) {
      log_.error(std::string("cannot serialize ") + m.schema().name + ": " + to_string(e));
      return status_frame(l2::GEN_ERR);
    }
    frames.push_back(std::move(frame));
  }
  return frames;
}

transport::Frames Dispatcher::status_frame(uint8_t status) {
  Bytes frame;
  const Error e = status_message(status).to_bytes(frame);
  if (!ok(e)) log_.error(std::string("cannot serialize status frame: ") + to_string(e));
  return transport::Frames{frame};
}

// ---------- L3 ----------

Error Dispatcher::process_l3(const Bytes& command, Bytes& result) {
  Message cmd;
  const Error parsed = resolve(catalog_, Layer::L3Command, command.data(), command.size(), cmd);
  const L3Handler handler = command.empty() ? nullptr : find_l3(command[0]);

  Error err = Error::None;
  Message res;
  if (parsed == Error::UnknownMessage || (ok(parsed) && !handler)) {
    err = Error::UnknownMessage;
  } else if (!ok(parsed)) {
    err = parsed;
  } else {
    const MessageSchema* shape = catalog_.find(Layer::L3Result, cmd.code());
    res = Message(shape ? *shape : l3::kEmptyResult);
    res.set_code(l3::OK);
    err = (api_.*handler)(cmd, res);
  }

  if (err == Error::Sequencing) return err;       // not a result: surfaces as L2 GEN_ERR

  if (ok(err)) err = res.to_bytes(result);
  if (!ok(err)) {
    const std::string what = cmd.bound() ? std::string(cmd.schema().name)
                                         : hex_u32(command.empty() ? 0 : command[0]);
    log_.info("command " + what + ": " + to_string(err));
    Message failed(l3::kEmptyResult);
    failed.set_code(l3_result_for(err));
    return failed.to_bytes(result);               // result byte only
  }
  return Error::None;
}

} // namespace sechip
