// -----------------------------------------------------------------------------
// catalog.cpp - static message shape tables
//
// One FieldSpec array and one MessageSchema per message kind. Priorities follow
// the wire order. Add a shape here and list it in kAll to make it resolvable.
// -----------------------------------------------------------------------------
#include "sechip/catalog.hpp"

#include <iterator>

namespace sechip {

namespace {

// ---------- L2 requests ----------
const FieldSpec kGenericReqF[] = {
  {"data", Dtype::U8, 0, 255, 0, 0}
};
const FieldSpec kGetInfoReqF[] = {
  {"object_id",   Dtype::U8, 1, 1, 0, 0},
  {"block_index", Dtype::U8, 1, 1, 1, 0}
};
const FieldSpec kHandshakeReqF[] = {
  {"e_hpub",     Dtype::U8, 32, 32, 0, 0},
  {"pkey_index", Dtype::U8, 1,  1,  1, 0}
};
const FieldSpec kEncCmdReqF[] = {
  {"l3_chunk", Dtype::U8, 1, l2::kMaxData, 0, 0}
};
const FieldSpec kSleepReqF[] = {
  {"sleep_kind", Dtype::U8, 1, 1, 0, 0}
};
const FieldSpec kFwEraseReqF[] = {
  {"bank_id", Dtype::U8, 1, 1, 0, 0}
};
const FieldSpec kStartupReqF[] = {
  {"startup_id", Dtype::U8, 1, 1, 0, l2::STARTUP_REBOOT}
};

// ---------- L2 responses ----------
const FieldSpec kGetInfoRspF[] = {
  {"object", Dtype::U8, 1, l2::kInfoBlockSize, 0, 0}
};
const FieldSpec kHandshakeRspF[] = {
  {"e_tpub",  Dtype::U8, 32, 32, 0, 0},
  {"t_tauth", Dtype::U8, 16, 16, 1, 0}
};
const FieldSpec kEncCmdRspF[] = {
  {"l3_chunk", Dtype::U8, 1, l2::kMaxData, 0, 0}
};
const FieldSpec kGetLogRspF[] = {
  {"log_msg", Dtype::U8, 0, l2::kMaxData, 0, 0}
};

// ---------- L3 commands ----------
const FieldSpec kPingCmdF[] = {
  {"data_in", Dtype::U8, 0, l3::kMaxPingData, 0, 0}
};
const FieldSpec kPairingWriteCmdF[] = {
  {"slot",    Dtype::U16, 1,  1,  0, 0},
  {"padding", Dtype::U8,  1,  1,  1, 0},
  {"s_hipub", Dtype::U8,  32, 32, 2, 0}
};
const FieldSpec kSlotCmdF[] = {
  {"slot", Dtype::U16, 1, 1, 0, 0}
};
const FieldSpec kConfigWriteCmdF[] = {
  {"address",   Dtype::U16, 1, 1, 0, 0},
  {"bit_index", Dtype::U8,  1, 1, 1, 0}
};
const FieldSpec kConfigReadCmdF[] = {
  {"address", Dtype::U16, 1, 1, 0, 0}
};
const FieldSpec kRandomCmdF[] = {
  {"n_bytes", Dtype::U8, 1, 1, 0, 0}
};

// ---------- L3 results ----------
const FieldSpec kPingResF[] = {
  {"data_out", Dtype::U8, 0, l3::kMaxPingData, 0, 0}
};
const FieldSpec kPairingReadResF[] = {
  {"padding", Dtype::U8, 3,  3,  0, 0},
  {"s_hipub", Dtype::U8, 32, 32, 1, 0}
};
const FieldSpec kConfigReadResF[] = {
  {"padding", Dtype::U8,  3, 3, 0, 0},
  {"value",   Dtype::U32, 1, 1, 1, 0}
};
const FieldSpec kRandomResF[] = {
  {"padding",     Dtype::U8, 3, 3,   0, 0},
  {"random_data", Dtype::U8, 0, 255, 1, 0}
};

#define SECHIP_SHAPE(layer, id, name, fields) \
  MessageSchema{layer, id, name, fields, std::size(fields)}
#define SECHIP_EMPTY_SHAPE(layer, id, name) \
  MessageSchema{layer, id, name, nullptr, 0}

const MessageSchema kGetInfoReq   = SECHIP_SHAPE(Layer::L2Request, l2::GET_INFO, "get_info_req", kGetInfoReqF);
const MessageSchema kHandshakeReq = SECHIP_SHAPE(Layer::L2Request, l2::HANDSHAKE, "handshake_req", kHandshakeReqF);
const MessageSchema kEncCmdReq    = SECHIP_SHAPE(Layer::L2Request, l2::ENCRYPTED_CMD, "encrypted_cmd_req", kEncCmdReqF);
const MessageSchema kAbortReq     = SECHIP_EMPTY_SHAPE(Layer::L2Request, l2::ENCRYPTED_SESSION_ABT, "encrypted_session_abt_req");
const MessageSchema kResendReq    = SECHIP_EMPTY_SHAPE(Layer::L2Request, l2::RESEND, "resend_req");
const MessageSchema kSleepReq     = SECHIP_SHAPE(Layer::L2Request, l2::SLEEP, "sleep_req", kSleepReqF);
const MessageSchema kGetLogReq    = SECHIP_EMPTY_SHAPE(Layer::L2Request, l2::GET_LOG, "get_log_req");
const MessageSchema kFwEraseReq   = SECHIP_SHAPE(Layer::L2Request, l2::MUTABLE_FW_ERASE, "mutable_fw_erase_req", kFwEraseReqF);
const MessageSchema kStartupReq   = SECHIP_SHAPE(Layer::L2Request, l2::STARTUP, "startup_req", kStartupReqF);

const MessageSchema kGetInfoRsp   = SECHIP_SHAPE(Layer::L2Response, l2::GET_INFO, "get_info_rsp", kGetInfoRspF);
const MessageSchema kHandshakeRsp = SECHIP_SHAPE(Layer::L2Response, l2::HANDSHAKE, "handshake_rsp", kHandshakeRspF);
const MessageSchema kEncCmdRsp    = SECHIP_SHAPE(Layer::L2Response, l2::ENCRYPTED_CMD, "encrypted_cmd_rsp", kEncCmdRspF);
const MessageSchema kGetLogRsp    = SECHIP_SHAPE(Layer::L2Response, l2::GET_LOG, "get_log_rsp", kGetLogRspF);

const MessageSchema kPingCmd          = SECHIP_SHAPE(Layer::L3Command, l3::PING, "ping_cmd", kPingCmdF);
const MessageSchema kPairingWriteCmd  = SECHIP_SHAPE(Layer::L3Command, l3::PAIRING_KEY_WRITE, "pairing_key_write_cmd", kPairingWriteCmdF);
const MessageSchema kPairingReadCmd   = SECHIP_SHAPE(Layer::L3Command, l3::PAIRING_KEY_READ, "pairing_key_read_cmd", kSlotCmdF);
const MessageSchema kPairingInvCmd    = SECHIP_SHAPE(Layer::L3Command, l3::PAIRING_KEY_INVALIDATE, "pairing_key_invalidate_cmd", kSlotCmdF);
const MessageSchema kConfigWriteCmd   = SECHIP_SHAPE(Layer::L3Command, l3::CONFIG_WRITE, "config_write_cmd", kConfigWriteCmdF);
const MessageSchema kConfigReadCmd    = SECHIP_SHAPE(Layer::L3Command, l3::CONFIG_READ, "config_read_cmd", kConfigReadCmdF);
const MessageSchema kRandomCmd        = SECHIP_SHAPE(Layer::L3Command, l3::RANDOM_VALUE_GET, "random_value_get_cmd", kRandomCmdF);

const MessageSchema kPingRes          = SECHIP_SHAPE(Layer::L3Result, l3::PING, "ping_res", kPingResF);
const MessageSchema kPairingWriteRes  = SECHIP_EMPTY_SHAPE(Layer::L3Result, l3::PAIRING_KEY_WRITE, "pairing_key_write_res");
const MessageSchema kPairingReadRes   = SECHIP_SHAPE(Layer::L3Result, l3::PAIRING_KEY_READ, "pairing_key_read_res", kPairingReadResF);
const MessageSchema kPairingInvRes    = SECHIP_EMPTY_SHAPE(Layer::L3Result, l3::PAIRING_KEY_INVALIDATE, "pairing_key_invalidate_res");
const MessageSchema kConfigWriteRes   = SECHIP_EMPTY_SHAPE(Layer::L3Result, l3::CONFIG_WRITE, "config_write_res");
const MessageSchema kConfigReadRes    = SECHIP_SHAPE(Layer::L3Result, l3::CONFIG_READ, "config_read_res", kConfigReadResF);
const MessageSchema kRandomRes        = SECHIP_SHAPE(Layer::L3Result, l3::RANDOM_VALUE_GET, "random_value_get_res", kRandomResF);

#undef SECHIP_SHAPE
#undef SECHIP_EMPTY_SHAPE

const MessageSchema* const kAll[] = {
  &kGetInfoReq, &kHandshakeReq, &kEncCmdReq, &kAbortReq, &kResendReq,
  &kSleepReq, &kGetLogReq, &kFwEraseReq, &kStartupReq,
  &kGetInfoRsp, &kHandshakeRsp, &kEncCmdRsp, &kGetLogRsp,
  &kPingCmd, &kPairingWriteCmd, &kPairingReadCmd, &kPairingInvCmd,
  &kConfigWriteCmd, &kConfigReadCmd, &kRandomCmd,
  &kPingRes, &kPairingWriteRes, &kPairingReadRes, &kPairingInvRes,
  &kConfigWriteRes, &kConfigReadRes, &kRandomRes
};

} // namespace

namespace l2 {
const MessageSchema kGenericRequest{Layer::L2Request, 0x00, "generic_req", kGenericReqF,
                                    std::size(kGenericReqF)};
const MessageSchema kEmptyResponse{Layer::L2Response, 0x00, "empty_rsp", nullptr, 0};
} // namespace l2

namespace l3 {
const MessageSchema kEmptyResult{Layer::L3Result, 0x00, "empty_res", nullptr, 0};
} // namespace l3

const SchemaCatalog& default_catalog() {
  static const TableCatalog catalog(kAll, std::size(kAll));
  return catalog;
}

} // namespace sechip
