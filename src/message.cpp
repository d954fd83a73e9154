// -----------------------------------------------------------------------------
// message.cpp - Implementation of sechip message framing
//
// Layout per layer, parsing rules and lookup contract:
//   see include/sechip/message.hpp
//
// NOTE: a Message never owns its shape. Shapes are static tables (catalog.cpp)
// and outlive every message built from them.
// -----------------------------------------------------------------------------
#include "sechip/message.hpp"
#include "sechip/crc16.hpp"

#include <algorithm>
#include <cstring>

namespace sechip {

namespace {
constexpr size_t kL2Overhead = 4;   // code + length + CRC16
}

// ---------- construction ----------

Message::Message(const MessageSchema& schema)
: schema_(&schema), code_(schema.id) {
  fields_.reserve(schema.field_count);
  for (size_t i = 0; i < schema.field_count; ++i) fields_.emplace_back(schema.fields[i]);
  // priority order; equal priorities keep declaration order
  std::stable_sort(fields_.begin(), fields_.end(), [](const Field& a, const Field& b) {
    return a.spec().priority < b.spec().priority;
  });
}

Field* Message::field(const char* name) {
  for (auto& f : fields_) {
    if (std::strcmp(f.name(), name) == 0) return &f;
  }
  return nullptr;
}

const Field* Message::field(const char* name) const {
  for (const auto& f : fields_) {
    if (std::strcmp(f.name(), name) == 0) return &f;
  }
  return nullptr;
}

// ---------- serialization ----------

Error Message::payload(Bytes& out) const {
  for (const auto& f : fields_) {
    const Error e = encode(f, out);
    if (!ok(e)) return e;
  }
  return Error::None;
}

Error Message::to_bytes(Bytes& out) const {
  if (!schema_) return Error::MalformedMessage;

  Bytes data;
  const Error e = payload(data);
  if (!ok(e)) return e;

  out.clear();
  out.push_back(code_);
  if (!is_l2(schema_->layer)) {
    out.insert(out.end(), data.begin(), data.end());
    return Error::None;
  }

  if (data.size() > 0xFF) return Error::Size;          // length byte cannot express it
  out.push_back(static_cast<uint8_t>(data.size()));
  out.insert(out.end(), data.begin(), data.end());
  const size_t body = out.size();
  out.resize(body + 2);
  crc16_write(out.data(), body);
  return Error::None;
}

uint16_t Message::computed_checksum() const {
  Bytes frame;
  if (!ok(to_bytes(frame)) || frame.size() < 2) return 0;
  return static_cast<uint16_t>((frame[frame.size() - 2] << 8) | frame[frame.size() - 1]);
}

uint16_t Message::checksum() const {
  return parsed_ ? rx_checksum_ : computed_checksum();
}

bool Message::has_valid_checksum() const {
  if (!schema_) return false;
  if (!is_l2(schema_->layer) || !parsed_) return true;
  return computed_checksum() == rx_checksum_;
}

// ---------- parsing ----------

// from_bytes() - Split the frame, then walk the fields in priority order.
//
// PRE: raw points to a complete frame of len bytes (framing included).
// OUT: out is rebound to schema and filled; untouched on failure.
Error Message::from_bytes(const MessageSchema& schema, const uint8_t* raw, size_t len,
                          Message& out) {
  const bool l2 = is_l2(schema.layer);
  if (!raw || len < (l2 ? kL2Overhead : 1)) return Error::MalformedMessage;

  const uint8_t* data = raw + (l2 ? 2 : 1);
  size_t data_len     = len - (l2 ? kL2Overhead : 1);
  if (l2 && raw[1] != data_len) return Error::MalformedMessage;   // REQ_LEN disagrees

  Message msg(schema);
  msg.code_ = raw[0];
  if (l2) {
    msg.rx_checksum_ = static_cast<uint16_t>((raw[len - 2] << 8) | raw[len - 1]);
  }

  // Fixed fields take exactly their span; the variable one takes the rest.
  size_t fixed_bytes = 0;
  const Field* variable = nullptr;
  for (const auto& f : msg.fields_) {
    if (f.spec().is_variable()) {
      if (variable) return Error::MalformedMessage;   // shape error: two variable fields
      variable = &f;
    } else {
      fixed_bytes += f.spec().max_size * width(f.spec().dtype);
    }
  }
  if (data_len < fixed_bytes) return Error::MalformedMessage;

  size_t variable_count = 0;
  if (variable) {
    const size_t rest = data_len - fixed_bytes;
    const size_t w    = width(variable->spec().dtype);
    if (rest % w != 0) return Error::MalformedMessage;
    variable_count = rest / w;
    if (variable_count < variable->spec().min_size ||
        variable_count > variable->spec().max_size) {
      return Error::MalformedMessage;
    }
  } else if (data_len != fixed_bytes) {
    return Error::MalformedMessage;
  }

  size_t off = 0;
  std::vector<uint64_t> values;
  for (auto& f : msg.fields_) {
    const size_t count = f.spec().is_variable() ? variable_count : f.spec().max_size;
    const size_t span  = count * width(f.spec().dtype);
    Error e = decode(data + off, span, f.spec().dtype, values);
    if (ok(e)) e = f.set(values);
    if (!ok(e)) return Error::MalformedMessage;
    off += span;
  }

  msg.parsed_ = true;
  out = std::move(msg);
  return Error::None;
}

bool Message::operator==(const Message& other) const {
  return schema_ == other.schema_ && code_ == other.code_ && fields_ == other.fields_;
}

// ---------- lookup ----------

const MessageSchema* TableCatalog::find(Layer layer, uint8_t id) const {
  for (size_t i = 0; i < count_; ++i) {
    const MessageSchema* s = table_[i];
    if (s->layer == layer && s->id == id) return s;
  }
  return nullptr;
}

Error resolve(const SchemaCatalog& catalog, Layer layer, const uint8_t* raw, size_t len,
              Message& out) {
  if (!raw || len == 0) return Error::MalformedMessage;
  const MessageSchema* schema = catalog.find(layer, raw[0]);
  if (!schema) return Error::UnknownMessage;
  return Message::from_bytes(*schema, raw, len, out);
}

} // namespace sechip
