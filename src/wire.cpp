// -----------------------------------------------------------------------------
// wire.cpp - Implementation of the sechip wire codec
//
// API and size rules: see include/sechip/wire.hpp
// Tests: tests/test_wire.cpp
// -----------------------------------------------------------------------------
#include "sechip/wire.hpp"

namespace sechip {

namespace {
ByteOrder g_byte_order = ByteOrder::Little;   // process-wide codec setting
}

uint64_t max_value(Dtype d) {
  switch (d) {
    case Dtype::U8:  return 0xFFull;
    case Dtype::U16: return 0xFFFFull;
    case Dtype::U32: return 0xFFFFFFFFull;
    case Dtype::U64: return 0xFFFFFFFFFFFFFFFFull;
  }
  return 0;
}

void set_byte_order(ByteOrder order) { g_byte_order = order; }

ByteOrder byte_order() { return g_byte_order; }

void put_uint(Bytes& out, uint64_t value, Dtype d) {
  const size_t w = width(d);
  if (g_byte_order == ByteOrder::Little) {
    for (size_t i = 0; i < w; ++i) out.push_back(static_cast<uint8_t>(value >> (8 * i)));
  } else {
    for (size_t i = w; i > 0; --i) out.push_back(static_cast<uint8_t>(value >> (8 * (i - 1))));
  }
}

uint64_t get_uint(const uint8_t* p, Dtype d) {
  const size_t w = width(d);
  uint64_t v = 0;
  if (g_byte_order == ByteOrder::Little) {
    for (size_t i = w; i > 0; --i) v = (v << 8) | p[i - 1];
  } else {
    for (size_t i = 0; i < w; ++i) v = (v << 8) | p[i];
  }
  return v;
}

// ---------- Field ----------

Field::Field(const FieldSpec& spec)
: spec_(&spec) {
  const size_t n = spec.is_variable() ? spec.min_size : spec.max_size;
  values_.assign(n, spec.default_value);
}

// pad() - zero-fill up to the minimum the shape always serializes.
void Field::pad() {
  const size_t target = spec_->is_variable() ? spec_->min_size : spec_->max_size;
  while (values_.size() < target) values_.push_back(0);
}

Error Field::set(const std::vector<uint64_t>& values) {
  if (values.size() > spec_->max_size) return Error::Size;
  const uint64_t limit = max_value(spec_->dtype);
  for (uint64_t v : values) {
    if (v > limit) return Error::Encoding;
  }
  values_ = values;
  pad();
  return Error::None;
}

Error Field::set_value(uint64_t v) {
  return set(std::vector<uint64_t>{v});
}

Error Field::set_bytes(const uint8_t* data, size_t len) {
  if (len > spec_->max_size) return Error::Size;
  std::vector<uint64_t> tmp;
  tmp.reserve(len);
  for (size_t i = 0; i < len; ++i) tmp.push_back(data[i]);
  return set(tmp);
}

Bytes Field::bytes() const {
  Bytes out;
  out.reserve(values_.size());
  for (uint64_t v : values_) out.push_back(static_cast<uint8_t>(v));
  return out;
}

bool Field::operator==(const Field& other) const {
  return spec_ == other.spec_ && values_ == other.values_;
}

// ---------- free codec ----------

Error encode(const Field& field, Bytes& out) {
  const FieldSpec& spec = field.spec();
  if (field.element_count() > spec.max_size) return Error::Size;
  const uint64_t limit = max_value(spec.dtype);
  for (uint64_t v : field.values()) {
    if (v > limit) return Error::Encoding;
  }
  for (uint64_t v : field.values()) put_uint(out, v, spec.dtype);
  return Error::None;
}

Error decode(const uint8_t* data, size_t len, Dtype dtype, std::vector<uint64_t>& out) {
  const size_t w = width(dtype);
  if (len % w != 0) return Error::MalformedMessage;
  out.clear();
  out.reserve(len / w);
  for (size_t off = 0; off < len; off += w) out.push_back(get_uint(data + off, dtype));
  return Error::None;
}

} // namespace sechip
