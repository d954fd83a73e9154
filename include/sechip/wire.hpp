/**
 * @file wire.hpp
 * @brief Wire codec: typed fields to and from byte sequences.
 *
 * @details
 * Every value that crosses the chip interface is a *field*: an array of
 * unsigned integer elements of one width (u8/u16/u32/u64) with a declared
 * element-count range. A scalar is simply a field with `min_size == max_size == 1`.
 *
 * ## Size rules
 * - A field whose range is fixed (`min_size == max_size`) always serializes
 *   exactly `max_size` elements; shorter input is zero-padded.
 * - A variable field (`min_size < max_size`) serializes what it holds, padded
 *   up to `min_size` when shorter.
 * - More than `max_size` elements is refused with `Error::Size`.
 * - An element that does not fit the declared width is refused with
 *   `Error::Encoding`.
 *
 * ## Byte order
 * One process-wide setting, little-endian unless changed with
 * `set_byte_order()`. It applies to every multi-byte element the codec writes
 * or reads (field elements, the L3 packet size prefix). The L2 CRC is not a
 * field and is always written most-significant byte first.
 *
 * ## Example
 * ```
 * static const FieldSpec kAddr{"address", Dtype::U16, 1, 1, 0, 0};
 * Field f{kAddr};
 * f.set_value(0x0120);
 * Bytes out;
 * encode(f, out);            // little-endian: {0x20, 0x01}
 * ```
 */

#ifndef SECHIP_WIRE_HPP
#define SECHIP_WIRE_HPP

#include "sechip/errors.hpp"

#include <stddef.h>
#include <stdint.h>
#include <vector>

namespace sechip {

using Bytes = std::vector<uint8_t>;

/// Element type. The enumerator value is the element width in bytes.
enum class Dtype : uint8_t { U8 = 1, U16 = 2, U32 = 4, U64 = 8 };

enum class ByteOrder : uint8_t { Little = 0, Big = 1 };

inline size_t width(Dtype d) { return static_cast<size_t>(d); }

/// Largest value an element of @p d can carry.
uint64_t max_value(Dtype d);

void      set_byte_order(ByteOrder order);
ByteOrder byte_order();

/// Append one element of width @p d in the current byte order (no range check).
void     put_uint(Bytes& out, uint64_t value, Dtype d);
/// Read one element of width @p d from @p p in the current byte order.
uint64_t get_uint(const uint8_t* p, Dtype d);

/**
 * @brief Static description of one field of a message shape.
 *
 * Catalog tables hold these as constants; a Field keeps a pointer to its spec,
 * so specs must outlive the fields built from them.
 */
struct FieldSpec {
  const char* name;
  Dtype       dtype;
  uint16_t    min_size;        ///< minimum element count
  uint16_t    max_size;        ///< maximum element count
  int8_t      priority;        ///< serialization order, lower first
  uint64_t    default_value;   ///< value of each element when not set

  bool is_variable() const { return min_size != max_size; }
};

/**
 * @brief A FieldSpec plus its current elements.
 *
 * Setters validate first and only then assign, so a refused value leaves the
 * previous content untouched.
 */
class Field {
public:
  explicit Field(const FieldSpec& spec);

  const FieldSpec& spec() const { return *spec_; }
  const char*      name() const { return spec_->name; }

  Error set(const std::vector<uint64_t>& values);
  Error set_value(uint64_t v);
  /// Each input byte becomes one element (the usual case for u8 arrays).
  Error set_bytes(const uint8_t* data, size_t len);
  Error set_bytes(const Bytes& data) { return set_bytes(data.data(), data.size()); }

  const std::vector<uint64_t>& values() const { return values_; }
  uint64_t value() const { return values_.empty() ? 0 : values_.front(); }
  /// Elements narrowed to bytes; meaningful for u8 fields.
  Bytes    bytes() const;

  size_t element_count() const { return values_.size(); }
  size_t byte_size() const { return values_.size() * width(spec_->dtype); }

  bool operator==(const Field& other) const;
  bool operator!=(const Field& other) const { return !(*this == other); }

private:
  void pad();

  const FieldSpec*      spec_;
  std::vector<uint64_t> values_;
};

/// Serialize @p field (appends to @p out). Re-validates size and width.
Error encode(const Field& field, Bytes& out);

/// Split @p len bytes into elements of @p dtype. Fails with MalformedMessage
/// when @p len is not a multiple of the element width.
Error decode(const uint8_t* data, size_t len, Dtype dtype, std::vector<uint64_t>& out);

} // namespace sechip

#endif // SECHIP_WIRE_HPP
