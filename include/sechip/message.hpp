/**
 * @file message.hpp
 * @brief Message framing: shapes, messages and the shape lookup.
 *
 * @details
 * A *message shape* (`MessageSchema`) is a static list of FieldSpecs bound to a
 * layer and a one-byte identifier. A `Message` is one instance of a shape,
 * with values. Shapes only describe the data fields; the framing bytes around
 * them depend on the layer:
 *
 * | Layer       | Layout on the wire                                   |
 * |-------------|------------------------------------------------------|
 * | L2Request   | `[REQ_ID][REQ_LEN][data...][CRC16 hi][CRC16 lo]`     |
 * | L2Response  | `[STATUS][RSP_LEN][data...][CRC16 hi][CRC16 lo]`     |
 * | L3Command   | `[CMD_ID][data...]`                                  |
 * | L3Result    | `[RESULT][data...]`                                  |
 *
 * The first byte is the message *code*: the identifier for requests and
 * commands, the status or result for responses and results. L3 messages carry
 * no checksum; they travel inside the authenticated L3 packet.
 *
 * ## Parsing
 * `from_bytes()` consumes fixed fields exactly and hands the remaining span to
 * the single variable field a shape may declare. A length that does not fit
 * the shape is `Error::MalformedMessage`.
 *
 * ## Lookup
 * `SchemaCatalog` is the abstract (layer, id) lookup the core consumes.
 * `TableCatalog` implements it over a static array of shapes. `resolve()`
 * reads the identifier byte, looks the shape up and parses, returning
 * `Error::UnknownMessage` or `Error::MalformedMessage` so the caller can pick
 * different status codes.
 */

#ifndef SECHIP_MESSAGE_HPP
#define SECHIP_MESSAGE_HPP

#include "sechip/errors.hpp"
#include "sechip/wire.hpp"

#include <stddef.h>
#include <stdint.h>
#include <vector>

namespace sechip {

enum class Layer : uint8_t { L2Request = 0, L2Response = 1, L3Command = 2, L3Result = 3 };

/// L2 layers carry a length byte and a CRC16 trailer.
inline bool is_l2(Layer l) { return l == Layer::L2Request || l == Layer::L2Response; }

struct MessageSchema {
  Layer            layer;
  uint8_t          id;
  const char*      name;
  const FieldSpec* fields;
  size_t           field_count;
};

class Message {
public:
  Message() = default;                       ///< unbound; only useful as an output slot
  explicit Message(const MessageSchema& schema);

  bool                 bound() const { return schema_ != nullptr; }
  const MessageSchema& schema() const { return *schema_; }

  uint8_t code() const { return code_; }
  void    set_code(uint8_t c) { code_ = c; }

  /// Field by name, nullptr when the shape has none.
  Field*       field(const char* name);
  const Field* field(const char* name) const;
  const std::vector<Field>& fields() const { return fields_; }

  /// Bytes of all data fields in priority order (no framing).
  Error payload(Bytes& out) const;

  /// Full frame: code, length (L2), payload, checksum (L2).
  Error to_bytes(Bytes& out) const;

  /// Checksum received with a parsed frame, or the one to_bytes() would write.
  uint16_t checksum() const;
  /// Recomputes over the non-checksum bytes; always true for L3 and for built messages.
  bool     has_valid_checksum() const;

  static Error from_bytes(const MessageSchema& schema, const uint8_t* raw, size_t len,
                          Message& out);

  bool operator==(const Message& other) const;
  bool operator!=(const Message& other) const { return !(*this == other); }

private:
  uint16_t computed_checksum() const;

  const MessageSchema* schema_{nullptr};
  uint8_t              code_{0};
  std::vector<Field>   fields_;             // sorted by FieldSpec::priority
  uint16_t             rx_checksum_{0};
  bool                 parsed_{false};
};

/// Abstract (layer, id) -> shape lookup.
class SchemaCatalog {
public:
  virtual ~SchemaCatalog() = default;
  virtual const MessageSchema* find(Layer layer, uint8_t id) const = 0;
};

/// SchemaCatalog over a static array of shape pointers (linear scan).
class TableCatalog : public SchemaCatalog {
public:
  TableCatalog(const MessageSchema* const* table, size_t count)
  : table_(table), count_(count) {}

  const MessageSchema* find(Layer layer, uint8_t id) const override;

private:
  const MessageSchema* const* table_;
  size_t                      count_;
};

/// Look up raw[0] in @p catalog for @p layer and parse the frame into @p out.
Error resolve(const SchemaCatalog& catalog, Layer layer, const uint8_t* raw, size_t len,
              Message& out);

} // namespace sechip

#endif // SECHIP_MESSAGE_HPP
