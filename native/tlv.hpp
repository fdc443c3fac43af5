/**
 * RFC 5444 Decoder: TLV blocks.
 * One decoder serves packet, message and address-block TLVs; only address
 * TLVs may carry index fields.
 */

#ifndef RFC5444_TLV_HPP
#define RFC5444_TLV_HPP

#include "cursor.hpp"
#include "error.hpp"
#include <cstddef>
#include <cstdint>

namespace rfc5444 {

/** One decoded <tlv>. value borrows the input buffer. */
struct Tlv {
  uint8_t type{0};
  uint8_t flags{0};
  bool has_type_ext{false};
  uint8_t type_ext{0};
  bool in_address_block{false};
  bool has_index{false};      // index fields were on the wire
  uint8_t index_start{0};     // inclusive; 0 when no index fields in an address block
  uint8_t index_stop{0};      // inclusive; num_addr - 1 when no index fields
  bool has_value{false};
  bool multivalue{false};
  ByteSpan value;

  /** Whether this address TLV describes address index i of its block. */
  bool applies_to(size_t index) const;

  /**
   * Value for address index i: the per-address item of a multi-value TLV,
   * the whole value otherwise. False when the TLV does not apply to index.
   */
  bool value_for(size_t index, ByteSpan& out) const;
};

/**
 * Single-pass sequence over the TLVs of one block.
 * next() returns false at the end or on the first malformed TLV; error()
 * tells the two apart. Nothing is yielded after an error.
 */
class TlvIterator {
 public:
  TlvIterator() = default;
  TlvIterator(ByteSpan bytes, size_t num_addr) : cursor_(bytes), num_addr_(num_addr) {}

  bool next(Tlv& out);
  DecodeError error() const { return error_; }

 private:
  ByteCursor cursor_;
  size_t num_addr_{0};
  DecodeError error_{DecodeError::kNone};
};

/** A <tlv-block> whose TLVs are decoded lazily. */
struct TlvBlockView {
  ByteSpan bytes;       // the <tlv>* region, without the length field
  size_t num_addr{0};   // owning address block's count; 0 for packet and message TLVs

  bool empty() const { return bytes.empty(); }

  /** Fresh iterator from the start of the block; may be called any number of times. */
  TlvIterator iterator() const { return TlvIterator(bytes, num_addr); }

  /** Decode every TLV; kNone when the whole block is well formed. */
  DecodeError validate() const;
};

/** Decode one <tlv>. num_addr is 0 outside address blocks. */
DecodeError decode_tlv(ByteCursor& cursor, size_t num_addr, Tlv& out);

/**
 * Read <tlvs-length> and borrow that many bytes as a TLV block.
 * kUnexpectedEndOfInput if the length field is missing, kTruncatedTlvBlock
 * if the declared bytes are not there.
 */
DecodeError decode_tlv_block(ByteCursor& cursor, TlvBlockView& out, size_t num_addr = 0);

}  // namespace rfc5444

#endif  // RFC5444_TLV_HPP
