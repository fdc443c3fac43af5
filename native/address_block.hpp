/**
 * RFC 5444 Decoder: address blocks.
 *
 * An address block stores num_addr addresses of addr_length bytes each as
 *   <head> (shared prefix) + <mid> (per address) + <tail> (shared suffix)
 * where the tail may be an implicit run of zero bytes that is not on the
 * wire. Addresses are rebuilt on request into a caller-owned buffer; the
 * block itself only borrows the input.
 */

#ifndef RFC5444_ADDRESS_BLOCK_HPP
#define RFC5444_ADDRESS_BLOCK_HPP

#include "cursor.hpp"
#include "error.hpp"
#include "tlv.hpp"
#include <cstddef>
#include <cstdint>

namespace rfc5444 {

/** Longest address a message can declare (<msg-addr-length> + 1). */
const size_t kMaxAddressLength = 16;

struct AddressBlock {
  uint8_t num_addr{0};
  uint8_t flags{0};
  uint8_t addr_length{0};
  ByteSpan head;
  uint8_t tail_length{0};
  bool zero_tail{false};
  ByteSpan tail;             // empty for a zero tail
  uint8_t mid_length{0};
  ByteSpan mid;              // num_addr * mid_length bytes
  ByteSpan prefix_lengths;   // none, one shared byte, or num_addr bytes
  TlvBlockView tlv_block;    // index ranges refer to this block's addresses

  /**
   * Write address i (head + mid[i] + tail, addr_length bytes) to out.
   * False if i >= num_addr or out cannot hold addr_length bytes.
   */
  bool address(size_t index, uint8_t* out, size_t out_len) const;

  /**
   * Prefix length of address i in bits. Without <prefix-length> fields
   * every address is a full host address (8 * addr_length).
   */
  bool prefix_length(size_t index, uint8_t& out) const;

  bool has_prefix_lengths() const { return !prefix_lengths.empty(); }
};

/** Decode one <address-block> and the <tlv-block> that follows it. */
DecodeError decode_address_block(ByteCursor& cursor, size_t addr_length, AddressBlock& out);

/**
 * The (<address-block><tlv-block>)* tail of a message.
 * Bytes left over that cannot hold a complete address block end the
 * sequence with kTrailingGarbage.
 */
class AddressBlockIterator {
 public:
  AddressBlockIterator() = default;
  AddressBlockIterator(ByteSpan bytes, size_t addr_length)
      : cursor_(bytes), addr_length_(addr_length) {}

  bool next(AddressBlock& out);
  DecodeError error() const { return error_; }

 private:
  ByteCursor cursor_;
  size_t addr_length_{0};
  DecodeError error_{DecodeError::kNone};
};

}  // namespace rfc5444

#endif  // RFC5444_ADDRESS_BLOCK_HPP
