/**
 * RFC 5444 Decoder: messages.
 *
 * <message> := <msg-header> <tlv-block> (<addr-block><tlv-block>)*
 * <msg-size> bounds everything after the header, so a message that fails to
 * decode deeper down never disturbs the message that follows it.
 */

#ifndef RFC5444_MESSAGE_HPP
#define RFC5444_MESSAGE_HPP

#include "address_block.hpp"
#include "cursor.hpp"
#include "error.hpp"
#include "tlv.hpp"
#include <cstddef>
#include <cstdint>

namespace rfc5444 {

struct MessageHeader {
  uint8_t type{0};
  uint8_t flags{0};          // high nibble of the flags/addr-length byte
  uint8_t addr_length{0};    // bytes, 1..16
  uint16_t size{0};          // whole message, header included
  bool has_orig_addr{false};
  ByteSpan orig_addr;
  bool has_hop_limit{false};
  uint8_t hop_limit{0};
  bool has_hop_count{false};
  uint8_t hop_count{0};
  bool has_seq_num{false};
  uint16_t seq_num{0};
};

struct Message {
  MessageHeader header;
  TlvBlockView tlv_block;
  ByteSpan address_blocks;   // (<address-block><tlv-block>)* region
  ByteSpan bytes;            // the whole encoded message

  AddressBlockIterator address_block_iterator() const {
    return AddressBlockIterator(address_blocks, header.addr_length);
  }
};

/**
 * Decode one message header and its message TLV block, consuming exactly
 * <msg-size> bytes from cursor. Address blocks are left for
 * address_block_iterator().
 */
DecodeError decode_message(ByteCursor& cursor, Message& out);

/**
 * Messages filling the rest of a packet, fail-fast: the first error ends the
 * sequence and is kept in error(). Messages already yielded stay valid.
 */
class MessageIterator {
 public:
  MessageIterator() = default;
  explicit MessageIterator(ByteSpan bytes) : cursor_(bytes) {}

  bool next(Message& out);
  DecodeError error() const { return error_; }

 private:
  ByteCursor cursor_;
  DecodeError error_{DecodeError::kNone};
};

}  // namespace rfc5444

#endif  // RFC5444_MESSAGE_HPP
