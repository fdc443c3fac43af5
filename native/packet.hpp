/**
 * RFC 5444 Decoder: packet decoding.
 * Entry point of the decoder: header, optional packet TLV block, then a lazy
 * sequence of messages filling the rest of the buffer.
 */

#ifndef RFC5444_PACKET_HPP
#define RFC5444_PACKET_HPP

#include "cursor.hpp"
#include "error.hpp"
#include "message.hpp"
#include "tlv.hpp"
#include <cstddef>
#include <cstdint>

namespace rfc5444 {

/** The only <version> this decoder accepts. */
const uint8_t kSupportedVersion = 0;

struct PacketHeader {
  uint8_t version{0};
  uint8_t flags{0};          // low nibble of the first byte
  bool has_seq_num{false};
  uint16_t seq_num{0};
  bool has_tlv_block{false};
};

/** Decoded packet. Every span borrows the buffer passed to decode_packet. */
struct Packet {
  PacketHeader header;
  TlvBlockView tlv_block;    // empty unless header.has_tlv_block
  ByteSpan messages;         // all encoded messages

  MessageIterator message_iterator() const { return MessageIterator(messages); }
};

/**
 * Decode the packet header and packet TLV block of buf.
 * Messages are not touched; walk them with packet.message_iterator().
 * packet is only valid when kNone is returned, and only while buf is.
 */
DecodeError decode_packet(const uint8_t* data, size_t len, Packet& packet);

/**
 * Decode everything in buf eagerly (every message, TLV and address block)
 * and return the first error, or kNone for a fully valid packet.
 */
DecodeError validate_packet(const uint8_t* data, size_t len);

/** Deep check of one message: message TLVs, address blocks and their TLVs. */
DecodeError validate_message(const Message& msg);

}  // namespace rfc5444

#endif  // RFC5444_PACKET_HPP
