/**
 * RFC 5444 Decoder: packet decoding implementation.
 */

#include "packet.hpp"

namespace rfc5444 {

namespace {

const uint8_t kPktHasSeqNum = 0x08;
const uint8_t kPktHasTlv = 0x04;
const uint8_t kPktReserved = 0x03;

}  // namespace

DecodeError decode_packet(const uint8_t* data, size_t len, Packet& packet) {
  ByteCursor cursor(data, len);
  Packet pkt;
  PacketHeader& hdr = pkt.header;

  // <version><pkt-flags>
  uint8_t first = 0;
  if (!cursor.read_u8(first)) return DecodeError::kUnexpectedEndOfInput;
  hdr.version = static_cast<uint8_t>(first >> 4);
  hdr.flags = first & 0x0f;
  if (hdr.version != kSupportedVersion) return DecodeError::kUnsupportedVersion;
  if ((hdr.flags & kPktReserved) != 0) return DecodeError::kReservedBitsSet;
  hdr.has_seq_num = (hdr.flags & kPktHasSeqNum) != 0;
  hdr.has_tlv_block = (hdr.flags & kPktHasTlv) != 0;

  // <pkt-seq-num>?
  if (hdr.has_seq_num && !cursor.read_u16_be(hdr.seq_num)) {
    return DecodeError::kUnexpectedEndOfInput;
  }

  // <tlv-block>?
  if (hdr.has_tlv_block) {
    DecodeError err = decode_tlv_block(cursor, pkt.tlv_block);
    if (err != DecodeError::kNone) return err;
  }

  pkt.messages = cursor.rest();
  packet = pkt;
  return DecodeError::kNone;
}

DecodeError validate_message(const Message& msg) {
  DecodeError err = msg.tlv_block.validate();
  if (err != DecodeError::kNone) return err;

  AddressBlockIterator blocks = msg.address_block_iterator();
  AddressBlock block;
  while (blocks.next(block)) {
    err = block.tlv_block.validate();
    if (err != DecodeError::kNone) return err;
  }
  return blocks.error();
}

DecodeError validate_packet(const uint8_t* data, size_t len) {
  Packet pkt;
  DecodeError err = decode_packet(data, len, pkt);
  if (err != DecodeError::kNone) return err;

  err = pkt.tlv_block.validate();
  if (err != DecodeError::kNone) return err;

  MessageIterator messages = pkt.message_iterator();
  Message msg;
  while (messages.next(msg)) {
    err = validate_message(msg);
    if (err != DecodeError::kNone) return err;
  }
  return messages.error();
}

}  // namespace rfc5444
