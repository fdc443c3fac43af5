/**
 * RFC 5444 Decoder: message implementation.
 */

#include "message.hpp"

namespace rfc5444 {

namespace {

const uint8_t kMsgHasOrig = 0x80;
const uint8_t kMsgHasHopLimit = 0x40;
const uint8_t kMsgHasHopCount = 0x20;
const uint8_t kMsgHasSeqNum = 0x10;

const size_t kMsgFixedHeaderLen = 4;  // type + flags/addr-length + size
const size_t kTlvBlockLengthLen = 2;

/** Smallest <msg-size> the flags allow: the header fields plus an empty TLV block. */
size_t min_message_size(const MessageHeader& hdr) {
  size_t len = kMsgFixedHeaderLen + kTlvBlockLengthLen;
  if (hdr.has_orig_addr) len += hdr.addr_length;
  if (hdr.has_hop_limit) len += 1;
  if (hdr.has_hop_count) len += 1;
  if (hdr.has_seq_num) len += 2;
  return len;
}

}  // namespace

DecodeError decode_message(ByteCursor& cursor, Message& out) {
  const ByteSpan start = cursor.rest();
  Message msg;
  MessageHeader& hdr = msg.header;

  // <msg-type><msg-flags|msg-addr-length><msg-size>
  uint8_t flags_len = 0;
  if (!cursor.read_u8(hdr.type) || !cursor.read_u8(flags_len) || !cursor.read_u16_be(hdr.size)) {
    return DecodeError::kUnexpectedEndOfInput;
  }

  hdr.flags = flags_len & 0xf0;
  hdr.addr_length = static_cast<uint8_t>((flags_len & 0x0f) + 1);
  hdr.has_orig_addr = (hdr.flags & kMsgHasOrig) != 0;
  hdr.has_hop_limit = (hdr.flags & kMsgHasHopLimit) != 0;
  hdr.has_hop_count = (hdr.flags & kMsgHasHopCount) != 0;
  hdr.has_seq_num = (hdr.flags & kMsgHasSeqNum) != 0;

  if (hdr.size < min_message_size(hdr)) return DecodeError::kTruncatedMessage;

  ByteCursor body;
  if (!cursor.sub_cursor(hdr.size - kMsgFixedHeaderLen, body)) {
    return DecodeError::kTruncatedMessage;
  }
  msg.bytes = ByteSpan{start.data, hdr.size};

  // min_message_size() has already been checked, so none of these can run short
  if (hdr.has_orig_addr && !body.read_bytes(hdr.addr_length, hdr.orig_addr)) {
    return DecodeError::kTruncatedMessage;
  }
  if (hdr.has_hop_limit && !body.read_u8(hdr.hop_limit)) return DecodeError::kTruncatedMessage;
  if (hdr.has_hop_count && !body.read_u8(hdr.hop_count)) return DecodeError::kTruncatedMessage;
  if (hdr.has_seq_num && !body.read_u16_be(hdr.seq_num)) return DecodeError::kTruncatedMessage;

  DecodeError err = decode_tlv_block(body, msg.tlv_block);
  if (err == DecodeError::kUnexpectedEndOfInput) return DecodeError::kTruncatedMessage;
  if (err != DecodeError::kNone) return err;

  msg.address_blocks = body.rest();
  out = msg;
  return DecodeError::kNone;
}

bool MessageIterator::next(Message& out) {
  if (error_ != DecodeError::kNone || cursor_.at_end()) return false;
  DecodeError err = decode_message(cursor_, out);
  if (err != DecodeError::kNone) {
    error_ = err;
    return false;
  }
  return true;
}

}  // namespace rfc5444
