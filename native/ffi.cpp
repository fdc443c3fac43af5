/**
 * RFC 5444 Decoder: C interface implementation.
 * Error kinds collapse onto two classes: running out of bytes, and anything
 * else being invalid.
 */

#include "rfc5444.h"
#include "packet.hpp"
#include <cerrno>

namespace {

int to_ffi_status(rfc5444::DecodeError err) {
  switch (err) {
    case rfc5444::DecodeError::kNone:
      return 0;
    case rfc5444::DecodeError::kUnexpectedEndOfInput:
    case rfc5444::DecodeError::kTruncatedMessage:
    case rfc5444::DecodeError::kTruncatedTlvBlock:
      return RFC5444_EEOF;
    default:
      return -EINVAL;
  }
}

rfc5444_buf_t to_buf(rfc5444::ByteSpan span) {
  rfc5444_buf_t b;
  b.buf = span.data;
  b.buf_len = span.size;
  return b;
}

}  // namespace

extern "C" {

int rfc5444_read_packet(const uint8_t* buf, size_t buf_len, rfc5444_packet_t* pkt) {
  if (pkt == nullptr || (buf == nullptr && buf_len != 0)) return -EINVAL;

  rfc5444::Packet p;
  rfc5444::DecodeError err = rfc5444::decode_packet(buf, buf_len, p);
  if (err != rfc5444::DecodeError::kNone) return to_ffi_status(err);

  pkt->hdr.version = p.header.version;
  pkt->hdr.has_seq_num = p.header.has_seq_num;
  pkt->hdr.seq_num = p.header.seq_num;
  pkt->hdr.has_tlv_block = p.header.has_tlv_block;
  pkt->messages.buf = to_buf(p.messages);
  pkt->tlv_block = to_buf(p.tlv_block.bytes);
  return 0;
}

int rfc5444_read_message(const rfc5444_buf_t* msgs, rfc5444_msg_header_t* hdr,
                         rfc5444_buf_t* rest) {
  if (msgs == nullptr || hdr == nullptr || rest == nullptr) return -EINVAL;
  if (msgs->buf == nullptr && msgs->buf_len != 0) return -EINVAL;

  rfc5444::ByteCursor cursor(msgs->buf, msgs->buf_len);
  rfc5444::Message m;
  rfc5444::DecodeError err = rfc5444::decode_message(cursor, m);
  if (err != rfc5444::DecodeError::kNone) return to_ffi_status(err);

  const rfc5444::MessageHeader& h = m.header;
  hdr->type = h.type;
  hdr->addr_length = h.addr_length;
  hdr->size = h.size;
  hdr->has_orig_addr = h.has_orig_addr;
  hdr->orig_addr = to_buf(h.orig_addr);
  hdr->has_hop_limit = h.has_hop_limit;
  hdr->hop_limit = h.hop_limit;
  hdr->has_hop_count = h.has_hop_count;
  hdr->hop_count = h.hop_count;
  hdr->has_seq_num = h.has_seq_num;
  hdr->seq_num = h.seq_num;
  hdr->tlv_block = to_buf(m.tlv_block.bytes);
  hdr->addr_blocks = to_buf(m.address_blocks);
  *rest = to_buf(cursor.rest());
  return 0;
}

int rfc5444_validate_packet(const uint8_t* buf, size_t buf_len) {
  if (buf == nullptr && buf_len != 0) return -EINVAL;
  return to_ffi_status(rfc5444::validate_packet(buf, buf_len));
}

const char* rfc5444_strerror(int status) {
  if (status == 0) return "success";
  if (status == RFC5444_EEOF) return "unexpected end of input";
  if (status == -EINVAL) return "invalid packet";
  return "unknown status";
}

}  // extern "C"
