/**
 * RFC 5444 Decoder: byte cursor implementation.
 */

#include "cursor.hpp"

namespace rfc5444 {

ByteCursor::ByteCursor(const uint8_t* data, size_t len)
    : data_(data), len_(data == nullptr ? 0 : len) {}

bool ByteCursor::read_u8(uint8_t& out) {
  if (remaining() < 1) return false;
  out = data_[pos_];
  pos_ += 1;
  return true;
}

bool ByteCursor::read_u16_be(uint16_t& out) {
  if (remaining() < 2) return false;
  out = static_cast<uint16_t>((static_cast<uint16_t>(data_[pos_]) << 8) | data_[pos_ + 1]);
  pos_ += 2;
  return true;
}

bool ByteCursor::peek_u8(uint8_t& out) const {
  if (remaining() < 1) return false;
  out = data_[pos_];
  return true;
}

bool ByteCursor::read_bytes(size_t n, ByteSpan& out) {
  if (remaining() < n) return false;
  out.data = data_ + pos_;
  out.size = n;
  pos_ += n;
  return true;
}

bool ByteCursor::skip(size_t n) {
  if (remaining() < n) return false;
  pos_ += n;
  return true;
}

bool ByteCursor::sub_cursor(size_t n, ByteCursor& out) {
  ByteSpan span;
  if (!read_bytes(n, span)) return false;
  out = ByteCursor(span.data, span.size);
  return true;
}

}  // namespace rfc5444
