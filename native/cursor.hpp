/**
 * RFC 5444 Decoder: bounds-checked byte cursor.
 * Every multi-byte read is big-endian; nothing here allocates or copies.
 */

#ifndef RFC5444_CURSOR_HPP
#define RFC5444_CURSOR_HPP

#include <cstddef>
#include <cstdint>

namespace rfc5444 {

/** Borrowed region of the caller's input buffer. */
struct ByteSpan {
  const uint8_t* data{nullptr};
  size_t size{0};

  bool empty() const { return size == 0; }
};

/**
 * Read position over a borrowed byte region.
 * Reads return false, and leave the position untouched, when fewer than the
 * requested bytes remain.
 */
class ByteCursor {
 public:
  ByteCursor() = default;
  ByteCursor(const uint8_t* data, size_t len);
  explicit ByteCursor(ByteSpan span) : ByteCursor(span.data, span.size) {}

  bool read_u8(uint8_t& out);
  bool read_u16_be(uint16_t& out);
  bool peek_u8(uint8_t& out) const;

  /** Borrow the next n bytes and advance past them. */
  bool read_bytes(size_t n, ByteSpan& out);

  bool skip(size_t n);

  /** Carve the next n bytes into a cursor of their own and advance past them. */
  bool sub_cursor(size_t n, ByteCursor& out);

  size_t remaining() const { return len_ - pos_; }
  size_t position() const { return pos_; }
  bool at_end() const { return pos_ == len_; }

  /** Bytes not consumed yet. */
  ByteSpan rest() const { return ByteSpan{data_ + pos_, len_ - pos_}; }

 private:
  const uint8_t* data_{nullptr};
  size_t len_{0};
  size_t pos_{0};
};

}  // namespace rfc5444

#endif  // RFC5444_CURSOR_HPP
