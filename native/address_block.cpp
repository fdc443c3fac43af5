/**
 * RFC 5444 Decoder: address block implementation.
 */

#include "address_block.hpp"
#include <cstring>

namespace rfc5444 {

namespace {

const uint8_t kAddrHasHead = 0x80;
const uint8_t kAddrHasFullTail = 0x40;
const uint8_t kAddrHasZeroTail = 0x20;
const uint8_t kAddrHasSinglePrelen = 0x10;
const uint8_t kAddrHasMultiPrelen = 0x08;
const uint8_t kAddrReserved = 0x07;

}  // namespace

bool AddressBlock::address(size_t index, uint8_t* out, size_t out_len) const {
  if (index >= num_addr || out == nullptr || out_len < addr_length) return false;
  size_t head_len = head.size;
  if (head_len > 0) memcpy(out, head.data, head_len);
  if (mid_length > 0) memcpy(out + head_len, mid.data + index * mid_length, mid_length);
  if (tail_length > 0) {
    uint8_t* tail_out = out + head_len + mid_length;
    if (zero_tail) {
      memset(tail_out, 0, tail_length);
    } else {
      memcpy(tail_out, tail.data, tail_length);
    }
  }
  return true;
}

bool AddressBlock::prefix_length(size_t index, uint8_t& out) const {
  if (index >= num_addr) return false;
  if (prefix_lengths.size == 0) {
    out = static_cast<uint8_t>(8 * addr_length);
  } else if (prefix_lengths.size == 1) {
    out = prefix_lengths.data[0];
  } else {
    out = prefix_lengths.data[index];
  }
  return true;
}

DecodeError decode_address_block(ByteCursor& cursor, size_t addr_length, AddressBlock& out) {
  if (addr_length == 0 || addr_length > kMaxAddressLength) {
    return DecodeError::kInvalidAddressGeometry;
  }

  AddressBlock block;
  block.addr_length = static_cast<uint8_t>(addr_length);

  // <num-addr><addr-flags>
  if (!cursor.read_u8(block.num_addr) || !cursor.read_u8(block.flags)) {
    return DecodeError::kUnexpectedEndOfInput;
  }
  const uint8_t flags = block.flags;
  if ((flags & kAddrReserved) != 0) return DecodeError::kReservedBitsSet;
  if (block.num_addr == 0) return DecodeError::kInvalidAddressGeometry;

  bool full_tail = (flags & kAddrHasFullTail) != 0;
  bool zero_tail = (flags & kAddrHasZeroTail) != 0;
  bool single_prelen = (flags & kAddrHasSinglePrelen) != 0;
  bool multi_prelen = (flags & kAddrHasMultiPrelen) != 0;
  if ((full_tail && zero_tail) || (single_prelen && multi_prelen)) {
    return DecodeError::kInvalidAddressGeometry;
  }

  // (<head-length><head>?)?
  uint8_t head_length = 0;
  if ((flags & kAddrHasHead) != 0) {
    if (!cursor.read_u8(head_length)) return DecodeError::kUnexpectedEndOfInput;
    if (head_length > addr_length) return DecodeError::kInvalidAddressGeometry;
    if (!cursor.read_bytes(head_length, block.head)) return DecodeError::kUnexpectedEndOfInput;
  }

  // (<tail-length><tail>?)?
  if (full_tail || zero_tail) {
    if (!cursor.read_u8(block.tail_length)) return DecodeError::kUnexpectedEndOfInput;
    if (static_cast<size_t>(head_length) + block.tail_length > addr_length) {
      return DecodeError::kInvalidAddressGeometry;
    }
    if (full_tail) {
      if (!cursor.read_bytes(block.tail_length, block.tail)) {
        return DecodeError::kUnexpectedEndOfInput;
      }
    } else {
      block.zero_tail = true;
    }
  }

  // <mid>*, one run of num_addr * mid-length bytes
  block.mid_length = static_cast<uint8_t>(addr_length - head_length - block.tail_length);
  size_t mid_bytes = static_cast<size_t>(block.num_addr) * block.mid_length;
  if (!cursor.read_bytes(mid_bytes, block.mid)) return DecodeError::kUnexpectedEndOfInput;

  // <prefix-length>*
  size_t prefix_fields = 0;
  if (single_prelen) prefix_fields = 1;
  if (multi_prelen) prefix_fields = block.num_addr;
  if (prefix_fields > 0) {
    if (!cursor.read_bytes(prefix_fields, block.prefix_lengths)) {
      return DecodeError::kUnexpectedEndOfInput;
    }
    for (size_t i = 0; i < prefix_fields; i++) {
      if (block.prefix_lengths.data[i] > 8 * addr_length) return DecodeError::kPrefixTooLarge;
    }
  }

  DecodeError err = decode_tlv_block(cursor, block.tlv_block, block.num_addr);
  if (err != DecodeError::kNone) return err;

  out = block;
  return DecodeError::kNone;
}

bool AddressBlockIterator::next(AddressBlock& out) {
  if (error_ != DecodeError::kNone || cursor_.at_end()) return false;
  DecodeError err = decode_address_block(cursor_, addr_length_, out);
  if (err == DecodeError::kUnexpectedEndOfInput || err == DecodeError::kTruncatedTlvBlock) {
    err = DecodeError::kTrailingGarbage;
  }
  if (err != DecodeError::kNone) {
    error_ = err;
    return false;
  }
  return true;
}

}  // namespace rfc5444
