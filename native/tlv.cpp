/**
 * RFC 5444 Decoder: TLV block implementation.
 */

#include "tlv.hpp"

namespace rfc5444 {

namespace {

const uint8_t kTlvHasTypeExt = 0x80;
const uint8_t kTlvHasSingleIndex = 0x40;
const uint8_t kTlvHasMultiIndex = 0x20;
const uint8_t kTlvHasValue = 0x10;
const uint8_t kTlvHasExtLen = 0x08;
const uint8_t kTlvIsMultivalue = 0x04;
const uint8_t kTlvReserved = 0x03;

}  // namespace

bool Tlv::applies_to(size_t index) const {
  return in_address_block && index >= index_start && index <= index_stop;
}

bool Tlv::value_for(size_t index, ByteSpan& out) const {
  if (!applies_to(index)) return false;
  if (!multivalue) {
    out = value;
    return true;
  }
  // decode_tlv guarantees the value splits evenly
  size_t count = static_cast<size_t>(index_stop - index_start) + 1;
  size_t item = value.size / count;
  out.data = value.data + (index - index_start) * item;
  out.size = item;
  return true;
}

DecodeError decode_tlv(ByteCursor& cursor, size_t num_addr, Tlv& out) {
  Tlv tlv;
  if (!cursor.read_u8(tlv.type) || !cursor.read_u8(tlv.flags)) {
    return DecodeError::kMalformedTlv;
  }
  const uint8_t flags = tlv.flags;
  if ((flags & kTlvReserved) != 0) return DecodeError::kReservedBitsSet;

  if ((flags & kTlvHasTypeExt) != 0) {
    tlv.has_type_ext = true;
    if (!cursor.read_u8(tlv.type_ext)) return DecodeError::kMalformedTlv;
  }

  // (<index-start><index-stop>?)?
  bool single_index = (flags & kTlvHasSingleIndex) != 0;
  bool multi_index = (flags & kTlvHasMultiIndex) != 0;
  if (single_index && multi_index) return DecodeError::kMalformedTlv;
  if ((single_index || multi_index) && num_addr == 0) return DecodeError::kMalformedTlv;
  if (single_index) {
    if (!cursor.read_u8(tlv.index_start)) return DecodeError::kMalformedTlv;
    tlv.index_stop = tlv.index_start;
    tlv.has_index = true;
  } else if (multi_index) {
    if (!cursor.read_u8(tlv.index_start) || !cursor.read_u8(tlv.index_stop)) {
      return DecodeError::kMalformedTlv;
    }
    tlv.has_index = true;
  }

  if (num_addr != 0) {
    tlv.in_address_block = true;
    if (!tlv.has_index) {
      // no index fields: the TLV covers the whole block
      tlv.index_start = 0;
      tlv.index_stop = static_cast<uint8_t>(num_addr - 1);
    } else if (tlv.index_start > tlv.index_stop || tlv.index_stop >= num_addr) {
      return DecodeError::kMalformedTlv;
    }
  }

  // (<length><value>?)?
  if ((flags & kTlvHasValue) != 0) {
    tlv.has_value = true;
    size_t length = 0;
    if ((flags & kTlvHasExtLen) != 0) {
      uint16_t len16 = 0;
      if (!cursor.read_u16_be(len16)) return DecodeError::kMalformedTlv;
      length = len16;
    } else {
      uint8_t len8 = 0;
      if (!cursor.read_u8(len8)) return DecodeError::kMalformedTlv;
      length = len8;
    }
    if (!cursor.read_bytes(length, tlv.value)) return DecodeError::kMalformedTlv;
  } else if ((flags & kTlvHasExtLen) != 0) {
    return DecodeError::kMalformedTlv;
  }

  if ((flags & kTlvIsMultivalue) != 0) {
    if (!tlv.in_address_block || !tlv.has_value) return DecodeError::kMalformedTlv;
    size_t count = static_cast<size_t>(tlv.index_stop - tlv.index_start) + 1;
    if (tlv.value.size % count != 0) return DecodeError::kMalformedTlv;
    tlv.multivalue = true;
  }

  out = tlv;
  return DecodeError::kNone;
}

bool TlvIterator::next(Tlv& out) {
  if (error_ != DecodeError::kNone || cursor_.at_end()) return false;
  DecodeError err = decode_tlv(cursor_, num_addr_, out);
  if (err != DecodeError::kNone) {
    error_ = err;
    return false;
  }
  return true;
}

DecodeError TlvBlockView::validate() const {
  TlvIterator it = iterator();
  Tlv tlv;
  while (it.next(tlv)) {
  }
  return it.error();
}

DecodeError decode_tlv_block(ByteCursor& cursor, TlvBlockView& out, size_t num_addr) {
  uint16_t length = 0;
  if (!cursor.read_u16_be(length)) return DecodeError::kUnexpectedEndOfInput;
  ByteSpan bytes;
  if (!cursor.read_bytes(length, bytes)) return DecodeError::kTruncatedTlvBlock;
  out.bytes = bytes;
  out.num_addr = num_addr;
  return DecodeError::kNone;
}

}  // namespace rfc5444
