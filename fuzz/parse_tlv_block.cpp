/**
 * libFuzzer harness: a TLV block. The first byte picks the address count
 * (0 for packet and message TLVs).
 */

#include <cstddef>
#include <cstdint>

#include "cursor.hpp"
#include "tlv.hpp"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  using namespace rfc5444;
  if (size < 1) return 0;

  size_t num_addr = data[0] % 8;
  ByteCursor cursor(data + 1, size - 1);
  TlvBlockView block;
  if (decode_tlv_block(cursor, block, num_addr) != DecodeError::kNone) return 0;

  TlvIterator it = block.iterator();
  Tlv tlv;
  while (it.next(tlv)) {
    if (tlv.value.size > 0 &&
        (tlv.value.data < block.bytes.data ||
         tlv.value.data + tlv.value.size > block.bytes.data + block.bytes.size)) {
      __builtin_trap();
    }
    ByteSpan item;
    for (size_t i = 0; i < num_addr; i++) tlv.value_for(i, item);
  }
  return 0;
}
