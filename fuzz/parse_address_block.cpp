/**
 * libFuzzer harness: address blocks. The first byte picks the address
 * length (1..16).
 */

#include <cstddef>
#include <cstdint>

#include "address_block.hpp"
#include "cursor.hpp"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  using namespace rfc5444;
  if (size < 1) return 0;

  size_t addr_length = (data[0] % kMaxAddressLength) + 1;
  AddressBlockIterator blocks(ByteSpan{data + 1, size - 1}, addr_length);
  AddressBlock block;
  while (blocks.next(block)) {
    uint8_t addr[kMaxAddressLength];
    uint8_t prefix = 0;
    for (size_t i = 0; i < block.num_addr; i++) {
      if (!block.address(i, addr, sizeof(addr))) __builtin_trap();
      if (!block.prefix_length(i, prefix) || prefix > 8 * addr_length) __builtin_trap();
    }
    if (block.tlv_block.validate() != DecodeError::kNone) break;
  }
  return 0;
}
