/**
 * libFuzzer harness: whole packets, walked down to every address and TLV.
 */

#include <cstddef>
#include <cstdint>

#include "packet.hpp"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  using namespace rfc5444;

  DecodeError deep = validate_packet(data, size);

  Packet pkt;
  if (decode_packet(data, size, pkt) != DecodeError::kNone) return 0;

  MessageIterator messages = pkt.message_iterator();
  Message msg;
  DecodeError walked = pkt.tlv_block.validate();
  while (messages.next(msg)) {
    AddressBlockIterator blocks = msg.address_block_iterator();
    AddressBlock block;
    while (blocks.next(block)) {
      uint8_t addr[kMaxAddressLength];
      uint8_t prefix = 0;
      for (size_t i = 0; i < block.num_addr; i++) {
        if (!block.address(i, addr, sizeof(addr))) __builtin_trap();
        if (!block.prefix_length(i, prefix)) __builtin_trap();
      }
      TlvIterator tlvs = block.tlv_block.iterator();
      Tlv tlv;
      while (tlvs.next(tlv)) {
        ByteSpan item;
        for (size_t i = 0; i < block.num_addr; i++) tlv.value_for(i, item);
      }
    }
    if (walked == DecodeError::kNone) walked = validate_message(msg);
  }
  if (walked == DecodeError::kNone) walked = messages.error();

  // the lazy walk finds the same first error as the eager one
  if (walked != deep) __builtin_trap();
  return 0;
}
