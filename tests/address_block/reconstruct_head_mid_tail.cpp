#include <cstddef>
#include <cstdint>
#include <cstring>

#include "address_block.hpp"
#include "cursor.hpp"
#include "support/check.hpp"
#include "support/fixtures.hpp"

// Addresses are rebuilt as head + mid[i] + tail into a caller buffer:
// - shared head only (NHDP HELLO)
// - head and full tail (IPv4 and IPv6)
// - neither, and a head covering the whole address (zero-length mids)

namespace {

bool address_is(const rfc5444::AddressBlock& block, size_t index,
                const std::vector<uint8_t>& expect) {
  uint8_t out[rfc5444::kMaxAddressLength];
  memset(out, 0xee, sizeof(out));
  if (!block.address(index, out, sizeof(out))) return false;
  if (expect.size() != block.addr_length) return false;
  if (memcmp(out, expect.data(), expect.size()) != 0) return false;
  // nothing past addr_length is written
  for (size_t i = expect.size(); i < sizeof(out); i++) {
    if (out[i] != 0xee) return false;
  }
  return true;
}

}  // namespace

int main() {
  using namespace rfc5444;

  {
    // NHDP HELLO address block starts after the packet, message and message TLV headers
    const uint8_t* start = fixtures::kNhdpPacket + 7;
    size_t len = sizeof(fixtures::kNhdpPacket) - 7;
    ByteCursor c(start, len);
    AddressBlock block;
    CHECK(decode_address_block(c, 4, block) == DecodeError::kNone);
    CHECK(c.at_end());
    CHECK(block.num_addr == 4);
    CHECK(block.head.size == 1);
    CHECK(block.tail_length == 0);
    CHECK(block.mid_length == 3);
    CHECK(block.mid.size == 12);
    CHECK(address_is(block, 0, {10, 1, 0, 101}));
    CHECK(address_is(block, 1, {10, 1, 0, 102}));
    CHECK(address_is(block, 2, {10, 1, 0, 103}));
    CHECK(address_is(block, 3, {10, 11, 11, 11}));
    CHECK(!address_is(block, 4, {10, 0, 0, 0}));
    CHECK(fixtures::span_within(block.head, start, len));
    CHECK(fixtures::span_within(block.mid, start, len));
    CHECK(fixtures::span_within(block.tlv_block.bytes, start, len));
  }

  {
    // head c0 a8, full tail 01, one byte of mid per address
    const uint8_t* start = fixtures::kFullPacket + 30;
    ByteCursor c(start, 28);
    AddressBlock block;
    CHECK(decode_address_block(c, 4, block) == DecodeError::kNone);
    CHECK(c.at_end());
    CHECK(block.num_addr == 3);
    CHECK(!block.zero_tail);
    CHECK(fixtures::span_equals(block.tail, {0x01}));
    CHECK(address_is(block, 0, {192, 168, 1, 1}));
    CHECK(address_is(block, 1, {192, 168, 2, 1}));
    CHECK(address_is(block, 2, {192, 168, 3, 1}));
  }

  {
    // IPv6: 8 byte head, 6 byte tail, 2 byte mids
    const uint8_t buf[] = {
        0x02, 0xc0,
        0x08, 0x20, 0x01, 0x0d, 0xb8, 0x00, 0x00, 0x00, 0x00,
        0x06, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01,
        0x00, 0x01, 0xff, 0xfe,
        0x00, 0x00,
    };
    ByteCursor c(buf, sizeof(buf));
    AddressBlock block;
    CHECK(decode_address_block(c, 16, block) == DecodeError::kNone);
    CHECK(c.at_end());
    CHECK(block.mid_length == 2);
    CHECK(address_is(block, 0, {0x20, 0x01, 0x0d, 0xb8, 0, 0, 0, 0, 0x00, 0x01, 0, 0, 0, 0, 0, 0x01}));
    CHECK(address_is(block, 1, {0x20, 0x01, 0x0d, 0xb8, 0, 0, 0, 0, 0xff, 0xfe, 0, 0, 0, 0, 0, 0x01}));
  }

  {
    // no head, no tail: every address is carried whole
    const uint8_t buf[] = {0x02, 0x00, 1, 2, 3, 4, 5, 6, 7, 8, 0x00, 0x00};
    ByteCursor c(buf, sizeof(buf));
    AddressBlock block;
    CHECK(decode_address_block(c, 4, block) == DecodeError::kNone);
    CHECK(block.head.empty());
    CHECK(block.mid_length == 4);
    CHECK(address_is(block, 0, {1, 2, 3, 4}));
    CHECK(address_is(block, 1, {5, 6, 7, 8}));
  }

  {
    // the head is the whole address: no mid bytes on the wire
    const uint8_t buf[] = {0x03, 0x80, 0x04, 10, 0, 0, 1, 0x00, 0x00};
    ByteCursor c(buf, sizeof(buf));
    AddressBlock block;
    CHECK(decode_address_block(c, 4, block) == DecodeError::kNone);
    CHECK(c.at_end());
    CHECK(block.mid_length == 0);
    CHECK(block.mid.empty());
    CHECK(address_is(block, 2, {10, 0, 0, 1}));
  }

  {
    // output buffer checks
    const uint8_t buf[] = {0x01, 0x00, 1, 2, 3, 4, 0x00, 0x00};
    ByteCursor c(buf, sizeof(buf));
    AddressBlock block;
    CHECK(decode_address_block(c, 4, block) == DecodeError::kNone);
    uint8_t small[3];
    CHECK(!block.address(0, small, sizeof(small)));
    CHECK(!block.address(0, nullptr, 4));
    uint8_t exact[4];
    CHECK(block.address(0, exact, sizeof(exact)));
    CHECK(exact[3] == 4);
  }

  return 0;
}
