#include <cstddef>
#include <cstdint>

#include "address_block.hpp"
#include "cursor.hpp"
#include "support/check.hpp"
#include "support/fixtures.hpp"

// <prefix-length> fields: none (host addresses), one shared, or one per
// address; none may exceed the address length in bits.

int main() {
  using namespace rfc5444;

  {
    // one per address: 32, 24, 16
    ByteCursor c(fixtures::kFullPacket + 30, 28);
    AddressBlock block;
    CHECK(decode_address_block(c, 4, block) == DecodeError::kNone);
    CHECK(block.has_prefix_lengths());
    CHECK(block.prefix_lengths.size == 3);
    uint8_t p = 0;
    CHECK(block.prefix_length(0, p) && p == 32);
    CHECK(block.prefix_length(1, p) && p == 24);
    CHECK(block.prefix_length(2, p) && p == 16);
    CHECK(!block.prefix_length(3, p));
  }

  {
    // one shared by every address
    ByteCursor c(fixtures::kFullPacket + 58, 10);
    AddressBlock block;
    CHECK(decode_address_block(c, 4, block) == DecodeError::kNone);
    CHECK(block.prefix_lengths.size == 1);
    uint8_t p = 0;
    CHECK(block.prefix_length(0, p) && p == 16);
    CHECK(block.prefix_length(1, p) && p == 16);
  }

  {
    // none: full-length host addresses
    const uint8_t v4[] = {0x01, 0x00, 1, 2, 3, 4, 0x00, 0x00};
    ByteCursor c(v4, sizeof(v4));
    AddressBlock block;
    CHECK(decode_address_block(c, 4, block) == DecodeError::kNone);
    CHECK(!block.has_prefix_lengths());
    uint8_t p = 0;
    CHECK(block.prefix_length(0, p) && p == 32);

    const uint8_t v6[] = {0x01, 0x20, 0x10, 0x00, 0x00};
    ByteCursor c6(v6, sizeof(v6));
    CHECK(decode_address_block(c6, 16, block) == DecodeError::kNone);
    CHECK(block.prefix_length(0, p) && p == 128);
  }

  {
    // 33 bits on a 4 byte address, shared and per address
    const uint8_t single[] = {0x01, 0x10, 1, 2, 3, 4, 33, 0x00, 0x00};
    const uint8_t multi[] = {0x02, 0x08, 1, 2, 3, 4, 5, 6, 7, 8, 32, 33, 0x00, 0x00};
    AddressBlock block;
    ByteCursor c1(single, sizeof(single));
    CHECK(decode_address_block(c1, 4, block) == DecodeError::kPrefixTooLarge);
    ByteCursor c2(multi, sizeof(multi));
    CHECK(decode_address_block(c2, 4, block) == DecodeError::kPrefixTooLarge);
  }

  {
    // 128 is fine for IPv6, 129 is not
    const uint8_t ok[] = {0x01, 0x30, 0x10, 128, 0x00, 0x00};
    const uint8_t too_large[] = {0x01, 0x30, 0x10, 129, 0x00, 0x00};
    AddressBlock block;
    ByteCursor c1(ok, sizeof(ok));
    CHECK(decode_address_block(c1, 16, block) == DecodeError::kNone);
    uint8_t p = 0;
    CHECK(block.prefix_length(0, p) && p == 128);
    ByteCursor c2(too_large, sizeof(too_large));
    CHECK(decode_address_block(c2, 16, block) == DecodeError::kPrefixTooLarge);
  }

  {
    // prefix lengths cut short
    const uint8_t buf[] = {0x02, 0x08, 1, 2, 3, 4, 5, 6, 7, 8, 24};
    ByteCursor c(buf, sizeof(buf));
    AddressBlock block;
    CHECK(decode_address_block(c, 4, block) == DecodeError::kUnexpectedEndOfInput);
  }

  return 0;
}
