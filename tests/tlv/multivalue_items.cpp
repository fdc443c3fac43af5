#include <cstddef>
#include <cstdint>

#include "cursor.hpp"
#include "support/check.hpp"
#include "support/fixtures.hpp"
#include "tlv.hpp"

// Multi-value address TLVs: the value splits into one equal item per index
// in the TLV's range; value_for() hands back the item for one address.

int main() {
  using namespace rfc5444;

  {
    // type 10, indices 1..2, items 000a and 0014
    const uint8_t buf[] = {0x0a, 0x34, 0x01, 0x02, 0x04, 0x00, 0x0a, 0x00, 0x14};
    ByteCursor c(buf, sizeof(buf));
    Tlv tlv;
    CHECK(decode_tlv(c, 3, tlv) == DecodeError::kNone);
    CHECK(tlv.multivalue);
    CHECK(tlv.value.size == 4);

    ByteSpan item;
    CHECK(!tlv.value_for(0, item));
    CHECK(tlv.value_for(1, item));
    CHECK(fixtures::span_equals(item, {0x00, 0x0a}));
    CHECK(tlv.value_for(2, item));
    CHECK(fixtures::span_equals(item, {0x00, 0x14}));
    CHECK(item.data == buf + 7);
  }

  {
    // no index fields: one item per address of the block
    const uint8_t buf[] = {0x0a, 0x14, 0x03, 0x01, 0x02, 0x03};
    ByteCursor c(buf, sizeof(buf));
    Tlv tlv;
    CHECK(decode_tlv(c, 3, tlv) == DecodeError::kNone);
    CHECK(!tlv.has_index);
    for (size_t i = 0; i < 3; i++) {
      ByteSpan item;
      CHECK(tlv.value_for(i, item));
      CHECK(item.size == 1);
      CHECK(static_cast<size_t>(item.data[0]) == i + 1);
    }
  }

  {
    // 3 bytes cannot be shared out between 2 addresses
    const uint8_t buf[] = {0x0a, 0x34, 0x01, 0x02, 0x03, 0x00, 0x0a, 0x00};
    ByteCursor c(buf, sizeof(buf));
    Tlv tlv;
    CHECK(decode_tlv(c, 3, tlv) == DecodeError::kMalformedTlv);
  }

  {
    // an empty multi-value gives every address an empty item
    const uint8_t buf[] = {0x0a, 0x14, 0x00};
    ByteCursor c(buf, sizeof(buf));
    Tlv tlv;
    CHECK(decode_tlv(c, 2, tlv) == DecodeError::kNone);
    ByteSpan item;
    CHECK(tlv.value_for(1, item));
    CHECK(item.empty());
  }

  {
    // a single-value TLV hands every covered address the whole value
    const uint8_t buf[] = {0x03, 0x30, 0x00, 0x01, 0x02, 0xab, 0xcd};
    ByteCursor c(buf, sizeof(buf));
    Tlv tlv;
    CHECK(decode_tlv(c, 2, tlv) == DecodeError::kNone);
    CHECK(!tlv.multivalue);
    ByteSpan item;
    CHECK(tlv.value_for(0, item));
    CHECK(fixtures::span_equals(item, {0xab, 0xcd}));
    CHECK(tlv.value_for(1, item));
    CHECK(fixtures::span_equals(item, {0xab, 0xcd}));
  }

  return 0;
}
