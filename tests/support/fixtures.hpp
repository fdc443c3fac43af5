/**
 * Test fixtures: hand-encoded RFC 5444 packets shared by the tests.
 * Byte-by-byte layouts are spelled out next to each fixture.
 */

#ifndef RFC5444_TESTS_FIXTURES_HPP
#define RFC5444_TESTS_FIXTURES_HPP

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include "cursor.hpp"

namespace fixtures {

// NHDP HELLO as produced by olsrd2: one message, one address block of four
// IPv4 addresses sharing the head 10., three address TLVs with index fields.
//
//   00                     version 0, no flags
//   01 03 00 28            type 1, no flags, addr-length 4, size 40
//   00 00                  empty message TLV block
//   04 80 01 0a            4 addresses, ahashead, head-length 1, head 0a
//   01 00 65 01 00 66      mids: 1.0.101 1.0.102
//   01 00 67 0b 0b 0b            1.0.103 11.11.11
//   00 10                  address TLV block, 16 bytes:
//   02 50 01 01 00           type 2, single index 1, value 00
//   03 50 00 01 01           type 3, single index 0, value 01
//   03 30 02 03 01 01        type 3, index 2..3, value 01
static const uint8_t kNhdpPacket[] = {
    0x00, 0x01, 0x03, 0x00, 0x28, 0x00, 0x00, 0x04, 0x80, 0x01, 0x0a, 0x01,
    0x00, 0x65, 0x01, 0x00, 0x66, 0x01, 0x00, 0x67, 0x0b, 0x0b, 0x0b, 0x00,
    0x10, 0x02, 0x50, 0x01, 0x01, 0x00, 0x03, 0x50, 0x00, 0x01, 0x01, 0x03,
    0x30, 0x02, 0x03, 0x01, 0x01,
};

// Every optional field in use.
//
//   0c 12 34               version 0, phasseqnum|phastlv, seq 0x1234
//   00 05 07 90 01 01 aa   packet TLV: type 7, type-ext 1, value aa
//   05 f3 00 3a            message type 5, all four flags, addr-length 4, size 58
//   c0 a8 01 01            originator 192.168.1.1
//   10 02 be ef            hop limit 16, hop count 2, seq 0xbeef
//   00 06 01 18 00 02 de ad  message TLV: type 1, 16-bit length 2, value dead
//   03 c8 02 c0 a8 01 01   3 addresses, head c0 a8, full tail 01
//   01 02 03               mids -> 192.168.1.1 192.168.2.1 192.168.3.1
//   20 18 10               multi prefix lengths 32 24 16
//   00 0d                  address TLV block, 13 bytes:
//   09 10 01 07              type 9, no index (all addresses), value 07
//   0a 34 01 02 04 00 0a 00 14  type 10, index 1..2, multivalue 000a | 0014
//   02 30 02               2 addresses, zero tail of 2 bytes, single prefix length
//   0a 00 0a 01            mids -> 10.0.0.0 10.1.0.0
//   10 00 00               prefix length 16, empty TLV block
static const uint8_t kFullPacket[] = {
    0x0c, 0x12, 0x34,
    0x00, 0x05, 0x07, 0x90, 0x01, 0x01, 0xaa,
    0x05, 0xf3, 0x00, 0x3a,
    0xc0, 0xa8, 0x01, 0x01,
    0x10, 0x02, 0xbe, 0xef,
    0x00, 0x06, 0x01, 0x18, 0x00, 0x02, 0xde, 0xad,
    0x03, 0xc8, 0x02, 0xc0, 0xa8, 0x01, 0x01,
    0x01, 0x02, 0x03,
    0x20, 0x18, 0x10,
    0x00, 0x0d,
    0x09, 0x10, 0x01, 0x07,
    0x0a, 0x34, 0x01, 0x02, 0x04, 0x00, 0x0a, 0x00, 0x14,
    0x02, 0x30, 0x02,
    0x0a, 0x00, 0x0a, 0x01,
    0x10, 0x00, 0x00,
};

inline std::vector<uint8_t> to_vector(const uint8_t* data, size_t len) {
  return std::vector<uint8_t>(data, data + len);
}

template <size_t N>
std::vector<uint8_t> to_vector(const uint8_t (&arr)[N]) {
  return to_vector(arr, N);
}

inline bool span_equals(rfc5444::ByteSpan span, const std::vector<uint8_t>& expect) {
  return span.size == expect.size() &&
         (expect.empty() || memcmp(span.data, expect.data(), expect.size()) == 0);
}

/** Span lies inside [base, base + len). */
inline bool span_within(rfc5444::ByteSpan span, const uint8_t* base, size_t len) {
  if (span.size == 0) return true;
  return span.data >= base && span.data + span.size <= base + len;
}

}  // namespace fixtures

#endif  // RFC5444_TESTS_FIXTURES_HPP
