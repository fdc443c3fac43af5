/**
 * RFC 5444 Decoder: error kinds.
 * Every decode function returns one of these; kNone means success.
 */

#ifndef RFC5444_ERROR_HPP
#define RFC5444_ERROR_HPP

#include <cstdint>

namespace rfc5444 {

enum class DecodeError : uint8_t {
  kNone = 0,
  kUnexpectedEndOfInput,
  kMalformedTlv,
  kInvalidAddressGeometry,
  kTruncatedMessage,
  kTruncatedTlvBlock,
  kUnsupportedVersion,
  kReservedBitsSet,
  kTrailingGarbage,
  kPrefixTooLarge,
};

/** Stable kind name, e.g. "UnexpectedEndOfInput". */
const char* to_string(DecodeError err);

/** Stable small negative code per kind (0 for kNone). */
int error_code(DecodeError err);

}  // namespace rfc5444

#endif  // RFC5444_ERROR_HPP
