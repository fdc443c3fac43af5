/**
 * RFC 5444 Decoder: error kind names and codes.
 */

#include "error.hpp"

namespace rfc5444 {

const char* to_string(DecodeError err) {
  switch (err) {
    case DecodeError::kNone:
      return "None";
    case DecodeError::kUnexpectedEndOfInput:
      return "UnexpectedEndOfInput";
    case DecodeError::kMalformedTlv:
      return "MalformedTlv";
    case DecodeError::kInvalidAddressGeometry:
      return "InvalidAddressGeometry";
    case DecodeError::kTruncatedMessage:
      return "TruncatedMessage";
    case DecodeError::kTruncatedTlvBlock:
      return "TruncatedTlvBlock";
    case DecodeError::kUnsupportedVersion:
      return "UnsupportedVersion";
    case DecodeError::kReservedBitsSet:
      return "ReservedBitsSet";
    case DecodeError::kTrailingGarbage:
      return "TrailingGarbage";
    case DecodeError::kPrefixTooLarge:
      return "PrefixTooLarge";
  }
  return "Unknown";
}

int error_code(DecodeError err) {
  return -static_cast<int>(err);
}

}  // namespace rfc5444
