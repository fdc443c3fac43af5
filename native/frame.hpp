/**
 * RFC 5444 Decoder: link-layer frame decoding.
 * Pull the UDP payload of MANET traffic (port 269 by default) out of a
 * captured Ethernet, Linux cooked or raw IP frame.
 */

#ifndef RFC5444_FRAME_HPP
#define RFC5444_FRAME_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace rfc5444 {

/** IANA "manet" UDP port (RFC 5498). */
const uint16_t kManetPort = 269;

/** pcap DLT_ values understood by decode_frame. */
enum LinkType : int {
  kLinkEthernet = 1,    // DLT_EN10MB
  kLinkRaw = 12,        // DLT_RAW
  kLinkLinuxSll = 113,  // DLT_LINUX_SLL
};

/** Decoded 4-tuple: source and destination IP + port. */
struct FourTuple {
  std::string src_ip;
  uint16_t src_port{0};
  std::string dst_ip;
  uint16_t dst_port{0};
};

/** UDP datagram to or from a MANET port; payload borrows the frame. */
struct ManetDatagram {
  FourTuple tuple;
  const uint8_t* payload{nullptr};
  size_t payload_len{0};
};

/**
 * Decode a frame of the given link type.
 * Returns true if it is a complete, unfragmented UDP datagram whose source or
 * destination port is in ports; datagram is only valid when true.
 */
bool decode_frame(const uint8_t* data, size_t len, int link_type,
                  const std::vector<uint16_t>& ports, ManetDatagram& datagram);

/** Dotted quad for 4 bytes, RFC 5952 text for 16, colon-separated hex otherwise. */
std::string format_address(const uint8_t* addr, size_t len);

/** Format IP:port for logging. */
std::string format_endpoint(const std::string& ip, uint16_t port);

}  // namespace rfc5444

#endif  // RFC5444_FRAME_HPP
