/**
 * RFC 5444 Decoder: frame decoding implementation.
 * Handles Ethernet II (with one 802.1Q tag), Linux cooked capture and raw
 * IP, carrying IPv4 or IPv6 and UDP. No IP reassembly: fragments are skipped.
 */

#include "frame.hpp"
#include <arpa/inet.h>
#include <cstdio>
#include <cstring>
#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/ip6.h>
#include <netinet/udp.h>

namespace rfc5444 {

namespace {

const size_t ETH_HEADER_LEN = 14;
const size_t SLL_HEADER_LEN = 16;
const size_t VLAN_TAG_LEN = 4;
const size_t UDP_HEADER_LEN = 8;

const uint16_t ETH_P_IP4 = 0x0800;
const uint16_t ETH_P_IP6 = 0x86dd;
const uint16_t ETH_P_VLAN = 0x8100;

uint16_t read_be16(const uint8_t* p) {
  return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

/** Locate the IP header after the link-layer header. */
bool link_payload(const uint8_t* data, size_t len, int link_type,
                  const uint8_t** ip_base, size_t* ip_len) {
  size_t offset = 0;
  uint16_t proto = 0;
  switch (link_type) {
    case kLinkEthernet:
      if (len < ETH_HEADER_LEN) return false;
      // Ethernet II: 6 dst MAC, 6 src MAC, 2 type
      proto = read_be16(data + 12);
      offset = ETH_HEADER_LEN;
      if (proto == ETH_P_VLAN) {
        if (len < ETH_HEADER_LEN + VLAN_TAG_LEN) return false;
        proto = read_be16(data + 16);
        offset += VLAN_TAG_LEN;
      }
      break;
    case kLinkLinuxSll:
      if (len < SLL_HEADER_LEN) return false;
      proto = read_be16(data + 14);
      offset = SLL_HEADER_LEN;
      break;
    case kLinkRaw:
      if (len < 1) return false;
      proto = (data[0] >> 4) == 6 ? ETH_P_IP6 : ETH_P_IP4;
      break;
    default:
      return false;
  }
  if (proto != ETH_P_IP4 && proto != ETH_P_IP6) return false;
  *ip_base = data + offset;
  *ip_len = len - offset;
  return true;
}

/** Find the UDP header inside an IPv4 or IPv6 packet; fills both addresses. */
bool ip_payload(const uint8_t* ip_base, size_t ip_len, FourTuple& tuple,
                const uint8_t** udp_base, size_t* udp_total) {
  if (ip_len < 1) return false;
  unsigned version = ip_base[0] >> 4;

  if (version == 4) {
    struct ip ip;
    if (ip_len < sizeof(ip)) return false;
    memcpy(&ip, ip_base, sizeof(ip));
    if (ip.ip_p != IPPROTO_UDP) return false;
    if ((ntohs(ip.ip_off) & (IP_MF | IP_OFFMASK)) != 0) return false;
    size_t header_len = static_cast<size_t>(ip.ip_hl) * 4;
    size_t total_len = ntohs(ip.ip_len);
    if (header_len < sizeof(ip) || total_len < header_len || total_len > ip_len) return false;
    tuple.src_ip = format_address(ip_base + 12, 4);
    tuple.dst_ip = format_address(ip_base + 16, 4);
    *udp_base = ip_base + header_len;
    *udp_total = total_len - header_len;
    return true;
  }

  if (version == 6) {
    struct ip6_hdr ip6;
    if (ip_len < sizeof(ip6)) return false;
    memcpy(&ip6, ip_base, sizeof(ip6));
    if (ip6.ip6_nxt != IPPROTO_UDP) return false;  // extension headers not followed
    size_t payload_len = ntohs(ip6.ip6_plen);
    if (payload_len > ip_len - sizeof(ip6)) return false;
    tuple.src_ip = format_address(ip_base + 8, 16);
    tuple.dst_ip = format_address(ip_base + 24, 16);
    *udp_base = ip_base + sizeof(ip6);
    *udp_total = payload_len;
    return true;
  }

  return false;
}

bool port_matches(const std::vector<uint16_t>& ports, uint16_t src, uint16_t dst) {
  for (uint16_t p : ports) {
    if (p == src || p == dst) return true;
  }
  return false;
}

}  // namespace

bool decode_frame(const uint8_t* data, size_t len, int link_type,
                  const std::vector<uint16_t>& ports, ManetDatagram& datagram) {
  if (data == nullptr) return false;

  const uint8_t* ip_base = nullptr;
  size_t ip_len = 0;
  if (!link_payload(data, len, link_type, &ip_base, &ip_len)) return false;

  FourTuple tuple;
  const uint8_t* udp_base = nullptr;
  size_t udp_total = 0;
  if (!ip_payload(ip_base, ip_len, tuple, &udp_base, &udp_total)) return false;
  if (udp_total < UDP_HEADER_LEN) return false;

  struct udphdr udp;
  memcpy(&udp, udp_base, sizeof(udp));
  size_t udp_len = ntohs(udp.uh_ulen);
  if (udp_len < UDP_HEADER_LEN || udp_len > udp_total) return false;

  tuple.src_port = ntohs(udp.uh_sport);
  tuple.dst_port = ntohs(udp.uh_dport);
  if (!port_matches(ports, tuple.src_port, tuple.dst_port)) return false;

  datagram.tuple = tuple;
  datagram.payload = udp_base + UDP_HEADER_LEN;
  datagram.payload_len = udp_len - UDP_HEADER_LEN;
  return true;
}

std::string format_address(const uint8_t* addr, size_t len) {
  if (addr == nullptr) return "";
  if (len == 4 || len == 16) {
    char buf[INET6_ADDRSTRLEN];
    int family = len == 4 ? AF_INET : AF_INET6;
    return inet_ntop(family, addr, buf, sizeof(buf)) ? std::string(buf) : "";
  }
  std::string out;
  char hex[4];
  for (size_t i = 0; i < len; i++) {
    snprintf(hex, sizeof(hex), i == 0 ? "%02x" : ":%02x", addr[i]);
    out += hex;
  }
  return out;
}

std::string format_endpoint(const std::string& ip, uint16_t port) {
  if (ip.find(':') != std::string::npos) return "[" + ip + "]:" + std::to_string(port);
  return ip + ":" + std::to_string(port);
}

}  // namespace rfc5444
