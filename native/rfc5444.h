/*
 * RFC 5444 Decoder: C interface.
 * Reads a packet header and hands back the encoded messages as a buffer
 * view; messages are pulled one at a time with rfc5444_read_message().
 */

#ifndef RFC5444_H
#define RFC5444_H

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/** Supported RFC 5444 version. */
#define RFC5444_VERSION 0

/** Unexpected end of input. Every other decode failure is -EINVAL. */
#define RFC5444_EEOF (-1)

/** Borrowed slice of the caller's buffer. */
typedef struct {
    const uint8_t *buf;
    size_t buf_len;
} rfc5444_buf_t;

typedef struct {
    uint8_t version;
    bool has_seq_num;
    uint16_t seq_num;
    bool has_tlv_block;
} rfc5444_pkt_header_t;

typedef struct {
    /** Encoded messages following the packet header. */
    rfc5444_buf_t buf;
} rfc5444_messages_t;

typedef struct {
    rfc5444_pkt_header_t hdr;
    rfc5444_messages_t messages;
    /** Packet TLV block contents; empty unless hdr.has_tlv_block. Trails
     *  messages so { hdr, messages } callers keep their offsets. */
    rfc5444_buf_t tlv_block;
} rfc5444_packet_t;

typedef struct {
    uint8_t type;
    /** Address length in bytes (1..16). */
    uint8_t addr_length;
    /** Whole message size, header included. */
    uint16_t size;
    bool has_orig_addr;
    rfc5444_buf_t orig_addr;
    bool has_hop_limit;
    uint8_t hop_limit;
    bool has_hop_count;
    uint8_t hop_count;
    bool has_seq_num;
    uint16_t seq_num;
    /** Message TLV block contents. */
    rfc5444_buf_t tlv_block;
    /** (<address-block><tlv-block>)* bytes of the message. */
    rfc5444_buf_t addr_blocks;
} rfc5444_msg_header_t;

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Read a single RFC 5444 packet.
 *
 * @param[in]  buf     Packet bytes.
 * @param[in]  buf_len Length of buf.
 * @param[out] pkt     Decoded header; its buffers point into buf.
 *
 * @return 0 on success, RFC5444_EEOF on unexpected end of input,
 *         -EINVAL on an invalid packet or invalid arguments.
 */
int rfc5444_read_packet(const uint8_t *buf, size_t buf_len, rfc5444_packet_t *pkt);

/**
 * Read the next message off a messages buffer.
 *
 * @param[in]  msgs Messages buffer, e.g. pkt->messages.buf or a previous rest.
 * @param[out] hdr  Decoded message header.
 * @param[out] rest Bytes after this message.
 *
 * @return 0 on success, RFC5444_EEOF when msgs cannot hold a message header,
 *         -EINVAL on a malformed message or invalid arguments.
 */
int rfc5444_read_message(const rfc5444_buf_t *msgs, rfc5444_msg_header_t *hdr,
                         rfc5444_buf_t *rest);

/** Fully validate a packet: same codes as rfc5444_read_packet(). */
int rfc5444_validate_packet(const uint8_t *buf, size_t buf_len);

/** Short description of a status returned above. */
const char *rfc5444_strerror(int status);

#ifdef __cplusplus
}
#endif

#endif /* RFC5444_H */
