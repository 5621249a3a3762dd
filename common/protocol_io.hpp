#pragma once

// ============================================================
// protocol_io.hpp -- Packet encode/decode with byte-order handling
// ============================================================

#include "protocol.hpp"
#include <array>
#include <vector>
#include <stdexcept>

// Linux: htole16/32 and le16/32toh live in <endian.h>
#ifndef _WIN32
#  include <endian.h>
#endif

namespace proto {

using Frame = std::array<u8, MAVFTP_FRAME_LEN>;

// Raised for frames that cannot hold the packet they announce
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ---- Byte-order helpers (wire is little-endian) ----

inline u16 htole_16(u16 v) {
#if defined(_WIN32)
    return v;
#else
    return htole16(v);
#endif
}

inline u32 htole_32(u32 v) {
#if defined(_WIN32)
    return v;
#else
    return htole32(v);
#endif
}

inline u16 letoh_16(u16 v) {
#if defined(_WIN32)
    return v;
#else
    return le16toh(v);
#endif
}

inline u32 letoh_32(u32 v) {
#if defined(_WIN32)
    return v;
#else
    return le32toh(v);
#endif
}

// ---- Header ----

inline void encode_header(const FtpPacket& p, u8 buf[MAVFTP_HDR_LEN]) {
    FtpHeader h;
    h.seq            = htole_16(p.seq);
    h.session        = p.session;
    h.opcode         = static_cast<u8>(p.opcode);
    h.size           = p.size;
    h.req_opcode     = static_cast<u8>(p.req_opcode);
    h.burst_complete = p.burst_complete ? 1 : 0;
    h.padding        = 0;
    h.offset         = htole_32(p.offset);
    std::memcpy(buf, &h, MAVFTP_HDR_LEN);
}

inline FtpHeader decode_header(const u8 buf[MAVFTP_HDR_LEN]) {
    FtpHeader h;
    std::memcpy(&h, buf, MAVFTP_HDR_LEN);
    h.seq    = letoh_16(h.seq);
    h.offset = letoh_32(h.offset);
    return h;
}

// ---- Packet ----

// Header followed by the payload, no padding
inline std::vector<u8> encode(const FtpPacket& p) {
    if (p.payload.size() > MAVFTP_MAX_PAYLOAD) {
        throw std::length_error("payload exceeds " + std::to_string(MAVFTP_MAX_PAYLOAD) + " bytes");
    }
    std::vector<u8> out(MAVFTP_HDR_LEN + p.payload.size());
    encode_header(p, out.data());
    if (!p.payload.empty()) {
        std::memcpy(out.data() + MAVFTP_HDR_LEN, p.payload.data(), p.payload.size());
    }
    return out;
}

// Transport frame: encode() right-padded with zeros to MAVFTP_FRAME_LEN
inline Frame encode_frame(const FtpPacket& p) {
    std::vector<u8> raw = encode(p);
    Frame f{};
    std::memcpy(f.data(), raw.data(), raw.size());
    return f;
}

// Parse a received frame. Bytes beyond the announced size are padding.
inline FtpPacket decode(const u8* data, size_t len) {
    if (len < MAVFTP_HDR_LEN) {
        throw DecodeError("frame too short: " + std::to_string(len) + " bytes");
    }
    FtpHeader h = decode_header(data);
    if (h.size > MAVFTP_MAX_PAYLOAD) {
        throw DecodeError("payload size " + std::to_string(h.size) + " exceeds maximum");
    }
    if (len < MAVFTP_HDR_LEN + h.size) {
        throw DecodeError("frame of " + std::to_string(len) +
                          " bytes cannot hold payload of " + std::to_string(h.size));
    }
    FtpPacket p;
    p.seq            = h.seq;
    p.session        = h.session;
    p.opcode         = static_cast<Opcode>(h.opcode);
    p.size           = h.size;
    p.req_opcode     = static_cast<Opcode>(h.req_opcode);
    p.burst_complete = h.burst_complete != 0;
    p.offset         = h.offset;
    p.payload.assign(data + MAVFTP_HDR_LEN, data + MAVFTP_HDR_LEN + h.size);
    return p;
}

inline FtpPacket decode(const std::vector<u8>& buf) {
    return decode(buf.data(), buf.size());
}

// Little-endian u32 carried in a payload (open reply file size)
inline u32 read_u32(const u8* p) {
    return (u32)p[0] | ((u32)p[1] << 8) | ((u32)p[2] << 16) | ((u32)p[3] << 24);
}

inline void write_u32(u8* p, u32 v) {
    p[0] = (u8)v;
    p[1] = (u8)(v >> 8);
    p[2] = (u8)(v >> 16);
    p[3] = (u8)(v >> 24);
}

// Classify an Ack/Nack reply. An empty operation name is filled
// from the reply's req_opcode.
FtpStatus decode_status(const FtpPacket& reply, const std::string& operation = "");

} // namespace proto
