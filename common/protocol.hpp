#pragma once

// protocol.hpp -- Wire definitions for the MAVLink file transfer protocol

#include "platform.hpp"
#include <cstring>
#include <string>
#include <vector>

static constexpr u32 MAVFTP_HDR_LEN     = 12;
static constexpr u32 MAVFTP_MAX_PAYLOAD = 239;
// Every frame handed to the transport is padded to this size.
static constexpr u32 MAVFTP_FRAME_LEN   = MAVFTP_HDR_LEN + MAVFTP_MAX_PAYLOAD;

// ---- Opcodes ----
enum class Opcode : u8 {
    OP_NONE              = 0,
    OP_TERMINATE_SESSION = 1,
    OP_RESET_SESSIONS    = 2,
    OP_LIST_DIRECTORY    = 3,
    OP_OPEN_FILE_RO      = 4,
    OP_READ_FILE         = 5,
    OP_CREATE_FILE       = 6,
    OP_WRITE_FILE        = 7,
    OP_REMOVE_FILE       = 8,
    OP_CREATE_DIRECTORY  = 9,
    OP_REMOVE_DIRECTORY  = 10,
    OP_OPEN_FILE_WO      = 11,
    OP_TRUNCATE_FILE     = 12,
    OP_RENAME            = 13,
    OP_CALC_FILE_CRC32   = 14,
    OP_BURST_READ_FILE   = 15,
    OP_ACK               = 128,
    OP_NACK              = 129,
};

// ---- Error codes ----
// 0..10 travel as the first payload byte of a Nack.
// 64.. are local classifications produced by the client.
enum class FtpError : u8 {
    ERR_NONE                 = 0,
    ERR_FAIL                 = 1,
    ERR_FAIL_ERRNO           = 2,
    ERR_INVALID_DATA_SIZE    = 3,
    ERR_INVALID_SESSION      = 4,
    ERR_NO_SESSIONS_AVAILABLE = 5,
    ERR_END_OF_FILE          = 6,
    ERR_UNKNOWN_COMMAND      = 7,
    ERR_FILE_EXISTS          = 8,
    ERR_FILE_PROTECTED       = 9,
    ERR_FILE_NOT_FOUND       = 10,

    ERR_NO_ERROR_CODE_IN_PAYLOAD       = 64,
    ERR_NO_ERROR_CODE_IN_NACK          = 65,
    ERR_NO_FILESYSTEM_ERROR_IN_PAYLOAD = 66,
    ERR_INVALID_ERROR_CODE             = 67,
    ERR_PAYLOAD_TOO_LARGE              = 68,
    ERR_INVALID_OPCODE                 = 69,
    ERR_INVALID_ARGUMENTS              = 70,
    ERR_PUT_ALREADY_IN_PROGRESS        = 71,
    ERR_FAIL_TO_OPEN_LOCAL_FILE        = 72,
    ERR_REMOTE_REPLY_TIMEOUT           = 73,
};

// ---- Header (12 bytes, little-endian on wire) ----
#pragma pack(push, 1)
struct FtpHeader {
    u16 seq;
    u8  session;
    u8  opcode;
    u8  size;
    u8  req_opcode;
    u8  burst_complete;
    u8  padding;
    u32 offset;
};
#pragma pack(pop)
static_assert(sizeof(FtpHeader) == MAVFTP_HDR_LEN, "FtpHeader must be 12 bytes");

// One decoded request or reply
struct FtpPacket {
    u16             seq{0};
    u8              session{0};
    Opcode          opcode{Opcode::OP_NONE};
    u8              size{0};
    Opcode          req_opcode{Opcode::OP_NONE};
    bool            burst_complete{false};
    u32             offset{0};
    std::vector<u8> payload;

    bool is_ack()  const { return opcode == Opcode::OP_ACK; }
    bool is_nack() const { return opcode == Opcode::OP_NACK; }

    std::string to_string() const;
};

// Outcome of one protocol operation as seen by the client
struct FtpStatus {
    std::string operation;
    FtpError    error{FtpError::ERR_NONE};
    u8          system_error{0};
    u8          invalid_error_code{0};
    u8          invalid_opcode{0};
    u32         payload_size{0};

    bool ok() const { return error == FtpError::ERR_NONE; }

    std::string describe() const;

    // Log at the severity the error class deserves
    void log() const;
};

const char* opcode_name(Opcode op);

// Builds a request with an ASCII argument in the payload (path names)
inline FtpPacket make_request(Opcode op, u32 offset = 0, u8 size = 0) {
    FtpPacket p;
    p.opcode = op;
    p.offset = offset;
    p.size   = size;
    return p;
}

inline FtpPacket make_path_request(Opcode op, const std::string& path) {
    FtpPacket p;
    p.opcode = op;
    p.payload.assign(path.begin(), path.end());
    p.size = (u8)p.payload.size();
    return p;
}
