// ============================================================
// protocol.cpp -- Opcode names, reply classification, status text
// ============================================================

#include "protocol.hpp"
#include "protocol_io.hpp"
#include "logger.hpp"
#include <sstream>

const char* opcode_name(Opcode op) {
    switch (op) {
        case Opcode::OP_NONE:              return "None";
        case Opcode::OP_TERMINATE_SESSION: return "TerminateSession";
        case Opcode::OP_RESET_SESSIONS:    return "ResetSessions";
        case Opcode::OP_LIST_DIRECTORY:    return "ListDirectory";
        case Opcode::OP_OPEN_FILE_RO:      return "OpenFileRO";
        case Opcode::OP_READ_FILE:         return "ReadFile";
        case Opcode::OP_CREATE_FILE:       return "CreateFile";
        case Opcode::OP_WRITE_FILE:        return "WriteFile";
        case Opcode::OP_REMOVE_FILE:       return "RemoveFile";
        case Opcode::OP_CREATE_DIRECTORY:  return "CreateDirectory";
        case Opcode::OP_REMOVE_DIRECTORY:  return "RemoveDirectory";
        case Opcode::OP_OPEN_FILE_WO:      return "OpenFileWO";
        case Opcode::OP_TRUNCATE_FILE:     return "TruncateFile";
        case Opcode::OP_RENAME:            return "Rename";
        case Opcode::OP_CALC_FILE_CRC32:   return "CalcFileCRC32";
        case Opcode::OP_BURST_READ_FILE:   return "BurstReadFile";
        case Opcode::OP_ACK:               return "Ack";
        case Opcode::OP_NACK:              return "Nack";
    }
    return "Unknown";
}

std::string FtpPacket::to_string() const {
    std::ostringstream ss;
    ss << "OP seq:" << seq
       << " sess:" << (unsigned)session
       << " opcode:" << (unsigned)static_cast<u8>(opcode)
       << " req_opcode:" << (unsigned)static_cast<u8>(req_opcode)
       << " size:" << (unsigned)size
       << " bc:" << (burst_complete ? 1 : 0)
       << " ofs:" << offset
       << " plen=" << payload.size();
    if (!payload.empty()) {
        ss << " [" << (unsigned)payload[0] << "]";
    }
    return ss.str();
}

std::string FtpStatus::describe() const {
    const std::string& op = operation;
    switch (error) {
        case FtpError::ERR_NONE:                  return op + " succeeded";
        case FtpError::ERR_FAIL:                  return op + " failed, generic error";
        case FtpError::ERR_FAIL_ERRNO:
            return op + " failed, system error " + std::to_string(system_error);
        case FtpError::ERR_INVALID_DATA_SIZE:     return op + " failed, invalid data size";
        case FtpError::ERR_INVALID_SESSION:       return op + " failed, session is not currently open";
        case FtpError::ERR_NO_SESSIONS_AVAILABLE: return op + " failed, no sessions available";
        case FtpError::ERR_END_OF_FILE:           return op + " failed, offset past end of file";
        case FtpError::ERR_UNKNOWN_COMMAND:       return op + " failed, unknown command";
        case FtpError::ERR_FILE_EXISTS:           return op + " failed, file/directory already exists";
        case FtpError::ERR_FILE_PROTECTED:        return op + " failed, file/directory is protected";
        case FtpError::ERR_FILE_NOT_FOUND:        return op + " failed, file/directory not found";

        case FtpError::ERR_NO_ERROR_CODE_IN_PAYLOAD:
            return op + " failed, payload contains no error code";
        case FtpError::ERR_NO_ERROR_CODE_IN_NACK:
            return op + " failed, no error code";
        case FtpError::ERR_NO_FILESYSTEM_ERROR_IN_PAYLOAD:
            return op + " failed, file-system error missing in payload";
        case FtpError::ERR_INVALID_ERROR_CODE:
            return op + " failed, invalid error code " + std::to_string(invalid_error_code);
        case FtpError::ERR_PAYLOAD_TOO_LARGE:
            return op + " failed, payload is too long " + std::to_string(payload_size);
        case FtpError::ERR_INVALID_OPCODE:
            return op + " failed, invalid opcode " + std::to_string(invalid_opcode);
        case FtpError::ERR_INVALID_ARGUMENTS:       return op + " failed, invalid arguments";
        case FtpError::ERR_PUT_ALREADY_IN_PROGRESS: return op + " failed, put already in progress";
        case FtpError::ERR_FAIL_TO_OPEN_LOCAL_FILE: return op + " failed, failed to open local file";
        case FtpError::ERR_REMOTE_REPLY_TIMEOUT:    return op + " failed, remote reply timeout";
    }
    return op + " failed, unknown error " + std::to_string(static_cast<unsigned>(error));
}

void FtpStatus::log() const {
    switch (error) {
        case FtpError::ERR_NONE:
            LOG_INFO(describe());
            break;
        case FtpError::ERR_FILE_EXISTS:
        case FtpError::ERR_FILE_PROTECTED:
        case FtpError::ERR_FILE_NOT_FOUND:
            LOG_WARN(describe());
            break;
        default:
            LOG_ERROR(describe());
            break;
    }
}

FtpStatus proto::decode_status(const FtpPacket& reply, const std::string& operation) {
    FtpStatus st;
    st.operation    = operation.empty() ? opcode_name(reply.req_opcode) : operation;
    st.payload_size = (u32)reply.payload.size();
    st.invalid_opcode = static_cast<u8>(reply.opcode);

    if (reply.is_ack()) {
        st.error = FtpError::ERR_NONE;
        return st;
    }
    if (!reply.is_nack()) {
        st.error = FtpError::ERR_INVALID_OPCODE;
        return st;
    }

    const auto& pl = reply.payload;
    if (pl.empty()) {
        st.error = FtpError::ERR_NO_ERROR_CODE_IN_PAYLOAD;
    } else if (pl.size() == 1) {
        u8 code = pl[0];
        if (code == static_cast<u8>(FtpError::ERR_NONE)) {
            st.error = FtpError::ERR_NO_ERROR_CODE_IN_NACK;
        } else if (code == static_cast<u8>(FtpError::ERR_FAIL_ERRNO)) {
            st.error = FtpError::ERR_NO_FILESYSTEM_ERROR_IN_PAYLOAD;
        } else if (code <= static_cast<u8>(FtpError::ERR_FILE_NOT_FOUND)) {
            st.error = static_cast<FtpError>(code);
        } else {
            st.invalid_error_code = code;
            st.error = FtpError::ERR_INVALID_ERROR_CODE;
        }
    } else if (pl[0] == static_cast<u8>(FtpError::ERR_FAIL_ERRNO) && pl.size() == 2) {
        st.system_error = pl[1];
        st.error = FtpError::ERR_FAIL_ERRNO;
    } else {
        st.error = FtpError::ERR_PAYLOAD_TOO_LARGE;
    }
    return st;
}
