// ============================================================
// device_sim.cpp
// ============================================================

#include "device_sim.hpp"
#include "../common/protocol_io.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include <algorithm>
#include <cstring>

DeviceSimulator::DeviceSimulator(std::string root_dir, u32 burst_packets)
    : root_dir_(std::move(root_dir))
    , burst_packets_(burst_packets > 0 ? burst_packets : 1)
{}

std::vector<FtpPacket> DeviceSimulator::handle_request(const FtpPacket& req) {
    switch (req.opcode) {
        case Opcode::OP_RESET_SESSIONS:
            close_file();
            return {ack(req)};
        case Opcode::OP_TERMINATE_SESSION:
            return on_terminate(req);
        case Opcode::OP_OPEN_FILE_RO:
            return on_open(req);
        case Opcode::OP_BURST_READ_FILE:
            return on_burst_read(req);
        case Opcode::OP_READ_FILE:
            return on_read(req);
        default:
            LOG_DEBUG(std::string("device: unsupported ") + opcode_name(req.opcode));
            return {nack(req, FtpError::ERR_UNKNOWN_COMMAND)};
    }
}

std::vector<FtpPacket> DeviceSimulator::on_open(const FtpPacket& req) {
    if (session_) {
        return {nack(req, FtpError::ERR_NO_SESSIONS_AVAILABLE)};
    }

    std::string remote(req.payload.begin(), req.payload.end());
    // Path arguments may arrive NUL terminated
    std::string::size_type nul = remote.find('\0');
    if (nul != std::string::npos) remote.erase(nul);

    std::unique_ptr<file_io::MmapReader> reader;
    try {
        fs::path local = file_io::proto_to_fspath(root_dir_, remote);
        std::error_code ec;
        if (!fs::is_regular_file(local, ec)) {
            LOG_INFO("device: not found " + remote);
            return {nack(req, FtpError::ERR_FILE_NOT_FOUND)};
        }
        reader = std::make_unique<file_io::MmapReader>(local.string());
    } catch (const std::exception& e) {
        LOG_WARN("device: cannot open " + remote + ": " + e.what());
        return {nack(req, FtpError::ERR_FILE_NOT_FOUND)};
    }
    if (reader->size() > 0xFFFFFFFFULL) {
        return {nack(req, FtpError::ERR_FAIL)};
    }

    hash::Hash128 digest = hash::xxh3_128(reader->data(), (size_t)reader->size());
    LOG_INFO("device: serving " + remote + " (" + std::to_string(reader->size()) +
             " bytes) xxh3 " + hash::to_hex(digest) + " session " + std::to_string(req.session));

    file_    = std::move(reader);
    session_ = req.session;
    path_    = remote;

    FtpPacket reply = ack(req);
    reply.payload.resize(4);
    proto::write_u32(reply.payload.data(), (u32)file_->size());
    reply.size = 4;
    return {reply};
}

std::vector<FtpPacket> DeviceSimulator::on_burst_read(const FtpPacket& req) {
    if (!session_ || req.session != *session_) {
        return {nack(req, FtpError::ERR_INVALID_SESSION)};
    }
    const u32 size = read_size(req);
    if (file_->chunk_len(req.offset, size) == 0) {
        return {nack(req, FtpError::ERR_END_OF_FILE)};
    }

    std::vector<FtpPacket> out;
    u64 ofs = req.offset;
    for (u32 i = 0; i < burst_packets_; ++i) {
        u32 n = (u32)file_->chunk_len(ofs, size);
        if (n == 0) break;
        FtpPacket p = data_reply(req, (u32)ofs, n, (u16)(i + 1));
        ofs += n;
        bool last = (i + 1 == burst_packets_) || ofs >= file_->size();
        p.burst_complete = last;
        out.push_back(std::move(p));
        if (last) break;
    }
    return out;
}

std::vector<FtpPacket> DeviceSimulator::on_read(const FtpPacket& req) {
    if (!session_ || req.session != *session_) {
        return {nack(req, FtpError::ERR_INVALID_SESSION)};
    }
    u32 n = (u32)file_->chunk_len(req.offset, read_size(req));
    if (n == 0) {
        return {nack(req, FtpError::ERR_END_OF_FILE)};
    }
    return {data_reply(req, req.offset, n, 1)};
}

std::vector<FtpPacket> DeviceSimulator::on_terminate(const FtpPacket& req) {
    if (!session_ || req.session != *session_) {
        return {nack(req, FtpError::ERR_INVALID_SESSION)};
    }
    LOG_DEBUG("device: closed session " + std::to_string(*session_));
    close_file();
    return {ack(req)};
}

// ---- Reply construction ----

FtpPacket DeviceSimulator::ack(const FtpPacket& req, u16 seq_step) const {
    FtpPacket p;
    p.seq        = (u16)(req.seq + seq_step);
    p.session    = req.session;
    p.opcode     = Opcode::OP_ACK;
    p.req_opcode = req.opcode;
    p.offset     = req.offset;
    return p;
}

FtpPacket DeviceSimulator::nack(const FtpPacket& req, FtpError err) const {
    FtpPacket p = ack(req);
    p.opcode = Opcode::OP_NACK;
    p.payload.push_back(static_cast<u8>(err));
    p.size = 1;
    return p;
}

FtpPacket DeviceSimulator::data_reply(const FtpPacket& req, u32 offset, u32 len, u16 seq_step) const {
    FtpPacket p = ack(req, seq_step);
    p.offset = offset;
    p.payload.assign(file_->data() + offset, file_->data() + offset + len);
    p.size = (u8)len;
    return p;
}

u32 DeviceSimulator::read_size(const FtpPacket& req) {
    if (req.size == 0 || req.size > MAVFTP_MAX_PAYLOAD) return MAVFTP_MAX_PAYLOAD;
    return req.size;
}

void DeviceSimulator::close_file() {
    file_.reset();
    session_.reset();
    path_.clear();
}
