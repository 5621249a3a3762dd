// ============================================================
// transfer_engine.cpp
// ============================================================

#include "transfer_engine.hpp"
#include "../common/protocol_io.hpp"
#include "../common/logger.hpp"
#include <algorithm>
#include <sstream>

const char* transfer_state_name(TransferState s) {
    switch (s) {
        case TransferState::IDLE:        return "idle";
        case TransferState::OPENING:     return "opening";
        case TransferState::STREAMING:   return "streaming";
        case TransferState::GAP_FILLING: return "gap-filling";
    }
    return "unknown";
}

static FtpStatus make_status(const std::string& operation, FtpError err) {
    FtpStatus st;
    st.operation = operation;
    st.error = err;
    return st;
}

TransferEngine::TransferEngine(const FtpSettings& settings, SendFn send, ClockFn clock)
    : settings_(settings)
    , send_(std::move(send))
    , clock_(std::move(clock))
{
    gap_policy_.retry_ms             = settings_.retry_ms;
    gap_policy_.max_backlog          = settings_.max_backlog;
    gap_policy_.min_send_interval_ms = settings_.min_gap_send_interval_ms;

    if (settings_.loss_seed != 0) {
        rng_.seed(settings_.loss_seed);
    } else {
        std::random_device rd;
        rng_.seed(rd());
    }

    burst_size_   = configured_burst_size();
    last_send_ms_ = clock_();
}

u32 TransferEngine::configured_burst_size() const {
    int n = settings_.burst_read_size;
    if (n < 1 || n > (int)MAVFTP_MAX_PAYLOAD) return MAVFTP_MAX_PAYLOAD;
    return (u32)n;
}

bool TransferEngine::tracing(int level) const {
    return settings_.debug >= level || Logger::get().enabled(LogLevel::DEBUG);
}

// Debug levels promote transfer detail to INFO; otherwise it is
// only visible with a DEBUG log level.
void TransferEngine::trace(int level, const std::string& msg) const {
    if (settings_.debug >= level) {
        LOG_INFO(msg);
    } else {
        LOG_DEBUG(msg);
    }
}

bool TransferEngine::drop_packet(int loss_percent) {
    if (loss_percent <= 0) return false;
    std::uniform_real_distribution<double> dist(0.0, 100.0);
    return dist(rng_) < (double)loss_percent;
}

u64 TransferEngine::contiguous_bytes() const {
    if (!sink_) return 0;
    u64 hw = sink_->cursor();
    auto lowest = gaps_.lowest_offset();
    if (lowest && *lowest < hw) hw = *lowest;
    return hw;
}

// ---- Sending ----

void TransferEngine::send(FtpPacket p) {
    session_.stamp(p);
    proto::Frame frame = proto::encode_frame(p);
    send_(frame.data(), frame.size());

    u64 now = clock_();
    if (tracing(2)) {
        trace(2, "FTP: > " + p.to_string() + " dt=" + std::to_string(now - last_op_time_ms_) + "ms");
    }
    last_op_         = p;
    last_op_time_ms_ = now;
    last_send_ms_    = now;
}

void TransferEngine::reset_sessions() {
    send(make_request(Opcode::OP_RESET_SESSIONS));
}

FtpStatus TransferEngine::start_download(const std::string& remote_path,
                                         std::unique_ptr<file_io::ByteSink> sink,
                                         CompletionFn on_complete,
                                         ProgressFn on_progress)
{
    if (remote_path.empty() || remote_path.size() > MAVFTP_MAX_PAYLOAD ||
        !utils::is_ascii(remote_path)) {
        LOG_ERROR("FTP: invalid remote path '" + remote_path + "'");
        return make_status("OpenFileRO", FtpError::ERR_INVALID_ARGUMENTS);
    }
    if (!sink) {
        LOG_ERROR("FTP: no local sink for " + remote_path);
        return make_status("OpenFileRO", FtpError::ERR_INVALID_ARGUMENTS);
    }

    terminate();

    remote_path_  = remote_path;
    sink_         = std::move(sink);
    on_complete_  = std::move(on_complete);
    on_progress_  = std::move(on_progress);
    burst_size_   = configured_burst_size();
    op_start_ms_  = clock_();
    state_        = TransferState::OPENING;

    LOG_INFO("Getting " + remote_path_ + " to " + sink_->describe());
    send(make_path_request(Opcode::OP_OPEN_FILE_RO, remote_path_));
    return make_status("OpenFileRO", FtpError::ERR_NONE);
}

// ---- Receiving ----

FtpStatus TransferEngine::handle_frame(const u8* data, size_t len) {
    return handle_packet(proto::decode(data, len));
}

FtpStatus TransferEngine::handle_packet(const FtpPacket& p) {
    u64 now = clock_();
    u64 dt  = now - last_op_time_ms_;

    if (tracing(2)) {
        trace(2, "FTP: < " + p.to_string() + " dt=" + std::to_string(dt) + "ms");
    }

    if (!session_.belongs_to_session(p)) {
        trace(1, "FTP: wrong session " + std::to_string(p.session) + " != " +
                 std::to_string(session_.current_session()));
        return make_status(opcode_name(p.req_opcode), FtpError::ERR_INVALID_SESSION);
    }

    if (drop_packet(settings_.pkt_loss_rx)) {
        trace(1, "FTP: dropping packet RX");
        return make_status(opcode_name(p.req_opcode), FtpError::ERR_FAIL);
    }

    if (last_op_ && p.req_opcode == last_op_->opcode &&
        p.seq == (u16)((last_op_->seq + 1) % 256)) {
        rtt_ms_ = std::max<u64>(std::min(rtt_ms_, dt), 10);
    }
    last_op_time_ms_ = now;

    switch (p.req_opcode) {
        case Opcode::OP_OPEN_FILE_RO:
            return handle_open_reply(p);
        case Opcode::OP_BURST_READ_FILE:
            return handle_burst_reply(p);
        case Opcode::OP_READ_FILE:
            return handle_read_reply(p);
        case Opcode::OP_RESET_SESSIONS: {
            FtpStatus st = proto::decode_status(p);
            if (!st.ok()) st.log();
            else trace(1, st.describe());
            return st;
        }
        case Opcode::OP_NONE:
        case Opcode::OP_TERMINATE_SESSION:
            return make_status(opcode_name(p.req_opcode), FtpError::ERR_NONE);
        case Opcode::OP_LIST_DIRECTORY:
        case Opcode::OP_CREATE_FILE:
        case Opcode::OP_WRITE_FILE:
        case Opcode::OP_REMOVE_FILE:
        case Opcode::OP_CREATE_DIRECTORY:
        case Opcode::OP_REMOVE_DIRECTORY:
        case Opcode::OP_OPEN_FILE_WO:
        case Opcode::OP_TRUNCATE_FILE:
        case Opcode::OP_RENAME:
        case Opcode::OP_CALC_FILE_CRC32:
            trace(1, std::string("FTP: ignoring reply to ") + opcode_name(p.req_opcode));
            return make_status(opcode_name(p.req_opcode), FtpError::ERR_UNKNOWN_COMMAND);
        case Opcode::OP_ACK:
        case Opcode::OP_NACK:
            break;
    }

    LOG_INFO("FTP: unknown reply " + p.to_string());
    FtpStatus st = make_status("FTP reply", FtpError::ERR_INVALID_OPCODE);
    st.invalid_opcode = static_cast<u8>(p.req_opcode);
    return st;
}

FtpStatus TransferEngine::handle_open_reply(const FtpPacket& p) {
    if (state_ != TransferState::OPENING || !sink_) {
        trace(1, "FTP: unexpected OpenFileRO reply " + p.to_string());
        return make_status("OpenFileRO", FtpError::ERR_FAIL);
    }

    if (!p.is_ack()) {
        FtpStatus st = proto::decode_status(p, "OpenFileRO");
        st.log();
        terminate();
        return st;
    }

    try {
        sink_->open();
    } catch (const std::exception& e) {
        LOG_ERROR("FTP: failed to open " + sink_->describe() + ": " + e.what());
        terminate();
        return make_status("OpenFileRO", FtpError::ERR_FAIL_TO_OPEN_LOCAL_FILE);
    }

    if (p.payload.size() >= 4) {
        remote_file_size_ = proto::read_u32(p.payload.data());
        trace(1, "Remote file size: " + std::to_string(*remote_file_size_));
    } else {
        remote_file_size_.reset();
    }

    state_ = TransferState::STREAMING;
    last_burst_read_ms_ = clock_();
    send(make_request(Opcode::OP_BURST_READ_FILE, 0, (u8)burst_size_));
    return make_status("OpenFileRO", FtpError::ERR_NONE);
}

FtpStatus TransferEngine::handle_burst_reply(const FtpPacket& p) {
    if (drop_packet(settings_.pkt_loss_tx)) {
        trace(1, "FTP: dropping TX");
        return make_status("BurstReadFile", FtpError::ERR_FAIL);
    }
    if (!sink_ || state_ == TransferState::OPENING || state_ == TransferState::IDLE) {
        LOG_WARN("FTP: unexpected burst read reply, discarded");
        return make_status("BurstReadFile", FtpError::ERR_FAIL);
    }

    last_burst_read_ms_ = clock_();
    const u64 gen  = generation_;
    const u32 size = (u32)p.payload.size();

    if (size > burst_size_) {
        // remote ignored the requested burst size
        burst_size_ = MAVFTP_MAX_PAYLOAD;
        trace(1, "Setting burst size to " + std::to_string(burst_size_));
    }

    if (p.is_ack()) {
        const u64 ofs = sink_->cursor();
        if (p.offset < ofs) {
            if (!gaps_.resolve_gap(p.offset, size)) {
                trace(1, "FTP: duplicate read at " + std::to_string(p.offset));
                ++duplicates_;
                return make_status("BurstReadFile", FtpError::ERR_FAIL);
            }
            trace(1, "FTP: removed gap at " + std::to_string(p.offset) + " size " +
                     std::to_string(size));
            if (!write_payload(p, false)) return make_status("BurstReadFile", FtpError::ERR_FAIL);
            if (attempt_finish()) return make_status("BurstReadFile", FtpError::ERR_NONE);
            if (!running(gen)) return make_status("BurstReadFile", FtpError::ERR_FAIL);
        } else {
            if (p.offset > ofs) {
                u32 gap_len = p.offset - (u32)ofs;
                gaps_.register_gap((u32)ofs, gap_len, burst_size_);
                trace(1, "FTP: gap of " + std::to_string(gap_len) + " bytes at " +
                         std::to_string(ofs));
            }
            if (!write_payload(p, true)) return make_status("BurstReadFile", FtpError::ERR_FAIL);
        }

        if (p.burst_complete) {
            if (size > 0 && size < burst_size_) {
                // short final packet of the file
                mark_eof();
                if (attempt_finish()) return make_status("BurstReadFile", FtpError::ERR_NONE);
                if (!running(gen)) return make_status("BurstReadFile", FtpError::ERR_FAIL);
                check_read_send(clock_());
                return make_status("BurstReadFile", FtpError::ERR_NONE);
            }
            u32 next_ofs = p.offset + size;
            trace(1, "FTP: burst continue at " + std::to_string(next_ofs) + " " +
                     std::to_string(next_ofs - (u32)sink_->cursor()));
            send(make_request(Opcode::OP_BURST_READ_FILE, next_ofs, (u8)burst_size_));
        }
        return make_status("BurstReadFile", FtpError::ERR_NONE);
    }

    if (p.is_nack()) {
        u8 ecode = p.payload.empty() ? 0 : p.payload[0];
        if (ecode == static_cast<u8>(FtpError::ERR_END_OF_FILE) ||
            ecode == static_cast<u8>(FtpError::ERR_NONE)) {
            if (!reached_eof_ && p.offset > sink_->cursor()) {
                // the tail of the burst was lost, the stall retry re-reads it
                trace(1, "FTP: burst lost EOF " + std::to_string(p.offset) + " " +
                         std::to_string(sink_->cursor()));
                return make_status("BurstReadFile", FtpError::ERR_FAIL);
            }
            mark_eof();
            if (attempt_finish()) return make_status("BurstReadFile", FtpError::ERR_NONE);
            if (!running(gen)) return make_status("BurstReadFile", FtpError::ERR_FAIL);
            check_read_send(clock_());
            return make_status("BurstReadFile", FtpError::ERR_NONE);
        }

        FtpStatus st = proto::decode_status(p, "BurstReadFile");
        LOG_WARN("FTP: burst nack: " + st.describe());
        terminate();
        return st;
    }

    LOG_WARN("FTP: burst error " + p.to_string());
    return make_status("BurstReadFile", FtpError::ERR_INVALID_OPCODE);
}

FtpStatus TransferEngine::handle_read_reply(const FtpPacket& p) {
    if (!sink_ || state_ == TransferState::OPENING || state_ == TransferState::IDLE) {
        trace(1, "FTP: unexpected read reply, discarded");
        return make_status("ReadFile", FtpError::ERR_FAIL);
    }

    gaps_.on_read_reply();
    const u64 gen  = generation_;
    const u32 size = (u32)p.payload.size();

    if (p.is_ack()) {
        if (gaps_.resolve_gap(p.offset, size)) {
            trace(1, "FTP: removed gap at " + std::to_string(p.offset) + " size " +
                     std::to_string(size) + ", " + std::to_string(gaps_.size()) + " left");
            if (!write_payload(p, false)) return make_status("ReadFile", FtpError::ERR_FAIL);
            if (attempt_finish()) return make_status("ReadFile", FtpError::ERR_NONE);
            if (!running(gen)) return make_status("ReadFile", FtpError::ERR_FAIL);
        } else if (size < burst_size_) {
            LOG_WARN("FTP: file size changed to " + std::to_string((u64)p.offset + size));
            terminate();
            return make_status("ReadFile", FtpError::ERR_FAIL);
        } else {
            ++duplicates_;
            trace(1, "FTP: no gap read at " + std::to_string(p.offset) + " size " +
                     std::to_string(size));
        }
    } else if (p.is_nack()) {
        FtpStatus st = proto::decode_status(p, "ReadFile");
        LOG_WARN("FTP: read failed with " + std::to_string(gaps_.size()) + " gaps: " +
                 st.describe());
        terminate();
        return st;
    }

    check_read_send(clock_());
    return make_status("ReadFile", FtpError::ERR_NONE);
}

// False when the write failed or the progress callback ended the transfer
bool TransferEngine::write_payload(const FtpPacket& p, bool move_cursor) {
    const u64 gen = generation_;
    try {
        sink_->write_at(p.offset, p.payload.data(), p.payload.size(), move_cursor);
    } catch (const std::exception& e) {
        LOG_ERROR("FTP: write to " + sink_->describe() + " failed: " + e.what());
        terminate();
        return false;
    }
    read_total_ += p.payload.size();
    if (on_progress_ && remote_file_size_ && *remote_file_size_ > 0) {
        on_progress_(std::min(1.0, (double)read_total_ / (double)*remote_file_size_));
    }
    return running(gen);
}

void TransferEngine::mark_eof() {
    if (!reached_eof_) {
        gaps_at_eof_ = gaps_.size();
        trace(1, "FTP: EOF at " + std::to_string(sink_->cursor()) + " with " +
                 std::to_string(gaps_at_eof_) + " gaps");
    }
    reached_eof_ = true;
    if (!gaps_.empty()) state_ = TransferState::GAP_FILLING;
}

void TransferEngine::check_read_send(u64 now_ms) {
    gaps_.tick(now_ms, reached_eof_, gap_policy_, [this](u32 offset, u32 length) {
        trace(1, "FTP: gap read of " + std::to_string(length) + " at " + std::to_string(offset) +
                 " backlog=" + std::to_string(gaps_.backlog()));
        send(make_request(Opcode::OP_READ_FILE, offset, (u8)length));
    });
}

// ---- Completion ----

bool TransferEngine::attempt_finish() {
    if (!sink_ || !reached_eof_ || !gaps_.empty()) return false;

    try {
        sink_->finalize();
    } catch (const std::exception& e) {
        LOG_ERROR("FTP: finalize of " + sink_->describe() + " failed: " + e.what());
        terminate();
        return false;
    }

    u64 elapsed = op_start_ms_ ? clock_() - *op_start_ms_ : 0;
    u64 size    = sink_->extent();
    LOG_INFO("Got " + std::to_string(size) + " bytes from " + remote_path_ + " in " +
             utils::format_seconds(elapsed) + " " + utils::format_rate(size, elapsed));

    std::unique_ptr<file_io::ByteSink> done = std::move(sink_);
    CompletionFn cb = std::move(on_complete_);
    on_complete_ = nullptr;

    // terminate() snapshots the counters; mark the snapshot successful
    terminate();
    last_stats_.completed = true;
    last_stats_.file_size = size;

    if (cb) cb(std::move(done));
    return true;
}

void TransferEngine::terminate() {
    const bool active = state_ != TransferState::IDLE;

    if (active) {
        last_stats_ = TransferStats{};
        last_stats_.bytes_written = read_total_;
        last_stats_.file_size     = sink_ ? sink_->extent() : 0;
        last_stats_.duplicates    = duplicates_;
        last_stats_.read_retries  = read_retries_;
        last_stats_.open_retries  = open_retries_;
        last_stats_.gaps_at_eof   = gaps_at_eof_;
        last_stats_.elapsed_ms    = op_start_ms_ ? clock_() - *op_start_ms_ : 0;
        send(make_request(Opcode::OP_TERMINATE_SESSION));
    }

    CompletionFn cb = std::move(on_complete_);
    on_complete_ = nullptr;
    on_progress_ = nullptr;
    sink_.reset();
    gaps_.clear();

    state_        = TransferState::IDLE;
    burst_size_   = configured_burst_size();
    reached_eof_  = false;
    duplicates_   = 0;
    read_total_   = 0;
    read_retries_ = 0;
    open_retries_ = 0;
    gaps_at_eof_  = 0;
    remote_file_size_.reset();
    op_start_ms_.reset();
    last_burst_read_ms_.reset();

    if (active) trace(1, "FTP: terminated session " + std::to_string(session_.current_session()));
    session_.advance_session();
    ++generation_;

    if (active && cb) cb(nullptr);
}

// ---- Periodic ----

bool TransferEngine::periodic_tick(u64 now_ms) {
    if (state_ == TransferState::OPENING && op_start_ms_ &&
        now_ms > *op_start_ms_ && now_ms - *op_start_ms_ > settings_.read_retry_ms) {
        op_start_ms_ = now_ms;
        ++open_retries_;
        if (open_retries_ > 2) {
            LOG_WARN("FTP: no reply to OpenFileRO " + remote_path_ + ", giving up");
            terminate();
        } else {
            trace(1, "FTP: retry open of " + remote_path_);
            send(make_request(Opcode::OP_TERMINATE_SESSION));
            session_.advance_session();
            send(make_path_request(Opcode::OP_OPEN_FILE_RO, remote_path_));
        }
    }

    if (state_ == TransferState::STREAMING || state_ == TransferState::GAP_FILLING) {
        if (!reached_eof_ && last_burst_read_ms_ && now_ms > *last_burst_read_ms_ &&
            now_ms - *last_burst_read_ms_ > settings_.retry_ms) {
            u64 dt = now_ms - *last_burst_read_ms_;
            last_burst_read_ms_ = now_ms;
            trace(1, "FTP: retry read at " + std::to_string(sink_->cursor()) + " rtt " +
                     std::to_string(rtt_ms_) + "ms dt " + std::to_string(dt) + "ms");
            send(make_request(Opcode::OP_BURST_READ_FILE, (u32)sink_->cursor(), (u8)burst_size_));
            ++read_retries_;
        }
        check_read_send(now_ms);
    }

    return now_ms > last_send_ms_ && now_ms - last_send_ms_ > settings_.idle_detection_ms;
}

std::string TransferEngine::status_line(u64 now_ms) const {
    if (state_ == TransferState::IDLE) return "No transfer in progress";
    std::ostringstream ss;
    ss << "Transfer " << remote_path_ << " " << transfer_state_name(state_)
       << " at offset " << cursor()
       << " with " << gaps_.size() << " gaps"
       << " " << read_retries_ << " retries"
       << " " << duplicates_ << " duplicates";
    if (remote_file_size_) {
        ss << " of " << *remote_file_size_ << " bytes";
    }
    if (op_start_ms_ && now_ms > *op_start_ms_) {
        ss << " " << utils::format_rate(read_total_, now_ms - *op_start_ms_);
    }
    return ss.str();
}
