#pragma once

// ============================================================
// transfer_engine.hpp -- MAVFTP download state machine
//
// Single-threaded and poll driven: the owner feeds every received
// frame to handle_frame() and calls periodic_tick() at a steady
// cadence from its message pump. The engine never blocks and never
// starts timers of its own.
//
//   IDLE --start_download--> OPENING --open ack--> STREAMING
//   STREAMING --EOF seen, gaps left--> GAP_FILLING
//   any state --terminate / finish--> IDLE
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/file_io.hpp"
#include "../common/utils.hpp"
#include "session_tracker.hpp"
#include "gap_tracker.hpp"
#include <string>
#include <memory>
#include <optional>
#include <functional>
#include <random>

struct FtpSettings {
    int debug{0};              // 0 quiet, 1 transfer events, 2 every packet
    int pkt_loss_tx{0};        // test only: % of burst replies to drop
    int pkt_loss_rx{0};        // test only: % of received packets to drop
    u32 max_backlog{5};
    int burst_read_size{80};   // clamped to 1..239, out of range -> 239
    u64 retry_ms{500};
    u64 read_retry_ms{1000};
    u64 idle_detection_ms{3700};
    u64 min_gap_send_interval_ms{50};
    u32 loss_seed{0};          // 0 = seed from std::random_device
};

enum class TransferState {
    IDLE,
    OPENING,
    STREAMING,
    GAP_FILLING,
};

const char* transfer_state_name(TransferState s);

// Counters of the most recent transfer, kept after terminate()
struct TransferStats {
    bool   completed{false};
    u64    bytes_written{0};
    u64    file_size{0};
    u32    duplicates{0};
    u32    read_retries{0};
    u32    open_retries{0};
    size_t gaps_at_eof{0};
    u64    elapsed_ms{0};
};

class TransferEngine {
public:
    using SendFn       = std::function<void(const u8* frame, size_t len)>;
    using ClockFn      = std::function<u64()>;
    // Finalized sink on success, nullptr on failure
    using CompletionFn = std::function<void(std::unique_ptr<file_io::ByteSink> sink)>;
    using ProgressFn   = std::function<void(double fraction)>;

    TransferEngine(const FtpSettings& settings, SendFn send, ClockFn clock = utils::now_ms);

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    // Reset the remote FTP state machine (sent once at start-up)
    void reset_sessions();

    // Terminate any prior transfer and request remote_path.
    // The sink is opened when the remote acknowledges the open.
    FtpStatus start_download(const std::string& remote_path,
                             std::unique_ptr<file_io::ByteSink> sink,
                             CompletionFn on_complete,
                             ProgressFn on_progress = nullptr);

    // Decode and dispatch one transport frame.
    // Throws proto::DecodeError for frames that cannot be parsed.
    FtpStatus handle_frame(const u8* data, size_t len);

    // Dispatch one decoded reply. Not reentrant.
    FtpStatus handle_packet(const FtpPacket& p);

    // Open retry, burst stall recovery and gap re-requests.
    // Returns true when nothing was sent for idle_detection_ms.
    bool periodic_tick(u64 now_ms);

    // Complete the transfer if EOF was seen and no gaps remain
    bool attempt_finish();

    // End the current transfer (failure if one was in progress).
    // Always advances the session id.
    void terminate();
    void cancel() { terminate(); }

    std::string status_line(u64 now_ms) const;

    // ---- Observers ----
    TransferState state() const { return state_; }
    bool in_progress() const { return state_ != TransferState::IDLE; }
    bool reached_eof() const { return reached_eof_; }
    u32 duplicates() const { return duplicates_; }
    u64 bytes_written() const { return read_total_; }
    u64 cursor() const { return sink_ ? sink_->cursor() : 0; }
    u64 contiguous_bytes() const;
    size_t gap_count() const { return gaps_.size(); }
    std::vector<Gap> gaps() const { return gaps_.gaps(); }
    u32 backlog() const { return gaps_.backlog(); }
    u32 burst_size() const { return burst_size_; }
    u8 session() const { return session_.current_session(); }
    u32 read_retries() const { return read_retries_; }
    u32 open_retries() const { return open_retries_; }
    std::optional<u32> remote_file_size() const { return remote_file_size_; }
    u64 rtt_ms() const { return rtt_ms_; }
    const TransferStats& last_stats() const { return last_stats_; }
    const FtpSettings& settings() const { return settings_; }

private:
    void send(FtpPacket p);

    FtpStatus handle_open_reply(const FtpPacket& p);
    FtpStatus handle_burst_reply(const FtpPacket& p);
    FtpStatus handle_read_reply(const FtpPacket& p);

    // False once the transfer that owned `generation` has been torn down,
    // e.g. by a callback that cancelled or restarted it.
    bool running(u64 generation) const {
        return generation == generation_ && state_ != TransferState::IDLE && sink_;
    }

    bool write_payload(const FtpPacket& p, bool move_cursor);
    void mark_eof();
    void check_read_send(u64 now_ms);
    bool drop_packet(int loss_percent);
    u32 configured_burst_size() const;
    bool tracing(int level) const;
    void trace(int level, const std::string& msg) const;

    FtpSettings    settings_;
    SendFn         send_;
    ClockFn        clock_;
    SessionTracker session_;
    GapTracker     gaps_;
    GapRetryPolicy gap_policy_;
    std::mt19937   rng_;

    // Current transfer
    TransferState                      state_{TransferState::IDLE};
    std::string                        remote_path_;
    std::unique_ptr<file_io::ByteSink> sink_;
    CompletionFn                       on_complete_;
    ProgressFn                         on_progress_;
    u32                                burst_size_{MAVFTP_MAX_PAYLOAD};
    bool                               reached_eof_{false};
    u32                                duplicates_{0};
    u64                                read_total_{0};
    u32                                read_retries_{0};
    u32                                open_retries_{0};
    size_t                             gaps_at_eof_{0};
    std::optional<u32>                 remote_file_size_;
    std::optional<u64>                 op_start_ms_;
    std::optional<u64>                 last_burst_read_ms_;

    // Link bookkeeping, survives terminate()
    std::optional<FtpPacket> last_op_;
    u64                      last_op_time_ms_{0};
    u64                      last_send_ms_{0};
    u64                      rtt_ms_{500};
    u64                      generation_{0};   // bumped by every terminate()

    TransferStats last_stats_;
};
