#pragma once

// ============================================================
// session_tracker.hpp -- Request sequence numbers and session id
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"

class SessionTracker {
public:
    // Returns the current sequence number, then advances it (mod 256)
    u8 next_sequence() {
        u8 s = seq_;
        seq_ = (u8)(seq_ + 1);
        return s;
    }

    u8 current_session() const { return session_; }

    // Invoked on every terminate; wraps mod 256
    void advance_session() { session_ = (u8)(session_ + 1); }

    // Replies from an already-terminated session are stale
    bool belongs_to_session(const FtpPacket& p) const {
        return p.session == session_;
    }

    // Stamp an outgoing request with sequence and session
    void stamp(FtpPacket& p);

private:
    u8 seq_{0};
    u8 session_{0};
};
