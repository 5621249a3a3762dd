// ============================================================
// session_tracker.cpp
// ============================================================

#include "session_tracker.hpp"

void SessionTracker::stamp(FtpPacket& p) {
    p.seq     = next_sequence();
    p.session = session_;
}
