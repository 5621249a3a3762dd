// ============================================================
// gap_tracker.cpp
// ============================================================

#include "gap_tracker.hpp"
#include <algorithm>

void GapTracker::register_gap(u32 offset, u32 length, u32 max_chunk) {
    if (max_chunk == 0) max_chunk = 1;
    while (length > 0) {
        u32 n = std::min(length, max_chunk);
        gaps_.push_back(Gap{offset, n, 0});
        offset += n;
        length -= n;
    }
}

bool GapTracker::resolve_gap(u32 offset, u32 length) {
    auto it = std::find_if(gaps_.begin(), gaps_.end(), [&](const Gap& g) {
        return g.offset == offset && g.length == length;
    });
    if (it == gaps_.end()) return false;
    gaps_.erase(it);
    return true;
}

void GapTracker::tick(u64 now_ms, bool reached_eof, const GapRetryPolicy& policy,
                      const SendReadFn& send_read)
{
    if (gaps_.empty()) return;

    if (!reached_eof) {
        // Burst still streaming: request every new gap once, right away.
        // Sent gaps move behind the pending ones in the order sent.
        std::list<Gap> sent;
        for (auto it = gaps_.begin(); it != gaps_.end(); ) {
            auto next = std::next(it);
            if (it->last_attempt_ms == 0) {
                send_read(it->offset, it->length);
                it->last_attempt_ms = now_ms;
                ++backlog_;
                last_gap_send_ms_ = now_ms;
                sent.splice(sent.end(), gaps_, it);
            }
            it = next;
        }
        gaps_.splice(gaps_.end(), sent);
        return;
    }

    Gap& oldest = gaps_.front();
    if (oldest.last_attempt_ms != 0 && now_ms > oldest.last_attempt_ms &&
        now_ms - oldest.last_attempt_ms > policy.retry_ms) {
        // reply lost, make it eligible again
        if (backlog_ > 0) --backlog_;
        oldest.last_attempt_ms = 0;
    }

    if (oldest.last_attempt_ms != 0) {
        return;  // still pending
    }
    if (!reached_eof && backlog_ >= policy.max_backlog) {
        return;
    }
    if (last_gap_send_ms_ && now_ms < *last_gap_send_ms_ + policy.min_send_interval_ms) {
        return;
    }
    send_front(now_ms, send_read);
}

void GapTracker::send_front(u64 now_ms, const SendReadFn& send_read) {
    Gap& g = gaps_.front();
    send_read(g.offset, g.length);
    g.last_attempt_ms = now_ms;
    ++backlog_;
    last_gap_send_ms_ = now_ms;
    gaps_.splice(gaps_.end(), gaps_, gaps_.begin());
}

void GapTracker::clear() {
    gaps_.clear();
    backlog_ = 0;
    last_gap_send_ms_.reset();
}

std::optional<u32> GapTracker::lowest_offset() const {
    if (gaps_.empty()) return std::nullopt;
    auto it = std::min_element(gaps_.begin(), gaps_.end(), [](const Gap& a, const Gap& b) {
        return a.offset < b.offset;
    });
    return it->offset;
}
