#pragma once

// ============================================================
// gap_tracker.hpp -- Missing byte ranges of a streaming download
//
// A gap is registered when a burst reply lands beyond the stream
// cursor. Gaps are re-requested with single ReadFile requests:
// once each as soon as they are known, then one at a time, oldest
// first, with a retry timeout and a cap on outstanding requests.
// ============================================================

#include "../common/platform.hpp"
#include <list>
#include <vector>
#include <optional>
#include <functional>

struct Gap {
    u32 offset{0};
    u32 length{0};
    u64 last_attempt_ms{0};   // 0 = never attempted
};

struct GapRetryPolicy {
    u64 retry_ms{500};
    u32 max_backlog{5};
    u64 min_send_interval_ms{50};
};

class GapTracker {
public:
    using SendReadFn = std::function<void(u32 offset, u32 length)>;

    // Split [offset, offset+length) into ranges of at most max_chunk
    // bytes and append them, never attempted.
    void register_gap(u32 offset, u32 length, u32 max_chunk);

    // Remove the gap with exactly this offset and length.
    // Returns false (and changes nothing) for any other range.
    bool resolve_gap(u32 offset, u32 length);

    // Retry policy, driven by the caller's tick
    void tick(u64 now_ms, bool reached_eof, const GapRetryPolicy& policy,
              const SendReadFn& send_read);

    // A ReadFile reply arrived; one less request outstanding
    void on_read_reply() { if (backlog_ > 0) --backlog_; }

    void clear();

    bool empty() const { return gaps_.empty(); }
    size_t size() const { return gaps_.size(); }
    u32 backlog() const { return backlog_; }

    // Lowest missing offset, if any
    std::optional<u32> lowest_offset() const;

    std::vector<Gap> gaps() const { return {gaps_.begin(), gaps_.end()}; }

private:
    void send_front(u64 now_ms, const SendReadFn& send_read);

    std::list<Gap>     gaps_;
    u32                backlog_{0};
    std::optional<u64> last_gap_send_ms_;
};
