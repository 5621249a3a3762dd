#include "../client/gap_tracker.hpp"
#include <gtest/gtest.h>
#include <utility>
#include <vector>

namespace {

using Range = std::pair<u32, u32>;

struct Recorder {
    std::vector<Range> reads;
    GapTracker::SendReadFn fn() {
        return [this](u32 offset, u32 length) { reads.emplace_back(offset, length); };
    }
};

std::vector<Range> ranges(const GapTracker& t) {
    std::vector<Range> out;
    for (const Gap& g : t.gaps()) out.emplace_back(g.offset, g.length);
    return out;
}

} // namespace

TEST(GapTracker, RegisterTilesIntoChunks) {
    GapTracker t;
    t.register_gap(100, 500, 239);
    EXPECT_EQ(ranges(t), (std::vector<Range>{{100, 239}, {339, 239}, {578, 22}}));
    for (const Gap& g : t.gaps()) EXPECT_EQ(g.last_attempt_ms, 0u);
}

TEST(GapTracker, ResolveRequiresExactMatch) {
    GapTracker t;
    t.register_gap(0, 478, 239);
    EXPECT_FALSE(t.resolve_gap(0, 100));
    EXPECT_FALSE(t.resolve_gap(10, 239));
    EXPECT_EQ(t.size(), 2u);
    EXPECT_TRUE(t.resolve_gap(239, 239));
    EXPECT_FALSE(t.resolve_gap(239, 239));
    EXPECT_EQ(ranges(t), (std::vector<Range>{{0, 239}}));
}

TEST(GapTracker, LowestOffset) {
    GapTracker t;
    EXPECT_FALSE(t.lowest_offset().has_value());
    t.register_gap(500, 10, 239);
    t.register_gap(100, 10, 239);
    EXPECT_EQ(*t.lowest_offset(), 100u);
}

TEST(GapTracker, BeforeEofEveryNewGapIsSentOnce) {
    GapTracker t;
    GapRetryPolicy policy;
    Recorder rec;
    t.register_gap(0, 300, 100);

    t.tick(1000, false, policy, rec.fn());
    EXPECT_EQ(rec.reads, (std::vector<Range>{{0, 100}, {100, 100}, {200, 100}}));
    EXPECT_EQ(t.backlog(), 3u);

    // nothing new, nothing resent
    t.tick(5000, false, policy, rec.fn());
    EXPECT_EQ(rec.reads.size(), 3u);

    t.register_gap(900, 50, 100);
    t.tick(5001, false, policy, rec.fn());
    ASSERT_EQ(rec.reads.size(), 4u);
    EXPECT_EQ(rec.reads.back(), Range(900, 50));
}

TEST(GapTracker, AfterEofPendingOldestHoldsTheQueue) {
    GapTracker t;
    GapRetryPolicy policy;
    Recorder rec;
    t.register_gap(0, 200, 100);
    t.tick(1000, false, policy, rec.fn());
    ASSERT_EQ(rec.reads.size(), 2u);

    t.tick(1400, true, policy, rec.fn());
    EXPECT_EQ(rec.reads.size(), 2u);
    EXPECT_EQ(t.backlog(), 2u);
}

TEST(GapTracker, AfterEofTimedOutGapIsResent) {
    GapTracker t;
    GapRetryPolicy policy;
    Recorder rec;
    t.register_gap(0, 200, 100);
    t.tick(1000, false, policy, rec.fn());

    t.tick(1600, true, policy, rec.fn());
    ASSERT_EQ(rec.reads.size(), 3u);
    EXPECT_EQ(rec.reads.back(), Range(0, 100));
    // one expired, one resent
    EXPECT_EQ(t.backlog(), 2u);
    // the resent gap moved to the back
    EXPECT_EQ(ranges(t), (std::vector<Range>{{100, 100}, {0, 100}}));
    EXPECT_EQ(t.gaps().back().last_attempt_ms, 1600u);
}

TEST(GapTracker, AfterEofSendsAreSpaced) {
    GapTracker t;
    GapRetryPolicy policy;
    Recorder rec;
    t.register_gap(0, 200, 100);

    t.tick(1000, true, policy, rec.fn());
    ASSERT_EQ(rec.reads.size(), 1u);
    EXPECT_EQ(rec.reads[0], Range(0, 100));

    t.tick(1020, true, policy, rec.fn());
    EXPECT_EQ(rec.reads.size(), 1u);

    t.tick(1050, true, policy, rec.fn());
    ASSERT_EQ(rec.reads.size(), 2u);
    EXPECT_EQ(rec.reads[1], Range(100, 100));
}

TEST(GapTracker, ReadReplyDecrementsBacklogWithoutUnderflow) {
    GapTracker t;
    GapRetryPolicy policy;
    Recorder rec;
    t.register_gap(0, 100, 100);
    t.tick(1000, false, policy, rec.fn());
    EXPECT_EQ(t.backlog(), 1u);
    t.on_read_reply();
    t.on_read_reply();
    EXPECT_EQ(t.backlog(), 0u);
}

TEST(GapTracker, ClearResetsEverything) {
    GapTracker t;
    GapRetryPolicy policy;
    Recorder rec;
    t.register_gap(0, 100, 100);
    t.tick(1000, false, policy, rec.fn());
    t.clear();
    EXPECT_TRUE(t.empty());
    EXPECT_EQ(t.backlog(), 0u);

    // spacing restarts after clear
    t.register_gap(0, 100, 100);
    t.tick(1001, true, policy, rec.fn());
    EXPECT_EQ(rec.reads.size(), 2u);
}
