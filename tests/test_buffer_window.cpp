#include <gtest/gtest.h>
#include "buffer_window.h"
#include "stream_errors.h"

#include <numeric>
#include <vector>

using namespace piecestream;

namespace {

// Stream byte at offset i is (i * 7) mod 256
uint8_t byte_at(int64_t offset) {
    return static_cast<uint8_t>((offset * 7) % 256);
}

class RecordingSource {
public:
    BufferWindow::FetchFunction fetcher() {
        return [this](const ByteRange& range, uint8_t* dest) {
            fetched.push_back(range);
            for (int64_t i = range.start; i < range.end; ++i) {
                dest[i - range.start] = byte_at(i);
            }
        };
    }
    
    std::vector<ByteRange> fetched;
};

void expect_contents(const BufferWindow& window) {
    const ByteRange& range = window.range();
    std::vector<uint8_t> out(static_cast<size_t>(range.length()));
    ASSERT_EQ(window.copy_out(range.start, out.data(), out.size()), out.size());
    for (int64_t i = range.start; i < range.end; ++i) {
        ASSERT_EQ(out[static_cast<size_t>(i - range.start)], byte_at(i)) << "offset " << i;
    }
}

} // namespace

//=============================================================================
// Planning
//=============================================================================

TEST(RefillPlanTest, EmptyCurrentReadsEverything) {
    RefillPlan plan = plan_refill(ByteRange(), ByteRange(10, 50));
    EXPECT_TRUE(plan.keep.empty());
    ASSERT_EQ(plan.reads.size(), 1u);
    EXPECT_EQ(plan.reads[0], ByteRange(10, 50));
}

TEST(RefillPlanTest, DisjointRangesReadEverything) {
    RefillPlan plan = plan_refill(ByteRange(10, 50), ByteRange(80, 120));
    EXPECT_TRUE(plan.keep.empty());
    ASSERT_EQ(plan.reads.size(), 1u);
    EXPECT_EQ(plan.reads[0], ByteRange(80, 120));
    
    plan = plan_refill(ByteRange(80, 120), ByteRange(10, 50));
    ASSERT_EQ(plan.reads.size(), 1u);
    EXPECT_EQ(plan.reads[0], ByteRange(10, 50));
}

TEST(RefillPlanTest, AdjacentRangesDoNotOverlap) {
    RefillPlan plan = plan_refill(ByteRange(0, 20), ByteRange(20, 40));
    EXPECT_TRUE(plan.keep.empty());
    ASSERT_EQ(plan.reads.size(), 1u);
    EXPECT_EQ(plan.reads[0], ByteRange(20, 40));
}

TEST(RefillPlanTest, ExtendForwardReadsTail) {
    RefillPlan plan = plan_refill(ByteRange(10, 50), ByteRange(40, 80));
    EXPECT_EQ(plan.keep, ByteRange(40, 50));
    ASSERT_EQ(plan.reads.size(), 1u);
    EXPECT_EQ(plan.reads[0], ByteRange(50, 80));
}

TEST(RefillPlanTest, ExtendBackwardReadsHead) {
    RefillPlan plan = plan_refill(ByteRange(10, 50), ByteRange(0, 20));
    EXPECT_EQ(plan.keep, ByteRange(10, 20));
    ASSERT_EQ(plan.reads.size(), 1u);
    EXPECT_EQ(plan.reads[0], ByteRange(0, 10));
}

TEST(RefillPlanTest, ContainedWindowNeedsNoRead) {
    RefillPlan plan = plan_refill(ByteRange(10, 50), ByteRange(20, 30));
    EXPECT_EQ(plan.keep, ByteRange(20, 30));
    EXPECT_TRUE(plan.is_noop());
}

TEST(RefillPlanTest, ContainingWindowReadsHeadAndTail) {
    RefillPlan plan = plan_refill(ByteRange(20, 30), ByteRange(10, 50));
    EXPECT_EQ(plan.keep, ByteRange(20, 30));
    ASSERT_EQ(plan.reads.size(), 2u);
    EXPECT_EQ(plan.reads[0], ByteRange(10, 20));
    EXPECT_EQ(plan.reads[1], ByteRange(30, 50));
}

TEST(RefillPlanTest, SameWindowNeedsNoRead) {
    RefillPlan plan = plan_refill(ByteRange(10, 50), ByteRange(10, 50));
    EXPECT_EQ(plan.keep, ByteRange(10, 50));
    EXPECT_TRUE(plan.is_noop());
}

//=============================================================================
// BufferWindow
//=============================================================================

TEST(BufferWindowTest, StartsEmpty) {
    BufferWindow window(64);
    EXPECT_EQ(window.range(), ByteRange(-1, -1));
    EXPECT_FALSE(window.contains(0));
    uint8_t byte = 0;
    EXPECT_EQ(window.copy_out(0, &byte, 1), 0u);
}

TEST(BufferWindowTest, MovesKeepContentsCorrect) {
    BufferWindow window;
    RecordingSource source;
    
    const std::vector<ByteRange> moves = {
        ByteRange(10, 50),      // fresh
        ByteRange(0, 20),       // backward
        ByteRange(0, 40),       // forward, previous as head
        ByteRange(5, 25),       // narrowing
        ByteRange(0, 60),       // head and tail
        ByteRange(100, 140),    // disjoint
        ByteRange(90, 130),     // backward again
    };
    
    for (const ByteRange& want : moves) {
        SCOPED_TRACE(want.to_string());
        window.refill(want, source.fetcher());
        EXPECT_EQ(window.range(), want);
        expect_contents(window);
    }
    
    const std::vector<ByteRange> expected_fetches = {
        ByteRange(10, 50),
        ByteRange(0, 10),
        ByteRange(20, 40),
        ByteRange(0, 5), ByteRange(25, 60),
        ByteRange(100, 140),
        ByteRange(90, 100),
    };
    EXPECT_EQ(source.fetched, expected_fetches);
    EXPECT_EQ(window.fetch_count(), expected_fetches.size());
}

TEST(BufferWindowTest, RefillToSameRangeIsNoop) {
    BufferWindow window;
    RecordingSource source;
    window.refill(ByteRange(0, 20), source.fetcher());
    RefillPlan plan = window.refill(ByteRange(0, 20), source.fetcher());
    
    EXPECT_TRUE(plan.is_noop());
    EXPECT_EQ(source.fetched.size(), 1u);
    EXPECT_EQ(window.bytes_reused(), 0u);
}

TEST(BufferWindowTest, CountsReusedAndFetchedBytes) {
    BufferWindow window;
    RecordingSource source;
    window.refill(ByteRange(10, 50), source.fetcher());
    window.refill(ByteRange(0, 20), source.fetcher());
    
    EXPECT_EQ(window.bytes_fetched(), 50u);
    EXPECT_EQ(window.bytes_reused(), 10u);
}

TEST(BufferWindowTest, CopyOutStopsAtWindowEnd) {
    BufferWindow window;
    RecordingSource source;
    window.refill(ByteRange(10, 20), source.fetcher());
    
    std::vector<uint8_t> out(32);
    EXPECT_EQ(window.copy_out(15, out.data(), out.size()), 5u);
    EXPECT_EQ(out[0], byte_at(15));
    EXPECT_EQ(out[4], byte_at(19));
    EXPECT_EQ(window.copy_out(20, out.data(), out.size()), 0u);
    EXPECT_EQ(window.copy_out(9, out.data(), out.size()), 0u);
}

TEST(BufferWindowTest, FailedFetchEmptiesWindow) {
    BufferWindow window;
    RecordingSource source;
    window.refill(ByteRange(10, 50), source.fetcher());
    
    EXPECT_THROW(window.refill(ByteRange(40, 80), [](const ByteRange&, uint8_t*) {
        throw IoError("disk gone");
    }), IoError);
    EXPECT_EQ(window.range(), ByteRange(-1, -1));
    
    window.refill(ByteRange(40, 80), source.fetcher());
    expect_contents(window);
}

TEST(BufferWindowTest, ReleaseDropsContents) {
    BufferWindow window;
    RecordingSource source;
    window.refill(ByteRange(0, 20), source.fetcher());
    window.release();
    EXPECT_EQ(window.range(), ByteRange(-1, -1));
    EXPECT_FALSE(window.contains(0));
}
