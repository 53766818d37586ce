#include <gtest/gtest.h>
#include "offset_translator.h"

#include <memory>
#include <stdexcept>

using namespace piecestream;

namespace {

// 10 pieces of 100 bytes from torrent offset 0; the stream starts 30 bytes in
// and is 900 bytes long, so piece 0 holds [0, 70) and piece 9 holds [870, 900)
// plus 40 bytes of garbage.
class OffsetTranslatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        pieces_ = std::make_shared<PieceList>(1000, 100, 0);
        translator_ = std::make_unique<OffsetTranslator>(pieces_, 30, 900);
    }
    
    std::shared_ptr<PieceList> pieces_;
    std::unique_ptr<OffsetTranslator> translator_;
};

} // namespace

TEST_F(OffsetTranslatorTest, TranslatesOffsets) {
    EXPECT_EQ(translator_->to_physical(0), 30);
    EXPECT_EQ(translator_->to_physical(899), 929);
    EXPECT_EQ(translator_->to_logical(30), 0);
}

TEST_F(OffsetTranslatorTest, FindsPieces) {
    EXPECT_EQ(translator_->find_piece_index(0), 0u);
    EXPECT_EQ(translator_->find_piece_index(69), 0u);
    EXPECT_EQ(translator_->find_piece_index(70), 1u);
    EXPECT_EQ(translator_->find_piece_index(169), 1u);
    EXPECT_EQ(translator_->find_piece_index(899), 9u);
}

TEST_F(OffsetTranslatorTest, ClampsOutsideThePieces) {
    EXPECT_EQ(translator_->find_piece_index(-30), 0u);
    EXPECT_EQ(translator_->find_piece_index(-1000), 0u);
    EXPECT_EQ(translator_->find_piece_index(970), 9u);
    EXPECT_EQ(translator_->find_piece_index(1000000), 9u);
}

TEST_F(OffsetTranslatorTest, FindPieceIndexIsMonotonic) {
    size_t previous = 0;
    for (int64_t offset = -50; offset < 1100; ++offset) {
        size_t index = translator_->find_piece_index(offset);
        ASSERT_GE(index, previous) << "offset " << offset;
        previous = index;
    }
}

TEST_F(OffsetTranslatorTest, PieceLogicalRangeClipsGarbage) {
    EXPECT_EQ(translator_->piece_logical_range(0), ByteRange(0, 70));
    EXPECT_EQ(translator_->piece_logical_range(1), ByteRange(70, 170));
    EXPECT_EQ(translator_->piece_logical_range(9), ByteRange(870, 900));
}

TEST_F(OffsetTranslatorTest, ExtentsNeverCoverUnfinishedPieces) {
    // Finished: 0, 1, 2, 5, 6, 9
    for (size_t i : {0u, 1u, 2u, 5u, 6u, 9u}) {
        pieces_->set_state(i, PieceState::Finished);
    }
    pieces_->set_state(3, PieceState::Downloading);
    pieces_->set_state(7, PieceState::Failed);
    
    for (int64_t from = 0; from <= 900; ++from) {
        int64_t forward = translator_->compute_max_buffer_size_forward(from, 1000000);
        int64_t backward = translator_->compute_max_buffer_size_backward(from, 1000000);
        for (int64_t pos = from; pos < from + forward; ++pos) {
            ASSERT_TRUE(pieces_->is_finished(translator_->find_piece_index(pos)))
                << "forward from " << from << " covers " << pos;
        }
        for (int64_t pos = from - backward; pos < from; ++pos) {
            ASSERT_TRUE(pieces_->is_finished(translator_->find_piece_index(pos)))
                << "backward from " << from << " covers " << pos;
        }
        ASSERT_LE(from + forward, 900);
        ASSERT_GE(from - backward, 0);
    }
}

TEST_F(OffsetTranslatorTest, ExtentsSpanFinishedRuns) {
    for (size_t i : {0u, 1u, 2u, 5u, 6u}) {
        pieces_->set_state(i, PieceState::Finished);
    }
    // Piece 5 holds [470, 570), piece 6 [570, 670)
    EXPECT_EQ(translator_->compute_max_buffer_size_forward(500, 1000000), 170);
    EXPECT_EQ(translator_->compute_max_buffer_size_backward(600, 1000000), 130);
    EXPECT_EQ(translator_->compute_max_buffer_size_forward(500, 50), 50);
    EXPECT_EQ(translator_->compute_max_buffer_size_backward(600, 50), 50);
    
    // Pieces 0..2 hold [0, 270)
    EXPECT_EQ(translator_->compute_max_buffer_size_forward(0, 1000000), 270);
    EXPECT_EQ(translator_->compute_max_buffer_size_backward(269, 1000000), 269);
    EXPECT_EQ(translator_->compute_max_buffer_size_forward(270, 1000000), 0);
}

TEST_F(OffsetTranslatorTest, BackwardNeedsFinishedAnchor) {
    pieces_->set_state(0, PieceState::Finished);
    // Stream offset 70 is the first byte of unfinished piece 1
    EXPECT_EQ(translator_->compute_max_buffer_size_backward(70, 1000000), 0);
    EXPECT_EQ(translator_->compute_max_buffer_size_backward(69, 1000000), 69);
}

TEST_F(OffsetTranslatorTest, ZeroCapacityYieldsNothing) {
    pieces_->set_all_states(PieceState::Finished);
    EXPECT_EQ(translator_->compute_max_buffer_size_forward(100, 0), 0);
    EXPECT_EQ(translator_->compute_max_buffer_size_backward(100, 0), 0);
}

TEST(OffsetTranslatorConstructionTest, RejectsInvalidArguments) {
    auto pieces = std::make_shared<PieceList>(1000, 100, 500);
    EXPECT_THROW(OffsetTranslator(nullptr, 0, 10), std::invalid_argument);
    EXPECT_THROW(OffsetTranslator(pieces, 500, -1), std::invalid_argument);
    EXPECT_THROW(OffsetTranslator(pieces, 499, 10), std::invalid_argument);
    EXPECT_NO_THROW(OffsetTranslator(pieces, 500, 1000));
}

TEST(OffsetTranslatorConstructionTest, UnevenPieceSizes) {
    auto pieces = std::make_shared<PieceList>(std::vector<int64_t>{10, 0, 5, 20}, 100);
    OffsetTranslator translator(pieces, 100, 35);
    
    EXPECT_EQ(translator.find_piece_index(9), 0u);
    EXPECT_EQ(translator.find_piece_index(10), 2u);     // skips the empty piece
    EXPECT_EQ(translator.find_piece_index(15), 3u);
    
    pieces->set_all_states(PieceState::Finished);
    EXPECT_EQ(translator.compute_max_buffer_size_forward(0, 1000), 35);
    EXPECT_EQ(translator.compute_max_buffer_size_backward(35 - 1, 1000), 34);
}
