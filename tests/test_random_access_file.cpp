#include <gtest/gtest.h>
#include "random_access_file.h"
#include "stream_errors.h"
#include "fs.h"

#include <algorithm>
#include <string>
#include <vector>

using namespace piecestream;

class FileRandomAccessTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = make_temp_directory("piecestream_raf_");
        ASSERT_FALSE(dir_.empty());
        path_ = dir_ + "/data.bin";
        
        content_.resize(1000);
        for (size_t i = 0; i < content_.size(); ++i) {
            content_[i] = static_cast<uint8_t>(i % 251);
        }
        ASSERT_TRUE(create_file_binary(path_, content_));
    }
    
    void TearDown() override {
        delete_directory_tree(dir_.c_str());
    }
    
    std::string dir_;
    std::string path_;
    std::vector<uint8_t> content_;
};

TEST_F(FileRandomAccessTest, ReportsLength) {
    FileRandomAccess file(path_);
    EXPECT_TRUE(file.is_open());
    EXPECT_EQ(file.length(), 1000);
    EXPECT_EQ(file.path(), path_);
}

TEST_F(FileRandomAccessTest, ReadsAtOffset) {
    FileRandomAccess file(path_);
    std::vector<uint8_t> buffer(100);
    
    size_t n = read_fully(file, 500, buffer.data(), buffer.size());
    ASSERT_EQ(n, 100u);
    EXPECT_TRUE(std::equal(buffer.begin(), buffer.end(), content_.begin() + 500));
}

TEST_F(FileRandomAccessTest, ShortReadAtEnd) {
    FileRandomAccess file(path_);
    std::vector<uint8_t> buffer(100);
    
    EXPECT_EQ(read_fully(file, 950, buffer.data(), buffer.size()), 50u);
    EXPECT_EQ(buffer[49], content_[999]);
    EXPECT_EQ(file.read_at(1000, buffer.data(), buffer.size()), 0u);
    EXPECT_EQ(file.read_at(5000, buffer.data(), buffer.size()), 0u);
}

TEST_F(FileRandomAccessTest, NegativeOffsetThrows) {
    FileRandomAccess file(path_);
    uint8_t byte = 0;
    EXPECT_THROW(file.read_at(-1, &byte, 1), IoError);
}

TEST_F(FileRandomAccessTest, ClosedFileThrows) {
    FileRandomAccess file(path_);
    file.close();
    file.close();
    EXPECT_FALSE(file.is_open());
    
    uint8_t byte = 0;
    EXPECT_THROW(file.read_at(0, &byte, 1), IoError);
    EXPECT_THROW(file.length(), IoError);
}

TEST_F(FileRandomAccessTest, MissingFileThrows) {
    EXPECT_THROW(FileRandomAccess(dir_ + "/missing.bin"), IoError);
}

TEST(MemoryRandomAccessTest, ReadsLikeAFile) {
    MemoryRandomAccess memory(std::vector<uint8_t>{1, 2, 3, 4, 5});
    EXPECT_EQ(memory.length(), 5);
    
    uint8_t buffer[4] = {0};
    EXPECT_EQ(memory.read_at(3, buffer, sizeof(buffer)), 2u);
    EXPECT_EQ(buffer[0], 4);
    EXPECT_EQ(buffer[1], 5);
    EXPECT_EQ(memory.read_at(5, buffer, sizeof(buffer)), 0u);
}

TEST(MemoryRandomAccessTest, ClosedThrows) {
    MemoryRandomAccess memory(std::vector<uint8_t>{1, 2, 3});
    memory.close();
    EXPECT_FALSE(memory.is_open());
    
    uint8_t byte = 0;
    EXPECT_THROW(memory.read_at(0, &byte, 1), IoError);
}

namespace {

// Returns at most `chunk` bytes per call
class TricklingFile : public MemoryRandomAccess {
public:
    TricklingFile(std::vector<uint8_t> data, size_t chunk)
        : MemoryRandomAccess(std::move(data)), chunk_(chunk), calls_(0) {}
    
    size_t read_at(int64_t offset, uint8_t* buffer, size_t length) override {
        ++calls_;
        return MemoryRandomAccess::read_at(offset, buffer, (std::min)(length, chunk_));
    }
    
    int calls() const { return calls_; }
    
private:
    size_t chunk_;
    int calls_;
};

} // namespace

TEST(ReadFullyTest, LoopsOverShortReads) {
    std::vector<uint8_t> data(100);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i);
    }
    TricklingFile file(data, 7);
    
    std::vector<uint8_t> buffer(50);
    EXPECT_EQ(read_fully(file, 10, buffer.data(), buffer.size()), 50u);
    EXPECT_EQ(buffer[0], 10);
    EXPECT_EQ(buffer[49], 59);
    EXPECT_EQ(file.calls(), 8);
}

TEST(ReadFullyTest, StopsAtEndOfFile) {
    TricklingFile file(std::vector<uint8_t>(20, 0xAB), 7);
    std::vector<uint8_t> buffer(50);
    EXPECT_EQ(read_fully(file, 0, buffer.data(), buffer.size()), 20u);
}
