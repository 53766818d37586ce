#pragma once

/**
 * @file random_access_file.h
 * @brief Positional read access to the storage behind a stream
 */

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace piecestream {

/**
 * @brief Seek + read primitive over a file or an equivalent store
 *
 * Implementations throw IoError on failures and on reads after close().
 */
class RandomAccessFile {
public:
    virtual ~RandomAccessFile() = default;
    
    virtual int64_t length() const = 0;
    
    /**
     * @brief Read up to `length` bytes starting at `offset`
     * @return Bytes read; fewer than requested only at end of file
     */
    virtual size_t read_at(int64_t offset, uint8_t* buffer, size_t length) = 0;
    
    /// Release the underlying handle. Idempotent.
    virtual void close() = 0;
    
    virtual bool is_open() const = 0;
};

/**
 * @brief Read-only file opened with open(2) and read with pread(2)
 */
class FileRandomAccess : public RandomAccessFile {
public:
    /// @throws IoError if the file cannot be opened
    explicit FileRandomAccess(const std::string& path);
    ~FileRandomAccess() override;
    
    FileRandomAccess(const FileRandomAccess&) = delete;
    FileRandomAccess& operator=(const FileRandomAccess&) = delete;
    
    int64_t length() const override;
    size_t read_at(int64_t offset, uint8_t* buffer, size_t length) override;
    void close() override;
    bool is_open() const override { return fd_ >= 0; }
    
    const std::string& path() const { return path_; }

private:
    std::string path_;
    int fd_;
};

/**
 * @brief Accessor over bytes held in memory
 */
class MemoryRandomAccess : public RandomAccessFile {
public:
    explicit MemoryRandomAccess(std::vector<uint8_t> data);
    
    int64_t length() const override;
    size_t read_at(int64_t offset, uint8_t* buffer, size_t length) override;
    void close() override;
    bool is_open() const override { return open_; }

private:
    std::vector<uint8_t> data_;
    bool open_;
};

/**
 * @brief Read until `length` bytes are in `buffer` or the file ends
 * @return Bytes read
 */
size_t read_fully(RandomAccessFile& file, int64_t offset, uint8_t* buffer, size_t length);

} // namespace piecestream
