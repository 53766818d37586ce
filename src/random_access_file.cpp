#include "random_access_file.h"
#include "stream_errors.h"
#include "stream_log_macros.h"

#include <cerrno>
#include <cstring>
#include <algorithm>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace piecestream {

namespace {

std::string errno_message(const std::string& what, const std::string& path) {
    return what + " '" + path + "': " + std::strerror(errno);
}

} // namespace

//=============================================================================
// FileRandomAccess
//=============================================================================

FileRandomAccess::FileRandomAccess(const std::string& path)
    : path_(path), fd_(-1) {
    fd_ = ::open(path.c_str(), O_RDONLY);
    if (fd_ < 0) {
        std::string message = errno_message("Failed to open", path);
        LOG_FILE_ERROR(message);
        throw IoError(message);
    }
    LOG_FILE_DEBUG("Opened " << path);
}

FileRandomAccess::~FileRandomAccess() {
    close();
}

int64_t FileRandomAccess::length() const {
    if (fd_ < 0) {
        throw IoError("file is closed: " + path_);
    }
    struct stat st;
    if (::fstat(fd_, &st) != 0) {
        throw IoError(errno_message("Failed to stat", path_));
    }
    return static_cast<int64_t>(st.st_size);
}

size_t FileRandomAccess::read_at(int64_t offset, uint8_t* buffer, size_t length) {
    if (fd_ < 0) {
        throw IoError("file is closed: " + path_);
    }
    if (offset < 0) {
        throw IoError("negative file offset " + std::to_string(offset) + " in " + path_);
    }
    
    ssize_t n;
    do {
        n = ::pread(fd_, buffer, length, static_cast<off_t>(offset));
    } while (n < 0 && errno == EINTR);
    
    if (n < 0) {
        std::string message = errno_message("Failed to read", path_);
        LOG_FILE_ERROR(message << " at offset " << offset);
        throw IoError(message);
    }
    return static_cast<size_t>(n);
}

void FileRandomAccess::close() {
    if (fd_ < 0) {
        return;
    }
    ::close(fd_);
    fd_ = -1;
    LOG_FILE_DEBUG("Closed " << path_);
}

//=============================================================================
// MemoryRandomAccess
//=============================================================================

MemoryRandomAccess::MemoryRandomAccess(std::vector<uint8_t> data)
    : data_(std::move(data)), open_(true) {
}

int64_t MemoryRandomAccess::length() const {
    if (!open_) {
        throw IoError("memory file is closed");
    }
    return static_cast<int64_t>(data_.size());
}

size_t MemoryRandomAccess::read_at(int64_t offset, uint8_t* buffer, size_t length) {
    if (!open_) {
        throw IoError("memory file is closed");
    }
    if (offset < 0) {
        throw IoError("negative offset " + std::to_string(offset));
    }
    if (offset >= static_cast<int64_t>(data_.size())) {
        return 0;
    }
    size_t available = data_.size() - static_cast<size_t>(offset);
    size_t n = (std::min)(available, length);
    std::memcpy(buffer, data_.data() + offset, n);
    return n;
}

void MemoryRandomAccess::close() {
    open_ = false;
    data_.clear();
    data_.shrink_to_fit();
}

//=============================================================================
// Helpers
//=============================================================================

size_t read_fully(RandomAccessFile& file, int64_t offset, uint8_t* buffer, size_t length) {
    size_t total = 0;
    while (total < length) {
        size_t n = file.read_at(offset + static_cast<int64_t>(total), buffer + total, length - total);
        if (n == 0) {
            break;
        }
        total += n;
    }
    return total;
}

} // namespace piecestream
