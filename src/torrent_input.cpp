#include "torrent_input.h"
#include "stream_errors.h"
#include "stream_log_macros.h"

#include <algorithm>
#include <stdexcept>

namespace piecestream {

namespace {

// Bytes to reserve for the window: twice the radius, at most the stream size
size_t window_capacity(const TorrentInputOptions& options) {
    if (options.size <= 0 || options.buffer_size <= 0) {
        return 0;
    }
    if (options.buffer_size >= options.size / 2) {
        return static_cast<size_t>(options.size);
    }
    return static_cast<size_t>(2 * options.buffer_size);
}

} // namespace

//=============================================================================
// Construction
//=============================================================================

TorrentInput::TorrentInput(std::unique_ptr<RandomAccessFile> file,
                           std::shared_ptr<const PieceList> pieces,
                           const TorrentInputOptions& options)
    : file_(std::move(file))
    , pieces_(pieces)
    , translator_(std::move(pieces), options.logical_start_offset, options.size)
    , buffer_size_(options.buffer_size)
    , storage_offset_(options.storage_offset)
    , piece_wait_timeout_(options.piece_wait_timeout)
    , position_(0)
    , window_(window_capacity(options))
    , closed_(false) {
    if (!file_) {
        throw std::invalid_argument("file must not be null");
    }
    if (buffer_size_ <= 0) {
        throw std::invalid_argument("buffer_size must be positive");
    }
    if (storage_offset_ < 0) {
        throw std::invalid_argument("storage_offset must not be negative");
    }
    if (translator_.to_physical(options.size) > pieces_->end_offset()) {
        throw std::invalid_argument("stream of " + std::to_string(options.size) +
                                    " bytes at offset " + std::to_string(options.logical_start_offset) +
                                    " extends past the last piece");
    }
    
    LOG_STREAM_DEBUG("Opened stream: size " << options.size
                     << ", logical start " << options.logical_start_offset
                     << ", " << pieces_->piece_count() << " pieces"
                     << ", buffer size " << buffer_size_);
}

TorrentInput::~TorrentInput() {
    close();
}

//=============================================================================
// Stream
//=============================================================================

void TorrentInput::check_open() const {
    if (closed_) {
        throw InvalidStateError("TorrentInput is closed");
    }
}

int64_t TorrentInput::position() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return position_;
}

void TorrentInput::seek_to(int64_t position) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_open();
    if (position < 0) {
        throw std::invalid_argument("seek position must not be negative: " + std::to_string(position));
    }
    position_ = position;
}

int64_t TorrentInput::read(std::vector<uint8_t>& buffer, int64_t offset, int64_t length,
                           const CancellationToken& token) {
    std::unique_lock<std::mutex> lock(mutex_);
    check_open();
    
    if (offset < 0) {
        throw std::invalid_argument("offset must not be negative: " + std::to_string(offset));
    }
    if (length < 0) {
        throw std::invalid_argument("length must not be negative: " + std::to_string(length));
    }
    if (static_cast<uint64_t>(offset) + static_cast<uint64_t>(length) > buffer.size()) {
        throw std::invalid_argument("offset + length exceeds the buffer size " + std::to_string(buffer.size()));
    }
    
    if (position_ >= translator_.size()) {
        return -1;
    }
    if (length == 0) {
        return 0;
    }
    
    // A piece may regress to Failed between the wait and the refill, and
    // another thread may seek while the lock is released
    while (!window_.contains(position_)) {
        size_t anchor = translator_.find_piece_index(position_);
        if (!pieces_->is_finished(anchor)) {
            LOG_STREAM_DEBUG("Waiting for piece " << anchor << " at position " << position_);
            lock.unlock();
            try {
                await_piece(anchor, token);
            } catch (const OperationCancelled&) {
                lock.lock();
                check_open();
                throw;
            }
            lock.lock();
            check_open();
            if (position_ >= translator_.size()) {
                return -1;
            }
            continue;
        }
        prepare_buffer_locked();
    }
    
    size_t n = window_.copy_out(position_, buffer.data() + offset, static_cast<size_t>(length));
    position_ += static_cast<int64_t>(n);
    return static_cast<int64_t>(n);
}

int64_t TorrentInput::read(std::vector<uint8_t>& buffer, const CancellationToken& token) {
    return read(buffer, 0, static_cast<int64_t>(buffer.size()), token);
}

void TorrentInput::await_piece(size_t index, const CancellationToken& token) {
    // Copies of the source share its state, so a callback still running on
    // the cancelling thread never outlives it
    CancellationSource wait_source;
    CancellationRegistration on_caller(token, [wait_source]() mutable { wait_source.cancel(); });
    CancellationRegistration on_close(close_source_.token(), [wait_source]() mutable { wait_source.cancel(); });
    
    pieces_->await_finished(index, wait_source.token(), piece_wait_timeout_);
}

void TorrentInput::prepare_buffer() {
    std::lock_guard<std::mutex> lock(mutex_);
    check_open();
    prepare_buffer_locked();
}

void TorrentInput::prepare_buffer_locked() {
    if (position_ >= translator_.size()) {
        return;
    }
    
    int64_t forward = translator_.compute_max_buffer_size_forward(position_, buffer_size_);
    if (forward == 0) {
        return;
    }
    int64_t backward = translator_.compute_max_buffer_size_backward(position_, buffer_size_);
    
    ByteRange want(position_ - backward, position_ + forward);
    ByteRange previous = window_.range();
    if (want == previous) {
        return;
    }
    
    RefillPlan plan = window_.refill(want, [this](const ByteRange& range, uint8_t* dest) {
        fetch(range, dest);
    });
    
    LOG_STREAM_DEBUG("Buffer " << previous.to_string() << " -> " << want.to_string()
                     << ": reused " << plan.keep.length() << " bytes, "
                     << plan.reads.size() << " reads");
}

void TorrentInput::fetch(const ByteRange& range, uint8_t* dest) {
    int64_t physical = storage_offset_ + range.start;
    size_t length = static_cast<size_t>(range.length());
    
    size_t n;
    try {
        n = read_fully(*file_, physical, dest, length);
    } catch (const IoError& e) {
        LOG_STREAM_ERROR("Read of " << range.to_string() << " failed: " << e.what());
        throw;
    }
    
    if (n < length) {
        LOG_STREAM_ERROR("Storage ended at " << (physical + static_cast<int64_t>(n))
                         << " while reading " << range.to_string());
        throw IoError("unexpected end of storage while reading " + range.to_string());
    }
}

ByteRange TorrentInput::buffered_offset_range() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return window_.range();
}

void TorrentInput::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    close_source_.cancel();
    file_->close();
    file_.reset();
    window_.release();
    LOG_STREAM_DEBUG("Closed stream");
}

bool TorrentInput::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

//=============================================================================
// Convenience readers
//=============================================================================

std::vector<uint8_t> TorrentInput::read_bytes(size_t max_length, const CancellationToken& token) {
    std::vector<uint8_t> buffer(max_length);
    int64_t n = read(buffer, token);
    if (n < 0) {
        return {};
    }
    buffer.resize(static_cast<size_t>(n));
    return buffer;
}

std::vector<uint8_t> TorrentInput::read_exact_bytes(size_t length, const CancellationToken& token) {
    std::vector<uint8_t> result(length);
    size_t total = 0;
    while (total < length) {
        int64_t n = read(result, static_cast<int64_t>(total), static_cast<int64_t>(length - total), token);
        if (n < 0) {
            throw EndOfStreamError("end of stream after " + std::to_string(total) +
                          " of " + std::to_string(length) + " bytes");
        }
        total += static_cast<size_t>(n);
    }
    return result;
}

std::vector<uint8_t> TorrentInput::read_all_bytes(const CancellationToken& token) {
    std::vector<uint8_t> result;
    std::vector<uint8_t> chunk(static_cast<size_t>((std::min)(buffer_size_, int64_t(65536))));
    while (true) {
        int64_t n = read(chunk, token);
        if (n < 0) {
            break;
        }
        result.insert(result.end(), chunk.begin(), chunk.begin() + n);
    }
    return result;
}

//=============================================================================
// Diagnostics
//=============================================================================

TorrentInputStats TorrentInput::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    TorrentInputStats stats;
    stats.physical_reads = window_.fetch_count();
    stats.bytes_fetched = window_.bytes_fetched();
    stats.bytes_reused = window_.bytes_reused();
    return stats;
}

} // namespace piecestream
