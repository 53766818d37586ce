#pragma once

/**
 * @file torrent_input.h
 * @brief Seekable input stream over a partially downloaded torrent file
 *
 * TorrentInput presents one file of a torrent as a random-access stream.
 * Reads are served from a buffer window that extends up to `buffer_size`
 * bytes behind and ahead of the read position, never into a piece that is
 * not finished. When the piece under the read position is not finished,
 * a read blocks until the download engine finishes it.
 *
 * Example:
 * @code
 * auto pieces = std::make_shared<PieceList>(torrent_size, piece_length);
 * TorrentInputOptions options;
 * options.logical_start_offset = file_offset_in_torrent;
 * options.size = file_size;
 * TorrentInput input(std::make_unique<FileRandomAccess>(path), pieces, options);
 * input.seek_to(1024);
 * std::vector<uint8_t> chunk = input.read_bytes(4096);
 * @endcode
 */

#include "stream_types.h"
#include "piece_list.h"
#include "offset_translator.h"
#include "buffer_window.h"
#include "random_access_file.h"
#include "cancellation.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace piecestream {

/**
 * @brief Construction parameters of a TorrentInput
 */
struct TorrentInputOptions {
    int64_t logical_start_offset = 0;       ///< Piece-space offset of stream byte 0
    int64_t size = 0;                       ///< Declared stream length
    int64_t buffer_size = PS_DEFAULT_BUFFER_SIZE;   ///< Bytes buffered each side of the position
    int64_t storage_offset = 0;             ///< Accessor offset of stream byte 0
    std::chrono::milliseconds piece_wait_timeout{0};    ///< Zero waits forever
};

/**
 * @brief Buffer statistics of a stream
 */
struct TorrentInputStats {
    uint64_t physical_reads = 0;    ///< Reads issued to the accessor
    uint64_t bytes_fetched = 0;     ///< Bytes read from the accessor
    uint64_t bytes_reused = 0;      ///< Bytes kept across window moves
};

class TorrentInput {
public:
    /**
     * @throws std::invalid_argument on null collaborators, a non-positive
     *         buffer size, a negative size or storage offset, or a stream
     *         that does not fit inside the piece list
     */
    TorrentInput(std::unique_ptr<RandomAccessFile> file,
                 std::shared_ptr<const PieceList> pieces,
                 const TorrentInputOptions& options);
    
    ~TorrentInput();
    
    TorrentInput(const TorrentInput&) = delete;
    TorrentInput& operator=(const TorrentInput&) = delete;
    
    //=========================================================================
    // Stream
    //=========================================================================
    
    int64_t position() const;
    int64_t size() const { return translator_.size(); }
    
    /**
     * @brief Move the read position
     *
     * No I/O happens here. Seeking past the end is allowed; reads there
     * return -1.
     *
     * @throws std::invalid_argument if `position` is negative
     * @throws InvalidStateError if the stream is closed
     */
    void seek_to(int64_t position);
    
    /**
     * @brief Read up to `length` bytes into `buffer[offset, offset + length)`
     *
     * Blocks while the piece under the position is not finished. The
     * stream lock is released during the wait, so other threads can query
     * the stream, seek it or close it. A close() from another thread ends
     * the wait with InvalidStateError.
     *
     * @return Bytes read, 0 for a zero-length request, -1 at end of stream
     * @throws std::invalid_argument on negative or out-of-bounds arguments
     * @throws InvalidStateError if the stream is closed, before or during the wait
     * @throws OperationCancelled / PieceWaitTimeout if the wait is interrupted
     * @throws IoError on storage failures
     */
    int64_t read(std::vector<uint8_t>& buffer, int64_t offset, int64_t length,
                 const CancellationToken& token = CancellationToken());
    
    /// Read up to buffer.size() bytes into the start of `buffer`
    int64_t read(std::vector<uint8_t>& buffer,
                 const CancellationToken& token = CancellationToken());
    
    /**
     * @brief Fill the buffer window around the current position
     *
     * Does not block: when the piece under the position is not finished,
     * or the position is at the end, the window is left as it is. A
     * second call without moving the position is a no-op.
     *
     * @throws InvalidStateError if the stream is closed
     */
    void prepare_buffer();
    
    /// Stream range currently buffered, [-1, -1) when empty
    ByteRange buffered_offset_range() const;
    
    /// Release the accessor and the buffer. Idempotent.
    void close();
    
    bool is_closed() const;
    
    //=========================================================================
    // Convenience readers
    //=========================================================================
    
    /// One read of at most `max_length` bytes; empty at end of stream
    std::vector<uint8_t> read_bytes(size_t max_length = 8192,
                                    const CancellationToken& token = CancellationToken());
    
    /// @throws EndOfStreamError if the stream ends before `length` bytes
    std::vector<uint8_t> read_exact_bytes(size_t length,
                                          const CancellationToken& token = CancellationToken());
    
    /// Read until end of stream
    std::vector<uint8_t> read_all_bytes(const CancellationToken& token = CancellationToken());
    
    //=========================================================================
    // Diagnostics
    //=========================================================================
    
    const OffsetTranslator& translator() const { return translator_; }
    int64_t buffer_size() const { return buffer_size_; }
    TorrentInputStats stats() const;

private:
    void check_open() const;
    
    // Called without mutex_; ends on the caller's token or on close()
    void await_piece(size_t index, const CancellationToken& token);
    
    // Callers hold mutex_
    void prepare_buffer_locked();
    void fetch(const ByteRange& range, uint8_t* dest);
    
    std::unique_ptr<RandomAccessFile> file_;
    std::shared_ptr<const PieceList> pieces_;
    OffsetTranslator translator_;
    const int64_t buffer_size_;
    const int64_t storage_offset_;
    const std::chrono::milliseconds piece_wait_timeout_;
    
    mutable std::mutex mutex_;
    int64_t position_;
    BufferWindow window_;
    bool closed_;
    CancellationSource close_source_;
};

} // namespace piecestream
