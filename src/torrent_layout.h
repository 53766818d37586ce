#pragma once

/**
 * @file torrent_layout.h
 * @brief File layout of a torrent and the stream parameters of each file
 *
 * Files are laid out back to back in the torrent's data. A file rarely
 * starts or ends on a piece boundary, so the pieces a file needs carry
 * bytes of its neighbours before and after it.
 */

#include "piece_list.h"
#include "torrent_input.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace piecestream {

/**
 * @brief A file inside the torrent
 */
struct TorrentFileEntry {
    std::string path;       ///< Relative path of the file
    int64_t size;           ///< Size in bytes
    int64_t offset;         ///< Offset from the start of the torrent data
    
    TorrentFileEntry() : size(0), offset(0) {}
    TorrentFileEntry(const std::string& p, int64_t s, int64_t off)
        : path(p), size(s), offset(off) {}
};

/**
 * @brief Everything needed to open a TorrentInput on one file
 */
struct FileStreamParams {
    std::shared_ptr<PieceList> pieces;  ///< Pieces spanning the file
    uint32_t first_piece;               ///< Torrent piece index of pieces[0]
    uint32_t last_piece;                ///< Torrent piece index of the last entry
    TorrentInputOptions options;        ///< logical_start_offset and size filled in
};

class TorrentLayout {
public:
    /// @throws std::invalid_argument if `piece_length` is not positive
    explicit TorrentLayout(int64_t piece_length);
    
    /// Append a file; its offset is the current total size
    /// @throws std::invalid_argument on a negative size
    void add_file(const std::string& path, int64_t size);
    
    size_t num_files() const { return files_.size(); }
    const TorrentFileEntry& file_at(size_t index) const { return files_.at(index); }
    
    int64_t piece_length() const { return piece_length_; }
    int64_t total_size() const { return total_size_; }
    uint32_t num_pieces() const;
    
    /// Size of a piece; the last one may be shorter
    int64_t piece_size(uint32_t piece_index) const;
    
    /// @throws std::out_of_range on a bad file index
    uint32_t file_first_piece(size_t file_index) const;
    uint32_t file_last_piece(size_t file_index) const;
    
    /**
     * @brief Build the piece list and stream options for one file
     *
     * The piece list starts at the file's first piece, so its
     * `initial_data_offset` is `first_piece * piece_length` and the file
     * begins `offset - initial_data_offset` bytes into it. The stream reads
     * the file itself, so `storage_offset` stays 0.
     *
     * @param buffer_size Capacity radius for the stream
     * @throws std::out_of_range on a bad file index
     * @throws std::invalid_argument for an empty file
     */
    FileStreamParams file_stream_params(size_t file_index,
                                        int64_t buffer_size = PS_DEFAULT_BUFFER_SIZE) const;

private:
    std::vector<TorrentFileEntry> files_;
    int64_t piece_length_;
    int64_t total_size_;
};

} // namespace piecestream
