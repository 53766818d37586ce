#include "torrent_layout.h"

#include <algorithm>
#include <stdexcept>

namespace piecestream {

TorrentLayout::TorrentLayout(int64_t piece_length)
    : piece_length_(piece_length)
    , total_size_(0) {
    if (piece_length_ <= 0) {
        throw std::invalid_argument("piece_length must be positive");
    }
}

void TorrentLayout::add_file(const std::string& path, int64_t size) {
    if (size < 0) {
        throw std::invalid_argument("file size must not be negative: " + path);
    }
    files_.emplace_back(path, size, total_size_);
    total_size_ += size;
}

uint32_t TorrentLayout::num_pieces() const {
    return static_cast<uint32_t>((total_size_ + piece_length_ - 1) / piece_length_);
}

int64_t TorrentLayout::piece_size(uint32_t piece_index) const {
    uint32_t count = num_pieces();
    if (piece_index >= count) {
        return 0;
    }
    if (piece_index == count - 1) {
        return total_size_ - static_cast<int64_t>(piece_index) * piece_length_;
    }
    return piece_length_;
}

uint32_t TorrentLayout::file_first_piece(size_t file_index) const {
    const TorrentFileEntry& file = files_.at(file_index);
    return static_cast<uint32_t>(file.offset / piece_length_);
}

uint32_t TorrentLayout::file_last_piece(size_t file_index) const {
    const TorrentFileEntry& file = files_.at(file_index);
    if (file.size == 0) {
        return file_first_piece(file_index);
    }
    return static_cast<uint32_t>((file.offset + file.size - 1) / piece_length_);
}

FileStreamParams TorrentLayout::file_stream_params(size_t file_index, int64_t buffer_size) const {
    const TorrentFileEntry& file = files_.at(file_index);
    if (file.size == 0) {
        throw std::invalid_argument("cannot stream empty file: " + file.path);
    }
    
    FileStreamParams params;
    params.first_piece = file_first_piece(file_index);
    params.last_piece = file_last_piece(file_index);
    
    std::vector<int64_t> sizes;
    sizes.reserve(params.last_piece - params.first_piece + 1);
    for (uint32_t piece = params.first_piece; piece <= params.last_piece; ++piece) {
        sizes.push_back(piece_size(piece));
    }
    
    int64_t initial_data_offset = static_cast<int64_t>(params.first_piece) * piece_length_;
    params.pieces = std::make_shared<PieceList>(sizes, initial_data_offset);
    
    params.options.logical_start_offset = file.offset;
    params.options.size = file.size;
    params.options.buffer_size = buffer_size;
    params.options.storage_offset = 0;
    return params;
}

} // namespace piecestream
