#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace piecestream {

// Existence / size
bool file_exists(const char* path);
int64_t get_file_size(const char* path);

// Whole-file helpers used for configuration files and fixtures
bool create_file(const char* path, const std::string& content);
bool create_file_binary(const char* path, const void* data, size_t size);
bool read_file_text(const char* path, std::string& content_out);
bool delete_file(const char* path);

// Scratch directories for fixtures
std::string make_temp_directory(const std::string& prefix);
bool delete_directory_tree(const char* path);

// C++ convenience wrappers
inline bool file_exists(const std::string& path) { return file_exists(path.c_str()); }
inline int64_t get_file_size(const std::string& path) { return get_file_size(path.c_str()); }
inline bool create_file(const std::string& path, const std::string& content) {
    return create_file(path.c_str(), content);
}
inline bool create_file_binary(const std::string& path, const std::vector<uint8_t>& data) {
    return create_file_binary(path.c_str(), data.data(), data.size());
}
inline bool delete_file(const std::string& path) { return delete_file(path.c_str()); }

} // namespace piecestream
