#include "fs.h"
#include "logger.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

namespace piecestream {

bool file_exists(const char* path) {
    if (!path) return false;
    return access(path, F_OK) == 0;
}

int64_t get_file_size(const char* path) {
    if (!path) return -1;
    
    struct stat st;
    if (stat(path, &st) == 0) {
        return st.st_size;
    }
    return -1;
}

bool create_file(const char* path, const std::string& content) {
    return create_file_binary(path, content.data(), content.size());
}

bool create_file_binary(const char* path, const void* data, size_t size) {
    if (!path) return false;
    
    FILE* file = fopen(path, "wb");
    if (!file) {
        LOG_ERROR("FS", "Failed to create file: " << path);
        return false;
    }
    
    size_t written = 0;
    if (data && size > 0) {
        written = fwrite(data, 1, size, file);
    }
    bool closed = fclose(file) == 0;
    
    if (written != size || !closed) {
        LOG_ERROR("FS", "Failed to write complete content to file: " << path);
        return false;
    }
    return true;
}

bool read_file_text(const char* path, std::string& content_out) {
    if (!path) return false;
    
    FILE* file = fopen(path, "rb");
    if (!file) {
        LOG_ERROR("FS", "Failed to open file for reading: " << path);
        return false;
    }
    
    content_out.clear();
    char chunk[4096];
    size_t n;
    while ((n = fread(chunk, 1, sizeof(chunk), file)) > 0) {
        content_out.append(chunk, n);
    }
    bool failed = ferror(file) != 0;
    fclose(file);
    
    if (failed) {
        LOG_ERROR("FS", "Failed to read file: " << path);
        return false;
    }
    return true;
}

bool delete_file(const char* path) {
    if (!path) return false;
    return remove(path) == 0;
}

std::string make_temp_directory(const std::string& prefix) {
    const char* tmp = std::getenv("TMPDIR");
    std::string pattern = std::string(tmp && *tmp ? tmp : "/tmp") + "/" + prefix + "XXXXXX";
    
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (!mkdtemp(buffer.data())) {
        LOG_ERROR("FS", "Failed to create temporary directory: " << pattern);
        return "";
    }
    return std::string(buffer.data());
}

bool delete_directory_tree(const char* path) {
    if (!path) return false;
    
    DIR* dir = opendir(path);
    if (!dir) {
        return false;
    }
    
    bool ok = true;
    while (struct dirent* entry = readdir(dir)) {
        if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) {
            continue;
        }
        std::string child = std::string(path) + "/" + entry->d_name;
        struct stat st;
        if (lstat(child.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
            ok = delete_directory_tree(child.c_str()) && ok;
        } else {
            ok = (remove(child.c_str()) == 0) && ok;
        }
    }
    closedir(dir);
    
    return (rmdir(path) == 0) && ok;
}

} // namespace piecestream
