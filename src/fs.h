#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstdio>

namespace meshshare {

// File/Directory existence check
bool file_exists(const char* path);
bool directory_exists(const char* path);
bool is_symlink(const char* path);

// File creation and writing
bool create_file(const char* path, const char* content);

// File reading
char* read_file_text(const char* path, size_t* size_out = nullptr);

// Directory operations
bool create_directory(const char* path);
bool create_directories(const char* path); // Create parent directories if needed

// File information
int64_t get_file_size(const char* path);
bool is_file(const char* path);

// Free bytes available to unprivileged users on the filesystem holding path.
// Returns false when the filesystem cannot be queried.
bool get_free_space(const char* path, uint64_t& free_bytes);

// File operations
bool delete_file(const char* path);
bool delete_directory(const char* path);

// Path utilities
std::string combine_paths(const std::string& base, const std::string& relative);

// Utility functions
void free_file_buffer(void* buffer); // Free memory allocated by read functions

// C++ convenience wrappers
inline bool file_exists(const std::string& path) { return file_exists(path.c_str()); }
inline bool directory_exists(const std::string& path) { return directory_exists(path.c_str()); }
inline bool is_symlink(const std::string& path) { return is_symlink(path.c_str()); }
inline bool create_file(const std::string& path, const std::string& content) {
    return create_file(path.c_str(), content.c_str());
}
inline std::string read_file_text_cpp(const std::string& path) {
    size_t size;
    char* content = read_file_text(path.c_str(), &size);
    if (!content) return "";
    std::string result(content, size);
    free_file_buffer(content);
    return result;
}
inline bool create_directories(const std::string& path) { return create_directories(path.c_str()); }
inline int64_t get_file_size(const std::string& path) { return get_file_size(path.c_str()); }
inline bool is_file(const std::string& path) { return is_file(path.c_str()); }
inline bool get_free_space(const std::string& path, uint64_t& free_bytes) {
    return get_free_space(path.c_str(), free_bytes);
}
inline bool delete_file(const std::string& path) { return delete_file(path.c_str()); }
inline bool delete_directory(const std::string& path) { return delete_directory(path.c_str()); }

//=============================================================================
// Download directory probe
//=============================================================================

enum class DownloadDirectoryStatus {
    Ok,
    NotFound,
    Symlink,
    NotADirectory,
    NotEnoughSpace,
    ProbeFailed
};

const char* download_directory_status_to_string(DownloadDirectoryStatus status);

/**
 * Validates a destination directory before an incoming transfer is accepted.
 */
class FilesystemProbe {
public:
    virtual ~FilesystemProbe() = default;

    /**
     * Check that path exists, is a real directory (not a symlink or a file)
     * and that at least required_bytes are free on its filesystem.
     */
    virtual DownloadDirectoryStatus check_download_directory(const std::string& path, uint64_t required_bytes) = 0;
};

class LocalFilesystemProbe : public FilesystemProbe {
public:
    DownloadDirectoryStatus check_download_directory(const std::string& path, uint64_t required_bytes) override;
};

} // namespace meshshare
