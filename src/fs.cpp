#include "fs.h"
#include "logger.h"
#include <cstring>
#include <cstdlib>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>
#include <errno.h>

#define LOG_FS_DEBUG(message) LOG_DEBUG("fs", message)
#define LOG_FS_WARN(message)  LOG_WARN("fs", message)
#define LOG_FS_ERROR(message) LOG_ERROR("fs", message)

namespace meshshare {

bool file_exists(const char* path) {
    if (!path) return false;
    return access(path, F_OK) == 0;
}

bool directory_exists(const char* path) {
    if (!path) return false;

    struct stat st;
    if (stat(path, &st) == 0) {
        return S_ISDIR(st.st_mode);
    }
    return false;
}

bool is_symlink(const char* path) {
    if (!path) return false;

    struct stat st;
    if (lstat(path, &st) == 0) {
        return S_ISLNK(st.st_mode);
    }
    return false;
}

bool create_file(const char* path, const char* content) {
    if (!path) return false;

    FILE* file = fopen(path, "wb");
    if (!file) {
        LOG_FS_ERROR("Failed to create file: " << path);
        return false;
    }

    if (content) {
        size_t len = strlen(content);
        size_t written = fwrite(content, 1, len, file);
        fclose(file);

        if (written != len) {
            LOG_FS_ERROR("Failed to write complete content to file: " << path);
            return false;
        }
    } else {
        fclose(file);
    }

    return true;
}

char* read_file_text(const char* path, size_t* size_out) {
    if (!path) return nullptr;

    FILE* file = fopen(path, "rb");
    if (!file) {
        LOG_FS_DEBUG("Failed to open file for reading: " << path);
        return nullptr;
    }

    fseek(file, 0, SEEK_END);
    long file_size = ftell(file);
    fseek(file, 0, SEEK_SET);

    if (file_size < 0) {
        LOG_FS_ERROR("Failed to get file size: " << path);
        fclose(file);
        return nullptr;
    }

    // +1 for null terminator
    char* buffer = (char*)malloc(file_size + 1);
    if (!buffer) {
        LOG_FS_ERROR("Failed to allocate memory for file: " << path);
        fclose(file);
        return nullptr;
    }

    size_t bytes_read = fread(buffer, 1, file_size, file);
    fclose(file);

    buffer[bytes_read] = '\0';

    if (size_out) {
        *size_out = bytes_read;
    }

    return buffer;
}

bool create_directory(const char* path) {
    if (!path) return false;

    if (directory_exists(path)) {
        return true; // Already exists
    }

    return mkdir(path, 0755) == 0;
}

bool create_directories(const char* path) {
    if (!path) return false;

    if (directory_exists(path)) {
        return true; // Already exists
    }

    std::string partial(path);
    for (size_t i = 1; i < partial.size(); i++) {
        if (partial[i] == '/') {
            std::string parent = partial.substr(0, i);
            if (!directory_exists(parent.c_str()) && !create_directory(parent.c_str())) {
                LOG_FS_ERROR("Failed to create directory: " << parent);
                return false;
            }
        }
    }

    return create_directory(path);
}

int64_t get_file_size(const char* path) {
    if (!path) return -1;

    struct stat st;
    if (stat(path, &st) == 0) {
        return st.st_size;
    }
    return -1;
}

bool is_file(const char* path) {
    if (!path) return false;

    struct stat st;
    if (stat(path, &st) == 0) {
        return S_ISREG(st.st_mode);
    }
    return false;
}

bool get_free_space(const char* path, uint64_t& free_bytes) {
    if (!path) return false;

    struct statvfs vfs;
    if (statvfs(path, &vfs) != 0) {
        LOG_FS_WARN("statvfs failed for " << path << ": " << strerror(errno));
        return false;
    }

    free_bytes = static_cast<uint64_t>(vfs.f_bavail) * static_cast<uint64_t>(vfs.f_frsize);
    return true;
}

bool delete_file(const char* path) {
    if (!path) return false;

    return remove(path) == 0;
}

bool delete_directory(const char* path) {
    if (!path) return false;

    return rmdir(path) == 0;
}

std::string combine_paths(const std::string& base, const std::string& relative) {
    if (base.empty()) return relative;
    if (relative.empty()) return base;

    if (base.back() == '/') {
        return relative.front() == '/' ? base + relative.substr(1) : base + relative;
    }
    return relative.front() == '/' ? base + relative : base + "/" + relative;
}

void free_file_buffer(void* buffer) {
    if (buffer) {
        free(buffer);
    }
}

//=============================================================================
// Download directory probe
//=============================================================================

const char* download_directory_status_to_string(DownloadDirectoryStatus status) {
    switch (status) {
        case DownloadDirectoryStatus::Ok: return "ok";
        case DownloadDirectoryStatus::NotFound: return "not found";
        case DownloadDirectoryStatus::Symlink: return "symlink";
        case DownloadDirectoryStatus::NotADirectory: return "not a directory";
        case DownloadDirectoryStatus::NotEnoughSpace: return "not enough space";
        case DownloadDirectoryStatus::ProbeFailed: return "probe failed";
        default: return "unknown";
    }
}

DownloadDirectoryStatus LocalFilesystemProbe::check_download_directory(const std::string& path, uint64_t required_bytes) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) {
            return DownloadDirectoryStatus::NotFound;
        }
        LOG_FS_ERROR("lstat failed for " << path << ": " << strerror(errno));
        return DownloadDirectoryStatus::ProbeFailed;
    }

    if (S_ISLNK(st.st_mode)) {
        return DownloadDirectoryStatus::Symlink;
    }
    if (!S_ISDIR(st.st_mode)) {
        return DownloadDirectoryStatus::NotADirectory;
    }

    uint64_t free_bytes = 0;
    if (!get_free_space(path, free_bytes)) {
        return DownloadDirectoryStatus::ProbeFailed;
    }
    if (free_bytes < required_bytes) {
        LOG_FS_DEBUG("Not enough space in " << path << ": need " << required_bytes
                     << " bytes, have " << free_bytes);
        return DownloadDirectoryStatus::NotEnoughSpace;
    }

    return DownloadDirectoryStatus::Ok;
}

} // namespace meshshare
