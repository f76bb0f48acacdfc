#include "fs.h"
#include "logger.h"
#include <cstring>
#include <cerrno>
#include <vector>
#include <sys/stat.h>

#ifdef _WIN32
    #include <windows.h>
    #include <direct.h>
    #include <io.h>
    #define stat _stat
    #define mkdir(path, mode) _mkdir(path)
    #define access _access
    #define F_OK 0
    #define R_OK 4
#else
    #include <unistd.h>
    #include <fcntl.h>
    #include <sys/statvfs.h>
#endif

namespace peerq {

namespace {

void set_error(std::string* error, int err) {
    if (error) {
        *error = std::strerror(err);
    }
}

} // namespace

bool file_exists(const std::string& path) {
    if (path.empty()) return false;
    return access(path.c_str(), F_OK) == 0;
}

bool directory_exists(const std::string& path) {
    if (path.empty()) return false;

    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        return (st.st_mode & S_IFDIR) != 0;
    }
    return false;
}

bool is_file(const std::string& path) {
    if (path.empty()) return false;

    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        return (st.st_mode & S_IFREG) != 0;
    }
    return false;
}

bool create_file(const std::string& path, const std::string& content) {
    if (path.empty()) return false;

    FILE* file = fopen(path.c_str(), "wb");
    if (!file) {
        LOG_ERROR("FS", "Failed to create file: " << path << ": " << std::strerror(errno));
        return false;
    }

    size_t written = fwrite(content.data(), 1, content.size(), file);
    bool flushed = fclose(file) == 0;

    if (written != content.size() || !flushed) {
        LOG_ERROR("FS", "Failed to write complete content to file: " << path);
        return false;
    }

    return true;
}

std::string read_file_text(const std::string& path) {
    FILE* file = fopen(path.c_str(), "rb");
    if (!file) {
        return "";
    }

    std::string content;
    std::vector<char> buffer(64 * 1024);
    size_t bytes_read;
    while ((bytes_read = fread(buffer.data(), 1, buffer.size(), file)) > 0) {
        content.append(buffer.data(), bytes_read);
    }
    fclose(file);

    return content;
}

bool delete_file(const std::string& path) {
    if (path.empty()) return false;
    return remove(path.c_str()) == 0;
}

bool delete_directory(const std::string& path) {
    if (path.empty()) return false;

#ifdef _WIN32
    return RemoveDirectoryA(path.c_str()) != 0;
#else
    return rmdir(path.c_str()) == 0;
#endif
}

bool write_file_atomic(const std::string& path, const std::string& content) {
    std::string temp_path = path + ".tmp";

    if (!create_file(temp_path, content)) {
        delete_file(temp_path);
        return false;
    }

#ifdef _WIN32
    // rename() does not replace an existing file on Windows
    delete_file(path);
#endif

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        LOG_ERROR("FS", "Failed to replace " << path << ": " << std::strerror(errno));
        delete_file(temp_path);
        return false;
    }

    return true;
}

bool create_directories(const std::string& path, std::string* error) {
    if (path.empty()) {
        set_error(error, ENOENT);
        return false;
    }

    if (directory_exists(path)) {
        return true;
    }

    // Create parent directories first
    for (size_t i = 1; i < path.size(); ++i) {
        if (path[i] != '/' && path[i] != '\\') {
            continue;
        }

        std::string parent = path.substr(0, i);
        if (directory_exists(parent)) {
            continue;
        }

        if (mkdir(parent.c_str(), 0755) != 0 && errno != EEXIST) {
            set_error(error, errno);
            return false;
        }

        if (!directory_exists(parent)) {
            // Something other than a directory occupies the path
            set_error(error, ENOTDIR);
            return false;
        }
    }

    if (mkdir(path.c_str(), 0755) != 0) {
        int err = errno;
        if (err == EEXIST && directory_exists(path)) {
            return true;
        }
        set_error(error, err == EEXIST ? ENOTDIR : err);
        return false;
    }

    return true;
}

int64_t get_file_size(const std::string& path) {
    if (path.empty()) return -1;

    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        return st.st_size;
    }
    return -1;
}

bool is_file_readable(const std::string& path) {
    if (path.empty()) return false;
    return access(path.c_str(), R_OK) == 0;
}

size_t get_max_filename_bytes(const std::string& folder_path) {
#ifdef _WIN32
    (void)folder_path;
    return 255;
#else
    struct statvfs info;
    if (statvfs(folder_path.c_str(), &info) == 0 && info.f_namemax > 0) {
        return static_cast<size_t>(info.f_namemax);
    }
    return 255;
#endif
}

bool move_file(const std::string& src_path, const std::string& dest_path, std::string* error) {
    if (src_path.empty() || dest_path.empty()) {
        set_error(error, EINVAL);
        return false;
    }

    if (rename(src_path.c_str(), dest_path.c_str()) == 0) {
        return true;
    }

    int rename_error = errno;
    if (rename_error != EXDEV) {
        set_error(error, rename_error);
        return false;
    }

    // Different file systems: stream a copy, then drop the source
    FILE* src = fopen(src_path.c_str(), "rb");
    if (!src) {
        set_error(error, errno);
        return false;
    }

    FILE* dest = fopen(dest_path.c_str(), "wb");
    if (!dest) {
        set_error(error, errno);
        fclose(src);
        return false;
    }

    std::vector<char> buffer(256 * 1024);
    bool ok = true;
    size_t bytes_read;
    while ((bytes_read = fread(buffer.data(), 1, buffer.size(), src)) > 0) {
        if (fwrite(buffer.data(), 1, bytes_read, dest) != bytes_read) {
            set_error(error, errno);
            ok = false;
            break;
        }
    }

    if (ferror(src)) {
        set_error(error, errno);
        ok = false;
    }

    fclose(src);
    if (fclose(dest) != 0 && ok) {
        set_error(error, errno);
        ok = false;
    }

    if (!ok) {
        // Keep the source intact, drop the partial copy
        delete_file(dest_path);
        return false;
    }

    return delete_file(src_path);
}

std::string combine_paths(const std::string& base, const std::string& relative) {
    if (base.empty()) return relative;
    if (relative.empty()) return base;

    char last = base.back();
    if (last == '/' || last == '\\') {
        return base + relative;
    }
    return base + "/" + relative;
}

std::string get_filename_from_path(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    if (pos == std::string::npos) {
        return path;
    }
    return path.substr(pos + 1);
}

std::string get_parent_directory(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    if (pos == std::string::npos) {
        return "";
    }
    if (pos == 0) {
        return path.substr(0, 1);
    }
    return path.substr(0, pos);
}

std::string normalize_path(const std::string& path) {
    if (path.empty()) {
        return ".";
    }

    bool absolute = path[0] == '/';
    std::vector<std::string> parts;
    std::string part;

    auto flush_part = [&]() {
        if (part.empty() || part == ".") {
            // skip
        } else if (part == "..") {
            if (!parts.empty() && parts.back() != "..") {
                parts.pop_back();
            } else if (!absolute) {
                parts.push_back(part);
            }
        } else {
            parts.push_back(part);
        }
        part.clear();
    };

    for (char c : path) {
        if (c == '/') {
            flush_part();
        } else {
            part += c;
        }
    }
    flush_part();

    std::string result = absolute ? "/" : "";
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += "/";
        result += parts[i];
    }

    if (result.empty()) {
        return ".";
    }
    return result;
}

//=============================================================================
// FileHandle
//=============================================================================

std::shared_ptr<FileHandle> FileHandle::open(const std::string& path, const char* mode, std::string* error) {
    FILE* file = fopen(path.c_str(), mode);
    if (!file) {
        set_error(error, errno);
        return nullptr;
    }
    return std::make_shared<FileHandle>(file, path);
}

bool FileHandle::try_lock_exclusive(std::string* error) {
    if (!file_) {
        set_error(error, EBADF);
        return false;
    }

#ifdef _WIN32
    return true;
#else
    struct flock lock;
    std::memset(&lock, 0, sizeof(lock));
    lock.l_type = F_WRLCK;
    lock.l_whence = SEEK_SET;

    if (fcntl(fileno(file_), F_SETLK, &lock) != 0) {
        set_error(error, errno);
        return false;
    }
    return true;
#endif
}

bool FileHandle::truncate(std::string* error) {
    if (!file_) {
        set_error(error, EBADF);
        return false;
    }

    fflush(file_);
#ifdef _WIN32
    if (_chsize_s(_fileno(file_), 0) != 0) {
#else
    if (ftruncate(fileno(file_), 0) != 0) {
#endif
        set_error(error, errno);
        return false;
    }
    return true;
}

int64_t FileHandle::seek_end() {
    if (!file_ || fseek(file_, 0, SEEK_END) != 0) {
        return -1;
    }
    return static_cast<int64_t>(ftell(file_));
}

void FileHandle::close() {
    if (file_) {
        fclose(file_);
        file_ = nullptr;
    }
}

} // namespace peerq
