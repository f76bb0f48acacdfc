#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include <cstdio>

namespace peerq {

// File/Directory existence check
bool file_exists(const std::string& path);
bool directory_exists(const std::string& path);
bool is_file(const std::string& path);

// File creation, reading and removal
bool create_file(const std::string& path, const std::string& content);
std::string read_file_text(const std::string& path);
bool delete_file(const std::string& path);
bool delete_directory(const std::string& path);

/**
 * Replace a file's content through a temporary sibling and a rename,
 * so readers never observe a half-written file.
 */
bool write_file_atomic(const std::string& path, const std::string& content);

// Directory operations; `error` receives the OS error text on failure
bool create_directories(const std::string& path, std::string* error = nullptr);

// File information
int64_t get_file_size(const std::string& path);
bool is_file_readable(const std::string& path);

/**
 * Maximum number of bytes a single file name may occupy in `folder_path`.
 * Falls back to 255 when the file system cannot be queried.
 */
size_t get_max_filename_bytes(const std::string& folder_path);

// Rename, or copy and delete across file systems
bool move_file(const std::string& src_path, const std::string& dest_path, std::string* error = nullptr);

// Path utilities
std::string combine_paths(const std::string& base, const std::string& relative);
std::string get_filename_from_path(const std::string& path);
std::string get_parent_directory(const std::string& path);
std::string normalize_path(const std::string& path);

/**
 * Open file owned by exactly one transfer at a time. The network worker
 * borrows it for reads/writes; closing is idempotent.
 */
class FileHandle {
public:
    FileHandle(FILE* file, std::string path) : file_(file), path_(std::move(path)) {}
    ~FileHandle() { close(); }

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    /**
     * Open `path` with a stdio mode string.
     * @return nullptr on failure, with the OS error text in `error`
     */
    static std::shared_ptr<FileHandle> open(const std::string& path, const char* mode, std::string* error = nullptr);

    FILE* get() const { return file_; }
    const std::string& path() const { return path_; }
    bool is_open() const { return file_ != nullptr; }

    // Non-blocking exclusive advisory lock
    bool try_lock_exclusive(std::string* error = nullptr);
    bool truncate(std::string* error = nullptr);
    // Seek to the end and return the resulting offset, -1 on failure
    int64_t seek_end();

    void close();

private:
    FILE* file_;
    std::string path_;
};

} // namespace peerq
