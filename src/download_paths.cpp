#include "download_manager.h"
#include "path_utils.h"
#include "hash.h"
#include "fs.h"
#include <algorithm>

namespace peerq {

namespace {

std::string replace_all(std::string text, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return text;
    }
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

} // namespace

std::string DownloadManager::get_default_download_folder(const std::string& username) const {
    std::string download_folder_path = normalize_path(config_.download_folder);

    if (!username.empty() && config_.username_subfolders) {
        download_folder_path = combine_paths(download_folder_path, clean_file(username));
    }

    return download_folder_path;
}

std::string DownloadManager::get_folder_destination(const std::string& username, const std::string& folder_path,
                                                    const std::string& root_folder_path,
                                                    const std::string& download_folder_path) {
    // Drop the remote parents of the requested folder
    const std::string& parent_folder_path = root_folder_path.empty() ? folder_path : root_folder_path;
    std::string removed_parent_folders;
    size_t last_separator = parent_folder_path.rfind('\\');
    if (last_separator != std::string::npos) {
        removed_parent_folders = parent_folder_path.substr(0, last_separator);
    }

    std::string target_folders = replace_all(folder_path, removed_parent_folders, "");
    size_t first = target_folders.find_first_not_of('\\');
    target_folders = first == std::string::npos ? "" : target_folders.substr(first);
    std::replace(target_folders.begin(), target_folders.end(), '\\', '/');

    std::string destination = download_folder_path;
    if (destination.empty()) {
        auto user_it = requested_folders_.find(username);
        if (user_it != requested_folders_.end()) {
            auto folder_it = user_it->second.find(folder_path);
            if (folder_it != user_it->second.end()) {
                destination = folder_it->second;
            }
        }
    }
    if (destination.empty()) {
        destination = get_default_download_folder(username);
    }

    return combine_paths(destination, target_folders);
}

size_t DownloadManager::get_basename_byte_limit(const std::string& folder_path) {
    auto it = folder_basename_byte_limits_.find(folder_path);
    if (it != folder_basename_byte_limits_.end()) {
        return it->second;
    }

    size_t max_bytes = get_max_filename_bytes(folder_path);
    folder_basename_byte_limits_[folder_path] = max_bytes;
    return max_bytes;
}

std::string DownloadManager::get_download_basename(const std::string& virtual_path,
                                                   const std::string& download_folder_path, bool avoid_conflict) {
    size_t max_bytes = get_basename_byte_limit(download_folder_path);

    std::string basename = clean_file(virtual_path_basename(virtual_path));
    auto parts = split_extension(basename);
    std::string basename_no_extension = parts.first;
    std::string extension = parts.second;

    int64_t basename_limit = static_cast<int64_t>(max_bytes) - static_cast<int64_t>(extension.size());
    basename_no_extension = truncate_string_byte(basename_no_extension,
                                                 static_cast<size_t>(std::max<int64_t>(0, basename_limit)));

    if (basename_limit < 0) {
        extension = truncate_string_byte(extension, max_bytes);
    }

    std::string corrected_basename = basename_no_extension + extension;

    if (!avoid_conflict) {
        return corrected_basename;
    }

    int counter = 1;
    while (file_exists(combine_paths(download_folder_path, corrected_basename))) {
        corrected_basename = basename_no_extension + " (" + std::to_string(counter) + ")" + extension;
        counter++;
    }

    return corrected_basename;
}

std::optional<std::string> DownloadManager::get_complete_download_file_path(const std::string& username,
                                                                            const std::string& virtual_path,
                                                                            uint64_t size,
                                                                            const std::string& download_folder_path) {
    std::string folder_path = download_folder_path.empty()
        ? get_default_download_folder(username) : download_folder_path;

    std::string basename = get_download_basename(virtual_path, folder_path);
    auto parts = split_extension(basename);
    std::string download_file_path = combine_paths(folder_path, basename);
    int counter = 1;

    while (is_file(download_file_path)) {
        if (get_file_size(download_file_path) == static_cast<int64_t>(size)) {
            // Found a previous download with a matching file size
            return download_file_path;
        }

        basename = parts.first + " (" + std::to_string(counter) + ")" + parts.second;
        download_file_path = combine_paths(folder_path, basename);
        counter++;
    }

    return std::nullopt;
}

std::string DownloadManager::get_incomplete_download_file_path(const std::string& username,
                                                               const std::string& virtual_path) {
    const std::string prefix = "INCOMPLETE" + sha1_hex(virtual_path + username);

    std::string incomplete_folder_path = normalize_path(config_.incomplete_folder);
    size_t max_bytes = get_basename_byte_limit(incomplete_folder_path);

    std::string basename = clean_file(virtual_path_basename(virtual_path));
    auto parts = split_extension(basename);
    std::string basename_no_extension = parts.first;
    std::string extension = parts.second;

    int64_t basename_limit = static_cast<int64_t>(max_bytes) - static_cast<int64_t>(prefix.size())
        - static_cast<int64_t>(extension.size());
    basename_no_extension = truncate_string_byte(basename_no_extension,
                                                 static_cast<size_t>(std::max<int64_t>(0, basename_limit)));

    if (basename_limit < 0) {
        int64_t extension_limit = static_cast<int64_t>(max_bytes) - static_cast<int64_t>(prefix.size());
        extension = truncate_string_byte(extension, static_cast<size_t>(std::max<int64_t>(0, extension_limit)));
    }

    return combine_paths(incomplete_folder_path, prefix + basename_no_extension + extension);
}

std::string DownloadManager::get_current_download_file_path(const std::string& username,
                                                            const std::string& virtual_path,
                                                            const std::string& download_folder_path,
                                                            uint64_t size) {
    std::optional<std::string> complete_path =
        get_complete_download_file_path(username, virtual_path, size, download_folder_path);
    if (complete_path) {
        return *complete_path;
    }
    return get_incomplete_download_file_path(username, virtual_path);
}

} // namespace peerq
