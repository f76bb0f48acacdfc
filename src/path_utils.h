#pragma once

#include <string>
#include <utility>
#include <cstddef>

namespace peerq {

// Replace characters that are invalid in a file name with "_"
std::string clean_file(const std::string& filename);

// Like clean_file(), but keeps path separators
std::string clean_path(const std::string& path);

/**
 * Cut a UTF-8 string to at most `max_bytes` bytes without splitting a
 * multi-byte character.
 */
std::string truncate_string_byte(const std::string& text, size_t max_bytes);

/**
 * Split a file name into stem and extension. The extension starts at the
 * last dot; leading dots belong to the stem (".bashrc" has no extension).
 */
std::pair<std::string, std::string> split_extension(const std::string& basename);

// Last component of a peer path ("\" or "/" separated), "" if none
std::string virtual_path_basename(const std::string& virtual_path);

// Component before the last one, "" if the path has a single component
std::string virtual_path_parent_name(const std::string& virtual_path);

// Locale-aware ordering of file names, falling back to byte order
bool locale_less(const std::string& a, const std::string& b);

} // namespace peerq
