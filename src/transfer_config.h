#pragma once

#include "messages.h"
#include <string>
#include <vector>
#include <cstdint>

namespace peerq {

/**
 * Download filter as entered by the user. Escaped filters are plain text
 * where `*` is a wildcard; others are regular expressions.
 */
struct DownloadFilter {
    std::string pattern;
    bool escaped;

    DownloadFilter(std::string pattern_ = "", bool escaped_ = true)
        : pattern(std::move(pattern_)), escaped(escaped_) {}

    bool operator<(const DownloadFilter& other) const {
        if (pattern != other.pattern) return pattern < other.pattern;
        return escaped < other.escaped;
    }
};

// Who may push files to us without us asking
enum class RemoteDownloadPermission {
    NOBODY = 0,
    EVERYONE = 1,
    BUDDIES = 2,
    TRUSTED = 3
};

enum class SpeedLimitMode {
    OFF,
    PRIMARY,
    ALTERNATIVE
};

/**
 * Transfer settings
 */
struct TransferConfig {
    std::string data_folder;            // Transfer lists (default: ./data)
    std::string download_folder;        // Finished downloads (default: ./downloads)
    std::string incomplete_folder;      // Downloads in progress (default: ./incomplete)
    std::string upload_folder;          // Files peers pushed to us (default: ./received)
    bool username_subfolders;           // One subfolder per user in download_folder (default: false)

    std::vector<DownloadFilter> download_filters;
    bool enable_filters;                // (default: false)
    bool autoclear_downloads;           // (default: false)
    bool autoclear_uploads;             // (default: false)
    RemoteDownloadPermission remote_downloads;  // (default: BUDDIES)

    bool use_upload_slots;              // Slots when true, bandwidth otherwise (default: true)
    uint32_t upload_slots;              // (default: 2)
    uint32_t upload_bandwidth;          // KiB/s (default: 50)
    uint32_t file_limit;                // Queued files per user, 0 = unlimited (default: 100)
    uint32_t queue_limit;               // Queued MiB per user, 0 = unlimited (default: 150)
    bool friends_no_limits;             // Buddies bypass the queue limits (default: false)
    bool prefer_friends;                // Every buddy is prioritized (default: false)
    bool fifo_queue;                    // FIFO instead of round robin (default: false)

    bool use_custom_ban;                // (default: false)
    std::string custom_ban;

    SpeedLimitMode download_speed_limit;    // (default: OFF)
    uint32_t download_limit;                // KiB/s (default: 1000)
    uint32_t download_limit_alt;            // KiB/s (default: 100)
    SpeedLimitMode upload_speed_limit;      // (default: OFF)
    uint32_t upload_limit;                  // KiB/s (default: 1000)
    uint32_t upload_limit_alt;              // KiB/s (default: 100)
    UploadLimitScope upload_limit_by;       // (default: PER_TRANSFER)

    TransferConfig()
        : data_folder("./data"),
          download_folder("./downloads"),
          incomplete_folder("./incomplete"),
          upload_folder("./received"),
          username_subfolders(false),
          enable_filters(false),
          autoclear_downloads(false),
          autoclear_uploads(false),
          remote_downloads(RemoteDownloadPermission::BUDDIES),
          use_upload_slots(true),
          upload_slots(2),
          upload_bandwidth(50),
          file_limit(100),
          queue_limit(150),
          friends_no_limits(false),
          prefer_friends(false),
          fifo_queue(false),
          use_custom_ban(false),
          download_speed_limit(SpeedLimitMode::OFF),
          download_limit(1000),
          download_limit_alt(100),
          upload_speed_limit(SpeedLimitMode::OFF),
          upload_limit(1000),
          upload_limit_alt(100),
          upload_limit_by(UploadLimitScope::PER_TRANSFER) {}
};

const char* speed_limit_mode_to_string(SpeedLimitMode mode);
SpeedLimitMode speed_limit_mode_from_string(const std::string& text);

/**
 * Load settings from a JSON file. Keys missing from the file keep the
 * values already in `config`. A missing file is created with `config`.
 * @return false if the file exists but cannot be parsed
 */
bool load_transfer_config(const std::string& path, TransferConfig& config);

bool save_transfer_config(const std::string& path, const TransferConfig& config);

} // namespace peerq
