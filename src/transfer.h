#pragma once

#include "fs.h"
#include <string>
#include <map>
#include <memory>
#include <optional>
#include <cstdint>
#include <functional>

namespace peerq {

using socket_t = int;
constexpr socket_t INVALID_SOCKET_VALUE = -1;

/**
 * Transfer status vocabulary shared by downloads and uploads.
 *
 * The first group are local states. The second group are reasons a peer
 * (or our own admission control) gives when declining a transfer; they
 * travel on the wire as strings, see status_to_string().
 */
enum class TransferStatus {
    QUEUED,
    GETTING_STATUS,         // Active, waiting for the file connection
    TRANSFERRING,
    FINISHED,
    PAUSED,
    CANCELLED,
    FILTERED,
    USER_LOGGED_OFF,
    CONNECTION_CLOSED,
    CONNECTION_TIMEOUT,
    LOCAL_FILE_ERROR,
    DOWNLOAD_FOLDER_ERROR,

    BANNED,
    COMPLETE,
    FILE_NOT_SHARED,
    FILE_READ_ERROR,
    PENDING_SHUTDOWN,
    TOO_MANY_FILES,
    TOO_MANY_MEGABYTES,
    DISALLOWED_EXTENSION,
    REMOTE_QUEUED           // Peer queued the request on its side ("Queued")
};

enum class TransferDirection {
    DOWNLOAD,
    UPLOAD
};

const char* status_to_string(TransferStatus status);
const char* direction_to_string(TransferDirection direction);

/**
 * Parse a status string as written by status_to_string().
 * @return nullopt for text that names no known status
 */
std::optional<TransferStatus> status_from_string(const std::string& text);

/**
 * True for the statuses that are purely local and must never be accepted
 * as a rejection reason coming from a peer.
 */
bool is_internal_status(TransferStatus status);

/**
 * Identity of a transfer within one direction.
 */
struct TransferKey {
    std::string username;
    std::string virtual_path;

    bool operator==(const TransferKey& other) const {
        return username == other.username && virtual_path == other.virtual_path;
    }
    bool operator!=(const TransferKey& other) const { return !(*this == other); }
};

struct TransferKeyHash {
    size_t operator()(const TransferKey& key) const {
        size_t h1 = std::hash<std::string>()(key.username);
        size_t h2 = std::hash<std::string>()(key.virtual_path);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

/**
 * One file transfer record. Owned exclusively by a TransferRegistry.
 */
struct Transfer {
    std::string username;
    std::string virtual_path;
    std::string folder_path;            // Local destination (downloads) or source folder (uploads)

    uint64_t size;
    std::optional<uint64_t> current_byte_offset;
    std::optional<uint64_t> last_byte_offset;
    TransferStatus status;
    std::string status_message;         // Ban reason or unrecognised peer reason

    std::optional<uint32_t> token;
    uint32_t queue_position;
    std::optional<uint64_t> speed;      // Bytes per second
    double time_elapsed;                // Seconds
    uint64_t time_left;                 // Seconds
    double start_time;                  // Monotonic seconds
    double last_update;                 // Monotonic seconds

    bool legacy_attempt;
    bool size_changed;
    std::string modifier;               // "privileged" / "prioritized" for uploads
    std::map<uint32_t, uint32_t> file_attributes;

    std::shared_ptr<FileHandle> file_handle;
    socket_t sock;

    // Registry bookkeeping
    uint64_t queue_sequence;            // 0 when not queued
    uint64_t request_timer_id;          // 0 when no request timeout is armed

    Transfer(std::string username_, std::string virtual_path_, std::string folder_path_ = "",
             uint64_t size_ = 0)
        : username(std::move(username_)), virtual_path(std::move(virtual_path_)),
          folder_path(std::move(folder_path_)), size(size_),
          status(TransferStatus::QUEUED), queue_position(0),
          time_elapsed(0.0), time_left(0), start_time(0.0), last_update(0.0),
          legacy_attempt(false), size_changed(false),
          sock(INVALID_SOCKET_VALUE), queue_sequence(0), request_timer_id(0) {}

    TransferKey key() const { return TransferKey{username, virtual_path}; }

    // Status text shown to the user, including any custom reason
    std::string status_text() const;

    double get_completion_percentage() const {
        if (size == 0 || !current_byte_offset) return 0.0;
        return (static_cast<double>(*current_byte_offset) / size) * 100.0;
    }
};

} // namespace peerq
