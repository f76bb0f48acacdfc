#pragma once

/**
 * @file events.h
 * @brief Event types travelling over the EventBus.
 *
 * Inbound events are produced by the network, shares and server
 * collaborators. Outbound events are produced by the transfer managers
 * for the user interface and plugins.
 *
 * Outbound events that carry a `const Transfer*` are only valid for the
 * duration of the dispatch.
 */

#include "transfer.h"
#include "messages.h"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace peerq {

enum class EventKind {
    // Inbound: file connections
    FILE_TRANSFER_INIT,
    FILE_DOWNLOAD_PROGRESS,
    FILE_UPLOAD_PROGRESS,
    FILE_CONNECTION_CLOSED,
    DOWNLOAD_FILE_ERROR,
    UPLOAD_FILE_ERROR,

    // Inbound: peer connections and messages
    PEER_CONNECTION_ERROR,
    PEER_CONNECTION_CLOSED,
    TRANSFER_REQUEST,
    TRANSFER_RESPONSE,
    QUEUE_UPLOAD,
    UPLOAD_DENIED,
    UPLOAD_FAILED,
    PLACE_IN_QUEUE_REQUEST,
    PLACE_IN_QUEUE_RESPONSE,
    FOLDER_CONTENTS_RESPONSE,

    // Inbound: server and local state
    USER_STATUS,
    USER_STATS,
    SHARES_READY,
    SERVER_LOGIN,
    SERVER_DISCONNECT,
    SET_CONNECTION_STATS,
    SCHEDULE_QUIT,
    ADD_PRIVILEGED_USER,
    REMOVE_PRIVILEGED_USER,

    // Outbound
    TRANSFER_UPDATED,
    TRANSFER_ABORTED,
    TRANSFER_CLEARED,
    TRANSFER_LIST_UPDATED,
    TRANSFER_LIMITS_UPDATED,
    TRANSFER_STARTED,
    TRANSFER_FINISHED,
    UPLOAD_QUEUED,
    DOWNLOAD_NOTIFICATION,
    UPLOAD_NOTIFICATION,
    LARGE_FOLDER_REQUESTED,
    FILE_DOWNLOADED,
    FOLDER_DOWNLOADED,
    DOWNLOAD_FOLDER_ERROR,
    QUIT_REQUESTED
};

//=============================================================================
// Inbound: file connections
//=============================================================================

struct FileTransferInitEvent {
    static constexpr EventKind kind = EventKind::FILE_TRANSFER_INIT;
    std::string username;
    uint32_t token = 0;
    socket_t sock = INVALID_SOCKET_VALUE;
    bool is_outgoing = false;
};

struct FileDownloadProgressEvent {
    static constexpr EventKind kind = EventKind::FILE_DOWNLOAD_PROGRESS;
    std::string username;
    uint32_t token = 0;
    uint64_t bytes_left = 0;
};

struct FileUploadProgressEvent {
    static constexpr EventKind kind = EventKind::FILE_UPLOAD_PROGRESS;
    std::string username;
    uint32_t token = 0;
    uint64_t offset = 0;
    uint64_t bytes_sent = 0;
};

struct FileConnectionClosedEvent {
    static constexpr EventKind kind = EventKind::FILE_CONNECTION_CLOSED;
    std::string username;
    uint32_t token = 0;
    socket_t sock = INVALID_SOCKET_VALUE;
    bool timed_out = false;
};

struct DownloadFileErrorEvent {
    static constexpr EventKind kind = EventKind::DOWNLOAD_FILE_ERROR;
    std::string username;
    uint32_t token = 0;
    std::string error;
};

struct UploadFileErrorEvent {
    static constexpr EventKind kind = EventKind::UPLOAD_FILE_ERROR;
    std::string username;
    uint32_t token = 0;
    std::string error;
};

//=============================================================================
// Inbound: peer connections and messages
//=============================================================================

/**
 * A peer connection could not be established. `msgs` are the messages
 * that were waiting to be delivered on it.
 */
struct PeerConnectionErrorEvent {
    static constexpr EventKind kind = EventKind::PEER_CONNECTION_ERROR;
    std::string username;
    std::vector<PeerMessage> msgs;
    bool is_offline = false;
    bool is_timeout = true;
};

struct PeerConnectionClosedEvent {
    static constexpr EventKind kind = EventKind::PEER_CONNECTION_CLOSED;
    std::string username;
    std::vector<PeerMessage> msgs;
};

struct TransferRequestEvent {
    static constexpr EventKind kind = EventKind::TRANSFER_REQUEST;
    std::string username;
    std::string ip_address;
    TransferRequest request;
};

struct TransferResponseEvent {
    static constexpr EventKind kind = EventKind::TRANSFER_RESPONSE;
    std::string username;
    TransferResponse response;
};

struct QueueUploadEvent {
    static constexpr EventKind kind = EventKind::QUEUE_UPLOAD;
    std::string username;
    std::string ip_address;
    QueueUpload request;
};

struct UploadDeniedEvent {
    static constexpr EventKind kind = EventKind::UPLOAD_DENIED;
    std::string username;
    UploadDenied message;
};

struct UploadFailedEvent {
    static constexpr EventKind kind = EventKind::UPLOAD_FAILED;
    std::string username;
    UploadFailed message;
};

struct PlaceInQueueRequestEvent {
    static constexpr EventKind kind = EventKind::PLACE_IN_QUEUE_REQUEST;
    std::string username;
    PlaceInQueueRequest request;
};

struct PlaceInQueueResponseEvent {
    static constexpr EventKind kind = EventKind::PLACE_IN_QUEUE_RESPONSE;
    std::string username;
    PlaceInQueueResponse response;
};

struct FolderContentsResponseEvent {
    static constexpr EventKind kind = EventKind::FOLDER_CONTENTS_RESPONSE;
    std::string username;
    uint32_t token = 0;
    FolderListing listing;
};

//=============================================================================
// Inbound: server and local state
//=============================================================================

struct UserStatusEvent {
    static constexpr EventKind kind = EventKind::USER_STATUS;
    std::string username;
    UserStatus status = UserStatus::OFFLINE;
    std::optional<bool> privileged;
};

struct UserStatsEvent {
    static constexpr EventKind kind = EventKind::USER_STATS;
    std::string username;
    uint64_t avgspeed = 0;
};

struct SharesReadyEvent {
    static constexpr EventKind kind = EventKind::SHARES_READY;
    bool successful = true;
};

struct ServerLoginEvent {
    static constexpr EventKind kind = EventKind::SERVER_LOGIN;
    bool success = false;
};

struct ServerDisconnectEvent {
    static constexpr EventKind kind = EventKind::SERVER_DISCONNECT;
};

// Current total bandwidth of the network worker, bytes per second
struct SetConnectionStatsEvent {
    static constexpr EventKind kind = EventKind::SET_CONNECTION_STATS;
    uint64_t download_bandwidth = 0;
    uint64_t upload_bandwidth = 0;
};

struct ScheduleQuitEvent {
    static constexpr EventKind kind = EventKind::SCHEDULE_QUIT;
    bool should_finish_uploads = false;
};

struct AddPrivilegedUserEvent {
    static constexpr EventKind kind = EventKind::ADD_PRIVILEGED_USER;
    std::string username;
};

struct RemovePrivilegedUserEvent {
    static constexpr EventKind kind = EventKind::REMOVE_PRIVILEGED_USER;
    std::string username;
};

//=============================================================================
// Outbound
//=============================================================================

struct TransferUpdatedEvent {
    static constexpr EventKind kind = EventKind::TRANSFER_UPDATED;
    TransferDirection direction = TransferDirection::DOWNLOAD;
    const Transfer* transfer = nullptr;
    bool update_parent = true;
};

struct TransferAbortedEvent {
    static constexpr EventKind kind = EventKind::TRANSFER_ABORTED;
    TransferDirection direction = TransferDirection::DOWNLOAD;
    const Transfer* transfer = nullptr;
    TransferStatus status = TransferStatus::CANCELLED;
    bool update_parent = true;
};

// Emitted right before the record is destroyed
struct TransferClearedEvent {
    static constexpr EventKind kind = EventKind::TRANSFER_CLEARED;
    TransferDirection direction = TransferDirection::DOWNLOAD;
    const Transfer* transfer = nullptr;
    bool update_parent = true;
};

// Many records changed at once; views should refresh everything
struct TransferListUpdatedEvent {
    static constexpr EventKind kind = EventKind::TRANSFER_LIST_UPDATED;
    TransferDirection direction = TransferDirection::DOWNLOAD;
};

struct TransferLimitsUpdatedEvent {
    static constexpr EventKind kind = EventKind::TRANSFER_LIMITS_UPDATED;
    TransferDirection direction = TransferDirection::DOWNLOAD;
};

struct TransferStartedEvent {
    static constexpr EventKind kind = EventKind::TRANSFER_STARTED;
    TransferDirection direction = TransferDirection::DOWNLOAD;
    std::string username;
    std::string virtual_path;
    std::string file_path;
};

struct TransferFinishedEvent {
    static constexpr EventKind kind = EventKind::TRANSFER_FINISHED;
    TransferDirection direction = TransferDirection::DOWNLOAD;
    std::string username;
    std::string virtual_path;
    std::string file_path;
};

struct UploadQueuedEvent {
    static constexpr EventKind kind = EventKind::UPLOAD_QUEUED;
    std::string username;
    std::string virtual_path;
    std::string real_path;
};

struct DownloadNotificationEvent {
    static constexpr EventKind kind = EventKind::DOWNLOAD_NOTIFICATION;
    bool finished = false;
};

struct UploadNotificationEvent {
    static constexpr EventKind kind = EventKind::UPLOAD_NOTIFICATION;
};

/**
 * A requested folder holds too many files to enqueue without asking.
 * Confirm with DownloadManager::download_large_folder().
 */
struct LargeFolderRequestedEvent {
    static constexpr EventKind kind = EventKind::LARGE_FOLDER_REQUESTED;
    std::string username;
    std::string folder_path;
    size_t num_files = 0;
    FolderListing listing;
};

struct FileDownloadedEvent {
    static constexpr EventKind kind = EventKind::FILE_DOWNLOADED;
    std::string username;
    std::string file_path;
};

struct FolderDownloadedEvent {
    static constexpr EventKind kind = EventKind::FOLDER_DOWNLOADED;
    std::string username;
    std::string folder_path;
};

// High priority notification; the message is the raw OS error text
struct DownloadFolderErrorEvent {
    static constexpr EventKind kind = EventKind::DOWNLOAD_FOLDER_ERROR;
    std::string error;
};

struct QuitRequestedEvent {
    static constexpr EventKind kind = EventKind::QUIT_REQUESTED;
};

} // namespace peerq
