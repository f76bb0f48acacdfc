#pragma once

/**
 * @file messages.h
 * @brief Protocol messages exchanged with peers, the server and the
 *        network worker.
 *
 * These are abstract message shapes; encoding them on the wire is the
 * transport's job. Every message converts to JSON for the transfer log.
 */

#include "transfer.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <variant>
#include <cstdint>

namespace peerq {

//=============================================================================
// Peer messages
//=============================================================================

/** Ask a peer to queue one of its files for us. */
struct QueueUpload {
    std::string file;
    bool legacy_client = false;     // Encode the file name as latin-1
};

enum class WireDirection : uint32_t {
    DOWNLOAD = 0,   // Requester wants to download from the receiver
    UPLOAD = 1      // Requester is ready to upload to the receiver
};

struct TransferRequest {
    WireDirection direction = WireDirection::UPLOAD;
    uint32_t token = 0;
    std::string file;
    uint64_t filesize = 0;
};

struct TransferResponse {
    bool allowed = false;
    uint32_t token = 0;
    std::string reason;             // Empty when allowed
    uint64_t filesize = 0;
};

struct UploadDenied {
    std::string file;
    std::string reason;
};

struct UploadFailed {
    std::string file;
};

struct PlaceInQueueRequest {
    std::string file;
    bool legacy_client = false;
};

struct PlaceInQueueResponse {
    std::string filename;
    uint32_t place = 0;
};

struct FolderContentsRequest {
    std::string directory;
    uint32_t token = 0;
};

struct FileTransferInit {
    uint32_t token = 0;
    bool is_outgoing = false;
};

struct FileOffset {
    socket_t sock = INVALID_SOCKET_VALUE;
    uint64_t offset = 0;
};

using PeerMessage = std::variant<
    QueueUpload, TransferRequest, TransferResponse, UploadDenied, UploadFailed,
    PlaceInQueueRequest, PlaceInQueueResponse, FolderContentsRequest,
    FileTransferInit, FileOffset>;

/**
 * One file of a folder listing as returned by a peer.
 */
struct FolderFileEntry {
    uint32_t code = 1;
    std::string basename;
    uint64_t size = 0;
    std::string extension;
    std::map<uint32_t, uint32_t> file_attributes;
};

// Folder virtual path -> its files
using FolderListing = std::map<std::string, std::vector<FolderFileEntry>>;

//=============================================================================
// Network worker commands
//=============================================================================

struct CloseConnection {
    socket_t sock = INVALID_SOCKET_VALUE;
};

struct DownloadFile {
    socket_t sock = INVALID_SOCKET_VALUE;
    uint32_t token = 0;
    std::shared_ptr<FileHandle> file;
    uint64_t leftbytes = 0;
};

struct UploadFile {
    socket_t sock = INVALID_SOCKET_VALUE;
    uint32_t token = 0;
    std::shared_ptr<FileHandle> file;
    uint64_t size = 0;
};

struct SetDownloadLimit {
    uint64_t limit = 0;             // KiB/s, 0 = unlimited
};

enum class UploadLimitScope {
    PER_TRANSFER,
    TOTAL
};

struct SetUploadLimit {
    uint64_t limit = 0;             // KiB/s, 0 = unlimited
    UploadLimitScope limit_by = UploadLimitScope::PER_TRANSFER;
};

using NetworkCommand = std::variant<
    CloseConnection, DownloadFile, UploadFile, SetDownloadLimit, SetUploadLimit>;

//=============================================================================
// Server messages
//=============================================================================

enum class UserStatus {
    OFFLINE = 0,
    AWAY = 1,
    ONLINE = 2
};

struct SendUploadSpeed {
    uint64_t speed = 0;
};

using ServerMessage = std::variant<SendUploadSpeed>;

//=============================================================================
// Helpers
//=============================================================================

/** Next request token; tokens stay within 31 bits. */
uint32_t increment_token(uint32_t token);

/** Name of a message type, e.g. "QueueUpload". */
std::string message_name(const PeerMessage& message);
std::string message_name(const NetworkCommand& command);

/** JSON rendering of a message for the transfer log. */
nlohmann::json message_to_json(const PeerMessage& message);
nlohmann::json message_to_json(const NetworkCommand& command);

} // namespace peerq
