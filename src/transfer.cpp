#include "transfer.h"

namespace peerq {

const char* status_to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::QUEUED:                return "Queued";
        case TransferStatus::GETTING_STATUS:        return "Getting status";
        case TransferStatus::TRANSFERRING:          return "Transferring";
        case TransferStatus::FINISHED:              return "Finished";
        case TransferStatus::PAUSED:                return "Paused";
        case TransferStatus::CANCELLED:             return "Cancelled";
        case TransferStatus::FILTERED:              return "Filtered";
        case TransferStatus::USER_LOGGED_OFF:       return "User logged off";
        case TransferStatus::CONNECTION_CLOSED:     return "Connection closed";
        case TransferStatus::CONNECTION_TIMEOUT:    return "Connection timeout";
        case TransferStatus::LOCAL_FILE_ERROR:      return "Local file error";
        case TransferStatus::DOWNLOAD_FOLDER_ERROR: return "Download folder error";
        case TransferStatus::BANNED:                return "Banned";
        case TransferStatus::COMPLETE:              return "Complete";
        case TransferStatus::FILE_NOT_SHARED:       return "File not shared.";
        case TransferStatus::FILE_READ_ERROR:       return "File read error.";
        case TransferStatus::PENDING_SHUTDOWN:      return "Pending shutdown.";
        case TransferStatus::TOO_MANY_FILES:        return "Too many files";
        case TransferStatus::TOO_MANY_MEGABYTES:    return "Too many megabytes";
        case TransferStatus::DISALLOWED_EXTENSION:  return "Disallowed extension";
        case TransferStatus::REMOTE_QUEUED:         return "Queued";
    }
    return "Unknown";
}

const char* direction_to_string(TransferDirection direction) {
    return direction == TransferDirection::DOWNLOAD ? "download" : "upload";
}

std::optional<TransferStatus> status_from_string(const std::string& text) {
    // "Queued" is ambiguous on the wire; a peer saying it means its own queue
    static const TransferStatus all[] = {
        TransferStatus::REMOTE_QUEUED, TransferStatus::GETTING_STATUS, TransferStatus::TRANSFERRING,
        TransferStatus::FINISHED, TransferStatus::PAUSED, TransferStatus::CANCELLED,
        TransferStatus::FILTERED, TransferStatus::USER_LOGGED_OFF, TransferStatus::CONNECTION_CLOSED,
        TransferStatus::CONNECTION_TIMEOUT, TransferStatus::LOCAL_FILE_ERROR,
        TransferStatus::DOWNLOAD_FOLDER_ERROR, TransferStatus::BANNED, TransferStatus::COMPLETE,
        TransferStatus::FILE_NOT_SHARED, TransferStatus::FILE_READ_ERROR,
        TransferStatus::PENDING_SHUTDOWN, TransferStatus::TOO_MANY_FILES,
        TransferStatus::TOO_MANY_MEGABYTES, TransferStatus::DISALLOWED_EXTENSION
    };

    for (TransferStatus status : all) {
        if (text == status_to_string(status)) {
            return status;
        }
    }
    return std::nullopt;
}

bool is_internal_status(TransferStatus status) {
    switch (status) {
        case TransferStatus::GETTING_STATUS:
        case TransferStatus::TRANSFERRING:
        case TransferStatus::FINISHED:
        case TransferStatus::PAUSED:
        case TransferStatus::FILTERED:
        case TransferStatus::USER_LOGGED_OFF:
        case TransferStatus::CONNECTION_CLOSED:
        case TransferStatus::CONNECTION_TIMEOUT:
        case TransferStatus::LOCAL_FILE_ERROR:
        case TransferStatus::DOWNLOAD_FOLDER_ERROR:
            return true;
        default:
            return false;
    }
}

std::string Transfer::status_text() const {
    if (status_message.empty()) {
        return status_to_string(status);
    }
    if (status == TransferStatus::BANNED) {
        return std::string(status_to_string(status)) + " (" + status_message + ")";
    }
    return status_message;
}

} // namespace peerq
