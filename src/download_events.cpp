#include "download_manager.h"
#include "transfer_log_macros.h"
#include "path_utils.h"
#include "fs.h"
#include <algorithm>
#include <cmath>

namespace peerq {

namespace {

constexpr double DOWNLOAD_QUEUE_CHECK_INTERVAL_SECONDS = 180.0;
constexpr double RETRY_CONNECTION_DOWNLOADS_INTERVAL_SECONDS = 180.0;
constexpr double RETRY_IO_DOWNLOADS_INTERVAL_SECONDS = 900.0;

} // namespace

//=============================================================================
// Server and local state
//=============================================================================

void DownloadManager::on_server_login(const ServerLoginEvent& event) {
    if (!event.success) {
        return;
    }

    update_transfer_limits();

    // Records loaded from disk are queued again with the peers
    for (Transfer* download : registry_.transfers()) {
        if (download->status != TransferStatus::QUEUED || registry_.is_queued(*download)
                || registry_.is_active(*download) || registry_.is_failed(*download)) {
            continue;
        }

        if (enqueue_transfer(*download)) {
            registry_.update(*download);
        }
    }

    requested_folders_.clear();

    // Request queue positions of queued downloads every 3 minutes
    download_queue_timer_id_ = scheduler_.schedule(
        DOWNLOAD_QUEUE_CHECK_INTERVAL_SECONDS, [this]() { check_download_queue(); }, true);

    // Retry downloads that failed due to connection issues every 3 minutes
    retry_connection_downloads_timer_id_ = scheduler_.schedule(
        RETRY_CONNECTION_DOWNLOADS_INTERVAL_SECONDS, [this]() { retry_failed_connection_downloads(); }, true);

    // Retry downloads that failed due to file I/O errors every 15 minutes
    retry_io_downloads_timer_id_ = scheduler_.schedule(
        RETRY_IO_DOWNLOADS_INTERVAL_SECONDS, [this]() { retry_failed_io_downloads(); }, true);
}

void DownloadManager::on_server_disconnect(const ServerDisconnectEvent&) {
    for (TimerId* timer_id : {&download_queue_timer_id_, &retry_connection_downloads_timer_id_,
                              &retry_io_downloads_timer_id_}) {
        scheduler_.cancel(*timer_id);
        *timer_id = 0;
    }

    std::vector<Transfer*> downloads = registry_.queued_transfers();
    std::vector<Transfer*> active = registry_.active_transfers();
    downloads.insert(downloads.end(), active.begin(), active.end());

    for (Transfer* download : downloads) {
        registry_.abort(*download, TransferStatus::USER_LOGGED_OFF, "", false);
    }

    registry_.clear_user_queue_limits();
    save_transfers();

    TransferListUpdatedEvent list_event;
    list_event.direction = TransferDirection::DOWNLOAD;
    events_.emit(list_event);

    requested_folders_.clear();
}

void DownloadManager::on_shares_ready(const SharesReadyEvent&) {
    std::vector<std::pair<TransferKey, QueueUpload>> pending;
    pending.swap(pending_queue_messages_);

    for (const auto& entry : pending) {
        LOG_DOWNLOADS_DEBUG("Sending deferred message to " << entry.first.username << ": "
                            << message_to_json(PeerMessage(entry.second)).dump());
        network_.send_to_peer(entry.first.username, entry.second);
    }
}

void DownloadManager::on_set_connection_stats(const SetConnectionStatsEvent& event) {
    total_bandwidth_ = event.download_bandwidth;
}

void DownloadManager::on_user_status(const UserStatusEvent& event) {
    const std::string& username = event.username;

    if (event.status == UserStatus::OFFLINE) {
        std::vector<Transfer*> downloads = registry_.queued_for(username);
        std::vector<Transfer*> failed = registry_.failed_for(username);
        downloads.insert(downloads.end(), failed.begin(), failed.end());

        for (Transfer* download : registry_.active_for(username)) {
            // Running file connections finish on their own
            if (download->status != TransferStatus::TRANSFERRING) {
                downloads.push_back(download);
            }
        }

        for (Transfer* download : downloads) {
            registry_.abort(*download, TransferStatus::USER_LOGGED_OFF, "", false);
        }
    } else {
        for (Transfer* download : registry_.failed_for(username)) {
            registry_.unfail(*download);
            if (enqueue_transfer(*download)) {
                registry_.update(*download, false);
            }
        }
    }

    TransferListUpdatedEvent list_event;
    list_event.direction = TransferDirection::DOWNLOAD;
    events_.emit(list_event);
}

//=============================================================================
// Peer connections
//=============================================================================

void DownloadManager::on_peer_connection_error(const PeerConnectionErrorEvent& event) {
    for (const auto& message : event.msgs) {
        if (const auto* queue_upload = std::get_if<QueueUpload>(&message)) {
            cant_connect_queue_file(event.username, queue_upload->file, event.is_offline, event.is_timeout);
        }
    }
}

void DownloadManager::on_peer_connection_closed(const PeerConnectionClosedEvent& event) {
    for (const auto& message : event.msgs) {
        if (const auto* queue_upload = std::get_if<QueueUpload>(&message)) {
            cant_connect_queue_file(event.username, queue_upload->file, false, false);
        }
    }
}

void DownloadManager::cant_connect_queue_file(const std::string& username, const std::string& virtual_path,
                                              bool is_offline, bool is_timeout) {
    Transfer* download = registry_.find_queued(username, virtual_path);
    if (!download) {
        return;
    }

    LOG_TRANSFERS_INFO("Download attempt for file " << virtual_path << " from user " << username
                       << " failed because of connection issue");

    TransferStatus status = TransferStatus::CONNECTION_CLOSED;
    if (is_offline) {
        status = TransferStatus::USER_LOGGED_OFF;
    } else if (is_timeout) {
        status = TransferStatus::CONNECTION_TIMEOUT;
    }

    registry_.abort(*download, status);
}

//=============================================================================
// Peer messages
//=============================================================================

void DownloadManager::on_folder_contents_response(const FolderContentsResponseEvent& event, bool check_num_files) {
    const std::string& username = event.username;

    auto user_it = requested_folders_.find(username);
    if (user_it == requested_folders_.end()) {
        return;
    }

    for (const auto& folder : event.listing) {
        const std::string& folder_path = folder.first;

        if (user_it->second.count(folder_path) == 0) {
            continue;
        }

        LOG_TRANSFERS_INFO("Received response for folder content request from user " << username);

        std::vector<FolderFileEntry> files = folder.second;
        size_t num_files = files.size();

        if (check_num_files && num_files > 100) {
            LargeFolderRequestedEvent large_event;
            large_event.username = username;
            large_event.folder_path = folder_path;
            large_event.num_files = num_files;
            large_event.listing = event.listing;
            events_.emit(large_event);
            return;
        }

        std::string destination_folder_path = get_folder_destination(username, folder_path);
        user_it->second.erase(folder_path);

        std::sort(files.begin(), files.end(), [](const FolderFileEntry& a, const FolderFileEntry& b) {
            return locale_less(a.basename, b.basename);
        });

        LOG_TRANSFERS_INFO("Attempting to download files in folder " << folder_path << " for user " << username
                           << ". Destination path: " << destination_folder_path);

        std::string parent_path = folder_path;
        while (!parent_path.empty() && parent_path.back() == '\\') {
            parent_path.pop_back();
        }

        for (const auto& file : files) {
            enqueue_download(username, parent_path + "\\" + file.basename, destination_folder_path, file.size,
                             file.file_attributes);
        }
    }
}

void DownloadManager::on_transfer_request(const TransferRequestEvent& event) {
    if (event.request.direction != WireDirection::UPLOAD) {
        return;
    }

    TransferResponse response = transfer_request_downloads(event);

    LOG_TRANSFERS_INFO("Responding to download request with token " << response.token << " for file "
                       << event.request.file << " from user: " << event.username << ", allowed: "
                       << (response.allowed ? "true" : "false") << ", reason: " << response.reason);

    network_.send_to_peer(event.username, response);
}

TransferResponse DownloadManager::transfer_request_downloads(const TransferRequestEvent& event) {
    const std::string& username = event.username;
    const std::string& virtual_path = event.request.file;
    uint64_t size = event.request.filesize;
    uint32_t token = event.request.token;

    LOG_TRANSFERS_INFO("Received download request with token " << token << " for file " << virtual_path
                       << " from user " << username);

    TransferResponse response;
    response.token = token;

    Transfer* download = registry_.find_queued(username, virtual_path);
    if (!download) {
        download = registry_.find_failed(username, virtual_path);
    }

    if (download) {
        // The peer is ready to send a file we asked for. Some clients send a
        // size of 0 for large files; keep the size we already know then.
        registry_.unfail(*download);
        registry_.dequeue(*download);

        if (size > 0) {
            if (download->size != size) {
                // The remote file changed since we queued it
                download->size_changed = true;
            }
            download->size = size;
        }

        registry_.activate(*download, token);
        registry_.update(*download);

        response.allowed = true;
        return response;
    }

    download = registry_.find(username, virtual_path);
    response.reason = status_to_string(TransferStatus::CANCELLED);

    if (download) {
        if (download->status == TransferStatus::FINISHED) {
            response.reason = status_to_string(TransferStatus::COMPLETE);
        }
    } else if (can_upload(username)) {
        if (get_complete_download_file_path(username, virtual_path, size)) {
            response.reason = status_to_string(TransferStatus::COMPLETE);
        } else {
            // Not in our queue, so the peer is pushing the file to us
            std::string folder_path = combine_paths(
                combine_paths(normalize_path(config_.upload_folder), username),
                virtual_path_parent_name(virtual_path));

            Transfer* transfer = registry_.append(
                std::make_unique<Transfer>(username, virtual_path, folder_path, size));

            if (transfer) {
                registry_.activate(*transfer, token);
                registry_.update(*transfer);

                response.reason.clear();
                response.allowed = true;
                return response;
            }
        }
    }

    LOG_TRANSFERS_INFO("Denied file request: user " << username << ", file " << virtual_path
                       << ", reason " << response.reason);
    return response;
}

void DownloadManager::on_download_file_error(const DownloadFileErrorEvent& event) {
    Transfer* download = registry_.find_active(event.username, event.token);
    if (!download) {
        return;
    }

    LOG_DOWNLOADS_ERROR("Download I/O error: " << event.error);
    registry_.abort(*download, TransferStatus::LOCAL_FILE_ERROR);
}

void DownloadManager::on_file_transfer_init(const FileTransferInitEvent& event) {
    if (event.is_outgoing) {
        // Our own upload init, handled by the upload side
        return;
    }

    const std::string& username = event.username;
    uint32_t token = event.token;

    Transfer* download = registry_.find_active(username, token);
    if (!download || download->sock != INVALID_SOCKET_VALUE) {
        return;
    }

    const std::string virtual_path = download->virtual_path;
    std::string incomplete_folder_path = normalize_path(config_.incomplete_folder);
    download->sock = event.sock;
    bool need_update = true;

    LOG_TRANSFERS_INFO("Received file download init with token " << token << " for file " << virtual_path
                       << " from user " << username);

    std::string error;
    std::string incomplete_file_path;
    std::shared_ptr<FileHandle> file_handle;
    int64_t offset = -1;

    if (create_directories(incomplete_folder_path, &error)) {
        incomplete_file_path = get_incomplete_download_file_path(username, virtual_path);
        file_handle = FileHandle::open(incomplete_file_path, "ab+", &error);
    }

    if (file_handle) {
        std::string lock_error;
        if (!file_handle->try_lock_exclusive(&lock_error)) {
            LOG_DOWNLOADS_WARN("Can't get an exclusive lock on file - I/O error: " << lock_error);
        }

        // A different size than requested means the remote file changed;
        // stale partial data would corrupt it
        if (!download->size_changed || file_handle->truncate(&error)) {
            offset = file_handle->seek_end();
            if (offset < 0) {
                error = "Cannot seek to the end of " + incomplete_file_path;
            }
        }
    }

    if (offset < 0) {
        LOG_DOWNLOADS_ERROR("Cannot save file in " << incomplete_folder_path << ": " << error);
        if (file_handle) {
            file_handle->close();
        }
        registry_.abort(*download, TransferStatus::DOWNLOAD_FOLDER_ERROR);

        DownloadFolderErrorEvent error_event;
        error_event.error = error;
        events_.emit(error_event);
        need_update = false;
    } else {
        download->file_handle = file_handle;
        download->last_byte_offset = static_cast<uint64_t>(offset);
        download->last_update = scheduler_.now();
        download->start_time = download->last_update - download->time_elapsed;

        registry_.record_started();

        TransferStartedEvent started_event;
        started_event.direction = TransferDirection::DOWNLOAD;
        started_event.username = username;
        started_event.virtual_path = virtual_path;
        started_event.file_path = incomplete_file_path;
        events_.emit(started_event);

        LOG_DOWNLOADS_INFO("Download started: user " << username << ", file " << incomplete_file_path);

        if (download->size > static_cast<uint64_t>(offset)) {
            download->status = TransferStatus::TRANSFERRING;

            DownloadFile command;
            command.sock = event.sock;
            command.token = token;
            command.file = file_handle;
            command.leftbytes = download->size - static_cast<uint64_t>(offset);
            network_.send_to_network_worker(command);

            FileOffset file_offset;
            file_offset.sock = event.sock;
            file_offset.offset = static_cast<uint64_t>(offset);
            network_.send_to_peer(username, file_offset);
        } else {
            registry_.finish(*download);
            need_update = false;
        }
    }

    DownloadNotificationEvent notification;
    notification.finished = false;
    events_.emit(notification);

    if (need_update) {
        registry_.update(*download);
    }
}

void DownloadManager::on_upload_denied(const UploadDeniedEvent& event) {
    const std::string& username = event.username;
    const std::string& virtual_path = event.message.file;

    Transfer* download = registry_.find_queued(username, virtual_path);
    if (!download) {
        return;
    }

    std::string reason = event.message.reason;
    std::optional<TransferStatus> status = status_from_string(reason);

    if (status && is_internal_status(*status)) {
        // Local statuses are not accepted from peers
        status = TransferStatus::CANCELLED;
        reason = status_to_string(TransferStatus::CANCELLED);
    }

    if (status == TransferStatus::FILE_NOT_SHARED && !download->legacy_attempt) {
        // The peer may run an old client without Unicode support; ask once
        // more with the file name encoded as latin-1
        LOG_TRANSFERS_INFO("User " << username << " responded with reason '" << reason
                           << "' for download request " << virtual_path
                           << ". Attempting to request file as latin-1.");

        registry_.abort(*download);
        download->legacy_attempt = true;
        if (enqueue_transfer(*download)) {
            registry_.update(*download);
        }
        return;
    }

    if (status == TransferStatus::TOO_MANY_FILES || status == TransferStatus::TOO_MANY_MEGABYTES
            || reason.compare(0, 13, "User limit of") == 0) {
        // Shown as queued and resumed once our queue with the user drains
        status = TransferStatus::REMOTE_QUEUED;
        size_t num_queued = registry_.queued_count(username);
        registry_.set_user_queue_limit(username, std::max<size_t>(5, num_queued > 0 ? num_queued - 1 : 0));
    }

    if (!status) {
        status = TransferStatus::CANCELLED;
        download->status_message = reason;
    }

    registry_.abort(*download, *status);
    registry_.update(*download);

    LOG_TRANSFERS_INFO("Download request denied by user " << username << " for file " << virtual_path
                       << ". Reason: " << event.message.reason);
}

void DownloadManager::on_upload_failed(const UploadFailedEvent& event) {
    const std::string& username = event.username;
    const std::string& virtual_path = event.message.file;

    Transfer* download = registry_.find(username, virtual_path);
    if (!download || !download->token || registry_.find_active(username, *download->token) != download) {
        return;
    }

    if (!download->legacy_attempt) {
        // Request the file name encoded as latin-1 once
        registry_.abort(*download);
        download->legacy_attempt = true;
        if (enqueue_transfer(*download)) {
            registry_.update(*download);
        }
        return;
    }

    // Already failed once, give up
    registry_.abort(*download, TransferStatus::CONNECTION_CLOSED);

    LOG_TRANSFERS_INFO("Upload attempt by user " << username << " for file " << virtual_path
                       << " failed. Reason: " << status_to_string(download->status));
}

void DownloadManager::on_file_download_progress(const FileDownloadProgressEvent& event) {
    Transfer* download = registry_.find_active(event.username, event.token);
    if (!download) {
        return;
    }

    registry_.cancel_request_timer(*download);

    double current_time = scheduler_.now();
    uint64_t size = download->size;
    uint64_t current_byte_offset = event.bytes_left >= size ? 0 : size - event.bytes_left;

    download->status = TransferStatus::TRANSFERRING;
    download->time_elapsed = current_time - download->start_time;
    download->current_byte_offset = current_byte_offset;

    int64_t byte_difference = static_cast<int64_t>(current_byte_offset)
        - static_cast<int64_t>(download->last_byte_offset.value_or(0));

    if (byte_difference > 0) {
        registry_.record_transferred(static_cast<uint64_t>(byte_difference));

        if (size > current_byte_offset || !download->speed) {
            double elapsed = std::max(0.1, current_time - download->last_update);
            uint64_t speed = static_cast<uint64_t>(std::floor(byte_difference / elapsed));
            download->speed = speed;
            download->time_left = speed > 0 ? (size - current_byte_offset) / speed : 0;
        } else {
            download->time_left = 0;
        }
    }

    download->last_byte_offset = current_byte_offset;
    download->last_update = current_time;

    registry_.update(*download);
}

void DownloadManager::on_file_connection_closed(const FileConnectionClosedEvent& event) {
    Transfer* download = registry_.find_active(event.username, event.token);
    if (!download || download->sock != event.sock) {
        return;
    }

    if (download->current_byte_offset && *download->current_byte_offset >= download->size) {
        registry_.finish(*download);
        return;
    }

    std::optional<UserStatus> user_status = users_.user_status(download->username);
    TransferStatus status = user_status && *user_status == UserStatus::OFFLINE
        ? TransferStatus::USER_LOGGED_OFF : TransferStatus::CANCELLED;

    registry_.abort(*download, status);
}

void DownloadManager::on_place_in_queue_response(const PlaceInQueueResponseEvent& event) {
    Transfer* download = registry_.find_queued(event.username, event.response.filename);
    if (!download) {
        return;
    }

    download->queue_position = event.response.place;
    registry_.update(*download, false);
}

} // namespace peerq
