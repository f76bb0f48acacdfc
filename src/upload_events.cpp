#include "upload_manager.h"
#include "transfer_log_macros.h"
#include "fs.h"
#include <algorithm>
#include <cmath>

namespace peerq {

namespace {

constexpr double UPLOAD_QUEUE_CHECK_INTERVAL_SECONDS = 10.0;
constexpr double RETRY_FAILED_UPLOADS_INTERVAL_SECONDS = 180.0;

} // namespace

//=============================================================================
// Server and local state
//=============================================================================

void UploadManager::on_server_login(const ServerLoginEvent& event) {
    if (!event.success) {
        return;
    }

    update_transfer_limits();

    // Check if queued uploads can be started every 10 seconds
    upload_queue_timer_id_ = scheduler_.schedule(
        UPLOAD_QUEUE_CHECK_INTERVAL_SECONDS, [this]() { check_upload_queue(); }, true);

    // Re-queue timed out uploads every 3 minutes
    retry_failed_uploads_timer_id_ = scheduler_.schedule(
        RETRY_FAILED_UPLOADS_INTERVAL_SECONDS, [this]() { retry_failed_uploads(); }, true);
}

void UploadManager::on_server_disconnect(const ServerDisconnectEvent&) {
    scheduler_.cancel(upload_queue_timer_id_);
    scheduler_.cancel(retry_failed_uploads_timer_id_);
    upload_queue_timer_id_ = 0;
    retry_failed_uploads_timer_id_ = 0;

    std::vector<Transfer*> uploads = registry_.queued_transfers();
    std::vector<Transfer*> active = registry_.active_transfers();
    uploads.insert(uploads.end(), active.begin(), active.end());

    for (Transfer* upload : uploads) {
        registry_.abort(*upload, TransferStatus::USER_LOGGED_OFF, "", false);
    }

    save_transfers();

    TransferListUpdatedEvent list_event;
    list_event.direction = TransferDirection::UPLOAD;
    events_.emit(list_event);

    privileged_users_.clear();
    pending_network_msgs_.clear();
    user_update_counters_.clear();
    user_update_counter_ = 0;

    // Quit in case we were waiting for uploads to finish
    check_upload_queue();
}

void UploadManager::on_schedule_quit(const ScheduleQuitEvent& event) {
    if (!event.should_finish_uploads) {
        return;
    }

    pending_shutdown_ = true;
    check_upload_queue();
}

void UploadManager::on_shares_ready(const SharesReadyEvent&) {
    // Queue requests that arrived during the rescan are handled as if they
    // arrived now
    std::vector<PendingNetworkMessage> pending;
    pending.swap(pending_network_msgs_);

    for (const auto& message : pending) {
        std::visit([this](const auto& event) { events_.emit(event); }, message);
    }
}

void UploadManager::on_user_status(const UserStatusEvent& event) {
    const std::string& username = event.username;
    bool is_user_offline = event.status == UserStatus::OFFLINE;
    bool update = false;

    if (event.privileged) {
        if (*event.privileged) {
            AddPrivilegedUserEvent privileged_event;
            privileged_event.username = username;
            events_.emit(privileged_event);
        } else {
            RemovePrivilegedUserEvent privileged_event;
            privileged_event.username = username;
            events_.emit(privileged_event);
        }
    }

    if (is_user_offline) {
        for (Transfer* upload : registry_.active_for(username)) {
            if (upload->status == TransferStatus::TRANSFERRING) {
                continue;
            }

            if (!registry_.auto_clear(*upload)) {
                registry_.abort(*upload, TransferStatus::USER_LOGGED_OFF);
            }
            update = true;
        }
    }

    for (Transfer* upload : registry_.failed_for(username)) {
        if (!registry_.auto_clear(*upload)) {
            registry_.abort(*upload, is_user_offline ? TransferStatus::USER_LOGGED_OFF : TransferStatus::CANCELLED);
        }
        update = true;
    }

    if (update) {
        TransferListUpdatedEvent list_event;
        list_event.direction = TransferDirection::UPLOAD;
        events_.emit(list_event);
    }
}

void UploadManager::on_user_stats(const UserStatsEvent& event) {
    if (event.username == users_.login_username()) {
        upload_speed_ = event.avgspeed;
    }
}

void UploadManager::on_set_connection_stats(const SetConnectionStatsEvent& event) {
    total_bandwidth_ = event.upload_bandwidth;
}

//=============================================================================
// Peer connections
//=============================================================================

void UploadManager::on_peer_connection_error(const PeerConnectionErrorEvent& event) {
    for (const auto& message : event.msgs) {
        if (const auto* request = std::get_if<TransferRequest>(&message)) {
            cant_connect_upload(event.username, request->token, event.is_offline, event.is_timeout);
        } else if (const auto* init = std::get_if<FileTransferInit>(&message)) {
            cant_connect_upload(event.username, init->token, event.is_offline, event.is_timeout);
        }
    }
}

void UploadManager::on_peer_connection_closed(const PeerConnectionClosedEvent& event) {
    for (const auto& message : event.msgs) {
        if (const auto* request = std::get_if<TransferRequest>(&message)) {
            cant_connect_upload(event.username, request->token, false, false);
        } else if (const auto* init = std::get_if<FileTransferInit>(&message)) {
            cant_connect_upload(event.username, init->token, false, false);
        }
    }
}

void UploadManager::cant_connect_upload(const std::string& username, uint32_t token, bool is_offline,
                                        bool is_timeout) {
    Transfer* upload = registry_.find_active(username, token);
    if (!upload) {
        return;
    }

    TransferStatus status = TransferStatus::CONNECTION_CLOSED;
    if (is_offline) {
        status = TransferStatus::USER_LOGGED_OFF;
    } else if (is_timeout) {
        status = TransferStatus::CONNECTION_TIMEOUT;
    }

    LOG_TRANSFERS_INFO("Upload attempt for file " << upload->virtual_path << " with token " << token
                       << " to user " << username << " failed with status " << status_to_string(status));

    bool upload_cleared = is_offline && registry_.auto_clear(*upload);

    if (!upload_cleared) {
        registry_.abort(*upload, status);
    }

    check_upload_queue();
}

//=============================================================================
// Peer messages
//=============================================================================

void UploadManager::on_queue_upload(const QueueUploadEvent& event) {
    const std::string& username = event.username;
    const std::string& virtual_path = event.request.file;
    std::string real_path = shares_.virtual_to_real_path(virtual_path);

    UploadAdmission admission = check_queue_upload_allowed(username, event.ip_address, virtual_path, real_path,
                                                           PendingNetworkMessage(event));

    LOG_TRANSFERS_INFO("Upload request for file " << virtual_path << " from user: " << username
                       << ", allowed: " << (admission.allowed ? "true" : "false")
                       << ", reason: " << admission.reason);

    if (!admission.allowed) {
        if (!admission.reason.empty() && admission.reason != status_to_string(TransferStatus::REMOTE_QUEUED)) {
            UploadDenied message;
            message.file = virtual_path;
            message.reason = admission.reason;
            network_.send_to_peer(username, message);
        }
        return;
    }

    Transfer* transfer = registry_.append(std::make_unique<Transfer>(
        username, virtual_path, get_parent_directory(real_path), get_file_size(real_path)));
    if (!transfer) {
        return;
    }

    registry_.enqueue(*transfer);
    registry_.update(*transfer);

    UploadQueuedEvent queued_event;
    queued_event.username = username;
    queued_event.virtual_path = virtual_path;
    queued_event.real_path = real_path;
    events_.emit(queued_event);

    check_upload_queue();
}

void UploadManager::on_transfer_request(const TransferRequestEvent& event) {
    if (event.request.direction != WireDirection::DOWNLOAD) {
        return;
    }

    std::optional<TransferResponse> response = transfer_request_uploads(event);
    if (!response) {
        return;
    }

    LOG_TRANSFERS_INFO("Responding to legacy upload request " << response->token << " for file "
                       << event.request.file << " from user " << event.username << ", allowed: "
                       << (response->allowed ? "true" : "false") << ", reason: " << response->reason);

    network_.send_to_peer(event.username, *response);
}

std::optional<TransferResponse> UploadManager::transfer_request_uploads(const TransferRequestEvent& event) {
    const std::string& username = event.username;
    const std::string& virtual_path = event.request.file;
    uint32_t token = event.request.token;

    LOG_TRANSFERS_INFO("Received legacy upload request " << token << " for file " << virtual_path
                       << " from user " << username);

    TransferResponse response;
    response.token = token;

    std::string real_path = shares_.virtual_to_real_path(virtual_path);
    UploadAdmission admission = check_queue_upload_allowed(username, event.ip_address, virtual_path, real_path,
                                                           PendingNetworkMessage(event));

    if (!admission.allowed) {
        if (admission.reason.empty()) {
            // Deferred until the rescan is done
            return std::nullopt;
        }

        response.reason = admission.reason;
        return response;
    }

    UploadQueuedEvent queued_event;
    queued_event.username = username;
    queued_event.virtual_path = virtual_path;
    queued_event.real_path = real_path;
    events_.emit(queued_event);

    uint64_t size = get_file_size(real_path);

    if (!is_new_upload_accepted() || registry_.has_active(username)) {
        Transfer* transfer = registry_.append(std::make_unique<Transfer>(
            username, virtual_path, get_parent_directory(real_path), size));

        if (transfer) {
            registry_.enqueue(*transfer);
            registry_.update(*transfer);
        }

        response.reason = status_to_string(TransferStatus::REMOTE_QUEUED);
        return response;
    }

    // All checks passed, start the upload right away
    Transfer* transfer = registry_.append(std::make_unique<Transfer>(
        username, virtual_path, get_parent_directory(real_path), size));
    if (!transfer) {
        return std::nullopt;
    }

    registry_.activate(*transfer, token);
    registry_.update(*transfer);

    response.allowed = true;
    response.filesize = size;
    return response;
}

void UploadManager::on_transfer_response(const TransferResponseEvent& event) {
    const std::string& username = event.username;
    const TransferResponse& response = event.response;
    uint32_t token = response.token;

    LOG_TRANSFERS_INFO("Received response for upload with token: " << token << ", allowed: "
                       << (response.allowed ? "true" : "false") << ", reason: " << response.reason
                       << ", file size: " << response.filesize);

    Transfer* upload = registry_.find_active(username, token);
    if (!upload) {
        LOG_TRANSFERS_INFO("Received unknown upload response with token " << token << " from user " << username);
        return;
    }

    if (upload->sock != INVALID_SOCKET_VALUE) {
        LOG_TRANSFERS_INFO("Upload with token " << token << " already has an existing file connection");
        return;
    }

    if (!response.allowed) {
        std::optional<TransferStatus> status = status_from_string(response.reason);

        if (!status) {
            status = TransferStatus::CANCELLED;
            upload->status_message = response.reason;
        } else if (is_internal_status(*status) || *status == TransferStatus::DISALLOWED_EXTENSION) {
            // Local statuses are not accepted from peers
            status = TransferStatus::CANCELLED;
        }

        registry_.abort(*upload, *status);

        if (*status == TransferStatus::COMPLETE) {
            // The peer already has the complete file
            registry_.finish(*upload);
        } else if (*status == TransferStatus::CANCELLED) {
            registry_.auto_clear(*upload);
        }

        check_upload_queue();
        return;
    }

    FileTransferInit init;
    init.token = token;
    init.is_outgoing = true;
    network_.send_to_peer(username, init);

    check_upload_queue();
}

void UploadManager::on_upload_file_error(const UploadFileErrorEvent& event) {
    Transfer* upload = registry_.find_active(event.username, event.token);
    if (!upload) {
        return;
    }

    registry_.abort(*upload, TransferStatus::LOCAL_FILE_ERROR);

    LOG_UPLOADS_ERROR("Upload I/O error: " << event.error);
    check_upload_queue();
}

void UploadManager::on_file_transfer_init(const FileTransferInitEvent& event) {
    const std::string& username = event.username;
    uint32_t token = event.token;

    Transfer* upload = registry_.find_active(username, token);
    if (!upload || upload->sock != INVALID_SOCKET_VALUE) {
        return;
    }

    const std::string virtual_path = upload->virtual_path;
    upload->sock = event.sock;
    bool need_update = true;

    LOG_TRANSFERS_INFO("Initializing upload with token " << token << " for file " << virtual_path
                       << " to user " << username);

    std::string real_path = shares_.virtual_to_real_path(virtual_path);

    if (!shares_.file_is_shared(username, virtual_path, real_path)) {
        registry_.abort(*upload, TransferStatus::FILE_NOT_SHARED);
        check_upload_queue();
        return;
    }

    std::string error;
    std::shared_ptr<FileHandle> file_handle = FileHandle::open(real_path, "rb", &error);

    if (!file_handle) {
        LOG_UPLOADS_ERROR("Upload I/O error: " << error);
        registry_.abort(*upload, TransferStatus::LOCAL_FILE_ERROR);
        check_upload_queue();
    } else {
        upload->file_handle = file_handle;
        upload->last_update = scheduler_.now();
        upload->start_time = upload->last_update - upload->time_elapsed;

        registry_.record_started();

        TransferStartedEvent started_event;
        started_event.direction = TransferDirection::UPLOAD;
        started_event.username = username;
        started_event.virtual_path = virtual_path;
        started_event.file_path = real_path;
        events_.emit(started_event);

        LOG_UPLOADS_INFO("Upload started: user " << username << ", IP address " << users_.user_address(username)
                         << ", file " << virtual_path);

        if (upload->size > 0) {
            upload->status = TransferStatus::TRANSFERRING;

            UploadFile command;
            command.sock = event.sock;
            command.token = token;
            command.file = file_handle;
            command.size = upload->size;
            network_.send_to_network_worker(command);
        } else {
            registry_.finish(*upload);
            need_update = false;
        }
    }

    events_.emit(UploadNotificationEvent());

    // The record may be gone after an abort with auto-clear
    if (need_update && registry_.contains(upload)) {
        registry_.update(*upload);
    }
}

void UploadManager::on_file_upload_progress(const FileUploadProgressEvent& event) {
    Transfer* upload = registry_.find_active(event.username, event.token);
    if (!upload) {
        return;
    }

    registry_.cancel_request_timer(*upload);

    double current_time = scheduler_.now();
    uint64_t size = upload->size;

    if (!upload->last_byte_offset || *upload->last_byte_offset == 0) {
        upload->last_byte_offset = event.offset;
    }

    uint64_t current_byte_offset = event.offset + event.bytes_sent;

    upload->status = TransferStatus::TRANSFERRING;
    upload->time_elapsed = current_time - upload->start_time;
    upload->current_byte_offset = current_byte_offset;

    int64_t byte_difference = static_cast<int64_t>(current_byte_offset)
        - static_cast<int64_t>(*upload->last_byte_offset);

    if (byte_difference > 0) {
        registry_.record_transferred(static_cast<uint64_t>(byte_difference));

        if (size > current_byte_offset || !upload->speed) {
            double elapsed = std::max(0.1, current_time - upload->last_update);
            uint64_t speed = static_cast<uint64_t>(std::floor(byte_difference / elapsed));
            upload->speed = speed;
            upload->time_left = speed > 0 && size > current_byte_offset ? (size - current_byte_offset) / speed : 0;
        } else {
            upload->time_left = 0;
        }
    }

    upload->last_byte_offset = current_byte_offset;
    upload->last_update = current_time;

    registry_.update(*upload);
}

void UploadManager::on_file_connection_closed(const FileConnectionClosedEvent& event) {
    Transfer* upload = registry_.find_active(event.username, event.token);
    if (!upload || upload->sock != event.sock) {
        return;
    }

    if (!event.timed_out && upload->current_byte_offset && *upload->current_byte_offset >= upload->size) {
        // The downloading peer may still be writing; our side is done
        if (upload->speed) {
            LOG_TRANSFERS_INFO("Sending upload speed " << *upload->speed << " B/s to the server");

            SendUploadSpeed message;
            message.speed = *upload->speed;
            network_.send_to_server(message);
        }

        registry_.finish(*upload);
        return;
    }

    TransferStatus status;
    std::optional<UserStatus> user_status = users_.user_status(upload->username);

    if (user_status && *user_status == UserStatus::OFFLINE) {
        status = TransferStatus::USER_LOGGED_OFF;
    } else {
        status = TransferStatus::CANCELLED;

        // Ask the peer to queue the file again; a peer that cancelled on
        // purpose ignores this
        UploadFailed message;
        message.file = upload->virtual_path;
        network_.send_to_peer(upload->username, message);
    }

    if (!registry_.auto_clear(*upload)) {
        registry_.abort(*upload, status);
    }

    check_upload_queue();
}

void UploadManager::on_place_in_queue_request(const PlaceInQueueRequestEvent& event) {
    const std::string& username = event.username;
    const std::string& virtual_path = event.request.file;

    Transfer* upload = registry_.find_queued(username, virtual_path);
    if (!upload) {
        return;
    }

    bool is_privileged_queue = is_privileged(username);
    std::set<std::string> privileged_queued_users;
    size_t privileged_queued_uploads = 0;

    for (const auto& queued_username : registry_.queued_usernames()) {
        if (is_privileged(queued_username)) {
            privileged_queued_users.insert(queued_username);
            privileged_queued_uploads += registry_.queued_count(queued_username);
        }
    }

    uint32_t queue_position = 0;

    if (config_.fifo_queue) {
        uint32_t num_non_privileged = 0;
        uint32_t position = 1;

        for (const Transfer* queued_upload : registry_.queued_transfers()) {
            if (is_privileged_queue && privileged_queued_users.count(queued_upload->username) == 0) {
                num_non_privileged++;
            }

            if (queued_upload == upload) {
                queue_position += position - num_non_privileged;
                break;
            }
            position++;
        }
    } else {
        uint32_t position = 1;

        for (const Transfer* queued_upload : registry_.queued_for(username)) {
            if (queued_upload == upload) {
                size_t num_queued_users;

                if (is_privileged_queue) {
                    num_queued_users = privileged_queued_users.size();
                } else {
                    // Privileged users are served first
                    queue_position += static_cast<uint32_t>(privileged_queued_uploads);
                    num_queued_users = registry_.queued_user_count();
                }

                queue_position += position * static_cast<uint32_t>(num_queued_users);
                break;
            }
            position++;
        }
    }

    if (queue_position > 0) {
        PlaceInQueueResponse response;
        response.filename = virtual_path;
        response.place = queue_position;
        network_.send_to_peer(username, response);
    }

    upload->queue_position = queue_position;
    registry_.update(*upload, false);
}

} // namespace peerq
