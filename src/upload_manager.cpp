#include "upload_manager.h"
#include "transfer_log_macros.h"
#include "fs.h"
#include <algorithm>

namespace peerq {

UploadManager::UploadManager(const TransferConfig& config, EventBus& events, Scheduler& scheduler,
                             TransferNetwork& network, SharesIndex& shares, UserDirectory& users)
    : config_(config), events_(events), scheduler_(scheduler), network_(network), shares_(shares),
      users_(users),
      registry_(TransferRegistryConfig(TransferDirection::UPLOAD), config, events, scheduler, network),
      pending_shutdown_(false), upload_speed_(0), token_(0), total_bandwidth_(0),
      user_update_counter_(0), upload_queue_timer_id_(0), retry_failed_uploads_timer_id_(0) {
    install_hooks();
    subscribe_events();
}

UploadManager::~UploadManager() {
    scheduler_.cancel(upload_queue_timer_id_);
    scheduler_.cancel(retry_failed_uploads_timer_id_);
}

void UploadManager::install_hooks() {
    TransferRegistryHooks hooks;

    hooks.on_append = [this](Transfer& incoming, Transfer* existing) {
        return merge_appended_upload(incoming, existing);
    };

    hooks.on_queue_drained = [this](const std::string& username) {
        user_update_counters_.erase(username);
    };

    hooks.on_activate = [this](Transfer& transfer) {
        user_update_counters_.erase(transfer.username);
    };

    hooks.on_update = [this](Transfer& transfer) {
        // A user enqueueing more files keeps its place in the round robin
        if (user_update_counters_.count(transfer.username) == 0
                || !registry_.find_queued(transfer.username, transfer.virtual_path)) {
            update_user_counter(transfer.username);
        }
    };

    hooks.on_abort = [this](Transfer& transfer, const std::string& denied_message) {
        if (!transfer.file_handle && !denied_message.empty() && registry_.is_queued(transfer)) {
            UploadDenied message;
            message.file = transfer.virtual_path;
            message.reason = denied_message;
            network_.send_to_peer(transfer.username, message);
        }
    };

    hooks.on_aborted = [this](Transfer& transfer) {
        update_user_counter(transfer.username);
    };

    hooks.on_finished = [this](Transfer& transfer) {
        on_upload_finished(transfer);
    };

    hooks.on_check_queue = [this]() {
        check_upload_queue();
    };

    registry_.set_hooks(std::move(hooks));
}

void UploadManager::subscribe_events() {
    events_.on<AddPrivilegedUserEvent>([this](const AddPrivilegedUserEvent& e) {
        privileged_users_.insert(e.username);
    });
    events_.on<RemovePrivilegedUserEvent>([this](const RemovePrivilegedUserEvent& e) {
        privileged_users_.erase(e.username);
    });
    events_.on<FileConnectionClosedEvent>([this](const FileConnectionClosedEvent& e) {
        on_file_connection_closed(e);
    });
    events_.on<FileTransferInitEvent>([this](const FileTransferInitEvent& e) { on_file_transfer_init(e); });
    events_.on<FileUploadProgressEvent>([this](const FileUploadProgressEvent& e) { on_file_upload_progress(e); });
    events_.on<PeerConnectionClosedEvent>([this](const PeerConnectionClosedEvent& e) { on_peer_connection_closed(e); });
    events_.on<PeerConnectionErrorEvent>([this](const PeerConnectionErrorEvent& e) { on_peer_connection_error(e); });
    events_.on<PlaceInQueueRequestEvent>([this](const PlaceInQueueRequestEvent& e) { on_place_in_queue_request(e); });
    events_.on<QueueUploadEvent>([this](const QueueUploadEvent& e) { on_queue_upload(e); });
    events_.on<ScheduleQuitEvent>([this](const ScheduleQuitEvent& e) { on_schedule_quit(e); });
    events_.on<SetConnectionStatsEvent>([this](const SetConnectionStatsEvent& e) { on_set_connection_stats(e); });
    events_.on<SharesReadyEvent>([this](const SharesReadyEvent& e) { on_shares_ready(e); });
    events_.on<TransferRequestEvent>([this](const TransferRequestEvent& e) { on_transfer_request(e); });
    events_.on<TransferResponseEvent>([this](const TransferResponseEvent& e) { on_transfer_response(e); });
    events_.on<UploadFileErrorEvent>([this](const UploadFileErrorEvent& e) { on_upload_file_error(e); });
    events_.on<UserStatsEvent>([this](const UserStatsEvent& e) { on_user_stats(e); });
    events_.on<UserStatusEvent>([this](const UserStatusEvent& e) { on_user_status(e); });
    events_.on<ServerLoginEvent>([this](const ServerLoginEvent& e) { on_server_login(e); });
    events_.on<ServerDisconnectEvent>([this](const ServerDisconnectEvent& e) { on_server_disconnect(e); });
}

//=============================================================================
// Lifecycle
//=============================================================================

std::string UploadManager::transfers_file_path() const {
    return combine_paths(config_.data_folder, "uploads.json");
}

void UploadManager::start() {
    std::string file_path = transfers_file_path();

    for (auto& loaded : TransferRegistry::load_transfers(file_path, true)) {
        registry_.append(std::move(loaded));
    }

    LOG_UPLOADS_INFO("Loaded " << registry_.size() << " finished uploads from " << file_path);
}

void UploadManager::quit() {
    save_transfers();
    registry_.reset();

    upload_speed_ = 0;
    token_ = 0;
    user_update_counters_.clear();
    user_update_counter_ = 0;
}

bool UploadManager::save_transfers() const {
    if (!create_directories(config_.data_folder)) {
        LOG_UPLOADS_ERROR("Cannot create data folder " << config_.data_folder);
        return false;
    }
    return registry_.save_transfers(transfers_file_path());
}

bool UploadManager::is_offline(const std::string& username) const {
    if (users_.our_status() == UserStatus::OFFLINE) {
        return true;
    }
    std::optional<UserStatus> status = users_.user_status(username);
    return status && *status == UserStatus::OFFLINE;
}

//=============================================================================
// Privileges
//=============================================================================

bool UploadManager::is_privileged(const std::string& username) const {
    if (username.empty()) {
        return false;
    }

    if (privileged_users_.count(username) > 0) {
        return true;
    }

    return is_buddy_prioritized(username);
}

bool UploadManager::is_buddy_prioritized(const std::string& username) const {
    if (username.empty()) {
        return false;
    }

    std::optional<BuddyInfo> buddy = users_.find_buddy(username);
    if (!buddy) {
        return false;
    }

    // Every buddy, or only those explicitly prioritized
    return config_.prefer_friends || buddy->is_prioritized;
}

//=============================================================================
// Limits
//=============================================================================

size_t UploadManager::get_total_uploads_allowed() const {
    size_t upload_slots;

    if (config_.use_upload_slots) {
        upload_slots = config_.upload_slots;
    } else {
        upload_slots = registry_.active_user_count();

        if (is_new_upload_accepted()) {
            return upload_slots + 1;
        }
    }

    return upload_slots == 0 ? 1 : upload_slots;
}

size_t UploadManager::get_upload_queue_size(const std::string& username) const {
    if (is_privileged(username)) {
        size_t queue_size = 0;
        for (const auto& queued_username : registry_.queued_usernames()) {
            if (is_privileged(queued_username)) {
                queue_size += registry_.queued_count(queued_username);
            }
        }
        return queue_size;
    }

    return registry_.queued_count();
}

bool UploadManager::has_active_uploads() const {
    return registry_.has_any_active() || registry_.queued_user_count() > 0;
}

std::optional<TransferStatus> UploadManager::is_queue_limit_reached(const std::string& username) const {
    uint64_t file_limit = config_.file_limit;
    uint64_t queue_size_limit = static_cast<uint64_t>(config_.queue_limit) * 1024 * 1024;

    if (file_limit >= 1 && registry_.queued_count(username) >= file_limit) {
        return TransferStatus::TOO_MANY_FILES;
    }

    if (queue_size_limit >= 1 && registry_.user_queue_size(username) >= queue_size_limit) {
        return TransferStatus::TOO_MANY_MEGABYTES;
    }

    return std::nullopt;
}

bool UploadManager::is_slot_limit_reached() const {
    size_t upload_slot_limit = config_.upload_slots == 0 ? 1 : config_.upload_slots;
    return registry_.active_user_count() >= upload_slot_limit;
}

bool UploadManager::is_bandwidth_limit_reached() const {
    uint64_t bandwidth_limit = static_cast<uint64_t>(config_.upload_bandwidth) * 1024;

    if (bandwidth_limit == 0) {
        return false;
    }

    return total_bandwidth_ >= bandwidth_limit;
}

bool UploadManager::is_new_upload_accepted() const {
    if (shares_.rescanning()) {
        return false;
    }

    if (config_.use_upload_slots) {
        return !is_slot_limit_reached();
    }

    return !is_bandwidth_limit_reached();
}

bool UploadManager::is_file_readable(const std::string& virtual_path, const std::string& real_path) {
    if (peerq::is_file_readable(real_path)) {
        return true;
    }

    LOG_TRANSFERS_INFO("Cannot access file, not sharing: " << virtual_path << " with real path " << real_path);
    return false;
}

uint64_t UploadManager::get_file_size(const std::string& real_path) {
    // Remote files and missing files have no size
    int64_t size = peerq::get_file_size(real_path);
    return size > 0 ? static_cast<uint64_t>(size) : 0;
}

bool UploadManager::is_upload_queued(const std::string& username, const std::string& virtual_path) const {
    if (registry_.find_queued(username, virtual_path)) {
        return true;
    }

    for (const Transfer* upload : registry_.active_for(username)) {
        if (upload->virtual_path == virtual_path) {
            return true;
        }
    }
    return false;
}

void UploadManager::update_transfer_limits() {
    TransferLimitsUpdatedEvent limits_event;
    limits_event.direction = TransferDirection::UPLOAD;
    events_.emit(limits_event);

    if (users_.our_status() == UserStatus::OFFLINE) {
        return;
    }

    SetUploadLimit command;
    command.limit_by = config_.upload_limit_by;

    switch (config_.upload_speed_limit) {
        case SpeedLimitMode::PRIMARY:
            command.limit = config_.upload_limit;
            break;
        case SpeedLimitMode::ALTERNATIVE:
            command.limit = config_.upload_limit_alt;
            break;
        case SpeedLimitMode::OFF:
            command.limit = 0;
            break;
    }

    network_.send_to_network_worker(command);
    check_upload_queue();
}

//=============================================================================
// Registry hooks
//=============================================================================

Transfer* UploadManager::merge_appended_upload(Transfer& incoming, Transfer* existing) {
    const std::string& username = incoming.username;

    if (is_privileged(username)) {
        incoming.modifier = privileged_users_.count(username) > 0 ? "privileged" : "prioritized";
    }

    if (!existing) {
        return nullptr;
    }

    if (registry_.is_queued(*existing)) {
        // Keep the queue position, refresh what may have changed on disk
        registry_.set_queued_size(*existing, incoming.size);
        existing->folder_path = incoming.folder_path;
        registry_.update(*existing);
        return existing;
    }

    if (existing->status != TransferStatus::FINISHED) {
        incoming.current_byte_offset = existing->current_byte_offset;
        incoming.time_elapsed = existing->time_elapsed;
        incoming.time_left = existing->time_left;
        incoming.speed = existing->speed;
    }

    registry_.clear(*existing);
    return nullptr;
}

void UploadManager::on_upload_finished(Transfer& transfer) {
    const std::string username = transfer.username;
    const std::string virtual_path = transfer.virtual_path;

    LOG_UPLOADS_INFO("Upload finished: user " << username << ", IP address " << users_.user_address(username)
                     << ", file " << virtual_path);

    if (!registry_.auto_clear(transfer)) {
        registry_.update(transfer);
    }

    TransferFinishedEvent finished_event;
    finished_event.direction = TransferDirection::UPLOAD;
    finished_event.username = username;
    finished_event.virtual_path = virtual_path;
    finished_event.file_path = shares_.virtual_to_real_path(virtual_path);
    events_.emit(finished_event);
}

//=============================================================================
// Queue
//=============================================================================

void UploadManager::update_user_counter(const std::string& username) {
    if (registry_.has_queued(username) && !registry_.has_active(username)) {
        user_update_counter_++;
        user_update_counters_[username] = user_update_counter_;
    }
}

Transfer* UploadManager::get_upload_candidate() const {
    std::set<std::string> privileged_users;
    std::optional<std::string> target_username;

    for (const auto& entry : user_update_counters_) {
        if (is_privileged(entry.first)) {
            privileged_users.insert(entry.first);
        }
    }

    if (config_.fifo_queue) {
        // First queued file overall
        for (const Transfer* upload : registry_.queued_transfers()) {
            const std::string& username = upload->username;

            if (!privileged_users.empty() && privileged_users.count(username) == 0) {
                continue;
            }

            if (user_update_counters_.count(username) == 0) {
                continue;
            }

            target_username = username;
            break;
        }
    } else {
        // First queued file of the user who waited longest
        std::optional<uint64_t> oldest_time;

        for (const auto& entry : user_update_counters_) {
            if (!privileged_users.empty() && privileged_users.count(entry.first) == 0) {
                continue;
            }

            if (!oldest_time || entry.second < *oldest_time) {
                target_username = entry.first;
                oldest_time = entry.second;
            }
        }
    }

    if (!target_username) {
        return nullptr;
    }

    return registry_.first_queued_for(*target_username);
}

void UploadManager::check_upload_queue() {
    if (!is_new_upload_accepted()) {
        return;
    }

    bool had_active_uploads = registry_.has_any_active();
    Transfer* upload_candidate = get_upload_candidate();

    if (!upload_candidate) {
        if (!had_active_uploads && pending_shutdown_) {
            pending_shutdown_ = false;
            events_.emit(QuitRequestedEvent());
        }
        return;
    }

    const std::string username = upload_candidate->username;

    if (is_offline(username)) {
        // Either we are offline or the user we want to upload to is
        if (registry_.auto_clear(*upload_candidate)) {
            return;
        }

        registry_.abort(*upload_candidate, TransferStatus::USER_LOGGED_OFF);
        return;
    }

    token_ = increment_token(token_);

    LOG_TRANSFERS_INFO("Checked upload queue, requesting to upload file " << upload_candidate->virtual_path
                       << " with token " << token_ << " to user " << username);

    registry_.activate(*upload_candidate, token_);

    TransferRequest request;
    request.direction = WireDirection::UPLOAD;
    request.token = token_;
    request.file = upload_candidate->virtual_path;
    request.filesize = upload_candidate->size;
    network_.send_to_peer(username, request);

    registry_.update(*upload_candidate);
}

void UploadManager::retry_failed_uploads() {
    for (Transfer* upload : registry_.failed_transfers()) {
        if (upload->status != TransferStatus::CONNECTION_TIMEOUT) {
            continue;
        }

        registry_.unfail(*upload);
        registry_.enqueue(*upload);
        registry_.update(*upload);
    }
}

UploadAdmission UploadManager::check_queue_upload_allowed(const std::string& username,
                                                          const std::string& ip_address,
                                                          const std::string& virtual_path,
                                                          const std::string& real_path,
                                                          const PendingNetworkMessage& message) {
    UploadAdmission admission;

    // Is the user allowed to download?
    PermissionResult permission = shares_.check_user_permission(username, ip_address);

    if (permission.level == PermissionLevel::BANNED) {
        admission.reason = status_to_string(TransferStatus::BANNED);
        if (!permission.reason.empty()) {
            admission.reason += " (" + permission.reason + ")";
        }
        return admission;
    }

    if (shares_.rescanning()) {
        // Answered once the rescan is done
        pending_network_msgs_.push_back(message);
        return admission;
    }

    if (is_upload_queued(username, virtual_path)) {
        admission.reason = status_to_string(TransferStatus::REMOTE_QUEUED);
        return admission;
    }

    if (pending_shutdown_) {
        admission.reason = status_to_string(TransferStatus::PENDING_SHUTDOWN);
        return admission;
    }

    bool enable_limits = !(config_.friends_no_limits && users_.find_buddy(username));

    if (enable_limits) {
        std::optional<TransferStatus> limit_reason = is_queue_limit_reached(username);
        if (limit_reason) {
            admission.reason = status_to_string(*limit_reason);
            return admission;
        }
    }

    if (!shares_.file_is_shared(username, virtual_path, real_path)) {
        admission.reason = status_to_string(TransferStatus::FILE_NOT_SHARED);
        return admission;
    }

    if (!is_file_readable(virtual_path, real_path)) {
        admission.reason = status_to_string(TransferStatus::FILE_READ_ERROR);
        return admission;
    }

    admission.allowed = true;
    return admission;
}

//=============================================================================
// User actions
//=============================================================================

void UploadManager::ban_users(const std::vector<std::string>& users, const std::string& ban_message) {
    std::string message = ban_message;
    if (message.empty() && config_.use_custom_ban) {
        message = config_.custom_ban;
    }

    std::string status = status_to_string(TransferStatus::BANNED);
    if (!message.empty()) {
        status += " (" + message + ")";
    }

    for (Transfer* upload : registry_.transfers()) {
        if (std::find(users.begin(), users.end(), upload->username) == users.end()) {
            continue;
        }

        registry_.clear(*upload, status);
    }

    for (const auto& username : users) {
        users_.ban_user(username);
    }

    check_upload_queue();
}

void UploadManager::enqueue_upload(const std::string& username, const std::string& virtual_path, uint64_t size,
                                   const std::string& folder_path) {
    Transfer* transfer = registry_.find(username, virtual_path);
    std::string real_path = shares_.virtual_to_real_path(virtual_path);

    uint64_t new_size = get_file_size(real_path);
    if (new_size > 0) {
        size = new_size;
    }

    if (!transfer) {
        std::string upload_folder_path = folder_path.empty()
            ? get_parent_directory(real_path) : normalize_path(folder_path);

        transfer = registry_.append(std::make_unique<Transfer>(username, virtual_path, upload_folder_path, size));
        if (!transfer) {
            return;
        }
    } else {
        if (registry_.is_active(*transfer)) {
            // Upload already in progress
            return;
        }

        if (registry_.is_queued(*transfer)) {
            // Upload already queued
            return;
        }

        registry_.unfail(*transfer);
        transfer->size = size;
    }

    if (is_offline(username)) {
        // Either we are offline or the user we want to upload to is
        if (registry_.auto_clear(*transfer)) {
            return;
        }

        registry_.abort(*transfer, TransferStatus::USER_LOGGED_OFF);
        return;
    }

    registry_.enqueue(*transfer);
    registry_.update(*transfer);
    check_upload_queue();
}

void UploadManager::retry_upload(Transfer& transfer) {
    if (registry_.is_active(transfer) || transfer.status == TransferStatus::FINISHED) {
        // Active and finished uploads stay as they are
        return;
    }

    bool user_has_active_uploads = registry_.has_active(transfer.username);

    if (!registry_.is_queued(transfer)) {
        registry_.unfail(transfer);
        registry_.enqueue(transfer);
        registry_.update(transfer);
    }

    if (!user_has_active_uploads) {
        check_upload_queue();
    }
}

void UploadManager::retry_uploads(const std::vector<Transfer*>& uploads) {
    for (Transfer* upload : uploads) {
        if (registry_.contains(upload)) {
            retry_upload(*upload);
        }
    }
}

void UploadManager::abort_uploads(const std::vector<Transfer*>& uploads, const std::string& denied_message,
                                  TransferStatus status) {
    for (Transfer* upload : uploads) {
        if (upload->status == status || upload->status == TransferStatus::FINISHED) {
            continue;
        }

        registry_.abort(*upload, status, denied_message, false);
    }

    TransferListUpdatedEvent event;
    event.direction = TransferDirection::UPLOAD;
    events_.emit(event);
}

void UploadManager::clear_uploads(const std::vector<Transfer*>& uploads, const std::set<TransferStatus>& statuses) {
    std::vector<Transfer*> targets = uploads.empty() ? registry_.transfers() : uploads;

    for (Transfer* upload : targets) {
        if (!registry_.contains(upload)) {
            continue;
        }

        if (!statuses.empty() && statuses.count(upload->status) == 0) {
            continue;
        }

        registry_.clear(*upload, "", false);
    }

    TransferListUpdatedEvent event;
    event.direction = TransferDirection::UPLOAD;
    events_.emit(event);
}

} // namespace peerq
