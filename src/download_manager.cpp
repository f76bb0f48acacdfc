#include "download_manager.h"
#include "transfer_log_macros.h"
#include "path_utils.h"
#include "fs.h"
#include <algorithm>

namespace peerq {

namespace {

// Characters with a meaning in ECMAScript regular expressions
std::string escape_filter(const std::string& pattern) {
    static const std::string special = ".^$|?*+()[]{}\\";
    std::string escaped;

    for (char c : pattern) {
        if (special.find(c) != std::string::npos) {
            escaped += '\\';
        }
        escaped += c;
    }

    // "*" is the only wildcard an escaped filter supports
    std::string result;
    for (size_t i = 0; i < escaped.size(); ++i) {
        if (escaped[i] == '\\' && i + 1 < escaped.size() && escaped[i + 1] == '*') {
            result += ".*";
            ++i;
        } else {
            result += escaped[i];
        }
    }
    return result;
}

} // namespace

DownloadManager::DownloadManager(const TransferConfig& config, EventBus& events, Scheduler& scheduler,
                                 TransferNetwork& network, SharesIndex& shares, UserDirectory& users)
    : config_(config), events_(events), scheduler_(scheduler), network_(network), shares_(shares),
      users_(users),
      registry_(TransferRegistryConfig(TransferDirection::DOWNLOAD), config, events, scheduler, network),
      requested_folder_token_(0), total_bandwidth_(0),
      download_queue_timer_id_(0), retry_connection_downloads_timer_id_(0), retry_io_downloads_timer_id_(0) {
    install_hooks();
    subscribe_events();
}

DownloadManager::~DownloadManager() {
    scheduler_.cancel(download_queue_timer_id_);
    scheduler_.cancel(retry_connection_downloads_timer_id_);
    scheduler_.cancel(retry_io_downloads_timer_id_);
}

void DownloadManager::install_hooks() {
    TransferRegistryHooks hooks;

    hooks.on_abort = [](Transfer& transfer, const std::string&) {
        transfer.legacy_attempt = false;
        transfer.size_changed = false;
    };

    hooks.on_dequeue = [this](Transfer& transfer) {
        TransferKey key = transfer.key();
        pending_queue_messages_.erase(
            std::remove_if(pending_queue_messages_.begin(), pending_queue_messages_.end(),
                           [&key](const std::pair<TransferKey, QueueUpload>& entry) { return entry.first == key; }),
            pending_queue_messages_.end());
    };

    hooks.on_queue_drained = [this](const std::string& username) {
        enqueue_limited_transfers(username);
    };

    hooks.on_finish = [this](Transfer& transfer, const std::string& file_path) {
        return move_finished_download(transfer, file_path);
    };

    hooks.on_finished = [this](Transfer& transfer) {
        on_download_finished(transfer);
    };

    registry_.set_hooks(std::move(hooks));
}

void DownloadManager::subscribe_events() {
    events_.on<ServerLoginEvent>([this](const ServerLoginEvent& e) { on_server_login(e); });
    events_.on<ServerDisconnectEvent>([this](const ServerDisconnectEvent& e) { on_server_disconnect(e); });
    events_.on<SharesReadyEvent>([this](const SharesReadyEvent& e) { on_shares_ready(e); });
    events_.on<UserStatusEvent>([this](const UserStatusEvent& e) { on_user_status(e); });
    events_.on<SetConnectionStatsEvent>([this](const SetConnectionStatsEvent& e) { on_set_connection_stats(e); });
    events_.on<PeerConnectionErrorEvent>([this](const PeerConnectionErrorEvent& e) { on_peer_connection_error(e); });
    events_.on<PeerConnectionClosedEvent>([this](const PeerConnectionClosedEvent& e) { on_peer_connection_closed(e); });
    events_.on<FolderContentsResponseEvent>([this](const FolderContentsResponseEvent& e) {
        on_folder_contents_response(e);
    });
    events_.on<TransferRequestEvent>([this](const TransferRequestEvent& e) { on_transfer_request(e); });
    events_.on<DownloadFileErrorEvent>([this](const DownloadFileErrorEvent& e) { on_download_file_error(e); });
    events_.on<FileTransferInitEvent>([this](const FileTransferInitEvent& e) { on_file_transfer_init(e); });
    events_.on<UploadDeniedEvent>([this](const UploadDeniedEvent& e) { on_upload_denied(e); });
    events_.on<UploadFailedEvent>([this](const UploadFailedEvent& e) { on_upload_failed(e); });
    events_.on<FileDownloadProgressEvent>([this](const FileDownloadProgressEvent& e) {
        on_file_download_progress(e);
    });
    events_.on<FileConnectionClosedEvent>([this](const FileConnectionClosedEvent& e) {
        on_file_connection_closed(e);
    });
    events_.on<PlaceInQueueResponseEvent>([this](const PlaceInQueueResponseEvent& e) {
        on_place_in_queue_response(e);
    });
}

//=============================================================================
// Lifecycle
//=============================================================================

std::string DownloadManager::transfers_file_path() const {
    return combine_paths(config_.data_folder, "downloads.json");
}

void DownloadManager::start() {
    std::string file_path = transfers_file_path();

    if (!file_exists(file_path)) {
        // Lists written by older versions
        for (const char* legacy_name : {"config.transfers.pickle", "transfers.pickle"}) {
            std::string legacy_path = combine_paths(config_.data_folder, legacy_name);
            if (file_exists(legacy_path)) {
                file_path = legacy_path;
                break;
            }
        }
    }

    for (auto& loaded : TransferRegistry::load_transfers(file_path)) {
        Transfer* transfer = registry_.append(std::move(loaded));

        if (transfer && transfer->status == TransferStatus::USER_LOGGED_OFF) {
            // Retried once the user comes back online
            registry_.fail(*transfer);
        }
    }

    LOG_DOWNLOADS_INFO("Loaded " << registry_.size() << " downloads from " << file_path);
    update_download_filters();
}

void DownloadManager::quit() {
    save_transfers();
    registry_.reset();

    folder_basename_byte_limits_.clear();
    pending_queue_messages_.clear();
    requested_folders_.clear();
    requested_folder_token_ = 0;
}

bool DownloadManager::save_transfers() const {
    if (!create_directories(config_.data_folder)) {
        LOG_DOWNLOADS_ERROR("Cannot create data folder " << config_.data_folder);
        return false;
    }
    return registry_.save_transfers(transfers_file_path());
}

bool DownloadManager::is_offline(const std::string& username) const {
    if (users_.our_status() == UserStatus::OFFLINE) {
        return true;
    }
    std::optional<UserStatus> status = users_.user_status(username);
    return status && *status == UserStatus::OFFLINE;
}

//=============================================================================
// Filters and limits
//=============================================================================

void DownloadManager::update_download_filters() {
    std::vector<DownloadFilter> filters = config_.download_filters;
    std::sort(filters.begin(), filters.end());
    filters.erase(std::unique(filters.begin(), filters.end(),
                              [](const DownloadFilter& a, const DownloadFilter& b) {
                                  return !(a < b) && !(b < a);
                              }),
                  filters.end());

    std::vector<std::string> patterns;
    size_t failed = 0;

    for (const auto& filter : filters) {
        std::string pattern = filter.escaped ? escape_filter(filter.pattern) : filter.pattern;

        try {
            std::regex test(pattern, std::regex::ECMAScript | std::regex::icase);
            (void)test;
            patterns.push_back(pattern);
        } catch (const std::regex_error& e) {
            failed++;
            LOG_DOWNLOADS_WARN("Invalid download filter '" << filter.pattern << "': " << e.what());
        }
    }

    download_regexp_.clear();
    download_filter_.reset();

    if (patterns.empty()) {
        return;
    }

    std::string joined;
    for (size_t i = 0; i < patterns.size(); ++i) {
        if (i > 0) {
            joined += "|";
        }
        joined += patterns[i];
    }

    download_regexp_ = "(\\\\(" + joined + ")$)";

    try {
        download_filter_ = std::regex(download_regexp_, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
        LOG_DOWNLOADS_ERROR("Download filters disabled, combined expression is invalid: " << e.what());
        download_regexp_.clear();
        download_filter_.reset();
        return;
    }

    if (failed > 0) {
        LOG_DOWNLOADS_WARN(failed << " download filter(s) left out");
    }
}

bool DownloadManager::is_filtered(const std::string& virtual_path) const {
    if (!download_filter_) {
        return false;
    }
    return std::regex_search(virtual_path, *download_filter_);
}

void DownloadManager::update_transfer_limits() {
    TransferLimitsUpdatedEvent limits_event;
    limits_event.direction = TransferDirection::DOWNLOAD;
    events_.emit(limits_event);

    if (users_.our_status() == UserStatus::OFFLINE) {
        return;
    }

    SetDownloadLimit command;
    switch (config_.download_speed_limit) {
        case SpeedLimitMode::PRIMARY:
            command.limit = config_.download_limit;
            break;
        case SpeedLimitMode::ALTERNATIVE:
            command.limit = config_.download_limit_alt;
            break;
        case SpeedLimitMode::OFF:
            command.limit = 0;
            break;
    }

    network_.send_to_network_worker(command);
}

bool DownloadManager::can_upload(const std::string& username) const {
    switch (config_.remote_downloads) {
        case RemoteDownloadPermission::EVERYONE:
            return true;

        case RemoteDownloadPermission::BUDDIES:
            return users_.find_buddy(username).has_value();

        case RemoteDownloadPermission::TRUSTED: {
            std::optional<BuddyInfo> buddy = users_.find_buddy(username);
            return buddy && buddy->is_trusted;
        }

        case RemoteDownloadPermission::NOBODY:
            break;
    }
    return false;
}

//=============================================================================
// Queue policy
//=============================================================================

bool DownloadManager::enqueue_transfer(Transfer& transfer, bool bypass_filter) {
    const std::string username = transfer.username;
    const std::string virtual_path = transfer.virtual_path;

    if (!bypass_filter && config_.enable_filters && is_filtered(virtual_path)) {
        LOG_TRANSFERS_INFO("Filtering: " << virtual_path);

        if (registry_.auto_clear(transfer)) {
            return false;
        }

        registry_.abort(transfer, TransferStatus::FILTERED);
        return true;
    }

    if (is_offline(username)) {
        // Either we are offline or the user we want to download from is
        registry_.abort(transfer, TransferStatus::USER_LOGGED_OFF);
        return true;
    }

    std::optional<std::string> download_path =
        get_complete_download_file_path(username, virtual_path, transfer.size, transfer.folder_path);

    if (download_path) {
        transfer.status = TransferStatus::FINISHED;
        transfer.current_byte_offset = transfer.size;

        LOG_TRANSFERS_INFO("File " << *download_path << " is already downloaded");
        return true;
    }

    LOG_TRANSFERS_INFO("Adding file " << virtual_path << " from user " << username << " to download queue");
    registry_.enqueue(transfer);

    QueueUpload message;
    message.file = virtual_path;
    message.legacy_client = transfer.legacy_attempt;

    if (!shares_.initialized()) {
        // Remain queued locally until our shares have initialized, so the
        // peer does not browse an empty share list
        pending_queue_messages_.emplace_back(transfer.key(), message);
        return true;
    }

    network_.send_to_peer(username, message);
    return true;
}

void DownloadManager::enqueue_limited_transfers(const std::string& username) {
    std::optional<size_t> limit = registry_.user_queue_limit(username);
    if (!limit) {
        return;
    }

    size_t num_queued = 0;

    for (Transfer* download : registry_.failed_for(username)) {
        if (download->status != TransferStatus::REMOTE_QUEUED) {
            continue;
        }
        if (num_queued >= *limit) {
            // Only a small batch at a time, the rest follow once it drains
            return;
        }

        registry_.unfail(*download);
        if (enqueue_transfer(*download)) {
            registry_.update(*download);
        }
        num_queued++;
    }

    registry_.clear_user_queue_limit(username);
}

bool DownloadManager::move_finished_download(Transfer& transfer, const std::string& incomplete_file_path) {
    std::string download_folder_path = transfer.folder_path.empty()
        ? get_default_download_folder(transfer.username) : transfer.folder_path;

    std::string download_basename = get_download_basename(transfer.virtual_path, download_folder_path, true);
    std::string download_file_path = combine_paths(download_folder_path, download_basename);

    std::string error;
    if (!create_directories(download_folder_path, &error)
            || !move_file(incomplete_file_path, download_file_path, &error)) {
        LOG_DOWNLOADS_ERROR("Couldn't move '" << incomplete_file_path << "' to '" << download_file_path
                            << "': " << error);
        registry_.abort(transfer, TransferStatus::DOWNLOAD_FOLDER_ERROR);

        DownloadFolderErrorEvent error_event;
        error_event.error = error;
        events_.emit(error_event);
        return false;
    }

    finished_file_path_ = download_file_path;
    return true;
}

void DownloadManager::on_download_finished(Transfer& transfer) {
    // The record may be cleared below
    const std::string username = transfer.username;
    const std::string virtual_path = transfer.virtual_path;
    const std::string folder_path = transfer.folder_path;
    const std::string download_file_path = finished_file_path_;
    finished_file_path_.clear();

    file_downloaded_actions(username, download_file_path);
    folder_downloaded_actions(username, folder_path);

    DownloadNotificationEvent notification;
    notification.finished = true;
    events_.emit(notification);

    if (!registry_.auto_clear(transfer)) {
        registry_.update(transfer);
    }

    TransferFinishedEvent finished_event;
    finished_event.direction = TransferDirection::DOWNLOAD;
    finished_event.username = username;
    finished_event.virtual_path = virtual_path;
    finished_event.file_path = download_file_path;
    events_.emit(finished_event);

    LOG_DOWNLOADS_INFO("Download finished: user " << username << ", file " << virtual_path);
}

void DownloadManager::file_downloaded_actions(const std::string& username, const std::string& file_path) {
    FileDownloadedEvent event;
    event.username = username;
    event.file_path = file_path;
    events_.emit(event);
}

void DownloadManager::folder_downloaded_actions(const std::string& username, const std::string& folder_path) {
    if (folder_path.empty()) {
        return;
    }

    for (const auto& downloads : {registry_.queued_for(username), registry_.active_for(username),
                                  registry_.failed_for(username)}) {
        for (const Transfer* download : downloads) {
            if (download->folder_path == folder_path) {
                return;
            }
        }
    }

    FolderDownloadedEvent event;
    event.username = username;
    event.folder_path = folder_path;
    events_.emit(event);
}

//=============================================================================
// Timers
//=============================================================================

void DownloadManager::check_download_queue() {
    for (Transfer* download : registry_.queued_transfers()) {
        PlaceInQueueRequest request;
        request.file = download->virtual_path;
        request.legacy_client = download->legacy_attempt;
        network_.send_to_peer(download->username, request);
    }

    // Users whose queue ran dry while a remote queue limit was in place
    std::vector<std::string> limited_users;
    for (Transfer* download : registry_.failed_transfers()) {
        if (download->status == TransferStatus::REMOTE_QUEUED && !registry_.has_queued(download->username)
                && registry_.user_queue_limit(download->username)
                && std::find(limited_users.begin(), limited_users.end(), download->username)
                    == limited_users.end()) {
            limited_users.push_back(download->username);
        }
    }

    for (const auto& username : limited_users) {
        enqueue_limited_transfers(username);
    }
}

void DownloadManager::retry_failed_with_statuses(const std::set<TransferStatus>& statuses) {
    for (Transfer* download : registry_.failed_transfers()) {
        if (statuses.count(download->status) == 0) {
            continue;
        }

        registry_.unfail(*download);
        if (enqueue_transfer(*download)) {
            registry_.update(*download);
        }
    }
}

void DownloadManager::retry_failed_connection_downloads() {
    retry_failed_with_statuses({TransferStatus::CONNECTION_CLOSED, TransferStatus::CONNECTION_TIMEOUT,
                                TransferStatus::PENDING_SHUTDOWN});
}

void DownloadManager::retry_failed_io_downloads() {
    retry_failed_with_statuses({TransferStatus::DOWNLOAD_FOLDER_ERROR, TransferStatus::LOCAL_FILE_ERROR,
                                TransferStatus::FILE_READ_ERROR});
}

//=============================================================================
// User actions
//=============================================================================

void DownloadManager::enqueue_download(const std::string& username, const std::string& virtual_path,
                                       const std::string& folder_path, uint64_t size,
                                       const std::map<uint32_t, uint32_t>& file_attributes, bool bypass_filter) {
    Transfer* existing = registry_.find(username, virtual_path);

    std::string download_folder_path = folder_path.empty()
        ? get_default_download_folder(username) : clean_path(folder_path);

    if (existing && existing->folder_path != download_folder_path
            && existing->status == TransferStatus::FINISHED) {
        // Only one record per user and path; the old finished one goes
        registry_.clear(*existing, "", false);
        existing = nullptr;
    }

    if (existing) {
        LOG_DOWNLOADS_DEBUG("Download of " << virtual_path << " from " << username << " already exists");
        return;
    }

    auto record = std::make_unique<Transfer>(username, virtual_path, download_folder_path, size);
    record->file_attributes = file_attributes;

    Transfer* transfer = registry_.append(std::move(record));
    if (!transfer) {
        return;
    }

    if (enqueue_transfer(*transfer, bypass_filter)) {
        registry_.update(*transfer);
    }
}

void DownloadManager::enqueue_folder(const std::string& username, const std::string& folder_path,
                                     const std::string& download_folder_path) {
    requested_folders_[username][folder_path] = download_folder_path;
    requested_folder_token_ = increment_token(requested_folder_token_);

    FolderContentsRequest request;
    request.directory = folder_path;
    request.token = requested_folder_token_;
    network_.send_to_peer(username, request);
}

void DownloadManager::download_large_folder(const std::string& username, const std::string& folder_path,
                                            const FolderListing& listing) {
    FolderContentsResponseEvent event;
    event.username = username;
    event.token = requested_folder_token_;
    event.listing[folder_path] = listing.count(folder_path) ? listing.at(folder_path)
                                                            : std::vector<FolderFileEntry>();

    on_folder_contents_response(event, false);
}

void DownloadManager::retry_download(Transfer& transfer, bool bypass_filter) {
    if (registry_.is_active(transfer) || transfer.status == TransferStatus::FINISHED) {
        // Active and finished downloads stay as they are
        return;
    }

    registry_.dequeue(transfer);
    registry_.unfail(transfer);
    if (enqueue_transfer(transfer, bypass_filter)) {
        registry_.update(transfer);
    }
}

void DownloadManager::retry_downloads(const std::vector<Transfer*>& downloads) {
    size_t num_downloads = downloads.size();

    for (Transfer* download : downloads) {
        // Retrying a single filtered download lets it through the filters
        bool bypass_filter = num_downloads == 1 && download->status == TransferStatus::FILTERED;
        retry_download(*download, bypass_filter);
    }
}

void DownloadManager::abort_downloads(const std::vector<Transfer*>& downloads, TransferStatus status) {
    for (Transfer* download : downloads) {
        if (download->status == status || download->status == TransferStatus::FINISHED) {
            continue;
        }

        registry_.abort(*download, status, "", false);
    }

    TransferListUpdatedEvent event;
    event.direction = TransferDirection::DOWNLOAD;
    events_.emit(event);
}

void DownloadManager::clear_downloads(const std::vector<Transfer*>& downloads,
                                      const std::set<TransferStatus>& statuses, bool clear_deleted) {
    std::vector<Transfer*> targets = downloads.empty() ? registry_.transfers() : downloads;

    for (Transfer* download : targets) {
        if (!registry_.contains(download)) {
            continue;
        }

        if (!statuses.empty() && statuses.count(download->status) == 0) {
            continue;
        }

        if (clear_deleted) {
            if (download->status != TransferStatus::FINISHED) {
                continue;
            }

            if (get_complete_download_file_path(download->username, download->virtual_path, download->size,
                                                download->folder_path)) {
                continue;
            }
        }

        registry_.clear(*download, "", false);
    }

    TransferListUpdatedEvent event;
    event.direction = TransferDirection::DOWNLOAD;
    events_.emit(event);
}

} // namespace peerq
