#pragma once

/**
 * @file download_manager.h
 * @brief Download queue policy on top of a TransferRegistry.
 *
 * Implementation is split across:
 *   download_manager.cpp - lifecycle, filters, limits and user actions
 *   download_paths.cpp   - destination and incomplete file naming
 *   download_events.cpp  - peer, server and network worker events
 */

#include "transfer_registry.h"
#include "transfer_config.h"
#include "collaborators.h"
#include "event_bus.h"
#include "scheduler.h"
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace peerq {

class DownloadManager {
public:
    DownloadManager(const TransferConfig& config, EventBus& events, Scheduler& scheduler,
                    TransferNetwork& network, SharesIndex& shares, UserDirectory& users);
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // Load the download list and compile the filters
    void start();
    // Save the download list and drop every record
    void quit();

    TransferRegistry& registry() { return registry_; }
    const TransferRegistry& registry() const { return registry_; }

    std::string transfers_file_path() const;
    bool save_transfers() const;

    //=========================================================================
    // Filters and limits
    //=========================================================================

    /**
     * Compile the configured filters into one expression. Filters that do
     * not compile are reported and left out; if the combined expression
     * fails, filtering is disabled.
     */
    void update_download_filters();
    const std::string& download_regexp() const { return download_regexp_; }
    bool is_filtered(const std::string& virtual_path) const;

    // Send the configured speed limit to the network worker
    void update_transfer_limits();

    // Whether `username` may push files to us unasked
    bool can_upload(const std::string& username) const;

    //=========================================================================
    // User actions
    //=========================================================================

    void enqueue_download(const std::string& username, const std::string& virtual_path,
                          const std::string& folder_path = "", uint64_t size = 0,
                          const std::map<uint32_t, uint32_t>& file_attributes = {},
                          bool bypass_filter = false);

    // Ask a peer for the contents of one of its folders
    void enqueue_folder(const std::string& username, const std::string& folder_path,
                        const std::string& download_folder_path = "");

    // Enqueue a folder listing that was held back for being large
    void download_large_folder(const std::string& username, const std::string& folder_path,
                               const FolderListing& listing);

    void retry_download(Transfer& transfer, bool bypass_filter = false);
    // A single selected FILTERED download bypasses the filters
    void retry_downloads(const std::vector<Transfer*>& downloads);
    void abort_downloads(const std::vector<Transfer*>& downloads, TransferStatus status = TransferStatus::PAUSED);

    /**
     * Clear downloads (every download when `downloads` is empty), optionally
     * only those with one of `statuses`. With `clear_deleted`, only
     * finished downloads whose file no longer exists are cleared.
     */
    void clear_downloads(const std::vector<Transfer*>& downloads = {},
                         const std::set<TransferStatus>& statuses = {}, bool clear_deleted = false);

    //=========================================================================
    // Paths (download_paths.cpp)
    //=========================================================================

    std::string get_default_download_folder(const std::string& username = "") const;

    /**
     * Local folder for a requested remote folder: the remote parents of
     * the requested folder are dropped and the rest joined to the target.
     */
    std::string get_folder_destination(const std::string& username, const std::string& folder_path,
                                       const std::string& root_folder_path = "",
                                       const std::string& download_folder_path = "");

    // Cached per folder
    size_t get_basename_byte_limit(const std::string& folder_path);

    /**
     * File name for a download, bounded by the folder's name byte limit
     * with the extension preserved where possible. With `avoid_conflict`,
     * " (n)" is appended until the name is free.
     */
    std::string get_download_basename(const std::string& virtual_path, const std::string& download_folder_path,
                                      bool avoid_conflict = false);

    // Existing file of the same size in the destination, if any
    std::optional<std::string> get_complete_download_file_path(const std::string& username,
                                                               const std::string& virtual_path, uint64_t size,
                                                               const std::string& download_folder_path = "");

    std::string get_incomplete_download_file_path(const std::string& username, const std::string& virtual_path);

    std::string get_current_download_file_path(const std::string& username, const std::string& virtual_path,
                                               const std::string& download_folder_path, uint64_t size);

private:
    void install_hooks();
    void subscribe_events();

    bool is_offline(const std::string& username) const;
    // Returns false if the record was cleared by the filters
    bool enqueue_transfer(Transfer& transfer, bool bypass_filter = false);
    void enqueue_limited_transfers(const std::string& username);
    void file_downloaded_actions(const std::string& username, const std::string& file_path);
    void folder_downloaded_actions(const std::string& username, const std::string& folder_path);

    // Registry hooks
    bool move_finished_download(Transfer& transfer, const std::string& incomplete_file_path);
    void on_download_finished(Transfer& transfer);

    // Timers
    void check_download_queue();
    void retry_failed_connection_downloads();
    void retry_failed_io_downloads();
    void retry_failed_with_statuses(const std::set<TransferStatus>& statuses);

    // Event handlers (download_events.cpp)
    void on_server_login(const ServerLoginEvent& event);
    void on_server_disconnect(const ServerDisconnectEvent& event);
    void on_shares_ready(const SharesReadyEvent& event);
    void on_user_status(const UserStatusEvent& event);
    void on_set_connection_stats(const SetConnectionStatsEvent& event);
    void on_peer_connection_error(const PeerConnectionErrorEvent& event);
    void on_peer_connection_closed(const PeerConnectionClosedEvent& event);
    void cant_connect_queue_file(const std::string& username, const std::string& virtual_path,
                                 bool is_offline, bool is_timeout);
    void on_folder_contents_response(const FolderContentsResponseEvent& event, bool check_num_files = true);
    void on_transfer_request(const TransferRequestEvent& event);
    TransferResponse transfer_request_downloads(const TransferRequestEvent& event);
    void on_download_file_error(const DownloadFileErrorEvent& event);
    void on_file_transfer_init(const FileTransferInitEvent& event);
    void on_upload_denied(const UploadDeniedEvent& event);
    void on_upload_failed(const UploadFailedEvent& event);
    void on_file_download_progress(const FileDownloadProgressEvent& event);
    void on_file_connection_closed(const FileConnectionClosedEvent& event);
    void on_place_in_queue_response(const PlaceInQueueResponseEvent& event);

    const TransferConfig& config_;
    EventBus& events_;
    Scheduler& scheduler_;
    TransferNetwork& network_;
    SharesIndex& shares_;
    UserDirectory& users_;
    TransferRegistry registry_;

    std::string download_regexp_;
    std::optional<std::regex> download_filter_;

    // User -> requested remote folder -> local target ("" for the default)
    std::map<std::string, std::map<std::string, std::string>> requested_folders_;
    uint32_t requested_folder_token_;

    std::unordered_map<std::string, size_t> folder_basename_byte_limits_;
    // QueueUpload messages held until our shares are initialized
    std::vector<std::pair<TransferKey, QueueUpload>> pending_queue_messages_;
    // Set between move_finished_download() and on_download_finished()
    std::string finished_file_path_;

    uint64_t total_bandwidth_;

    TimerId download_queue_timer_id_;
    TimerId retry_connection_downloads_timer_id_;
    TimerId retry_io_downloads_timer_id_;
};

} // namespace peerq
