#pragma once

/**
 * @file upload_manager.h
 * @brief Upload queue policy on top of a TransferRegistry.
 *
 * Peers queue files with us; the manager admits them, and hands out
 * upload slots either round robin between users (default) or first in,
 * first out. Privileged users are always served before everyone else.
 *
 * Implementation is split across:
 *   upload_manager.cpp - lifecycle, admission, slot selection and user actions
 *   upload_events.cpp  - peer, server and network worker events
 */

#include "transfer_registry.h"
#include "transfer_config.h"
#include "collaborators.h"
#include "event_bus.h"
#include "scheduler.h"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace peerq {

// Outcome of the admission checks for a queue request
struct UploadAdmission {
    bool allowed = false;
    std::string reason;         // Empty when allowed, or when the request was deferred
};

class UploadManager {
public:
    UploadManager(const TransferConfig& config, EventBus& events, Scheduler& scheduler,
                  TransferNetwork& network, SharesIndex& shares, UserDirectory& users);
    ~UploadManager();

    UploadManager(const UploadManager&) = delete;
    UploadManager& operator=(const UploadManager&) = delete;

    // Load finished uploads
    void start();
    void quit();

    TransferRegistry& registry() { return registry_; }
    const TransferRegistry& registry() const { return registry_; }

    std::string transfers_file_path() const;
    bool save_transfers() const;

    //=========================================================================
    // Privileges
    //=========================================================================

    // Privileged on the server, or a prioritized buddy
    bool is_privileged(const std::string& username) const;
    bool is_buddy_prioritized(const std::string& username) const;
    const std::set<std::string>& privileged_users() const { return privileged_users_; }

    //=========================================================================
    // Limits
    //=========================================================================

    size_t get_total_uploads_allowed() const;
    // Queue length as seen by `username` (privileged users see only their own queue)
    size_t get_upload_queue_size(const std::string& username) const;
    bool has_active_uploads() const;

    /**
     * @return TOO_MANY_FILES or TOO_MANY_MEGABYTES when the user filled
     *         its queue allowance, nullopt otherwise
     */
    std::optional<TransferStatus> is_queue_limit_reached(const std::string& username) const;
    bool is_slot_limit_reached() const;
    bool is_bandwidth_limit_reached() const;
    bool is_new_upload_accepted() const;
    bool is_upload_queued(const std::string& username, const std::string& virtual_path) const;

    // Send the configured speed limit to the network worker
    void update_transfer_limits();

    uint64_t upload_speed() const { return upload_speed_; }
    bool pending_shutdown() const { return pending_shutdown_; }

    //=========================================================================
    // Queue
    //=========================================================================

    // Start the next upload if a slot is free
    void check_upload_queue();

    //=========================================================================
    // User actions
    //=========================================================================

    /**
     * Clear every upload of `users` with a "Banned" denial and ban them.
     * Without a message, the configured custom ban message is used.
     */
    void ban_users(const std::vector<std::string>& users, const std::string& ban_message = "");

    void enqueue_upload(const std::string& username, const std::string& virtual_path, uint64_t size,
                        const std::string& folder_path = "");
    void retry_upload(Transfer& transfer);
    void retry_uploads(const std::vector<Transfer*>& uploads);
    void abort_uploads(const std::vector<Transfer*>& uploads, const std::string& denied_message = "",
                       TransferStatus status = TransferStatus::CANCELLED);
    // Every upload when `uploads` is empty
    void clear_uploads(const std::vector<Transfer*>& uploads = {},
                       const std::set<TransferStatus>& statuses = {});

private:
    using PendingNetworkMessage = std::variant<QueueUploadEvent, TransferRequestEvent>;

    void install_hooks();
    void subscribe_events();

    bool is_offline(const std::string& username) const;
    Transfer* get_upload_candidate() const;
    void update_user_counter(const std::string& username);

    UploadAdmission check_queue_upload_allowed(const std::string& username, const std::string& ip_address,
                                               const std::string& virtual_path, const std::string& real_path,
                                               const PendingNetworkMessage& message);
    static bool is_file_readable(const std::string& virtual_path, const std::string& real_path);
    static uint64_t get_file_size(const std::string& real_path);

    // Registry hooks
    Transfer* merge_appended_upload(Transfer& incoming, Transfer* existing);
    void on_upload_finished(Transfer& transfer);

    void retry_failed_uploads();

    // Event handlers (upload_events.cpp)
    void on_server_login(const ServerLoginEvent& event);
    void on_server_disconnect(const ServerDisconnectEvent& event);
    void on_schedule_quit(const ScheduleQuitEvent& event);
    void on_shares_ready(const SharesReadyEvent& event);
    void on_user_status(const UserStatusEvent& event);
    void on_user_stats(const UserStatsEvent& event);
    void on_set_connection_stats(const SetConnectionStatsEvent& event);
    void on_peer_connection_error(const PeerConnectionErrorEvent& event);
    void on_peer_connection_closed(const PeerConnectionClosedEvent& event);
    void cant_connect_upload(const std::string& username, uint32_t token, bool is_offline, bool is_timeout);
    void on_queue_upload(const QueueUploadEvent& event);
    void on_transfer_request(const TransferRequestEvent& event);
    std::optional<TransferResponse> transfer_request_uploads(const TransferRequestEvent& event);
    void on_transfer_response(const TransferResponseEvent& event);
    void on_upload_file_error(const UploadFileErrorEvent& event);
    void on_file_transfer_init(const FileTransferInitEvent& event);
    void on_file_upload_progress(const FileUploadProgressEvent& event);
    void on_file_connection_closed(const FileConnectionClosedEvent& event);
    void on_place_in_queue_request(const PlaceInQueueRequestEvent& event);

    const TransferConfig& config_;
    EventBus& events_;
    Scheduler& scheduler_;
    TransferNetwork& network_;
    SharesIndex& shares_;
    UserDirectory& users_;
    TransferRegistry registry_;

    bool pending_shutdown_;
    std::set<std::string> privileged_users_;
    uint64_t upload_speed_;
    uint32_t token_;
    uint64_t total_bandwidth_;

    // Queue requests received while our shares were rescanning
    std::vector<PendingNetworkMessage> pending_network_msgs_;

    // Round robin: the user with the lowest counter waited longest
    uint64_t user_update_counter_;
    std::map<std::string, uint64_t> user_update_counters_;

    TimerId upload_queue_timer_id_;
    TimerId retry_failed_uploads_timer_id_;
};

} // namespace peerq
