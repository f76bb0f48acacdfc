#pragma once

/**
 * @file transfer_registry.h
 * @brief Ownership and partitioning of the transfers of one direction.
 *
 * The registry owns every Transfer record of its direction and keeps each
 * one in at most one of three partitions:
 *
 *   queued  - waiting for a slot, ordered by enqueue time (globally and per user)
 *   active  - negotiating or transferring, keyed by user and token
 *   failed  - retryable failures, keyed by user and virtual path
 *
 * Direction specific policy is plugged in through TransferRegistryHooks;
 * the download and upload managers each compose one registry.
 */

#include "transfer.h"
#include "transfer_config.h"
#include "event_bus.h"
#include "scheduler.h"
#include "collaborators.h"
#include <nlohmann/json.hpp>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace peerq {

/**
 * Direction specific behaviour. Every hook is optional.
 */
struct TransferRegistryHooks {
    /**
     * Called by append() when a record with the same key may already exist.
     * Return nullptr to store `incoming` (any record still registered under
     * the key is cleared first), or the record to keep using, in which case
     * `incoming` is discarded.
     */
    std::function<Transfer*(Transfer& incoming, Transfer* existing)> on_append;

    /**
     * Post-processing of a finished transfer, run after the transfer was
     * deactivated and its file closed. `file_path` is the path of the file
     * that was open. Return false if the hook aborted the transfer instead.
     */
    std::function<bool(Transfer& transfer, const std::string& file_path)> on_finish;

    // Runs once the record is FINISHED; the record may be cleared inside
    std::function<void(Transfer& transfer)> on_finished;

    std::function<void(Transfer& transfer)> on_dequeue;
    std::function<void(Transfer& transfer)> on_activate;

    // Runs before the update event is emitted
    std::function<void(Transfer& transfer)> on_update;

    // Runs before sockets and files are released
    std::function<void(Transfer& transfer, const std::string& denied_message)> on_abort;
    // Runs after the record left its partitions, before the status changes
    std::function<void(Transfer& transfer)> on_aborted;

    // The last queued record of a user was dequeued
    std::function<void(const std::string& username)> on_queue_drained;

    // Slots may have been freed; re-evaluate the queue
    std::function<void()> on_check_queue;
};

struct TransferRegistryConfig {
    TransferDirection direction;
    // Statuses that leave an aborted record outside the failed partition
    std::set<TransferStatus> non_failing_statuses;
    double request_timeout;             // Seconds (default: 60)

    explicit TransferRegistryConfig(TransferDirection direction_ = TransferDirection::DOWNLOAD)
        : direction(direction_), request_timeout(60.0) {
        if (direction == TransferDirection::DOWNLOAD) {
            non_failing_statuses = {TransferStatus::FINISHED, TransferStatus::FILTERED, TransferStatus::PAUSED};
        } else {
            non_failing_statuses = {TransferStatus::FINISHED, TransferStatus::CANCELLED};
        }
    }
};

struct TransferStatistics {
    uint64_t started_transfers = 0;
    uint64_t completed_transfers = 0;
    uint64_t transferred_bytes = 0;
};

class TransferRegistry {
public:
    TransferRegistry(const TransferRegistryConfig& registry_config, const TransferConfig& config,
                     EventBus& events, Scheduler& scheduler, TransferNetwork& network);
    ~TransferRegistry();

    TransferRegistry(const TransferRegistry&) = delete;
    TransferRegistry& operator=(const TransferRegistry&) = delete;

    void set_hooks(TransferRegistryHooks hooks) { hooks_ = std::move(hooks); }

    TransferDirection direction() const { return registry_config_.direction; }

    //=========================================================================
    // Records
    //=========================================================================

    /**
     * Take ownership of a new record.
     * @return The record now registered under the key (see on_append)
     */
    Transfer* append(std::unique_ptr<Transfer> transfer);

    Transfer* find(const std::string& username, const std::string& virtual_path) const;
    bool contains(const Transfer* transfer) const;

    // Snapshot of every record in insertion order
    std::vector<Transfer*> transfers() const;
    size_t size() const { return records_.size(); }

    //=========================================================================
    // Partition transitions
    //=========================================================================

    // Mark QUEUED and add to the queued partition
    void enqueue(Transfer& transfer);
    // Idempotent
    void dequeue(Transfer& transfer);

    /**
     * Move into the active partition under `token` and arm the request
     * timeout. Status becomes GETTING_STATUS.
     */
    void activate(Transfer& transfer, uint32_t token);
    void deactivate(Transfer& transfer);

    void fail(Transfer& transfer);
    void unfail(Transfer& transfer);

    void close_file(Transfer& transfer);

    // Progress arrived; the peer is no longer considered unresponsive
    void cancel_request_timer(Transfer& transfer);

    /**
     * Release the socket and file, leave every partition and, when a
     * status is given, set it and park the record in the failed partition
     * unless the status is non-failing.
     */
    void abort(Transfer& transfer, std::optional<TransferStatus> status = std::nullopt,
               const std::string& denied_message = "", bool update_parent = true);

    void finish(Transfer& transfer);

    // Abort, then destroy the record. `transfer` is dangling afterwards.
    void clear(Transfer& transfer, const std::string& denied_message = "", bool update_parent = true);

    // Clear if auto-clear is configured for this direction
    bool auto_clear(Transfer& transfer);

    // Notify listeners that a record changed
    void update(Transfer& transfer, bool update_parent = true);

    // Cancel every timer, close every handle and drop every record
    void reset();

    //=========================================================================
    // Partition views
    //=========================================================================

    Transfer* find_queued(const std::string& username, const std::string& virtual_path) const;
    Transfer* find_active(const std::string& username, uint32_t token) const;
    Transfer* find_failed(const std::string& username, const std::string& virtual_path) const;

    bool is_queued(const Transfer& transfer) const { return transfer.queue_sequence != 0; }
    bool is_active(const Transfer& transfer) const;
    bool is_failed(const Transfer& transfer) const;

    // Every queued record, oldest first
    std::vector<Transfer*> queued_transfers() const;
    std::vector<Transfer*> queued_for(const std::string& username) const;
    Transfer* first_queued_for(const std::string& username) const;
    size_t queued_count() const { return queued_.size(); }
    size_t queued_count(const std::string& username) const;
    bool has_queued(const std::string& username) const { return queued_users_.count(username) > 0; }
    std::vector<std::string> queued_usernames() const;
    size_t queued_user_count() const { return queued_users_.size(); }

    std::vector<Transfer*> active_for(const std::string& username) const;
    std::vector<Transfer*> active_transfers() const;
    bool has_active(const std::string& username) const { return active_users_.count(username) > 0; }
    bool has_any_active() const { return !active_users_.empty(); }
    size_t active_user_count() const { return active_users_.size(); }

    std::vector<Transfer*> failed_for(const std::string& username) const;
    std::vector<Transfer*> failed_transfers() const;

    //=========================================================================
    // Per-user aggregates
    //=========================================================================

    // Bytes queued by a user
    uint64_t user_queue_size(const std::string& username) const;
    // Replace the size of a queued record, keeping the user's total in step
    void set_queued_size(Transfer& transfer, uint64_t size);

    std::optional<size_t> user_queue_limit(const std::string& username) const;
    void set_user_queue_limit(const std::string& username, size_t limit);
    void clear_user_queue_limit(const std::string& username);
    void clear_user_queue_limits() { user_queue_limits_.clear(); }

    //=========================================================================
    // Persistence (transfer_persistence.cpp)
    //=========================================================================

    /**
     * Rows of [username, virtual_path, folder_path, status, size, offset,
     * file_attributes] for every record.
     */
    nlohmann::json get_transfer_rows() const;

    // Atomically replace `path` with the current rows
    bool save_transfers(const std::string& path) const;

    /**
     * Parse a transfer list. Statuses that cannot be resumed as-is load as
     * QUEUED. Rows that do not describe a transfer are skipped.
     */
    static std::vector<std::unique_ptr<Transfer>> load_transfers(const std::string& path,
                                                                  bool load_only_finished = false);

    //=========================================================================
    // Statistics
    //=========================================================================

    void record_started() { statistics_.started_transfers++; }
    void record_transferred(uint64_t bytes) { statistics_.transferred_bytes += bytes; }
    const TransferStatistics& statistics() const { return statistics_; }
    nlohmann::json get_statistics() const;

private:
    using RecordList = std::list<std::unique_ptr<Transfer>>;

    const char* log_module() const;
    void on_request_timeout(const TransferKey& key, uint32_t token);

    TransferRegistryConfig registry_config_;
    const TransferConfig& config_;
    EventBus& events_;
    Scheduler& scheduler_;
    TransferNetwork& network_;
    TransferRegistryHooks hooks_;

    RecordList records_;
    std::unordered_map<TransferKey, RecordList::iterator, TransferKeyHash> index_;

    uint64_t next_queue_sequence_;
    std::map<uint64_t, Transfer*> queued_;
    std::map<std::string, std::map<uint64_t, Transfer*>> queued_users_;
    std::map<std::string, std::map<uint32_t, Transfer*>> active_users_;
    std::map<std::string, std::map<std::string, Transfer*>> failed_users_;

    std::unordered_map<std::string, uint64_t> user_queue_sizes_;
    std::unordered_map<std::string, size_t> user_queue_limits_;

    TransferStatistics statistics_;
};

} // namespace peerq
