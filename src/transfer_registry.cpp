#include "transfer_registry.h"
#include "transfer_log_macros.h"
#include <algorithm>
#include <iterator>

namespace peerq {

TransferRegistry::TransferRegistry(const TransferRegistryConfig& registry_config, const TransferConfig& config,
                                   EventBus& events, Scheduler& scheduler, TransferNetwork& network)
    : registry_config_(registry_config), config_(config), events_(events), scheduler_(scheduler),
      network_(network), next_queue_sequence_(1) {
}

TransferRegistry::~TransferRegistry() {
    reset();
}

const char* TransferRegistry::log_module() const {
    return registry_config_.direction == TransferDirection::DOWNLOAD ? "downloads" : "uploads";
}

//=============================================================================
// Records
//=============================================================================

Transfer* TransferRegistry::append(std::unique_ptr<Transfer> transfer) {
    if (!transfer) {
        return nullptr;
    }

    Transfer* existing = find(transfer->username, transfer->virtual_path);

    if (hooks_.on_append) {
        Transfer* kept = hooks_.on_append(*transfer, existing);
        if (kept) {
            return kept;
        }
        // The hook may have cleared the old record
        existing = find(transfer->username, transfer->virtual_path);
    }

    if (existing) {
        // Only one record per user and path
        clear(*existing, "", false);
    }

    TransferKey key = transfer->key();
    records_.push_back(std::move(transfer));
    auto it = std::prev(records_.end());
    index_[key] = it;

    return it->get();
}

Transfer* TransferRegistry::find(const std::string& username, const std::string& virtual_path) const {
    auto it = index_.find(TransferKey{username, virtual_path});
    if (it == index_.end()) {
        return nullptr;
    }
    return it->second->get();
}

bool TransferRegistry::contains(const Transfer* transfer) const {
    if (!transfer) {
        return false;
    }
    for (const auto& record : records_) {
        if (record.get() == transfer) {
            return true;
        }
    }
    return false;
}

std::vector<Transfer*> TransferRegistry::transfers() const {
    std::vector<Transfer*> result;
    result.reserve(records_.size());
    for (const auto& record : records_) {
        result.push_back(record.get());
    }
    return result;
}

//=============================================================================
// Partition transitions
//=============================================================================

void TransferRegistry::enqueue(Transfer& transfer) {
    transfer.status = TransferStatus::QUEUED;
    transfer.status_message.clear();

    if (is_queued(transfer)) {
        return;
    }

    uint64_t sequence = next_queue_sequence_++;
    transfer.queue_sequence = sequence;
    queued_[sequence] = &transfer;
    queued_users_[transfer.username][sequence] = &transfer;
    user_queue_sizes_[transfer.username] += transfer.size;
}

void TransferRegistry::dequeue(Transfer& transfer) {
    if (!is_queued(transfer)) {
        return;
    }

    const std::string username = transfer.username;
    uint64_t sequence = transfer.queue_sequence;

    queued_.erase(sequence);
    transfer.queue_sequence = 0;

    auto size_it = user_queue_sizes_.find(username);
    if (size_it != user_queue_sizes_.end()) {
        size_it->second -= std::min(size_it->second, transfer.size);
    }

    bool drained = false;
    auto user_it = queued_users_.find(username);
    if (user_it != queued_users_.end()) {
        user_it->second.erase(sequence);
        if (user_it->second.empty()) {
            queued_users_.erase(user_it);
            user_queue_sizes_.erase(username);
            drained = true;
        }
    }

    if (hooks_.on_dequeue) {
        hooks_.on_dequeue(transfer);
    }

    if (drained && hooks_.on_queue_drained) {
        hooks_.on_queue_drained(username);
    }
}

void TransferRegistry::activate(Transfer& transfer, uint32_t token) {
    dequeue(transfer);
    unfail(transfer);
    deactivate(transfer);

    transfer.status = TransferStatus::GETTING_STATUS;
    transfer.status_message.clear();
    transfer.token = token;
    transfer.speed.reset();
    transfer.queue_position = 0;

    active_users_[transfer.username][token] = &transfer;

    TransferKey key = transfer.key();
    transfer.request_timer_id = scheduler_.schedule(
        registry_config_.request_timeout,
        [this, key, token]() { on_request_timeout(key, token); });

    if (hooks_.on_activate) {
        hooks_.on_activate(transfer);
    }
}

void TransferRegistry::deactivate(Transfer& transfer) {
    if (!transfer.token) {
        return;
    }

    auto user_it = active_users_.find(transfer.username);
    if (user_it != active_users_.end()) {
        auto token_it = user_it->second.find(*transfer.token);
        if (token_it != user_it->second.end() && token_it->second == &transfer) {
            user_it->second.erase(token_it);
        }
        if (user_it->second.empty()) {
            active_users_.erase(user_it);
        }
    }

    cancel_request_timer(transfer);
    transfer.token.reset();
}

void TransferRegistry::fail(Transfer& transfer) {
    failed_users_[transfer.username][transfer.virtual_path] = &transfer;
}

void TransferRegistry::unfail(Transfer& transfer) {
    auto user_it = failed_users_.find(transfer.username);
    if (user_it == failed_users_.end()) {
        return;
    }

    auto path_it = user_it->second.find(transfer.virtual_path);
    if (path_it != user_it->second.end() && path_it->second == &transfer) {
        user_it->second.erase(path_it);
    }
    if (user_it->second.empty()) {
        failed_users_.erase(user_it);
    }
}

void TransferRegistry::close_file(Transfer& transfer) {
    if (!transfer.file_handle) {
        return;
    }
    transfer.file_handle->close();
    transfer.file_handle.reset();
}

void TransferRegistry::abort(Transfer& transfer, std::optional<TransferStatus> status,
                             const std::string& denied_message, bool update_parent) {
    if (hooks_.on_abort) {
        hooks_.on_abort(transfer, denied_message);
    }

    if (transfer.sock != INVALID_SOCKET_VALUE) {
        NetworkCommand command = CloseConnection{transfer.sock};
        LOG_TRANSFERS_DEBUG(message_name(command) << " for socket " << transfer.sock);
        network_.send_to_network_worker(command);
        transfer.sock = INVALID_SOCKET_VALUE;
    }

    if (transfer.file_handle) {
        close_file(transfer);
        LOG_INFO(log_module(), (registry_config_.direction == TransferDirection::DOWNLOAD ? "Download" : "Upload")
                 << " aborted, user " << transfer.username << " file " << transfer.virtual_path);
    }

    deactivate(transfer);
    dequeue(transfer);
    unfail(transfer);

    if (hooks_.on_aborted) {
        hooks_.on_aborted(transfer);
    }

    if (!status) {
        return;
    }

    transfer.status = *status;

    if (registry_config_.non_failing_statuses.count(*status) == 0) {
        fail(transfer);
    }

    TransferAbortedEvent event;
    event.direction = registry_config_.direction;
    event.transfer = &transfer;
    event.status = *status;
    event.update_parent = update_parent;
    events_.emit(event);
}

void TransferRegistry::finish(Transfer& transfer) {
    std::string file_path = transfer.file_handle ? transfer.file_handle->path() : "";

    deactivate(transfer);
    close_file(transfer);
    dequeue(transfer);
    unfail(transfer);

    if (hooks_.on_finish && !hooks_.on_finish(transfer, file_path)) {
        return;
    }

    transfer.status = TransferStatus::FINISHED;
    transfer.current_byte_offset = transfer.size;
    transfer.sock = INVALID_SOCKET_VALUE;

    statistics_.completed_transfers++;

    if (hooks_.on_finished) {
        hooks_.on_finished(transfer);
    } else if (!auto_clear(transfer)) {
        update(transfer);
    }

    if (hooks_.on_check_queue) {
        hooks_.on_check_queue();
    }
}

void TransferRegistry::clear(Transfer& transfer, const std::string& denied_message, bool update_parent) {
    abort(transfer, std::nullopt, denied_message, update_parent);

    TransferClearedEvent event;
    event.direction = registry_config_.direction;
    event.transfer = &transfer;
    event.update_parent = update_parent;
    events_.emit(event);

    auto it = index_.find(transfer.key());
    if (it == index_.end() || it->second->get() != &transfer) {
        LOG_TRANSFERS_WARN("Cleared transfer " << transfer.virtual_path << " is not registered");
        return;
    }

    RecordList::iterator record_it = it->second;
    index_.erase(it);
    records_.erase(record_it);
}

bool TransferRegistry::auto_clear(Transfer& transfer) {
    bool enabled = registry_config_.direction == TransferDirection::DOWNLOAD
        ? config_.autoclear_downloads : config_.autoclear_uploads;

    if (!enabled) {
        return false;
    }

    clear(transfer);
    return true;
}

void TransferRegistry::update(Transfer& transfer, bool update_parent) {
    if (hooks_.on_update) {
        hooks_.on_update(transfer);
    }

    TransferUpdatedEvent event;
    event.direction = registry_config_.direction;
    event.transfer = &transfer;
    event.update_parent = update_parent;
    events_.emit(event);
}

void TransferRegistry::reset() {
    for (auto& record : records_) {
        cancel_request_timer(*record);
        close_file(*record);
    }

    queued_.clear();
    queued_users_.clear();
    active_users_.clear();
    failed_users_.clear();
    user_queue_sizes_.clear();
    user_queue_limits_.clear();
    index_.clear();
    records_.clear();
}

void TransferRegistry::on_request_timeout(const TransferKey& key, uint32_t token) {
    Transfer* transfer = find(key.username, key.virtual_path);
    if (!transfer || !transfer->token || *transfer->token != token || transfer->request_timer_id == 0) {
        return;
    }

    // The scheduler already dropped the one-shot timer
    transfer->request_timer_id = 0;

    LOG_TRANSFERS_INFO(direction_to_string(registry_config_.direction) << " " << transfer->virtual_path
                       << " with token " << token << " for user " << transfer->username << " timed out");

    abort(*transfer, TransferStatus::CONNECTION_TIMEOUT);

    if (hooks_.on_check_queue) {
        hooks_.on_check_queue();
    }
}

void TransferRegistry::cancel_request_timer(Transfer& transfer) {
    if (transfer.request_timer_id != 0) {
        scheduler_.cancel(transfer.request_timer_id);
        transfer.request_timer_id = 0;
    }
}

//=============================================================================
// Partition views
//=============================================================================

Transfer* TransferRegistry::find_queued(const std::string& username, const std::string& virtual_path) const {
    Transfer* transfer = find(username, virtual_path);
    if (transfer && is_queued(*transfer)) {
        return transfer;
    }
    return nullptr;
}

Transfer* TransferRegistry::find_active(const std::string& username, uint32_t token) const {
    auto user_it = active_users_.find(username);
    if (user_it == active_users_.end()) {
        return nullptr;
    }
    auto token_it = user_it->second.find(token);
    return token_it == user_it->second.end() ? nullptr : token_it->second;
}

Transfer* TransferRegistry::find_failed(const std::string& username, const std::string& virtual_path) const {
    auto user_it = failed_users_.find(username);
    if (user_it == failed_users_.end()) {
        return nullptr;
    }
    auto path_it = user_it->second.find(virtual_path);
    return path_it == user_it->second.end() ? nullptr : path_it->second;
}

bool TransferRegistry::is_active(const Transfer& transfer) const {
    return transfer.token && find_active(transfer.username, *transfer.token) == &transfer;
}

bool TransferRegistry::is_failed(const Transfer& transfer) const {
    return find_failed(transfer.username, transfer.virtual_path) == &transfer;
}

std::vector<Transfer*> TransferRegistry::queued_transfers() const {
    std::vector<Transfer*> result;
    result.reserve(queued_.size());
    for (const auto& entry : queued_) {
        result.push_back(entry.second);
    }
    return result;
}

std::vector<Transfer*> TransferRegistry::queued_for(const std::string& username) const {
    std::vector<Transfer*> result;
    auto user_it = queued_users_.find(username);
    if (user_it != queued_users_.end()) {
        for (const auto& entry : user_it->second) {
            result.push_back(entry.second);
        }
    }
    return result;
}

Transfer* TransferRegistry::first_queued_for(const std::string& username) const {
    auto user_it = queued_users_.find(username);
    if (user_it == queued_users_.end() || user_it->second.empty()) {
        return nullptr;
    }
    return user_it->second.begin()->second;
}

size_t TransferRegistry::queued_count(const std::string& username) const {
    auto user_it = queued_users_.find(username);
    return user_it == queued_users_.end() ? 0 : user_it->second.size();
}

std::vector<std::string> TransferRegistry::queued_usernames() const {
    std::vector<std::string> result;
    result.reserve(queued_users_.size());
    for (const auto& entry : queued_users_) {
        result.push_back(entry.first);
    }
    return result;
}

std::vector<Transfer*> TransferRegistry::active_for(const std::string& username) const {
    std::vector<Transfer*> result;
    auto user_it = active_users_.find(username);
    if (user_it != active_users_.end()) {
        for (const auto& entry : user_it->second) {
            result.push_back(entry.second);
        }
    }
    return result;
}

std::vector<Transfer*> TransferRegistry::active_transfers() const {
    std::vector<Transfer*> result;
    for (const auto& user : active_users_) {
        for (const auto& entry : user.second) {
            result.push_back(entry.second);
        }
    }
    return result;
}

std::vector<Transfer*> TransferRegistry::failed_for(const std::string& username) const {
    std::vector<Transfer*> result;
    auto user_it = failed_users_.find(username);
    if (user_it != failed_users_.end()) {
        for (const auto& entry : user_it->second) {
            result.push_back(entry.second);
        }
    }
    return result;
}

std::vector<Transfer*> TransferRegistry::failed_transfers() const {
    std::vector<Transfer*> result;
    for (const auto& user : failed_users_) {
        for (const auto& entry : user.second) {
            result.push_back(entry.second);
        }
    }
    return result;
}

//=============================================================================
// Per-user aggregates
//=============================================================================

uint64_t TransferRegistry::user_queue_size(const std::string& username) const {
    auto it = user_queue_sizes_.find(username);
    return it == user_queue_sizes_.end() ? 0 : it->second;
}

void TransferRegistry::set_queued_size(Transfer& transfer, uint64_t size) {
    if (is_queued(transfer) && size != transfer.size) {
        uint64_t& total = user_queue_sizes_[transfer.username];
        total -= std::min(total, transfer.size);
        total += size;
    }
    transfer.size = size;
}

std::optional<size_t> TransferRegistry::user_queue_limit(const std::string& username) const {
    auto it = user_queue_limits_.find(username);
    if (it == user_queue_limits_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void TransferRegistry::set_user_queue_limit(const std::string& username, size_t limit) {
    user_queue_limits_[username] = limit;
}

void TransferRegistry::clear_user_queue_limit(const std::string& username) {
    user_queue_limits_.erase(username);
}

//=============================================================================
// Statistics
//=============================================================================

nlohmann::json TransferRegistry::get_statistics() const {
    nlohmann::json stats;

    stats["direction"] = direction_to_string(registry_config_.direction);
    stats["started_transfers"] = statistics_.started_transfers;
    stats["completed_transfers"] = statistics_.completed_transfers;
    stats["transferred_bytes"] = statistics_.transferred_bytes;
    stats["total_transfers"] = records_.size();
    stats["queued_transfers"] = queued_.size();
    stats["active_transfers"] = active_transfers().size();
    stats["failed_transfers"] = failed_transfers().size();

    return stats;
}

} // namespace peerq
