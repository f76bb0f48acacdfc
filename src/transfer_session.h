#pragma once

/**
 * @file transfer_session.h
 * @brief One transfer core: event bus, timers, settings and both queues.
 *
 * The owner supplies the collaborators and drives the session from its
 * event loop:
 *
 *   peerq::TransferSession session("./data/transfers.json", network, shares, users);
 *   session.start();
 *   while (!session.quit_requested()) {
 *       // deliver inbound events with session.events().emit(...)
 *       session.run_once();
 *   }
 *   session.quit();
 */

#include "event_bus.h"
#include "scheduler.h"
#include "transfer_config.h"
#include "collaborators.h"
#include "download_manager.h"
#include "upload_manager.h"
#include <string>

namespace peerq {

class TransferSession {
public:
    /**
     * @param config_path Settings file; created with defaults if missing
     * @param clock       Time source for the scheduler (steady_clock if empty)
     */
    TransferSession(const std::string& config_path, TransferNetwork& network, SharesIndex& shares,
                    UserDirectory& users, Scheduler::Clock clock = Scheduler::Clock());
    ~TransferSession();

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    /**
     * Load the settings and both transfer lists.
     * @return false if the settings file exists but cannot be parsed; the
     *         session then runs with defaults
     */
    bool start();

    // Save both transfer lists and the settings
    void quit();

    // Fire due timers. Returns the number of timers that fired.
    size_t run_once();

    // Seconds until the next timer is due
    double time_until_next() const { return scheduler_.time_until_next(); }

    EventBus& events() { return events_; }
    Scheduler& scheduler() { return scheduler_; }
    TransferConfig& config() { return config_; }
    const std::string& config_path() const { return config_path_; }

    DownloadManager& downloads() { return downloads_; }
    UploadManager& uploads() { return uploads_; }

    /**
     * Apply changed speed-limit settings. Call after editing config().
     */
    void update_transfer_limits();

    // Set once every upload finished after a scheduled quit
    bool quit_requested() const { return quit_requested_; }

    nlohmann::json get_statistics() const;

private:
    std::string config_path_;
    EventBus events_;
    Scheduler scheduler_;
    TransferConfig config_;
    DownloadManager downloads_;
    UploadManager uploads_;
    bool started_;
    bool quit_requested_;
};

} // namespace peerq
