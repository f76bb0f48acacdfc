#include "transfer_session.h"
#include "logger.h"

namespace peerq {

TransferSession::TransferSession(const std::string& config_path, TransferNetwork& network, SharesIndex& shares,
                                 UserDirectory& users, Scheduler::Clock clock)
    : config_path_(config_path),
      scheduler_(std::move(clock)),
      downloads_(config_, events_, scheduler_, network, shares, users),
      uploads_(config_, events_, scheduler_, network, shares, users),
      started_(false),
      quit_requested_(false) {
    events_.on<QuitRequestedEvent>([this](const QuitRequestedEvent&) {
        LOG_INFO("session", "Every upload finished, quitting");
        quit_requested_ = true;
    });
}

TransferSession::~TransferSession() {
    if (started_) {
        quit();
    }
}

bool TransferSession::start() {
    bool config_loaded = load_transfer_config(config_path_, config_);
    if (!config_loaded) {
        LOG_WARN("session", "Using default transfer settings, " << config_path_ << " could not be read");
    }

    downloads_.start();
    uploads_.start();
    started_ = true;

    LOG_INFO("session", "Transfer session started with " << downloads_.registry().size() << " downloads and "
             << uploads_.registry().size() << " uploads");
    return config_loaded;
}

void TransferSession::quit() {
    if (!started_) {
        return;
    }

    downloads_.quit();
    uploads_.quit();
    scheduler_.clear();

    if (!save_transfer_config(config_path_, config_)) {
        LOG_ERROR("session", "Failed to save transfer settings to " << config_path_);
    }

    started_ = false;
    LOG_INFO("session", "Transfer session stopped");
}

size_t TransferSession::run_once() {
    return scheduler_.run_due();
}

void TransferSession::update_transfer_limits() {
    downloads_.update_download_filters();
    downloads_.update_transfer_limits();
    uploads_.update_transfer_limits();
}

nlohmann::json TransferSession::get_statistics() const {
    nlohmann::json stats;
    stats["downloads"] = downloads_.registry().get_statistics();
    stats["uploads"] = uploads_.registry().get_statistics();
    return stats;
}

} // namespace peerq
