#include "transfer_config.h"
#include "fs.h"
#include "logger.h"
#include <nlohmann/json.hpp>

#define LOG_CONFIG_INFO(message)  LOG_INFO("config", message)
#define LOG_CONFIG_WARN(message)  LOG_WARN("config", message)
#define LOG_CONFIG_ERROR(message) LOG_ERROR("config", message)

namespace peerq {

namespace {

nlohmann::json config_to_json(const TransferConfig& config) {
    nlohmann::json data;

    data["data_folder"] = config.data_folder;
    data["download_folder"] = config.download_folder;
    data["incomplete_folder"] = config.incomplete_folder;
    data["upload_folder"] = config.upload_folder;
    data["username_subfolders"] = config.username_subfolders;

    nlohmann::json filters = nlohmann::json::array();
    for (const auto& filter : config.download_filters) {
        filters.push_back({filter.pattern, filter.escaped});
    }
    data["download_filters"] = filters;
    data["enable_filters"] = config.enable_filters;
    data["autoclear_downloads"] = config.autoclear_downloads;
    data["autoclear_uploads"] = config.autoclear_uploads;
    data["remote_downloads"] = static_cast<int>(config.remote_downloads);

    data["use_upload_slots"] = config.use_upload_slots;
    data["upload_slots"] = config.upload_slots;
    data["upload_bandwidth"] = config.upload_bandwidth;
    data["file_limit"] = config.file_limit;
    data["queue_limit"] = config.queue_limit;
    data["friends_no_limits"] = config.friends_no_limits;
    data["prefer_friends"] = config.prefer_friends;
    data["fifo_queue"] = config.fifo_queue;

    data["use_custom_ban"] = config.use_custom_ban;
    data["custom_ban"] = config.custom_ban;

    data["download_speed_limit"] = speed_limit_mode_to_string(config.download_speed_limit);
    data["download_limit"] = config.download_limit;
    data["download_limit_alt"] = config.download_limit_alt;
    data["upload_speed_limit"] = speed_limit_mode_to_string(config.upload_speed_limit);
    data["upload_limit"] = config.upload_limit;
    data["upload_limit_alt"] = config.upload_limit_alt;
    data["upload_limit_by"] = config.upload_limit_by == UploadLimitScope::TOTAL ? "total" : "per_transfer";

    return data;
}

void config_from_json(const nlohmann::json& data, TransferConfig& config) {
    config.data_folder = data.value("data_folder", config.data_folder);
    config.download_folder = data.value("download_folder", config.download_folder);
    config.incomplete_folder = data.value("incomplete_folder", config.incomplete_folder);
    config.upload_folder = data.value("upload_folder", config.upload_folder);
    config.username_subfolders = data.value("username_subfolders", config.username_subfolders);

    if (data.contains("download_filters") && data["download_filters"].is_array()) {
        config.download_filters.clear();
        for (const auto& item : data["download_filters"]) {
            if (item.is_array() && item.size() == 2) {
                config.download_filters.emplace_back(item[0].get<std::string>(), item[1].get<bool>());
            } else {
                LOG_CONFIG_WARN("Ignoring malformed download filter: " << item.dump());
            }
        }
    }
    config.enable_filters = data.value("enable_filters", config.enable_filters);
    config.autoclear_downloads = data.value("autoclear_downloads", config.autoclear_downloads);
    config.autoclear_uploads = data.value("autoclear_uploads", config.autoclear_uploads);

    int remote_downloads = data.value("remote_downloads", static_cast<int>(config.remote_downloads));
    if (remote_downloads >= 0 && remote_downloads <= 3) {
        config.remote_downloads = static_cast<RemoteDownloadPermission>(remote_downloads);
    }

    config.use_upload_slots = data.value("use_upload_slots", config.use_upload_slots);
    config.upload_slots = data.value("upload_slots", config.upload_slots);
    config.upload_bandwidth = data.value("upload_bandwidth", config.upload_bandwidth);
    config.file_limit = data.value("file_limit", config.file_limit);
    config.queue_limit = data.value("queue_limit", config.queue_limit);
    config.friends_no_limits = data.value("friends_no_limits", config.friends_no_limits);
    config.prefer_friends = data.value("prefer_friends", config.prefer_friends);
    config.fifo_queue = data.value("fifo_queue", config.fifo_queue);

    config.use_custom_ban = data.value("use_custom_ban", config.use_custom_ban);
    config.custom_ban = data.value("custom_ban", config.custom_ban);

    config.download_speed_limit = speed_limit_mode_from_string(
        data.value("download_speed_limit", std::string(speed_limit_mode_to_string(config.download_speed_limit))));
    config.download_limit = data.value("download_limit", config.download_limit);
    config.download_limit_alt = data.value("download_limit_alt", config.download_limit_alt);
    config.upload_speed_limit = speed_limit_mode_from_string(
        data.value("upload_speed_limit", std::string(speed_limit_mode_to_string(config.upload_speed_limit))));
    config.upload_limit = data.value("upload_limit", config.upload_limit);
    config.upload_limit_alt = data.value("upload_limit_alt", config.upload_limit_alt);

    std::string limit_by = data.value("upload_limit_by", std::string());
    if (limit_by == "total") {
        config.upload_limit_by = UploadLimitScope::TOTAL;
    } else if (limit_by == "per_transfer") {
        config.upload_limit_by = UploadLimitScope::PER_TRANSFER;
    }
}

} // namespace

const char* speed_limit_mode_to_string(SpeedLimitMode mode) {
    switch (mode) {
        case SpeedLimitMode::PRIMARY:     return "primary";
        case SpeedLimitMode::ALTERNATIVE: return "alternative";
        case SpeedLimitMode::OFF:         return "unlimited";
    }
    return "unlimited";
}

SpeedLimitMode speed_limit_mode_from_string(const std::string& text) {
    if (text == "primary") return SpeedLimitMode::PRIMARY;
    if (text == "alternative") return SpeedLimitMode::ALTERNATIVE;
    return SpeedLimitMode::OFF;
}

bool load_transfer_config(const std::string& path, TransferConfig& config) {
    if (!file_exists(path)) {
        LOG_CONFIG_INFO("No transfer configuration at " << path << ", writing defaults");
        return save_transfer_config(path, config);
    }

    try {
        std::string config_data = read_file_text(path);
        if (config_data.empty()) {
            LOG_CONFIG_WARN("Transfer configuration file is empty, using defaults");
            return true;
        }

        nlohmann::json data = nlohmann::json::parse(config_data);
        if (!data.is_object()) {
            LOG_CONFIG_ERROR("Transfer configuration is not a JSON object: " << path);
            return false;
        }

        config_from_json(data, config);
        LOG_CONFIG_INFO("Loaded transfer configuration from " << path);
        return true;

    } catch (const nlohmann::json::exception& e) {
        LOG_CONFIG_ERROR("Failed to parse transfer configuration: " << e.what());
        return false;
    }
}

bool save_transfer_config(const std::string& path, const TransferConfig& config) {
    std::string parent = get_parent_directory(path);
    std::string error;
    if (!parent.empty() && !create_directories(parent, &error)) {
        LOG_CONFIG_ERROR("Cannot create configuration folder " << parent << ": " << error);
        return false;
    }

    if (!write_file_atomic(path, config_to_json(config).dump(4))) {
        LOG_CONFIG_ERROR("Failed to save transfer configuration to " << path);
        return false;
    }
    return true;
}

} // namespace peerq
