#include "transfer_registry.h"
#include "transfer_log_macros.h"
#include "fs.h"

namespace peerq {

namespace {

// Row layout of the transfer list files
enum RowField {
    ROW_USERNAME = 0,
    ROW_VIRTUAL_PATH = 1,
    ROW_FOLDER_PATH = 2,
    ROW_STATUS = 3,
    ROW_SIZE = 4,
    ROW_OFFSET = 5,
    ROW_ATTRIBUTES = 6
};

TransferStatus loaded_status(const std::string& text) {
    if (text == "Aborted") {
        return TransferStatus::PAUSED;
    }

    std::optional<TransferStatus> status = status_from_string(text);
    if (!status) {
        return TransferStatus::QUEUED;
    }

    switch (*status) {
        case TransferStatus::FINISHED:
        case TransferStatus::PAUSED:
        case TransferStatus::FILTERED:
        case TransferStatus::USER_LOGGED_OFF:
            return *status;
        default:
            // Anything in flight or waiting restarts from the queue
            return TransferStatus::QUEUED;
    }
}

std::map<uint32_t, uint32_t> parse_file_attributes(const nlohmann::json& value) {
    std::map<uint32_t, uint32_t> attributes;

    if (value.is_object()) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (!it.value().is_number_unsigned()) {
                continue;
            }
            try {
                attributes[static_cast<uint32_t>(std::stoul(it.key()))] = it.value().get<uint32_t>();
            } catch (const std::exception&) {
                // Non-numeric attribute key
            }
        }
    } else if (value.is_array() && value.size() >= 2) {
        // Older lists stored [bitrate, duration]
        if (value[0].is_number_unsigned() && value[0].get<uint32_t>() > 0) {
            attributes[0] = value[0].get<uint32_t>();
        }
        if (value[1].is_number_unsigned() && value[1].get<uint32_t>() > 0) {
            attributes[1] = value[1].get<uint32_t>();
        }
    }

    return attributes;
}

std::unique_ptr<Transfer> transfer_from_row(const nlohmann::json& row, bool load_only_finished) {
    if (!row.is_array() || row.size() < 2
            || !row[ROW_USERNAME].is_string() || !row[ROW_VIRTUAL_PATH].is_string()) {
        return nullptr;
    }

    std::string status_text;
    if (row.size() > ROW_STATUS && row[ROW_STATUS].is_string()) {
        status_text = row[ROW_STATUS].get<std::string>();
    }

    if (load_only_finished && status_text != status_to_string(TransferStatus::FINISHED)) {
        return nullptr;
    }

    std::string folder_path;
    if (row.size() > ROW_FOLDER_PATH && row[ROW_FOLDER_PATH].is_string()) {
        folder_path = row[ROW_FOLDER_PATH].get<std::string>();
    }

    uint64_t size = 0;
    if (row.size() > ROW_SIZE && row[ROW_SIZE].is_number_unsigned()) {
        size = row[ROW_SIZE].get<uint64_t>();
    }

    auto transfer = std::make_unique<Transfer>(
        row[ROW_USERNAME].get<std::string>(), row[ROW_VIRTUAL_PATH].get<std::string>(),
        folder_path, size);

    transfer->status = loaded_status(status_text);

    if (row.size() > ROW_OFFSET && row[ROW_OFFSET].is_number_unsigned()) {
        transfer->current_byte_offset = row[ROW_OFFSET].get<uint64_t>();
    }

    if (row.size() > ROW_ATTRIBUTES) {
        transfer->file_attributes = parse_file_attributes(row[ROW_ATTRIBUTES]);
    }

    if (transfer->status == TransferStatus::FINISHED) {
        transfer->current_byte_offset = transfer->size;
    }

    return transfer;
}

} // namespace

nlohmann::json TransferRegistry::get_transfer_rows() const {
    nlohmann::json rows = nlohmann::json::array();

    for (const auto& record : records_) {
        const Transfer& transfer = *record;

        nlohmann::json attributes = nlohmann::json::object();
        for (const auto& attribute : transfer.file_attributes) {
            attributes[std::to_string(attribute.first)] = attribute.second;
        }

        nlohmann::json offset = nullptr;
        if (transfer.current_byte_offset) {
            offset = *transfer.current_byte_offset;
        }

        rows.push_back({
            transfer.username,
            transfer.virtual_path,
            transfer.folder_path,
            status_to_string(transfer.status),
            transfer.size,
            offset,
            attributes
        });
    }

    return rows;
}

bool TransferRegistry::save_transfers(const std::string& path) const {
    std::string parent = get_parent_directory(path);
    std::string error;
    if (!parent.empty() && !create_directories(parent, &error)) {
        LOG_ERROR(log_module(), "Cannot create folder for transfer list " << path << ": " << error);
        return false;
    }

    if (!write_file_atomic(path, get_transfer_rows().dump(4))) {
        LOG_ERROR(log_module(), "Failed to save transfer list " << path);
        return false;
    }

    LOG_DEBUG(log_module(), "Saved " << records_.size() << " transfers to " << path);
    return true;
}

std::vector<std::unique_ptr<Transfer>> TransferRegistry::load_transfers(const std::string& path,
                                                                         bool load_only_finished) {
    std::vector<std::unique_ptr<Transfer>> transfers;

    if (!file_exists(path)) {
        return transfers;
    }

    std::string data = read_file_text(path);
    if (data.empty()) {
        return transfers;
    }

    if (static_cast<unsigned char>(data[0]) == 0x80) {
        LOG_WARN("transfers", "Transfer list " << path << " uses the binary pickle format, skipping it");
        return transfers;
    }

    try {
        nlohmann::json rows = nlohmann::json::parse(data);
        if (!rows.is_array()) {
            LOG_ERROR("transfers", "Transfer list " << path << " is not a list of transfers");
            return transfers;
        }

        for (const auto& row : rows) {
            std::unique_ptr<Transfer> transfer = transfer_from_row(row, load_only_finished);
            if (transfer) {
                transfers.push_back(std::move(transfer));
            }
        }

    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("transfers", "Failed to parse transfer list " << path << ": " << e.what());
        transfers.clear();
    }

    return transfers;
}

} // namespace peerq
