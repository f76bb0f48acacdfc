#include "messages.h"
#include <limits>

namespace peerq {

namespace {

// Peer messages

nlohmann::json create_message_json(const QueueUpload& msg) {
    nlohmann::json data;
    data["type"] = "QueueUpload";
    data["file"] = msg.file;
    data["legacy_client"] = msg.legacy_client;
    return data;
}

nlohmann::json create_message_json(const TransferRequest& msg) {
    nlohmann::json data;
    data["type"] = "TransferRequest";
    data["direction"] = static_cast<uint32_t>(msg.direction);
    data["token"] = msg.token;
    data["file"] = msg.file;
    data["filesize"] = msg.filesize;
    return data;
}

nlohmann::json create_message_json(const TransferResponse& msg) {
    nlohmann::json data;
    data["type"] = "TransferResponse";
    data["allowed"] = msg.allowed;
    data["token"] = msg.token;
    if (msg.allowed) {
        data["filesize"] = msg.filesize;
    } else {
        data["reason"] = msg.reason;
    }
    return data;
}

nlohmann::json create_message_json(const UploadDenied& msg) {
    nlohmann::json data;
    data["type"] = "UploadDenied";
    data["file"] = msg.file;
    data["reason"] = msg.reason;
    return data;
}

nlohmann::json create_message_json(const UploadFailed& msg) {
    nlohmann::json data;
    data["type"] = "UploadFailed";
    data["file"] = msg.file;
    return data;
}

nlohmann::json create_message_json(const PlaceInQueueRequest& msg) {
    nlohmann::json data;
    data["type"] = "PlaceInQueueRequest";
    data["file"] = msg.file;
    data["legacy_client"] = msg.legacy_client;
    return data;
}

nlohmann::json create_message_json(const PlaceInQueueResponse& msg) {
    nlohmann::json data;
    data["type"] = "PlaceInQueueResponse";
    data["filename"] = msg.filename;
    data["place"] = msg.place;
    return data;
}

nlohmann::json create_message_json(const FolderContentsRequest& msg) {
    nlohmann::json data;
    data["type"] = "FolderContentsRequest";
    data["directory"] = msg.directory;
    data["token"] = msg.token;
    return data;
}

nlohmann::json create_message_json(const FileTransferInit& msg) {
    nlohmann::json data;
    data["type"] = "FileTransferInit";
    data["token"] = msg.token;
    data["is_outgoing"] = msg.is_outgoing;
    return data;
}

nlohmann::json create_message_json(const FileOffset& msg) {
    nlohmann::json data;
    data["type"] = "FileOffset";
    data["sock"] = msg.sock;
    data["offset"] = msg.offset;
    return data;
}

// Network worker commands

nlohmann::json create_message_json(const CloseConnection& cmd) {
    nlohmann::json data;
    data["type"] = "CloseConnection";
    data["sock"] = cmd.sock;
    return data;
}

nlohmann::json create_message_json(const DownloadFile& cmd) {
    nlohmann::json data;
    data["type"] = "DownloadFile";
    data["sock"] = cmd.sock;
    data["token"] = cmd.token;
    data["file"] = cmd.file ? cmd.file->path() : "";
    data["leftbytes"] = cmd.leftbytes;
    return data;
}

nlohmann::json create_message_json(const UploadFile& cmd) {
    nlohmann::json data;
    data["type"] = "UploadFile";
    data["sock"] = cmd.sock;
    data["token"] = cmd.token;
    data["file"] = cmd.file ? cmd.file->path() : "";
    data["size"] = cmd.size;
    return data;
}

nlohmann::json create_message_json(const SetDownloadLimit& cmd) {
    nlohmann::json data;
    data["type"] = "SetDownloadLimit";
    data["limit"] = cmd.limit;
    return data;
}

nlohmann::json create_message_json(const SetUploadLimit& cmd) {
    nlohmann::json data;
    data["type"] = "SetUploadLimit";
    data["limit"] = cmd.limit;
    data["limit_by"] = cmd.limit_by == UploadLimitScope::TOTAL ? "total" : "per_transfer";
    return data;
}

} // namespace

uint32_t increment_token(uint32_t token) {
    if (token >= static_cast<uint32_t>(std::numeric_limits<int32_t>::max())) {
        return 0;
    }
    return token + 1;
}

nlohmann::json message_to_json(const PeerMessage& message) {
    return std::visit([](const auto& msg) { return create_message_json(msg); }, message);
}

nlohmann::json message_to_json(const NetworkCommand& command) {
    return std::visit([](const auto& cmd) { return create_message_json(cmd); }, command);
}

std::string message_name(const PeerMessage& message) {
    return message_to_json(message)["type"].get<std::string>();
}

std::string message_name(const NetworkCommand& command) {
    return message_to_json(command)["type"].get<std::string>();
}

} // namespace peerq
