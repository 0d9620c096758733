#include "transfer.h"
#include "logger.h"
#include <limits>

#define LOG_TRANSFER_WARN(message) LOG_WARN("transfer", message)

namespace meshshare {

const char* direction_to_string(TransferDirection direction) {
    switch (direction) {
        case TransferDirection::Incoming: return "incoming";
        case TransferDirection::Outgoing: return "outgoing";
        default: return "unknown";
    }
}

Transfer make_incoming_transfer(const std::string& id, const std::string& peer, std::vector<FileNode> files) {
    Transfer transfer;
    transfer.id = id;
    transfer.direction = TransferDirection::Incoming;
    transfer.peer = peer;
    transfer.status = TransferStatus::Requested;
    transfer.files = std::move(files);
    return transfer;
}

Transfer make_outgoing_transfer(const std::string& id, const std::string& peer, const std::string& path) {
    Transfer transfer;
    transfer.id = id;
    transfer.direction = TransferDirection::Outgoing;
    transfer.peer = peer;
    transfer.status = TransferStatus::Requested;
    transfer.path = path;
    return transfer;
}

uint32_t transfer_progress_percent(const Transfer& transfer) {
    if (transfer.total_size == 0) {
        return 0;
    }
    if (transfer.total_transferred >= transfer.total_size) {
        return 100;
    }
    if (transfer.total_size > std::numeric_limits<uint64_t>::max() / 100) {
        return static_cast<uint32_t>(transfer.total_transferred / (transfer.total_size / 100));
    }
    return static_cast<uint32_t>(transfer.total_transferred * 100 / transfer.total_size);
}

//=============================================================================
// History serialization
//=============================================================================

nlohmann::json file_node_to_json(const FileNode& node) {
    nlohmann::json json;
    json["id"] = node.id;
    json["size"] = node.size;
    json["status"] = static_cast<int>(node.status);
    json["transferred"] = node.transferred;

    nlohmann::json children = nlohmann::json::array();
    for (const auto& child : node.children) {
        children.push_back(file_node_to_json(child));
    }
    json["children"] = children;
    return json;
}

std::optional<FileNode> file_node_from_json(const nlohmann::json& json) {
    try {
        FileNode node;
        node.id = json.at("id").get<std::string>();
        node.size = json.value("size", static_cast<uint64_t>(0));
        node.transferred = json.value("transferred", static_cast<uint64_t>(0));

        auto status = status_from_code(json.value("status", static_cast<int64_t>(TransferStatus::Requested)));
        node.status = status ? *status : TransferStatus::BadStatus;

        if (json.contains("children")) {
            for (const auto& child_json : json["children"]) {
                auto child = file_node_from_json(child_json);
                if (!child) {
                    return std::nullopt;
                }
                node.children.push_back(std::move(*child));
            }
        }
        return node;
    } catch (const nlohmann::json::exception& e) {
        LOG_TRANSFER_WARN("Invalid file entry in history: " << e.what());
        return std::nullopt;
    }
}

nlohmann::json transfer_to_json(const Transfer& transfer) {
    nlohmann::json json;
    json["id"] = transfer.id;
    json["direction"] = direction_to_string(transfer.direction);
    json["peer"] = transfer.peer;
    json["status"] = static_cast<int>(transfer.status);
    json["path"] = transfer.path;
    json["created"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        transfer.created.time_since_epoch()).count();
    json["total_size"] = transfer.total_size;
    json["total_transferred"] = transfer.total_transferred;
    json["finalized"] = transfer.finalized;

    nlohmann::json files = nlohmann::json::array();
    for (const auto& node : transfer.files) {
        files.push_back(file_node_to_json(node));
    }
    json["files"] = files;
    return json;
}

std::optional<Transfer> transfer_from_json(const nlohmann::json& json) {
    try {
        Transfer transfer;
        transfer.id = json.at("id").get<std::string>();
        if (transfer.id.empty()) {
            LOG_TRANSFER_WARN("History entry without transfer id");
            return std::nullopt;
        }

        std::string direction = json.value("direction", "incoming");
        transfer.direction = direction == "outgoing" ? TransferDirection::Outgoing : TransferDirection::Incoming;
        transfer.peer = json.value("peer", "");
        transfer.path = json.value("path", "");

        auto status = status_from_code(json.value("status", static_cast<int64_t>(TransferStatus::Requested)));
        transfer.status = status ? *status : TransferStatus::BadStatus;

        int64_t created_ms = json.value("created", static_cast<int64_t>(0));
        transfer.created = std::chrono::system_clock::time_point(std::chrono::milliseconds(created_ms));
        transfer.total_size = json.value("total_size", static_cast<uint64_t>(0));
        transfer.total_transferred = json.value("total_transferred", static_cast<uint64_t>(0));
        transfer.finalized = json.value("finalized", false);

        if (json.contains("files")) {
            for (const auto& file_json : json["files"]) {
                auto node = file_node_from_json(file_json);
                if (!node) {
                    return std::nullopt;
                }
                transfer.files.push_back(std::move(*node));
            }
        }
        return transfer;
    } catch (const nlohmann::json::exception& e) {
        LOG_TRANSFER_WARN("Invalid transfer entry in history: " << e.what());
        return std::nullopt;
    }
}

} // namespace meshshare
