#pragma once

#include "file_tree.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>

namespace meshshare {

/**
 * Transfer direction as seen from this device
 */
enum class TransferDirection {
    Incoming,       // Peer is sending to us
    Outgoing        // We are sending to the peer
};

const char* direction_to_string(TransferDirection direction);

/**
 * Transfer record held by the registry
 */
struct Transfer {
    std::string id;                                 // Engine assigned transfer id
    TransferDirection direction;
    std::string peer;                               // Remote peer address
    TransferStatus status;
    std::string path;                               // Destination (incoming, after accept) or source (outgoing)
    std::chrono::system_clock::time_point created;
    std::vector<FileNode> files;                    // Top-level entries
    uint64_t total_size;                            // Sum of sizes of files that have started
    uint64_t total_transferred;                     // Bytes moved across started files
    bool finalized;                                 // Engine-side finalize already fired

    Transfer() : direction(TransferDirection::Incoming), status(TransferStatus::Requested),
                 created(std::chrono::system_clock::now()), total_size(0),
                 total_transferred(0), finalized(false) {}
};

Transfer make_incoming_transfer(const std::string& id, const std::string& peer, std::vector<FileNode> files);
Transfer make_outgoing_transfer(const std::string& id, const std::string& peer, const std::string& path);

/**
 * Integer percentage of total_transferred over total_size, rounded down.
 * 0 when nothing has started, never above 100.
 */
uint32_t transfer_progress_percent(const Transfer& transfer);

//=============================================================================
// History serialization
//=============================================================================

nlohmann::json file_node_to_json(const FileNode& node);
std::optional<FileNode> file_node_from_json(const nlohmann::json& json);

nlohmann::json transfer_to_json(const Transfer& transfer);
std::optional<Transfer> transfer_from_json(const nlohmann::json& json);

} // namespace meshshare
