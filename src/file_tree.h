#pragma once

/**
 * @file file_tree.h
 * @brief Recursive file/directory model of a transfer
 *
 * A transfer carries a list of top-level file nodes. Directories hold their
 * entries as ordered children; the full relative path of a node is the
 * concatenation of its ancestors' ids joined with '/'. Only leaves (nodes
 * without children) take part in status aggregation.
 */

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace meshshare {

//=============================================================================
// Status
//=============================================================================

/**
 * @brief File and transfer status
 *
 * Values below 100 are the numeric codes reported by the transfer engine in
 * TransferFinished events. Requested, Ongoing and FinishedWithErrors only
 * exist on this side.
 */
enum class TransferStatus : int {
    Success = 0,
    Canceled = 1,
    BadPath = 2,
    BadFile = 3,
    Transport = 4,
    BadStatus = 5,
    ServiceStop = 6,
    BadTransfer = 7,
    BadTransferState = 8,
    BadFileId = 9,
    BadSystemTime = 10,
    TruncatedFile = 11,
    EventSend = 12,
    BadUuid = 13,
    ChannelClosed = 14,
    Io = 15,
    DataSend = 16,
    DirectoryNotExpected = 17,
    EmptyTransfer = 18,
    TransferClosedByPeer = 19,
    TransferLimitsExceeded = 20,
    MismatchedSize = 21,
    UnexpectedData = 22,
    InvalidArgument = 23,
    TransferTimeout = 24,
    WsServer = 25,
    BadFileChecksum = 26,
    FileModified = 27,

    Requested = 100,
    Ongoing = 101,
    FinishedWithErrors = 102
};

/**
 * @brief Convert status to its enumerator name ("Success", "BadFile", ...)
 */
const char* status_to_string(TransferStatus status);

/**
 * @brief Human readable description used in notifications ("transport problem", ...)
 */
const char* status_description(TransferStatus status);

/**
 * @brief Map any known numeric code (engine codes and 100..102) to a status
 */
std::optional<TransferStatus> status_from_code(int64_t code);

/**
 * @brief Map the status code carried by a FileFailed event to a failure status
 *
 * Absent, unknown, Success and Canceled codes are not failures and map to BadStatus.
 */
TransferStatus failure_status_from_code(std::optional<int64_t> code);

// Success, Canceled or FinishedWithErrors
bool is_terminal_status(TransferStatus status);

// Neither Requested nor Ongoing
bool is_resolved_status(TransferStatus status);

// A resolved status other than Success and Canceled
bool is_failure_status(TransferStatus status);

//=============================================================================
// Tree
//=============================================================================

/**
 * File or directory entry of a transfer
 */
struct FileNode {
    std::string id;                     // Path segment of this entry
    uint64_t size;                      // Byte size (0 for directories)
    TransferStatus status;              // Meaningful for leaves only
    uint64_t transferred;               // Bytes received/sent for this file
    std::vector<FileNode> children;     // Directory entries in engine order

    FileNode() : size(0), status(TransferStatus::Requested), transferred(0) {}
    FileNode(std::string node_id, uint64_t node_size)
        : id(std::move(node_id)), size(node_size), status(TransferStatus::Requested), transferred(0) {}

    bool is_leaf() const { return children.empty(); }
};

/**
 * Flattened view of a node together with its full relative path
 */
struct FileEntry {
    std::string path;
    FileNode* node;
};

struct ConstFileEntry {
    std::string path;
    const FileNode* node;
};

/**
 * Depth-first listing of every directory and leaf reachable from files,
 * in the order the tree holds them. A directory precedes its entries.
 */
std::vector<FileEntry> flatten_files(std::vector<FileNode>& files);
std::vector<ConstFileEntry> flatten_files(const std::vector<FileNode>& files);

size_t count_leaves(const std::vector<FileNode>& files);

/**
 * Exact lookup by full relative path. Returns nullptr for unknown paths.
 */
FileNode* find_file(std::vector<FileNode>& files, const std::string& path);
const FileNode* find_file(const std::vector<FileNode>& files, const std::string& path);

/**
 * Set the status of the leaf at path. For a directory path every leaf below
 * it is updated. Unknown paths are ignored.
 */
void set_file_status(std::vector<FileNode>& files, const std::string& path, TransferStatus status);

// Set the status of every leaf
void set_all_file_status(std::vector<FileNode>& files, TransferStatus status);

/**
 * Move every leaf that is still Requested or Ongoing to status.
 * @return number of leaves changed
 */
size_t resolve_pending_files(std::vector<FileNode>& files, TransferStatus status);

// Sum of leaf sizes below node (its own size for a leaf)
uint64_t leaf_size(const FileNode& node);
uint64_t total_leaf_size(const std::vector<FileNode>& files);

/**
 * Derive the transfer status from the leaf statuses.
 *
 * Every leaf Canceled gives Canceled, every leaf Success gives Success, every
 * leaf resolved with at least one failure gives FinishedWithErrors. Anything
 * else (pending leaves, or a mix of Success and Canceled) keeps current.
 */
TransferStatus aggregate_status(const std::vector<FileNode>& files, TransferStatus current);

} // namespace meshshare
