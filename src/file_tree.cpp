#include "file_tree.h"

namespace meshshare {

//=============================================================================
// Status
//=============================================================================

const char* status_to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::Success: return "Success";
        case TransferStatus::Canceled: return "Canceled";
        case TransferStatus::BadPath: return "BadPath";
        case TransferStatus::BadFile: return "BadFile";
        case TransferStatus::Transport: return "Transport";
        case TransferStatus::BadStatus: return "BadStatus";
        case TransferStatus::ServiceStop: return "ServiceStop";
        case TransferStatus::BadTransfer: return "BadTransfer";
        case TransferStatus::BadTransferState: return "BadTransferState";
        case TransferStatus::BadFileId: return "BadFileId";
        case TransferStatus::BadSystemTime: return "BadSystemTime";
        case TransferStatus::TruncatedFile: return "TruncatedFile";
        case TransferStatus::EventSend: return "EventSend";
        case TransferStatus::BadUuid: return "BadUuid";
        case TransferStatus::ChannelClosed: return "ChannelClosed";
        case TransferStatus::Io: return "Io";
        case TransferStatus::DataSend: return "DataSend";
        case TransferStatus::DirectoryNotExpected: return "DirectoryNotExpected";
        case TransferStatus::EmptyTransfer: return "EmptyTransfer";
        case TransferStatus::TransferClosedByPeer: return "TransferClosedByPeer";
        case TransferStatus::TransferLimitsExceeded: return "TransferLimitsExceeded";
        case TransferStatus::MismatchedSize: return "MismatchedSize";
        case TransferStatus::UnexpectedData: return "UnexpectedData";
        case TransferStatus::InvalidArgument: return "InvalidArgument";
        case TransferStatus::TransferTimeout: return "TransferTimeout";
        case TransferStatus::WsServer: return "WsServer";
        case TransferStatus::BadFileChecksum: return "BadFileChecksum";
        case TransferStatus::FileModified: return "FileModified";
        case TransferStatus::Requested: return "Requested";
        case TransferStatus::Ongoing: return "Ongoing";
        case TransferStatus::FinishedWithErrors: return "FinishedWithErrors";
        default: return "Unknown";
    }
}

const char* status_description(TransferStatus status) {
    switch (status) {
        case TransferStatus::Success: return "completed";
        case TransferStatus::Canceled: return "canceled";
        case TransferStatus::BadPath: return "invalid path";
        case TransferStatus::BadFile: return "invalid file";
        case TransferStatus::Transport: return "transport problem";
        case TransferStatus::BadStatus: return "unknown error";
        case TransferStatus::ServiceStop: return "service stopped";
        case TransferStatus::BadTransfer: return "invalid transfer";
        case TransferStatus::BadTransferState: return "invalid transfer state";
        case TransferStatus::BadFileId: return "invalid file id";
        case TransferStatus::BadSystemTime: return "invalid system time";
        case TransferStatus::TruncatedFile: return "file truncated";
        case TransferStatus::EventSend: return "event send failure";
        case TransferStatus::BadUuid: return "invalid transfer id";
        case TransferStatus::ChannelClosed: return "channel closed";
        case TransferStatus::Io: return "IO error";
        case TransferStatus::DataSend: return "data send failure";
        case TransferStatus::DirectoryNotExpected: return "directory not expected";
        case TransferStatus::EmptyTransfer: return "empty transfer";
        case TransferStatus::TransferClosedByPeer: return "transfer closed by peer";
        case TransferStatus::TransferLimitsExceeded: return "transfer limits exceeded";
        case TransferStatus::MismatchedSize: return "mismatched size";
        case TransferStatus::UnexpectedData: return "unexpected data";
        case TransferStatus::InvalidArgument: return "invalid argument";
        case TransferStatus::TransferTimeout: return "transfer timed out";
        case TransferStatus::WsServer: return "websocket server error";
        case TransferStatus::BadFileChecksum: return "file checksum mismatch";
        case TransferStatus::FileModified: return "file modified during transfer";
        case TransferStatus::Requested: return "waiting for acceptance";
        case TransferStatus::Ongoing: return "in progress";
        case TransferStatus::FinishedWithErrors: return "finished with errors";
        default: return "unknown status";
    }
}

std::optional<TransferStatus> status_from_code(int64_t code) {
    if (code >= static_cast<int64_t>(TransferStatus::Success) &&
        code <= static_cast<int64_t>(TransferStatus::FileModified)) {
        return static_cast<TransferStatus>(code);
    }
    if (code >= static_cast<int64_t>(TransferStatus::Requested) &&
        code <= static_cast<int64_t>(TransferStatus::FinishedWithErrors)) {
        return static_cast<TransferStatus>(code);
    }
    return std::nullopt;
}

TransferStatus failure_status_from_code(std::optional<int64_t> code) {
    if (!code) {
        return TransferStatus::BadStatus;
    }

    auto status = status_from_code(*code);
    if (!status || !is_failure_status(*status)) {
        return TransferStatus::BadStatus;
    }
    return *status;
}

bool is_terminal_status(TransferStatus status) {
    return status == TransferStatus::Success ||
           status == TransferStatus::Canceled ||
           status == TransferStatus::FinishedWithErrors;
}

bool is_resolved_status(TransferStatus status) {
    return status != TransferStatus::Requested && status != TransferStatus::Ongoing;
}

bool is_failure_status(TransferStatus status) {
    return is_resolved_status(status) &&
           status != TransferStatus::Success &&
           status != TransferStatus::Canceled;
}

//=============================================================================
// Tree
//=============================================================================

namespace {

std::string child_path(const std::string& parent, const std::string& id) {
    return parent.empty() ? id : parent + "/" + id;
}

template <typename Node, typename Entry>
void flatten_into(Node& node, const std::string& parent, std::vector<Entry>& out) {
    std::string path = child_path(parent, node.id);
    out.push_back(Entry{path, &node});
    for (auto& child : node.children) {
        flatten_into(child, path, out);
    }
}

template <typename Func>
void for_each_leaf(std::vector<FileNode>& files, Func&& func) {
    for (auto& node : files) {
        if (node.is_leaf()) {
            func(node);
        } else {
            for_each_leaf(node.children, func);
        }
    }
}

template <typename Func>
void for_each_leaf(const std::vector<FileNode>& files, Func&& func) {
    for (const auto& node : files) {
        if (node.is_leaf()) {
            func(node);
        } else {
            for_each_leaf(node.children, func);
        }
    }
}

} // anonymous namespace

std::vector<FileEntry> flatten_files(std::vector<FileNode>& files) {
    std::vector<FileEntry> entries;
    for (auto& node : files) {
        flatten_into(node, "", entries);
    }
    return entries;
}

std::vector<ConstFileEntry> flatten_files(const std::vector<FileNode>& files) {
    std::vector<ConstFileEntry> entries;
    for (const auto& node : files) {
        flatten_into(node, "", entries);
    }
    return entries;
}

size_t count_leaves(const std::vector<FileNode>& files) {
    size_t count = 0;
    for_each_leaf(files, [&count](const FileNode&) { count++; });
    return count;
}

FileNode* find_file(std::vector<FileNode>& files, const std::string& path) {
    for (auto& entry : flatten_files(files)) {
        if (entry.path == path) {
            return entry.node;
        }
    }
    return nullptr;
}

const FileNode* find_file(const std::vector<FileNode>& files, const std::string& path) {
    for (const auto& entry : flatten_files(files)) {
        if (entry.path == path) {
            return entry.node;
        }
    }
    return nullptr;
}

void set_file_status(std::vector<FileNode>& files, const std::string& path, TransferStatus status) {
    FileNode* node = find_file(files, path);
    if (!node) {
        return;
    }

    if (node->is_leaf()) {
        node->status = status;
    } else {
        set_all_file_status(node->children, status);
    }
}

void set_all_file_status(std::vector<FileNode>& files, TransferStatus status) {
    for_each_leaf(files, [status](FileNode& leaf) { leaf.status = status; });
}

size_t resolve_pending_files(std::vector<FileNode>& files, TransferStatus status) {
    size_t changed = 0;
    for_each_leaf(files, [status, &changed](FileNode& leaf) {
        if (!is_resolved_status(leaf.status)) {
            leaf.status = status;
            changed++;
        }
    });
    return changed;
}

uint64_t leaf_size(const FileNode& node) {
    if (node.is_leaf()) {
        return node.size;
    }
    return total_leaf_size(node.children);
}

uint64_t total_leaf_size(const std::vector<FileNode>& files) {
    uint64_t total = 0;
    for_each_leaf(files, [&total](const FileNode& leaf) { total += leaf.size; });
    return total;
}

TransferStatus aggregate_status(const std::vector<FileNode>& files, TransferStatus current) {
    size_t leaves = 0;
    size_t pending = 0;
    size_t succeeded = 0;
    size_t canceled = 0;
    size_t failed = 0;

    for_each_leaf(files, [&](const FileNode& leaf) {
        leaves++;
        if (!is_resolved_status(leaf.status)) {
            pending++;
        } else if (leaf.status == TransferStatus::Success) {
            succeeded++;
        } else if (leaf.status == TransferStatus::Canceled) {
            canceled++;
        } else {
            failed++;
        }
    });

    if (leaves == 0 || pending > 0) {
        return current;
    }
    if (canceled == leaves) {
        return TransferStatus::Canceled;
    }
    if (failed > 0) {
        return TransferStatus::FinishedWithErrors;
    }
    // Every leaf resolved, some downloaded and the rest canceled
    return TransferStatus::Success;
}

} // namespace meshshare
