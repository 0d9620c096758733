#include "notifications.h"
#include "meshshare_log_macros.h"

namespace meshshare {

const char* const ACTION_KEY_ACCEPT_TRANSFER = "accept_transfer";
const char* const ACTION_KEY_CANCEL_TRANSFER = "cancel_transfer";
const char* const ACTION_KEY_OPEN_FILE = "open_file";

const char* const NOTIFY_NEW_TRANSFER_SUMMARY = "New file transfer";
const char* const NOTIFY_ACCEPT_FAILED_SUMMARY = "Failed to accept transfer";
const char* const NOTIFY_CANCEL_FAILED_SUMMARY = "Failed to cancel transfer";

const char* const NOTIFY_DOWNLOAD_DIR_NOT_FOUND = "Download directory does not exist.";
const char* const NOTIFY_DOWNLOAD_DIR_IS_SYMLINK = "Download directory is a symlink. Please choose a regular directory.";
const char* const NOTIFY_DOWNLOAD_DIR_NOT_A_DIRECTORY = "Download location is not a directory.";
const char* const NOTIFY_NOT_ENOUGH_SPACE = "There is not enough space on the device for this transfer.";
const char* const NOTIFY_TRANSFER_ALREADY_ACCEPTED = "The transfer was already accepted.";
const char* const NOTIFY_TRANSFER_TOO_LARGE = "The transfer exceeds the allowed size.";
const char* const NOTIFY_ACCEPT_ERROR_GENERIC = "Something went wrong while accepting the transfer.";
const char* const NOTIFY_TRANSFER_NOT_CANCELABLE = "The transfer has already finished and can no longer be canceled.";
const char* const NOTIFY_CANCEL_ERROR_GENERIC = "Something went wrong while canceling the transfer.";

//=============================================================================
// Builders
//=============================================================================

Notification make_new_transfer_notification(const std::string& transfer_id, const std::string& peer_name) {
    Notification notification;
    notification.summary = NOTIFY_NEW_TRANSFER_SUMMARY;
    notification.body = "Transfer ID: " + transfer_id + "\nFrom: " + peer_name;
    notification.actions.emplace_back(ACTION_KEY_ACCEPT_TRANSFER, "Accept");
    notification.actions.emplace_back(ACTION_KEY_CANCEL_TRANSFER, "Cancel");
    return notification;
}

Notification make_file_finished_notification(TransferDirection direction, FinishReason reason,
                                             TransferStatus file_status, const std::string& file_id) {
    Notification notification;
    notification.body = file_id;

    switch (reason) {
        case FinishReason::FileDownloaded:
            notification.summary = "downloaded";
            if (direction == TransferDirection::Incoming) {
                notification.actions.emplace_back(ACTION_KEY_OPEN_FILE, "Open");
            }
            break;
        case FinishReason::FileUploaded:
            notification.summary = "uploaded";
            break;
        case FinishReason::FileCanceled:
            notification.summary = "canceled";
            break;
        default:
            notification.summary = status_description(file_status);
            break;
    }
    return notification;
}

Notification make_transfer_finished_notification(const std::string& transfer_id, TransferStatus status) {
    Notification notification;
    notification.summary = status == TransferStatus::Canceled ? "Transfer canceled" : "Transfer failed";
    notification.body = "Transfer ID: " + transfer_id;
    return notification;
}

//=============================================================================
// LogNotifier
//=============================================================================

std::optional<uint32_t> LogNotifier::send_notification(const std::string& summary, const std::string& body,
                                                       const std::vector<NotificationAction>& actions) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return std::nullopt;
    }

    uint32_t id = next_id_++;

    std::ostringstream action_list;
    for (size_t i = 0; i < actions.size(); i++) {
        action_list << (i == 0 ? "" : ", ") << actions[i].label << " [" << actions[i].key << "]";
    }

    LOG_INFO("notify", "#" << id << " " << summary << ": " << body
             << (actions.empty() ? "" : " | actions: ") << action_list.str());
    return id;
}

bool LogNotifier::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    return true;
}

//=============================================================================
// NotificationManager
//=============================================================================

NotificationManager::NotificationManager(EventManager& events,
                                         std::shared_ptr<Notifier> notifier,
                                         std::shared_ptr<FilesystemProbe> filesystem,
                                         const std::string& download_directory,
                                         uint64_t size_limit,
                                         OpenFileCallback open_file_callback)
    : events_(events), notifier_(std::move(notifier)), filesystem_(std::move(filesystem)),
      size_limit_(size_limit), open_file_callback_(std::move(open_file_callback)),
      download_directory_(download_directory) {
}

NotificationManager::~NotificationManager() {
    if (notifier_ && !notifier_->close()) {
        LOG_NOTIFY_WARN("Failed to close notifier");
    }
}

void NotificationManager::set_download_directory(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    download_directory_ = path;
}

std::string NotificationManager::get_download_directory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return download_directory_;
}

std::optional<uint32_t> NotificationManager::send(const Notification& notification) {
    if (!notifier_) {
        return std::nullopt;
    }

    auto id = notifier_->send_notification(notification.summary, notification.body, notification.actions);
    if (!id) {
        LOG_NOTIFY_ERROR("Failed to send notification: " << notification.summary);
    }
    return id;
}

void NotificationManager::notify_accept_failed(const char* body) {
    Notification notification;
    notification.summary = NOTIFY_ACCEPT_FAILED_SUMMARY;
    notification.body = body;
    send(notification);
}

void NotificationManager::notify_cancel_failed(const char* body) {
    Notification notification;
    notification.summary = NOTIFY_CANCEL_FAILED_SUMMARY;
    notification.body = body;
    send(notification);
}

std::optional<std::string> NotificationManager::find_transfer(uint32_t notification_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(notification_id);
    if (it == transfers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void NotificationManager::on_new_transfer(const Transfer& transfer, const std::string& peer_name) {
    auto id = send(make_new_transfer_notification(transfer.id, peer_name));
    if (!id) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    transfers_[*id] = transfer.id;
}

void NotificationManager::on_file_finished(const Transfer& transfer, const FinishEventData& finish,
                                           TransferStatus file_status) {
    Notification notification = make_file_finished_notification(transfer.direction, finish.reason,
                                                                file_status, finish.file_id);
    auto id = send(notification);
    if (!id || notification.actions.empty()) {
        return;
    }

    std::string path = finish.final_path;
    if (path.empty()) {
        path = transfer.path.empty() ? finish.file_id : combine_paths(transfer.path, finish.file_id);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    downloaded_files_[*id] = path;
}

void NotificationManager::on_transfer_finished(const Transfer& transfer, FinishReason reason) {
    TransferStatus status = reason == FinishReason::TransferCanceled ? TransferStatus::Canceled
                                                                     : TransferStatus::FinishedWithErrors;
    send(make_transfer_finished_notification(transfer.id, status));
}

bool NotificationManager::accept_transfer(uint32_t notification_id) {
    auto transfer_id = find_transfer(notification_id);
    if (!transfer_id) {
        LOG_NOTIFY_WARN("No transfer for notification " << notification_id);
        notify_accept_failed(NOTIFY_ACCEPT_ERROR_GENERIC);
        return false;
    }

    auto transfer = events_.get_transfer(*transfer_id);
    if (!transfer) {
        LOG_NOTIFY_WARN("Transfer " << *transfer_id << " no longer exists");
        notify_accept_failed(NOTIFY_ACCEPT_ERROR_GENERIC);
        return false;
    }

    std::string destination = get_download_directory();
    DownloadDirectoryStatus directory_status = DownloadDirectoryStatus::ProbeFailed;
    if (filesystem_) {
        directory_status = filesystem_->check_download_directory(destination, total_leaf_size(transfer->files));
    }

    if (directory_status != DownloadDirectoryStatus::Ok) {
        LOG_NOTIFY_WARN("Cannot accept transfer " << *transfer_id << " into " << destination << ": "
                        << download_directory_status_to_string(directory_status));
        switch (directory_status) {
            case DownloadDirectoryStatus::NotFound:
                notify_accept_failed(NOTIFY_DOWNLOAD_DIR_NOT_FOUND);
                break;
            case DownloadDirectoryStatus::Symlink:
                notify_accept_failed(NOTIFY_DOWNLOAD_DIR_IS_SYMLINK);
                break;
            case DownloadDirectoryStatus::NotADirectory:
                notify_accept_failed(NOTIFY_DOWNLOAD_DIR_NOT_A_DIRECTORY);
                break;
            case DownloadDirectoryStatus::NotEnoughSpace:
                notify_accept_failed(NOTIFY_NOT_ENOUGH_SPACE);
                break;
            default:
                notify_accept_failed(NOTIFY_ACCEPT_ERROR_GENERIC);
                break;
        }
        return false;
    }

    FileshareError error = events_.accept_transfer(*transfer_id, destination, {}, size_limit_);
    switch (error) {
        case FileshareError::None:
            return true;
        case FileshareError::TransferAlreadyAccepted:
            notify_accept_failed(NOTIFY_TRANSFER_ALREADY_ACCEPTED);
            break;
        case FileshareError::SizeLimitExceeded:
            notify_accept_failed(NOTIFY_TRANSFER_TOO_LARGE);
            break;
        default:
            notify_accept_failed(NOTIFY_ACCEPT_ERROR_GENERIC);
            break;
    }

    LOG_NOTIFY_WARN("Failed to accept transfer " << *transfer_id << ": " << error_to_string(error));
    return false;
}

bool NotificationManager::cancel_transfer(uint32_t notification_id) {
    auto transfer_id = find_transfer(notification_id);
    if (!transfer_id) {
        LOG_NOTIFY_WARN("No transfer for notification " << notification_id);
        notify_cancel_failed(NOTIFY_CANCEL_ERROR_GENERIC);
        return false;
    }

    FileshareError error = events_.cancel_transfer(*transfer_id);
    if (error == FileshareError::None) {
        return true;
    }

    LOG_NOTIFY_WARN("Failed to cancel transfer " << *transfer_id << ": " << error_to_string(error));
    if (error == FileshareError::TransferNotCancelable) {
        notify_cancel_failed(NOTIFY_TRANSFER_NOT_CANCELABLE);
    } else {
        notify_cancel_failed(NOTIFY_CANCEL_ERROR_GENERIC);
    }
    return false;
}

bool NotificationManager::open_file(uint32_t notification_id) {
    std::string path;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = downloaded_files_.find(notification_id);
        if (it == downloaded_files_.end()) {
            LOG_NOTIFY_DEBUG("Nothing to open for notification " << notification_id);
            return false;
        }
        path = it->second;
        downloaded_files_.erase(it);
    }

    if (!open_file_callback_) {
        LOG_NOTIFY_WARN("No handler to open " << path);
        return false;
    }

    if (!open_file_callback_(path)) {
        LOG_NOTIFY_ERROR("Failed to open " << path);
        return false;
    }
    return true;
}

bool NotificationManager::handle_action(uint32_t notification_id, const std::string& action_key) {
    if (action_key == ACTION_KEY_ACCEPT_TRANSFER) {
        return accept_transfer(notification_id);
    } else if (action_key == ACTION_KEY_CANCEL_TRANSFER) {
        return cancel_transfer(notification_id);
    } else if (action_key == ACTION_KEY_OPEN_FILE) {
        return open_file(notification_id);
    }

    LOG_NOTIFY_WARN("Unknown notification action: " << action_key);
    return false;
}

} // namespace meshshare
