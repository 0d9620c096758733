#pragma once

/**
 * @file notifications.h
 * @brief User-facing notifications for transfer milestones
 *
 * The builders map transfer events to a summary, a body and a set of
 * actions. NotificationManager sends them through a Notifier and carries
 * out the actions (accept, cancel, open) the user picks.
 */

#include "event_manager.h"
#include "fs.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace meshshare {

//=============================================================================
// Notification model
//=============================================================================

extern const char* const ACTION_KEY_ACCEPT_TRANSFER;
extern const char* const ACTION_KEY_CANCEL_TRANSFER;
extern const char* const ACTION_KEY_OPEN_FILE;

struct NotificationAction {
    std::string key;            // Identifies the action in handle_action()
    std::string label;          // Button text

    NotificationAction() = default;
    NotificationAction(std::string k, std::string l) : key(std::move(k)), label(std::move(l)) {}

    bool operator==(const NotificationAction& other) const {
        return key == other.key && label == other.label;
    }
};

struct Notification {
    std::string summary;
    std::string body;
    std::vector<NotificationAction> actions;
};

// Summaries and bodies shared with the action handlers
extern const char* const NOTIFY_NEW_TRANSFER_SUMMARY;
extern const char* const NOTIFY_ACCEPT_FAILED_SUMMARY;
extern const char* const NOTIFY_CANCEL_FAILED_SUMMARY;

extern const char* const NOTIFY_DOWNLOAD_DIR_NOT_FOUND;
extern const char* const NOTIFY_DOWNLOAD_DIR_IS_SYMLINK;
extern const char* const NOTIFY_DOWNLOAD_DIR_NOT_A_DIRECTORY;
extern const char* const NOTIFY_NOT_ENOUGH_SPACE;
extern const char* const NOTIFY_TRANSFER_ALREADY_ACCEPTED;
extern const char* const NOTIFY_TRANSFER_TOO_LARGE;
extern const char* const NOTIFY_ACCEPT_ERROR_GENERIC;
extern const char* const NOTIFY_TRANSFER_NOT_CANCELABLE;
extern const char* const NOTIFY_CANCEL_ERROR_GENERIC;

Notification make_new_transfer_notification(const std::string& transfer_id, const std::string& peer_name);

/**
 * Notification for a single finished file. Only a successful download
 * offers the Open action.
 */
Notification make_file_finished_notification(TransferDirection direction, FinishReason reason,
                                             TransferStatus file_status, const std::string& file_id);

Notification make_transfer_finished_notification(const std::string& transfer_id, TransferStatus status);

//=============================================================================
// Notifier
//=============================================================================

/**
 * Delivery of notifications to the desktop
 */
class Notifier {
public:
    virtual ~Notifier() = default;

    /**
     * @return the id assigned to the notification, nullopt if it could not be shown
     */
    virtual std::optional<uint32_t> send_notification(const std::string& summary, const std::string& body,
                                                      const std::vector<NotificationAction>& actions) = 0;
    virtual bool close() = 0;
};

/**
 * Notifier that writes notifications to the log
 */
class LogNotifier : public Notifier {
public:
    LogNotifier() : next_id_(1), closed_(false) {}

    std::optional<uint32_t> send_notification(const std::string& summary, const std::string& body,
                                              const std::vector<NotificationAction>& actions) override;
    bool close() override;

private:
    std::mutex mutex_;
    uint32_t next_id_;
    bool closed_;
};

//=============================================================================
// Notification manager
//=============================================================================

class NotificationManager : public TransferNotificationSink {
public:
    // Opens a downloaded file with the desktop default application
    using OpenFileCallback = std::function<bool(const std::string& path)>;

    NotificationManager(EventManager& events,
                        std::shared_ptr<Notifier> notifier,
                        std::shared_ptr<FilesystemProbe> filesystem,
                        const std::string& download_directory,
                        uint64_t size_limit,
                        OpenFileCallback open_file_callback);
    ~NotificationManager() override;

    // TransferNotificationSink
    void on_new_transfer(const Transfer& transfer, const std::string& peer_name) override;
    void on_file_finished(const Transfer& transfer, const FinishEventData& finish, TransferStatus file_status) override;
    void on_transfer_finished(const Transfer& transfer, FinishReason reason) override;

    //=========================================================================
    // Actions
    //=========================================================================

    /**
     * Accept the transfer behind a new-transfer notification into the
     * default download directory. Failures are reported with a notification.
     */
    bool accept_transfer(uint32_t notification_id);

    // Cancel the transfer behind a new-transfer notification
    bool cancel_transfer(uint32_t notification_id);

    // Open the file behind a download notification, at most once
    bool open_file(uint32_t notification_id);

    bool handle_action(uint32_t notification_id, const std::string& action_key);

    void set_download_directory(const std::string& path);
    std::string get_download_directory() const;

private:
    std::optional<uint32_t> send(const Notification& notification);
    void notify_accept_failed(const char* body);
    void notify_cancel_failed(const char* body);
    std::optional<std::string> find_transfer(uint32_t notification_id) const;

    EventManager& events_;
    std::shared_ptr<Notifier> notifier_;
    std::shared_ptr<FilesystemProbe> filesystem_;
    uint64_t size_limit_;
    OpenFileCallback open_file_callback_;

    mutable std::mutex mutex_;
    std::string download_directory_;
    std::unordered_map<uint32_t, std::string> transfers_;           // notification id -> transfer id
    std::unordered_map<uint32_t, std::string> downloaded_files_;    // notification id -> file path
};

} // namespace meshshare
