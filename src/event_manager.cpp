#include "event_manager.h"
#include "meshshare_log_macros.h"

namespace meshshare {

TransferProgressUpdate make_progress_update(const Transfer& transfer) {
    if (transfer.status == TransferStatus::Success) {
        return TransferProgressUpdate(transfer.status, 100);
    }
    return TransferProgressUpdate(transfer.status, transfer_progress_percent(transfer));
}

EventManager::EventManager(PeerDirectory& peers, TransferStorage& storage, TransferEngine& engine,
                           size_t progress_channel_capacity)
    : peers_(peers), storage_(storage), engine_(engine),
      progress_channel_capacity_(progress_channel_capacity) {
    load_history();
}

EventManager::~EventManager() {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    for (auto& entry : subscriptions_) {
        entry.second->close();
    }
    subscriptions_.clear();
}

void EventManager::set_notification_sink(std::shared_ptr<TransferNotificationSink> sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    notification_sink_ = std::move(sink);
}

std::shared_ptr<TransferNotificationSink> EventManager::get_notification_sink() const {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    return notification_sink_;
}

void EventManager::load_history() {
    size_t restored = 0;
    for (const auto& transfer : storage_.load()) {
        if (registry_.insert(transfer)) {
            restored++;
        }
    }
    if (restored > 0) {
        LOG_EVENTS_INFO("Restored " << restored << " transfers from history");
    }
}

//=============================================================================
// Engine events
//=============================================================================

void EventManager::handle_event(const std::string& serialized) {
    auto event = decode_engine_event(serialized);
    if (!event) {
        LOG_EVENTS_WARN("Dropping undecodable engine event");
        return;
    }
    handle_event(*event);
}

void EventManager::handle_event(const EngineEvent& event) {
    LOG_EVENTS_DEBUG("Handling " << event_type_to_string(event.type) << " for transfer " << event.transfer_id);

    switch (event.type) {
        case EngineEventType::RequestReceived:
            handle_request_received(event);
            break;
        case EngineEventType::RequestQueued:
            handle_request_queued(event);
            break;
        case EngineEventType::TransferStarted:
            handle_transfer_started(event);
            break;
        case EngineEventType::TransferProgress:
            handle_transfer_progress(event);
            break;
        case EngineEventType::TransferFinished:
            if (!event.finish) {
                LOG_EVENTS_WARN("TransferFinished without payload for " << event.transfer_id);
                return;
            }
            if (is_file_reason(event.finish->reason)) {
                handle_file_finished(event);
            } else {
                handle_whole_transfer_finished(event);
            }
            break;
    }
}

void EventManager::handle_request_received(const EngineEvent& event) {
    if (!event.request) {
        return;
    }

    auto peer = peers_.find_peer(event.request->peer);
    if (!peer) {
        LOG_EVENTS_WARN("Ignoring transfer " << event.transfer_id << " from unknown peer " << event.request->peer);
        return;
    }
    if (!peer->allows_fileshare) {
        LOG_EVENTS_WARN("Ignoring transfer " << event.transfer_id << " from " << event.request->peer
                        << ": peer is not allowed to send files");
        return;
    }

    Transfer transfer = make_incoming_transfer(event.transfer_id, event.request->peer, event.request->files);
    if (!registry_.insert(transfer)) {
        LOG_EVENTS_WARN("Ignoring duplicate request for transfer " << event.transfer_id);
        return;
    }

    LOG_EVENTS_INFO("New incoming transfer " << event.transfer_id << " from " << peer->display_name()
                    << " with " << count_leaves(transfer.files) << " files");

    auto sink = get_notification_sink();
    if (sink) {
        sink->on_new_transfer(transfer, peer->display_name());
    }
}

void EventManager::handle_request_queued(const EngineEvent& event) {
    if (!event.request) {
        return;
    }

    bool terminal = false;
    bool found = registry_.update(event.transfer_id, [&](Transfer& transfer) {
        if (is_terminal_status(transfer.status)) {
            terminal = true;
            return;
        }
        transfer.files = event.request->files;
        if (transfer.peer.empty()) {
            transfer.peer = event.request->peer;
        }
    });

    if (!found) {
        LOG_EVENTS_WARN("RequestQueued for unknown transfer " << event.transfer_id);
        return;
    }
    if (terminal) {
        LOG_EVENTS_DEBUG("Ignoring RequestQueued for finished transfer " << event.transfer_id);
        return;
    }

    LOG_EVENTS_INFO("Transfer " << event.transfer_id << " queued with "
                    << count_leaves(event.request->files) << " files");
}

void EventManager::handle_transfer_started(const EngineEvent& event) {
    if (!event.progress) {
        return;
    }

    bool terminal = false;
    bool file_found = false;
    TransferProgressUpdate update;
    bool found = registry_.update(event.transfer_id, [&](Transfer& transfer) {
        if (is_terminal_status(transfer.status)) {
            terminal = true;
            return;
        }

        FileNode* node = find_file(transfer.files, event.progress->file_id);
        if (!node) {
            return;
        }
        file_found = true;

        // Only files still waiting count, a repeated start must not inflate the total
        if (node->is_leaf()) {
            if (node->status == TransferStatus::Requested) {
                transfer.total_size += node->size;
                node->status = TransferStatus::Ongoing;
            }
        } else {
            for (auto& entry : flatten_files(node->children)) {
                if (entry.node->is_leaf() && entry.node->status == TransferStatus::Requested) {
                    transfer.total_size += entry.node->size;
                    entry.node->status = TransferStatus::Ongoing;
                }
            }
        }

        transfer.status = TransferStatus::Ongoing;
        update = make_progress_update(transfer);
    });

    if (!found) {
        LOG_EVENTS_WARN("TransferStarted for unknown transfer " << event.transfer_id);
        return;
    }
    if (terminal) {
        LOG_EVENTS_DEBUG("Ignoring TransferStarted for finished transfer " << event.transfer_id);
        return;
    }
    if (!file_found) {
        LOG_EVENTS_WARN("TransferStarted for unknown file " << event.progress->file_id
                        << " in transfer " << event.transfer_id);
        return;
    }

    LOG_EVENTS_DEBUG("File " << event.progress->file_id << " of transfer " << event.transfer_id << " started");
    publish(event.transfer_id, update);
}

void EventManager::handle_transfer_progress(const EngineEvent& event) {
    if (!event.progress) {
        return;
    }

    bool terminal = false;
    bool file_found = false;
    TransferProgressUpdate update;
    bool found = registry_.update(event.transfer_id, [&](Transfer& transfer) {
        if (is_terminal_status(transfer.status)) {
            terminal = true;
            return;
        }

        FileNode* node = find_file(transfer.files, event.progress->file_id);
        if (!node) {
            return;
        }
        file_found = true;

        // The engine reports cumulative bytes per file
        uint64_t reported = event.progress->transferred;
        if (reported > node->transferred) {
            transfer.total_transferred += reported - node->transferred;
            node->transferred = reported;
        }

        transfer.status = TransferStatus::Ongoing;
        update = TransferProgressUpdate(TransferStatus::Ongoing, transfer_progress_percent(transfer));
    });

    if (!found) {
        LOG_EVENTS_WARN("TransferProgress for unknown transfer " << event.transfer_id);
        return;
    }
    if (terminal) {
        LOG_EVENTS_DEBUG("Ignoring TransferProgress for finished transfer " << event.transfer_id);
        return;
    }
    if (!file_found) {
        LOG_EVENTS_WARN("TransferProgress for unknown file " << event.progress->file_id
                        << " in transfer " << event.transfer_id);
        return;
    }

    publish(event.transfer_id, update);
}

void EventManager::handle_file_finished(const EngineEvent& event) {
    const FinishEventData& finish = *event.finish;

    TransferStatus file_status;
    switch (finish.reason) {
        case FinishReason::FileDownloaded:
        case FinishReason::FileUploaded:
            file_status = TransferStatus::Success;
            break;
        case FinishReason::FileCanceled:
            file_status = TransferStatus::Canceled;
            break;
        default:
            file_status = failure_status_from_code(finish.status_code);
            break;
    }

    bool terminal_before = false;
    bool file_found = false;
    bool became_terminal = false;
    bool needs_finalize = false;
    Transfer snapshot;
    bool found = registry_.update(event.transfer_id, [&](Transfer& transfer) {
        if (is_terminal_status(transfer.status)) {
            terminal_before = true;
            return;
        }

        FileNode* node = find_file(transfer.files, finish.file_id);
        if (!node) {
            return;
        }
        file_found = true;

        // Account for bytes the last progress event did not report
        if (node->is_leaf() && node->status == TransferStatus::Ongoing &&
            file_status == TransferStatus::Success && node->size > node->transferred) {
            transfer.total_transferred += node->size - node->transferred;
            node->transferred = node->size;
        }

        set_file_status(transfer.files, finish.file_id, file_status);
        transfer.status = aggregate_status(transfer.files, transfer.status);

        if (is_terminal_status(transfer.status)) {
            became_terminal = true;
            if (!transfer.finalized) {
                transfer.finalized = true;
                needs_finalize = true;
            }
        }
        snapshot = transfer;
    });

    if (!found) {
        LOG_EVENTS_WARN(finish_reason_to_string(finish.reason) << " for unknown transfer " << event.transfer_id);
        return;
    }
    if (terminal_before) {
        LOG_EVENTS_DEBUG("Ignoring " << finish_reason_to_string(finish.reason)
                         << " for finished transfer " << event.transfer_id);
        return;
    }
    if (!file_found) {
        LOG_EVENTS_WARN(finish_reason_to_string(finish.reason) << " for unknown file " << finish.file_id
                        << " in transfer " << event.transfer_id);
        return;
    }

    LOG_EVENTS_INFO("File " << finish.file_id << " of transfer " << event.transfer_id << " finished: "
                    << status_to_string(file_status));

    auto sink = get_notification_sink();
    if (sink) {
        sink->on_file_finished(snapshot, finish, file_status);
    }

    if (became_terminal) {
        complete_transfer(snapshot, needs_finalize);
    }
}

void EventManager::handle_whole_transfer_finished(const EngineEvent& event) {
    const FinishEventData& finish = *event.finish;
    bool canceled = finish.reason == FinishReason::TransferCanceled;
    TransferStatus leaf_status = canceled ? TransferStatus::Canceled : failure_status_from_code(finish.status_code);

    bool terminal_before = false;
    bool needs_finalize = false;
    Transfer snapshot;
    bool found = registry_.update(event.transfer_id, [&](Transfer& transfer) {
        if (is_terminal_status(transfer.status)) {
            terminal_before = true;
            return;
        }

        resolve_pending_files(transfer.files, leaf_status);
        transfer.status = canceled ? TransferStatus::Canceled : TransferStatus::FinishedWithErrors;
        if (!transfer.finalized) {
            transfer.finalized = true;
            needs_finalize = true;
        }
        snapshot = transfer;
    });

    if (!found) {
        LOG_EVENTS_WARN(finish_reason_to_string(finish.reason) << " for unknown transfer " << event.transfer_id);
        return;
    }
    if (terminal_before) {
        LOG_EVENTS_DEBUG("Ignoring " << finish_reason_to_string(finish.reason)
                         << " for finished transfer " << event.transfer_id);
        return;
    }

    LOG_EVENTS_INFO("Transfer " << event.transfer_id << (canceled ? " canceled" : " failed")
                    << (finish.by_peer ? " by peer" : ""));

    auto sink = get_notification_sink();
    if (sink) {
        sink->on_transfer_finished(snapshot, finish.reason);
    }

    complete_transfer(snapshot, needs_finalize);
}

void EventManager::complete_transfer(const Transfer& snapshot, bool finalize) {
    publish(snapshot.id, make_progress_update(snapshot));

    if (finalize && !engine_.finalize(snapshot.id)) {
        LOG_EVENTS_ERROR("Failed to finalize transfer " << snapshot.id << " on the engine side");
    }

    if (!storage_.store(snapshot)) {
        LOG_EVENTS_ERROR("Failed to store transfer " << snapshot.id << " in history");
    }

    LOG_EVENTS_INFO("Transfer " << snapshot.id << " completed with status " << status_to_string(snapshot.status));
}

//=============================================================================
// Queries
//=============================================================================

std::vector<Transfer> EventManager::get_transfers() const {
    return registry_.list();
}

std::optional<Transfer> EventManager::get_transfer(const std::string& transfer_id) const {
    return registry_.get(transfer_id);
}

//=============================================================================
// Operations
//=============================================================================

FileshareError EventManager::new_outgoing_transfer(const std::string& transfer_id, const std::string& peer,
                                                   const std::string& path) {
    if (!registry_.insert(make_outgoing_transfer(transfer_id, peer, path))) {
        LOG_EVENTS_WARN("Outgoing transfer " << transfer_id << " already exists");
        return FileshareError::TransferAlreadyExists;
    }

    LOG_EVENTS_INFO("New outgoing transfer " << transfer_id << " to " << peer << " from " << path);
    return FileshareError::None;
}

FileshareError EventManager::accept_transfer(const std::string& transfer_id, const std::string& destination,
                                             const std::vector<std::string>& file_ids, uint64_t size_limit,
                                             Transfer* accepted) {
    FileshareError result = FileshareError::None;
    Transfer snapshot;
    bool found = registry_.update(transfer_id, [&](Transfer& transfer) {
        if (transfer.direction != TransferDirection::Incoming) {
            result = FileshareError::TransferAcceptOutgoing;
            return;
        }
        if (transfer.status != TransferStatus::Requested) {
            result = FileshareError::TransferAlreadyAccepted;
            return;
        }

        uint64_t size = 0;
        if (file_ids.empty()) {
            size = total_leaf_size(transfer.files);
        } else {
            for (const auto& file_id : file_ids) {
                const FileNode* node = find_file(transfer.files, file_id);
                if (!node) {
                    result = FileshareError::FileNotFound;
                    return;
                }
                size += leaf_size(*node);
            }
        }

        if (size > size_limit) {
            result = FileshareError::SizeLimitExceeded;
            return;
        }

        transfer.path = destination;
        transfer.status = TransferStatus::Ongoing;
        snapshot = transfer;
    });

    if (!found) {
        return FileshareError::TransferNotFound;
    }
    if (result != FileshareError::None) {
        LOG_EVENTS_WARN("Cannot accept transfer " << transfer_id << ": " << error_to_string(result));
        return result;
    }

    LOG_EVENTS_INFO("Accepted transfer " << transfer_id << " into " << destination
                    << (file_ids.empty() ? "" : " (partial)"));

    if (!engine_.accept(transfer_id, destination, file_ids)) {
        LOG_EVENTS_ERROR("Engine failed to start receiving transfer " << transfer_id);
    }

    if (accepted) {
        *accepted = snapshot;
    }
    return FileshareError::None;
}

FileshareError EventManager::set_transfer_status(const std::string& transfer_id, TransferStatus status) {
    TransferProgressUpdate update;
    bool found = registry_.update(transfer_id, [&](Transfer& transfer) {
        transfer.status = status;
        if (!is_terminal_status(status)) {
            transfer.finalized = false;
        }
        update = make_progress_update(transfer);
    });

    if (!found) {
        return FileshareError::TransferNotFound;
    }

    LOG_EVENTS_DEBUG("Transfer " << transfer_id << " status set to " << status_to_string(status));
    publish(transfer_id, update);
    return FileshareError::None;
}

FileshareError EventManager::cancel_transfer(const std::string& transfer_id) {
    bool cancelable = true;
    bool needs_finalize = false;
    Transfer snapshot;
    bool found = registry_.update(transfer_id, [&](Transfer& transfer) {
        if (is_terminal_status(transfer.status)) {
            cancelable = false;
            return;
        }

        resolve_pending_files(transfer.files, TransferStatus::Canceled);
        transfer.status = TransferStatus::Canceled;
        if (!transfer.finalized) {
            transfer.finalized = true;
            needs_finalize = true;
        }
        snapshot = transfer;
    });

    if (!found) {
        return FileshareError::TransferNotFound;
    }
    if (!cancelable) {
        LOG_EVENTS_WARN("Transfer " << transfer_id << " is already finished, cannot cancel");
        return FileshareError::TransferNotCancelable;
    }

    LOG_EVENTS_INFO("Transfer " << transfer_id << " canceled by user");
    complete_transfer(snapshot, needs_finalize);
    return FileshareError::None;
}

FileshareError EventManager::cancel_file(const std::string& transfer_id, const std::string& file_id) {
    FileshareError result = FileshareError::None;
    bool found = registry_.update(transfer_id, [&](Transfer& transfer) {
        if (is_terminal_status(transfer.status)) {
            result = FileshareError::TransferNotCancelable;
            return;
        }

        const FileNode* node = find_file(transfer.files, file_id);
        if (!node) {
            result = FileshareError::FileNotFound;
            return;
        }

        bool pending = node->is_leaf() && !is_resolved_status(node->status);
        for (const auto& entry : flatten_files(node->children)) {
            if (entry.node->is_leaf() && !is_resolved_status(entry.node->status)) {
                pending = true;
            }
        }
        if (!pending) {
            result = FileshareError::TransferNotCancelable;
        }
    });

    if (!found) {
        return FileshareError::TransferNotFound;
    }
    if (result != FileshareError::None) {
        LOG_EVENTS_WARN("Cannot cancel file " << file_id << " of transfer " << transfer_id << ": "
                        << error_to_string(result));
        return result;
    }

    if (!engine_.cancel_file(transfer_id, file_id)) {
        LOG_EVENTS_ERROR("Engine failed to cancel file " << file_id << " of transfer " << transfer_id);
    }
    return FileshareError::None;
}

//=============================================================================
// Subscriptions
//=============================================================================

std::shared_ptr<ProgressChannel> EventManager::subscribe(const std::string& transfer_id) {
    auto channel = std::make_shared<ProgressChannel>(progress_channel_capacity_);
    std::shared_ptr<ProgressChannel> replaced;
    std::optional<TransferProgressUpdate> final_update;

    // Registered under the registry lock so a terminal transition cannot slip in between
    bool found = registry_.update(transfer_id, [&](Transfer& transfer) {
        if (is_terminal_status(transfer.status)) {
            final_update = make_progress_update(transfer);
            return;
        }

        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        auto it = subscriptions_.find(transfer_id);
        if (it != subscriptions_.end()) {
            replaced = it->second;
        }
        subscriptions_[transfer_id] = channel;
    });

    if (!found) {
        LOG_EVENTS_WARN("Cannot subscribe to unknown transfer " << transfer_id);
        return nullptr;
    }

    if (replaced) {
        replaced->close();
    }
    if (final_update && !channel->try_push(*final_update)) {
        LOG_EVENTS_WARN("Failed to deliver final status of transfer " << transfer_id);
    }
    return channel;
}

bool EventManager::has_subscription(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    return subscriptions_.find(transfer_id) != subscriptions_.end();
}

void EventManager::publish(const std::string& transfer_id, const TransferProgressUpdate& update) {
    std::shared_ptr<ProgressChannel> channel;
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        auto it = subscriptions_.find(transfer_id);
        if (it == subscriptions_.end()) {
            return;
        }
        channel = it->second;
        if (is_terminal_status(update.status) || channel->is_closed()) {
            subscriptions_.erase(it);
        }
    }

    if (!channel->try_push(update)) {
        LOG_EVENTS_DEBUG("Subscriber of transfer " << transfer_id << " closed its channel");
    }
}

} // namespace meshshare
