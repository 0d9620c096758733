#pragma once

/**
 * @file event_manager.h
 * @brief Transfer state machine driven by the transfer engine event stream
 *
 * EventManager owns the transfer registry. Engine events enter through
 * handle_event() and user-facing calls (accept, cancel, subscribe) through
 * the public API. Every check-then-transition sequence runs inside a single
 * registry critical section; collaborators (engine, storage, notification
 * sink) are always called after the lock is released.
 */

#include "engine_events.h"
#include "errors.h"
#include "peer_directory.h"
#include "progress_channel.h"
#include "transfer.h"
#include "transfer_engine.h"
#include "transfer_registry.h"
#include "transfer_storage.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace meshshare {

/**
 * Receiver of user-facing transfer milestones
 */
class TransferNotificationSink {
public:
    virtual ~TransferNotificationSink() = default;

    // A permitted peer asked to send us files
    virtual void on_new_transfer(const Transfer& transfer, const std::string& peer_name) = 0;

    // A single file reached a final state
    virtual void on_file_finished(const Transfer& transfer, const FinishEventData& finish, TransferStatus file_status) = 0;

    // The engine canceled or failed the whole transfer
    virtual void on_transfer_finished(const Transfer& transfer, FinishReason reason) = 0;
};

class EventManager {
public:
    EventManager(PeerDirectory& peers, TransferStorage& storage, TransferEngine& engine,
                 size_t progress_channel_capacity = 16);
    ~EventManager();

    EventManager(const EventManager&) = delete;
    EventManager& operator=(const EventManager&) = delete;

    void set_notification_sink(std::shared_ptr<TransferNotificationSink> sink);

    //=========================================================================
    // Engine events
    //=========================================================================

    /**
     * Decode and apply one serialized engine event. Malformed events and
     * events for unknown transfers or files are logged and dropped.
     */
    void handle_event(const std::string& serialized);
    void handle_event(const EngineEvent& event);

    //=========================================================================
    // Queries
    //=========================================================================

    // Copies, oldest first
    std::vector<Transfer> get_transfers() const;
    std::optional<Transfer> get_transfer(const std::string& transfer_id) const;

    //=========================================================================
    // Operations
    //=========================================================================

    /**
     * Register a transfer the local user started. The file tree arrives
     * later with RequestQueued.
     */
    FileshareError new_outgoing_transfer(const std::string& transfer_id, const std::string& peer,
                                         const std::string& path);

    /**
     * Accept an incoming transfer, or only file_ids out of it.
     *
     * At most one accept succeeds per transfer even under concurrent calls.
     * On success the engine is told to start receiving and, if accepted is
     * given, it receives a copy of the updated transfer.
     */
    FileshareError accept_transfer(const std::string& transfer_id, const std::string& destination,
                                   const std::vector<std::string>& file_ids, uint64_t size_limit,
                                   Transfer* accepted = nullptr);

    /**
     * Overwrite the transfer status. Setting a non-terminal status also
     * clears the finalize latch, so this is only meant for re-initialising
     * a transfer in tests and tools.
     */
    FileshareError set_transfer_status(const std::string& transfer_id, TransferStatus status);

    // Cancel the whole transfer and finalize it on the engine side
    FileshareError cancel_transfer(const std::string& transfer_id);

    // Ask the engine to cancel one file; the result arrives as a FileCanceled event
    FileshareError cancel_file(const std::string& transfer_id, const std::string& file_id);

    //=========================================================================
    // Subscriptions
    //=========================================================================

    /**
     * Open a progress channel for a transfer, replacing any previous one.
     *
     * For a transfer that already finished the returned channel holds the
     * final snapshot and is closed. Returns nullptr for unknown transfers.
     */
    std::shared_ptr<ProgressChannel> subscribe(const std::string& transfer_id);
    bool has_subscription(const std::string& transfer_id) const;

private:
    void handle_request_received(const EngineEvent& event);
    void handle_request_queued(const EngineEvent& event);
    void handle_transfer_started(const EngineEvent& event);
    void handle_transfer_progress(const EngineEvent& event);
    void handle_file_finished(const EngineEvent& event);
    void handle_whole_transfer_finished(const EngineEvent& event);

    // Post-lock side effects of reaching a terminal state
    void complete_transfer(const Transfer& snapshot, bool finalize);

    void publish(const std::string& transfer_id, const TransferProgressUpdate& update);
    void load_history();
    std::shared_ptr<TransferNotificationSink> get_notification_sink() const;

    PeerDirectory& peers_;
    TransferStorage& storage_;
    TransferEngine& engine_;
    const size_t progress_channel_capacity_;

    TransferRegistry registry_;

    // Lock order: registry, then subscriptions
    mutable std::mutex subscriptions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<ProgressChannel>> subscriptions_;

    mutable std::mutex sink_mutex_;
    std::shared_ptr<TransferNotificationSink> notification_sink_;
};

// Snapshot published for the current state of transfer
TransferProgressUpdate make_progress_update(const Transfer& transfer);

} // namespace meshshare
