#pragma once

/**
 * @file engine_events.h
 * @brief Decoding of the transfer engine event stream
 *
 * The engine emits one JSON document per event:
 *   { "type": "<EventType>", "data": { ... } }
 *
 * Decoding is done in two stages. The envelope is parsed first to obtain the
 * type discriminant, then the type-specific payload is decoded into the
 * matching optional field of EngineEvent.
 */

#include "file_tree.h"

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace meshshare {

//=============================================================================
// Event Types
//=============================================================================

enum class EngineEventType {
    RequestReceived,
    RequestQueued,
    TransferStarted,
    TransferProgress,
    TransferFinished
};

/**
 * @brief Sub-discriminant of TransferFinished
 */
enum class FinishReason {
    TransferCanceled,
    TransferFailed,
    FileDownloaded,
    FileUploaded,
    FileCanceled,
    FileFailed
};

const char* event_type_to_string(EngineEventType type);
std::optional<EngineEventType> event_type_from_string(const std::string& name);

const char* finish_reason_to_string(FinishReason reason);
std::optional<FinishReason> finish_reason_from_string(const std::string& name);

// True for the reasons that refer to a single file
bool is_file_reason(FinishReason reason);

//=============================================================================
// Payloads
//=============================================================================

/**
 * RequestReceived / RequestQueued payload
 */
struct RequestEventData {
    std::string peer;               // Empty when the engine omitted it (RequestQueued)
    std::vector<FileNode> files;
};

/**
 * TransferStarted / TransferProgress payload
 */
struct FileProgressData {
    std::string file_id;            // Full relative path of the file
    uint64_t transferred;           // Cumulative bytes of this file (TransferProgress only)

    FileProgressData() : transferred(0) {}
};

/**
 * TransferFinished payload
 */
struct FinishEventData {
    FinishReason reason;
    std::string file_id;                    // Set for file-level reasons
    bool by_peer;
    std::optional<int64_t> status_code;     // Engine status code, if reported
    std::string final_path;                 // Where a downloaded file ended up, if reported

    FinishEventData() : reason(FinishReason::TransferFailed), by_peer(false) {}
};

/**
 * @brief Decoded engine event
 */
struct EngineEvent {
    EngineEventType type;
    std::string transfer_id;

    // Data depending on type
    std::optional<RequestEventData> request;    // RequestReceived, RequestQueued
    std::optional<FileProgressData> progress;   // TransferStarted, TransferProgress
    std::optional<FinishEventData> finish;      // TransferFinished

    EngineEvent() : type(EngineEventType::RequestReceived) {}
    explicit EngineEvent(EngineEventType t) : type(t) {}
};

//=============================================================================
// Decoder
//=============================================================================

/**
 * @brief Decode one serialized engine event
 *
 * Returns nullopt (and logs why) for unparseable JSON, unknown event types or
 * reasons, and payloads missing required fields. Never throws.
 */
std::optional<EngineEvent> decode_engine_event(const std::string& serialized);

} // namespace meshshare
