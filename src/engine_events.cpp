#include "engine_events.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <cmath>

#define LOG_DECODER_DEBUG(message) LOG_DEBUG("decoder", message)
#define LOG_DECODER_WARN(message)  LOG_WARN("decoder", message)
#define LOG_DECODER_ERROR(message) LOG_ERROR("decoder", message)

namespace meshshare {

// ordered_json keeps "children" objects in the order the engine wrote them
using EventJson = nlohmann::ordered_json;

//=============================================================================
// Event Types
//=============================================================================

const char* event_type_to_string(EngineEventType type) {
    switch (type) {
        case EngineEventType::RequestReceived: return "RequestReceived";
        case EngineEventType::RequestQueued: return "RequestQueued";
        case EngineEventType::TransferStarted: return "TransferStarted";
        case EngineEventType::TransferProgress: return "TransferProgress";
        case EngineEventType::TransferFinished: return "TransferFinished";
        default: return "Unknown";
    }
}

std::optional<EngineEventType> event_type_from_string(const std::string& name) {
    if (name == "RequestReceived") return EngineEventType::RequestReceived;
    if (name == "RequestQueued") return EngineEventType::RequestQueued;
    if (name == "TransferStarted") return EngineEventType::TransferStarted;
    if (name == "TransferProgress") return EngineEventType::TransferProgress;
    if (name == "TransferFinished") return EngineEventType::TransferFinished;
    return std::nullopt;
}

const char* finish_reason_to_string(FinishReason reason) {
    switch (reason) {
        case FinishReason::TransferCanceled: return "TransferCanceled";
        case FinishReason::TransferFailed: return "TransferFailed";
        case FinishReason::FileDownloaded: return "FileDownloaded";
        case FinishReason::FileUploaded: return "FileUploaded";
        case FinishReason::FileCanceled: return "FileCanceled";
        case FinishReason::FileFailed: return "FileFailed";
        default: return "Unknown";
    }
}

std::optional<FinishReason> finish_reason_from_string(const std::string& name) {
    if (name == "TransferCanceled") return FinishReason::TransferCanceled;
    if (name == "TransferFailed") return FinishReason::TransferFailed;
    if (name == "FileDownloaded") return FinishReason::FileDownloaded;
    if (name == "FileUploaded") return FinishReason::FileUploaded;
    if (name == "FileCanceled") return FinishReason::FileCanceled;
    if (name == "FileFailed") return FinishReason::FileFailed;
    return std::nullopt;
}

bool is_file_reason(FinishReason reason) {
    return reason != FinishReason::TransferCanceled && reason != FinishReason::TransferFailed;
}

//=============================================================================
// Payload decoding
//=============================================================================

namespace {

bool read_string(const EventJson& object, const char* key, std::string& out) {
    if (!object.contains(key) || !object[key].is_string()) {
        return false;
    }
    out = object[key].get<std::string>();
    return true;
}

bool read_unsigned(const EventJson& value, uint64_t& out) {
    if (value.is_number_unsigned()) {
        out = value.get<uint64_t>();
        return true;
    }
    if (value.is_number_integer() && value.get<int64_t>() >= 0) {
        out = static_cast<uint64_t>(value.get<int64_t>());
        return true;
    }
    if (value.is_number_float()) {
        double number = value.get<double>();
        // 2^64 is exactly representable, anything below it fits
        if (number >= 0 && number < 18446744073709551616.0 && std::floor(number) == number) {
            out = static_cast<uint64_t>(number);
            return true;
        }
    }
    return false;
}

std::optional<FileNode> decode_file_node(const EventJson& json, const std::string& fallback_id) {
    if (!json.is_object()) {
        return std::nullopt;
    }

    FileNode node;
    if (!read_string(json, "id", node.id)) {
        node.id = fallback_id;
    }
    if (node.id.empty()) {
        return std::nullopt;
    }

    if (json.contains("size") && !json["size"].is_null() && !read_unsigned(json["size"], node.size)) {
        return std::nullopt;
    }

    if (json.contains("children") && !json["children"].is_null()) {
        const auto& children = json["children"];
        if (children.is_object()) {
            for (auto it = children.begin(); it != children.end(); ++it) {
                auto child = decode_file_node(it.value(), it.key());
                if (!child) {
                    return std::nullopt;
                }
                node.children.push_back(std::move(*child));
            }
        } else if (children.is_array()) {
            for (const auto& child_json : children) {
                auto child = decode_file_node(child_json, "");
                if (!child) {
                    return std::nullopt;
                }
                node.children.push_back(std::move(*child));
            }
        } else {
            return std::nullopt;
        }
    }

    return node;
}

std::optional<RequestEventData> decode_request(const EventJson& data, bool peer_required) {
    RequestEventData request;
    if (!read_string(data, "peer", request.peer) && peer_required) {
        LOG_DECODER_WARN("Request event without peer");
        return std::nullopt;
    }

    if (!data.contains("files") || !data["files"].is_array()) {
        LOG_DECODER_WARN("Request event without file list");
        return std::nullopt;
    }

    for (const auto& file_json : data["files"]) {
        auto node = decode_file_node(file_json, "");
        if (!node) {
            LOG_DECODER_WARN("Request event with malformed file entry: " << file_json.dump());
            return std::nullopt;
        }
        request.files.push_back(std::move(*node));
    }
    return request;
}

std::optional<FileProgressData> decode_progress(const EventJson& data, bool bytes_required) {
    FileProgressData progress;
    if (!read_string(data, "file", progress.file_id)) {
        LOG_DECODER_WARN("File event without file id");
        return std::nullopt;
    }

    if (bytes_required) {
        // Field name as spelled by the engine
        if (!data.contains("transfered") || !read_unsigned(data["transfered"], progress.transferred)) {
            LOG_DECODER_WARN("Progress event without transferred byte count");
            return std::nullopt;
        }
    }
    return progress;
}

std::optional<FinishEventData> decode_finish(const EventJson& data) {
    std::string reason_name;
    if (!read_string(data, "reason", reason_name)) {
        LOG_DECODER_WARN("TransferFinished event without reason");
        return std::nullopt;
    }

    auto reason = finish_reason_from_string(reason_name);
    if (!reason) {
        LOG_DECODER_WARN("TransferFinished event with unknown reason: " << reason_name);
        return std::nullopt;
    }

    FinishEventData finish;
    finish.reason = *reason;

    static const EventJson empty_details = EventJson::object();
    const EventJson* details = &empty_details;
    if (data.contains("data") && data["data"].is_object()) {
        details = &data["data"];
    }

    if (is_file_reason(finish.reason) && !read_string(*details, "file", finish.file_id)) {
        LOG_DECODER_WARN(reason_name << " event without file id");
        return std::nullopt;
    }

    if (details->contains("by_peer") && (*details)["by_peer"].is_boolean()) {
        finish.by_peer = (*details)["by_peer"].get<bool>();
    }
    if (details->contains("status") && (*details)["status"].is_number_integer()) {
        finish.status_code = (*details)["status"].get<int64_t>();
    }
    read_string(*details, "final_path", finish.final_path);

    return finish;
}

} // anonymous namespace

//=============================================================================
// Decoder
//=============================================================================

std::optional<EngineEvent> decode_engine_event(const std::string& serialized) {
    EventJson envelope;
    try {
        envelope = EventJson::parse(serialized);
    } catch (const nlohmann::json::exception& e) {
        LOG_DECODER_ERROR("Failed to parse engine event: " << e.what());
        return std::nullopt;
    }

    try {
        if (!envelope.is_object()) {
            LOG_DECODER_WARN("Engine event is not an object");
            return std::nullopt;
        }

        std::string type_name;
        if (!read_string(envelope, "type", type_name)) {
            LOG_DECODER_WARN("Engine event without type");
            return std::nullopt;
        }

        auto type = event_type_from_string(type_name);
        if (!type) {
            LOG_DECODER_WARN("Unknown engine event type: " << type_name);
            return std::nullopt;
        }

        if (!envelope.contains("data") || !envelope["data"].is_object()) {
            LOG_DECODER_WARN(type_name << " event without data");
            return std::nullopt;
        }
        const auto& data = envelope["data"];

        EngineEvent event(*type);
        if (!read_string(data, "transfer", event.transfer_id) || event.transfer_id.empty()) {
            LOG_DECODER_WARN(type_name << " event without transfer id");
            return std::nullopt;
        }

        switch (event.type) {
            case EngineEventType::RequestReceived:
                event.request = decode_request(data, true);
                if (!event.request) return std::nullopt;
                break;
            case EngineEventType::RequestQueued:
                event.request = decode_request(data, false);
                if (!event.request) return std::nullopt;
                break;
            case EngineEventType::TransferStarted:
                event.progress = decode_progress(data, false);
                if (!event.progress) return std::nullopt;
                break;
            case EngineEventType::TransferProgress:
                event.progress = decode_progress(data, true);
                if (!event.progress) return std::nullopt;
                break;
            case EngineEventType::TransferFinished:
                event.finish = decode_finish(data);
                if (!event.finish) return std::nullopt;
                break;
        }

        LOG_DECODER_DEBUG("Decoded " << type_name << " for transfer " << event.transfer_id);
        return event;
    } catch (const nlohmann::json::exception& e) {
        LOG_DECODER_ERROR("Malformed engine event: " << e.what());
        return std::nullopt;
    }
}

} // namespace meshshare
