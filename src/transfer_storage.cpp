#include "transfer_storage.h"
#include "fs.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <algorithm>

#define LOG_STORAGE_DEBUG(message) LOG_DEBUG("storage", message)
#define LOG_STORAGE_INFO(message)  LOG_INFO("storage", message)
#define LOG_STORAGE_WARN(message)  LOG_WARN("storage", message)
#define LOG_STORAGE_ERROR(message) LOG_ERROR("storage", message)

namespace meshshare {

JsonFileTransferStorage::JsonFileTransferStorage(const std::string& file_path)
    : file_path_(file_path), loaded_(false) {
}

std::vector<Transfer> JsonFileTransferStorage::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!loaded_ && !load_locked()) {
        return {};
    }
    return history_;
}

bool JsonFileTransferStorage::store(const Transfer& transfer) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!loaded_ && !load_locked()) {
        LOG_STORAGE_ERROR("Not overwriting unreadable transfer history " << file_path_);
        return false;
    }

    auto it = std::find_if(history_.begin(), history_.end(),
                           [&transfer](const Transfer& stored) { return stored.id == transfer.id; });
    if (it != history_.end()) {
        *it = transfer;
    } else {
        history_.push_back(transfer);
    }

    return save_locked();
}

bool JsonFileTransferStorage::load_locked() {
    history_.clear();

    if (!file_exists(file_path_)) {
        LOG_STORAGE_INFO("No transfer history at " << file_path_);
        loaded_ = true;
        return true;
    }

    try {
        std::string data = read_file_text_cpp(file_path_);
        if (data.empty()) {
            LOG_STORAGE_WARN("Transfer history file is empty: " << file_path_);
            loaded_ = true;
            return true;
        }

        nlohmann::json history = nlohmann::json::parse(data);
        if (!history.is_array()) {
            LOG_STORAGE_ERROR("Transfer history is not a JSON array: " << file_path_);
            return false;
        }

        for (const auto& entry : history) {
            auto transfer = transfer_from_json(entry);
            if (transfer) {
                history_.push_back(std::move(*transfer));
            }
        }

        LOG_STORAGE_INFO("Loaded " << history_.size() << " transfers from " << file_path_);
        loaded_ = true;
        return true;
    } catch (const nlohmann::json::exception& e) {
        LOG_STORAGE_ERROR("Failed to parse transfer history: " << e.what());
        return false;
    }
}

bool JsonFileTransferStorage::save_locked() {
    try {
        nlohmann::json history = nlohmann::json::array();
        for (const auto& transfer : history_) {
            history.push_back(transfer_to_json(transfer));
        }

        if (!create_file(file_path_, history.dump(4))) {
            LOG_STORAGE_ERROR("Failed to write transfer history to " << file_path_);
            return false;
        }

        LOG_STORAGE_DEBUG("Saved " << history_.size() << " transfers to " << file_path_);
        return true;
    } catch (const nlohmann::json::exception& e) {
        LOG_STORAGE_ERROR("Failed to serialize transfer history: " << e.what());
        return false;
    }
}

} // namespace meshshare
