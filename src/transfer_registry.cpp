#include "transfer_registry.h"
#include <algorithm>

namespace meshshare {

bool TransferRegistry::insert(const Transfer& transfer) {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_.emplace(transfer.id, transfer).second;
}

std::optional<Transfer> TransferRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(id);
    if (it == transfers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Transfer> TransferRegistry::list() const {
    std::vector<Transfer> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(transfers_.size());
        for (const auto& entry : transfers_) {
            result.push_back(entry.second);
        }
    }

    std::stable_sort(result.begin(), result.end(), [](const Transfer& a, const Transfer& b) {
        if (a.created != b.created) {
            return a.created < b.created;
        }
        return a.id < b.id;
    });
    return result;
}

bool TransferRegistry::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_.erase(id) > 0;
}

bool TransferRegistry::update(const std::string& id, const Mutator& mutator) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(id);
    if (it == transfers_.end()) {
        return false;
    }
    mutator(it->second);
    return true;
}

bool TransferRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_.find(id) != transfers_.end();
}

size_t TransferRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_.size();
}

} // namespace meshshare
