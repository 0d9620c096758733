#pragma once

#include "transfer.h"
#include <string>
#include <vector>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace meshshare {

/**
 * Thread-safe map of transfer id to transfer record.
 *
 * All reads and writes go through one mutex. Readers always get copies,
 * so nothing outside the registry can alias registry-held state. Compound
 * check-then-modify sequences must be done inside update() so they run as
 * a single critical section.
 */
class TransferRegistry {
public:
    using Mutator = std::function<void(Transfer&)>;

    TransferRegistry() = default;
    TransferRegistry(const TransferRegistry&) = delete;
    TransferRegistry& operator=(const TransferRegistry&) = delete;

    /**
     * Add a transfer.
     * @return false if a transfer with the same id is already present
     */
    bool insert(const Transfer& transfer);

    std::optional<Transfer> get(const std::string& id) const;

    // Copies of all transfers, oldest first
    std::vector<Transfer> list() const;

    bool remove(const std::string& id);

    /**
     * Run mutator on the stored transfer while holding the registry lock.
     * The mutator must not call back into the registry or any collaborator.
     * @return false if the transfer is unknown
     */
    bool update(const std::string& id, const Mutator& mutator);

    bool contains(const std::string& id) const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Transfer> transfers_;
};

} // namespace meshshare
