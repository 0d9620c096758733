#pragma once

#include "transfer.h"
#include <string>
#include <vector>
#include <mutex>

namespace meshshare {

/**
 * Persistence hook for finished transfers
 */
class TransferStorage {
public:
    virtual ~TransferStorage() = default;

    // Previously stored transfers
    virtual std::vector<Transfer> load() = 0;

    // Insert or replace the stored copy of transfer
    virtual bool store(const Transfer& transfer) = 0;
};

/**
 * Transfer history kept in a JSON file. The whole file is rewritten on
 * every store.
 */
class JsonFileTransferStorage : public TransferStorage {
public:
    explicit JsonFileTransferStorage(const std::string& file_path);

    std::vector<Transfer> load() override;
    bool store(const Transfer& transfer) override;

    const std::string& get_file_path() const { return file_path_; }

private:
    bool load_locked();
    bool save_locked();

    std::string file_path_;
    std::mutex mutex_;
    bool loaded_;
    std::vector<Transfer> history_;     // Oldest first
};

} // namespace meshshare
