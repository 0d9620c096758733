#pragma once

#include <string>
#include <vector>

namespace meshshare {

/**
 * Commands sent to the external transfer engine.
 *
 * Calls may block; EventManager never invokes them while holding the
 * registry lock. A false return is logged by the caller and does not
 * roll back registry state.
 */
class TransferEngine {
public:
    virtual ~TransferEngine() = default;

    /**
     * Release the transfer on the engine side.
     * Called at most once per transfer.
     */
    virtual bool finalize(const std::string& transfer_id) = 0;

    /**
     * Start downloading the accepted paths into destination.
     * An empty file_ids list means the whole transfer.
     */
    virtual bool accept(const std::string& transfer_id, const std::string& destination,
                        const std::vector<std::string>& file_ids) = 0;

    virtual bool cancel_file(const std::string& transfer_id, const std::string& file_id) = 0;
};

} // namespace meshshare
