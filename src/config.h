#pragma once

#include "logger.h"
#include "peer_directory.h"
#include <cstdint>
#include <string>
#include <vector>

namespace meshshare {

/**
 * Settings of the meshshare daemon, persisted as JSON
 */
struct FileshareConfig {
    std::string download_directory;         // Destination for accepts from notifications
    uint64_t max_accept_size;               // 0 = unlimited
    bool notifications_enabled;
    std::string history_file;               // Transfer history JSON file
    size_t progress_channel_capacity;       // Queued updates per subscriber
    LogLevel log_level;
    std::string log_file;                   // File logging is enabled when not empty
    std::vector<PeerInfo> peers;            // Static peer directory

    FileshareConfig();

    // Size limit for accept calls, with 0 translated to unlimited
    uint64_t effective_size_limit() const;
};

// $HOME/Downloads, or ./downloads when HOME is not set
std::string default_download_directory();

/**
 * Load config from path.
 *
 * A missing file is created with the current (default) values. An
 * unparsable file leaves config untouched and returns false. Unknown keys
 * are ignored.
 */
bool load_config(const std::string& path, FileshareConfig& config);
bool save_config(const std::string& path, const FileshareConfig& config);

} // namespace meshshare
