#include "config.h"
#include "fs.h"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <limits>

#define LOG_CONFIG_DEBUG(message) LOG_DEBUG("config", message)
#define LOG_CONFIG_INFO(message)  LOG_INFO("config", message)
#define LOG_CONFIG_WARN(message)  LOG_WARN("config", message)
#define LOG_CONFIG_ERROR(message) LOG_ERROR("config", message)

namespace meshshare {

FileshareConfig::FileshareConfig()
    : download_directory(default_download_directory()),
      max_accept_size(0),
      notifications_enabled(true),
      history_file("transfers.json"),
      progress_channel_capacity(16),
      log_level(LogLevel::INFO) {
}

uint64_t FileshareConfig::effective_size_limit() const {
    return max_accept_size == 0 ? std::numeric_limits<uint64_t>::max() : max_accept_size;
}

std::string default_download_directory() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return combine_paths(home, "Downloads");
    }
    return "./downloads";
}

bool save_config(const std::string& path, const FileshareConfig& config) {
    try {
        nlohmann::json json;
        json["download_directory"] = config.download_directory;
        json["max_accept_size"] = config.max_accept_size;
        json["notifications_enabled"] = config.notifications_enabled;
        json["history_file"] = config.history_file;
        json["progress_channel_capacity"] = config.progress_channel_capacity;
        json["log_level"] = log_level_to_string(config.log_level);
        json["log_file"] = config.log_file;

        nlohmann::json peers = nlohmann::json::array();
        for (const auto& peer : config.peers) {
            nlohmann::json entry;
            entry["address"] = peer.address;
            entry["hostname"] = peer.hostname;
            entry["allow_fileshare"] = peer.allows_fileshare;
            peers.push_back(entry);
        }
        json["peers"] = peers;

        if (!create_file(path, json.dump(4))) {
            LOG_CONFIG_ERROR("Failed to write configuration file " << path);
            return false;
        }

        LOG_CONFIG_DEBUG("Saved configuration to " << path);
        return true;
    } catch (const nlohmann::json::exception& e) {
        LOG_CONFIG_ERROR("Failed to serialize configuration: " << e.what());
        return false;
    }
}

bool load_config(const std::string& path, FileshareConfig& config) {
    LOG_CONFIG_INFO("Loading configuration from " << path);

    if (!file_exists(path)) {
        LOG_CONFIG_INFO("No existing configuration found, writing defaults");
        return save_config(path, config);
    }

    try {
        std::string data = read_file_text_cpp(path);
        if (data.empty()) {
            LOG_CONFIG_ERROR("Configuration file is empty");
            return false;
        }

        nlohmann::json json = nlohmann::json::parse(data);
        if (!json.is_object()) {
            LOG_CONFIG_ERROR("Configuration file is not a JSON object");
            return false;
        }

        // Parse into a copy so a type error halfway leaves config untouched
        FileshareConfig loaded = config;
        loaded.download_directory = json.value("download_directory", loaded.download_directory);
        loaded.max_accept_size = json.value("max_accept_size", loaded.max_accept_size);
        loaded.notifications_enabled = json.value("notifications_enabled", loaded.notifications_enabled);
        loaded.history_file = json.value("history_file", loaded.history_file);
        loaded.progress_channel_capacity = json.value("progress_channel_capacity", loaded.progress_channel_capacity);
        loaded.log_file = json.value("log_file", loaded.log_file);

        if (json.contains("log_level")) {
            loaded.log_level = log_level_from_string(json.value("log_level", "info"));
        }

        if (json.contains("peers")) {
            loaded.peers.clear();
            for (const auto& entry : json["peers"]) {
                PeerInfo peer;
                peer.address = entry.value("address", "");
                peer.hostname = entry.value("hostname", "");
                peer.allows_fileshare = entry.value("allow_fileshare", false);
                if (peer.address.empty()) {
                    LOG_CONFIG_WARN("Skipping peer entry without address");
                    continue;
                }
                loaded.peers.push_back(peer);
            }
        }

        if (loaded.progress_channel_capacity == 0) {
            LOG_CONFIG_WARN("progress_channel_capacity must be positive, using 1");
            loaded.progress_channel_capacity = 1;
        }

        config = loaded;
        LOG_CONFIG_INFO("Loaded configuration with " << config.peers.size() << " peers");
        return true;
    } catch (const nlohmann::json::exception& e) {
        LOG_CONFIG_ERROR("Failed to parse configuration file: " << e.what());
        return false;
    }
}

} // namespace meshshare
