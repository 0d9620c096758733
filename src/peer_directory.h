#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace meshshare {

/**
 * Mesh peer as known to the local device
 */
struct PeerInfo {
    std::string address;        // Mesh address used by the transfer engine
    std::string hostname;       // May be empty
    bool allows_fileshare;      // Local user lets this peer send files

    PeerInfo() : allows_fileshare(false) {}
    PeerInfo(std::string addr, std::string host, bool allow)
        : address(std::move(addr)), hostname(std::move(host)), allows_fileshare(allow) {}

    // Hostname when known, address otherwise
    const std::string& display_name() const { return hostname.empty() ? address : hostname; }
};

/**
 * Lookup of mesh peers by address
 */
class PeerDirectory {
public:
    virtual ~PeerDirectory() = default;
    virtual std::optional<PeerInfo> find_peer(const std::string& address) = 0;
};

/**
 * In-memory peer directory filled from configuration
 */
class StaticPeerDirectory : public PeerDirectory {
public:
    StaticPeerDirectory() = default;
    explicit StaticPeerDirectory(const std::vector<PeerInfo>& peers);

    std::optional<PeerInfo> find_peer(const std::string& address) override;

    // Add or replace a peer
    void set_peer(const PeerInfo& peer);
    bool remove_peer(const std::string& address);
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, PeerInfo> peers_;
};

} // namespace meshshare
