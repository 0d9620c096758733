#include "peer_directory.h"

namespace meshshare {

StaticPeerDirectory::StaticPeerDirectory(const std::vector<PeerInfo>& peers) {
    for (const auto& peer : peers) {
        peers_[peer.address] = peer;
    }
}

std::optional<PeerInfo> StaticPeerDirectory::find_peer(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(address);
    if (it == peers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void StaticPeerDirectory::set_peer(const PeerInfo& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    peers_[peer.address] = peer;
}

bool StaticPeerDirectory::remove_peer(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.erase(address) > 0;
}

size_t StaticPeerDirectory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.size();
}

} // namespace meshshare
