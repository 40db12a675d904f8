/**
 * @file peer_registry.cpp
 * @brief PeerRegistry implementation.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#include "proxid/core/peer_registry.hpp"
#include "proxid/utils/logger.hpp"

namespace proxid {
namespace core {

PeerRegistry::PeerRegistry()
    : open_(true)
{}

// =============================================================================
// Visible Peers
// =============================================================================

bool PeerRegistry::upsert(const PeerId& peerId, TimePoint timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!open_) {
        LOG_TRACE("PeerRegistry", "Closed, ignoring sighting of {}", peerId);
        return false;
    }

    auto it = peers_.find(peerId);
    if (it == peers_.end()) {
        PeerRecord record;
        record.peer_id = peerId;
        record.first_seen = timestamp;
        record.last_seen = timestamp;
        record.sightings = 1;
        peers_.emplace(peerId, std::move(record));
        LOG_DEBUG("PeerRegistry", "New peer {} ({} visible)", peerId, peers_.size());
        return true;
    }

    auto& record = it->second;
    if (timestamp > record.last_seen) {
        record.last_seen = timestamp;
    }
    ++record.sightings;
    return false;
}

std::vector<PeerId> PeerRegistry::sweep(TimePoint now,
                                        std::chrono::milliseconds stalenessThreshold) {
    std::vector<PeerId> stale;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = peers_.begin(); it != peers_.end(); ) {
        auto age = std::chrono::duration_cast<std::chrono::milliseconds>(
            now - it->second.last_seen);
        if (age >= stalenessThreshold) {
            LOG_DEBUG("PeerRegistry", "Peer {} stale after {}ms", it->first, age.count());
            stale.push_back(it->first);
            it = peers_.erase(it);
        } else {
            ++it;
        }
    }
    return stale;
}

std::vector<PeerId> PeerRegistry::listPeers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PeerId> result;
    result.reserve(peers_.size());
    for (const auto& [id, record] : peers_) {
        result.push_back(id);
    }
    return result;
}

std::optional<PeerRecord> PeerRegistry::getPeer(const PeerId& peerId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(peerId);
    if (it == peers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t PeerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.size();
}

std::vector<PeerId> PeerRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    return clearLocked();
}

std::vector<PeerId> PeerRegistry::clearLocked() {
    std::vector<PeerId> removed;
    removed.reserve(peers_.size());
    for (const auto& [id, record] : peers_) {
        removed.push_back(id);
    }
    peers_.clear();
    if (!removed.empty()) {
        LOG_DEBUG("PeerRegistry", "Cleared {} peers", removed.size());
    }
    return removed;
}

// =============================================================================
// Session Gate
// =============================================================================

void PeerRegistry::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = true;
}

std::vector<PeerId> PeerRegistry::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = false;
    return clearLocked();
}

bool PeerRegistry::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

// =============================================================================
// Address Cache
// =============================================================================

void PeerRegistry::rememberAddress(const TransportAddress& address, const PeerId& peerId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = addresses_.insert_or_assign(address, peerId);
    if (inserted) {
        LOG_TRACE("PeerRegistry", "Address {} -> {}", address, peerId);
    }
}

std::optional<PeerId> PeerRegistry::lookupAddress(const TransportAddress& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = addresses_.find(address);
    if (it == addresses_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t PeerRegistry::forgetAddresses() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = addresses_.size();
    addresses_.clear();
    return count;
}

size_t PeerRegistry::addressCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return addresses_.size();
}

}  // namespace core
}  // namespace proxid
