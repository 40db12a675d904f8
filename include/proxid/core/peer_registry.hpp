/**
 * @file peer_registry.hpp
 * @brief Thread-safe set of currently visible peers.
 *
 * The PeerRegistry owns:
 * - One record per visible PeerId with its last sighting time
 * - The advisory TransportAddress -> PeerId cache
 *
 * It is written from the radio context (sightings) and from the sweep
 * timer, and read from any thread. Everything is guarded by one mutex that
 * covers only the registry's own fields; no method calls out while holding
 * it.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#pragma once

#include "proxid/core/export.hpp"
#include "proxid/core/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace proxid {
namespace core {

/**
 * @struct PeerRecord
 * @brief A visible peer.
 */
struct PROXID_CORE_API PeerRecord {
    PeerId peer_id;
    TimePoint first_seen;   ///< Start of the current visibility episode
    TimePoint last_seen;    ///< Newest sighting timestamp
    uint64_t sightings;     ///< Sightings in this episode

    PeerRecord() : sightings(0) {}
};

/**
 * @class PeerRegistry
 * @brief Visible peers with staleness-based expiry.
 *
 * A PeerId is present from its first upsert until a sweep finds it stale
 * (now - last_seen >= threshold) or the registry is cleared. upsert()
 * reports the absent -> present transition so the caller can emit exactly
 * one "discovered" notification per visibility episode; sweep() and clear()
 * return the ids that made the present -> absent transition.
 *
 * @code
 * PeerRegistry registry;
 * if (registry.upsert("alice", Clock::now())) {
 *     // alice is newly visible
 * }
 * for (const auto& lost : registry.sweep(Clock::now(), std::chrono::seconds(5))) {
 *     // lost is no longer visible
 * }
 * @endcode
 */
class PROXID_CORE_API PeerRegistry {
public:
    PeerRegistry();
    ~PeerRegistry() = default;

    PeerRegistry(const PeerRegistry&) = delete;
    PeerRegistry& operator=(const PeerRegistry&) = delete;

    // =========================================================================
    // Visible Peers
    // =========================================================================

    /**
     * @brief Insert a peer or refresh its last sighting.
     *
     * last_seen never moves backwards: a timestamp older than the stored
     * one still counts the sighting but keeps the newer time.
     *
     * @return True if the peer was absent (a new visibility episode).
     *         Always false while the registry is closed.
     */
    bool upsert(const PeerId& peerId, TimePoint timestamp);

    /**
     * @brief Evict every peer with now - last_seen >= stalenessThreshold.
     * @return The evicted ids.
     */
    std::vector<PeerId> sweep(TimePoint now, std::chrono::milliseconds stalenessThreshold);

    /**
     * @brief Snapshot of the visible ids.
     */
    std::vector<PeerId> listPeers() const;

    /**
     * @brief Copy of one record, if visible.
     */
    std::optional<PeerRecord> getPeer(const PeerId& peerId) const;

    size_t size() const;

    /**
     * @brief Remove every record.
     * @return The removed ids.
     */
    std::vector<PeerId> clear();

    // =========================================================================
    // Session Gate
    // =========================================================================

    /**
     * @brief Accept upserts (the initial state).
     */
    void open();

    /**
     * @brief Stop accepting upserts and clear, as one step.
     *
     * Exchanges that complete after close() cannot bring a peer back.
     * @return The removed ids.
     */
    std::vector<PeerId> close();

    bool isOpen() const;

    // =========================================================================
    // Address Cache
    // =========================================================================

    /**
     * @brief Remember which PeerId a transport address resolved to.
     */
    void rememberAddress(const TransportAddress& address, const PeerId& peerId);

    /**
     * @brief Cached PeerId for an address. Advisory only: a hit says
     *        nothing about whether the peer is currently visible.
     */
    std::optional<PeerId> lookupAddress(const TransportAddress& address) const;

    /**
     * @brief Drop the address cache (addresses die with a radio power cycle).
     * @return Number of entries dropped.
     */
    size_t forgetAddresses();

    size_t addressCount() const;

private:
    mutable std::mutex mutex_;
    bool open_;
    std::unordered_map<PeerId, PeerRecord> peers_;
    std::unordered_map<TransportAddress, PeerId> addresses_;

    std::vector<PeerId> clearLocked();
};

}  // namespace core
}  // namespace proxid
