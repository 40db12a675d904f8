/**
 * @file identity_resolver.hpp
 * @brief Maps sightings to PeerIds.
 *
 * A sighting is resolved by, in order:
 * 1. The identifier embedded in the advertisement, if any
 * 2. The address cache kept in the PeerRegistry
 * 3. A connect-and-query exchange: connect, find the identity
 *    characteristic under the service marker, read it, disconnect
 *
 * At most one exchange per address is in flight. Failed exchanges are
 * abandoned without retry; the next sighting of the address tries again.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#pragma once

#include "proxid/core/discovery_config.hpp"
#include "proxid/core/export.hpp"
#include "proxid/core/peer_registry.hpp"
#include "proxid/core/radio.hpp"
#include "proxid/core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace proxid {
namespace core {

/**
 * @struct ResolverStats
 * @brief Resolution counters since construction.
 */
struct PROXID_CORE_API ResolverStats {
    uint64_t embedded = 0;              ///< Resolved from advertisement data
    uint64_t cached = 0;                ///< Resolved from the address cache
    uint64_t exchanges_started = 0;
    uint64_t exchanges_succeeded = 0;
    uint64_t exchanges_failed = 0;      ///< Includes mid-exchange disconnects
    uint64_t malformed = 0;             ///< Identifiers that failed to decode
    uint64_t coalesced = 0;             ///< Sightings dropped while pending
};

/**
 * @class IdentityResolver
 * @brief Resolves sightings and reports (PeerId, timestamp) pairs.
 *
 * handleSighting(), reset() and all radio callbacks run on the radio
 * executor. isPending(), pendingCount() and stats() may be called from any
 * thread.
 */
class PROXID_CORE_API IdentityResolver
    : public std::enable_shared_from_this<IdentityResolver> {
public:
    using ResolvedHandler = std::function<void(const PeerId& peerId, TimePoint timestamp)>;

    IdentityResolver(std::shared_ptr<CentralRadio> radio,
                     std::shared_ptr<PeerRegistry> registry,
                     const DiscoveryConfig& config,
                     ClockFn clock,
                     ResolvedHandler onResolved);

    IdentityResolver(const IdentityResolver&) = delete;
    IdentityResolver& operator=(const IdentityResolver&) = delete;

    /// Pass nullptr to stop reporting.
    void setResolvedHandler(ResolvedHandler handler);

    void handleSighting(const Sighting& sighting);

    /**
     * @brief Abandon every in-flight exchange.
     *
     * Connections are cancelled and late completions of the abandoned
     * exchanges are ignored.
     */
    void reset();

    /**
     * @brief reset() plus dropping the address cache.
     */
    void onRadioUnavailable();

    bool isPending(const TransportAddress& address) const;
    size_t pendingCount() const;
    ResolverStats stats() const;

private:
    std::shared_ptr<CentralRadio> radio_;
    std::shared_ptr<PeerRegistry> registry_;
    DiscoveryConfig config_;
    ClockFn clock_;
    ResolvedHandler onResolved_;

    mutable std::mutex mutex_;
    std::unordered_map<TransportAddress, uint64_t> pending_;  ///< address -> attempt id
    uint64_t nextAttempt_;
    ResolverStats stats_;

    void report(const PeerId& peerId, TimePoint timestamp);

    // Exchange steps
    void beginExchange(const TransportAddress& address);
    void onConnected(const TransportAddress& address, uint64_t attempt,
                     const RadioStatus& status);
    void onServicesDiscovered(const TransportAddress& address, uint64_t attempt,
                              const RadioStatus& status,
                              const std::vector<std::string>& services);
    void onCharacteristicsDiscovered(const TransportAddress& address, uint64_t attempt,
                                     const RadioStatus& status,
                                     const std::vector<std::string>& characteristics);
    void onIdentityRead(const TransportAddress& address, uint64_t attempt,
                        const RadioStatus& status, const std::string& value);
    void onDisconnected(const TransportAddress& address, uint64_t attempt);

    bool isCurrent(const TransportAddress& address, uint64_t attempt) const;

    /// Clears the pending marker if attempt is still the current one.
    bool finish(const TransportAddress& address, uint64_t attempt);

    void abandon(const TransportAddress& address, uint64_t attempt,
                 DiscoveryError error, const std::string& detail);
};

}  // namespace core
}  // namespace proxid
