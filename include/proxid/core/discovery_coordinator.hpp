/**
 * @file discovery_coordinator.hpp
 * @brief Public entry point of the discovery engine.
 *
 * The DiscoveryCoordinator wires together:
 * - AdvertiseController: puts this device's PeerId on the air
 * - ScanController: reports sightings of other devices
 * - IdentityResolver: turns sightings into PeerIds
 * - PeerRegistry: tracks which PeerIds are currently visible
 *
 * and tells a DiscoveryListener when peers appear and disappear.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#pragma once

#include "proxid/core/advertise_controller.hpp"
#include "proxid/core/discovery_config.hpp"
#include "proxid/core/discovery_listener.hpp"
#include "proxid/core/export.hpp"
#include "proxid/core/identity_resolver.hpp"
#include "proxid/core/peer_registry.hpp"
#include "proxid/core/radio.hpp"
#include "proxid/core/scan_controller.hpp"
#include "proxid/core/serial_executor.hpp"
#include "proxid/core/types.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace proxid {
namespace core {

/**
 * @class DiscoveryCoordinator
 * @brief Starts, stops and reports peer discovery.
 *
 * Threads:
 * - Radio work runs on the radio executor
 * - Listener callbacks run on the delivery executor
 * - The staleness sweep runs on a timer thread owned by the coordinator
 *
 * Each registry transition and the queuing of its notification happen
 * under one lock, so a listener sees discovered/lost for a given peer in
 * the order the registry applied them.
 *
 * @code
 * auto radioExecutor = std::make_shared<SerialExecutor>("radio");
 * auto deliveryExecutor = std::make_shared<SerialExecutor>("delivery");
 * DiscoveryCoordinator coordinator(config, radio, radio, radioExecutor, deliveryExecutor);
 * coordinator.setListener(listener);
 * coordinator.startDiscovery("alice");
 * @endcode
 */
class PROXID_CORE_API DiscoveryCoordinator {
public:
    DiscoveryCoordinator(const DiscoveryConfig& config,
                         std::shared_ptr<PeripheralRadio> peripheral,
                         std::shared_ptr<CentralRadio> central,
                         std::shared_ptr<SerialExecutor> radioExecutor,
                         std::shared_ptr<SerialExecutor> deliveryExecutor,
                         ClockFn clock = Clock::now);

    /// Stops discovery and detaches from the radio.
    ~DiscoveryCoordinator();

    DiscoveryCoordinator(const DiscoveryCoordinator&) = delete;
    DiscoveryCoordinator& operator=(const DiscoveryCoordinator&) = delete;

    /**
     * @brief Set the notification target. Only a weak reference is kept.
     */
    void setListener(const std::shared_ptr<DiscoveryListener>& listener);

    /**
     * @brief Advertise peerId and start discovering others.
     *
     * Calling it again while running with a different peerId switches the
     * advertised identity without touching the discovered set.
     *
     * @return False if peerId is invalid or the configuration is rejected.
     */
    bool startDiscovery(const PeerId& peerId);

    /**
     * @brief Stop advertising and scanning, and forget every peer.
     *
     * Idempotent. onPeerLost is queued for every peer visible at the moment
     * of the call, and getDiscoveredPeers() is empty once it returns.
     * Exchanges still in flight cannot bring peers back.
     */
    void stopDiscovery();

    /// Snapshot of the visible peers.
    std::vector<PeerId> getDiscoveredPeers() const;

    bool isRunning() const { return running_.load(); }

    /// PeerId being advertised, empty when stopped.
    PeerId localPeerId() const;

    /**
     * @brief Run one staleness sweep now.
     * @return The peers it found stale.
     */
    std::vector<PeerId> sweepNow();

    ResolverStats resolverStats() const;

    const DiscoveryConfig& config() const { return config_; }

    std::shared_ptr<PeerRegistry> registry() const { return registry_; }

private:
    DiscoveryConfig config_;
    std::shared_ptr<SerialExecutor> radioExecutor_;
    std::shared_ptr<SerialExecutor> deliveryExecutor_;
    ClockFn clock_;

    std::shared_ptr<PeerRegistry> registry_;
    std::shared_ptr<AdvertiseController> advertiser_;
    std::shared_ptr<ScanController> scanner_;
    std::shared_ptr<IdentityResolver> resolver_;

    mutable std::mutex listenerMutex_;
    std::weak_ptr<DiscoveryListener> listener_;

    // Serializes registry transitions with the queuing of their notifications.
    // Acquired before the registry's own lock.
    std::mutex eventMutex_;

    // Guards start/stop and localPeerId_.
    mutable std::mutex stateMutex_;
    std::atomic<bool> running_{false};
    PeerId localPeerId_;

    std::mutex sweepMutex_;
    std::condition_variable sweepCondition_;
    bool sweepStop_;
    std::thread sweepThread_;

    void recordResolved(const PeerId& peerId, TimePoint timestamp);
    void publish(const PeerId& peerId, bool discovered);
    void postRadio(SerialExecutor::Task task);

    void startSweeper();
    void stopSweeper();
    void sweepLoop();
};

}  // namespace core
}  // namespace proxid
