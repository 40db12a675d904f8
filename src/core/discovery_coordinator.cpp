/**
 * @file discovery_coordinator.cpp
 * @brief DiscoveryCoordinator implementation.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#include "proxid/core/discovery_coordinator.hpp"
#include "proxid/core/identity_codec.hpp"
#include "proxid/utils/logger.hpp"

namespace proxid {
namespace core {

DiscoveryCoordinator::DiscoveryCoordinator(const DiscoveryConfig& config,
                                           std::shared_ptr<PeripheralRadio> peripheral,
                                           std::shared_ptr<CentralRadio> central,
                                           std::shared_ptr<SerialExecutor> radioExecutor,
                                           std::shared_ptr<SerialExecutor> deliveryExecutor,
                                           ClockFn clock)
    : config_(config)
    , radioExecutor_(std::move(radioExecutor))
    , deliveryExecutor_(std::move(deliveryExecutor))
    , clock_(std::move(clock))
    , registry_(std::make_shared<PeerRegistry>())
    , sweepStop_(false)
{
    // Nothing is accepted until startDiscovery().
    registry_->close();

    advertiser_ = std::make_shared<AdvertiseController>(peripheral, config_);
    scanner_ = std::make_shared<ScanController>(central, config_, clock_);
    resolver_ = std::make_shared<IdentityResolver>(
        central, registry_, config_, clock_,
        [this](const PeerId& peerId, TimePoint timestamp) {
            recordResolved(peerId, timestamp);
        });

    std::weak_ptr<IdentityResolver> resolver = resolver_;
    scanner_->setSightingHandler([resolver](const Sighting& sighting) {
        if (auto r = resolver.lock()) {
            r->handleSighting(sighting);
        }
    });
    scanner_->setRadioLostHandler([resolver](RadioState) {
        if (auto r = resolver.lock()) {
            r->onRadioUnavailable();
        }
    });

    auto advertiser = advertiser_;
    auto scanner = scanner_;
    postRadio([advertiser, scanner]() {
        advertiser->attach();
        scanner->attach();
    });
}

DiscoveryCoordinator::~DiscoveryCoordinator() {
    stopDiscovery();

    auto advertiser = advertiser_;
    auto scanner = scanner_;
    auto resolver = resolver_;
    bool detached = radioExecutor_->runSync([advertiser, scanner, resolver]() {
        advertiser->detach();
        scanner->detach();
        resolver->setResolvedHandler(nullptr);
    });
    if (!detached) {
        // Radio executor already gone: no callback can reach us any more.
        LOG_DEBUG("Coordinator", "Radio executor stopped before coordinator teardown");
    }
}

void DiscoveryCoordinator::setListener(const std::shared_ptr<DiscoveryListener>& listener) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listener_ = listener;
}

// =============================================================================
// Start / Stop
// =============================================================================

bool DiscoveryCoordinator::startDiscovery(const PeerId& peerId) {
    if (!isValidPeerId(peerId)) {
        LOG_WARN("Coordinator", "Refusing to start: invalid peer id ({} bytes)", peerId.size());
        return false;
    }

    std::string error;
    if (!config_.validate(&error)) {
        LOG_ERROR("Coordinator", "Refusing to start: {}", error);
        return false;
    }

    if (peerId.size() > kRecommendedPeerIdBytes && config_.embed_identity) {
        LOG_INFO("Coordinator", "Peer id is {} bytes; peers may need to connect to read it",
                 peerId.size());
    }

    std::lock_guard<std::mutex> lock(stateMutex_);

    auto advertiser = advertiser_;
    if (running_.load()) {
        if (peerId != localPeerId_) {
            LOG_INFO("Coordinator", "Switching advertised identity to {}", peerId);
            localPeerId_ = peerId;
            postRadio([advertiser, peerId]() { advertiser->start(peerId); });
        }
        return true;
    }

    registry_->open();
    localPeerId_ = peerId;
    running_.store(true);

    auto scanner = scanner_;
    postRadio([advertiser, scanner, peerId]() {
        advertiser->start(peerId);
        scanner->start();
    });

    startSweeper();

    LOG_INFO("Coordinator", "Discovery started as {} (staleness {}ms, sweep {}ms)", peerId,
             config_.staleness_threshold_ms, config_.sweep_interval_ms);
    return true;
}

void DiscoveryCoordinator::stopDiscovery() {
    std::lock_guard<std::mutex> lock(stateMutex_);

    if (!running_.load()) {
        return;
    }
    running_.store(false);
    localPeerId_.clear();

    stopSweeper();

    size_t lostCount = 0;
    {
        std::lock_guard<std::mutex> events(eventMutex_);
        auto lost = registry_->close();
        lostCount = lost.size();
        for (const auto& peerId : lost) {
            publish(peerId, false);
        }
    }

    auto advertiser = advertiser_;
    auto scanner = scanner_;
    auto resolver = resolver_;
    postRadio([advertiser, scanner, resolver]() {
        scanner->stop();
        advertiser->stop();
        resolver->reset();
    });

    LOG_INFO("Coordinator", "Discovery stopped ({} peers dropped)", lostCount);
}

std::vector<PeerId> DiscoveryCoordinator::getDiscoveredPeers() const {
    return registry_->listPeers();
}

PeerId DiscoveryCoordinator::localPeerId() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return localPeerId_;
}

ResolverStats DiscoveryCoordinator::resolverStats() const {
    return resolver_->stats();
}

// =============================================================================
// Events
// =============================================================================

void DiscoveryCoordinator::recordResolved(const PeerId& peerId, TimePoint timestamp) {
    std::lock_guard<std::mutex> lock(eventMutex_);
    if (registry_->upsert(peerId, timestamp)) {
        LOG_INFO("Coordinator", "Peer discovered: {}", peerId);
        publish(peerId, true);
    }
}

std::vector<PeerId> DiscoveryCoordinator::sweepNow() {
    std::lock_guard<std::mutex> lock(eventMutex_);
    auto stale = registry_->sweep(clock_(), config_.stalenessThreshold());
    for (const auto& peerId : stale) {
        LOG_INFO("Coordinator", "Peer lost: {}", peerId);
        publish(peerId, false);
    }
    return stale;
}

void DiscoveryCoordinator::publish(const PeerId& peerId, bool discovered) {
    std::weak_ptr<DiscoveryListener> listener;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listener = listener_;
    }

    bool queued = deliveryExecutor_->post([listener, peerId, discovered]() {
        auto target = listener.lock();
        if (!target) {
            return;
        }
        if (discovered) {
            target->onPeerDiscovered(peerId);
        } else {
            target->onPeerLost(peerId);
        }
    });
    if (!queued) {
        LOG_WARN("Coordinator", "Delivery executor stopped, dropping {} event for {}",
                 discovered ? "discovered" : "lost", peerId);
    }
}

void DiscoveryCoordinator::postRadio(SerialExecutor::Task task) {
    if (!radioExecutor_->post(std::move(task))) {
        LOG_WARN("Coordinator", "Radio executor stopped, radio request dropped");
    }
}

// =============================================================================
// Sweep Timer
// =============================================================================

void DiscoveryCoordinator::startSweeper() {
    {
        std::lock_guard<std::mutex> lock(sweepMutex_);
        sweepStop_ = false;
    }
    sweepThread_ = std::thread(&DiscoveryCoordinator::sweepLoop, this);
}

void DiscoveryCoordinator::stopSweeper() {
    {
        std::lock_guard<std::mutex> lock(sweepMutex_);
        sweepStop_ = true;
    }
    sweepCondition_.notify_all();
    if (sweepThread_.joinable()) {
        sweepThread_.join();
    }
}

void DiscoveryCoordinator::sweepLoop() {
    LOG_DEBUG("Coordinator", "Sweep thread started");

    std::unique_lock<std::mutex> lock(sweepMutex_);
    while (!sweepStop_) {
        if (sweepCondition_.wait_for(lock, config_.sweepInterval(),
                                     [this]() { return sweepStop_; })) {
            break;
        }
        lock.unlock();
        sweepNow();
        lock.lock();
    }

    LOG_DEBUG("Coordinator", "Sweep thread stopped");
}

}  // namespace core
}  // namespace proxid
