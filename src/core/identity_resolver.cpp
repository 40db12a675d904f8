/**
 * @file identity_resolver.cpp
 * @brief IdentityResolver implementation.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#include "proxid/core/identity_resolver.hpp"
#include "proxid/core/identity_codec.hpp"
#include "proxid/utils/logger.hpp"
#include "proxid/utils/uuid.hpp"

#include <algorithm>
#include <string>

namespace proxid {
namespace core {

namespace {

bool containsUuid(const std::vector<std::string>& uuids, const std::string& wanted) {
    return std::any_of(uuids.begin(), uuids.end(), [&](const std::string& uuid) {
        return utils::uuidEquals(uuid, wanted);
    });
}

}  // namespace

IdentityResolver::IdentityResolver(std::shared_ptr<CentralRadio> radio,
                                   std::shared_ptr<PeerRegistry> registry,
                                   const DiscoveryConfig& config,
                                   ClockFn clock,
                                   ResolvedHandler onResolved)
    : radio_(std::move(radio))
    , registry_(std::move(registry))
    , config_(config)
    , clock_(std::move(clock))
    , onResolved_(std::move(onResolved))
    , nextAttempt_(0)
{}

void IdentityResolver::setResolvedHandler(ResolvedHandler handler) {
    onResolved_ = std::move(handler);
}

// =============================================================================
// Sightings
// =============================================================================

void IdentityResolver::handleSighting(const Sighting& sighting) {
    if (sighting.embeddedIdentifier) {
        auto peerId = decodePeerId(*sighting.embeddedIdentifier);
        if (!peerId) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++stats_.malformed;
            }
            LOG_WARN("Resolver", "Dropping sighting of {}: {}", sighting.address,
                     discoveryErrorToString(DiscoveryError::MALFORMED_IDENTIFIER));
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.embedded;
        }
        registry_->rememberAddress(sighting.address, *peerId);
        report(*peerId, sighting.timestamp);
        return;
    }

    if (auto cached = registry_->lookupAddress(sighting.address)) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.cached;
        }
        report(*cached, sighting.timestamp);
        return;
    }

    beginExchange(sighting.address);
}

void IdentityResolver::report(const PeerId& peerId, TimePoint timestamp) {
    if (onResolved_) {
        onResolved_(peerId, timestamp);
    }
}

// =============================================================================
// Connect-and-Query Exchange
// =============================================================================

void IdentityResolver::beginExchange(const TransportAddress& address) {
    uint64_t attempt;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_.count(address) > 0) {
            ++stats_.coalesced;
            return;
        }
        attempt = ++nextAttempt_;
        pending_[address] = attempt;
        ++stats_.exchanges_started;
    }

    LOG_DEBUG("Resolver", "Querying identity of {} (attempt {})", address, attempt);

    std::weak_ptr<IdentityResolver> weak = weak_from_this();
    radio_->connect(
        address,
        [weak, address, attempt](const RadioStatus& status) {
            if (auto self = weak.lock()) {
                self->onConnected(address, attempt, status);
            }
        },
        [weak, address, attempt](const RadioStatus&) {
            if (auto self = weak.lock()) {
                self->onDisconnected(address, attempt);
            }
        });
}

void IdentityResolver::onConnected(const TransportAddress& address, uint64_t attempt,
                                   const RadioStatus& status) {
    if (!isCurrent(address, attempt)) {
        // Abandoned while connecting. Drop the link unless a newer attempt owns it.
        if (status.ok()) {
            bool superseded;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                superseded = pending_.count(address) > 0;
            }
            if (!superseded) {
                radio_->cancelConnection(address);
            }
        }
        return;
    }

    if (!status.ok()) {
        if (finish(address, attempt)) {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.exchanges_failed;
        }
        LOG_DEBUG("Resolver", "{}: {} ({})", address,
                  discoveryErrorToString(DiscoveryError::CONNECT_FAILURE), status.message());
        return;
    }

    std::weak_ptr<IdentityResolver> weak = weak_from_this();
    radio_->discoverServices(
        address, {config_.service_uuid},
        [weak, address, attempt](const RadioStatus& result,
                                 const std::vector<std::string>& services) {
            if (auto self = weak.lock()) {
                self->onServicesDiscovered(address, attempt, result, services);
            }
        });
}

void IdentityResolver::onServicesDiscovered(const TransportAddress& address, uint64_t attempt,
                                            const RadioStatus& status,
                                            const std::vector<std::string>& services) {
    if (!isCurrent(address, attempt)) {
        return;
    }
    if (!status.ok()) {
        abandon(address, attempt, DiscoveryError::ENDPOINT_MISSING, status.message());
        return;
    }
    if (!containsUuid(services, config_.service_uuid)) {
        abandon(address, attempt, DiscoveryError::ENDPOINT_MISSING, "service marker not published");
        return;
    }

    std::weak_ptr<IdentityResolver> weak = weak_from_this();
    radio_->discoverCharacteristics(
        address, config_.service_uuid, {config_.identity_characteristic_uuid},
        [weak, address, attempt](const RadioStatus& result,
                                 const std::vector<std::string>& characteristics) {
            if (auto self = weak.lock()) {
                self->onCharacteristicsDiscovered(address, attempt, result, characteristics);
            }
        });
}

void IdentityResolver::onCharacteristicsDiscovered(
    const TransportAddress& address, uint64_t attempt,
    const RadioStatus& status, const std::vector<std::string>& characteristics) {
    if (!isCurrent(address, attempt)) {
        return;
    }
    if (!status.ok()) {
        abandon(address, attempt, DiscoveryError::ENDPOINT_MISSING, status.message());
        return;
    }
    if (!containsUuid(characteristics, config_.identity_characteristic_uuid)) {
        abandon(address, attempt, DiscoveryError::ENDPOINT_MISSING,
                "identity characteristic not published");
        return;
    }

    std::weak_ptr<IdentityResolver> weak = weak_from_this();
    radio_->readCharacteristic(
        address, config_.service_uuid, config_.identity_characteristic_uuid,
        [weak, address, attempt](const RadioStatus& result, const std::string& value) {
            if (auto self = weak.lock()) {
                self->onIdentityRead(address, attempt, result, value);
            }
        });
}

void IdentityResolver::onIdentityRead(const TransportAddress& address, uint64_t attempt,
                                      const RadioStatus& status, const std::string& value) {
    if (!isCurrent(address, attempt)) {
        return;
    }
    if (!status.ok()) {
        abandon(address, attempt, DiscoveryError::READ_FAILURE, status.message());
        return;
    }

    auto peerId = decodePeerId(value);
    if (!peerId) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.malformed;
        }
        abandon(address, attempt, DiscoveryError::MALFORMED_IDENTIFIER,
                std::to_string(value.size()) + " bytes");
        return;
    }

    if (!finish(address, attempt)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.exchanges_succeeded;
    }

    LOG_DEBUG("Resolver", "{} is {}", address, *peerId);
    registry_->rememberAddress(address, *peerId);
    radio_->cancelConnection(address);
    report(*peerId, clock_());
}

void IdentityResolver::onDisconnected(const TransportAddress& address, uint64_t attempt) {
    if (finish(address, attempt)) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.exchanges_failed;
        }
        LOG_DEBUG("Resolver", "{} disconnected mid-exchange", address);
    }
}

// =============================================================================
// Pending State
// =============================================================================

bool IdentityResolver::isCurrent(const TransportAddress& address, uint64_t attempt) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(address);
    return it != pending_.end() && it->second == attempt;
}

bool IdentityResolver::finish(const TransportAddress& address, uint64_t attempt) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(address);
    if (it == pending_.end() || it->second != attempt) {
        return false;
    }
    pending_.erase(it);
    return true;
}

void IdentityResolver::abandon(const TransportAddress& address, uint64_t attempt,
                               DiscoveryError error, const std::string& detail) {
    if (!finish(address, attempt)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.exchanges_failed;
    }
    LOG_DEBUG("Resolver", "Abandoning {}: {} ({})", address, discoveryErrorToString(error), detail);
    radio_->cancelConnection(address);
}

void IdentityResolver::reset() {
    std::vector<TransportAddress> abandoned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        abandoned.reserve(pending_.size());
        for (const auto& [address, attempt] : pending_) {
            abandoned.push_back(address);
        }
        pending_.clear();
    }

    for (const auto& address : abandoned) {
        radio_->cancelConnection(address);
    }
    if (!abandoned.empty()) {
        LOG_DEBUG("Resolver", "Abandoned {} pending exchanges", abandoned.size());
    }
}

void IdentityResolver::onRadioUnavailable() {
    reset();
    size_t forgotten = registry_->forgetAddresses();
    if (forgotten > 0) {
        LOG_DEBUG("Resolver", "Forgot {} cached addresses", forgotten);
    }
}

bool IdentityResolver::isPending(const TransportAddress& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(address) > 0;
}

size_t IdentityResolver::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

ResolverStats IdentityResolver::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

}  // namespace core
}  // namespace proxid
