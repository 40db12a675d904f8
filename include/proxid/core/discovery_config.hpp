/**
 * @file discovery_config.hpp
 * @brief Tunables of the discovery engine.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#pragma once

#include "proxid/core/export.hpp"
#include "proxid/core/types.hpp"

#include <chrono>
#include <string>

namespace proxid {
namespace core {

/**
 * @struct DiscoveryConfig
 * @brief Wire identifiers and timing of discovery.
 */
struct PROXID_CORE_API DiscoveryConfig {
    std::string service_uuid;                   ///< Service marker
    std::string identity_characteristic_uuid;   ///< Readable PeerId attribute
    std::string local_name;                     ///< Advertised device name
    bool embed_identity;                        ///< PeerId in advertisement service data
    int staleness_threshold_ms;                 ///< Age at which a peer is lost
    int sweep_interval_ms;                      ///< Period of the staleness sweep

    DiscoveryConfig()
        : service_uuid(kServiceUuid)
        , identity_characteristic_uuid(kPeerIdCharacteristicUuid)
        , local_name(kDefaultLocalName)
        , embed_identity(true)
        , staleness_threshold_ms(5000)
        , sweep_interval_ms(2000)
    {}

    std::chrono::milliseconds stalenessThreshold() const {
        return std::chrono::milliseconds(staleness_threshold_ms);
    }

    std::chrono::milliseconds sweepInterval() const {
        return std::chrono::milliseconds(sweep_interval_ms);
    }

    /**
     * @brief Check the configuration.
     *
     * Requires both uuids, a positive sweep interval, and a sweep interval
     * strictly below the staleness threshold (otherwise live peers with a
     * short scan gap get evicted).
     *
     * @param error Receives a description of the first problem, if any.
     */
    bool validate(std::string* error = nullptr) const;
};

}  // namespace core
}  // namespace proxid
