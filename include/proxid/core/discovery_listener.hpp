/**
 * @file discovery_listener.hpp
 * @brief Observer of peer visibility changes.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#pragma once

#include "proxid/core/export.hpp"
#include "proxid/core/types.hpp"

namespace proxid {
namespace core {

/**
 * @class DiscoveryListener
 * @brief Receives one call per visibility transition of a peer.
 *
 * Called on the delivery executor, never on the radio executor. For any
 * single peer, calls alternate discovered, lost, discovered, ...
 * The coordinator holds listeners weakly.
 */
class PROXID_CORE_API DiscoveryListener {
public:
    virtual ~DiscoveryListener() = default;

    virtual void onPeerDiscovered(const PeerId& peerId) = 0;

    virtual void onPeerLost(const PeerId& peerId) = 0;
};

}  // namespace core
}  // namespace proxid
