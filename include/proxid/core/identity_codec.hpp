/**
 * @file identity_codec.hpp
 * @brief PeerId <-> wire bytes.
 *
 * PeerIds travel as raw UTF-8, both in the advertisement service data and
 * as the value of the identity characteristic.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#pragma once

#include "proxid/core/export.hpp"
#include "proxid/core/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace proxid {
namespace core {

/// Largest identifier accepted from the wire (attribute value limit).
constexpr size_t kMaxPeerIdBytes = 512;

/// Identifiers up to this size fit in the advertisement next to the marker.
constexpr size_t kRecommendedPeerIdBytes = 20;

/**
 * @brief Check that text is usable as a PeerId.
 *
 * Non-empty, at most kMaxPeerIdBytes, well-formed UTF-8 (no overlong
 * forms, surrogates or code points above U+10FFFF) and free of NUL.
 */
PROXID_CORE_API bool isValidPeerId(const std::string& text);

/**
 * @brief Decode identifier bytes received from a peer.
 * @return The PeerId, or nullopt when the bytes are malformed.
 */
PROXID_CORE_API std::optional<PeerId> decodePeerId(const std::string& bytes);

/**
 * @brief Encode a PeerId for the wire. The encoding is the identity.
 */
inline std::string encodePeerId(const PeerId& peerId) {
    return peerId;
}

}  // namespace core
}  // namespace proxid
