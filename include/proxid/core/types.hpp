/**
 * @file types.hpp
 * @brief Identifiers, sightings and error taxonomy shared by the core.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#pragma once

#include "proxid/core/export.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace proxid {
namespace core {

/// Stable identifier of a logical peer. UTF-8 text.
using PeerId = std::string;

/// Session-scoped handle the radio assigns a device before its PeerId is known.
using TransportAddress = std::string;

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/// Time source. Production code uses Clock::now; tests inject a manual clock.
using ClockFn = std::function<TimePoint()>;

/// Service marker advertised by every participating device.
constexpr const char* kServiceUuid = "A7CE1234-1234-1234-1234-123456789ABC";

/// Readable characteristic under the service marker holding the PeerId.
constexpr const char* kPeerIdCharacteristicUuid = "A7CE5678-5678-5678-5678-567890DEF012";

constexpr const char* kDefaultLocalName = "proxid";

/**
 * @struct Sighting
 * @brief One scan observation of a device advertising the service marker.
 */
struct PROXID_CORE_API Sighting {
    TransportAddress address;
    std::optional<std::string> embeddedIdentifier;  ///< Raw service data bytes
    int rssi;
    TimePoint timestamp;

    Sighting() : rssi(0) {}
};

/**
 * @enum DiscoveryError
 * @brief Failure conditions. None of them is ever surfaced to the listener.
 */
enum class DiscoveryError {
    RADIO_UNAVAILABLE,     ///< Power off, unauthorized, unsupported or resetting
    MALFORMED_IDENTIFIER,  ///< Identifier bytes failed validation
    CONNECT_FAILURE,       ///< Connection could not be established
    ENDPOINT_MISSING,      ///< Service or characteristic not found
    READ_FAILURE           ///< Characteristic read failed
};

inline const char* discoveryErrorToString(DiscoveryError error) {
    switch (error) {
        case DiscoveryError::RADIO_UNAVAILABLE: return "radio-unavailable";
        case DiscoveryError::MALFORMED_IDENTIFIER: return "malformed-identifier";
        case DiscoveryError::CONNECT_FAILURE: return "connect-failure";
        case DiscoveryError::ENDPOINT_MISSING: return "endpoint-missing";
        case DiscoveryError::READ_FAILURE: return "read-failure";
        default: return "unknown";
    }
}

}  // namespace core
}  // namespace proxid
