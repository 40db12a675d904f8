/**
 * @file advertise_controller.hpp
 * @brief Broadcasts this device's identity.
 *
 * While started and the radio is powered on, the controller:
 * - Publishes the service marker with one readable characteristic whose
 *   value is the local PeerId (for the connect-and-query path)
 * - Advertises the service marker, the local name and, when enabled, the
 *   PeerId as service data (for the direct path)
 *
 * Advertising follows the radio: it stops when the radio becomes
 * unavailable and resumes by itself when the radio powers back on.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#pragma once

#include "proxid/core/discovery_config.hpp"
#include "proxid/core/export.hpp"
#include "proxid/core/radio.hpp"
#include "proxid/core/types.hpp"

#include <cstdint>
#include <memory>

namespace proxid {
namespace core {

/**
 * @class AdvertiseController
 * @brief Keeps the peripheral role advertising the local identity.
 *
 * All methods run on the radio executor.
 */
class PROXID_CORE_API AdvertiseController
    : public std::enable_shared_from_this<AdvertiseController> {
public:
    AdvertiseController(std::shared_ptr<PeripheralRadio> radio,
                        const DiscoveryConfig& config);

    AdvertiseController(const AdvertiseController&) = delete;
    AdvertiseController& operator=(const AdvertiseController&) = delete;

    /**
     * @brief Subscribe to radio state changes. Call once after construction.
     */
    void attach();

    /**
     * @brief Stop advertising and unsubscribe from the radio.
     */
    void detach();

    /**
     * @brief Advertise peerId. Idempotent.
     *
     * An empty or invalid peerId is logged and ignored. A different peerId
     * replaces the one being advertised.
     */
    void start(const PeerId& peerId);

    /**
     * @brief Stop advertising. Idempotent.
     */
    void stop();

    /// Advertising has been requested (regardless of radio state).
    bool isStarted() const { return started_; }

    /// Advertising is actually on the air.
    bool isAdvertising() const { return advertising_; }

    const PeerId& peerId() const { return peerId_; }

    /// Radio state change entry point (wired by attach()).
    void onRadioStateChanged(RadioState state);

private:
    std::shared_ptr<PeripheralRadio> radio_;
    DiscoveryConfig config_;

    PeerId peerId_;
    bool started_;
    bool advertising_;
    uint64_t session_;   ///< Bumped on every begin/halt to spot stale completions

    void beginAdvertising();
    void haltAdvertising();
};

}  // namespace core
}  // namespace proxid
