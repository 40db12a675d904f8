/**
 * @file scan_controller.hpp
 * @brief Continuous scan for devices advertising the service marker.
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
#include <functional>
#include <memory>

namespace proxid {
namespace core {

/**
 * @class ScanController
 * @brief Turns scan results into sightings.
 *
 * Scanning is requested with duplicates allowed: a stationary peer must
 * keep producing sightings, since they are what keeps it from going stale.
 * Like AdvertiseController, scanning stops when the radio becomes
 * unavailable and resumes when it powers back on.
 *
 * All methods run on the radio executor.
 */
class PROXID_CORE_API ScanController
    : public std::enable_shared_from_this<ScanController> {
public:
    using SightingHandler = std::function<void(const Sighting& sighting)>;
    using RadioLostHandler = std::function<void(RadioState state)>;

    ScanController(std::shared_ptr<CentralRadio> radio,
                   const DiscoveryConfig& config,
                   ClockFn clock);

    ScanController(const ScanController&) = delete;
    ScanController& operator=(const ScanController&) = delete;

    /// Receives every sighting of a device advertising the service marker.
    void setSightingHandler(SightingHandler handler);

    /// Called once each time the radio goes from usable to unavailable.
    void setRadioLostHandler(RadioLostHandler handler);

    void attach();
    void detach();

    /// Idempotent.
    void start();

    /// Idempotent.
    void stop();

    bool isStarted() const { return started_; }
    bool isScanning() const { return scanning_; }

    /// Sightings forwarded since construction.
    uint64_t sightingCount() const { return sightings_; }

    void onRadioStateChanged(RadioState state);
    void onScanResult(const ScanResult& result);

private:
    std::shared_ptr<CentralRadio> radio_;
    DiscoveryConfig config_;
    ClockFn clock_;

    SightingHandler sightingHandler_;
    RadioLostHandler radioLostHandler_;

    bool started_;
    bool scanning_;
    bool radioUsable_;
    uint64_t sightings_;

    void beginScan();
    void haltScan();
};

}  // namespace core
}  // namespace proxid
