/**
 * @file scan_controller.cpp
 * @brief ScanController implementation.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#include "proxid/core/scan_controller.hpp"
#include "proxid/utils/logger.hpp"

namespace proxid {
namespace core {

ScanController::ScanController(std::shared_ptr<CentralRadio> radio,
                               const DiscoveryConfig& config,
                               ClockFn clock)
    : radio_(std::move(radio))
    , config_(config)
    , clock_(std::move(clock))
    , started_(false)
    , scanning_(false)
    , radioUsable_(false)
    , sightings_(0)
{}

void ScanController::setSightingHandler(SightingHandler handler) {
    sightingHandler_ = std::move(handler);
}

void ScanController::setRadioLostHandler(RadioLostHandler handler) {
    radioLostHandler_ = std::move(handler);
}

void ScanController::attach() {
    std::weak_ptr<ScanController> weak = weak_from_this();
    radio_->setCentralStateHandler([weak](RadioState state) {
        if (auto self = weak.lock()) {
            self->onRadioStateChanged(state);
        }
    });
    onRadioStateChanged(radio_->centralState());
}

void ScanController::detach() {
    stop();
    radio_->setCentralStateHandler(nullptr);
    sightingHandler_ = nullptr;
    radioLostHandler_ = nullptr;
}

void ScanController::start() {
    if (started_) {
        return;
    }
    started_ = true;

    if (radio_->centralState() == RadioState::POWERED_ON) {
        beginScan();
    } else {
        LOG_INFO("Scan", "Radio is {}, will scan once powered on",
                 radioStateToString(radio_->centralState()));
    }
}

void ScanController::stop() {
    if (!started_) {
        return;
    }
    started_ = false;
    if (scanning_) {
        haltScan();
    }
    LOG_INFO("Scan", "Stopped");
}

void ScanController::onRadioStateChanged(RadioState state) {
    LOG_DEBUG("Scan", "Radio state: {}", radioStateToString(state));

    if (state == RadioState::POWERED_ON) {
        radioUsable_ = true;
        if (started_ && !scanning_) {
            beginScan();
        }
        return;
    }

    if (!isRadioUnavailable(state)) {
        return;
    }

    if (scanning_) {
        LOG_WARN("Scan", "Radio {}, scanning suspended", radioStateToString(state));
        haltScan();
    }
    if (radioUsable_) {
        radioUsable_ = false;
        if (radioLostHandler_) {
            radioLostHandler_(state);
        }
    }
}

void ScanController::onScanResult(const ScanResult& result) {
    if (!scanning_) {
        return;
    }
    if (!result.advertisement.advertisesService(config_.service_uuid)) {
        LOG_TRACE("Scan", "Ignoring {} (service marker absent)", result.address);
        return;
    }

    Sighting sighting;
    sighting.address = result.address;
    sighting.embeddedIdentifier = result.advertisement.serviceDataFor(config_.service_uuid);
    sighting.rssi = result.rssi;
    sighting.timestamp = clock_();
    ++sightings_;

    LOG_TRACE("Scan", "Sighting {} rssi={} embedded={}", sighting.address, sighting.rssi,
              sighting.embeddedIdentifier ? "yes" : "no");

    if (sightingHandler_) {
        sightingHandler_(sighting);
    }
}

void ScanController::beginScan() {
    std::weak_ptr<ScanController> weak = weak_from_this();

    ScanOptions options;
    options.allow_duplicates = true;

    scanning_ = true;
    radio_->startScan({config_.service_uuid}, options, [weak](const ScanResult& result) {
        if (auto self = weak.lock()) {
            self->onScanResult(result);
        }
    });
    LOG_INFO("Scan", "Scanning for service {}", config_.service_uuid);
}

void ScanController::haltScan() {
    radio_->stopScan();
    scanning_ = false;
}

}  // namespace core
}  // namespace proxid
