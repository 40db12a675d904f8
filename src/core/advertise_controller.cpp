/**
 * @file advertise_controller.cpp
 * @brief AdvertiseController implementation.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#include "proxid/core/advertise_controller.hpp"
#include "proxid/core/identity_codec.hpp"
#include "proxid/utils/logger.hpp"

namespace proxid {
namespace core {

AdvertiseController::AdvertiseController(std::shared_ptr<PeripheralRadio> radio,
                                         const DiscoveryConfig& config)
    : radio_(std::move(radio))
    , config_(config)
    , started_(false)
    , advertising_(false)
    , session_(0)
{}

void AdvertiseController::attach() {
    std::weak_ptr<AdvertiseController> weak = weak_from_this();
    radio_->setPeripheralStateHandler([weak](RadioState state) {
        if (auto self = weak.lock()) {
            self->onRadioStateChanged(state);
        }
    });

    // The radio may have settled before we subscribed.
    onRadioStateChanged(radio_->peripheralState());
}

void AdvertiseController::detach() {
    stop();
    radio_->setPeripheralStateHandler(nullptr);
}

void AdvertiseController::start(const PeerId& peerId) {
    if (peerId.empty()) {
        LOG_WARN("Advertise", "No peer id configured; not advertising");
        return;
    }
    if (!isValidPeerId(peerId)) {
        LOG_WARN("Advertise", "Peer id is not valid UTF-8 of 1-{} bytes; not advertising",
                 kMaxPeerIdBytes);
        return;
    }

    if (started_ && peerId == peerId_) {
        return;
    }

    if (advertising_) {
        LOG_INFO("Advertise", "Peer id changed from {} to {}, restarting", peerId_, peerId);
        haltAdvertising();
    }

    peerId_ = peerId;
    started_ = true;

    if (radio_->peripheralState() == RadioState::POWERED_ON) {
        beginAdvertising();
    } else {
        LOG_INFO("Advertise", "Radio is {}, will advertise {} once powered on",
                 radioStateToString(radio_->peripheralState()), peerId_);
    }
}

void AdvertiseController::stop() {
    if (!started_) {
        return;
    }
    started_ = false;
    if (advertising_) {
        haltAdvertising();
    }
    LOG_INFO("Advertise", "Stopped");
}

void AdvertiseController::onRadioStateChanged(RadioState state) {
    LOG_DEBUG("Advertise", "Radio state: {}", radioStateToString(state));

    if (state == RadioState::POWERED_ON) {
        if (started_ && !advertising_) {
            beginAdvertising();
        }
    } else if (isRadioUnavailable(state)) {
        if (advertising_) {
            LOG_WARN("Advertise", "Radio {}, advertising suspended", radioStateToString(state));
            haltAdvertising();
        }
    }
    // UNKNOWN: wait for the next update
}

void AdvertiseController::beginAdvertising() {
    const std::string payload = encodePeerId(peerId_);
    uint64_t session = ++session_;

    GattService service;
    service.uuid = config_.service_uuid;
    service.characteristics.push_back({config_.identity_characteristic_uuid, payload});

    radio_->removeAllServices();
    radio_->addService(service, [](const RadioStatus& status) {
        if (status.ok()) {
            LOG_DEBUG("Advertise", "Identity service published");
        } else {
            LOG_ERROR("Advertise", "Failed to publish identity service: {}", status.message());
        }
    });

    AdvertisementData data;
    data.local_name = config_.local_name;
    data.service_uuids.push_back(config_.service_uuid);
    if (config_.embed_identity) {
        data.service_data[config_.service_uuid] = payload;
        if (payload.size() > kRecommendedPeerIdBytes) {
            LOG_DEBUG("Advertise", "Peer id is {} bytes; it may not fit in the advertisement "
                      "and peers will query it instead", payload.size());
        }
    }

    std::weak_ptr<AdvertiseController> weak = weak_from_this();
    advertising_ = true;
    radio_->startAdvertising(data, [weak, session](const RadioStatus& status) {
        auto self = weak.lock();
        if (!self || session != self->session_) {
            return;
        }
        if (status.ok()) {
            LOG_INFO("Advertise", "Advertising as {}", self->peerId_);
        } else {
            // Retried on the next power-on transition.
            LOG_ERROR("Advertise", "Failed to start advertising: {}", status.message());
            self->advertising_ = false;
        }
    });
}

void AdvertiseController::haltAdvertising() {
    ++session_;
    radio_->stopAdvertising();
    radio_->removeAllServices();
    advertising_ = false;
}

}  // namespace core
}  // namespace proxid
