/**
 * @file gatt_service.cpp
 * @brief GattServiceImpl implementation.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#include "proxid/radio/gatt_service.hpp"
#include "proxid/utils/logger.hpp"
#include "proxid/utils/uuid.hpp"

#include <algorithm>
#include <chrono>

namespace proxid {
namespace radio {

namespace {

constexpr std::chrono::seconds kDefaultSessionIdleTimeout{30};

/// Unary reactor for handlers that complete before returning.
class FinishedReactor : public grpc::ServerUnaryReactor {
public:
    explicit FinishedReactor(const grpc::Status& status) {
        Finish(status);
    }

    void OnDone() override {
        delete this;
    }
};

bool passesFilter(const std::string& uuid,
                  const google::protobuf::RepeatedPtrField<std::string>& filter) {
    if (filter.empty()) {
        return true;
    }
    return std::any_of(filter.begin(), filter.end(), [&](const std::string& wanted) {
        return utils::uuidEquals(uuid, wanted);
    });
}

}  // namespace

GattServiceImpl::GattServiceImpl()
    : idleTimeout_(kDefaultSessionIdleTimeout)
{
    LOG_DEBUG("GattService", "Created attribute server");
}

void GattServiceImpl::setDeviceHandle(const std::string& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    deviceHandle_ = handle;
    if (!sessions_.empty()) {
        LOG_DEBUG("GattService", "Dropping {} sessions", sessions_.size());
        sessions_.clear();
    }
}

void GattServiceImpl::setSessionIdleTimeout(std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        LOG_WARN("GattService", "Ignoring non-positive session idle timeout {}ms", timeout.count());
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    idleTimeout_ = timeout;
}

void GattServiceImpl::addService(const core::GattService& service) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(services_.begin(), services_.end(), [&](const core::GattService& s) {
        return utils::uuidEquals(s.uuid, service.uuid);
    });
    if (it != services_.end()) {
        *it = service;
    } else {
        services_.push_back(service);
    }
    LOG_DEBUG("GattService", "Published service {} ({} characteristics)", service.uuid,
              service.characteristics.size());
}

void GattServiceImpl::removeAllServices() {
    std::lock_guard<std::mutex> lock(mutex_);
    services_.clear();
}

size_t GattServiceImpl::serviceCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return services_.size();
}

size_t GattServiceImpl::sessionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

size_t GattServiceImpl::expireIdleSessions() {
    std::lock_guard<std::mutex> lock(mutex_);
    return expireIdleSessionsLocked(SessionClock::now());
}

size_t GattServiceImpl::expireIdleSessionsLocked(SessionClock::time_point now) {
    size_t expired = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (now - it->second.lastActivity >= idleTimeout_) {
            LOG_DEBUG("GattService", "Session of central {} expired", it->second.centralHandle);
            it = sessions_.erase(it);
            ++expired;
        } else {
            ++it;
        }
    }
    return expired;
}

grpc::Status GattServiceImpl::touchSessionLocked(const std::string& sessionId) {
    if (deviceHandle_.empty()) {
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, "radio powered off");
    }
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, "not connected");
    }

    auto now = SessionClock::now();
    if (now - it->second.lastActivity >= idleTimeout_) {
        LOG_DEBUG("GattService", "Session of central {} expired", it->second.centralHandle);
        sessions_.erase(it);
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, "session expired");
    }
    it->second.lastActivity = now;
    return grpc::Status::OK;
}

const core::GattService* GattServiceImpl::findServiceLocked(const std::string& uuid) const {
    for (const auto& service : services_) {
        if (utils::uuidEquals(service.uuid, uuid)) {
            return &service;
        }
    }
    return nullptr;
}

// =============================================================================
// Connect / Disconnect
// =============================================================================

grpc::ServerUnaryReactor* GattServiceImpl::Connect(
    grpc::CallbackServerContext* context,
    const gatt::ConnectRequest* request,
    gatt::ConnectResponse* response) {

    std::lock_guard<std::mutex> lock(mutex_);
    if (deviceHandle_.empty()) {
        return new FinishedReactor(grpc::Status(grpc::StatusCode::UNAVAILABLE, "radio powered off"));
    }
    if (request->device_handle() != deviceHandle_) {
        return new FinishedReactor(grpc::Status(grpc::StatusCode::NOT_FOUND, "no such device"));
    }

    auto now = SessionClock::now();
    expireIdleSessionsLocked(now);

    std::string sessionId = utils::generateUUID();
    sessions_[sessionId] = Session{request->central_handle(), now};
    response->set_session_id(sessionId);

    LOG_DEBUG("GattService", "Central {} connected from {} (session {})",
              request->central_handle(), context->peer(), sessionId);
    return new FinishedReactor(grpc::Status::OK);
}

grpc::ServerUnaryReactor* GattServiceImpl::Disconnect(
    grpc::CallbackServerContext* context,
    const gatt::DisconnectRequest* request,
    gatt::DisconnectResponse* response) {

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(request->session_id());
    if (it != sessions_.end()) {
        LOG_DEBUG("GattService", "Central {} disconnected", it->second.centralHandle);
        sessions_.erase(it);
    }
    return new FinishedReactor(grpc::Status::OK);
}

// =============================================================================
// Discovery and Reads
// =============================================================================

grpc::ServerUnaryReactor* GattServiceImpl::DiscoverServices(
    grpc::CallbackServerContext* context,
    const gatt::DiscoverServicesRequest* request,
    gatt::UuidList* response) {

    std::lock_guard<std::mutex> lock(mutex_);
    grpc::Status status = touchSessionLocked(request->session_id());
    if (!status.ok()) {
        return new FinishedReactor(status);
    }

    for (const auto& service : services_) {
        if (passesFilter(service.uuid, request->service_filter())) {
            response->add_uuids(service.uuid);
        }
    }
    return new FinishedReactor(grpc::Status::OK);
}

grpc::ServerUnaryReactor* GattServiceImpl::DiscoverCharacteristics(
    grpc::CallbackServerContext* context,
    const gatt::DiscoverCharacteristicsRequest* request,
    gatt::UuidList* response) {

    std::lock_guard<std::mutex> lock(mutex_);
    grpc::Status status = touchSessionLocked(request->session_id());
    if (!status.ok()) {
        return new FinishedReactor(status);
    }

    const auto* service = findServiceLocked(request->service_uuid());
    if (!service) {
        return new FinishedReactor(grpc::Status(grpc::StatusCode::NOT_FOUND, "no such service"));
    }

    for (const auto& characteristic : service->characteristics) {
        if (passesFilter(characteristic.uuid, request->characteristic_filter())) {
            response->add_uuids(characteristic.uuid);
        }
    }
    return new FinishedReactor(grpc::Status::OK);
}

grpc::ServerUnaryReactor* GattServiceImpl::ReadCharacteristic(
    grpc::CallbackServerContext* context,
    const gatt::ReadCharacteristicRequest* request,
    gatt::ReadCharacteristicResponse* response) {

    std::lock_guard<std::mutex> lock(mutex_);
    grpc::Status status = touchSessionLocked(request->session_id());
    if (!status.ok()) {
        return new FinishedReactor(status);
    }

    const auto* service = findServiceLocked(request->service_uuid());
    if (!service) {
        return new FinishedReactor(grpc::Status(grpc::StatusCode::NOT_FOUND, "no such service"));
    }

    for (const auto& characteristic : service->characteristics) {
        if (utils::uuidEquals(characteristic.uuid, request->characteristic_uuid())) {
            response->set_value(characteristic.value);
            return new FinishedReactor(grpc::Status::OK);
        }
    }
    return new FinishedReactor(grpc::Status(grpc::StatusCode::NOT_FOUND, "no such characteristic"));
}

}  // namespace radio
}  // namespace proxid
