/**
 * @file gatt_service.hpp
 * @brief gRPC attribute server backing UdpRadio's peripheral role.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#pragma once

#include "proxid/radio/export.hpp"
#include "proxid/core/radio.hpp"

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Generated from proto/gatt.proto
#include "proxid/proto/gatt.grpc.pb.h"

namespace proxid {
namespace radio {

/**
 * @class GattServiceImpl
 * @brief Serves the published attribute services to remote centrals.
 *
 * Centrals open a session with Connect, naming the device handle they saw
 * advertised. A handle change (power cycle) invalidates every session.
 * A session with no call for the idle timeout is closed, so centrals that
 * vanish without Disconnect do not accumulate.
 *
 * Status codes:
 * - UNAVAILABLE: the radio is powered off
 * - NOT_FOUND: wrong device handle, unknown service or characteristic
 * - FAILED_PRECONDITION: unknown, closed or expired session
 *
 * @code
 * GattServiceImpl service;
 * service.setDeviceHandle(handle);
 * service.addService(identityService);
 *
 * grpc::ServerBuilder builder;
 * builder.AddListeningPort("0.0.0.0:0", grpc::InsecureServerCredentials(), &port);
 * builder.RegisterService(&service);
 * auto server = builder.BuildAndStart();
 * @endcode
 */
class PROXID_RADIO_API GattServiceImpl final : public gatt::GattService::CallbackService {
public:
    GattServiceImpl();
    ~GattServiceImpl() override = default;

    /// Handle accepted by Connect. Empty refuses every call. Drops all sessions.
    void setDeviceHandle(const std::string& handle);

    /// Idle time after which a session is closed. Must be positive.
    void setSessionIdleTimeout(std::chrono::milliseconds timeout);

    void addService(const core::GattService& service);
    void removeAllServices();

    size_t serviceCount() const;
    size_t sessionCount() const;

    /**
     * @brief Close sessions idle for longer than the timeout.
     * @return Number of sessions closed
     */
    size_t expireIdleSessions();

    // =========================================================================
    // gRPC Service Methods (Async Callback API)
    // =========================================================================

    grpc::ServerUnaryReactor* Connect(
        grpc::CallbackServerContext* context,
        const gatt::ConnectRequest* request,
        gatt::ConnectResponse* response) override;

    grpc::ServerUnaryReactor* DiscoverServices(
        grpc::CallbackServerContext* context,
        const gatt::DiscoverServicesRequest* request,
        gatt::UuidList* response) override;

    grpc::ServerUnaryReactor* DiscoverCharacteristics(
        grpc::CallbackServerContext* context,
        const gatt::DiscoverCharacteristicsRequest* request,
        gatt::UuidList* response) override;

    grpc::ServerUnaryReactor* ReadCharacteristic(
        grpc::CallbackServerContext* context,
        const gatt::ReadCharacteristicRequest* request,
        gatt::ReadCharacteristicResponse* response) override;

    grpc::ServerUnaryReactor* Disconnect(
        grpc::CallbackServerContext* context,
        const gatt::DisconnectRequest* request,
        gatt::DisconnectResponse* response) override;

private:
    using SessionClock = std::chrono::steady_clock;

    struct Session {
        std::string centralHandle;
        SessionClock::time_point lastActivity;
    };

    mutable std::mutex mutex_;
    std::string deviceHandle_;
    std::vector<core::GattService> services_;
    std::unordered_map<std::string, Session> sessions_;  ///< keyed by session id
    std::chrono::milliseconds idleTimeout_;

    /// Validates the session and marks it active.
    grpc::Status touchSessionLocked(const std::string& sessionId);
    size_t expireIdleSessionsLocked(SessionClock::time_point now);
    const core::GattService* findServiceLocked(const std::string& uuid) const;
};

}  // namespace radio
}  // namespace proxid
