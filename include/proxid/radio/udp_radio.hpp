/**
 * @file udp_radio.hpp
 * @brief Radio emulation over UDP multicast and gRPC.
 *
 * UdpRadio implements both radio roles on an IP network:
 * - Advertising: an Advertisement frame is multicast every interval
 * - Scanning: frames from other devices become scan results
 * - Attribute access: connect/discover/read are gRPC calls to the
 *   advertiser's GattService, reached at the frame's source IP
 *
 * Each power-on picks a new random device handle, which is the transport
 * address other devices see, so addresses do not survive a power cycle.
 *
 * All handlers are posted to the executor given at construction; the
 * socket, beacon and gRPC threads never call into the discovery engine.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#pragma once

#include "proxid/radio/export.hpp"
#include "proxid/radio/gatt_service.hpp"
#include "proxid/core/radio.hpp"
#include "proxid/core/serial_executor.hpp"
#include "proxid/net/udp_socket.hpp"

#include <grpcpp/grpcpp.h>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Generated from proto/gatt.proto
#include "proxid/proto/gatt.grpc.pb.h"

namespace proxid {
namespace radio {

/// Advertisement frame format version.
constexpr uint32_t kProtocolVersion = 1;

/**
 * @struct UdpRadioConfig
 * @brief Network settings of a UdpRadio.
 */
struct PROXID_RADIO_API UdpRadioConfig {
    std::string mcast_addr = "239.255.77.7";
    uint16_t mcast_port = 5770;
    std::string mcast_iface;                ///< Local IPv4 address for multicast; empty = default route
    std::string bind_addr = "0.0.0.0";      ///< Attribute server bind address
    uint16_t gatt_port = 0;                 ///< Attribute server port (0 = ephemeral)
    int advertise_interval_ms = 500;
    size_t service_data_limit = 20;         ///< Larger service data is left out of frames
    int rpc_deadline_ms = 5000;             ///< Failure bound for each attribute call
    int multicast_ttl = 1;
    bool loopback = true;                   ///< Needed for several devices on one host
    int tx_power = -59;                     ///< dBm, advertised for rssi derivation

    /**
     * @brief Check the settings before power-on.
     * @param error Receives the reason when invalid (may be null)
     * @return true if a radio can run with these settings
     */
    bool validate(std::string* error = nullptr) const;
};

/**
 * @class UdpRadio
 * @brief PeripheralRadio and CentralRadio over the local network.
 *
 * @code
 * auto executor = std::make_shared<core::SerialExecutor>("radio");
 * auto radio = std::make_shared<UdpRadio>(UdpRadioConfig{}, executor);
 * radio->powerOn();
 * @endcode
 */
class PROXID_RADIO_API UdpRadio final
    : public core::PeripheralRadio
    , public core::CentralRadio
    , public std::enable_shared_from_this<UdpRadio> {
public:
    UdpRadio(const UdpRadioConfig& config, std::shared_ptr<core::SerialExecutor> executor);

    /// Powers off.
    ~UdpRadio() override;

    UdpRadio(const UdpRadio&) = delete;
    UdpRadio& operator=(const UdpRadio&) = delete;

    // =========================================================================
    // Power
    // =========================================================================

    /**
     * @brief Open the socket, start the attribute server and report POWERED_ON.
     * @return False (state unchanged) if the network could not be set up.
     */
    bool powerOn();

    /**
     * @brief Stop everything and report the given unavailable state.
     *
     * Advertising, scanning and published services are dropped; live
     * connections get their disconnect handler.
     */
    void powerOff(core::RadioState reason = core::RadioState::POWERED_OFF);

    core::RadioState state() const { return state_.load(); }

    /// Handle other devices see while powered on, empty otherwise.
    std::string deviceHandle() const;

    /// Port of the attribute server while powered on, 0 otherwise.
    uint16_t gattPort() const;

    // =========================================================================
    // PeripheralRadio
    // =========================================================================

    core::RadioState peripheralState() const override { return state_.load(); }
    void setPeripheralStateHandler(core::RadioStateHandler handler) override;
    void addService(const core::GattService& service, core::RadioStatusHandler done) override;
    void removeAllServices() override;
    void startAdvertising(const core::AdvertisementData& data,
                          core::RadioStatusHandler done) override;
    void stopAdvertising() override;
    bool isAdvertising() const override;

    // =========================================================================
    // CentralRadio
    // =========================================================================

    core::RadioState centralState() const override { return state_.load(); }
    void setCentralStateHandler(core::RadioStateHandler handler) override;
    void startScan(const std::vector<std::string>& serviceUuids,
                   const core::ScanOptions& options,
                   ScanHandler handler) override;
    void stopScan() override;
    bool isScanning() const override;

    void connect(const core::TransportAddress& address,
                 core::RadioStatusHandler connected,
                 core::RadioStatusHandler disconnected) override;
    void discoverServices(const core::TransportAddress& address,
                          const std::vector<std::string>& serviceFilter,
                          UuidListHandler done) override;
    void discoverCharacteristics(const core::TransportAddress& address,
                                 const std::string& serviceUuid,
                                 const std::vector<std::string>& characteristicFilter,
                                 UuidListHandler done) override;
    void readCharacteristic(const core::TransportAddress& address,
                            const std::string& serviceUuid,
                            const std::string& characteristicUuid,
                            ReadHandler done) override;
    void cancelConnection(const core::TransportAddress& address) override;

    /// Connections open or being opened.
    size_t connectionCount() const;

private:
    using Stub = gatt::GattService::Stub;

    struct Connection {
        std::string endpoint;
        std::shared_ptr<Stub> stub;
        std::shared_ptr<grpc::ClientContext> connectContext;  ///< While connecting
        std::string sessionId;                                ///< Empty while connecting
        uint64_t generation = 0;
        core::RadioStatusHandler connected;
        core::RadioStatusHandler disconnected;
    };

    UdpRadioConfig config_;
    std::shared_ptr<core::SerialExecutor> executor_;

    std::atomic<core::RadioState> state_{core::RadioState::UNKNOWN};
    std::atomic<bool> running_{false};

    // Power on/off
    std::mutex powerMutex_;

    // Everything below is shared with the socket and gRPC threads.
    mutable std::mutex mutex_;
    std::string deviceHandle_;
    uint16_t boundGattPort_ = 0;
    core::RadioStateHandler peripheralStateHandler_;
    core::RadioStateHandler centralStateHandler_;

    bool advertising_ = false;
    core::AdvertisementData advertisement_;

    bool scanning_ = false;
    uint64_t scanGeneration_ = 0;
    std::vector<std::string> scanFilter_;
    bool allowDuplicates_ = false;
    ScanHandler scanHandler_;
    std::unordered_set<std::string> reported_;   ///< Handles reported this scan

    std::unordered_map<std::string, std::string> endpoints_;  ///< handle -> ip:port
    std::unordered_map<core::TransportAddress, Connection> connections_;
    uint64_t nextGeneration_ = 0;

    std::unordered_map<std::string, std::shared_ptr<Stub>> stubs_;  ///< endpoint -> stub

    net::UdpSocket socket_;
    std::shared_ptr<GattServiceImpl> gattService_;   ///< Fresh per power cycle
    std::unique_ptr<grpc::Server> gattServer_;

    std::mutex senderMutex_;
    std::condition_variable senderCondition_;
    bool sendNow_ = false;
    std::thread senderThread_;
    std::thread receiverThread_;

    bool openSocket();
    bool startGattServer();

    void senderLoop();
    void receiverLoop();
    void sendAdvertisement();
    void expireGattSessions();
    void processFrame(const char* data, size_t length, const net::SocketAddress& sender);

    void notifyState(core::RadioState state);
    void post(core::SerialExecutor::Task task);

    std::shared_ptr<Stub> getStub(const std::string& endpoint);
    std::shared_ptr<grpc::ClientContext> makeContext() const;

    /// False unless address has an established connection.
    bool sessionFor(const core::TransportAddress& address, std::string* sessionId,
                    std::shared_ptr<Stub>* stub, uint64_t* generation);

    void onConnectComplete(const core::TransportAddress& address, uint64_t generation,
                           const grpc::Status& status, const std::string& sessionId,
                           const std::shared_ptr<Stub>& stub);

    /// Reports an attribute call result; a transport failure also ends the link.
    void finishCall(const core::TransportAddress& address, uint64_t generation,
                    const grpc::Status& status,
                    const std::function<void(const core::RadioStatus&)>& report);

    void sendDisconnect(const std::shared_ptr<Stub>& stub, const std::string& sessionId);
    void dropAllConnections(const std::string& reason);
};

}  // namespace radio
}  // namespace proxid
