/**
 * @file udp_radio.cpp
 * @brief UdpRadio implementation.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#include "proxid/radio/udp_radio.hpp"
#include "proxid/utils/logger.hpp"
#include "proxid/utils/uuid.hpp"

// Generated from proto/advertisement.proto
#include "proxid/proto/advertisement.pb.h"

#include <algorithm>
#include <chrono>

namespace proxid {
namespace radio {

namespace {

/// Simulated attenuation between advertiser and scanner.
constexpr int kPathLossDb = 20;

constexpr int kReceiveTimeoutMs = 200;
constexpr size_t kMaxFrameBytes = 65535;

core::RadioStatus toRadioStatus(const grpc::Status& status) {
    if (status.ok()) {
        return core::RadioStatus::success();
    }
    return core::RadioStatus::failure(
        "rpc failed (" + std::to_string(static_cast<int>(status.error_code())) + "): " +
        status.error_message());
}

/// Statuses after which the remote session cannot be relied on.
bool isLinkFailure(const grpc::Status& status) {
    switch (status.error_code()) {
        case grpc::StatusCode::UNAVAILABLE:
        case grpc::StatusCode::FAILED_PRECONDITION:
        case grpc::StatusCode::DEADLINE_EXCEEDED:
        case grpc::StatusCode::CANCELLED:
            return true;
        default:
            return false;
    }
}

bool matchesFilter(const google::protobuf::RepeatedPtrField<std::string>& advertised,
                   const std::vector<std::string>& filter) {
    if (filter.empty()) {
        return true;
    }
    for (const auto& uuid : advertised) {
        for (const auto& wanted : filter) {
            if (utils::uuidEquals(uuid, wanted)) {
                return true;
            }
        }
    }
    return false;
}

}  // namespace

bool UdpRadioConfig::validate(std::string* error) const {
    auto fail = [error](const std::string& message) {
        if (error) {
            *error = message;
        }
        return false;
    };

    struct in_addr group{};
    if (inet_pton(AF_INET, mcast_addr.c_str(), &group) != 1 || !IN_MULTICAST(ntohl(group.s_addr))) {
        return fail("'" + mcast_addr + "' is not an IPv4 multicast group");
    }
    struct in_addr iface{};
    if (!mcast_iface.empty() && inet_pton(AF_INET, mcast_iface.c_str(), &iface) != 1) {
        return fail("multicast interface '" + mcast_iface + "' is not an IPv4 address");
    }
    if (mcast_port == 0) {
        return fail("multicast port must be in 1..65535");
    }
    if (advertise_interval_ms <= 0) {
        return fail("advertise interval must be positive");
    }
    if (rpc_deadline_ms <= 0) {
        return fail("rpc deadline must be positive");
    }
    if (multicast_ttl < 0 || multicast_ttl > 255) {
        return fail("multicast ttl must be in 0..255");
    }
    return true;
}

UdpRadio::UdpRadio(const UdpRadioConfig& config, std::shared_ptr<core::SerialExecutor> executor)
    : config_(config)
    , executor_(std::move(executor))
{
    LOG_DEBUG("UdpRadio", "Created radio for group {}:{}", config_.mcast_addr, config_.mcast_port);
}

UdpRadio::~UdpRadio() {
    powerOff();
}

// =============================================================================
// Power
// =============================================================================

bool UdpRadio::powerOn() {
    std::lock_guard<std::mutex> power(powerMutex_);

    if (running_.load()) {
        return true;
    }

    std::string error;
    if (!config_.validate(&error)) {
        LOG_ERROR("UdpRadio", "Invalid radio configuration: {}", error);
        return false;
    }

    if (!openSocket()) {
        socket_.close();
        return false;
    }

    std::string handle = utils::generateUUID();
    auto service = std::make_shared<GattServiceImpl>();
    service->setDeviceHandle(handle);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        gattService_ = service;
    }

    if (!startGattServer()) {
        std::lock_guard<std::mutex> lock(mutex_);
        gattService_.reset();
        socket_.close();
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        deviceHandle_ = handle;
        endpoints_.clear();
    }

    {
        std::lock_guard<std::mutex> lock(senderMutex_);
        running_.store(true);
        sendNow_ = false;
    }
    state_.store(core::RadioState::POWERED_ON);

    senderThread_ = std::thread(&UdpRadio::senderLoop, this);
    receiverThread_ = std::thread(&UdpRadio::receiverLoop, this);

    LOG_INFO("UdpRadio", "Powered on as {} (group {}:{}, attributes on port {})",
             handle, config_.mcast_addr, config_.mcast_port, gattPort());
    notifyState(core::RadioState::POWERED_ON);
    return true;
}

void UdpRadio::powerOff(core::RadioState reason) {
    std::lock_guard<std::mutex> power(powerMutex_);

    if (reason == core::RadioState::POWERED_ON || reason == core::RadioState::UNKNOWN) {
        LOG_WARN("UdpRadio", "powerOff() needs an unavailable state, using powered-off");
        reason = core::RadioState::POWERED_OFF;
    }

    bool wasRunning;
    {
        std::lock_guard<std::mutex> lock(senderMutex_);
        wasRunning = running_.exchange(false);
    }

    if (wasRunning) {
        state_.store(reason);
        senderCondition_.notify_all();

        if (senderThread_.joinable()) {
            senderThread_.join();
        }
        if (receiverThread_.joinable()) {
            receiverThread_.join();
        }
        socket_.close();

        if (gattServer_) {
            gattServer_->Shutdown(std::chrono::system_clock::now());
            gattServer_.reset();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (gattService_) {
                gattService_->setDeviceHandle("");
                gattService_.reset();
            }
            deviceHandle_.clear();
            boundGattPort_ = 0;
            advertising_ = false;
            scanning_ = false;
            scanHandler_ = nullptr;
            ++scanGeneration_;
            reported_.clear();
            endpoints_.clear();
            stubs_.clear();
        }

        dropAllConnections(std::string("radio ") + core::radioStateToString(reason));
        LOG_INFO("UdpRadio", "Powered off ({})", core::radioStateToString(reason));
        notifyState(reason);
        return;
    }

    if (state_.exchange(reason) != reason) {
        notifyState(reason);
    }
}

std::string UdpRadio::deviceHandle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deviceHandle_;
}

uint16_t UdpRadio::gattPort() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return boundGattPort_;
}

bool UdpRadio::openSocket() {
    if (!socket_.open()) {
        LOG_ERROR("UdpRadio", "Failed to create socket: {}", socket_.getLastError());
        return false;
    }

    if (!socket_.setReuseAddress(true)) {
        LOG_ERROR("UdpRadio", "Failed to set SO_REUSEADDR");
        return false;
    }

    if (!socket_.bind(config_.mcast_port)) {
        LOG_ERROR("UdpRadio", "Failed to bind to port {}", config_.mcast_port);
        return false;
    }

    if (!config_.mcast_iface.empty() && !socket_.setMulticastInterface(config_.mcast_iface)) {
        LOG_ERROR("UdpRadio", "Failed to select multicast interface {}", config_.mcast_iface);
        return false;
    }

    if (!socket_.joinMulticastGroup(config_.mcast_addr, config_.mcast_iface)) {
        LOG_ERROR("UdpRadio", "Failed to join multicast group {}", config_.mcast_addr);
        return false;
    }

    if (!socket_.setMulticastTTL(config_.multicast_ttl)) {
        LOG_WARN("UdpRadio", "Failed to set multicast TTL");
    }

    if (!socket_.setMulticastLoopback(config_.loopback)) {
        LOG_WARN("UdpRadio", "Failed to set multicast loopback");
    }
    return true;
}

bool UdpRadio::startGattServer() {
    std::string address = config_.bind_addr + ":" + std::to_string(config_.gatt_port);
    int selectedPort = 0;

    grpc::ServerBuilder builder;
    builder.AddListeningPort(address, grpc::InsecureServerCredentials(), &selectedPort);
    builder.RegisterService(gattService_.get());
    gattServer_ = builder.BuildAndStart();

    if (!gattServer_ || selectedPort == 0) {
        LOG_ERROR("UdpRadio", "Failed to start attribute server on {}", address);
        gattServer_.reset();
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    boundGattPort_ = static_cast<uint16_t>(selectedPort);
    return true;
}

void UdpRadio::notifyState(core::RadioState state) {
    std::weak_ptr<UdpRadio> weak = weak_from_this();
    post([weak, state]() {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        core::RadioStateHandler peripheral;
        core::RadioStateHandler central;
        {
            std::lock_guard<std::mutex> lock(self->mutex_);
            peripheral = self->peripheralStateHandler_;
            central = self->centralStateHandler_;
        }
        if (peripheral) {
            peripheral(state);
        }
        if (central) {
            central(state);
        }
    });
}

void UdpRadio::post(core::SerialExecutor::Task task) {
    if (!executor_->post(std::move(task))) {
        LOG_DEBUG("UdpRadio", "Executor stopped, dropping radio event");
    }
}

// =============================================================================
// Advertising
// =============================================================================

void UdpRadio::setPeripheralStateHandler(core::RadioStateHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    peripheralStateHandler_ = std::move(handler);
}

void UdpRadio::addService(const core::GattService& service, core::RadioStatusHandler done) {
    core::RadioStatus status;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.load() != core::RadioState::POWERED_ON || !gattService_) {
            status = core::RadioStatus::failure("radio not powered on");
        } else {
            gattService_->addService(service);
        }
    }
    post([done, status]() {
        if (done) {
            done(status);
        }
    });
}

void UdpRadio::removeAllServices() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (gattService_) {
        gattService_->removeAllServices();
    }
}

void UdpRadio::startAdvertising(const core::AdvertisementData& data,
                                core::RadioStatusHandler done) {
    core::RadioStatus status;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.load() != core::RadioState::POWERED_ON) {
            status = core::RadioStatus::failure("radio not powered on");
        } else {
            advertisement_ = data;
            advertising_ = true;
        }
    }

    if (status.ok()) {
        for (const auto& [uuid, bytes] : data.service_data) {
            if (bytes.size() > config_.service_data_limit) {
                LOG_INFO("UdpRadio", "Service data for {} is {} bytes (limit {}), not advertised",
                         uuid, bytes.size(), config_.service_data_limit);
            }
        }
        {
            std::lock_guard<std::mutex> lock(senderMutex_);
            sendNow_ = true;
        }
        senderCondition_.notify_all();
    }

    post([done, status]() {
        if (done) {
            done(status);
        }
    });
}

void UdpRadio::stopAdvertising() {
    std::lock_guard<std::mutex> lock(mutex_);
    advertising_ = false;
}

bool UdpRadio::isAdvertising() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return advertising_;
}

void UdpRadio::senderLoop() {
    LOG_DEBUG("UdpRadio", "Sender thread started");

    std::unique_lock<std::mutex> lock(senderMutex_);
    while (running_.load()) {
        sendNow_ = false;
        lock.unlock();
        sendAdvertisement();
        expireGattSessions();
        lock.lock();

        senderCondition_.wait_for(lock, std::chrono::milliseconds(config_.advertise_interval_ms),
                                  [this]() { return !running_.load() || sendNow_; });
    }

    LOG_DEBUG("UdpRadio", "Sender thread stopped");
}

void UdpRadio::expireGattSessions() {
    std::shared_ptr<GattServiceImpl> service;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        service = gattService_;
    }
    if (service) {
        size_t expired = service->expireIdleSessions();
        if (expired > 0) {
            LOG_DEBUG("UdpRadio", "Closed {} idle attribute sessions", expired);
        }
    }
}

void UdpRadio::sendAdvertisement() {
    Advertisement frame;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!advertising_) {
            return;
        }
        frame.set_protocol_version(kProtocolVersion);
        frame.set_device_handle(deviceHandle_);
        frame.set_local_name(advertisement_.local_name);
        for (const auto& uuid : advertisement_.service_uuids) {
            frame.add_service_uuids(uuid);
        }
        for (const auto& [uuid, bytes] : advertisement_.service_data) {
            if (bytes.size() <= config_.service_data_limit) {
                (*frame.mutable_service_data())[uuid] = bytes;
            }
        }
        frame.set_gatt_port(boundGattPort_);
        frame.set_tx_power(config_.tx_power);
    }

    std::string data;
    if (!frame.SerializeToString(&data)) {
        LOG_ERROR("UdpRadio", "Failed to serialize advertisement");
        return;
    }

    net::SocketAddress dest(config_.mcast_addr, config_.mcast_port);
    int sent = socket_.sendTo(dest, data.data(), data.size());
    if (sent < 0) {
        LOG_WARN("UdpRadio", "Failed to send advertisement: {}", socket_.getLastError());
    } else {
        LOG_TRACE("UdpRadio", "Sent advertisement ({} bytes)", sent);
    }
}

// =============================================================================
// Scanning
// =============================================================================

void UdpRadio::setCentralStateHandler(core::RadioStateHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    centralStateHandler_ = std::move(handler);
}

void UdpRadio::startScan(const std::vector<std::string>& serviceUuids,
                         const core::ScanOptions& options,
                         ScanHandler handler) {
    if (state_.load() != core::RadioState::POWERED_ON) {
        LOG_WARN("UdpRadio", "Scan requested while {}, ignored",
                 core::radioStateToString(state_.load()));
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    scanning_ = true;
    ++scanGeneration_;
    scanFilter_ = serviceUuids;
    allowDuplicates_ = options.allow_duplicates;
    scanHandler_ = std::move(handler);
    reported_.clear();
}

void UdpRadio::stopScan() {
    std::lock_guard<std::mutex> lock(mutex_);
    scanning_ = false;
    ++scanGeneration_;
    scanHandler_ = nullptr;
}

bool UdpRadio::isScanning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scanning_;
}

void UdpRadio::receiverLoop() {
    LOG_DEBUG("UdpRadio", "Receiver thread started");

    std::vector<char> buffer(kMaxFrameBytes);

    while (running_.load()) {
        net::SocketAddress sender;
        int received = socket_.receiveFrom(buffer.data(), buffer.size(), kReceiveTimeoutMs, sender);

        if (received > 0) {
            processFrame(buffer.data(), static_cast<size_t>(received), sender);
        } else if (received < 0 && running_.load()) {
            LOG_ERROR("UdpRadio", "Receive error: {}", socket_.getLastError());
            std::this_thread::sleep_for(std::chrono::milliseconds(kReceiveTimeoutMs));
        }
    }

    LOG_DEBUG("UdpRadio", "Receiver thread stopped");
}

void UdpRadio::processFrame(const char* data, size_t length, const net::SocketAddress& sender) {
    Advertisement frame;
    if (!frame.ParseFromArray(data, static_cast<int>(length))) {
        LOG_TRACE("UdpRadio", "Unparseable frame from {}", sender.toString());
        return;
    }
    if (frame.protocol_version() != kProtocolVersion || frame.device_handle().empty()) {
        LOG_TRACE("UdpRadio", "Ignoring frame v{} from {}", frame.protocol_version(),
                  sender.toString());
        return;
    }

    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (frame.device_handle() == deviceHandle_) {
            return;
        }
        endpoints_[frame.device_handle()] = sender.ip + ":" + std::to_string(frame.gatt_port());

        if (!scanning_ || !matchesFilter(frame.service_uuids(), scanFilter_)) {
            return;
        }
        if (!allowDuplicates_ && !reported_.insert(frame.device_handle()).second) {
            return;
        }
        generation = scanGeneration_;
    }

    core::ScanResult result;
    result.address = frame.device_handle();
    result.advertisement.local_name = frame.local_name();
    result.advertisement.service_uuids.assign(frame.service_uuids().begin(),
                                              frame.service_uuids().end());
    for (const auto& [uuid, bytes] : frame.service_data()) {
        result.advertisement.service_data[uuid] = bytes;
    }
    result.rssi = frame.tx_power() - kPathLossDb;

    std::weak_ptr<UdpRadio> weak = weak_from_this();
    post([weak, generation, result]() {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        ScanHandler handler;
        {
            std::lock_guard<std::mutex> lock(self->mutex_);
            if (!self->scanning_ || self->scanGeneration_ != generation) {
                return;
            }
            handler = self->scanHandler_;
        }
        if (handler) {
            handler(result);
        }
    });
}

// =============================================================================
// Connections
// =============================================================================

std::shared_ptr<UdpRadio::Stub> UdpRadio::getStub(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = stubs_.find(endpoint);
    if (it != stubs_.end()) {
        return it->second;
    }

    LOG_DEBUG("UdpRadio", "Creating channel to {}", endpoint);

    grpc::ChannelArguments args;
    args.SetInt(GRPC_ARG_KEEPALIVE_TIME_MS, 10000);
    args.SetInt(GRPC_ARG_KEEPALIVE_TIMEOUT_MS, 5000);

    auto channel = grpc::CreateCustomChannel(endpoint, grpc::InsecureChannelCredentials(), args);
    std::shared_ptr<Stub> stub = gatt::GattService::NewStub(channel);
    stubs_[endpoint] = stub;
    return stub;
}

std::shared_ptr<grpc::ClientContext> UdpRadio::makeContext() const {
    auto context = std::make_shared<grpc::ClientContext>();
    context->set_deadline(std::chrono::system_clock::now() +
                          std::chrono::milliseconds(config_.rpc_deadline_ms));
    return context;
}

size_t UdpRadio::connectionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

void UdpRadio::connect(const core::TransportAddress& address,
                       core::RadioStatusHandler connected,
                       core::RadioStatusHandler disconnected) {
    auto fail = [this, &connected](const std::string& message) {
        post([connected, message]() {
            if (connected) {
                connected(core::RadioStatus::failure(message));
            }
        });
    };

    if (state_.load() != core::RadioState::POWERED_ON) {
        fail("radio not powered on");
        return;
    }

    std::string endpoint;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = endpoints_.find(address);
        if (it == endpoints_.end()) {
            fail("unknown device " + address);
            return;
        }
        if (connections_.count(address) > 0) {
            fail("connection to " + address + " already exists");
            return;
        }
        endpoint = it->second;
    }

    auto stub = getStub(endpoint);
    auto context = makeContext();
    auto request = std::make_shared<gatt::ConnectRequest>();
    auto response = std::make_shared<gatt::ConnectResponse>();

    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation = ++nextGeneration_;

        Connection connection;
        connection.endpoint = endpoint;
        connection.stub = stub;
        connection.connectContext = context;
        connection.generation = generation;
        connection.connected = std::move(connected);
        connection.disconnected = std::move(disconnected);
        connections_[address] = std::move(connection);

        request->set_device_handle(address);
        request->set_central_handle(deviceHandle_);
    }

    LOG_DEBUG("UdpRadio", "Connecting to {} at {}", address, endpoint);

    std::weak_ptr<UdpRadio> weak = weak_from_this();
    stub->async()->Connect(
        context.get(), request.get(), response.get(),
        [weak, address, generation, stub, context, request, response](grpc::Status status) {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            std::string sessionId = response->session_id();
            self->post([weak, address, generation, status, sessionId, stub]() {
                if (auto radio = weak.lock()) {
                    radio->onConnectComplete(address, generation, status, sessionId, stub);
                }
            });
        });
}

void UdpRadio::onConnectComplete(const core::TransportAddress& address, uint64_t generation,
                                 const grpc::Status& status, const std::string& sessionId,
                                 const std::shared_ptr<Stub>& stub) {
    core::RadioStatusHandler connected;
    bool current = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(address);
        if (it != connections_.end() && it->second.generation == generation &&
            it->second.sessionId.empty()) {
            current = true;
            connected = std::move(it->second.connected);
            it->second.connectContext.reset();
            if (status.ok()) {
                it->second.sessionId = sessionId;
            } else {
                connections_.erase(it);
            }
        }
    }

    if (!current) {
        // Cancelled while connecting; release the session the peer opened.
        if (status.ok()) {
            sendDisconnect(stub, sessionId);
        }
        return;
    }

    if (status.ok()) {
        LOG_DEBUG("UdpRadio", "Connected to {}", address);
    } else {
        LOG_DEBUG("UdpRadio", "Connect to {} failed: {}", address, status.error_message());
    }
    if (connected) {
        connected(toRadioStatus(status));
    }
}

void UdpRadio::cancelConnection(const core::TransportAddress& address) {
    Connection connection;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(address);
        if (it == connections_.end()) {
            return;
        }
        connection = std::move(it->second);
        connections_.erase(it);
    }

    if (connection.sessionId.empty()) {
        if (connection.connectContext) {
            connection.connectContext->TryCancel();
        }
        auto connected = std::move(connection.connected);
        post([connected]() {
            if (connected) {
                connected(core::RadioStatus::failure("connection cancelled"));
            }
        });
        return;
    }

    sendDisconnect(connection.stub, connection.sessionId);
    auto disconnected = std::move(connection.disconnected);
    post([disconnected]() {
        if (disconnected) {
            disconnected(core::RadioStatus::success());
        }
    });
}

void UdpRadio::sendDisconnect(const std::shared_ptr<Stub>& stub, const std::string& sessionId) {
    auto context = makeContext();
    auto request = std::make_shared<gatt::DisconnectRequest>();
    auto response = std::make_shared<gatt::DisconnectResponse>();
    request->set_session_id(sessionId);

    stub->async()->Disconnect(
        context.get(), request.get(), response.get(),
        [stub, context, request, response](grpc::Status status) {
            if (!status.ok()) {
                LOG_DEBUG("UdpRadio", "Disconnect failed: {}", status.error_message());
            }
        });
}

void UdpRadio::dropAllConnections(const std::string& reason) {
    std::unordered_map<core::TransportAddress, Connection> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped.swap(connections_);
    }

    for (auto& [address, connection] : dropped) {
        if (connection.sessionId.empty()) {
            if (connection.connectContext) {
                connection.connectContext->TryCancel();
            }
            auto connected = std::move(connection.connected);
            post([connected, reason]() {
                if (connected) {
                    connected(core::RadioStatus::failure(reason));
                }
            });
        } else {
            auto disconnected = std::move(connection.disconnected);
            post([disconnected, reason]() {
                if (disconnected) {
                    disconnected(core::RadioStatus::failure(reason));
                }
            });
        }
    }
}

bool UdpRadio::sessionFor(const core::TransportAddress& address, std::string* sessionId,
                          std::shared_ptr<Stub>* stub, uint64_t* generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(address);
    if (it == connections_.end() || it->second.sessionId.empty()) {
        return false;
    }
    *sessionId = it->second.sessionId;
    *stub = it->second.stub;
    *generation = it->second.generation;
    return true;
}

void UdpRadio::finishCall(const core::TransportAddress& address, uint64_t generation,
                          const grpc::Status& status,
                          const std::function<void(const core::RadioStatus&)>& report) {
    core::RadioStatus result = toRadioStatus(status);
    report(result);

    if (status.ok() || !isLinkFailure(status)) {
        return;
    }

    core::RadioStatusHandler disconnected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(address);
        if (it == connections_.end() || it->second.generation != generation) {
            return;
        }
        disconnected = std::move(it->second.disconnected);
        connections_.erase(it);
    }

    LOG_DEBUG("UdpRadio", "Link to {} lost: {}", address, status.error_message());
    if (disconnected) {
        disconnected(result);
    }
}

// =============================================================================
// Attribute Access
// =============================================================================

void UdpRadio::discoverServices(const core::TransportAddress& address,
                                const std::vector<std::string>& serviceFilter,
                                UuidListHandler done) {
    std::string sessionId;
    std::shared_ptr<Stub> stub;
    uint64_t generation = 0;
    if (!sessionFor(address, &sessionId, &stub, &generation)) {
        post([done]() {
            if (done) {
                done(core::RadioStatus::failure("not connected"), {});
            }
        });
        return;
    }

    auto context = makeContext();
    auto request = std::make_shared<gatt::DiscoverServicesRequest>();
    auto response = std::make_shared<gatt::UuidList>();
    request->set_session_id(sessionId);
    for (const auto& uuid : serviceFilter) {
        request->add_service_filter(uuid);
    }

    std::weak_ptr<UdpRadio> weak = weak_from_this();
    stub->async()->DiscoverServices(
        context.get(), request.get(), response.get(),
        [weak, address, generation, done, stub, context, request, response](grpc::Status status) {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            std::vector<std::string> uuids(response->uuids().begin(), response->uuids().end());
            self->post([weak, address, generation, done, status, uuids]() {
                if (auto radio = weak.lock()) {
                    radio->finishCall(address, generation, status,
                                      [&](const core::RadioStatus& result) {
                                          if (done) {
                                              done(result, uuids);
                                          }
                                      });
                }
            });
        });
}

void UdpRadio::discoverCharacteristics(const core::TransportAddress& address,
                                       const std::string& serviceUuid,
                                       const std::vector<std::string>& characteristicFilter,
                                       UuidListHandler done) {
    std::string sessionId;
    std::shared_ptr<Stub> stub;
    uint64_t generation = 0;
    if (!sessionFor(address, &sessionId, &stub, &generation)) {
        post([done]() {
            if (done) {
                done(core::RadioStatus::failure("not connected"), {});
            }
        });
        return;
    }

    auto context = makeContext();
    auto request = std::make_shared<gatt::DiscoverCharacteristicsRequest>();
    auto response = std::make_shared<gatt::UuidList>();
    request->set_session_id(sessionId);
    request->set_service_uuid(serviceUuid);
    for (const auto& uuid : characteristicFilter) {
        request->add_characteristic_filter(uuid);
    }

    std::weak_ptr<UdpRadio> weak = weak_from_this();
    stub->async()->DiscoverCharacteristics(
        context.get(), request.get(), response.get(),
        [weak, address, generation, done, stub, context, request, response](grpc::Status status) {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            std::vector<std::string> uuids(response->uuids().begin(), response->uuids().end());
            self->post([weak, address, generation, done, status, uuids]() {
                if (auto radio = weak.lock()) {
                    radio->finishCall(address, generation, status,
                                      [&](const core::RadioStatus& result) {
                                          if (done) {
                                              done(result, uuids);
                                          }
                                      });
                }
            });
        });
}

void UdpRadio::readCharacteristic(const core::TransportAddress& address,
                                  const std::string& serviceUuid,
                                  const std::string& characteristicUuid,
                                  ReadHandler done) {
    std::string sessionId;
    std::shared_ptr<Stub> stub;
    uint64_t generation = 0;
    if (!sessionFor(address, &sessionId, &stub, &generation)) {
        post([done]() {
            if (done) {
                done(core::RadioStatus::failure("not connected"), std::string());
            }
        });
        return;
    }

    auto context = makeContext();
    auto request = std::make_shared<gatt::ReadCharacteristicRequest>();
    auto response = std::make_shared<gatt::ReadCharacteristicResponse>();
    request->set_session_id(sessionId);
    request->set_service_uuid(serviceUuid);
    request->set_characteristic_uuid(characteristicUuid);

    std::weak_ptr<UdpRadio> weak = weak_from_this();
    stub->async()->ReadCharacteristic(
        context.get(), request.get(), response.get(),
        [weak, address, generation, done, stub, context, request, response](grpc::Status status) {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            std::string value = response->value();
            self->post([weak, address, generation, done, status, value]() {
                if (auto radio = weak.lock()) {
                    radio->finishCall(address, generation, status,
                                      [&](const core::RadioStatus& result) {
                                          if (done) {
                                              done(result, value);
                                          }
                                      });
                }
            });
        });
}

}  // namespace radio
}  // namespace proxid
