/**
 * @file main.cpp
 * @brief proxid daemon entry point
 *
 * This is the thin executable that wires together all the library components:
 * - UdpRadio for advertising, scanning and identity reads on the LAN
 * - DiscoveryCoordinator for peer tracking
 * - A listener that logs peers as they appear and disappear
 */

#include <proxid/daemon/config.hpp>
#include <proxid/utils/logger.hpp>
#include <proxid/core/discovery_coordinator.hpp>
#include <proxid/core/serial_executor.hpp>
#include <proxid/radio/udp_radio.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

using namespace proxid;
using namespace proxid::daemon;

// Global shutdown flag
static std::atomic<bool> g_shutdown{false};

// Signal handler
void signalHandler(int) {
    g_shutdown.store(true);
}

namespace {

class LoggingListener : public core::DiscoveryListener {
public:
    void onPeerDiscovered(const core::PeerId& peerId) override {
        LOG_INFO("Daemon", "+ {}", peerId);
    }

    void onPeerLost(const core::PeerId& peerId) override {
        LOG_INFO("Daemon", "- {}", peerId);
    }
};

}  // namespace

int main(int argc, char* argv[]) {
    // Parse command line arguments
    Config config = parseArgs(argc, argv);

    if (config.help) {
        printUsage(argv[0]);
        return config.error ? 2 : 0;
    }

    // Configure logging
    utils::Logger::instance().setLevel(utils::parseLogLevel(config.log_level));

    core::DiscoveryConfig discoveryConfig = config.discoveryConfig();
    std::string error;
    if (!discoveryConfig.validate(&error)) {
        LOG_ERROR("Daemon", "Invalid configuration: {}", error);
        return 2;
    }

    radio::UdpRadioConfig radioConfig = config.radioConfig();
    if (!radioConfig.validate(&error)) {
        LOG_ERROR("Daemon", "Invalid radio configuration: {}", error);
        return 2;
    }

    LOG_INFO("Daemon", "proxid starting...");
    LOG_INFO("Daemon", "Peer id: {}", config.peer_id);
    LOG_INFO("Daemon", "Advertisements: {}:{}", config.mcast_addr, config.mcast_port);
    LOG_INFO("Daemon", "Staleness: {}ms (sweep every {}ms)", config.staleness_ms, config.sweep_ms);

    // Install signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    auto radioExecutor = std::make_shared<core::SerialExecutor>("radio");
    auto deliveryExecutor = std::make_shared<core::SerialExecutor>("delivery");

    auto udpRadio = std::make_shared<radio::UdpRadio>(radioConfig, radioExecutor);
    auto listener = std::make_shared<LoggingListener>();

    int exitCode = 0;
    {
        core::DiscoveryCoordinator coordinator(discoveryConfig, udpRadio, udpRadio,
                                               radioExecutor, deliveryExecutor);
        coordinator.setListener(listener);

        if (!udpRadio->powerOn()) {
            LOG_ERROR("Daemon", "Failed to bring up the radio");
            exitCode = 1;
        } else if (!coordinator.startDiscovery(config.peer_id)) {
            LOG_ERROR("Daemon", "Failed to start discovery");
            exitCode = 1;
        } else {
            LOG_INFO("Daemon", "proxid is ready");

            // Main loop - wait for shutdown signal
            while (!g_shutdown.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }

            LOG_INFO("Daemon", "Shutting down...");
            auto peers = coordinator.getDiscoveredPeers();
            LOG_INFO("Daemon", "{} peers visible at shutdown", peers.size());
            coordinator.stopDiscovery();
        }
    }

    // Coordinator is gone; nothing can reach the radio's handlers any more.
    udpRadio->powerOff();
    radioExecutor->shutdown();
    deliveryExecutor->shutdown();

    LOG_INFO("Daemon", "proxid stopped");
    return exitCode;
}
