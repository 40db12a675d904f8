/**
 * @file config.hpp
 * @brief proxid daemon configuration and CLI parsing
 */

#pragma once

#include "proxid/core/discovery_config.hpp"
#include "proxid/radio/udp_radio.hpp"

#include <cstdint>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

namespace proxid {
namespace daemon {

/**
 * @brief Daemon configuration structure
 */
struct Config {
    std::string peer_id;                          ///< Required
    std::string mcast_addr = "239.255.77.7";
    uint16_t mcast_port = 5770;
    std::string mcast_iface;                      ///< Empty = default route
    uint16_t gatt_port = 0;                       ///< 0 = ephemeral
    std::string bind_addr = "0.0.0.0";
    std::string local_name = "proxid";
    std::string log_level = "INFO";
    bool help = false;
    bool error = false;                           ///< Set when parsing failed

    // Advertising
    int advertise_interval_ms = 500;
    size_t service_data_limit = 20;               ///< Emulated advertisement payload slot
    bool embed_identity = true;                   ///< false = peers must connect to read id

    // Staleness
    int staleness_ms = 5000;                      ///< Age at which a peer is lost
    int sweep_ms = 2000;                          ///< Must be below staleness_ms

    int rpc_deadline_ms = 5000;

    core::DiscoveryConfig discoveryConfig() const {
        core::DiscoveryConfig config;
        config.local_name = local_name;
        config.embed_identity = embed_identity;
        config.staleness_threshold_ms = staleness_ms;
        config.sweep_interval_ms = sweep_ms;
        return config;
    }

    radio::UdpRadioConfig radioConfig() const {
        radio::UdpRadioConfig config;
        config.mcast_addr = mcast_addr;
        config.mcast_port = mcast_port;
        config.mcast_iface = mcast_iface;
        config.bind_addr = bind_addr;
        config.gatt_port = gatt_port;
        config.advertise_interval_ms = advertise_interval_ms;
        config.service_data_limit = service_data_limit;
        config.rpc_deadline_ms = rpc_deadline_ms;
        return config;
    }
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "proxid - Proximity Peer Discovery Daemon\n\n"
              << "Usage: " << program_name << " --peer-id <id> [OPTIONS]\n\n"
              << "Options:\n"
              << "  --peer-id <id>             Identity to advertise (required)\n"
              << "  --local-name <name>        Advertised device name (default: proxid)\n"
              << "  --mcast-addr <addr>        Multicast group for advertisements (default: 239.255.77.7)\n"
              << "  --mcast-port <port>        Multicast port for advertisements (default: 5770)\n"
              << "  --mcast-iface <addr>       Local interface address for multicast (default: route)\n"
              << "  --gatt-port <port>         gRPC port for identity reads, 0=any (default: 0)\n"
              << "  --bind <addr>              Bind address for the gRPC server (default: 0.0.0.0)\n"
              << "  --log-level <level>        Log level: TRACE, DEBUG, INFO, WARN, ERROR, OFF (default: INFO)\n"
              << "\nAdvertising Options:\n"
              << "  --advertise-interval <ms>  Interval between advertisements (default: 500)\n"
              << "  --service-data-limit <n>   Largest identity carried in advertisements (default: 20)\n"
              << "  --no-service-data          Never embed the identity; peers connect to read it\n"
              << "\nStaleness Options:\n"
              << "  --staleness-ms <ms>        Time without sightings before a peer is lost (default: 5000)\n"
              << "  --sweep-ms <ms>            Interval between staleness sweeps (default: 2000)\n"
              << "  --rpc-deadline-ms <ms>     Deadline for each identity read call (default: 5000)\n"
              << "\n  --help                     Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " --peer-id alice\n"
              << "  " << program_name << " --peer-id bob --no-service-data --log-level DEBUG\n";
}

/**
 * @brief Parse a port number
 * @throws std::invalid_argument, std::out_of_range outside 0..65535
 */
inline uint16_t parsePort(const char* value) {
    int port = std::stoi(value);
    if (port < 0 || port > 65535) {
        throw std::out_of_range("port out of range");
    }
    return static_cast<uint16_t>(port);
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration; error is set (and help requested) on bad input
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        // Flags without a value
        if (std::strcmp(arg, "--no-service-data") == 0) {
            config.embed_identity = false;
            continue;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            std::cerr << "Error: Option " << arg << " requires a value\n";
            config.help = true;
            config.error = true;
            return config;
        }

        const char* value = argv[++i];

        try {
            if (std::strcmp(arg, "--peer-id") == 0) {
                config.peer_id = value;
            } else if (std::strcmp(arg, "--local-name") == 0) {
                config.local_name = value;
            } else if (std::strcmp(arg, "--mcast-addr") == 0) {
                config.mcast_addr = value;
            } else if (std::strcmp(arg, "--mcast-port") == 0) {
                config.mcast_port = parsePort(value);
            } else if (std::strcmp(arg, "--mcast-iface") == 0) {
                config.mcast_iface = value;
            } else if (std::strcmp(arg, "--gatt-port") == 0) {
                config.gatt_port = parsePort(value);
            } else if (std::strcmp(arg, "--bind") == 0) {
                config.bind_addr = value;
            } else if (std::strcmp(arg, "--log-level") == 0) {
                config.log_level = value;
            } else if (std::strcmp(arg, "--advertise-interval") == 0) {
                config.advertise_interval_ms = std::stoi(value);
            } else if (std::strcmp(arg, "--service-data-limit") == 0) {
                config.service_data_limit = std::stoul(value);
            } else if (std::strcmp(arg, "--staleness-ms") == 0) {
                config.staleness_ms = std::stoi(value);
            } else if (std::strcmp(arg, "--sweep-ms") == 0) {
                config.sweep_ms = std::stoi(value);
            } else if (std::strcmp(arg, "--rpc-deadline-ms") == 0) {
                config.rpc_deadline_ms = std::stoi(value);
            } else {
                std::cerr << "Error: Unknown option " << arg << "\n";
                config.help = true;
                config.error = true;
                return config;
            }
        } catch (const std::exception&) {
            std::cerr << "Error: Invalid value '" << value << "' for " << arg << "\n";
            config.help = true;
            config.error = true;
            return config;
        }
    }

    if (config.peer_id.empty()) {
        std::cerr << "Error: --peer-id is required\n";
        config.help = true;
        config.error = true;
    }

    return config;
}

} // namespace daemon
} // namespace proxid
