/**
 * @file radio.hpp
 * @brief Abstract short-range radio: advertise, scan, connect-and-read.
 *
 * The discovery engine talks to the radio only through these two roles:
 * - PeripheralRadio: publishes attribute services and advertises
 * - CentralRadio: scans for advertisements and reads remote attributes
 *
 * Threading contract for implementations:
 * - Every method is called from the radio executor only.
 * - Every handler is invoked on the radio executor, asynchronously, never
 *   from inside the method call that registered it.
 *
 * Connection contract:
 * - connect() reports once through its ConnectHandler.
 * - After a successful connect, the DisconnectHandler fires exactly once
 *   when the link ends for any reason, cancelConnection() included.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#pragma once

#include "proxid/core/export.hpp"
#include "proxid/core/types.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace proxid {
namespace core {

/**
 * @enum RadioState
 * @brief Power/availability state reported by the radio.
 */
enum class RadioState {
    UNKNOWN,        ///< Not yet reported; wait for an update
    RESETTING,
    UNSUPPORTED,
    UNAUTHORIZED,
    POWERED_OFF,
    POWERED_ON
};

inline const char* radioStateToString(RadioState state) {
    switch (state) {
        case RadioState::UNKNOWN: return "unknown";
        case RadioState::RESETTING: return "resetting";
        case RadioState::UNSUPPORTED: return "unsupported";
        case RadioState::UNAUTHORIZED: return "unauthorized";
        case RadioState::POWERED_OFF: return "powered-off";
        case RadioState::POWERED_ON: return "powered-on";
        default: return "invalid";
    }
}

/// States in which advertising/scanning must stop.
inline bool isRadioUnavailable(RadioState state) {
    return state != RadioState::POWERED_ON && state != RadioState::UNKNOWN;
}

/**
 * @class RadioStatus
 * @brief Outcome of an asynchronous radio operation.
 */
class PROXID_CORE_API RadioStatus {
public:
    RadioStatus() : ok_(true) {}

    static RadioStatus success() { return RadioStatus(); }
    static RadioStatus failure(std::string message) {
        RadioStatus status;
        status.ok_ = false;
        status.message_ = std::move(message);
        return status;
    }

    bool ok() const { return ok_; }
    const std::string& message() const { return message_; }

private:
    bool ok_;
    std::string message_;
};

/**
 * @struct AdvertisementData
 * @brief Contents of one advertisement.
 */
struct PROXID_CORE_API AdvertisementData {
    std::string local_name;
    std::vector<std::string> service_uuids;
    std::map<std::string, std::string> service_data;  ///< service uuid -> bytes

    /// Case-insensitive membership test on service_uuids.
    bool advertisesService(const std::string& serviceUuid) const;

    /// Service data for a uuid (case-insensitive lookup).
    std::optional<std::string> serviceDataFor(const std::string& serviceUuid) const;
};

struct PROXID_CORE_API ScanOptions {
    /// Report every advertisement received, not only the first per device.
    bool allow_duplicates = false;
};

struct PROXID_CORE_API ScanResult {
    TransportAddress address;
    AdvertisementData advertisement;
    int rssi = 0;
};

struct PROXID_CORE_API GattCharacteristic {
    std::string uuid;
    std::string value;
};

struct PROXID_CORE_API GattService {
    std::string uuid;
    std::vector<GattCharacteristic> characteristics;
};

using RadioStateHandler = std::function<void(RadioState state)>;
using RadioStatusHandler = std::function<void(const RadioStatus& status)>;

/**
 * @class PeripheralRadio
 * @brief Advertiser role.
 */
class PROXID_CORE_API PeripheralRadio {
public:
    virtual ~PeripheralRadio() = default;

    virtual RadioState peripheralState() const = 0;

    /// Replaces any previous handler. Pass nullptr to detach.
    virtual void setPeripheralStateHandler(RadioStateHandler handler) = 0;

    /// Publish a service so that centrals can discover and read it.
    virtual void addService(const GattService& service, RadioStatusHandler done) = 0;

    virtual void removeAllServices() = 0;

    virtual void startAdvertising(const AdvertisementData& data, RadioStatusHandler done) = 0;

    virtual void stopAdvertising() = 0;

    virtual bool isAdvertising() const = 0;
};

/**
 * @class CentralRadio
 * @brief Scanner and connection initiator role.
 */
class PROXID_CORE_API CentralRadio {
public:
    using ScanHandler = std::function<void(const ScanResult& result)>;
    using UuidListHandler = std::function<void(const RadioStatus& status,
                                               const std::vector<std::string>& uuids)>;
    using ReadHandler = std::function<void(const RadioStatus& status,
                                           const std::string& value)>;

    virtual ~CentralRadio() = default;

    virtual RadioState centralState() const = 0;

    /// Replaces any previous handler. Pass nullptr to detach.
    virtual void setCentralStateHandler(RadioStateHandler handler) = 0;

    /**
     * @brief Scan for devices advertising any of serviceUuids.
     *        Replaces a scan already in progress.
     */
    virtual void startScan(const std::vector<std::string>& serviceUuids,
                           const ScanOptions& options,
                           ScanHandler handler) = 0;

    virtual void stopScan() = 0;

    virtual bool isScanning() const = 0;

    virtual void connect(const TransportAddress& address,
                         RadioStatusHandler connected,
                         RadioStatusHandler disconnected) = 0;

    /// Remote services, filtered to serviceFilter when it is non-empty.
    virtual void discoverServices(const TransportAddress& address,
                                  const std::vector<std::string>& serviceFilter,
                                  UuidListHandler done) = 0;

    /// Characteristics of one remote service, filtered likewise.
    virtual void discoverCharacteristics(const TransportAddress& address,
                                         const std::string& serviceUuid,
                                         const std::vector<std::string>& characteristicFilter,
                                         UuidListHandler done) = 0;

    virtual void readCharacteristic(const TransportAddress& address,
                                    const std::string& serviceUuid,
                                    const std::string& characteristicUuid,
                                    ReadHandler done) = 0;

    /// Tear down a connection or a pending connect. No-op if neither exists.
    virtual void cancelConnection(const TransportAddress& address) = 0;
};

}  // namespace core
}  // namespace proxid
