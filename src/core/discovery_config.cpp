/**
 * @file discovery_config.cpp
 * @brief DiscoveryConfig validation.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#include "proxid/core/discovery_config.hpp"
#include "proxid/utils/uuid.hpp"

namespace proxid {
namespace core {

bool DiscoveryConfig::validate(std::string* error) const {
    auto fail = [error](const std::string& message) {
        if (error) {
            *error = message;
        }
        return false;
    };

    if (!utils::isValidUUID(service_uuid)) {
        return fail("service uuid '" + service_uuid + "' is not a UUID");
    }
    if (!utils::isValidUUID(identity_characteristic_uuid)) {
        return fail("identity characteristic uuid '" + identity_characteristic_uuid +
                    "' is not a UUID");
    }
    if (sweep_interval_ms <= 0) {
        return fail("sweep interval must be positive");
    }
    if (sweep_interval_ms >= staleness_threshold_ms) {
        return fail("sweep interval (" + std::to_string(sweep_interval_ms) +
                    "ms) must be shorter than the staleness threshold (" +
                    std::to_string(staleness_threshold_ms) + "ms)");
    }
    return true;
}

}  // namespace core
}  // namespace proxid
