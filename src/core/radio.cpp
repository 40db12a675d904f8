/**
 * @file radio.cpp
 * @brief Advertisement helpers.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#include "proxid/core/radio.hpp"
#include "proxid/utils/uuid.hpp"

#include <algorithm>

namespace proxid {
namespace core {

bool AdvertisementData::advertisesService(const std::string& serviceUuid) const {
    return std::any_of(service_uuids.begin(), service_uuids.end(),
                       [&](const std::string& uuid) {
                           return utils::uuidEquals(uuid, serviceUuid);
                       });
}

std::optional<std::string> AdvertisementData::serviceDataFor(const std::string& serviceUuid) const {
    for (const auto& [uuid, bytes] : service_data) {
        if (utils::uuidEquals(uuid, serviceUuid)) {
            return bytes;
        }
    }
    return std::nullopt;
}

}  // namespace core
}  // namespace proxid
