/**
 * @file uuid.hpp
 * @brief Random (version 4) UUID helpers.
 *
 * Used for radio device handles, GATT session ids and default peer ids.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#pragma once

#include "proxid/utils/export.hpp"

#include <string>

namespace proxid {
namespace utils {

/**
 * @brief Generate an RFC 4122 version 4 UUID.
 *
 * Lowercase, formatted xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx where y is one
 * of 8, 9, a or b. Thread-safe.
 */
PROXID_UTILS_API std::string generateUUID();

/**
 * @brief Check the 8-4-4-4-12 hex layout. Case-insensitive.
 */
PROXID_UTILS_API bool isValidUUID(const std::string& uuid);

/**
 * @brief Compare two UUID strings ignoring case.
 */
PROXID_UTILS_API bool uuidEquals(const std::string& a, const std::string& b);

}  // namespace utils
}  // namespace proxid
