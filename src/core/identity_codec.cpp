/**
 * @file identity_codec.cpp
 * @brief PeerId validation.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#include "proxid/core/identity_codec.hpp"

#include <cstdint>

namespace proxid {
namespace core {

namespace {

bool isWellFormedUtf8(const std::string& text) {
    const auto* p = reinterpret_cast<const unsigned char*>(text.data());
    const auto* end = p + text.size();

    while (p < end) {
        unsigned char lead = *p;
        if (lead == 0x00) {
            return false;
        }
        if (lead < 0x80) {
            ++p;
            continue;
        }

        size_t length;
        uint32_t codePoint;
        uint32_t minimum;
        if ((lead & 0xE0) == 0xC0) {
            length = 2; codePoint = lead & 0x1F; minimum = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3; codePoint = lead & 0x0F; minimum = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4; codePoint = lead & 0x07; minimum = 0x10000;
        } else {
            return false;
        }

        if (static_cast<size_t>(end - p) < length) {
            return false;
        }
        for (size_t i = 1; i < length; ++i) {
            if ((p[i] & 0xC0) != 0x80) {
                return false;
            }
            codePoint = (codePoint << 6) | (p[i] & 0x3F);
        }

        if (codePoint < minimum || codePoint > 0x10FFFF ||
            (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
            return false;
        }
        p += length;
    }
    return true;
}

}  // namespace

bool isValidPeerId(const std::string& text) {
    return !text.empty() && text.size() <= kMaxPeerIdBytes && isWellFormedUtf8(text);
}

std::optional<PeerId> decodePeerId(const std::string& bytes) {
    if (!isValidPeerId(bytes)) {
        return std::nullopt;
    }
    return PeerId(bytes);
}

}  // namespace core
}  // namespace proxid
