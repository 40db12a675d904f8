/**
 * @file recording_listener.hpp
 * @brief DiscoveryListener that records what it is told.
 */

#pragma once

#include <proxid/core/discovery_listener.hpp>

#include <algorithm>
#include <mutex>
#include <string>
#include <vector>

namespace proxid {
namespace test {

class RecordingListener : public core::DiscoveryListener {
public:
    struct Event {
        bool discovered;
        core::PeerId peerId;

        bool operator==(const Event& other) const {
            return discovered == other.discovered && peerId == other.peerId;
        }
    };

    void onPeerDiscovered(const core::PeerId& peerId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back({true, peerId});
    }

    void onPeerLost(const core::PeerId& peerId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back({false, peerId});
    }

    std::vector<Event> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    size_t discoveredCount(const core::PeerId& peerId) const {
        return count(true, peerId);
    }

    size_t lostCount(const core::PeerId& peerId) const {
        return count(false, peerId);
    }

private:
    mutable std::mutex mutex_;
    std::vector<Event> events_;

    size_t count(bool discovered, const core::PeerId& peerId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count(events_.begin(), events_.end(),
                                              Event{discovered, peerId}));
    }
};

}  // namespace test
}  // namespace proxid
