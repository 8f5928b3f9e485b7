#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace upnpbridge {

using Clock = std::chrono::steady_clock;

/** @brief Network origin of a discovery datagram */
struct NetworkAddress {
    std::string host;
    uint16_t port = 0;

    std::string to_string() const { return host + ":" + std::to_string(port); }
};

/**
 * @brief A legacy (XML) device seen on the discovery channel.
 *
 * Only last_seen changes after the first sighting.
 */
struct DiscoveredDevice {
    /** @brief Unique device identifier (uuid part of USN) */
    std::string uuid;
    /** @brief URL of the XML device description */
    std::string location;
    /** @brief Declared device type, "unknown" when absent */
    std::string device_type;
    NetworkAddress addr;
    Clock::time_point last_seen;
};

// Seconds on the monotonic clock, as reported by the HTTP surface.
inline double seconds_since_epoch(Clock::time_point tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

} // namespace upnpbridge
