#pragma once
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "DiscoveredDevice.hpp"

namespace upnpbridge {

class DeviceRegistry {
public:
    using DiscoveryCallback = std::function<void(const DiscoveredDevice&)>;

    // Default notification logs "Discovered device: <type> at <location>".
    DeviceRegistry();
    explicit DeviceRegistry(DiscoveryCallback on_discovered);

    // Insert on first sighting; afterwards only last_seen is refreshed.
    // Returns true when a new entry was created.
    bool upsert(const std::string& uuid, const std::string& location, const std::string& device_type,
                const NetworkAddress& addr, Clock::time_point now);

    // Snapshot in insertion order.
    std::vector<DiscoveredDevice> list() const;

    std::optional<DiscoveredDevice> get(const std::string& uuid) const;

    // Remove every entry with now - last_seen > max_age. Returns removed identifiers.
    std::vector<std::string> sweep(Clock::time_point now, Clock::duration max_age);

    std::size_t size() const;

private:
    void reindex();

    std::vector<DiscoveredDevice> devices;
    std::unordered_map<std::string, std::size_t> index;
    DiscoveryCallback on_discovered;
    mutable std::mutex registry_mutex;
};

} // namespace upnpbridge
