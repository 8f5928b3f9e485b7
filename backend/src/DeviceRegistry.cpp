#include "DeviceRegistry.hpp"
#include <algorithm>
#include <iostream>

namespace upnpbridge {

DeviceRegistry::DeviceRegistry()
: on_discovered([](const DiscoveredDevice& d) {
      std::cout << "Discovered device: " << d.device_type << " at " << d.location << std::endl;
  }) {}

DeviceRegistry::DeviceRegistry(DiscoveryCallback cb) : on_discovered(std::move(cb)) {}

bool DeviceRegistry::upsert(const std::string& uuid, const std::string& location, const std::string& device_type,
                            const NetworkAddress& addr, Clock::time_point now) {
    DiscoveredDevice created;
    {
        std::lock_guard<std::mutex> lock(registry_mutex);
        auto it = index.find(uuid);
        if (it != index.end()) {
            auto& d = devices[it->second];
            // keep last_seen non-decreasing even if events arrive out of order
            if (now > d.last_seen) d.last_seen = now;
            return false;
        }
        created = DiscoveredDevice{uuid, location, device_type.empty() ? "unknown" : device_type, addr, now};
        index.emplace(uuid, devices.size());
        devices.push_back(created);
    }
    if (on_discovered) on_discovered(created);
    return true;
}

std::vector<DiscoveredDevice> DeviceRegistry::list() const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    return devices;
}

std::optional<DiscoveredDevice> DeviceRegistry::get(const std::string& uuid) const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    auto it = index.find(uuid);
    if (it == index.end()) return std::nullopt;
    return devices[it->second];
}

std::vector<std::string> DeviceRegistry::sweep(Clock::time_point now, Clock::duration max_age) {
    std::vector<std::string> removed;
    std::lock_guard<std::mutex> lock(registry_mutex);
    auto stale = [&](const DiscoveredDevice& d) { return now - d.last_seen > max_age; };
    for (const auto& d : devices) {
        if (stale(d)) removed.push_back(d.uuid);
    }
    if (removed.empty()) return removed;
    devices.erase(std::remove_if(devices.begin(), devices.end(), stale), devices.end());
    reindex();
    return removed;
}

std::size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    return devices.size();
}

void DeviceRegistry::reindex() {
    index.clear();
    for (std::size_t i = 0; i < devices.size(); ++i) index.emplace(devices[i].uuid, i);
}

} // namespace upnpbridge
