#pragma once
#include <functional>
#include <string>
#include "DeviceRegistry.hpp"
#include "discovery/DiscoveryMessage.hpp"

namespace upnpbridge {

enum class RouteOutcome {
    Inserted,       // first sighting, registry entry created
    Refreshed,      // known device, last_seen updated
    Dropped,        // incomplete, self, JSON-native or unhandled kind
    QueryForwarded, // M-SEARCH handed to the query handler
};

// Classifies inbound discovery messages into registry updates or query handling.
class DiscoveryMessageRouter {
public:
    using QueryHandler = std::function<void(const DiscoveryMessage&)>;
    using NowFn = std::function<Clock::time_point()>;

    DiscoveryMessageRouter(DeviceRegistry& registry, std::string proxy_uuid, QueryHandler on_query, NowFn now = {});

    RouteOutcome route(const DiscoveryMessage& msg);

private:
    RouteOutcome handle_presence(const DiscoveryMessage& msg);

    DeviceRegistry& registry_;
    std::string proxy_uuid_;
    QueryHandler on_query_;
    NowFn now_;
};

} // namespace upnpbridge
