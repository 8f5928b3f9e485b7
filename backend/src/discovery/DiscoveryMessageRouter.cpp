#include "discovery/DiscoveryMessageRouter.hpp"
#include "discovery/ResponsePolicy.hpp"
#include <boost/algorithm/string/predicate.hpp>

namespace upnpbridge {

DiscoveryMessageRouter::DiscoveryMessageRouter(DeviceRegistry& registry, std::string proxy_uuid, QueryHandler on_query,
                                               NowFn now)
: registry_(registry), proxy_uuid_(std::move(proxy_uuid)), on_query_(std::move(on_query)), now_(std::move(now)) {
    if (!now_) now_ = [] { return Clock::now(); };
}

RouteOutcome DiscoveryMessageRouter::route(const DiscoveryMessage& msg) {
    switch (msg.kind()) {
    case MessageKind::PresenceNotify:
    case MessageKind::SearchResponse:
        return handle_presence(msg);
    case MessageKind::SearchQuery:
        if (!on_query_) return RouteOutcome::Dropped;
        on_query_(msg);
        return RouteOutcome::QueryForwarded;
    case MessageKind::Departure:
    case MessageKind::Unknown:
        break;
    }
    return RouteOutcome::Dropped;
}

RouteOutcome DiscoveryMessageRouter::handle_presence(const DiscoveryMessage& msg) {
    auto location = msg.location();
    auto uuid = msg.identifier();
    if (!location || !uuid) return RouteOutcome::Dropped;

    // never register ourselves
    if (*uuid == proxy_uuid_) return RouteOutcome::Dropped;

    // JSON-native devices need no conversion
    auto role = msg.role();
    if (role && boost::icontains(*role, ResponsePolicy::JSON_NATIVE_MARKER)) return RouteOutcome::Dropped;

    bool inserted = registry_.upsert(*uuid, *location, role.value_or("unknown"), msg.sender(), now_());
    return inserted ? RouteOutcome::Inserted : RouteOutcome::Refreshed;
}

} // namespace upnpbridge
