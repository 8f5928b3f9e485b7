#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace upnpbridge {

inline constexpr const char* PROXY_DEVICE_NAME = "json-upnp-proxy";
inline constexpr const char* PROXY_NOTIFICATION_TYPE = "urn:schemas-json-upnp-org:device:json-upnp-proxy:1";
inline constexpr const char* PROXY_DEVICE_TYPE = "urn:schemas-json-upnp-org:device:proxy:1";
inline constexpr const char* PROXY_SERVICE_TYPE = "urn:schemas-json-upnp-org:service:DeviceProxy:1";

/**
 * @brief Process-wide identity of the proxy.
 *
 * Built once at startup and never modified afterwards.
 */
class ProxyIdentity {
public:
    // An empty uuid is replaced with a random RFC 4122 identifier.
    ProxyIdentity(std::string uuid, std::string host, uint16_t port);

    const std::string& uuid() const { return uuid_; }
    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }

    std::string base_url() const;
    /** @brief URL advertised in LOCATION headers */
    std::string description_url() const;
    /** @brief JSON self-description served at /proxy/description */
    nlohmann::json description() const;

    static std::string generate_uuid();

private:
    std::string uuid_;
    std::string host_;
    uint16_t port_;
};

} // namespace upnpbridge
