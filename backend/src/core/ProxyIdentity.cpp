#include "core/ProxyIdentity.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace upnpbridge {

ProxyIdentity::ProxyIdentity(std::string uuid, std::string host, uint16_t port)
: uuid_(uuid.empty() ? generate_uuid() : std::move(uuid)), host_(std::move(host)), port_(port) {}

std::string ProxyIdentity::generate_uuid() {
    boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

std::string ProxyIdentity::base_url() const {
    return "http://" + host_ + ":" + std::to_string(port_);
}

std::string ProxyIdentity::description_url() const {
    return base_url() + "/proxy/description";
}

nlohmann::json ProxyIdentity::description() const {
    const std::string base = base_url();
    return {
        {"deviceType", PROXY_DEVICE_TYPE},
        {"friendlyName", "JSON-UPnP Proxy Server"},
        {"manufacturer", "UpnpBridge"},
        {"modelName", PROXY_DEVICE_NAME},
        {"modelNumber", "1.0"},
        {"UDN", "uuid:" + uuid_},
        {"services", nlohmann::json::array({
            {
                {"serviceType", PROXY_SERVICE_TYPE},
                {"serviceId", "urn:upnp-org:serviceId:DeviceProxy"},
                {"description", "Converts XML UPnP devices to JSON"},
                {"endpoints", {
                    {"convert", base + "/device/json?url={device_location}"},
                    {"list", base + "/devices"},
                    {"get", base + "/devices/{uuid}"}
                }}
            }
        })},
        {"presentationURL", base + "/devices"}
    };
}

} // namespace upnpbridge
