#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

namespace upnpbridge {

class ConversionCache;
class DeviceRegistry;
class IDescriptionConverter;
class ProxyIdentity;

namespace net {
class IDescriptionFetcher;
}

/**
 * @brief HTTP routes of the proxy.
 *
 *   GET /proxy/description   self-description
 *   GET /device/json?url=    fetch + convert, memoized in the conversion cache
 *   GET /device/xml?url=     raw passthrough
 *   GET /devices             registry listing
 *   GET /devices/{uuid}      one device with a freshly converted description
 *
 * Every failure becomes a response; nothing thrown here reaches the server loop.
 */
class ProxyApi {
public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;
    using Responder = std::function<void(Response)>;

    ProxyApi(const ProxyIdentity& identity, DeviceRegistry& registry, ConversionCache& cache,
             net::IDescriptionFetcher& fetcher, const IDescriptionConverter& converter,
             std::chrono::steady_clock::duration fetch_timeout = std::chrono::seconds(10));

    // respond may run synchronously or later on the io thread.
    void handle(const Request& req, Responder respond);

    nlohmann::json build_device_list() const;
    std::string convert_url_for(const std::string& location) const;

    static Response make_json_response(unsigned status, const nlohmann::json& body, unsigned version = 11,
                                       bool keep_alive = false);
    static Response make_text_response(unsigned status, std::string body, const std::string& content_type,
                                       unsigned version = 11, bool keep_alive = false);

private:
    void handle_device_to_json(const Request& req, const std::string& url, Responder respond);
    void handle_device_passthrough(const Request& req, const std::string& url, Responder respond);
    void handle_get_device(const Request& req, const std::string& uuid, Responder respond);

    const ProxyIdentity& identity_;
    DeviceRegistry& registry_;
    ConversionCache& cache_;
    net::IDescriptionFetcher& fetcher_;
    const IDescriptionConverter& converter_;
    std::chrono::steady_clock::duration fetch_timeout_;
};

} // namespace upnpbridge
