#include "ProxyApi.hpp"
#include "DeviceRegistry.hpp"
#include "convert/IDescriptionConverter.hpp"
#include "core/BuildInfo.hpp"
#include "core/ConversionCache.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/ProxyIdentity.hpp"
#include "net/HttpFetcher.hpp"
#include "net/Url.hpp"
#include <iostream>
#include <boost/beast/core/error.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
using json = nlohmann::json;

namespace upnpbridge {

namespace {

constexpr const char* DEVICES_PREFIX = "/devices/";

// Fetch outcome -> ProxyError; returns normally only for a 200 response.
void check_fetch(const boost::system::error_code& ec, const net::FetchResult& result) {
    if (ec == beast::error::timeout) throw ProxyError(ErrorKind::Timeout, errors::MSG_FETCH_TIMEOUT);
    if (ec) throw ProxyError(ErrorKind::ConversionFailure, ec.message());
    if (result.status != 200) {
        throw ProxyError(ErrorKind::UpstreamUnavailable, errors::format_upstream_status(result.status));
    }
}

json error_body(const std::string& message) {
    return json{{"error", message}};
}

} // namespace

ProxyApi::ProxyApi(const ProxyIdentity& identity, DeviceRegistry& registry, ConversionCache& cache,
                   net::IDescriptionFetcher& fetcher, const IDescriptionConverter& converter,
                   std::chrono::steady_clock::duration fetch_timeout)
: identity_(identity), registry_(registry), cache_(cache), fetcher_(fetcher), converter_(converter),
  fetch_timeout_(fetch_timeout) {}

// Strings taken from the network may carry invalid UTF-8; those bytes become U+FFFD.
ProxyApi::Response ProxyApi::make_json_response(unsigned status, const json& body, unsigned version, bool keep_alive) {
    return make_text_response(status, body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json",
                              version, keep_alive);
}

ProxyApi::Response ProxyApi::make_text_response(unsigned status, std::string body, const std::string& content_type,
                                                unsigned version, bool keep_alive) {
    Response res{static_cast<http::status>(status), version};
    res.set(http::field::server, buildinfo::product_token());
    res.set(http::field::content_type, content_type);
    res.keep_alive(keep_alive);
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

std::string ProxyApi::convert_url_for(const std::string& location) const {
    return identity_.base_url() + "/device/json?url=" + net::url_encode(location);
}

json ProxyApi::build_device_list() const {
    json devices = json::array();
    for (const auto& d : registry_.list()) {
        devices.push_back({
            {"uuid", d.uuid},
            {"location", d.location},
            {"deviceType", d.device_type},
            {"addr", d.addr.to_string()},
            {"lastSeen", seconds_since_epoch(d.last_seen)},
            {"jsonUrl", convert_url_for(d.location)}
        });
    }
    return {{"devices", devices}, {"count", devices.size()}};
}

void ProxyApi::handle(const Request& req, Responder respond) {
    const unsigned version = req.version();
    const bool keep_alive = req.keep_alive();

    if (req.method() != http::verb::get) {
        respond(make_json_response(405, error_body(errors::MSG_METHOD_NOT_ALLOWED), version, keep_alive));
        return;
    }

    auto target = net::parse_target(std::string(req.target()));
    const auto& path = target.path;
    auto url_param = [&]() -> std::string {
        auto it = target.query.find("url");
        return it == target.query.end() ? std::string() : it->second;
    };

    if (path == "/proxy/description") {
        respond(make_json_response(200, identity_.description(), version, keep_alive));
    } else if (path == "/device/json") {
        handle_device_to_json(req, url_param(), std::move(respond));
    } else if (path == "/device/xml") {
        handle_device_passthrough(req, url_param(), std::move(respond));
    } else if (path == "/devices") {
        respond(make_json_response(200, build_device_list(), version, keep_alive));
    } else if (path.size() > std::char_traits<char>::length(DEVICES_PREFIX) && path.rfind(DEVICES_PREFIX, 0) == 0
               && path.find('/', std::char_traits<char>::length(DEVICES_PREFIX)) == std::string::npos) {
        handle_get_device(req, path.substr(std::char_traits<char>::length(DEVICES_PREFIX)), std::move(respond));
    } else {
        respond(make_json_response(404, error_body(errors::MSG_ROUTE_NOT_FOUND), version, keep_alive));
    }
}

void ProxyApi::handle_device_to_json(const Request& req, const std::string& url, Responder respond) {
    const unsigned version = req.version();
    const bool keep_alive = req.keep_alive();

    if (url.empty()) {
        respond(make_json_response(400, error_body(errors::MSG_MISSING_URL), version, keep_alive));
        return;
    }
    if (auto cached = cache_.get(url)) {
        respond(make_json_response(200, *cached, version, keep_alive));
        return;
    }

    fetcher_.fetch(url, fetch_timeout_,
        [this, url, version, keep_alive, respond = std::move(respond)](boost::system::error_code ec, net::FetchResult result) {
            Response res;
            try {
                check_fetch(ec, result);
                auto converted = converter_.convert(result.body, DOC_TYPE_DEVICE);
                res = make_json_response(200, converted, version, keep_alive);
                cache_.put(url, std::move(converted));
            } catch (const ProxyError& e) {
                std::cerr << "ProxyApi: error converting " << url << ": " << e.what() << std::endl;
                res = make_json_response(e.http_status(), error_body(e.what()), version, keep_alive);
            } catch (const std::exception& e) {
                std::cerr << "ProxyApi: error converting " << url << ": " << e.what() << std::endl;
                res = make_json_response(500, error_body(e.what()), version, keep_alive);
            }
            respond(std::move(res));
        });
}

void ProxyApi::handle_device_passthrough(const Request& req, const std::string& url, Responder respond) {
    const unsigned version = req.version();
    const bool keep_alive = req.keep_alive();

    if (url.empty()) {
        respond(make_text_response(400, errors::MSG_MISSING_URL, "text/plain", version, keep_alive));
        return;
    }

    fetcher_.fetch(url, fetch_timeout_,
        [version, keep_alive, respond = std::move(respond)](boost::system::error_code ec, net::FetchResult result) {
            if (ec) {
                std::string message = ec == beast::error::timeout ? errors::MSG_FETCH_TIMEOUT : ec.message();
                respond(make_text_response(500, std::move(message), "text/plain", version, keep_alive));
                return;
            }
            std::string content_type = result.content_type.empty() ? "text/xml" : result.content_type;
            respond(make_text_response(200, std::move(result.body), content_type, version, keep_alive));
        });
}

void ProxyApi::handle_get_device(const Request& req, const std::string& uuid, Responder respond) {
    const unsigned version = req.version();
    const bool keep_alive = req.keep_alive();

    auto device = registry_.get(uuid);
    if (!device) {
        respond(make_json_response(404, error_body(errors::MSG_DEVICE_NOT_FOUND), version, keep_alive));
        return;
    }

    // always a fresh fetch; the conversion cache is not consulted here
    fetcher_.fetch(device->location, fetch_timeout_,
        [this, d = *device, version, keep_alive, respond = std::move(respond)](boost::system::error_code ec,
                                                                              net::FetchResult result) {
            Response res;
            try {
                check_fetch(ec, result);
                auto converted = converter_.convert(result.body, DOC_TYPE_DEVICE);
                res = make_json_response(200, {
                    {"uuid", d.uuid},
                    {"location", d.location},
                    {"addr", d.addr.to_string()},
                    {"lastSeen", seconds_since_epoch(d.last_seen)},
                    {"description", converted}
                }, version, keep_alive);
            } catch (const std::exception& e) {
                std::cerr << "ProxyApi: error refreshing " << d.uuid << ": " << e.what() << std::endl;
                res = make_json_response(500, {
                    {"uuid", d.uuid},
                    {"location", d.location},
                    {"error", e.what()}
                }, version, keep_alive);
            }
            respond(std::move(res));
        });
}

} // namespace upnpbridge
