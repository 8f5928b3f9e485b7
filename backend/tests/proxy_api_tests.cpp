#include <gtest/gtest.h>
#include "DeviceRegistry.hpp"
#include "ProxyApi.hpp"
#include "convert/XmlDescriptionConverter.hpp"
#include "core/ConversionCache.hpp"
#include "core/ProxyIdentity.hpp"
#include "net/HttpFetcher.hpp"
#include "net/HttpServer.hpp"
#include "net/Url.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/beast/core/error.hpp>
#include <chrono>
#include <map>
#include <optional>

using namespace upnpbridge;
using nlohmann::json;
namespace http = boost::beast::http;
using namespace std::chrono_literals;

namespace {

const char* LAMP_XML =
    "<root><device><deviceType>urn:schemas-upnp-org:device:DimmableLight:1</deviceType>"
    "<friendlyName>Lamp</friendlyName></device></root>";

// Answers synchronously from a canned table.
struct FakeFetcher : net::IDescriptionFetcher {
    struct Canned {
        boost::system::error_code ec;
        net::FetchResult result;
    };

    void fetch(const std::string& url, std::chrono::steady_clock::duration, Handler handler) override {
        ++calls;
        auto it = table.find(url);
        if (it == table.end()) {
            handler(boost::asio::error::connection_refused, {});
            return;
        }
        handler(it->second.ec, it->second.result);
    }

    std::map<std::string, Canned> table;
    int calls = 0;
};

struct CountingConverter : IDescriptionConverter {
    json convert(const std::string& source, const std::string& doc_type) const override {
        ++calls;
        return inner.convert(source, doc_type);
    }
    XmlDescriptionConverter inner;
    mutable int calls = 0;
};

struct ApiFixture : ::testing::Test {
    ProxyIdentity identity{"proxy-uuid", "127.0.0.1", 5030};
    DeviceRegistry registry{[](const DiscoveredDevice&) {}};
    ConversionCache cache;
    FakeFetcher fetcher;
    CountingConverter converter;
    ProxyApi api{identity, registry, cache, fetcher, converter};

    ProxyApi::Response get(const std::string& target, http::verb verb = http::verb::get) {
        ProxyApi::Request req{verb, target, 11};
        std::optional<ProxyApi::Response> out;
        api.handle(req, [&](ProxyApi::Response res) { out = std::move(res); });
        EXPECT_TRUE(out.has_value()) << target;
        return out ? std::move(*out) : ProxyApi::Response{};
    }

    static json body(const ProxyApi::Response& res) { return json::parse(res.body()); }
};

const std::string LAMP_URL = "http://192.168.1.20:49152/desc.xml";

} // namespace

TEST_F(ApiFixture, ProxyDescription) {
    auto res = get("/proxy/description");
    EXPECT_EQ(res.result_int(), 200u);
    EXPECT_EQ(std::string(res[http::field::content_type]), "application/json");
    auto j = body(res);
    EXPECT_EQ(j["UDN"], "uuid:proxy-uuid");
    EXPECT_EQ(j["presentationURL"], "http://127.0.0.1:5030/devices");
}

TEST_F(ApiFixture, DeviceJsonRequiresUrl) {
    auto res = get("/device/json");
    EXPECT_EQ(res.result_int(), 400u);
    EXPECT_EQ(body(res)["error"], "Missing 'url' parameter");
    EXPECT_EQ(fetcher.calls, 0);
}

TEST_F(ApiFixture, DeviceJsonConvertsOnceThenServesFromCache) {
    fetcher.table[LAMP_URL] = {{}, {200, "text/xml", LAMP_XML}};
    const auto target = "/device/json?url=" + net::url_encode(LAMP_URL);

    auto first = get(target);
    EXPECT_EQ(first.result_int(), 200u);
    EXPECT_EQ(body(first)["device"]["friendlyName"], "Lamp");

    auto second = get(target);
    EXPECT_EQ(second.result_int(), 200u);
    EXPECT_EQ(body(second), body(first));
    EXPECT_EQ(fetcher.calls, 1);
    EXPECT_EQ(converter.calls, 1);
    EXPECT_TRUE(cache.contains(LAMP_URL));
}

TEST_F(ApiFixture, DeviceJsonMapsUpstreamFailures) {
    fetcher.table["http://h/404.xml"] = {{}, {404, "text/html", "nope"}};
    fetcher.table["http://h/slow.xml"] = {boost::beast::error::timeout, {}};
    fetcher.table["http://h/bad.xml"] = {{}, {200, "text/xml", "<root><open></root>"}};

    auto not_ok = get("/device/json?url=http://h/404.xml");
    EXPECT_EQ(not_ok.result_int(), 502u);
    EXPECT_EQ(body(not_ok)["error"], "Device returned status 404");

    auto slow = get("/device/json?url=http://h/slow.xml");
    EXPECT_EQ(slow.result_int(), 504u);
    EXPECT_EQ(body(slow)["error"], "Timeout fetching device description");

    auto bad = get("/device/json?url=http://h/bad.xml");
    EXPECT_EQ(bad.result_int(), 500u);
    EXPECT_TRUE(body(bad).contains("error"));

    auto refused = get("/device/json?url=http://h/unknown.xml");
    EXPECT_EQ(refused.result_int(), 500u);

    // failures are not cached
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(ApiFixture, DeviceXmlPassesThrough) {
    fetcher.table[LAMP_URL] = {{}, {200, "text/xml; charset=\"utf-8\"", LAMP_XML}};
    auto res = get("/device/xml?url=" + net::url_encode(LAMP_URL));
    EXPECT_EQ(res.result_int(), 200u);
    EXPECT_EQ(res.body(), LAMP_XML);
    EXPECT_EQ(std::string(res[http::field::content_type]), "text/xml; charset=\"utf-8\"");

    auto missing = get("/device/xml");
    EXPECT_EQ(missing.result_int(), 400u);
    EXPECT_EQ(missing.body(), "Missing 'url' parameter");

    auto failed = get("/device/xml?url=http://h/unknown.xml");
    EXPECT_EQ(failed.result_int(), 500u);
}

TEST_F(ApiFixture, DeviceListIncludesConvertUrl) {
    registry.upsert("dev-1", LAMP_URL, "urn:schemas-upnp-org:device:DimmableLight:1", {"192.168.1.20", 1900},
                    Clock::time_point(42s));
    auto res = get("/devices");
    EXPECT_EQ(res.result_int(), 200u);
    auto j = body(res);
    EXPECT_EQ(j["count"], 1);
    const auto& d = j["devices"][0];
    EXPECT_EQ(d["uuid"], "dev-1");
    EXPECT_EQ(d["addr"], "192.168.1.20:1900");
    EXPECT_DOUBLE_EQ(d["lastSeen"].get<double>(), 42.0);
    EXPECT_EQ(d["jsonUrl"], "http://127.0.0.1:5030/device/json?url=http%3A//192.168.1.20%3A49152/desc.xml");
}

TEST_F(ApiFixture, GetDeviceFetchesFreshDescription) {
    registry.upsert("dev-1", LAMP_URL, "t", {"192.168.1.20", 1900}, Clock::time_point(1s));
    fetcher.table[LAMP_URL] = {{}, {200, "text/xml", LAMP_XML}};
    cache.put(LAMP_URL, json{{"stale", true}});

    auto res = get("/devices/dev-1");
    EXPECT_EQ(res.result_int(), 200u);
    auto j = body(res);
    EXPECT_EQ(j["uuid"], "dev-1");
    EXPECT_EQ(j["description"]["device"]["friendlyName"], "Lamp");
    EXPECT_EQ(fetcher.calls, 1);
}

TEST_F(ApiFixture, GetDeviceErrors) {
    auto unknown = get("/devices/unknown-id");
    EXPECT_EQ(unknown.result_int(), 404u);
    EXPECT_EQ(body(unknown)["error"], "Device not found");

    registry.upsert("dev-2", "http://h/gone.xml", "t", {"10.0.0.2", 1900}, Clock::time_point(1s));
    auto failed = get("/devices/dev-2");
    EXPECT_EQ(failed.result_int(), 500u);
    auto j = body(failed);
    EXPECT_EQ(j["uuid"], "dev-2");
    EXPECT_EQ(j["location"], "http://h/gone.xml");
    EXPECT_TRUE(j.contains("error"));
}

TEST_F(ApiFixture, InvalidUtf8FromTheNetworkIsReplacedNotThrown) {
    // LOCATION as announced by a misbehaving device; nothing answers on it
    const std::string bad_location = "http://10.0.0.9/d\xff.xml";
    registry.upsert("dev1", bad_location, "urn:x\xfe", {"10.0.0.9", 1900}, Clock::time_point(1s));

    ProxyApi::Response list;
    ASSERT_NO_THROW(list = get("/devices"));
    EXPECT_EQ(list.result_int(), 200u);
    auto j = body(list);
    EXPECT_EQ(j["count"], 1);
    EXPECT_EQ(j["devices"][0]["location"], "http://10.0.0.9/d\xEF\xBF\xBD.xml");

    ProxyApi::Response one;
    ASSERT_NO_THROW(one = get("/devices/dev1"));
    EXPECT_EQ(one.result_int(), 500u);
    EXPECT_EQ(body(one)["uuid"], "dev1");
    EXPECT_TRUE(body(one).contains("error"));
}

TEST_F(ApiFixture, InvalidUtf8InDescriptionIsServedAndCached) {
    fetcher.table["http://h/latin1.xml"] = {{}, {200, "text/xml",
        "<root><device><friendlyName>Caf\xe9</friendlyName></device></root>"}};

    auto first = get("/device/json?url=http://h/latin1.xml");
    EXPECT_EQ(first.result_int(), 200u);
    EXPECT_EQ(body(first)["device"]["friendlyName"], "Caf\xEF\xBF\xBD");

    auto second = get("/device/json?url=http://h/latin1.xml");
    EXPECT_EQ(second.result_int(), 200u);
    EXPECT_EQ(second.body(), first.body());
    EXPECT_EQ(fetcher.calls, 1);
}

TEST_F(ApiFixture, UnknownRouteAndMethod) {
    EXPECT_EQ(get("/nothing/here").result_int(), 404u);
    EXPECT_EQ(get("/devices/a/b").result_int(), 404u);
    EXPECT_EQ(get("/devices", http::verb::post).result_int(), 405u);
}

TEST(Url, ParseTargetDecodesQueryOnce) {
    auto t = net::parse_target("/device/json?url=http%3A%2F%2Fh%2Fa%2520b.xml&url=ignored");
    EXPECT_EQ(t.path, "/device/json");
    EXPECT_EQ(t.query["url"], "http://h/a%20b.xml");
}

TEST(Url, ParseHttpUrl) {
    net::HttpUrl u;
    ASSERT_TRUE(net::parse_http_url("http://192.168.1.20:49152/desc.xml?x=1", u));
    EXPECT_EQ(u.host, "192.168.1.20");
    EXPECT_EQ(u.port, "49152");
    EXPECT_EQ(u.target, "/desc.xml?x=1");

    ASSERT_TRUE(net::parse_http_url("http://[fe80::1]/d.xml", u));
    EXPECT_EQ(u.host, "fe80::1");
    EXPECT_EQ(u.port, "80");

    EXPECT_FALSE(net::parse_http_url("https://secure/d.xml", u));
    EXPECT_FALSE(net::parse_http_url("ftp://h/d.xml", u));
}

// Real sockets: the Beast server answers the Beast client on loopback.
TEST(HttpServer, ServesApiOverLoopback) {
    boost::asio::io_context ioc;
    ProxyIdentity identity{"loop-uuid", "127.0.0.1", 0};
    DeviceRegistry registry{[](const DiscoveredDevice&) {}};
    ConversionCache cache;
    net::HttpFetcher fetcher(ioc);
    XmlDescriptionConverter converter;
    ProxyApi api(identity, registry, cache, fetcher, converter, 2s);

    net::HttpServer server(ioc, "127.0.0.1", 0,
        [&](const ProxyApi::Request& req, ProxyApi::Responder respond) { api.handle(req, std::move(respond)); });
    server.start();
    ASSERT_NE(server.local_port(), 0);

    std::optional<net::FetchResult> got;
    boost::system::error_code got_ec;
    fetcher.fetch("http://127.0.0.1:" + std::to_string(server.local_port()) + "/proxy/description", 2s,
        [&](boost::system::error_code ec, net::FetchResult r) {
            got_ec = ec;
            got = std::move(r);
            server.stop();
        });
    ioc.run_for(3s);

    ASSERT_TRUE(got.has_value());
    EXPECT_FALSE(got_ec) << got_ec.message();
    EXPECT_EQ(got->status, 200u);
    EXPECT_EQ(json::parse(got->body)["UDN"], "uuid:loop-uuid");
}

TEST(HttpFetcher, RejectsNonHttpUrls) {
    boost::asio::io_context ioc;
    net::HttpFetcher fetcher(ioc);
    boost::system::error_code got;
    bool called = false;
    fetcher.fetch("ftp://example/desc.xml", 1s, [&](boost::system::error_code ec, net::FetchResult) {
        called = true;
        got = ec;
    });
    ioc.run_for(500ms);
    EXPECT_TRUE(called);
    EXPECT_EQ(got, boost::asio::error::invalid_argument);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
