#include <gtest/gtest.h>
#include "DeviceRegistry.hpp"
#include "discovery/DiscoveryMessageRouter.hpp"
#include "discovery/ResponsePolicy.hpp"
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <vector>

using namespace upnpbridge;
using namespace std::chrono_literals;

namespace {

struct RecordingTransport : IDiscoveryTransport {
    void start_listening(MessageHandler) override {}
    void stop_listening() override {}
    void send_alive() override { ++alive; }
    void send_byebye() override { ++byebye; }
    void send_search(const std::string& target, int) override { searches.push_back(target); }
    void send_search_response(const std::string& target) override { responses.push_back(target); }

    int alive = 0;
    int byebye = 0;
    std::vector<std::string> searches;
    std::vector<std::string> responses;
};

const NetworkAddress SENDER{"192.168.1.20", 1900};
const std::string PROXY_ID = "proxy-self";

DiscoveryMessage notify(const std::string& uuid, const std::string& nt, const std::string& location = "http://h/d.xml") {
    DiscoveryMessage::Headers h{{"NT", nt}, {"NTS", "ssdp:alive"}, {"USN", "uuid:" + uuid + "::" + nt}};
    if (!location.empty()) h.emplace_back("LOCATION", location);
    return DiscoveryMessage{MessageKind::PresenceNotify, "NOTIFY * HTTP/1.1", h, SENDER};
}

DiscoveryMessage search(const std::string& st, const std::string& mx = "") {
    DiscoveryMessage::Headers h{{"ST", st}};
    if (!mx.empty()) h.emplace_back("MX", mx);
    return DiscoveryMessage{MessageKind::SearchQuery, "M-SEARCH * HTTP/1.1", h, SENDER};
}

} // namespace

TEST(DiscoveryMessageRouter, RegistersLegacyDevicesOnce) {
    DeviceRegistry reg([](const DiscoveredDevice&) {});
    auto now = Clock::time_point(100s);
    DiscoveryMessageRouter router(reg, PROXY_ID, nullptr, [&] { return now; });

    auto msg = notify("dev-1", "urn:schemas-upnp-org:device:Basic:1");
    EXPECT_EQ(router.route(msg), RouteOutcome::Inserted);
    now += 5s;
    EXPECT_EQ(router.route(msg), RouteOutcome::Refreshed);

    auto d = reg.get("dev-1");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->device_type, "urn:schemas-upnp-org:device:Basic:1");
    EXPECT_EQ(d->addr.host, "192.168.1.20");
    EXPECT_EQ(d->last_seen, Clock::time_point(105s));
}

TEST(DiscoveryMessageRouter, IgnoresOwnAnnouncements) {
    DeviceRegistry reg([](const DiscoveredDevice&) {});
    DiscoveryMessageRouter router(reg, PROXY_ID, nullptr);
    EXPECT_EQ(router.route(notify(PROXY_ID, "urn:schemas-upnp-org:device:Basic:1")), RouteOutcome::Dropped);
    EXPECT_EQ(reg.size(), 0u);
}

TEST(DiscoveryMessageRouter, IgnoresJsonNativeDevices) {
    DeviceRegistry reg([](const DiscoveredDevice&) {});
    DiscoveryMessageRouter router(reg, PROXY_ID, nullptr);
    EXPECT_EQ(router.route(notify("j-1", "urn:schemas-JSON-UPNP-org:device:Light:1")), RouteOutcome::Dropped);
    EXPECT_EQ(reg.size(), 0u);
}

TEST(DiscoveryMessageRouter, DropsIncompleteAndDepartures) {
    DeviceRegistry reg([](const DiscoveredDevice&) {});
    DiscoveryMessageRouter router(reg, PROXY_ID, nullptr);
    EXPECT_EQ(router.route(notify("dev-1", "urn:x", "")), RouteOutcome::Dropped);

    DiscoveryMessage bye{MessageKind::Departure, "NOTIFY * HTTP/1.1",
                         {{"NTS", "ssdp:byebye"}, {"USN", "uuid:dev-2"}, {"LOCATION", "http://h/d.xml"}}, SENDER};
    EXPECT_EQ(router.route(bye), RouteOutcome::Dropped);
    EXPECT_EQ(reg.size(), 0u);
}

TEST(DiscoveryMessageRouter, ForwardsQueries) {
    DeviceRegistry reg([](const DiscoveredDevice&) {});
    std::vector<std::string> forwarded;
    DiscoveryMessageRouter router(reg, PROXY_ID, [&](const DiscoveryMessage& q) {
        forwarded.push_back(q.search_target().value_or(""));
    });
    EXPECT_EQ(router.route(search("ssdp:all")), RouteOutcome::QueryForwarded);
    ASSERT_EQ(forwarded.size(), 1u);
    EXPECT_EQ(forwarded[0], "ssdp:all");
}

TEST(ResponsePolicy, MatchesTargets) {
    EXPECT_TRUE(ResponsePolicy::should_respond(std::string("ssdp:all")));
    EXPECT_TRUE(ResponsePolicy::should_respond(std::string("urn:schemas-json-upnp-org:device:json-upnp-proxy:1")));
    EXPECT_TRUE(ResponsePolicy::should_respond(std::string("urn:example:service:PROXY:1")));
    EXPECT_FALSE(ResponsePolicy::should_respond(std::string("upnp:rootdevice")));
    EXPECT_FALSE(ResponsePolicy::should_respond(std::string("urn:schemas-upnp-org:device:MediaServer:1")));
    EXPECT_FALSE(ResponsePolicy::should_respond(std::nullopt));
}

TEST(ResponsePolicy, DelayStaysWithinMaxWait) {
    boost::asio::io_context ioc;
    RecordingTransport transport;
    ResponsePolicy policy(ioc, transport);
    for (int i = 0; i < 200; ++i) {
        auto d = policy.compute_delay(2).count();
        EXPECT_GE(d, 0.0);
        EXPECT_LE(d, 2.0);
    }
    EXPECT_EQ(policy.compute_delay(0).count(), 0.0);
}

TEST(ResponsePolicy, MissingMaxWaitDefaultsToThreeSeconds) {
    boost::asio::io_context ioc;
    RecordingTransport transport;
    double seen_hi = -1;
    ResponsePolicy policy(ioc, transport, [&](double, double hi) { seen_hi = hi; return hi; });
    EXPECT_DOUBLE_EQ(policy.compute_delay(std::nullopt).count(), 3.0);
    EXPECT_DOUBLE_EQ(seen_hi, 3.0);
}

TEST(ResponsePolicy, RespondsAfterJitter) {
    boost::asio::io_context ioc;
    RecordingTransport transport;
    ResponsePolicy policy(ioc, transport, [](double, double) { return 0.02; });

    EXPECT_FALSE(policy.on_query(search("upnp:rootdevice", "1")));
    EXPECT_TRUE(policy.on_query(search("ssdp:all", "1")));
    EXPECT_EQ(policy.pending(), 1u);
    EXPECT_TRUE(transport.responses.empty());

    ioc.run_for(std::chrono::milliseconds(500));
    ASSERT_EQ(transport.responses.size(), 1u);
    EXPECT_EQ(transport.responses[0], "ssdp:all");
    EXPECT_EQ(policy.pending(), 0u);
}

TEST(ResponsePolicy, CancelledResponsesAreNeverSent) {
    boost::asio::io_context ioc;
    RecordingTransport transport;
    ResponsePolicy policy(ioc, transport, [](double, double) { return 0.05; });
    policy.on_query(search("ssdp:all", "1"));
    policy.cancel_pending();
    ioc.run_for(std::chrono::milliseconds(200));
    EXPECT_TRUE(transport.responses.empty());
}

TEST(ResponsePolicy, DestroyingThePolicyCancelsPendingResponses) {
    boost::asio::io_context ioc;
    RecordingTransport transport;
    {
        ResponsePolicy policy(ioc, transport, [](double, double) { return 0.02; });
        EXPECT_TRUE(policy.on_query(search("ssdp:all", "1")));
    }
    ioc.run_for(std::chrono::milliseconds(200));
    EXPECT_TRUE(transport.responses.empty());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
