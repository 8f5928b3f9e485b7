#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include "discovery/IDiscoveryTransport.hpp"

namespace upnpbridge {

/**
 * @brief Decides whether and when the proxy answers an M-SEARCH.
 *
 * Matching queries are answered after a uniform random delay in
 * [0, MX] seconds so that responders on the segment do not reply in step.
 */
class ResponsePolicy {
public:
    // Returns a sample from [lo, hi].
    using UniformSource = std::function<double(double lo, double hi)>;

    static constexpr int DEFAULT_MAX_WAIT = 3;
    static constexpr const char* JSON_NATIVE_MARKER = "json-upnp";
    static constexpr const char* PROXY_MARKER = "proxy";

    // An empty uniform source selects a std::mt19937_64 seeded from std::random_device.
    ResponsePolicy(boost::asio::io_context& ioc, IDiscoveryTransport& transport, UniformSource uniform = {});
    ~ResponsePolicy();

    static bool should_respond(const std::optional<std::string>& target);

    std::chrono::duration<double> compute_delay(std::optional<int> max_wait);

    // Schedules a jittered response. Returns false when the query is ignored.
    bool on_query(const DiscoveryMessage& query);

    void cancel_pending();
    std::size_t pending() const { return pending_.size(); }

private:
    boost::asio::io_context& ioc_;
    IDiscoveryTransport& transport_;
    UniformSource uniform_;
    std::set<std::shared_ptr<boost::asio::steady_timer>> pending_;
};

} // namespace upnpbridge
