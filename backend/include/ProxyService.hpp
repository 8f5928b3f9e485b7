#pragma once
#include <memory>
#include <boost/asio/io_context.hpp>
#include "DeviceRegistry.hpp"
#include "ProxyApi.hpp"
#include "convert/IDescriptionConverter.hpp"
#include "core/ConversionCache.hpp"
#include "core/ProxyConfig.hpp"
#include "core/ProxyIdentity.hpp"
#include "discovery/DiscoveryMessageRouter.hpp"
#include "discovery/IDiscoveryTransport.hpp"
#include "discovery/ResponsePolicy.hpp"
#include "discovery/Scheduler.hpp"
#include "net/HttpFetcher.hpp"

namespace upnpbridge {

namespace net {
class HttpServer;
}

/**
 * @brief The proxy: discovery listener, registry, conversion cache, HTTP surface
 * and the periodic loops, all driven by one io_context.
 *
 * Collaborators left null are created with their production implementations
 * (SsdpTransport, HttpFetcher, XmlDescriptionConverter).
 */
class ProxyService {
public:
    struct Collaborators {
        std::unique_ptr<IDiscoveryTransport> transport;
        std::unique_ptr<net::IDescriptionFetcher> fetcher;
        std::unique_ptr<IDescriptionConverter> converter;
        ResponsePolicy::UniformSource uniform;
        Scheduler::NowFn now;
    };

    ProxyService(boost::asio::io_context& ioc, const ProxyConfig& cfg);
    ProxyService(boost::asio::io_context& ioc, const ProxyConfig& cfg, Collaborators collaborators);
    ~ProxyService();

    // Throws when the HTTP or discovery socket cannot be opened.
    void start();
    // Loops -> byebye -> listener -> HTTP. Safe to call more than once.
    void stop();

    bool running() const { return running_; }
    uint16_t http_port() const;

    const ProxyIdentity& identity() const { return identity_; }
    DeviceRegistry& registry() { return registry_; }
    ConversionCache& cache() { return cache_; }
    ProxyApi& api() { return *api_; }
    Scheduler& scheduler() { return *scheduler_; }
    ResponsePolicy& response_policy() { return *policy_; }
    DiscoveryMessageRouter& router() { return *router_; }

private:
    boost::asio::io_context& ioc_;
    ProxyConfig cfg_;
    ProxyIdentity identity_;
    DeviceRegistry registry_;
    ConversionCache cache_;

    std::unique_ptr<IDiscoveryTransport> transport_;
    std::unique_ptr<net::IDescriptionFetcher> fetcher_;
    std::unique_ptr<IDescriptionConverter> converter_;

    std::unique_ptr<ResponsePolicy> policy_;
    std::unique_ptr<DiscoveryMessageRouter> router_;
    std::unique_ptr<Scheduler> scheduler_;
    std::unique_ptr<ProxyApi> api_;
    std::unique_ptr<net::HttpServer> http_;

    bool running_ = false;
};

} // namespace upnpbridge
