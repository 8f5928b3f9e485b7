#include "ProxyService.hpp"
#include "convert/XmlDescriptionConverter.hpp"
#include "core/BuildInfo.hpp"
#include "discovery/SsdpTransport.hpp"
#include "net/HttpFetcher.hpp"
#include "net/HttpServer.hpp"
#include <iostream>

namespace upnpbridge {

ProxyService::ProxyService(boost::asio::io_context& ioc, const ProxyConfig& cfg)
: ProxyService(ioc, cfg, Collaborators{}) {}

ProxyService::ProxyService(boost::asio::io_context& ioc, const ProxyConfig& cfg, Collaborators c)
: ioc_(ioc), cfg_(cfg), identity_(cfg.proxy_uuid, cfg.host, cfg.port),
  transport_(std::move(c.transport)), fetcher_(std::move(c.fetcher)), converter_(std::move(c.converter)) {
    if (!transport_) {
        ssdp::Advertisement ad{identity_.uuid(), identity_.description_url(), PROXY_NOTIFICATION_TYPE,
                               buildinfo::product_token(), cfg_.advertise_max_age};
        transport_ = std::make_unique<SsdpTransport>(ioc_, cfg_.multicast_group, cfg_.multicast_port, std::move(ad));
    }
    if (!fetcher_) fetcher_ = std::make_unique<net::HttpFetcher>(ioc_);
    if (!converter_) converter_ = std::make_unique<XmlDescriptionConverter>();

    policy_ = std::make_unique<ResponsePolicy>(ioc_, *transport_, std::move(c.uniform));
    router_ = std::make_unique<DiscoveryMessageRouter>(registry_, identity_.uuid(),
        [this](const DiscoveryMessage& query) { policy_->on_query(query); }, c.now);
    scheduler_ = std::make_unique<Scheduler>(ioc_, *transport_, registry_, cache_, SchedulerConfig::from(cfg_), c.now);
    api_ = std::make_unique<ProxyApi>(identity_, registry_, cache_, *fetcher_, *converter_, cfg_.fetch_timeout);
    http_ = std::make_unique<net::HttpServer>(ioc_, cfg_.host, cfg_.port,
        [this](const ProxyApi::Request& req, ProxyApi::Responder respond) { api_->handle(req, std::move(respond)); });
}

ProxyService::~ProxyService() {
    stop();
}

void ProxyService::start() {
    if (running_) return;

    http_->start();
    transport_->start_listening([this](const DiscoveryMessage& msg) { router_->route(msg); });
    scheduler_->start();
    running_ = true;

    std::cout << "JSON-UPnP Proxy Server started:" << std::endl
              << "  - Proxy endpoint: " << identity_.base_url() << std::endl
              << "  - Proxy UUID: " << identity_.uuid() << std::endl
              << "  - Mode: json-upnp" << std::endl
              << "  - Discovery group: " << cfg_.multicast_group << ":" << cfg_.multicast_port << std::endl;
}

void ProxyService::stop() {
    if (!running_) return;
    running_ = false;

    scheduler_->cancel_all();
    policy_->cancel_pending();
    transport_->send_byebye();
    transport_->stop_listening();
    http_->stop();

    std::cout << "JSON-UPnP Proxy Server stopped" << std::endl;
}

uint16_t ProxyService::http_port() const {
    return http_->local_port();
}

} // namespace upnpbridge
