#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include "ProxyApi.hpp"

namespace upnpbridge::net {

// Boost.Beast HTTP/1.1 listener; each connection is served by its own session.
class HttpServer {
public:
    using RequestHandler = std::function<void(const ProxyApi::Request&, ProxyApi::Responder)>;

    HttpServer(boost::asio::io_context& ioc, std::string host, uint16_t port, RequestHandler handler);
    ~HttpServer();

    // Throws boost::system::system_error when the address cannot be bound.
    void start();
    void stop();

    bool running() const { return running_; }
    // Bound port (differs from the configured one when that was 0).
    uint16_t local_port() const;

    struct SessionSet;

private:
    void do_accept();

    boost::asio::io_context& ioc_;
    std::string host_;
    uint16_t port_;
    RequestHandler handler_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::shared_ptr<SessionSet> sessions_;
    bool running_ = false;
};

} // namespace upnpbridge::net
