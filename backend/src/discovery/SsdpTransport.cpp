#include "discovery/SsdpTransport.hpp"
#include "core/BuildInfo.hpp"
#include <iostream>
#include <memory>
#include <boost/asio/ip/multicast.hpp>

namespace asio = boost::asio;
using udp = asio::ip::udp;

namespace upnpbridge {

SsdpTransport::SsdpTransport(asio::io_context& ioc, const std::string& group, uint16_t port, ssdp::Advertisement ad)
: multicast_ep_(asio::ip::make_address(group), port),
  socket_(ioc),
  ad_(std::move(ad)),
  host_header_(multicast_ep_.address().to_string() + ":" + std::to_string(port)) {}

SsdpTransport::~SsdpTransport() {
    stop_listening();
}

void SsdpTransport::start_listening(MessageHandler handler) {
    if (listening_) return;
    handler_ = std::move(handler);

    const auto protocol = multicast_ep_.protocol();
    socket_.open(protocol);
    socket_.set_option(udp::socket::reuse_address(true));
    socket_.bind(udp::endpoint(protocol, multicast_ep_.port()));
    socket_.set_option(asio::ip::multicast::join_group(multicast_ep_.address()));
    socket_.set_option(asio::ip::multicast::hops(4)); // UPnP default
    socket_.set_option(asio::ip::multicast::enable_loopback(true));

    listening_ = true;
    std::cout << "SsdpTransport: listening on " << host_header_ << std::endl;
    do_receive();
}

void SsdpTransport::stop_listening() {
    listening_ = false;
    if (!socket_.is_open()) return;
    boost::system::error_code ec;
    socket_.set_option(asio::ip::multicast::leave_group(multicast_ep_.address()), ec);
    socket_.close(ec);
    if (ec) std::cerr << "SsdpTransport: close failed: " << ec.message() << std::endl;
}

void SsdpTransport::do_receive() {
    socket_.async_receive_from(asio::buffer(buffer_), remote_ep_,
        [this](const boost::system::error_code& ec, std::size_t bytes) {
            if (ec == asio::error::operation_aborted || !listening_) return;
            if (ec) {
                std::cerr << "SsdpTransport: receive error: " << ec.message() << std::endl;
            } else {
                NetworkAddress sender{remote_ep_.address().to_string(), remote_ep_.port()};
                auto msg = DiscoveryMessage::parse(std::string_view(buffer_.data(), bytes), sender);
                // discovery is best-effort: anything unrecognised is dropped
                if (msg.kind() != MessageKind::Unknown && handler_) {
                    try {
                        handler_(msg);
                    } catch (const std::exception& e) {
                        std::cerr << "SsdpTransport: handler error: " << e.what() << std::endl;
                    }
                }
            }
            do_receive();
        });
}

void SsdpTransport::send(const DiscoveryMessage& msg) {
    if (!socket_.is_open()) {
        std::cerr << "SsdpTransport: socket closed, dropping " << to_string(msg.kind()) << std::endl;
        return;
    }
    auto payload = std::make_shared<std::string>(msg.to_datagram());
    socket_.async_send_to(asio::buffer(*payload), multicast_ep_,
        [payload](const boost::system::error_code& ec, std::size_t) {
            if (ec && ec != asio::error::operation_aborted) {
                std::cerr << "SsdpTransport: send failed: " << ec.message() << std::endl;
            }
        });
}

void SsdpTransport::send_alive() {
    send(ssdp::make_alive(ad_, host_header_));
}

// Sent synchronously: it normally precedes stop_listening(), which would abort a queued send.
void SsdpTransport::send_byebye() {
    if (!socket_.is_open()) return;
    boost::system::error_code ec;
    socket_.send_to(asio::buffer(ssdp::make_byebye(ad_, host_header_).to_datagram()), multicast_ep_, 0, ec);
    if (ec) std::cerr << "SsdpTransport: byebye failed: " << ec.message() << std::endl;
}

void SsdpTransport::send_search(const std::string& target, int max_wait) {
    send(ssdp::make_search(target, max_wait, host_header_, buildinfo::product_token()));
}

void SsdpTransport::send_search_response(const std::string& target) {
    send(ssdp::make_search_response(ad_, target));
}

} // namespace upnpbridge
