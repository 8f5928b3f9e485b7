#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include "discovery/IDiscoveryTransport.hpp"

namespace upnpbridge {

// UDP multicast implementation of the discovery channel.
class SsdpTransport : public IDiscoveryTransport {
public:
    SsdpTransport(boost::asio::io_context& ioc, const std::string& group, uint16_t port, ssdp::Advertisement ad);
    ~SsdpTransport() override;

    // Throws boost::system::system_error when the socket cannot be bound or joined.
    void start_listening(MessageHandler handler) override;
    void stop_listening() override;
    void send_alive() override;
    void send_byebye() override;
    void send_search(const std::string& target, int max_wait) override;
    void send_search_response(const std::string& target) override;

    const boost::asio::ip::udp::endpoint& multicast_endpoint() const { return multicast_ep_; }

private:
    void do_receive();
    void send(const DiscoveryMessage& msg);

    boost::asio::ip::udp::endpoint multicast_ep_;
    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::udp::endpoint remote_ep_;
    std::array<char, 8192> buffer_{};
    ssdp::Advertisement ad_;
    std::string host_header_;
    MessageHandler handler_;
    bool listening_ = false;
};

} // namespace upnpbridge
