#pragma once
#include <functional>
#include <string>
#include "discovery/DiscoveryMessage.hpp"

namespace upnpbridge {

/**
 * @brief Abstract discovery channel (multicast socket plus framing).
 *
 * Implementations deliver parsed messages on the io thread and never throw
 * from the send operations; failures are logged and dropped.
 */
class IDiscoveryTransport {
public:
    using MessageHandler = std::function<void(const DiscoveryMessage&)>;

    virtual ~IDiscoveryTransport() = default;
    /** @brief Begin receiving; every parsed datagram is passed to handler */
    virtual void start_listening(MessageHandler handler) = 0;
    virtual void stop_listening() = 0;
    /** @brief Multicast the proxy's ssdp:alive notification */
    virtual void send_alive() = 0;
    /** @brief Multicast the proxy's ssdp:byebye notification */
    virtual void send_byebye() = 0;
    /** @brief Multicast an M-SEARCH for target */
    virtual void send_search(const std::string& target, int max_wait) = 0;
    /** @brief Announce the proxy as a match for target */
    virtual void send_search_response(const std::string& target) = 0;
};

} // namespace upnpbridge
