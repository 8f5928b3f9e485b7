#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "DiscoveredDevice.hpp"

namespace upnpbridge {

enum class MessageKind {
    PresenceNotify, // NOTIFY ssdp:alive / ssdp:update
    SearchResponse, // HTTP/1.1 200 OK answering an M-SEARCH
    SearchQuery,    // M-SEARCH
    Departure,      // NOTIFY ssdp:byebye
    Unknown,
};

const char* to_string(MessageKind kind);

/**
 * @brief One parsed discovery datagram.
 *
 * Header names are matched case-insensitively. Both the legacy
 * HTTP-over-UDP framing and the JSON-native framing parse to this type.
 */
class DiscoveryMessage {
public:
    using Headers = std::vector<std::pair<std::string, std::string>>;

    DiscoveryMessage() = default;
    DiscoveryMessage(MessageKind kind, std::string start_line, Headers headers, NetworkAddress sender = {});

    // Never throws; malformed input yields kind() == MessageKind::Unknown.
    static DiscoveryMessage parse(std::string_view datagram, const NetworkAddress& sender);

    MessageKind kind() const { return kind_; }
    const std::string& start_line() const { return start_line_; }
    const Headers& headers() const { return headers_; }
    const NetworkAddress& sender() const { return sender_; }

    std::optional<std::string> header(std::string_view name) const;

    std::optional<std::string> location() const;
    // uuid part of USN, without the "uuid:" prefix or "::type" suffix
    std::optional<std::string> identifier() const;
    // NT for notifications, ST for responses and queries
    std::optional<std::string> role() const;
    std::optional<std::string> search_target() const;
    // MX in seconds; empty when absent, negative or not a number
    std::optional<int> max_wait() const;

    // Legacy framing, CRLF line endings, terminated by an empty line.
    std::string to_datagram() const;

private:
    static DiscoveryMessage parse_text(std::string_view datagram, const NetworkAddress& sender);
    static DiscoveryMessage parse_json(std::string_view datagram, const NetworkAddress& sender);

    MessageKind kind_ = MessageKind::Unknown;
    std::string start_line_;
    Headers headers_;
    NetworkAddress sender_;
};

namespace ssdp {

inline constexpr const char* SEARCH_ALL = "ssdp:all";
inline constexpr const char* NTS_ALIVE = "ssdp:alive";
inline constexpr const char* NTS_BYEBYE = "ssdp:byebye";

// What the proxy advertises about itself.
struct Advertisement {
    std::string uuid;
    std::string location;
    std::string notification_type;
    std::string server;
    int max_age = 1800;
};

DiscoveryMessage make_alive(const Advertisement& ad, const std::string& host_header);
DiscoveryMessage make_byebye(const Advertisement& ad, const std::string& host_header);
DiscoveryMessage make_search(const std::string& target, int max_wait, const std::string& host_header,
                             const std::string& user_agent);
DiscoveryMessage make_search_response(const Advertisement& ad, const std::string& target);

} // namespace ssdp

} // namespace upnpbridge
