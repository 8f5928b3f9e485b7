/*
src/discovery/DiscoveryMessage.cpp
Parse and format SSDP datagrams in both the legacy header framing and
the JSON-native framing.
*/
#include "discovery/DiscoveryMessage.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <nlohmann/json.hpp>

namespace upnpbridge {

namespace {

MessageKind kind_from_nts(const std::optional<std::string>& nts) {
    if (nts && boost::iequals(*nts, ssdp::NTS_BYEBYE)) return MessageKind::Departure;
    return MessageKind::PresenceNotify;
}

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        auto nl = text.find('\n', pos);
        auto end = nl == std::string_view::npos ? text.size() : nl;
        auto line = text.substr(pos, end - pos);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.push_back(line);
        if (nl == std::string_view::npos) break;
        pos = nl + 1;
    }
    return lines;
}

} // namespace

const char* to_string(MessageKind kind) {
    switch (kind) {
    case MessageKind::PresenceNotify: return "presence-notify";
    case MessageKind::SearchResponse: return "search-response";
    case MessageKind::SearchQuery: return "search-query";
    case MessageKind::Departure: return "departure";
    case MessageKind::Unknown: break;
    }
    return "unknown";
}

DiscoveryMessage::DiscoveryMessage(MessageKind kind, std::string start_line, Headers headers, NetworkAddress sender)
: kind_(kind), start_line_(std::move(start_line)), headers_(std::move(headers)), sender_(std::move(sender)) {}

DiscoveryMessage DiscoveryMessage::parse(std::string_view datagram, const NetworkAddress& sender) {
    auto first = datagram.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return DiscoveryMessage{MessageKind::Unknown, {}, {}, sender};
    if (datagram[first] == '{') return parse_json(datagram.substr(first), sender);
    return parse_text(datagram.substr(first), sender);
}

DiscoveryMessage DiscoveryMessage::parse_text(std::string_view datagram, const NetworkAddress& sender) {
    auto lines = split_lines(datagram);
    DiscoveryMessage msg{MessageKind::Unknown, boost::trim_copy(std::string(lines.front())), {}, sender};

    for (std::size_t i = 1; i < lines.size(); ++i) {
        if (lines[i].empty()) break;
        auto colon = lines[i].find(':');
        if (colon == std::string_view::npos || colon == 0) continue;
        auto name = boost::trim_copy(std::string(lines[i].substr(0, colon)));
        auto value = boost::trim_copy(std::string(lines[i].substr(colon + 1)));
        msg.headers_.emplace_back(std::move(name), std::move(value));
    }

    const auto& start = msg.start_line_;
    if (boost::istarts_with(start, "NOTIFY ")) {
        msg.kind_ = kind_from_nts(msg.header("NTS"));
    } else if (boost::istarts_with(start, "M-SEARCH ")) {
        msg.kind_ = MessageKind::SearchQuery;
    } else if (boost::istarts_with(start, "HTTP/1.") && start.find(" 200") != std::string::npos) {
        msg.kind_ = MessageKind::SearchResponse;
    }
    return msg;
}

DiscoveryMessage DiscoveryMessage::parse_json(std::string_view datagram, const NetworkAddress& sender) {
    DiscoveryMessage msg{MessageKind::Unknown, {}, {}, sender};
    auto j = nlohmann::json::parse(datagram.begin(), datagram.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) return msg;

    std::string type;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const auto& v = it.value();
        std::string text;
        if (v.is_string()) text = v.get<std::string>();
        else if (v.is_number_unsigned()) text = std::to_string(v.get<unsigned long long>());
        else if (v.is_number_integer()) text = std::to_string(v.get<long long>());
        // fractional or exponent forms keep their JSON spelling; max_wait() rejects them
        else if (v.is_number()) text = v.dump();
        else continue;
        if (boost::iequals(it.key(), "type")) {
            type = boost::to_lower_copy(text);
            continue;
        }
        msg.headers_.emplace_back(it.key(), std::move(text));
    }

    if (type == "notify") {
        msg.kind_ = kind_from_nts(msg.header("nts"));
        msg.start_line_ = "NOTIFY * HTTP/1.1";
    } else if (type == "msearch" || type == "m-search") {
        msg.kind_ = MessageKind::SearchQuery;
        msg.start_line_ = "M-SEARCH * HTTP/1.1";
    } else if (type == "response") {
        msg.kind_ = MessageKind::SearchResponse;
        msg.start_line_ = "HTTP/1.1 200 OK";
    }
    return msg;
}

std::optional<std::string> DiscoveryMessage::header(std::string_view name) const {
    for (const auto& [k, v] : headers_) {
        if (boost::iequals(k, name)) return v;
    }
    return std::nullopt;
}

std::optional<std::string> DiscoveryMessage::location() const {
    auto v = header("LOCATION");
    if (!v || v->empty()) return std::nullopt;
    return v;
}

std::optional<std::string> DiscoveryMessage::identifier() const {
    auto usn = header("USN");
    if (!usn) return std::nullopt;
    std::string id = *usn;
    if (boost::istarts_with(id, "uuid:")) id.erase(0, 5);
    auto sep = id.find("::");
    if (sep != std::string::npos) id.erase(sep);
    boost::trim(id);
    if (id.empty()) return std::nullopt;
    return id;
}

std::optional<std::string> DiscoveryMessage::role() const {
    auto v = (kind_ == MessageKind::PresenceNotify || kind_ == MessageKind::Departure) ? header("NT") : header("ST");
    if (!v || v->empty()) return std::nullopt;
    return v;
}

std::optional<std::string> DiscoveryMessage::search_target() const {
    auto v = header("ST");
    if (!v || v->empty()) return std::nullopt;
    return v;
}

std::optional<int> DiscoveryMessage::max_wait() const {
    auto v = header("MX");
    if (!v) return std::nullopt;
    try {
        std::size_t pos = 0;
        int mx = std::stoi(*v, &pos);
        if (pos != v->size() || mx < 0) return std::nullopt;
        return mx;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string DiscoveryMessage::to_datagram() const {
    std::string out = start_line_;
    out += "\r\n";
    for (const auto& [k, v] : headers_) {
        out += k;
        out += ": ";
        out += v;
        out += "\r\n";
    }
    out += "\r\n";
    return out;
}

namespace ssdp {

namespace {

DiscoveryMessage make_notify(const Advertisement& ad, const std::string& host_header, const char* nts) {
    DiscoveryMessage::Headers h{
        {"HOST", host_header},
        {"NT", ad.notification_type},
        {"NTS", nts},
        {"USN", "uuid:" + ad.uuid + "::" + ad.notification_type},
    };
    if (std::string(nts) == NTS_ALIVE) {
        h.emplace_back("CACHE-CONTROL", "max-age=" + std::to_string(ad.max_age));
        h.emplace_back("LOCATION", ad.location);
        h.emplace_back("SERVER", ad.server);
    }
    return DiscoveryMessage{std::string(nts) == NTS_ALIVE ? MessageKind::PresenceNotify : MessageKind::Departure,
                            "NOTIFY * HTTP/1.1", std::move(h)};
}

} // namespace

DiscoveryMessage make_alive(const Advertisement& ad, const std::string& host_header) {
    return make_notify(ad, host_header, NTS_ALIVE);
}

DiscoveryMessage make_byebye(const Advertisement& ad, const std::string& host_header) {
    return make_notify(ad, host_header, NTS_BYEBYE);
}

DiscoveryMessage make_search(const std::string& target, int max_wait, const std::string& host_header,
                             const std::string& user_agent) {
    return DiscoveryMessage{MessageKind::SearchQuery, "M-SEARCH * HTTP/1.1", {
        {"HOST", host_header},
        {"MAN", "\"ssdp:discover\""},
        {"MX", std::to_string(max_wait)},
        {"ST", target},
        {"USER-AGENT", user_agent},
    }};
}

DiscoveryMessage make_search_response(const Advertisement& ad, const std::string& target) {
    return DiscoveryMessage{MessageKind::SearchResponse, "HTTP/1.1 200 OK", {
        {"CACHE-CONTROL", "max-age=" + std::to_string(ad.max_age)},
        {"EXT", ""},
        {"LOCATION", ad.location},
        {"SERVER", ad.server},
        {"ST", target},
        {"USN", "uuid:" + ad.uuid + "::" + target},
    }};
}

} // namespace ssdp

} // namespace upnpbridge
