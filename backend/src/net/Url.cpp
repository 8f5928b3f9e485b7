#include "net/Url.hpp"
#include <cctype>

namespace upnpbridge::net {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

} // namespace

bool parse_http_url(const std::string& url, HttpUrl& out) {
    const std::string prefix = "http://";
    if (url.size() < prefix.size()) return false;
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(url[i])) != prefix[i]) return false;
    }
    std::string s = url.substr(prefix.size());

    std::string hostport;
    auto slash = s.find_first_of("/?");
    if (slash == std::string::npos) {
        hostport = s;
        out.target = "/";
    } else {
        hostport = s.substr(0, slash);
        out.target = s.substr(slash);
        if (out.target.front() == '?') out.target.insert(out.target.begin(), '/');
    }
    auto hash = out.target.find('#');
    if (hash != std::string::npos) out.target.erase(hash);

    // strip userinfo
    auto at = hostport.rfind('@');
    if (at != std::string::npos) hostport.erase(0, at + 1);

    if (!hostport.empty() && hostport.front() == '[') {
        auto close = hostport.find(']');
        if (close == std::string::npos) return false;
        out.host = hostport.substr(1, close - 1);
        auto rest = hostport.substr(close + 1);
        out.port = (rest.size() > 1 && rest.front() == ':') ? rest.substr(1) : "80";
    } else {
        auto colon = hostport.find(':');
        if (colon == std::string::npos) {
            out.host = hostport;
            out.port = "80";
        } else {
            out.host = hostport.substr(0, colon);
            out.port = hostport.substr(colon + 1);
            if (out.port.empty()) out.port = "80";
        }
    }
    return !out.host.empty();
}

std::string url_encode(std::string_view in, std::string_view safe) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(in.size() * 3);
    for (char ch : in) {
        auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c) || safe.find(ch) != std::string_view::npos) {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0xF]);
        }
    }
    return out;
}

std::string url_decode(std::string_view in, bool plus_as_space) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '%' && i + 2 < in.size()) {
            int hi = hex_value(in[i + 1]);
            int lo = hex_value(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        if (c == '+' && plus_as_space) {
            out.push_back(' ');
            continue;
        }
        out.push_back(c);
    }
    return out;
}

RequestTarget parse_target(std::string_view target) {
    RequestTarget out;
    auto q = target.find('?');
    out.path = url_decode(target.substr(0, q));
    if (q == std::string_view::npos) return out;

    auto query = target.substr(q + 1);
    while (!query.empty()) {
        auto amp = query.find('&');
        auto pair = query.substr(0, amp);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            auto key = url_decode(pair.substr(0, eq), true);
            std::string value = eq == std::string_view::npos ? std::string() : url_decode(pair.substr(eq + 1), true);
            // first occurrence wins
            out.query.emplace(std::move(key), std::move(value));
        }
        if (amp == std::string_view::npos) break;
        query.remove_prefix(amp + 1);
    }
    return out;
}

} // namespace upnpbridge::net
