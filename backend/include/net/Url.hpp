#pragma once
#include <map>
#include <string>
#include <string_view>

namespace upnpbridge::net {

struct HttpUrl {
    std::string host;
    std::string port;
    std::string target; // path plus query, always starts with '/'
};

// Minimal parser for http://host[:port][/path][?query]. Returns false for other schemes.
bool parse_http_url(const std::string& url, HttpUrl& out);

// Percent-encode everything except unreserved characters and those in safe.
std::string url_encode(std::string_view in, std::string_view safe = "/");
// Decode %XX escapes; '+' becomes a space when plus_as_space is set.
std::string url_decode(std::string_view in, bool plus_as_space = false);

struct RequestTarget {
    std::string path;
    std::map<std::string, std::string> query;
};

// Split "/path?a=1&b=2"; query keys and values are decoded once.
RequestTarget parse_target(std::string_view target);

} // namespace upnpbridge::net
