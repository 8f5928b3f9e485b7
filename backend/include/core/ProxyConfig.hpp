#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace upnpbridge {

// Runtime settings. Durations are in seconds.
struct ProxyConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 5030;
    std::string proxy_uuid; // generated when empty
    int cache_ttl = 3600;   // advertised hint only

    std::string multicast_group = "224.0.0.1";
    uint16_t multicast_port = 5007;
    int advertise_max_age = 1800;

    std::chrono::seconds announce_interval{600};
    std::chrono::seconds discovery_initial_delay{5};
    std::chrono::seconds discovery_interval{120};
    int discovery_max_wait = 3;
    std::chrono::seconds cleanup_interval{300};
    std::chrono::seconds stale_age{3600};
    std::chrono::seconds fetch_timeout{10};

    std::size_t cache_max_size = 100;
    std::size_t cache_keep = 50;

    // Base URL of the HTTP surface, e.g. "http://127.0.0.1:5030".
    std::string base_url() const;
};

struct ParseResult {
    ProxyConfig config;
    bool show_help = false;
};

// Parse command-line flags, then apply UPNPBRIDGE_* environment overrides.
// Invalid numeric values keep their defaults and print a warning.
ParseResult parse_config(int argc, const char* const* argv);

void apply_env_overrides(ProxyConfig& cfg);

void print_usage(const char* prog);

} // namespace upnpbridge
