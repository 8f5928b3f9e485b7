#include "core/ProxyConfig.hpp"

#include <cstdlib>
#include <iostream>
#include <limits>

namespace upnpbridge {

namespace {

bool parse_int(const std::string& text, int& out) {
    try {
        std::size_t pos = 0;
        int v = std::stoi(text, &pos);
        if (pos != text.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

void set_port(const std::string& flag, const std::string& value, uint16_t& out) {
    int v = 0;
    if (!parse_int(value, v) || v < 0 || v > std::numeric_limits<uint16_t>::max()) {
        std::cerr << "config: ignoring invalid " << flag << " value '" << value << "'" << std::endl;
        return;
    }
    out = static_cast<uint16_t>(v);
}

void set_positive(const std::string& flag, const std::string& value, int& out) {
    int v = 0;
    if (!parse_int(value, v) || v <= 0) {
        std::cerr << "config: ignoring invalid " << flag << " value '" << value << "'" << std::endl;
        return;
    }
    out = v;
}

void set_seconds(const std::string& flag, const std::string& value, std::chrono::seconds& out) {
    int v = static_cast<int>(out.count());
    set_positive(flag, value, v);
    out = std::chrono::seconds(v);
}

} // namespace

std::string ProxyConfig::base_url() const {
    return "http://" + host + ":" + std::to_string(port);
}

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -h, --help                  Show this help message and exit\n"
              << "  --host HOST                 HTTP bind/advertised host (default 127.0.0.1)\n"
              << "  -p, --port PORT             HTTP port (default 5030)\n"
              << "  --uuid UUID                 Fixed proxy identifier (generated if absent)\n"
              << "  --cache-ttl SECONDS         Cache lifetime hint (default 3600)\n"
              << "  --multicast-group ADDR      Discovery multicast group (default 224.0.0.1)\n"
              << "  --multicast-port PORT       Discovery multicast port (default 5007)\n"
              << "  --announce-interval SECONDS Self-announce interval (default 600)\n"
              << "Environment: UPNPBRIDGE_HOST, UPNPBRIDGE_PORT, UPNPBRIDGE_UUID\n"
              << std::flush;
}

void apply_env_overrides(ProxyConfig& cfg) {
    if (const char* env = std::getenv("UPNPBRIDGE_HOST"); env && *env) cfg.host = env;
    if (const char* env = std::getenv("UPNPBRIDGE_PORT"); env && *env) set_port("UPNPBRIDGE_PORT", env, cfg.port);
    if (const char* env = std::getenv("UPNPBRIDGE_UUID"); env && *env) cfg.proxy_uuid = env;
}

ParseResult parse_config(int argc, const char* const* argv) {
    ParseResult result;
    ProxyConfig& cfg = result.config;

    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        std::string value;
        bool has_inline = false;
        auto eq = a.find('=');
        if (a.rfind("--", 0) == 0 && eq != std::string::npos) {
            value = a.substr(eq + 1);
            a = a.substr(0, eq);
            has_inline = true;
        }

        if (a == "-h" || a == "--help") {
            result.show_help = true;
            continue;
        }

        bool known = a == "--host" || a == "--port" || a == "-p" || a == "--uuid" || a == "--cache-ttl"
            || a == "--multicast-group" || a == "--multicast-port" || a == "--announce-interval";
        if (!known) {
            std::cerr << "config: ignoring unknown argument '" << argv[i] << "'" << std::endl;
            continue;
        }
        if (!has_inline) {
            if (i + 1 >= argc) {
                std::cerr << "config: missing value for " << a << std::endl;
                continue;
            }
            value = argv[++i];
        }

        if (a == "--host") cfg.host = value;
        else if (a == "--port" || a == "-p") set_port(a, value, cfg.port);
        else if (a == "--uuid") cfg.proxy_uuid = value;
        else if (a == "--cache-ttl") set_positive(a, value, cfg.cache_ttl);
        else if (a == "--multicast-group") cfg.multicast_group = value;
        else if (a == "--multicast-port") set_port(a, value, cfg.multicast_port);
        else if (a == "--announce-interval") set_seconds(a, value, cfg.announce_interval);
    }

    apply_env_overrides(cfg);
    return result;
}

} // namespace upnpbridge
