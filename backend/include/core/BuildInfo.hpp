#pragma once

#include <string>

namespace upnpbridge::buildinfo {

inline std::string version() {
#ifdef UPNPBRIDGE_VERSION
    return std::string(UPNPBRIDGE_VERSION);
#else
    return "1.0";
#endif
}

inline std::string git_commit() {
#ifdef UPNPBRIDGE_GIT_COMMIT
    return std::string(UPNPBRIDGE_GIT_COMMIT);
#else
    return "unknown";
#endif
}

// Product token used in SSDP SERVER and HTTP Server headers.
inline std::string product_token() {
    return "UpnpBridge/" + version();
}

} // namespace upnpbridge::buildinfo
