#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace upnpbridge::errors {

// Error taxonomy surfaced at the request boundary.
enum class ErrorKind {
    MissingParameter,
    UpstreamUnavailable,
    Timeout,
    ConversionFailure,
    NotFound,
};

// 1400-1499: request / conversion errors
inline constexpr int E1400_MISSING_PARAMETER = 1400;
inline constexpr int E1402_UPSTREAM_UNAVAILABLE = 1402;
inline constexpr int E1404_NOT_FOUND = 1404;
inline constexpr int E1450_CONVERSION_FAILURE = 1450;
inline constexpr int E1454_TIMEOUT = 1454;

inline constexpr const char* MSG_MISSING_URL = "Missing 'url' parameter";
inline constexpr const char* MSG_DEVICE_NOT_FOUND = "Device not found";
inline constexpr const char* MSG_ROUTE_NOT_FOUND = "not found";
inline constexpr const char* MSG_METHOD_NOT_ALLOWED = "method not allowed";
inline constexpr const char* MSG_FETCH_TIMEOUT = "Timeout fetching device description";
inline constexpr const char* MSG_UPSTREAM_STATUS_PREFIX = "Device returned status ";

// Converter details.
inline constexpr const char* D1450_EMPTY_DOCUMENT = "empty description document";
inline constexpr const char* D1450_NO_ROOT_ELEMENT = "description has no root element";
inline constexpr const char* D1450_XML_PARSE_PREFIX = "invalid XML: ";

// Fetcher details.
inline constexpr const char* D1402_UNSUPPORTED_URL = "unsupported url (expected http://host[:port]/path): ";

inline int code_of(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::MissingParameter: return E1400_MISSING_PARAMETER;
    case ErrorKind::UpstreamUnavailable: return E1402_UPSTREAM_UNAVAILABLE;
    case ErrorKind::Timeout: return E1454_TIMEOUT;
    case ErrorKind::ConversionFailure: return E1450_CONVERSION_FAILURE;
    case ErrorKind::NotFound: return E1404_NOT_FOUND;
    }
    return E1450_CONVERSION_FAILURE;
}

// HTTP status used when the error reaches the request boundary.
inline unsigned http_status(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::MissingParameter: return 400;
    case ErrorKind::UpstreamUnavailable: return 502;
    case ErrorKind::Timeout: return 504;
    case ErrorKind::ConversionFailure: return 500;
    case ErrorKind::NotFound: return 404;
    }
    return 500;
}

inline std::string format_upstream_status(unsigned status) {
    return std::string(MSG_UPSTREAM_STATUS_PREFIX) + std::to_string(status);
}

inline std::string format_xml_parse_error(std::string_view detail) {
    std::string out(D1450_XML_PARSE_PREFIX);
    out.append(detail.data(), detail.size());
    return out;
}

} // namespace upnpbridge::errors

namespace upnpbridge {

using errors::ErrorKind;

class ProxyError : public std::runtime_error {
public:
    ProxyError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }
    int code() const { return errors::code_of(kind_); }
    unsigned http_status() const { return errors::http_status(kind_); }

private:
    ErrorKind kind_;
};

} // namespace upnpbridge
