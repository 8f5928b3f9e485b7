#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace upnpbridge {

inline constexpr const char* DOC_TYPE_DEVICE = "device";
inline constexpr const char* DOC_TYPE_SERVICE = "service";

/**
 * @brief Converts a source-format description into JSON.
 *
 * Implementations are stateless: identical input gives identical output and
 * concurrent calls are safe. Malformed input throws ProxyError(ConversionFailure).
 */
class IDescriptionConverter {
public:
    virtual ~IDescriptionConverter() = default;
    virtual nlohmann::json convert(const std::string& source, const std::string& doc_type) const = 0;
};

} // namespace upnpbridge
