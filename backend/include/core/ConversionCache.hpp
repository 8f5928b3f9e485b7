#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace upnpbridge {

// Memoizes converted descriptions by exact location string. Entries only
// leave through compact(), which keeps the most recently *inserted* keys.
class ConversionCache {
public:
    std::optional<nlohmann::json> get(const std::string& location) const;
    // Overwriting an existing key keeps its original insertion position.
    void put(const std::string& location, nlohmann::json value);
    // Returns the number of evicted entries (0 when size <= max_size).
    std::size_t compact(std::size_t max_size = 100, std::size_t keep = 50);

    std::size_t size() const;
    bool contains(const std::string& location) const;

private:
    mutable std::mutex mu_;
    std::unordered_map<std::string, nlohmann::json> entries_;
    std::deque<std::string> order_;
};

} // namespace upnpbridge
