/*
src/core/ConversionCache.cpp
Best-effort memoization of XML -> JSON description conversions,
truncated in bulk by the cleanup loop.
*/
#include "core/ConversionCache.hpp"

namespace upnpbridge {

std::optional<nlohmann::json> ConversionCache::get(const std::string& location) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(location);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void ConversionCache::put(const std::string& location, nlohmann::json value) {
    std::lock_guard<std::mutex> lock(mu_);
    auto [it, inserted] = entries_.insert_or_assign(location, std::move(value));
    if (inserted) order_.push_back(location);
}

std::size_t ConversionCache::compact(std::size_t max_size, std::size_t keep) {
    std::lock_guard<std::mutex> lock(mu_);
    if (entries_.size() <= max_size || order_.size() <= keep) return 0;
    std::size_t evicted = 0;
    while (order_.size() > keep) {
        evicted += entries_.erase(order_.front());
        order_.pop_front();
    }
    return evicted;
}

std::size_t ConversionCache::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.size();
}

bool ConversionCache::contains(const std::string& location) const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.count(location) != 0;
}

} // namespace upnpbridge
