#include "discovery/ResponsePolicy.hpp"
#include <algorithm>
#include <iostream>
#include <random>
#include <boost/algorithm/string/predicate.hpp>

namespace asio = boost::asio;

namespace upnpbridge {

ResponsePolicy::ResponsePolicy(asio::io_context& ioc, IDiscoveryTransport& transport, UniformSource uniform)
: ioc_(ioc), transport_(transport), uniform_(std::move(uniform)) {
    if (!uniform_) {
        auto rng = std::make_shared<std::mt19937_64>(std::random_device{}());
        uniform_ = [rng](double lo, double hi) {
            return std::uniform_real_distribution<double>(lo, hi)(*rng);
        };
    }
}

ResponsePolicy::~ResponsePolicy() {
    cancel_pending();
}

bool ResponsePolicy::should_respond(const std::optional<std::string>& target) {
    if (!target) return false;
    if (*target == ssdp::SEARCH_ALL) return true;
    return boost::icontains(*target, JSON_NATIVE_MARKER) || boost::icontains(*target, PROXY_MARKER);
}

std::chrono::duration<double> ResponsePolicy::compute_delay(std::optional<int> max_wait) {
    const double mx = static_cast<double>(max_wait.value_or(DEFAULT_MAX_WAIT));
    if (mx <= 0.0) return std::chrono::duration<double>(0.0);
    return std::chrono::duration<double>(std::clamp(uniform_(0.0, mx), 0.0, mx));
}

bool ResponsePolicy::on_query(const DiscoveryMessage& query) {
    auto target = query.search_target();
    if (!should_respond(target)) return false;

    auto delay = compute_delay(query.max_wait());
    auto timer = std::make_shared<asio::steady_timer>(ioc_);
    timer->expires_after(std::chrono::duration_cast<asio::steady_timer::duration>(delay));
    pending_.insert(timer);

    timer->async_wait([this, timer, t = *target](const boost::system::error_code& ec) {
        // cancel_pending() already dropped the timer
        if (ec == asio::error::operation_aborted) return;
        pending_.erase(timer);
        if (ec) {
            std::cerr << "ResponsePolicy: timer error: " << ec.message() << std::endl;
            return;
        }
        transport_.send_search_response(t);
    });
    return true;
}

void ResponsePolicy::cancel_pending() {
    for (auto& t : pending_) t->cancel();
    pending_.clear();
}

} // namespace upnpbridge
